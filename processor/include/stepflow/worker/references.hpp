#pragma once

#include "stepflow/worker/value.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace stepflow {
namespace worker {

// Reference to a named return value of an earlier step.
// Resolved by the runner; carries no behavior of its own.
struct StepOutput {
    std::string step_id;
    std::string return_name;

    StepOutput(std::string step_id, std::string return_name)
        : step_id(std::move(step_id)), return_name(std::move(return_name)) {}

    bool operator==(const StepOutput& other) const {
        return step_id == other.step_id && return_name == other.return_name;
    }
};

/**
 * Path inside the per-run temporary root.
 *
 * Parts must be relative and may not climb out of the root with "..".
 * eval() is idempotent: it never removes or truncates existing content.
 */
class WorkDirPath {
public:
    explicit WorkDirPath(std::vector<std::string> parts, bool mkdir = false);

    const std::vector<std::string>& parts() const { return parts_; }
    bool mkdir() const { return mkdir_; }

    std::filesystem::path eval(const std::filesystem::path& root) const;

private:
    std::vector<std::string> parts_;
    bool mkdir_;
};

// Value bound to an operation parameter: literal, earlier return, or work dir path
using Argument = std::variant<Value, StepOutput, WorkDirPath>;
using Arguments = std::map<std::string, Argument>;

} // namespace worker
} // namespace stepflow
