#pragma once

#include "stepflow/worker/step.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace stepflow {
namespace worker {

// Raised while constructing a Workflow whose steps are wired incorrectly.
// Nothing has executed when this is thrown.
class WorkflowValidationError : public std::runtime_error {
public:
    WorkflowValidationError(const std::string& message,
                            std::string workflow_id,
                            std::string step_id = "",
                            std::string parameter = "")
        : std::runtime_error(message),
          workflow_id_(std::move(workflow_id)),
          step_id_(std::move(step_id)),
          parameter_(std::move(parameter)) {}

    const std::string& workflow_id() const { return workflow_id_; }
    const std::string& step_id() const { return step_id_; }
    const std::string& parameter() const { return parameter_; }

private:
    std::string workflow_id_;
    std::string step_id_;
    std::string parameter_;
};

/**
 * Ordered, validated sequence of steps.
 *
 * Step order defines execution order and which returns a step may reference.
 * The constructor validates the whole pipeline and throws
 * WorkflowValidationError on the first problem found.
 */
class Workflow {
public:
    Workflow(std::string id,
             std::string version,
             std::string name,
             std::vector<Step> steps,
             std::string description = "");

    const std::string& id() const { return id_; }
    const std::string& version() const { return version_; }
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::vector<Step>& steps() const { return steps_; }

    const Step* find_step(const std::string& step_id) const;

private:
    std::string id_;
    std::string version_;
    std::string name_;
    std::string description_;
    std::vector<Step> steps_;

    void validate() const;
};

} // namespace worker
} // namespace stepflow
