#pragma once

#include "stepflow/worker/value.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace stepflow {
namespace worker {

// Step progress marker. Numeric values are part of the feedback format.
enum class Stage : int {
    not_started = 0,
    running = 1,
    completed = 2
};

// Machine-readable error codes for programmatic error handling
enum class ErrorCode {
    none = 0,
    // Validation errors (1xxx)
    invalid_input = 1001,
    missing_required_field = 1002,
    invalid_format = 1003,
    // Execution errors (2xxx)
    execution_failed = 2001,
    resource_unavailable = 2002,
    permission_denied = 2003,
    return_arity_mismatch = 2004,
    argument_resolution_failed = 2005,
    // System errors (4xxx)
    internal_error = 4001
};

std::string stage_to_string(Stage stage);
std::string error_code_to_string(ErrorCode code);

// Random lowercase hex string of 2 * bytes characters (run ids, section markers)
std::string generate_hex_id(std::size_t bytes = 16);

// Correlation fields carried through logs, spans and metrics of a single run
struct RunContext {
    std::string workflow_id;
    std::string run_id;
    std::string step_id;
    std::string trace_id;
};

// Outcome of one operation invocation.
// Operations either return one of these or throw.
struct OperationResult {
    bool ok = true;
    ErrorCode error_code = ErrorCode::none;
    Value value;
    std::string error_message;

    bool is_success() const { return ok; }
    bool is_error() const { return !ok; }

    static OperationResult success(Value value) {
        OperationResult result;
        result.ok = true;
        result.value = std::move(value);
        return result;
    }

    static OperationResult error_result(ErrorCode code, const std::string& message) {
        OperationResult result;
        result.ok = false;
        result.error_code = code;
        result.error_message = message;
        return result;
    }
};

using NamedValues = std::map<std::string, Value>;

// Outcome of one step as seen by the runner: named returns on success,
// message and stack frames on failure.
struct StepOutcome {
    bool ok = true;
    ErrorCode error_code = ErrorCode::none;
    NamedValues returns;
    std::string error_message;
    std::vector<std::string> error_stack;
    int64_t latency_ms = 0;

    bool is_success() const { return ok; }
    bool is_error() const { return !ok; }

    static StepOutcome success(NamedValues returns, int64_t latency_ms = 0) {
        StepOutcome outcome;
        outcome.ok = true;
        outcome.returns = std::move(returns);
        outcome.latency_ms = latency_ms;
        return outcome;
    }

    static StepOutcome error_result(ErrorCode code,
                                    const std::string& message,
                                    std::vector<std::string> stack,
                                    int64_t latency_ms = 0) {
        StepOutcome outcome;
        outcome.ok = false;
        outcome.error_code = code;
        outcome.error_message = message;
        outcome.error_stack = std::move(stack);
        outcome.latency_ms = latency_ms;
        return outcome;
    }
};

// Worker configuration
struct WorkerConfig {
    std::string workflow = "check_status";
    std::string project_id;
    std::string project_dir;
    std::string feedback_file;
    bool feedback_stdout = false;
    std::string temp_dir;          // empty means the system temporary directory
    bool keep_workdir = false;
    std::string log_level = "info";
    std::string metrics_file;
};

} // namespace worker
} // namespace stepflow
