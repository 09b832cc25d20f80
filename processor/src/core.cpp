#include "stepflow/worker/core.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace stepflow {
namespace worker {

std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::not_started:
            return "not_started";
        case Stage::running:
            return "running";
        case Stage::completed:
            return "completed";
    }
    return "unknown";
}

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::none:
            return "NONE";
        case ErrorCode::invalid_input:
            return "INVALID_INPUT";
        case ErrorCode::missing_required_field:
            return "MISSING_REQUIRED_FIELD";
        case ErrorCode::invalid_format:
            return "INVALID_FORMAT";
        case ErrorCode::execution_failed:
            return "EXECUTION_FAILED";
        case ErrorCode::resource_unavailable:
            return "RESOURCE_UNAVAILABLE";
        case ErrorCode::permission_denied:
            return "PERMISSION_DENIED";
        case ErrorCode::return_arity_mismatch:
            return "RETURN_ARITY_MISMATCH";
        case ErrorCode::argument_resolution_failed:
            return "ARGUMENT_RESOLUTION_FAILED";
        case ErrorCode::internal_error:
            return "INTERNAL_ERROR";
    }
    return "UNKNOWN_ERROR";
}

std::string generate_hex_id(std::size_t bytes) {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<int> distribution(0, 255);

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << distribution(generator);
    }
    return out.str();
}

} // namespace worker
} // namespace stepflow
