#include "stepflow/worker/operation.hpp"

#include <chrono>
#include <stdexcept>

namespace stepflow {
namespace worker {

const Value& require_argument(const ArgumentValues& args, const std::string& name) {
    auto it = args.find(name);
    if (it == args.end()) {
        throw std::invalid_argument("Missing required argument: " + name);
    }
    return it->second;
}

OperationResult BaseOperation::invoke(const ArgumentValues& args) {
    auto start_time = std::chrono::steady_clock::now();
    auto elapsed_ms = [start_time]() {
        auto end_time = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    };

    try {
        OperationResult result = invoke_impl(args);
        metrics_.latency_total_ms += elapsed_ms();
        if (result.is_success()) {
            metrics_.success_count++;
        } else {
            metrics_.error_count++;
        }
        return result;
    } catch (...) {
        metrics_.latency_total_ms += elapsed_ms();
        metrics_.error_count++;
        throw;
    }
}

std::shared_ptr<Operation> make_operation(std::string name,
                                          std::vector<std::string> keyword_parameters,
                                          FunctionOperation::Function function) {
    return make_operation(std::move(name), OperationSignature::keywords(keyword_parameters), std::move(function));
}

std::shared_ptr<Operation> make_operation(std::string name,
                                          OperationSignature signature,
                                          FunctionOperation::Function function) {
    if (!function) {
        throw std::invalid_argument("Operation \"" + name + "\" has no callable");
    }
    return std::make_shared<FunctionOperation>(std::move(name), std::move(signature), std::move(function));
}

} // namespace worker
} // namespace stepflow
