#pragma once

#include "stepflow/worker/core.hpp"
#include "stepflow/worker/value.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stepflow {
namespace worker {

enum class ParameterKind {
    keyword,          // bindable by name
    positional_only,
    variadic
};

struct Parameter {
    std::string name;
    ParameterKind kind = ParameterKind::keyword;
};

// Declared parameters of an operation, checked against step bindings
// when a workflow is constructed.
struct OperationSignature {
    std::vector<Parameter> parameters;

    static OperationSignature keywords(const std::vector<std::string>& names) {
        OperationSignature signature;
        for (const auto& name : names) {
            signature.parameters.push_back(Parameter{name, ParameterKind::keyword});
        }
        return signature;
    }

    std::vector<std::string> parameter_names() const {
        std::vector<std::string> names;
        names.reserve(parameters.size());
        for (const auto& parameter : parameters) {
            names.push_back(parameter.name);
        }
        return names;
    }
};

// Resolved keyword arguments handed to Operation::invoke
using ArgumentValues = std::map<std::string, Value>;

// Throws std::invalid_argument when the argument is missing
const Value& require_argument(const ArgumentValues& args, const std::string& name);

struct OperationMetricsSnapshot {
    int64_t success_count = 0;
    int64_t error_count = 0;
    int64_t latency_total_ms = 0;
};

struct OperationMetrics {
    std::atomic<int64_t> success_count{0};
    std::atomic<int64_t> error_count{0};
    std::atomic<int64_t> latency_total_ms{0};

    OperationMetricsSnapshot snapshot() const {
        return OperationMetricsSnapshot{success_count.load(), error_count.load(), latency_total_ms.load()};
    }
};

// Operation interface
// invoke() may report failure through OperationResult::error_result or by throwing;
// the runner treats both the same way.
class Operation {
public:
    virtual ~Operation() = default;

    virtual std::string name() const = 0;
    virtual const OperationSignature& signature() const = 0;
    virtual OperationResult invoke(const ArgumentValues& args) = 0;
    virtual OperationMetricsSnapshot metrics() const = 0;
};

// Base Operation implementation with common functionality
class BaseOperation : public Operation {
public:
    BaseOperation(std::string name, OperationSignature signature)
        : name_(std::move(name)), signature_(std::move(signature)) {}

    std::string name() const override { return name_; }
    const OperationSignature& signature() const override { return signature_; }

    OperationResult invoke(const ArgumentValues& args) override;

    OperationMetricsSnapshot metrics() const override { return metrics_.snapshot(); }

protected:
    // Subclasses should override this method
    virtual OperationResult invoke_impl(const ArgumentValues& args) = 0;

private:
    std::string name_;
    OperationSignature signature_;
    OperationMetrics metrics_;
};

// Operation backed by a callable
class FunctionOperation : public BaseOperation {
public:
    using Function = std::function<OperationResult(const ArgumentValues&)>;

    FunctionOperation(std::string name, OperationSignature signature, Function function)
        : BaseOperation(std::move(name), std::move(signature)), function_(std::move(function)) {}

protected:
    OperationResult invoke_impl(const ArgumentValues& args) override { return function_(args); }

private:
    Function function_;
};

std::shared_ptr<Operation> make_operation(std::string name,
                                          std::vector<std::string> keyword_parameters,
                                          FunctionOperation::Function function);

std::shared_ptr<Operation> make_operation(std::string name,
                                          OperationSignature signature,
                                          FunctionOperation::Function function);

} // namespace worker
} // namespace stepflow
