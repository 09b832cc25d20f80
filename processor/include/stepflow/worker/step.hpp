#pragma once

#include "stepflow/worker/operation.hpp"
#include "stepflow/worker/references.hpp"

#include <memory>
#include <string>
#include <vector>

namespace stepflow {
namespace worker {

/**
 * One workflow node: an operation, the sources of its arguments and the
 * names given to its return values.
 *
 * - return_names: names of the operation's return values, in return order
 * - outputs: subset of return_names that is safe to show to the user
 *
 * Steps are immutable once built; run progress lives in the runner.
 */
struct Step {
    std::string id;
    std::string name;
    std::shared_ptr<Operation> operation;
    Arguments arguments;
    std::vector<std::string> return_names;
    std::vector<std::string> outputs;

    Step(std::string id,
         std::string name,
         std::shared_ptr<Operation> operation,
         Arguments arguments = {},
         std::vector<std::string> return_names = {},
         std::vector<std::string> outputs = {})
        : id(std::move(id)),
          name(std::move(name)),
          operation(std::move(operation)),
          arguments(std::move(arguments)),
          return_names(std::move(return_names)),
          outputs(std::move(outputs)) {}

    std::string operation_name() const { return operation ? operation->name() : std::string("<none>"); }

    std::vector<std::string> parameter_names() const {
        return operation ? operation->signature().parameter_names() : std::vector<std::string>{};
    }

    std::size_t return_arity() const { return return_names.size(); }
};

} // namespace worker
} // namespace stepflow
