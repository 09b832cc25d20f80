#include "stepflow/worker/workflow.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace stepflow {
namespace worker {

namespace {

std::string format_names(const std::vector<std::string>& names) {
    std::string text = "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += "'" + names[i] + "'";
    }
    return text + "]";
}

std::vector<std::string> argument_names(const Arguments& arguments) {
    std::vector<std::string> names;
    for (const auto& [name, value] : arguments) {
        names.push_back(name);
    }
    return names;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

Workflow::Workflow(std::string id,
                   std::string version,
                   std::string name,
                   std::vector<Step> steps,
                   std::string description)
    : id_(std::move(id)),
      version_(std::move(version)),
      name_(std::move(name)),
      description_(std::move(description)),
      steps_(std::move(steps)) {
    validate();
}

const Step* Workflow::find_step(const std::string& step_id) const {
    for (const auto& step : steps_) {
        if (step.id == step_id) {
            return &step;
        }
    }
    return nullptr;
}

void Workflow::validate() const {
    if (steps_.empty()) {
        throw WorkflowValidationError(
            "The workflow \"" + id_ + "\" should contain at least one step.", id_);
    }

    // Returns of the steps validated so far; a step may only reference these
    std::map<std::string, std::vector<std::string>> all_step_returns;

    for (const auto& step : steps_) {
        if (!step.operation) {
            throw WorkflowValidationError(
                "The workflow \"" + id_ + "\" has step \"" + step.id + "\" without an operation.",
                id_, step.id);
        }

        if (all_step_returns.count(step.id)) {
            throw WorkflowValidationError(
                "The workflow \"" + id_ + "\" has more than one step with id \"" + step.id + "\".",
                id_, step.id);
        }

        const std::string method = step.operation->name();
        std::vector<std::string> param_names;

        for (const auto& param : step.operation->signature().parameters) {
            if (param.kind != ParameterKind::keyword) {
                throw WorkflowValidationError(
                    "The workflow \"" + id_ + "\" method \"" + method + "\" has a non keyword parameter \"" +
                        param.name + "\".",
                    id_, step.id, param.name);
            }

            if (!step.arguments.count(param.name)) {
                throw WorkflowValidationError(
                    "The workflow \"" + id_ + "\" method \"" + method + "\" has an argument \"" + param.name +
                        "\" that is not available in the step definition \"arguments\", expected one of " +
                        format_names(argument_names(step.arguments)) + ".",
                    id_, step.id, param.name);
            }

            param_names.push_back(param.name);
        }

        for (const auto& [name, value] : step.arguments) {
            if (const auto* output = std::get_if<StepOutput>(&value)) {
                auto previous = all_step_returns.find(output->step_id);
                if (previous == all_step_returns.end()) {
                    throw WorkflowValidationError(
                        "The workflow \"" + id_ + "\" has step \"" + step.id +
                            "\" that requires a non-existing step return value \"" + output->step_id + "." +
                            output->return_name + "\" for argument \"" + name +
                            "\". Previous step with that id does not exist.",
                        id_, step.id, name);
                }

                if (!contains(previous->second, output->return_name)) {
                    throw WorkflowValidationError(
                        "The workflow \"" + id_ + "\" has step \"" + step.id +
                            "\" that requires a non-existing step return value \"" + output->step_id + "." +
                            output->return_name + "\" for argument \"" + name +
                            "\". Previous step with that id found, but returns no value with such name.",
                        id_, step.id, name);
                }
            }

            if (!contains(param_names, name)) {
                throw WorkflowValidationError(
                    "The workflow \"" + id_ + "\" method \"" + method + "\" receives a parameter \"" + name +
                        "\" that is not available in the method definition, expected one of " +
                        format_names(param_names) + ".",
                    id_, step.id, name);
            }
        }

        std::set<std::string> seen_returns;
        for (const auto& return_name : step.return_names) {
            if (!seen_returns.insert(return_name).second) {
                throw WorkflowValidationError(
                    "The workflow \"" + id_ + "\" has step \"" + step.id + "\" that declares the return name \"" +
                        return_name + "\" more than once.",
                    id_, step.id, return_name);
            }
        }

        for (const auto& output_name : step.outputs) {
            if (!seen_returns.count(output_name)) {
                throw WorkflowValidationError(
                    "The workflow \"" + id_ + "\" has step \"" + step.id + "\" with output \"" + output_name +
                        "\" that is not one of its return names " + format_names(step.return_names) + ".",
                    id_, step.id, output_name);
            }
        }

        all_step_returns[step.id] = step.return_names;
    }
}

} // namespace worker
} // namespace stepflow
