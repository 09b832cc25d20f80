#include "stepflow/worker/actors.hpp"

#include <caf/error.hpp>
#include <caf/scheduled_actor.hpp>
#include <caf/sec.hpp>

#include <stdexcept>

namespace stepflow {
namespace worker {

namespace {

std::shared_ptr<Observability> require_observability(const WorkflowActorConfig& config) {
    if (!config.observability) {
        throw std::invalid_argument("WorkflowActor requires an Observability instance");
    }
    return config.observability;
}

} // namespace

WorkflowActorState::WorkflowActorState([[maybe_unused]] caf::scheduled_actor* self, WorkflowActorConfig config)
    : config_(std::move(config)),
      runner_(require_observability(config_), config_.runner_options) {
    if (!config_.catalog) {
        config_.catalog = std::make_shared<const WorkflowCatalog>();
    }

    config_.observability->log_info("WorkflowActor initialized", {
        {"workflows", std::to_string(config_.catalog->names().size())},
        {"keep_workdir", config_.runner_options.keep_workdir ? "true" : "false"}
    });
}

workflow_actor::behavior_type WorkflowActorState::make_behavior() {
    return {
        [this](caf::atom_value run_atom,
               const std::string& workflow_name,
               const std::string& project_id,
               const std::string& project_dir,
               const std::string& feedback_file) -> caf::result<std::string> {
            if (run_atom != caf::atom("run")) {
                return caf::make_error(caf::sec::unexpected_message, "Expected 'run' request");
            }
            return handle_run(workflow_name, project_id, project_dir, feedback_file);
        }
    };
}

caf::result<std::string> WorkflowActorState::handle_run(const std::string& workflow_name,
                                                        const std::string& project_id,
                                                        const std::string& project_dir,
                                                        const std::string& feedback_file) {
    auto workflow = config_.catalog->build(workflow_name, WorkflowParams{project_id, project_dir});
    if (!workflow) {
        config_.observability->log_error("Workflow rejected", {
            {"workflow", workflow_name},
            {"error", caf::to_string(workflow.error())}
        });
        return workflow.error();
    }

    FeedbackSink sink = feedback_file.empty() ? FeedbackSink::none() : FeedbackSink::file(feedback_file);

    try {
        FeedbackDocument feedback = runner_.run(*workflow, sink, project_id);
        return feedback.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const WorkflowDefect& e) {
        return caf::make_error(caf::sec::runtime_error, std::string("Workflow defect: ") + e.what());
    }
}

} // namespace worker
} // namespace stepflow
