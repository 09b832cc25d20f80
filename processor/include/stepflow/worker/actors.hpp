#pragma once

#include "stepflow/worker/observability.hpp"
#include "stepflow/worker/runner.hpp"
#include "stepflow/worker/workflow_catalog.hpp"

#include <caf/actor_system.hpp>
#include <caf/atom.hpp>
#include <caf/result.hpp>
#include <caf/typed_actor.hpp>
#include <caf/typed_event_based_actor.hpp>

#include <memory>
#include <string>

namespace stepflow {
namespace worker {

// Workflow actor interface:
// ('run', workflow, project_id, project_dir, feedback_file) -> feedback JSON
using workflow_actor = caf::typed_actor<
    caf::replies_to<caf::atom_value, std::string, std::string, std::string, std::string>::with<std::string>
>;

struct WorkflowActorConfig {
    std::shared_ptr<Observability> observability;
    std::shared_ptr<const WorkflowCatalog> catalog;
    RunnerOptions runner_options;
};

class WorkflowActorState {
public:
    WorkflowActorState(caf::scheduled_actor* self, WorkflowActorConfig config);

    workflow_actor::behavior_type make_behavior();

private:
    WorkflowActorConfig config_;
    WorkflowRunner runner_;

    caf::result<std::string> handle_run(const std::string& workflow_name,
                                        const std::string& project_id,
                                        const std::string& project_dir,
                                        const std::string& feedback_file);
};

class WorkflowActorImpl : public caf::typed_event_based_actor<
    caf::replies_to<caf::atom_value, std::string, std::string, std::string, std::string>::with<std::string>
> {
public:
    WorkflowActorImpl(caf::actor_config& cfg, WorkflowActorConfig config)
        : caf::typed_event_based_actor<
            caf::replies_to<caf::atom_value, std::string, std::string, std::string, std::string>::with<std::string>
          >(cfg),
          state_(this, std::move(config)) {}

    behavior_type make_behavior() override {
        return state_.make_behavior();
    }

private:
    WorkflowActorState state_;
};

using WorkflowActor = WorkflowActorImpl;

} // namespace worker
} // namespace stepflow
