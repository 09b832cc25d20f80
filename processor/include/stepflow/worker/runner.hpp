#pragma once

#include "stepflow/worker/core.hpp"
#include "stepflow/worker/feedback.hpp"
#include "stepflow/worker/observability.hpp"
#include "stepflow/worker/workflow.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace stepflow {
namespace worker {

// Broken invariant, e.g. a StepOutput pointing at a step that never
// completed. Validation makes that impossible for well-formed workflows;
// operations may also throw it. run() records it as INTERNAL_ERROR, writes
// the feedback, then rethrows it.
class WorkflowDefect : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Progress of one run: stage per step and the named returns of every
 * completed step. Owned by a single WorkflowRunner::run() call.
 *
 * Stages only move forward: not_started -> running -> completed.
 */
class ExecutionState {
public:
    explicit ExecutionState(const Workflow& workflow);

    Stage stage(const std::string& step_id) const;
    void set_stage(const std::string& step_id, Stage stage);

    void complete(const std::string& step_id, NamedValues returns);
    const NamedValues* returns(const std::string& step_id) const;

    // Throws WorkflowDefect when the referenced value is not available
    const Value& lookup(const StepOutput& output) const;

private:
    std::map<std::string, Stage> stages_;
    std::map<std::string, NamedValues> returns_;
};

struct RunnerOptions {
    std::filesystem::path temp_dir;   // parent of the per-run roots; system temp dir when empty
    bool keep_workdir = false;
};

/**
 * Executes a validated workflow, one step at a time, in declared order.
 *
 * run() always returns a feedback document for step failures: the first
 * failing step stops the run, completed steps keep their returns and outputs,
 * and error / error_stack describe the failure. The document is written to
 * the sink exactly once, at the end.
 */
class WorkflowRunner {
public:
    explicit WorkflowRunner(std::shared_ptr<Observability> observability, RunnerOptions options = {});

    FeedbackDocument run(const Workflow& workflow,
                         const FeedbackSink& sink = FeedbackSink::none(),
                         const std::string& trace_id = "");

private:
    std::shared_ptr<Observability> observability_;
    RunnerOptions options_;

    StepOutcome execute_step(const Workflow& workflow,
                             const Step& step,
                             ExecutionState& state,
                             const std::filesystem::path& root,
                             const RunContext& ctx,
                             const SpanPtr& workflow_span);

    StepOutcome invoke_step(const Workflow& workflow,
                            const Step& step,
                            const ExecutionState& state,
                            const std::filesystem::path& root,
                            const RunContext& ctx);

    FeedbackDocument build_feedback(const Workflow& workflow,
                                    const ExecutionState& state,
                                    const StepOutcome* failure) const;
};

// Runs with a shared default Observability and default options
FeedbackDocument run_workflow(const Workflow& workflow, const FeedbackSink& sink = FeedbackSink::none());

} // namespace worker
} // namespace stepflow
