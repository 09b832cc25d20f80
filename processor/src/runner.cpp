#include "stepflow/worker/runner.hpp"
#include "stepflow/worker/work_dir.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <sstream>
#include <type_traits>
#include <variant>

namespace stepflow {
namespace worker {

namespace {

std::string workflow_frame(const Workflow& workflow, const RunContext& ctx) {
    return "Workflow \"" + workflow.id() + "\" version \"" + workflow.version() +
           "\", run \"" + ctx.run_id + "\"";
}

std::string step_frame(const Step& step) {
    return "Step \"" + step.id + "\" (\"" + step.name + "\"), operation \"" +
           step.operation_name() + "\"";
}

std::string join_parts(const std::vector<std::string>& parts) {
    std::ostringstream out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out << '/';
        }
        out << parts[i];
    }
    return out.str();
}

// Outermost exception first, then one frame per nested cause
void append_exception_frames(const std::exception& e, std::vector<std::string>& frames, bool outermost = true) {
    frames.push_back(std::string(outermost ? "Exception: " : "Caused by: ") + e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        append_exception_frames(nested, frames, false);
    } catch (...) {
        frames.push_back("Caused by: unknown exception");
    }
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

// ExecutionState

ExecutionState::ExecutionState(const Workflow& workflow) {
    for (const auto& step : workflow.steps()) {
        stages_[step.id] = Stage::not_started;
    }
}

Stage ExecutionState::stage(const std::string& step_id) const {
    auto it = stages_.find(step_id);
    if (it == stages_.end()) {
        throw WorkflowDefect("Unknown step \"" + step_id + "\"");
    }
    return it->second;
}

void ExecutionState::set_stage(const std::string& step_id, Stage stage) {
    auto it = stages_.find(step_id);
    if (it == stages_.end()) {
        throw WorkflowDefect("Unknown step \"" + step_id + "\"");
    }
    if (static_cast<int>(stage) < static_cast<int>(it->second)) {
        throw WorkflowDefect("Step \"" + step_id + "\" cannot move from stage " +
                             stage_to_string(it->second) + " back to " + stage_to_string(stage));
    }
    it->second = stage;
}

void ExecutionState::complete(const std::string& step_id, NamedValues returns) {
    set_stage(step_id, Stage::completed);
    returns_[step_id] = std::move(returns);
}

const NamedValues* ExecutionState::returns(const std::string& step_id) const {
    auto it = returns_.find(step_id);
    return it == returns_.end() ? nullptr : &it->second;
}

const Value& ExecutionState::lookup(const StepOutput& output) const {
    const std::string reference = output.step_id + "." + output.return_name;

    auto stage_it = stages_.find(output.step_id);
    if (stage_it == stages_.end() || stage_it->second != Stage::completed) {
        throw WorkflowDefect("Return value \"" + reference + "\" requested, but step \"" +
                             output.step_id + "\" has not completed");
    }

    const NamedValues* values = returns(output.step_id);
    if (!values) {
        throw WorkflowDefect("Step \"" + output.step_id + "\" completed without recorded returns");
    }

    auto value_it = values->find(output.return_name);
    if (value_it == values->end()) {
        throw WorkflowDefect("Return value \"" + reference + "\" was not produced");
    }
    return value_it->second;
}

// WorkflowRunner

WorkflowRunner::WorkflowRunner(std::shared_ptr<Observability> observability, RunnerOptions options)
    : observability_(std::move(observability)), options_(std::move(options)) {
    if (!observability_) {
        throw std::invalid_argument("WorkflowRunner requires an Observability instance");
    }
}

FeedbackDocument WorkflowRunner::run(const Workflow& workflow,
                                     const FeedbackSink& sink,
                                     const std::string& trace_id) {
    const auto started = std::chrono::steady_clock::now();

    RunContext ctx;
    ctx.workflow_id = workflow.id();
    ctx.run_id = generate_hex_id(8);
    ctx.trace_id = trace_id;

    auto workflow_span = observability_->start_workflow_span(ctx, workflow.name());
    observability_->log_info_with_context("Workflow started", ctx, {
        {"workflow_name", workflow.name()},
        {"workflow_version", workflow.version()},
        {"steps", std::to_string(workflow.steps().size())}
    });

    ExecutionState state(workflow);
    std::optional<TemporaryDirectory> workdir;
    std::optional<StepOutcome> failure;
    std::exception_ptr defect;

    try {
        workdir.emplace(TemporaryDirectory::create(options_.temp_dir));
        if (options_.keep_workdir) {
            workdir->keep();
        }
        observability_->log_debug_with_context("Work directory created", ctx, {
            {"path", workdir->path().string()}
        });
    } catch (const std::exception& e) {
        std::vector<std::string> frames{workflow_frame(workflow, ctx)};
        append_exception_frames(e, frames);
        failure = StepOutcome::error_result(
            ErrorCode::resource_unavailable,
            std::string("Failed to create work directory: ") + e.what(),
            std::move(frames));
    }

    if (!failure) {
        for (const auto& step : workflow.steps()) {
            try {
                StepOutcome outcome = execute_step(workflow, step, state, workdir->path(), ctx, workflow_span);
                if (outcome.is_error()) {
                    failure = std::move(outcome);
                    break;
                }
            } catch (const WorkflowDefect& e) {
                failure = StepOutcome::error_result(
                    ErrorCode::internal_error, e.what(),
                    {workflow_frame(workflow, ctx), step_frame(step), std::string("Defect: ") + e.what()});
                defect = std::current_exception();
                break;
            }
        }
    }

    FeedbackDocument feedback = build_feedback(workflow, state, failure ? &*failure : nullptr);

    try {
        write_feedback(feedback, sink);
    } catch (const std::exception& e) {
        observability_->log_error_with_context("Failed to write feedback", ctx, {{"error", e.what()}});
    }

    if (workdir && !workdir->kept()) {
        const std::string root = workdir->path().string();
        std::error_code ec;
        if (!workdir->remove(ec)) {
            observability_->log_warn_with_context("Failed to remove work directory", ctx, {
                {"path", root},
                {"error", ec.message()}
            });
        }
    } else if (workdir) {
        observability_->log_info_with_context("Work directory kept", ctx, {
            {"path", workdir->path().string()}
        });
    }

    const double duration = seconds_since(started);
    const std::string status = failure ? "error" : "success";
    observability_->record_workflow_run(workflow.id(), status, duration);
    Observability::end_span(workflow_span, !failure, failure ? failure->error_message : "");

    if (failure) {
        observability_->log_error_with_context("Workflow failed", ctx, {
            {"error", failure->error_message},
            {"error_code", error_code_to_string(failure->error_code)},
            {"duration_ms", std::to_string(static_cast<int64_t>(duration * 1000.0))}
        });
    } else {
        observability_->log_info_with_context("Workflow completed", ctx, {
            {"duration_ms", std::to_string(static_cast<int64_t>(duration * 1000.0))}
        });
    }

    if (defect) {
        std::rethrow_exception(defect);
    }
    return feedback;
}

StepOutcome WorkflowRunner::execute_step(const Workflow& workflow,
                                         const Step& step,
                                         ExecutionState& state,
                                         const std::filesystem::path& root,
                                         const RunContext& ctx,
                                         const SpanPtr& workflow_span) {
    RunContext step_ctx = ctx;
    step_ctx.step_id = step.id;

    const std::string marker_id = generate_hex_id();
    const auto started = std::chrono::steady_clock::now();

    state.set_stage(step.id, Stage::running);
    observability_->step_marker_begin(marker_id, step.name);
    observability_->log_info_with_context("Step started", step_ctx, {
        {"step_name", step.name},
        {"operation", step.operation_name()}
    });
    auto span = observability_->start_step_span(step_ctx, step.name, step.operation_name(), workflow_span);

    StepOutcome outcome;
    try {
        outcome = invoke_step(workflow, step, state, root, step_ctx);
    } catch (const WorkflowDefect& e) {
        observability_->step_marker_end(marker_id, state.stage(step.id));
        Observability::end_span(span, false, e.what());
        throw;
    }

    const double duration = seconds_since(started);
    outcome.latency_ms = static_cast<int64_t>(duration * 1000.0);

    if (outcome.is_success()) {
        state.complete(step.id, outcome.returns);
    }

    observability_->step_marker_end(marker_id, state.stage(step.id));
    observability_->record_step_execution(step.operation_name(), outcome.is_success() ? "success" : "error", duration);
    Observability::end_span(span, outcome.is_success(), outcome.error_message);

    if (outcome.is_success()) {
        observability_->log_info_with_context("Step completed", step_ctx, {
            {"latency_ms", std::to_string(outcome.latency_ms)},
            {"returns", std::to_string(outcome.returns.size())}
        });
    } else {
        observability_->record_step_error(step.operation_name(), error_code_to_string(outcome.error_code));
        observability_->log_error_with_context("Step failed", step_ctx, {
            {"error", outcome.error_message},
            {"error_code", error_code_to_string(outcome.error_code)},
            {"latency_ms", std::to_string(outcome.latency_ms)}
        });
    }

    return outcome;
}

StepOutcome WorkflowRunner::invoke_step(const Workflow& workflow,
                                        const Step& step,
                                        const ExecutionState& state,
                                        const std::filesystem::path& root,
                                        const RunContext& ctx) {
    auto frames = [&]() {
        return std::vector<std::string>{workflow_frame(workflow, ctx), step_frame(step)};
    };

    ArgumentValues arguments;
    for (const auto& entry : step.arguments) {
        const std::string& name = entry.first;
        const Argument& argument = entry.second;
        const auto* path = std::get_if<WorkDirPath>(&argument);
        if (path) {
            try {
                arguments[name] = Value::of(path->eval(root).string());
            } catch (const std::exception& e) {
                auto stack = frames();
                stack.push_back("Argument \"" + name + "\" (work dir path \"" + join_parts(path->parts()) + "\")");
                append_exception_frames(e, stack);
                return StepOutcome::error_result(ErrorCode::argument_resolution_failed, e.what(), std::move(stack));
            }
            continue;
        }

        std::visit([&](const auto& source) {
            using Source = std::decay_t<decltype(source)>;
            if constexpr (std::is_same_v<Source, Value>) {
                arguments[name] = source;
            } else if constexpr (std::is_same_v<Source, StepOutput>) {
                arguments[name] = state.lookup(source);
            }
        }, argument);
    }

    OperationResult result;
    try {
        result = step.operation->invoke(arguments);
    } catch (const WorkflowDefect&) {
        throw;
    } catch (const std::exception& e) {
        auto stack = frames();
        append_exception_frames(e, stack);
        return StepOutcome::error_result(ErrorCode::execution_failed, e.what(), std::move(stack));
    } catch (...) {
        auto stack = frames();
        stack.push_back("Exception: unknown exception");
        return StepOutcome::error_result(ErrorCode::execution_failed, "Unknown exception", std::move(stack));
    }

    if (result.is_error()) {
        auto stack = frames();
        stack.push_back("Error " + error_code_to_string(result.error_code) + ": " + result.error_message);
        return StepOutcome::error_result(result.error_code, result.error_message, std::move(stack));
    }

    NamedValues returns;
    const std::size_t arity = step.return_arity();
    if (arity == 1) {
        returns[step.return_names.front()] = std::move(result.value);
    } else if (arity > 1) {
        if (!result.value.is_sequence() || result.value.sequence_size() != arity) {
            const std::string got = result.value.is_sequence()
                ? std::to_string(result.value.sequence_size()) + " values"
                : std::string("a single value");
            const std::string message = "Step \"" + step.id + "\" expects " + std::to_string(arity) +
                                        " return values, but operation \"" + step.operation_name() +
                                        "\" returned " + got;
            auto stack = frames();
            stack.push_back("Error " + error_code_to_string(ErrorCode::return_arity_mismatch) + ": " + message);
            return StepOutcome::error_result(ErrorCode::return_arity_mismatch, message, std::move(stack));
        }
        for (std::size_t i = 0; i < arity; ++i) {
            returns[step.return_names[i]] = result.value.sequence_at(i);
        }
    }

    return StepOutcome::success(std::move(returns));
}

FeedbackDocument WorkflowRunner::build_feedback(const Workflow& workflow,
                                                const ExecutionState& state,
                                                const StepOutcome* failure) const {
    FeedbackDocument feedback;
    feedback.workflow_version = workflow.version();
    feedback.workflow_id = workflow.id();
    feedback.workflow_name = workflow.name();

    for (const auto& step : workflow.steps()) {
        StepFeedback entry;
        entry.id = step.id;
        entry.name = step.name;
        entry.stage = state.stage(step.id);

        const NamedValues* returns = state.returns(step.id);
        if (entry.stage == Stage::completed && returns) {
            entry.returns = *returns;

            NamedValues outputs;
            for (const auto& output_name : step.outputs) {
                auto it = returns->find(output_name);
                if (it != returns->end()) {
                    outputs.emplace(output_name, it->second);
                }
            }
            feedback.outputs[step.id] = std::move(outputs);
        }

        feedback.steps.push_back(std::move(entry));
    }

    if (failure) {
        feedback.error = failure->error_message;
        feedback.error_stack = failure->error_stack;
    }

    return feedback;
}

FeedbackDocument run_workflow(const Workflow& workflow, const FeedbackSink& sink) {
    static std::shared_ptr<Observability> observability = std::make_shared<Observability>("stepflow-runner");
    WorkflowRunner runner(observability);
    return runner.run(workflow, sink);
}

} // namespace worker
} // namespace stepflow
