#include <iostream>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/exit_reason.hpp>
#include <caf/scoped_actor.hpp>
#include <opentelemetry/exporters/ostream/span_exporter.h>
#include <opentelemetry/sdk/trace/simple_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include "stepflow/worker/core.hpp"
#include "stepflow/worker/actors.hpp"
#include "stepflow/worker/feature_flags.hpp"
#include "stepflow/worker/observability.hpp"
#include <nlohmann/json.hpp>
#include <unistd.h>

class StepflowConfig : public caf::actor_system_config {
public:
    StepflowConfig() {
        opt_group{custom_options_, "global"}
            .add(worker_config.workflow, "workflow", "Name of the workflow to run")
            .add(worker_config.project_id, "project-id", "Project identifier passed to the workflow")
            .add(worker_config.project_dir, "project-dir", "Project directory")
            .add(worker_config.feedback_file, "feedback-file", "Write the feedback document to this file")
            .add(worker_config.feedback_stdout, "feedback-stdout", "Print the feedback document to stdout")
            .add(worker_config.temp_dir, "temp-dir", "Parent directory of per-run work directories")
            .add(worker_config.keep_workdir, "keep-workdir", "Keep the work directory after the run")
            .add(worker_config.log_level, "log-level", "Log level: debug, info, warn, error")
            .add(worker_config.metrics_file, "metrics-file", "Write Prometheus metrics to this file");
    }

    stepflow::worker::WorkerConfig worker_config;
};

namespace {

// Spans go to stdout through the SDK ostream exporter; the API stays a no-op otherwise
void install_tracer_provider() {
    namespace trace_api = opentelemetry::trace;
    namespace trace_sdk = opentelemetry::sdk::trace;

    auto exporter = std::unique_ptr<trace_sdk::SpanExporter>(new opentelemetry::exporter::trace::OStreamSpanExporter());
    auto processor = std::unique_ptr<trace_sdk::SpanProcessor>(new trace_sdk::SimpleSpanProcessor(std::move(exporter)));
    opentelemetry::nostd::shared_ptr<trace_api::TracerProvider> provider(
        new trace_sdk::TracerProvider(std::move(processor)));
    trace_api::Provider::SetTracerProvider(provider);
}

} // namespace

int caf_main(caf::actor_system& system, const StepflowConfig& config) {
    using namespace stepflow::worker;

    const WorkerConfig& worker_config = config.worker_config;

    if (FeatureFlags::is_tracing_enabled()) {
        install_tracer_provider();
    }

    Observability::Options options;
    std::string level_text = FeatureFlags::log_level_override();
    options.log_level = parse_log_level(level_text.empty() ? worker_config.log_level : level_text);
    auto observability = std::make_shared<Observability>("worker_" + std::to_string(getpid()), options);

    observability->log_info("Worker starting", {
        {"workflow", worker_config.workflow},
        {"project_id", worker_config.project_id},
        {"project_dir", worker_config.project_dir},
        {"keep_workdir", worker_config.keep_workdir ? "true" : "false"}
    });

    WorkflowActorConfig actor_config;
    actor_config.observability = observability;
    actor_config.catalog = std::make_shared<const WorkflowCatalog>();
    actor_config.runner_options.temp_dir = worker_config.temp_dir;
    actor_config.runner_options.keep_workdir = worker_config.keep_workdir;

    auto actor = system.spawn<WorkflowActor>(actor_config);

    int exit_code = 0;
    caf::scoped_actor self{system};
    self->request(actor, caf::infinite, caf::atom("run"),
                  worker_config.workflow,
                  worker_config.project_id,
                  worker_config.project_dir,
                  worker_config.feedback_file)
        .receive(
            [&](const std::string& feedback) {
                if (worker_config.feedback_stdout) {
                    std::cout << "Feedback:" << std::endl << feedback << std::endl;
                }
                auto document = nlohmann::json::parse(feedback, nullptr, false);
                if (document.is_discarded() || document.contains("error")) {
                    exit_code = 1;
                }
            },
            [&](const caf::error& err) {
                observability->log_error("Workflow run failed", {{"error", caf::to_string(err)}});
                exit_code = 2;
            });

    if (!worker_config.metrics_file.empty()) {
        if (auto written = observability->write_metrics_file(worker_config.metrics_file); !written) {
            observability->log_error("Failed to write metrics file", {
                {"path", worker_config.metrics_file},
                {"error", caf::to_string(written.error())}
            });
        }
    }

    observability->log_info("Worker shutting down", {{"exit_code", std::to_string(exit_code)}});
    self->send_exit(actor, caf::exit_reason::user_shutdown);
    return exit_code;
}

int main(int argc, char** argv) {
    StepflowConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 1;
    }

    if (config.cli_helptext_printed) {
        return 0;
    }

    // Run the actor system
    caf::actor_system system(config);
    return caf_main(system, config);
}
