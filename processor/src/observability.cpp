#include "stepflow/worker/observability.hpp"
#include "stepflow/worker/core.hpp"
#include "stepflow/worker/feature_flags.hpp"

#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <nlohmann/json.hpp>
#include <opentelemetry/trace/provider.h>
#include <prometheus/text_serializer.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <map>
#include <regex>
#include <vector>

namespace stepflow {
namespace worker {

using json = nlohmann::json;
namespace trace_api = opentelemetry::trace;
namespace nostd = opentelemetry::nostd;

// Secret fields to filter from log context
static const std::vector<std::string> SECRET_FIELDS = {
    "password", "passwd", "api_key", "secret", "token", "access_token",
    "refresh_token", "authorization", "credentials"
};

// Helper function to check if a field name should be filtered (case-insensitive)
static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Recursively filter secrets from JSON object
static void filter_secrets_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_secrets_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_secrets_recursive(item);
            }
        }
    }
}

// Generate ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t);
#else
    gmtime_r(&time_t, &tm_buf);
#endif

    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

static const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug:
            return "DEBUG";
        case LogLevel::info:
            return "INFO";
        case LogLevel::warn:
            return "WARN";
        case LogLevel::error:
            return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& text, LogLevel fallback) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::debug;
    } else if (lower == "info") {
        return LogLevel::info;
    } else if (lower == "warn" || lower == "warning") {
        return LogLevel::warn;
    } else if (lower == "error") {
        return LogLevel::error;
    }
    return fallback;
}

Observability::Observability(const std::string& worker_id) : Observability(worker_id, Options{}) {}

Observability::Observability(const std::string& worker_id, Options options)
    : worker_id_(worker_id), options_(options), log_level_(options.log_level) {
    initialize_metrics();
    initialize_tracing();
}

Observability::~Observability() = default;

void Observability::set_log_level(LogLevel level) {
    log_level_ = level;
}

LogLevel Observability::log_level() const {
    return log_level_;
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    if (!options_.metrics_enabled) {
        return;
    }

    step_executions_total_family_ = &prometheus::BuildCounter()
        .Name("stepflow_step_executions_total")
        .Help("Total number of step executions")
        .Labels({{"worker_id", worker_id_}})
        .Register(*registry_);

    step_errors_total_family_ = &prometheus::BuildCounter()
        .Name("stepflow_step_errors_total")
        .Help("Total number of failed step executions")
        .Labels({{"worker_id", worker_id_}})
        .Register(*registry_);

    workflow_runs_total_family_ = &prometheus::BuildCounter()
        .Name("stepflow_workflow_runs_total")
        .Help("Total number of workflow runs")
        .Labels({{"worker_id", worker_id_}})
        .Register(*registry_);

    step_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("stepflow_step_duration_seconds")
        .Help("Step execution duration in seconds")
        .Labels({{"worker_id", worker_id_}})
        .Register(*registry_);

    workflow_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("stepflow_workflow_duration_seconds")
        .Help("Workflow run duration in seconds")
        .Labels({{"worker_id", worker_id_}})
        .Register(*registry_);
}

void Observability::initialize_tracing() {
    // Uses whatever provider is installed globally; the no-op provider by default
    tracer_ = trace_api::Provider::GetTracerProvider()->GetTracer("stepflow_worker", "1.0.0");
}

void Observability::record_step_execution(const std::string& operation,
                                          const std::string& execution_status,
                                          double duration_seconds) {
    if (!options_.metrics_enabled) {
        return;
    }

    step_executions_total_family_->Add({
        {"operation", operation},
        {"status", execution_status}
    }).Increment();

    step_duration_seconds_family_->Add(
        {{"operation", operation}},
        prometheus::Histogram::BucketBoundaries{0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0, 30.0, 120.0}
    ).Observe(duration_seconds);
}

void Observability::record_step_error(const std::string& operation, const std::string& error_code) {
    if (!options_.metrics_enabled) {
        return;
    }

    step_errors_total_family_->Add({
        {"operation", operation},
        {"error_code", error_code}
    }).Increment();
}

void Observability::record_workflow_run(const std::string& workflow_id,
                                        const std::string& execution_status,
                                        double duration_seconds) {
    if (!options_.metrics_enabled) {
        return;
    }

    workflow_runs_total_family_->Add({
        {"workflow_id", workflow_id},
        {"status", execution_status}
    }).Increment();

    workflow_duration_seconds_family_->Add(
        {{"workflow_id", workflow_id}},
        prometheus::Histogram::BucketBoundaries{0.01, 0.1, 0.5, 1.0, 5.0, 10.0, 30.0, 60.0, 300.0, 900.0}
    ).Observe(duration_seconds);
}

std::string Observability::metrics_text() const {
    if (!options_.metrics_enabled) {
        return "";
    }

    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

caf::expected<void> Observability::write_metrics_file(const std::filesystem::path& path) const {
    // Write next to the target and rename, so collectors never read a partial file
    std::filesystem::path tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            return caf::make_error(caf::sec::runtime_error, "Failed to open metrics file: " + tmp_path.string());
        }
        file << metrics_text();
        if (!file) {
            return caf::make_error(caf::sec::runtime_error, "Failed to write metrics file: " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        return caf::make_error(caf::sec::runtime_error,
                               "Failed to move metrics file into place: " + path.string() + ": " + ec.message());
    }

    return caf::unit;
}

SpanPtr Observability::start_workflow_span(const RunContext& ctx, const std::string& workflow_name) {
    auto span = tracer_->StartSpan("workflow " + ctx.workflow_id);
    span->SetAttribute("workflow.id", nostd::string_view(ctx.workflow_id));
    span->SetAttribute("workflow.name", nostd::string_view(workflow_name));
    span->SetAttribute("run.id", nostd::string_view(ctx.run_id));
    span->SetAttribute("worker.id", nostd::string_view(worker_id_));
    return span;
}

SpanPtr Observability::start_step_span(const RunContext& ctx,
                                       const std::string& step_name,
                                       const std::string& operation,
                                       const SpanPtr& parent) {
    trace_api::StartSpanOptions options;
    if (parent) {
        options.parent = parent->GetContext();
    }

    auto span = tracer_->StartSpan("step " + ctx.step_id, options);
    span->SetAttribute("workflow.id", nostd::string_view(ctx.workflow_id));
    span->SetAttribute("run.id", nostd::string_view(ctx.run_id));
    span->SetAttribute("step.id", nostd::string_view(ctx.step_id));
    span->SetAttribute("step.name", nostd::string_view(step_name));
    span->SetAttribute("operation", nostd::string_view(operation));
    return span;
}

void Observability::end_span(const SpanPtr& span, bool ok, const std::string& error_message) {
    if (!span) {
        return;
    }
    if (ok) {
        span->SetStatus(trace_api::StatusCode::kOk);
    } else {
        span->SetStatus(trace_api::StatusCode::kError, error_message);
    }
    span->End();
}

void Observability::step_marker_begin(const std::string& marker_id, const std::string& step_name) {
    if (!options_.step_markers_enabled) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex_);
    *options_.err << "::<<<::" << marker_id << " " << step_name << std::endl;
}

void Observability::step_marker_end(const std::string& marker_id, Stage stage) {
    if (!options_.step_markers_enabled) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex_);
    *options_.err << "::>>>::" << marker_id << " " << static_cast<int>(stage) << std::endl;
}

void Observability::log_debug(const std::string& message,
                              const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::debug, message, RunContext{}, context);
}

void Observability::log_info(const std::string& message,
                             const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::info, message, RunContext{}, context);
}

void Observability::log_warn(const std::string& message,
                             const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::warn, message, RunContext{}, context);
}

void Observability::log_error(const std::string& message,
                              const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::error, message, RunContext{}, context);
}

void Observability::log_debug_with_context(const std::string& message,
                                           const RunContext& ctx,
                                           const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::debug, message, ctx, context);
}

void Observability::log_info_with_context(const std::string& message,
                                          const RunContext& ctx,
                                          const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::info, message, ctx, context);
}

void Observability::log_warn_with_context(const std::string& message,
                                          const RunContext& ctx,
                                          const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::warn, message, ctx, context);
}

void Observability::log_error_with_context(const std::string& message,
                                           const RunContext& ctx,
                                           const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::error, message, ctx, context);
}

std::string Observability::redact(const std::string& text) {
    static const std::regex password_pattern("(password=')(.*?)(')", std::regex::icase);
    return std::regex_replace(text, password_pattern, "$1***$3");
}

void Observability::write_log(LogLevel level,
                              const std::string& message,
                              const RunContext& ctx,
                              const std::unordered_map<std::string, std::string>& context) {
    if (static_cast<int>(level) < static_cast<int>(log_level_.load())) {
        return;
    }

    std::string line = format_json_log(level_to_string(level), message, ctx, context);

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::ostream& stream = level == LogLevel::error ? *options_.err : *options_.out;
    stream << line << std::endl;
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const RunContext& ctx,
                                           const std::unordered_map<std::string, std::string>& context) const {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "worker";
    log_entry["message"] = redact(message);

    // Correlation fields (at top level, when provided)
    if (!ctx.workflow_id.empty()) {
        log_entry["workflow_id"] = ctx.workflow_id;
    }
    if (!ctx.run_id.empty()) {
        log_entry["run_id"] = ctx.run_id;
    }
    if (!ctx.step_id.empty()) {
        log_entry["step_id"] = ctx.step_id;
    }
    if (!ctx.trace_id.empty()) {
        log_entry["trace_id"] = ctx.trace_id;
    }

    json context_obj;
    context_obj["worker_id"] = worker_id_;
    for (const auto& [key, value] : context) {
        context_obj[key] = redact(value);
    }

    filter_secrets_recursive(context_obj);
    log_entry["context"] = context_obj;

    // Invalid UTF-8 in operation messages must not take the logger down
    return log_entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace worker
} // namespace stepflow
