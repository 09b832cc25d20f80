#pragma once

#include "stepflow/worker/core.hpp"
#include "stepflow/worker/feature_flags.hpp"

#include <caf/expected.hpp>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>

#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace stepflow {
namespace worker {

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

// Accepts debug/info/warn/warning/error in any case; returns fallback otherwise
LogLevel parse_log_level(const std::string& text, LogLevel fallback = LogLevel::info);

using SpanPtr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>;

class Observability {
public:
    struct Options {
        LogLevel log_level = LogLevel::info;
        bool metrics_enabled = FeatureFlags::is_metrics_enabled();
        bool step_markers_enabled = FeatureFlags::is_step_markers_enabled();
        std::ostream* out = &std::cout;   // DEBUG/INFO/WARN lines
        std::ostream* err = &std::cerr;   // ERROR lines and step markers
    };

    explicit Observability(const std::string& worker_id);
    Observability(const std::string& worker_id, Options options);
    ~Observability();

    Observability(const Observability&) = delete;
    Observability& operator=(const Observability&) = delete;

    void set_log_level(LogLevel level);
    LogLevel log_level() const;

    // Metrics
    void record_step_execution(const std::string& operation,
                               const std::string& execution_status,
                               double duration_seconds);

    void record_step_error(const std::string& operation, const std::string& error_code);

    void record_workflow_run(const std::string& workflow_id,
                             const std::string& execution_status,
                             double duration_seconds);

    bool metrics_enabled() const { return options_.metrics_enabled; }

    // Prometheus text format; empty when metrics are disabled
    std::string metrics_text() const;

    // Writes metrics_text() to a node-exporter style textfile
    caf::expected<void> write_metrics_file(const std::filesystem::path& path) const;

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Tracing
    SpanPtr start_workflow_span(const RunContext& ctx, const std::string& workflow_name);

    SpanPtr start_step_span(const RunContext& ctx,
                            const std::string& step_name,
                            const std::string& operation,
                            const SpanPtr& parent);

    static void end_span(const SpanPtr& span, bool ok, const std::string& error_message = "");

    // Step section markers on the error stream
    void step_marker_begin(const std::string& marker_id, const std::string& step_name);
    void step_marker_end(const std::string& marker_id, Stage stage);

    // Logging
    void log_debug(const std::string& message,
                   const std::unordered_map<std::string, std::string>& context = {});
    void log_info(const std::string& message,
                  const std::unordered_map<std::string, std::string>& context = {});
    void log_warn(const std::string& message,
                  const std::unordered_map<std::string, std::string>& context = {});
    void log_error(const std::string& message,
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_debug_with_context(const std::string& message,
                                const RunContext& ctx,
                                const std::unordered_map<std::string, std::string>& context = {});
    void log_info_with_context(const std::string& message,
                               const RunContext& ctx,
                               const std::unordered_map<std::string, std::string>& context = {});
    void log_warn_with_context(const std::string& message,
                               const RunContext& ctx,
                               const std::unordered_map<std::string, std::string>& context = {});
    void log_error_with_context(const std::string& message,
                                const RunContext& ctx,
                                const std::unordered_map<std::string, std::string>& context = {});

    // Replaces password='...' values with ***
    static std::string redact(const std::string& text);

private:
    std::string worker_id_;
    Options options_;
    std::atomic<LogLevel> log_level_;
    mutable std::mutex output_mutex_;

    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Family<prometheus::Counter>* step_executions_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* step_errors_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* workflow_runs_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* step_duration_seconds_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* workflow_duration_seconds_family_ = nullptr;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;

    void initialize_metrics();
    void initialize_tracing();
    void write_log(LogLevel level,
                   const std::string& message,
                   const RunContext& ctx,
                   const std::unordered_map<std::string, std::string>& context);
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const RunContext& ctx,
                                const std::unordered_map<std::string, std::string>& context) const;
};

} // namespace worker
} // namespace stepflow
