#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace stepflow {
namespace worker {

/**
 * Worker Feature Flags
 *
 * Optional worker behavior is switched through environment variables:
 * - STEPFLOW_METRICS_ENABLED       (default: false)
 * - STEPFLOW_TRACING_ENABLED       (default: false)
 * - STEPFLOW_STEP_MARKERS_ENABLED  (default: true)
 * - STEPFLOW_LOG_LEVEL             (default: unset, command line wins)
 */
class FeatureFlags {
public:
    /**
     * Check if Prometheus metrics collection is enabled
     *
     * Gates:
     * - Step/workflow counters and histograms
     * - Metrics textfile output
     */
    static bool is_metrics_enabled() {
        return get_env_bool("STEPFLOW_METRICS_ENABLED", false);
    }

    /**
     * Check if the worker installs an OpenTelemetry SDK tracer provider
     * (ostream exporter). Without it spans go to the no-op provider.
     */
    static bool is_tracing_enabled() {
        return get_env_bool("STEPFLOW_TRACING_ENABLED", false);
    }

    /**
     * Check if step section markers are printed on stderr
     *
     * Markers look like:
     *   ::<<<::<id> <step name>
     *   ::>>>::<id> <stage>
     */
    static bool is_step_markers_enabled() {
        return get_env_bool("STEPFLOW_STEP_MARKERS_ENABLED", true);
    }

    // Empty when not set
    static std::string log_level_override() {
        const char* value = std::getenv("STEPFLOW_LOG_LEVEL");
        return value == nullptr ? std::string() : std::string(value);
    }

private:
    /**
     * Get boolean value from environment variable
     *
     * Returns `true` if environment variable is set to:
     * - "true" (case-insensitive)
     * - "1"
     * - "yes" (case-insensitive)
     *
     * Returns `false` for "false", "0" and "no", and `default_value`
     * if the variable is not set or has any other value.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (str_value == "true" || str_value == "1" || str_value == "yes") {
            return true;
        }
        if (str_value == "false" || str_value == "0" || str_value == "no") {
            return false;
        }
        return default_value;
    }
};

} // namespace worker
} // namespace stepflow
