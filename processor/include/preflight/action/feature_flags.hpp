#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace preflight {
namespace action {

/**
 * Feature Flags
 *
 * Optional behavior is gated behind process environment variables.
 * Every flag defaults to `false`.
 *
 * - PREFLIGHT_METRICS_ENABLED
 * - PREFLIGHT_TEXT_TIMEOUT_DETECTION
 * - PREFLIGHT_CONNECT_TIMEOUT_ENABLED
 */
class FeatureFlags {
public:
    /**
     * Check if Prometheus metrics collection is enabled
     *
     * Gates:
     * - preflight_attempts_total / preflight_attempt_duration_ms
     * - preflight_signals_total
     */
    static bool is_metrics_enabled() {
        return get_env_bool("PREFLIGHT_METRICS_ENABLED", false);
    }

    /**
     * Check if timeouts are detected from the error text only
     *
     * When enabled, a connection failure is a timeout only if its error text
     * contains lowercase "timeout" (case-sensitive); the transport's explicit
     * timeout indicator is ignored.
     */
    static bool is_text_timeout_detection_enabled() {
        return get_env_bool("PREFLIGHT_TEXT_TIMEOUT_DETECTION", false);
    }

    /**
     * Check if a separate connection-establishment timeout is applied
     */
    static bool is_connect_timeout_enabled() {
        return get_env_bool("PREFLIGHT_CONNECT_TIMEOUT_ENABLED", false);
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
     * Returns `default_value` if environment variable is not set.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace action
} // namespace preflight
