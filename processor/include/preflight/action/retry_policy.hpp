#pragma once

#include "preflight/action/core.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>

namespace preflight {
namespace action {

/**
 * Retry Policy
 *
 * Bounded fixed-delay retry of connection-level failures:
 * - Timeout and NetworkError outcomes are retryable
 * - Received responses (2xx/4xx/5xx) and unclassified failures are final
 * - retry_count never exceeds max_retries
 */
class RetryPolicy {
public:
    struct Config {
        int32_t max_retries = 0;     // 0 = never retry
        int64_t retry_delay_ms = 1000;
    };

    enum class Decision {
        retry,
        finalize
    };

    RetryPolicy(const Config& config = Config()) : config_(config) {
        config_.max_retries = std::max<int32_t>(0, config_.max_retries);
        config_.retry_delay_ms = std::max<int64_t>(0, config_.retry_delay_ms);
    }

    static Config config_from(const RequestConfig& request_config) {
        Config config;
        config.max_retries = request_config.max_retries;
        config.retry_delay_ms = request_config.retry_delay_seconds > 0.0
            ? static_cast<int64_t>(std::llround(request_config.retry_delay_seconds * 1000.0))
            : 0;
        return config;
    }

    /**
     * Check if an outcome of this kind may be retried
     */
    bool is_retryable(OutcomeKind kind) const {
        switch (kind) {
            case OutcomeKind::timeout:
            case OutcomeKind::network_error:
                return true;
            default:
                return false;
        }
    }

    /**
     * Decide what follows an attempt. On `retry` the retry counter of
     * `state` has been incremented.
     */
    Decision next_step(OutcomeKind kind, AttemptState& state) const {
        if (!is_retryable(kind) || state.retry_count >= config_.max_retries) {
            return Decision::finalize;
        }
        ++state.retry_count;
        return Decision::retry;
    }

    int32_t max_retries() const {
        return config_.max_retries;
    }

    std::chrono::milliseconds retry_delay() const {
        return std::chrono::milliseconds(config_.retry_delay_ms);
    }

private:
    Config config_;
};

} // namespace action
} // namespace preflight
