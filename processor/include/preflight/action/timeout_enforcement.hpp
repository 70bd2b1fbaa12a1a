#pragma once

#include "preflight/action/feature_flags.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace preflight {
namespace action {

/**
 * Timeout and redirect policy for a single attempt
 *
 * Converts the designer's seconds into the transport's milliseconds and
 * decides the redirect limit. The connection timeout is gated behind
 * PREFLIGHT_CONNECT_TIMEOUT_ENABLED.
 */
class TimeoutEnforcement {
public:
    static constexpr int32_t FOLLOW_REDIRECT_LIMIT = 32;
    static constexpr int64_t CONNECT_TIMEOUT_MS = 5000;

    /**
     * Request timeout in milliseconds; 0 means no timeout
     */
    static int64_t request_timeout_ms(double timeout_seconds) {
        if (!(timeout_seconds > 0.0)) {
            return 0;
        }
        return std::max<int64_t>(1, static_cast<int64_t>(std::llround(timeout_seconds * 1000.0)));
    }

    /**
     * Get HTTP connection timeout
     */
    static int64_t connect_timeout_ms(int64_t request_timeout_ms) {
        if (!FeatureFlags::is_connect_timeout_enabled()) {
            // Transport default: connection bounded by the request timeout only
            return 0;
        }

        if (request_timeout_ms > 0) {
            return std::min(CONNECT_TIMEOUT_MS, request_timeout_ms);
        }
        return CONNECT_TIMEOUT_MS;
    }

    /**
     * Redirect limit; 0 makes the transport fail on a redirect instead of following it
     */
    static int32_t redirect_limit(bool follow_redirects) {
        return follow_redirects ? FOLLOW_REDIRECT_LIMIT : 0;
    }
};

} // namespace action
} // namespace preflight
