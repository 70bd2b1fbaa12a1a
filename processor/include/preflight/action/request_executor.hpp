#pragma once

#include "preflight/action/core.hpp"
#include "preflight/action/http_types.hpp"
#include <chrono>

namespace preflight {
namespace action {

// Builds one OPTIONS attempt. URL and headers are rebuilt from the config
// for every attempt, retries included.
class RequestExecutor {
public:
    static TransportRequest prepare(const RequestConfig& config);

    static double elapsed_ms(std::chrono::steady_clock::time_point started,
                             std::chrono::steady_clock::time_point finished);
};

} // namespace action
} // namespace preflight
