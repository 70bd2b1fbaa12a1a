#pragma once

#include "preflight/action/http_types.hpp"

namespace preflight {
namespace action {

// HTTP transport capability. perform() blocks until the attempt completes
// and reports every failure through TransportResult::kind.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual TransportResult perform(const TransportRequest& request) = 0;
};

} // namespace action
} // namespace preflight
