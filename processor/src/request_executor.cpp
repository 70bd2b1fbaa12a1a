#include "preflight/action/request_executor.hpp"
#include "preflight/action/header_composer.hpp"
#include "preflight/action/timeout_enforcement.hpp"
#include "preflight/action/url_composer.hpp"

namespace preflight {
namespace action {

TransportRequest RequestExecutor::prepare(const RequestConfig& config) {
    TransportRequest request;
    request.method = "OPTIONS";
    request.url = UrlComposer::compose(config);
    request.headers = HeaderComposer::compose(config);
    request.timeout_ms = TimeoutEnforcement::request_timeout_ms(config.timeout_seconds);
    request.connect_timeout_ms = TimeoutEnforcement::connect_timeout_ms(request.timeout_ms);
    request.redirect_limit = TimeoutEnforcement::redirect_limit(config.follow_redirects);
    return request;
}

double RequestExecutor::elapsed_ms(std::chrono::steady_clock::time_point started,
                                   std::chrono::steady_clock::time_point finished) {
    return std::chrono::duration<double, std::milli>(finished - started).count();
}

} // namespace action
} // namespace preflight
