#pragma once

#include "preflight/action/http_transport.hpp"
#include <curl/curl.h>
#include <cstddef>

namespace preflight {
namespace action {

// libcurl transport. Each perform() owns a fresh easy handle that is
// released before it returns, on every path.
class CurlTransport : public HttpTransport {
public:
    TransportResult perform(const TransportRequest& request) override;

    static TransportResultKind classify_curl_code(CURLcode code);

private:
    static size_t write_callback(char* data, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace action
} // namespace preflight
