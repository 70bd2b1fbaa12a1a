#include "preflight/action/curl_transport.hpp"
#include "preflight/action/curl_handle.hpp"
#include "preflight/action/status_text.hpp"
#include "preflight/action/string_utils.hpp"
#include <stdexcept>
#include <string>

namespace preflight {
namespace action {

namespace {

struct ResponseCapture {
    std::string body;
    HeaderList headers;
    std::string reason_phrase;
};

// "HTTP/1.1 403 Forbidden" -> "Forbidden"; HTTP/2 status lines carry none
std::string reason_phrase_of(const std::string& status_line) {
    size_t first_space = status_line.find(' ');
    if (first_space == std::string::npos) {
        return std::string();
    }
    size_t second_space = status_line.find(' ', first_space + 1);
    if (second_space == std::string::npos) {
        return std::string();
    }
    return string_utils::trim(status_line.substr(second_space + 1));
}

CurlSlistPtr build_header_list(const HeaderList& headers) {
    curl_slist* list = nullptr;
    for (const auto& entry : headers.entries()) {
        // "Name;" is curl's syntax for sending a header with an empty value
        std::string line = entry.second.empty() ? entry.first + ";" : entry.first + ": " + entry.second;
        curl_slist* appended = curl_slist_append(list, line.c_str());
        if (appended == nullptr) {
            curl_slist_free_all(list);
            throw std::bad_alloc();
        }
        list = appended;
    }
    return CurlSlistPtr(list);
}

} // namespace

CurlGlobal::CurlGlobal() {
    const auto rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

TransportResult CurlTransport::perform(const TransportRequest& request) {
    TransportResult result;

    CurlEasyPtr curl(curl_easy_init());
    if (!curl) {
        result.kind = TransportResultKind::data_processing_error;
        result.error_text = "Failed to initialize CURL";
        return result;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    ResponseCapture capture;
    CurlSlistPtr header_list;
    try {
        header_list = build_header_list(request.headers);
    } catch (const std::bad_alloc&) {
        result.kind = TransportResultKind::data_processing_error;
        result.error_text = "Failed to build request headers";
        return result;
    }

    CURLcode rc = CURLE_OK;
    auto setopt = [&](CURLoption option, auto value) {
        if (rc == CURLE_OK) {
            rc = curl_easy_setopt(curl.get(), option, value);
        }
    };

    setopt(CURLOPT_URL, request.url.c_str());
    setopt(CURLOPT_CUSTOMREQUEST, request.method.c_str());
    setopt(CURLOPT_NOSIGNAL, 1L);
    setopt(CURLOPT_ERRORBUFFER, error_buffer);
    setopt(CURLOPT_WRITEFUNCTION, write_callback);
    setopt(CURLOPT_WRITEDATA, static_cast<void*>(&capture));
    setopt(CURLOPT_HEADERFUNCTION, header_callback);
    setopt(CURLOPT_HEADERDATA, static_cast<void*>(&capture));

    // OPTIONS over HTTP only; other schemes fail as CURLE_UNSUPPORTED_PROTOCOL
#if LIBCURL_VERSION_NUM >= 0x075500
    setopt(CURLOPT_PROTOCOLS_STR, "http,https");
    setopt(CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    setopt(CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    setopt(CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif

    if (header_list) {
        setopt(CURLOPT_HTTPHEADER, header_list.get());
    }

    if (request.timeout_ms > 0) {
        setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    }
    if (request.connect_timeout_ms > 0) {
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));
    }

    // A limit of 0 makes curl refuse the first redirect with CURLE_TOO_MANY_REDIRECTS
    setopt(CURLOPT_FOLLOWLOCATION, 1L);
    setopt(CURLOPT_MAXREDIRS, static_cast<long>(request.redirect_limit));

    if (rc != CURLE_OK) {
        result.kind = TransportResultKind::data_processing_error;
        result.error_text = "Failed to configure CURL: " + std::string(curl_easy_strerror(rc));
        return result;
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        result.kind = classify_curl_code(res);
        result.error_text = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(res));
        result.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        return result;
    }

    long response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);

    result.status_code = static_cast<int32_t>(response_code);
    result.body = std::move(capture.body);
    result.headers = std::move(capture.headers);

    if (response_code >= 400) {
        result.kind = TransportResultKind::protocol_error;
        result.error_text = capture.reason_phrase.empty()
            ? StatusText::message(result.status_code)
            : capture.reason_phrase;
    } else {
        result.kind = TransportResultKind::success;
    }

    return result;
}

TransportResultKind CurlTransport::classify_curl_code(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransportResultKind::success;

        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_HTTP2:
        case CURLE_PARTIAL_FILE:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_TOO_MANY_REDIRECTS:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return TransportResultKind::connection_error;

        default:
            return TransportResultKind::data_processing_error;
    }
}

size_t CurlTransport::write_callback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* capture = static_cast<ResponseCapture*>(userdata);
    if (capture == nullptr || data == nullptr) {
        return 0;
    }
    capture->body.append(data, size * nmemb);
    return size * nmemb;
}

size_t CurlTransport::header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* capture = static_cast<ResponseCapture*>(userdata);
    const size_t total = size * nitems;
    if (capture == nullptr) {
        return 0;
    }

    std::string line = string_utils::trim(std::string(buffer, total));
    if (line.empty()) {
        return total;
    }

    if (line.compare(0, 5, "HTTP/") == 0) {
        // New status line: an interim (1xx) or redirect response came first
        capture->headers.clear();
        capture->body.clear();
        capture->reason_phrase = reason_phrase_of(line);
        return total;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        capture->headers.append(string_utils::trim(line.substr(0, colon)),
                                string_utils::trim(line.substr(colon + 1)));
    }
    return total;
}

} // namespace action
} // namespace preflight
