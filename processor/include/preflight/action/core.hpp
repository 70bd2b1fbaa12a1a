#pragma once

#include "preflight/action/http_types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace preflight {
namespace action {

// Correlation fields carried by every log line of an action instance
struct ActionContext {
    std::string owner_id;    // host object that owns the state machine
    std::string state_name;  // state the action is attached to
    std::string action_id;
    std::string trace_id;
};

// Authentication schemes. Exactly one is active per invocation.
struct NoAuth {};

struct BearerToken {
    std::string token;
};

struct ApiKey {
    std::string token;
};

struct BasicAuth {
    std::string username;
    std::string password;  // may be empty
};

struct CustomHeaderAuth {
    std::string header_name;
    std::string token;
};

using AuthScheme = std::variant<NoAuth, BearerToken, ApiKey, BasicAuth, CustomHeaderAuth>;

// Designer-supplied fields. Snapshotted at activation and read-only for the
// lifetime of the invocation, retries included.
struct RequestConfig {
    std::string url;            // direct URL, wins over base_url + endpoint_path
    std::string base_url;
    std::string endpoint_path;
    AuthScheme auth = NoAuth{};
    std::string custom_headers;    // "Key:Value" per line
    std::string query_parameters;  // "Key=Value" per line
    std::string accept_header = "application/json";
    std::string user_agent = "preflight-options-action/1.0";
    double timeout_seconds = 30.0;  // <= 0 disables the timeout
    bool follow_redirects = true;
    int32_t max_retries = 0;
    double retry_delay_seconds = 1.0;
    bool log_request = false;
    bool log_response = false;
    bool debug_mode = false;

    static RequestConfig defaults() {
        return RequestConfig{};
    }
};

// Per-invocation counters
struct AttemptState {
    std::chrono::steady_clock::time_point attempt_started{};
    int32_t retry_count = 0;  // reset at activation only
    int32_t attempts = 0;
};

// Terminal signals. At most one fires per invocation.
enum class Signal {
    success,
    client_error,
    server_error,
    network_error,
    timeout
};

enum class OutcomeKind {
    success,
    client_error,
    server_error,
    network_error,
    timeout,
    unclassified_error
};

// Data of a received response
struct ResponseData {
    int32_t status_code = 0;
    std::string body;
    HeaderList headers;
};

struct SuccessOutcome {
    ResponseData response;
};

struct ClientErrorOutcome {
    ResponseData response;
    std::string message;
};

struct ServerErrorOutcome {
    ResponseData response;
    std::string message;
};

struct NetworkErrorOutcome {
    std::string message;
};

struct TimeoutOutcome {
    std::string message;
};

// Failure outside the four classified categories. Carries the response when
// one was received with a status outside 2xx/4xx/5xx.
struct UnclassifiedOutcome {
    std::optional<ResponseData> response;
    std::string message;
};

using Outcome = std::variant<SuccessOutcome, ClientErrorOutcome, ServerErrorOutcome,
                             NetworkErrorOutcome, TimeoutOutcome, UnclassifiedOutcome>;

OutcomeKind kind_of(const Outcome& outcome);

// Signal fired when an outcome of this kind ends the invocation
Signal terminal_signal(OutcomeKind kind);

} // namespace action
} // namespace preflight
