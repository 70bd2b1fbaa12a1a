#include "preflight/action/outcome_classifier.hpp"
#include "preflight/action/feature_flags.hpp"
#include "preflight/action/status_text.hpp"
#include "preflight/action/string_utils.hpp"
#include <variant>

namespace preflight {
namespace action {

namespace {

struct OutcomeRecorder {
    const OutputSlots& slots;

    void operator()(const SuccessOutcome& outcome) const {
        OutcomeClassifier::record_response(outcome.response, slots);
    }

    void operator()(const ClientErrorOutcome& outcome) const {
        OutcomeClassifier::record_response(outcome.response, slots);
        assign(slots.error_message, outcome.message);
    }

    void operator()(const ServerErrorOutcome& outcome) const {
        OutcomeClassifier::record_response(outcome.response, slots);
        assign(slots.error_message, outcome.message);
    }

    void operator()(const NetworkErrorOutcome& outcome) const {
        assign(slots.error_message, outcome.message);
    }

    void operator()(const TimeoutOutcome& outcome) const {
        assign(slots.error_message, outcome.message);
    }

    void operator()(const UnclassifiedOutcome& outcome) const {
        if (outcome.response) {
            OutcomeClassifier::record_response(*outcome.response, slots);
        }
        assign(slots.error_message, outcome.message);
    }
};

ResponseData response_data_from(const TransportResult& result) {
    ResponseData response;
    response.status_code = result.status_code;
    response.body = result.body;
    response.headers = result.headers;
    return response;
}

} // namespace

Outcome OutcomeClassifier::classify(const TransportResult& result) {
    switch (result.kind) {
        case TransportResultKind::success:
        case TransportResultKind::protocol_error:
            return classify_response(result);

        case TransportResultKind::connection_error:
            if (is_timeout(result)) {
                return TimeoutOutcome{"Request timeout"};
            }
            return NetworkErrorOutcome{"Network Error: " + result.error_text};

        case TransportResultKind::data_processing_error:
        default:
            return UnclassifiedOutcome{std::nullopt, "Error: " + result.error_text};
    }
}

Outcome OutcomeClassifier::classify_response(const TransportResult& result) {
    const int32_t code = result.status_code;

    if (code >= 200 && code <= 299) {
        return SuccessOutcome{response_data_from(result)};
    }
    if (code >= 400 && code <= 499) {
        return ClientErrorOutcome{response_data_from(result),
                                  "Client Error " + std::to_string(code) + ": " + result.error_text};
    }
    if (code >= 500 && code <= 599) {
        return ServerErrorOutcome{response_data_from(result),
                                  "Server Error " + std::to_string(code) + ": " + result.error_text};
    }

    // 1xx/3xx (redirects not followed) and out-of-range codes
    std::string text = result.error_text.empty() ? StatusText::message(code) : result.error_text;
    return UnclassifiedOutcome{response_data_from(result), "Error: " + text};
}

bool OutcomeClassifier::is_timeout(const TransportResult& result) {
    if (result.kind != TransportResultKind::connection_error) {
        return false;
    }
    if (FeatureFlags::is_text_timeout_detection_enabled()) {
        return result.error_text.find("timeout") != std::string::npos;
    }
    return result.timed_out || string_utils::icontains(result.error_text, "timeout");
}

const ResponseData* OutcomeClassifier::response_of(const Outcome& outcome) {
    if (const auto* success = std::get_if<SuccessOutcome>(&outcome)) {
        return &success->response;
    }
    if (const auto* client_error = std::get_if<ClientErrorOutcome>(&outcome)) {
        return &client_error->response;
    }
    if (const auto* server_error = std::get_if<ServerErrorOutcome>(&outcome)) {
        return &server_error->response;
    }
    if (const auto* unclassified = std::get_if<UnclassifiedOutcome>(&outcome)) {
        return unclassified->response ? &*unclassified->response : nullptr;
    }
    return nullptr;
}

std::string OutcomeClassifier::message_of(const Outcome& outcome) {
    if (const auto* client_error = std::get_if<ClientErrorOutcome>(&outcome)) {
        return client_error->message;
    }
    if (const auto* server_error = std::get_if<ServerErrorOutcome>(&outcome)) {
        return server_error->message;
    }
    if (const auto* network_error = std::get_if<NetworkErrorOutcome>(&outcome)) {
        return network_error->message;
    }
    if (const auto* timeout = std::get_if<TimeoutOutcome>(&outcome)) {
        return timeout->message;
    }
    if (const auto* unclassified = std::get_if<UnclassifiedOutcome>(&outcome)) {
        return unclassified->message;
    }
    return std::string();
}

void OutcomeClassifier::record(const Outcome& outcome, const OutputSlots& slots) {
    std::visit(OutcomeRecorder{slots}, outcome);
}

void OutcomeClassifier::record_response(const ResponseData& response, const OutputSlots& slots) {
    assign(slots.status_code, response.status_code);
    if (slots.status_message) {
        assign(slots.status_message, StatusText::message(response.status_code));
    }
    assign(slots.response_body, response.body);
    if (slots.response_headers) {
        assign(slots.response_headers, StatusText::format_headers(response.headers));
    }

    if (const auto* allow = response.headers.find("Allow")) {
        assign(slots.allowed_methods, *allow);
    }
    if (const auto* allow_headers = response.headers.find("Access-Control-Allow-Headers")) {
        assign(slots.allowed_headers, *allow_headers);
    }
    if (const auto* max_age = response.headers.find("Access-Control-Max-Age")) {
        assign(slots.max_age, *max_age);
    }
}

} // namespace action
} // namespace preflight
