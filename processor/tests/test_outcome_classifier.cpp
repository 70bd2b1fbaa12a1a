#include <iostream>
#include <cassert>
#include <cstdlib>
#include <string>
#include "preflight/action/core.hpp"
#include "preflight/action/outcome_classifier.hpp"
#include "preflight/action/output_slots.hpp"
#include "preflight/action/status_text.hpp"
#include "test_support.hpp"

using namespace preflight::action;
using namespace preflight::action::testing;

void test_status_text_table() {
    std::cout << "Testing status text table..." << std::endl;

    assert(StatusText::message(200) == "OK");
    assert(StatusText::message(201) == "Created");
    assert(StatusText::message(204) == "No Content");
    assert(StatusText::message(400) == "Bad Request");
    assert(StatusText::message(401) == "Unauthorized");
    assert(StatusText::message(403) == "Forbidden");
    assert(StatusText::message(404) == "Not Found");
    assert(StatusText::message(500) == "Internal Server Error");
    assert(StatusText::message(502) == "Bad Gateway");
    assert(StatusText::message(503) == "Service Unavailable");
    assert(StatusText::message(418) == "HTTP 418");
    assert(StatusText::message(0) == "HTTP 0");

    std::cout << "✓ Status text table test passed" << std::endl;
}

void test_format_headers() {
    std::cout << "Testing header text formatting..." << std::endl;

    HeaderList headers;
    headers.append("Allow", "GET, OPTIONS");
    headers.append("Access-Control-Max-Age", "600");

    assert(StatusText::format_headers(headers) == "Allow: GET, OPTIONS\nAccess-Control-Max-Age: 600");
    assert(StatusText::format_headers(HeaderList()) == "");

    std::cout << "✓ Header text formatting test passed" << std::endl;
}

void test_success_populates_slots() {
    std::cout << "Testing 2xx classification..." << std::endl;

    OutputVariables variables;
    OutputSlots slots = variables.bind_all();

    auto result = make_response(204, "No Content", "", {
        {"allow", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
        {"Access-Control-Max-Age", "86400"}
    });

    Outcome outcome = OutcomeClassifier::classify(result);
    assert(kind_of(outcome) == OutcomeKind::success);
    OutcomeClassifier::record(outcome, slots);

    assert(variables.status_code->get() == 204);
    assert(variables.status_message->get() == "No Content");
    assert(variables.response_body->get() == "");
    assert(variables.allowed_methods->get() == "GET, POST, OPTIONS");
    assert(variables.allowed_headers->get() == "Content-Type, Authorization");
    assert(variables.max_age->get() == "86400");
    assert(variables.response_headers->get() ==
           "allow: GET, POST, OPTIONS\nAccess-Control-Allow-Headers: Content-Type, Authorization\nAccess-Control-Max-Age: 86400");
    assert(!variables.error_message->assigned());

    std::cout << "✓ 2xx classification test passed" << std::endl;
}

void test_options_slots_only_when_present() {
    std::cout << "Testing OPTIONS slots without the headers..." << std::endl;

    OutputVariables variables;
    OutputSlots slots = variables.bind_all();

    OutcomeClassifier::record(OutcomeClassifier::classify(make_response(200, "OK", "{}")), slots);

    assert(variables.status_code->get() == 200);
    assert(variables.response_body->get() == "{}");
    assert(!variables.allowed_methods->assigned());
    assert(!variables.allowed_headers->assigned());
    assert(!variables.max_age->assigned());

    std::cout << "✓ OPTIONS slots presence test passed" << std::endl;
}

void test_client_error() {
    std::cout << "Testing 4xx classification..." << std::endl;

    OutputVariables variables;
    OutputSlots slots = variables.bind_all();

    Outcome outcome = OutcomeClassifier::classify(make_response(403, "Forbidden", "denied"));
    assert(kind_of(outcome) == OutcomeKind::client_error);
    OutcomeClassifier::record(outcome, slots);

    assert(variables.error_message->get() == "Client Error 403: Forbidden");
    assert(variables.status_code->get() == 403);
    assert(variables.status_message->get() == "Forbidden");
    assert(variables.response_body->get() == "denied");

    std::cout << "✓ 4xx classification test passed" << std::endl;
}

void test_server_error() {
    std::cout << "Testing 5xx classification..." << std::endl;

    OutputVariables variables;
    OutputSlots slots = variables.bind_all();

    Outcome outcome = OutcomeClassifier::classify(make_response(503, "Service Unavailable"));
    assert(kind_of(outcome) == OutcomeKind::server_error);
    OutcomeClassifier::record(outcome, slots);

    assert(variables.error_message->get() == "Server Error 503: Service Unavailable");
    assert(variables.status_message->get() == "Service Unavailable");

    Outcome upper = OutcomeClassifier::classify(make_response(599, "Custom"));
    assert(kind_of(upper) == OutcomeKind::server_error);

    std::cout << "✓ 5xx classification test passed" << std::endl;
}

void test_timeout_detection() {
    std::cout << "Testing timeout detection..." << std::endl;

    unsetenv("PREFLIGHT_TEXT_TIMEOUT_DETECTION");

    OutputVariables variables;
    OutputSlots slots = variables.bind_all();

    Outcome by_text = OutcomeClassifier::classify(make_connection_error("Connection timeout after 30000ms"));
    assert(kind_of(by_text) == OutcomeKind::timeout);
    OutcomeClassifier::record(by_text, slots);
    assert(variables.error_message->get() == "Request timeout");
    // No response exists: response slots stay untouched
    assert(!variables.status_code->assigned());
    assert(!variables.response_body->assigned());

    Outcome by_case = OutcomeClassifier::classify(make_connection_error("Operation TimeOut"));
    assert(kind_of(by_case) == OutcomeKind::timeout);

    Outcome by_flag = OutcomeClassifier::classify(make_connection_error("Operation timed out after 5000 milliseconds", true));
    assert(kind_of(by_flag) == OutcomeKind::timeout);

    setenv("PREFLIGHT_TEXT_TIMEOUT_DETECTION", "true", 1);
    Outcome text_only = OutcomeClassifier::classify(make_connection_error("Operation timed out after 5000 milliseconds", true));
    assert(kind_of(text_only) == OutcomeKind::network_error);
    Outcome still_text = OutcomeClassifier::classify(make_connection_error("timeout"));
    assert(kind_of(still_text) == OutcomeKind::timeout);
    Outcome mixed_case = OutcomeClassifier::classify(make_connection_error("Operation TimeOut"));
    assert(kind_of(mixed_case) == OutcomeKind::network_error);
    unsetenv("PREFLIGHT_TEXT_TIMEOUT_DETECTION");

    std::cout << "✓ Timeout detection test passed" << std::endl;
}

void test_network_error() {
    std::cout << "Testing network error classification..." << std::endl;

    OutputVariables variables;
    OutputSlots slots = variables.bind_all();

    Outcome outcome = OutcomeClassifier::classify(make_connection_error("Could not resolve host: nowhere.invalid"));
    assert(kind_of(outcome) == OutcomeKind::network_error);
    OutcomeClassifier::record(outcome, slots);

    assert(variables.error_message->get() == "Network Error: Could not resolve host: nowhere.invalid");
    assert(!variables.status_code->assigned());
    assert(!variables.response_headers->assigned());

    std::cout << "✓ Network error classification test passed" << std::endl;
}

void test_unclassified_failures() {
    std::cout << "Testing unclassified failures..." << std::endl;

    OutputVariables variables;
    OutputSlots slots = variables.bind_all();

    Outcome processing = OutcomeClassifier::classify(make_processing_error("Failure writing output to destination"));
    assert(kind_of(processing) == OutcomeKind::unclassified_error);
    OutcomeClassifier::record(processing, slots);
    assert(variables.error_message->get() == "Error: Failure writing output to destination");
    assert(!variables.status_code->assigned());

    OutputVariables redirect_vars;
    OutputSlots redirect_slots = redirect_vars.bind_all();
    Outcome redirect = OutcomeClassifier::classify(make_response(302, "Found", "", {{"Location", "/elsewhere"}}));
    assert(kind_of(redirect) == OutcomeKind::unclassified_error);
    OutcomeClassifier::record(redirect, redirect_slots);
    assert(redirect_vars.status_code->get() == 302);
    assert(redirect_vars.status_message->get() == "HTTP 302");
    assert(redirect_vars.error_message->get() == "Error: HTTP 302");

    std::cout << "✓ Unclassified failures test passed" << std::endl;
}

void test_unbound_slots_are_safe() {
    std::cout << "Testing classification with unbound slots..." << std::endl;

    OutputSlots unbound;
    OutcomeClassifier::record(OutcomeClassifier::classify(make_response(200, "OK", "x", {{"Allow", "GET"}})), unbound);
    OutcomeClassifier::record(OutcomeClassifier::classify(make_response(404, "Not Found")), unbound);
    OutcomeClassifier::record(OutcomeClassifier::classify(make_connection_error("refused")), unbound);

    // Partially bound: only the error slot
    OutputVariables variables;
    OutputSlots partial;
    partial.error_message = bind(variables.error_message);
    OutcomeClassifier::record(OutcomeClassifier::classify(make_response(401, "Unauthorized")), partial);
    assert(variables.error_message->get() == "Client Error 401: Unauthorized");
    assert(!variables.status_code->assigned());

    std::cout << "✓ Unbound slots test passed" << std::endl;
}

void test_outcome_accessors() {
    std::cout << "Testing outcome accessors..." << std::endl;

    Outcome success = OutcomeClassifier::classify(make_response(200, "OK", "body"));
    assert(OutcomeClassifier::response_of(success) != nullptr);
    assert(OutcomeClassifier::response_of(success)->body == "body");
    assert(OutcomeClassifier::message_of(success).empty());

    Outcome network = OutcomeClassifier::classify(make_connection_error("refused"));
    assert(OutcomeClassifier::response_of(network) == nullptr);
    assert(OutcomeClassifier::message_of(network) == "Network Error: refused");

    std::cout << "✓ Outcome accessors test passed" << std::endl;
}

int main() {
    std::cout << "Running outcome classifier tests..." << std::endl;

    try {
        test_status_text_table();
        test_format_headers();
        test_success_populates_slots();
        test_options_slots_only_when_present();
        test_client_error();
        test_server_error();
        test_timeout_detection();
        test_network_error();
        test_unclassified_failures();
        test_unbound_slots_are_safe();
        test_outcome_accessors();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All outcome classifier tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "\n❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
