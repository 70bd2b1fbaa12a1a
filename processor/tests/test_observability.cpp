#include <iostream>
#include <cassert>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <unordered_map>
#include "preflight/action/core.hpp"
#include "preflight/action/observability.hpp"
#include <nlohmann/json.hpp>

using namespace preflight::action;
using json = nlohmann::json;

static std::vector<json> parse_lines(const std::string& output) {
    std::vector<json> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(json::parse(line));
        }
    }
    return lines;
}

void test_log_format_compliance() {
    std::cout << "Testing log format compliance..." << std::endl;

    std::ostringstream out;
    std::ostringstream err;
    Observability observability("action_1", out, err);

    observability.log_info("Request to: https://api.example.com");

    auto lines = parse_lines(out.str());
    assert(lines.size() == 1);
    assert(err.str().empty());

    const auto& entry = lines[0];
    assert(entry["level"] == "INFO");
    assert(entry["component"] == "options_action");
    assert(entry["message"] == "Request to: https://api.example.com");
    assert(entry["context"]["action_id"] == "action_1");

    // 2026-10-18T09:30:00.123456Z
    std::string timestamp = entry["timestamp"];
    assert(timestamp.size() == 27);
    assert(timestamp[4] == '-' && timestamp[10] == 'T' && timestamp[19] == '.' && timestamp.back() == 'Z');

    std::cout << "✓ Log format compliance test passed" << std::endl;
}

void test_correlation_fields_at_top_level() {
    std::cout << "Testing correlation fields at top level..." << std::endl;

    std::ostringstream out;
    std::ostringstream err;
    Observability observability("action_1", out, err);

    ActionContext ctx;
    ctx.owner_id = "door_controller";
    ctx.state_name = "CheckAccess";
    ctx.action_id = "action_1";
    ctx.trace_id = "trace_def456";

    observability.log_debug("Request details", ctx, {{"method", "OPTIONS"}});

    auto entry = parse_lines(out.str()).at(0);
    assert(entry["level"] == "DEBUG");
    assert(entry["owner_id"] == "door_controller");
    assert(entry["state_name"] == "CheckAccess");
    assert(entry["action_id"] == "action_1");
    assert(entry["trace_id"] == "trace_def456");
    assert(entry["context"]["method"] == "OPTIONS");

    // Empty correlation fields are omitted
    std::ostringstream bare_out;
    Observability bare("action_2", bare_out, err);
    bare.log_info("No correlation");
    auto bare_entry = parse_lines(bare_out.str()).at(0);
    assert(!bare_entry.contains("owner_id"));
    assert(!bare_entry.contains("trace_id"));

    std::cout << "✓ Correlation fields test passed" << std::endl;
}

void test_secret_filtering() {
    std::cout << "Testing secret filtering..." << std::endl;

    std::ostringstream out;
    std::ostringstream err;
    Observability observability("action_1", out, err);

    observability.log_info("Credentials", {}, {
        {"password", "hunter2"},
        {"Authorization", "Bearer abc"},
        {"auth_token", "abc"},
        {"X-API-Key", "k"},
        {"session_cookie", "c"},
        {"url", "https://api.example.com"}
    });

    auto entry = parse_lines(out.str()).at(0);
    assert(entry["context"]["password"] == "[REDACTED]");
    assert(entry["context"]["Authorization"] == "[REDACTED]");
    assert(entry["context"]["auth_token"] == "[REDACTED]");
    assert(entry["context"]["X-API-Key"] == "[REDACTED]");
    assert(entry["context"]["session_cookie"] == "[REDACTED]");
    assert(entry["context"]["url"] == "https://api.example.com");

    std::cout << "✓ Secret filtering test passed" << std::endl;
}

void test_all_log_levels() {
    std::cout << "Testing all log levels..." << std::endl;

    std::ostringstream out;
    std::ostringstream err;
    Observability observability("action_1", out, err);

    observability.log_debug("debug");
    observability.log_info("info");
    observability.log_warn("Request timeout");
    observability.log_error("Network Error: refused");

    auto info_lines = parse_lines(out.str());
    auto error_lines = parse_lines(err.str());
    assert(info_lines.size() == 3);
    assert(info_lines[0]["level"] == "DEBUG");
    assert(info_lines[1]["level"] == "INFO");
    assert(info_lines[2]["level"] == "WARN");
    assert(error_lines.size() == 1);
    assert(error_lines[0]["level"] == "ERROR");
    assert(error_lines[0]["message"] == "Network Error: refused");

    std::cout << "✓ All log levels test passed" << std::endl;
}

void test_invalid_utf8_body() {
    std::cout << "Testing invalid UTF-8 in a logged body..." << std::endl;

    std::ostringstream out;
    std::ostringstream err;
    Observability observability("action_1", out, err);

    std::string body = "Response 200: ";
    body += static_cast<char>(0xff);
    body += static_cast<char>(0xfe);
    observability.log_info(body);

    auto entry = parse_lines(out.str()).at(0);
    std::string message = entry["message"];
    assert(message.compare(0, 14, "Response 200: ") == 0);

    std::cout << "✓ Invalid UTF-8 test passed" << std::endl;
}

void test_special_characters() {
    std::cout << "Testing special characters..." << std::endl;

    std::ostringstream out;
    std::ostringstream err;
    Observability observability("action_1", out, err);

    observability.log_info("Line1\nLine2\t\"quoted\"", {}, {{"headers", "Allow: GET\nVary: Origin"}});

    auto entry = parse_lines(out.str()).at(0);
    assert(entry["message"] == "Line1\nLine2\t\"quoted\"");
    assert(entry["context"]["headers"] == "Allow: GET\nVary: Origin");

    std::cout << "✓ Special characters test passed" << std::endl;
}

void test_metrics_disabled() {
    std::cout << "Testing metrics with the flag off..." << std::endl;

    unsetenv("PREFLIGHT_METRICS_ENABLED");

    std::ostringstream out;
    std::ostringstream err;
    Observability observability("action_1", out, err);

    observability.record_attempt(OutcomeKind::success, 12.0);
    observability.record_signal(Signal::success);
    assert(observability.get_metrics_response().empty());

    std::cout << "✓ Metrics disabled test passed" << std::endl;
}

void test_metrics_enabled() {
    std::cout << "Testing metrics with the flag on..." << std::endl;

    setenv("PREFLIGHT_METRICS_ENABLED", "1", 1);

    std::ostringstream out;
    std::ostringstream err;
    Observability observability("action_1", out, err);

    observability.record_attempt(OutcomeKind::network_error, 120.0);
    observability.record_attempt(OutcomeKind::network_error, 80.0);
    observability.record_attempt(OutcomeKind::unclassified_error, 3.0);
    observability.record_signal(Signal::network_error);

    std::string metrics = observability.get_metrics_response();
    assert(metrics.find("preflight_attempts_total{outcome=\"network_error\"} 2") != std::string::npos);
    assert(metrics.find("preflight_attempts_total{outcome=\"error\"} 1") != std::string::npos);
    assert(metrics.find("preflight_attempt_duration_ms_count 3") != std::string::npos);
    assert(metrics.find("preflight_signals_total{signal=\"network_error\"} 1") != std::string::npos);

    unsetenv("PREFLIGHT_METRICS_ENABLED");

    std::cout << "✓ Metrics enabled test passed" << std::endl;
}

int main() {
    std::cout << "Running observability tests..." << std::endl;

    try {
        test_log_format_compliance();
        test_correlation_fields_at_top_level();
        test_secret_filtering();
        test_all_log_levels();
        test_invalid_utf8_body();
        test_special_characters();
        test_metrics_disabled();
        test_metrics_enabled();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All observability tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "\n❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
