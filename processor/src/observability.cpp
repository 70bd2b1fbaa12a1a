#include "preflight/action/observability.hpp"
#include "preflight/action/core.hpp"
#include "preflight/action/feature_flags.hpp"
#include "preflight/action/result_converter.hpp"
#include <prometheus/text_serializer.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace preflight {
namespace action {

using json = nlohmann::json;

// Secret-bearing field names to filter
static const std::vector<std::string> SECRET_FIELDS = {
    "password", "secret", "token", "api_key", "api-key",
    "authorization", "credential", "cookie"
};

// Helper function to check if a field name should be filtered (case-insensitive)
static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(), ::tolower);

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Recursively filter secrets from JSON object
static void filter_secrets_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_secrets_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_secrets_recursive(item);
            }
        }
    }
}

// Generate ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

Observability::Observability(const std::string& action_id,
                             std::ostream& info_stream,
                             std::ostream& error_stream)
    : action_id_(action_id),
      info_stream_(info_stream),
      error_stream_(error_stream),
      registry_(std::make_shared<prometheus::Registry>()) {
    initialize_metrics();
}

void Observability::initialize_metrics() {
    metrics_enabled_ = FeatureFlags::is_metrics_enabled();
    if (!metrics_enabled_) {
        return;
    }

    attempts_total_family_ = &prometheus::BuildCounter()
        .Name("preflight_attempts_total")
        .Help("Total number of OPTIONS attempts by outcome")
        .Register(*registry_);

    attempt_duration_ms_family_ = &prometheus::BuildHistogram()
        .Name("preflight_attempt_duration_ms")
        .Help("OPTIONS attempt duration in milliseconds")
        .Register(*registry_);

    signals_total_family_ = &prometheus::BuildCounter()
        .Name("preflight_signals_total")
        .Help("Total number of terminal signals fired")
        .Register(*registry_);
}

void Observability::record_attempt(OutcomeKind outcome, double duration_ms) {
    if (!metrics_enabled_) {
        return;
    }

    attempts_total_family_->Add({{"outcome", ResultConverter::outcome_kind_to_string(outcome)}}).Increment();
    attempt_duration_ms_family_->Add({}, prometheus::Histogram::BucketBoundaries{
        10, 50, 100, 250, 500, 1000, 2500, 5000, 10000, 30000
    }).Observe(duration_ms);
}

void Observability::record_signal(Signal signal) {
    if (!metrics_enabled_) {
        return;
    }

    signals_total_family_->Add({{"signal", ResultConverter::signal_to_string(signal)}}).Increment();
}

std::string Observability::get_metrics_response() {
    if (!metrics_enabled_) {
        return ""; // Return empty if feature flag disabled
    }

    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void Observability::log_info(const std::string& message,
                             const ActionContext& ctx,
                             const std::unordered_map<std::string, std::string>& context) {
    info_stream_ << format_json_log("INFO", message, ctx, context) << std::endl;
}

void Observability::log_warn(const std::string& message,
                             const ActionContext& ctx,
                             const std::unordered_map<std::string, std::string>& context) {
    info_stream_ << format_json_log("WARN", message, ctx, context) << std::endl;
}

void Observability::log_error(const std::string& message,
                              const ActionContext& ctx,
                              const std::unordered_map<std::string, std::string>& context) {
    error_stream_ << format_json_log("ERROR", message, ctx, context) << std::endl;
}

void Observability::log_debug(const std::string& message,
                              const ActionContext& ctx,
                              const std::unordered_map<std::string, std::string>& context) {
    info_stream_ << format_json_log("DEBUG", message, ctx, context) << std::endl;
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const ActionContext& ctx,
                                           const std::unordered_map<std::string, std::string>& context) {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "options_action";
    log_entry["message"] = message;

    // Correlation fields (at top level, when provided)
    if (!ctx.owner_id.empty()) {
        log_entry["owner_id"] = ctx.owner_id;
    }
    if (!ctx.state_name.empty()) {
        log_entry["state_name"] = ctx.state_name;
    }
    if (!ctx.action_id.empty()) {
        log_entry["action_id"] = ctx.action_id;
    }
    if (!ctx.trace_id.empty()) {
        log_entry["trace_id"] = ctx.trace_id;
    }

    // Context object (technical details)
    json context_obj;
    context_obj["action_id"] = action_id_;

    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }

    filter_secrets_recursive(context_obj);
    log_entry["context"] = context_obj;

    // Response bodies are arbitrary bytes
    return log_entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace action
} // namespace preflight
