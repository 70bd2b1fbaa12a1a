#pragma once

#include "preflight/action/core.hpp"
#include "preflight/action/output_slots.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace preflight {
namespace action {

// Converter utilities for signal/outcome names and the host's result document

class ResultConverter {
public:
    // Default event name of each terminal signal
    static std::string signal_to_string(Signal signal) {
        switch (signal) {
            case Signal::success:
                return "success";
            case Signal::client_error:
                return "client_error";
            case Signal::server_error:
                return "server_error";
            case Signal::network_error:
                return "network_error";
            case Signal::timeout:
                return "timeout";
            default:
                return "network_error";
        }
    }

    // Metric label of each outcome kind
    static std::string outcome_kind_to_string(OutcomeKind kind) {
        switch (kind) {
            case OutcomeKind::success:
                return "success";
            case OutcomeKind::client_error:
                return "client_error";
            case OutcomeKind::server_error:
                return "server_error";
            case OutcomeKind::network_error:
                return "network_error";
            case OutcomeKind::timeout:
                return "timeout";
            case OutcomeKind::unclassified_error:
            default:
                return "error";
        }
    }

    // Summary of one finished invocation: the fired event (null when the
    // signal was unbound), retries used and every slot that was assigned
    static nlohmann::json to_summary_json(const std::optional<std::string>& fired_event,
                                          int32_t retries_used,
                                          const OutputVariables& variables) {
        nlohmann::json summary;
        summary["signal"] = fired_event ? nlohmann::json(*fired_event) : nlohmann::json(nullptr);
        summary["retries_used"] = retries_used;

        nlohmann::json outputs = nlohmann::json::object();
        add_if_assigned(outputs, "status_code", variables.status_code);
        add_if_assigned(outputs, "status_message", variables.status_message);
        add_if_assigned(outputs, "response_body", variables.response_body);
        add_if_assigned(outputs, "response_headers", variables.response_headers);
        add_if_assigned(outputs, "error_message", variables.error_message);
        add_if_assigned(outputs, "response_time_ms", variables.response_time_ms);
        add_if_assigned(outputs, "allowed_methods", variables.allowed_methods);
        add_if_assigned(outputs, "allowed_headers", variables.allowed_headers);
        add_if_assigned(outputs, "max_age", variables.max_age);
        summary["outputs"] = outputs;

        return summary;
    }

    // Printable summary; response bodies are arbitrary bytes, so invalid
    // UTF-8 is replaced instead of failing the dump
    static std::string to_summary_text(const std::optional<std::string>& fired_event,
                                       int32_t retries_used,
                                       const OutputVariables& variables) {
        return to_summary_json(fired_event, retries_used, variables)
            .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

private:
    template <class T>
    static void add_if_assigned(nlohmann::json& target, const char* name,
                                const std::shared_ptr<Variable<T>>& variable) {
        if (variable && variable->assigned()) {
            target[name] = variable->get();
        }
    }
};

} // namespace action
} // namespace preflight
