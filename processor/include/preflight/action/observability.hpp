#pragma once

#include "preflight/action/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>

namespace preflight {
namespace action {

class Observability {
public:
    explicit Observability(const std::string& action_id,
                           std::ostream& info_stream = std::cout,
                           std::ostream& error_stream = std::cerr);

    // Metrics (gated behind PREFLIGHT_METRICS_ENABLED)
    void record_attempt(OutcomeKind outcome, double duration_ms);
    void record_signal(Signal signal);
    std::string get_metrics_response(); // Prometheus text format

    // Logging
    void log_info(const std::string& message,
                  const ActionContext& ctx = {},
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const ActionContext& ctx = {},
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const ActionContext& ctx = {},
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_debug(const std::string& message,
                   const ActionContext& ctx = {},
                   const std::unordered_map<std::string, std::string>& context = {});

    // Prometheus registry access
    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

private:
    std::string action_id_;
    std::ostream& info_stream_;
    std::ostream& error_stream_;
    std::shared_ptr<prometheus::Registry> registry_;
    bool metrics_enabled_ = false;

    prometheus::Family<prometheus::Counter>* attempts_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* attempt_duration_ms_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* signals_total_family_ = nullptr;

    void initialize_metrics();
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const ActionContext& ctx,
                                const std::unordered_map<std::string, std::string>& context);
};

} // namespace action
} // namespace preflight
