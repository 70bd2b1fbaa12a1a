#include "preflight/action/actors.hpp"
#include "preflight/action/outcome_classifier.hpp"
#include "preflight/action/request_executor.hpp"
#include "preflight/action/result_converter.hpp"
#include "preflight/action/retry_policy.hpp"
#include <caf/actor_cast.hpp>
#include <caf/atom.hpp>
#include <caf/error.hpp>
#include <caf/typed_event_based_actor.hpp>
#include <chrono>
#include <string>

namespace preflight {
namespace action {

OptionsActionState::OptionsActionState(options_action_base* self, RequestConfig config,
                                       ActionBindings bindings, transport_actor transport)
    : self_(self),
      config_(std::move(config)),
      bindings_(std::move(bindings)),
      transport_(std::move(transport)),
      observability_(bindings_.observability) {
    if (!observability_) {
        observability_ = std::make_shared<Observability>(bindings_.context.action_id);
    }
}

options_action_actor::behavior_type OptionsActionState::make_behavior() {
    return {
        [this](caf::atom_value atom) {
            if (atom == caf::atom("activate")) {
                activate();
            } else if (atom == caf::atom("retry")) {
                // A retry nobody scheduled would overlap the attempt in flight
                if (invocation_ && invocation_->retry_pending) {
                    invocation_->retry_pending = false;
                    start_attempt();
                }
            }
        }
    };
}

void OptionsActionState::activate() {
    if (invocation_) {
        observability_->log_warn("Activation ignored: an invocation is already running", bindings_.context, {
            {"attempt", std::to_string(invocation_->state.attempts)},
            {"retry_count", std::to_string(invocation_->state.retry_count)}
        });
        return;
    }

    invocation_ = Invocation{config_, AttemptState{}};
    start_attempt();
}

void OptionsActionState::start_attempt() {
    auto& invocation = *invocation_;
    invocation.state.attempt_started = std::chrono::steady_clock::now();
    ++invocation.state.attempts;

    TransportRequest request = RequestExecutor::prepare(invocation.config);
    log_request(invocation.config, request);

    self_->request(transport_, caf::infinite, caf::atom("perform"), std::move(request)).then(
        [this](TransportResult& result) {
            on_attempt_complete(result);
        },
        [this](caf::error& err) {
            TransportResult failed;
            failed.kind = TransportResultKind::data_processing_error;
            failed.error_text = caf::to_string(err);
            on_attempt_complete(failed);
        }
    );
}

void OptionsActionState::on_attempt_complete(const TransportResult& result) {
    if (!invocation_) {
        return;
    }
    auto& invocation = *invocation_;

    double elapsed = RequestExecutor::elapsed_ms(invocation.state.attempt_started,
                                                 std::chrono::steady_clock::now());
    assign(bindings_.slots.response_time_ms, elapsed);

    Outcome outcome = OutcomeClassifier::classify(result);
    OutcomeKind kind = kind_of(outcome);
    OutcomeClassifier::record(outcome, bindings_.slots);
    observability_->record_attempt(kind, elapsed);
    log_outcome(invocation.config, outcome);

    RetryPolicy policy(RetryPolicy::config_from(invocation.config));
    if (policy.next_step(kind, invocation.state) == RetryPolicy::Decision::retry) {
        if (invocation.config.debug_mode) {
            observability_->log_debug("Retrying... Attempt " + std::to_string(invocation.state.retry_count) +
                                      "/" + std::to_string(policy.max_retries()), bindings_.context, {
                {"outcome", ResultConverter::outcome_kind_to_string(kind)},
                {"retry_delay_ms", std::to_string(policy.retry_delay().count())}
            });
        }
        invocation.retry_pending = true;
        self_->delayed_send(caf::actor_cast<options_action_actor>(self_), policy.retry_delay(),
                            caf::atom("retry"));
        return;
    }

    finalize(terminal_signal(kind));
}

void OptionsActionState::finalize(Signal signal) {
    int32_t retries_used = invocation_ ? invocation_->state.retry_count : 0;
    invocation_.reset();

    observability_->record_signal(signal);

    const auto& event_name = bindings_.events.for_signal(signal);
    if (bindings_.emitter) {
        if (event_name) {
            bindings_.emitter->emit(*event_name);
        }
        bindings_.emitter->finish(bindings_.context.action_id, signal, retries_used);
    }
}

void OptionsActionState::log_request(const RequestConfig& config, const TransportRequest& request) {
    if (config.log_request || config.debug_mode) {
        observability_->log_info("Request to: " + request.url, bindings_.context);
    }

    if (config.debug_mode) {
        std::string header_names;
        for (const auto& entry : request.headers.entries()) {
            if (!header_names.empty()) {
                header_names += ", ";
            }
            header_names += entry.first;
        }

        observability_->log_debug("Request details", bindings_.context, {
            {"method", request.method},
            {"url", request.url},
            {"timeout_ms", std::to_string(request.timeout_ms)},
            {"redirect_limit", std::to_string(request.redirect_limit)},
            {"header_names", header_names},
            {"attempt", std::to_string(invocation_ ? invocation_->state.attempts : 0)}
        });
    }
}

void OptionsActionState::log_outcome(const RequestConfig& config, const Outcome& outcome) {
    if (!config.log_response && !config.debug_mode) {
        return;
    }

    if (const auto* response = OutcomeClassifier::response_of(outcome)) {
        observability_->log_info("Response " + std::to_string(response->status_code) + ": " + response->body,
                                 bindings_.context);
        if (const auto* allow = response->headers.find("Allow")) {
            observability_->log_info("Allowed Methods: " + *allow, bindings_.context);
        }
    }

    switch (kind_of(outcome)) {
        case OutcomeKind::timeout:
            observability_->log_warn(OutcomeClassifier::message_of(outcome), bindings_.context);
            break;
        case OutcomeKind::network_error:
        case OutcomeKind::unclassified_error:
            observability_->log_error(OutcomeClassifier::message_of(outcome), bindings_.context);
            break;
        default:
            break;
    }
}

} // namespace action
} // namespace preflight
