#pragma once

#include "preflight/action/core.hpp"
#include "preflight/action/http_transport.hpp"
#include "preflight/action/http_types.hpp"
#include "preflight/action/observability.hpp"
#include "preflight/action/output_slots.hpp"
#include "preflight/action/signal_emitter.hpp"
#include <caf/actor_system.hpp>
#include <caf/typed_actor.hpp>
#include <caf/typed_event_based_actor.hpp>
#include <memory>
#include <optional>

namespace preflight {
namespace action {

// Transport actor interface: (perform, request) -> result
using transport_actor = caf::typed_actor<
    caf::replies_to<caf::atom_value, TransportRequest>::with<TransportResult>
>;

class TransportActorState {
public:
    explicit TransportActorState(std::shared_ptr<HttpTransport> transport);

    transport_actor::behavior_type make_behavior();

private:
    std::shared_ptr<HttpTransport> transport_;
};

// Spawn detached: perform() blocks on socket I/O
class TransportActorImpl : public caf::typed_event_based_actor<
    caf::replies_to<caf::atom_value, TransportRequest>::with<TransportResult>
> {
public:
    TransportActorImpl(caf::actor_config& cfg, std::shared_ptr<HttpTransport> transport)
        : caf::typed_event_based_actor<
            caf::replies_to<caf::atom_value, TransportRequest>::with<TransportResult>
          >(cfg),
          state_(std::move(transport)) {}

    behavior_type make_behavior() override {
        return state_.make_behavior();
    }
private:
    TransportActorState state_;
};

// Options action interface: (activate) from the host, (retry) from itself
using options_action_actor = caf::typed_actor<
    caf::reacts_to<caf::atom_value>
>;

using options_action_base = caf::typed_event_based_actor<
    caf::reacts_to<caf::atom_value>
>;

// Everything the host wires into an action instance
struct ActionBindings {
    ActionContext context;
    OutputSlots slots;
    EventBindings events;
    std::shared_ptr<SignalEmitter> emitter;
    std::shared_ptr<Observability> observability; // created from context.action_id when null
};

// Invocation controller: one OPTIONS invocation at a time, each with a
// fresh config snapshot and retry counter
class OptionsActionState {
public:
    OptionsActionState(options_action_base* self, RequestConfig config,
                       ActionBindings bindings, transport_actor transport);

    options_action_actor::behavior_type make_behavior();

private:
    struct Invocation {
        RequestConfig config;
        AttemptState state;
        bool retry_pending = false;  // set only while our own delayed retry is queued
    };

    options_action_base* self_;
    RequestConfig config_;
    ActionBindings bindings_;
    transport_actor transport_;
    std::shared_ptr<Observability> observability_;
    std::optional<Invocation> invocation_;

    void activate();
    void start_attempt();
    void on_attempt_complete(const TransportResult& result);
    void finalize(Signal signal);

    void log_request(const RequestConfig& config, const TransportRequest& request);
    void log_outcome(const RequestConfig& config, const Outcome& outcome);
};

class OptionsActionImpl : public options_action_base {
public:
    OptionsActionImpl(caf::actor_config& cfg, RequestConfig config,
                      ActionBindings bindings, transport_actor transport)
        : options_action_base(cfg),
          state_(this, std::move(config), std::move(bindings), std::move(transport)) {}

    behavior_type make_behavior() override {
        return state_.make_behavior();
    }
private:
    OptionsActionState state_;
};

using OptionsAction = OptionsActionImpl;

} // namespace action
} // namespace preflight
