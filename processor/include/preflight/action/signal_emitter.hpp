#pragma once

#include "preflight/action/core.hpp"
#include <caf/actor.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace preflight {
namespace action {

// Host event names for the five terminal signals. An unbound signal is
// silently not fired.
struct EventBindings {
    std::optional<std::string> success;
    std::optional<std::string> client_error;
    std::optional<std::string> server_error;
    std::optional<std::string> network_error;
    std::optional<std::string> timeout;

    const std::optional<std::string>& for_signal(Signal signal) const;

    // Every signal bound to its default name
    static EventBindings defaults();
};

// Signal emitter capability of the host state machine
class SignalEmitter {
public:
    virtual ~SignalEmitter() = default;

    virtual void emit(const std::string& event_name) = 0;

    // End of the invocation; sent once, after the terminal signal (bound or not)
    virtual void finish(const std::string& action_id, Signal signal, int32_t retries_used) = 0;
};

// Forwards signals to a host actor as (signal, event_name) and
// (finished, action_id, signal_name, retries_used)
class ActorSignalEmitter : public SignalEmitter {
public:
    explicit ActorSignalEmitter(caf::actor host);

    void emit(const std::string& event_name) override;
    void finish(const std::string& action_id, Signal signal, int32_t retries_used) override;

private:
    caf::actor host_;
};

} // namespace action
} // namespace preflight
