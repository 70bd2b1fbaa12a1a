#include "preflight/action/signal_emitter.hpp"
#include "preflight/action/result_converter.hpp"
#include <caf/atom.hpp>
#include <caf/send.hpp>

namespace preflight {
namespace action {

const std::optional<std::string>& EventBindings::for_signal(Signal signal) const {
    switch (signal) {
        case Signal::success:
            return success;
        case Signal::client_error:
            return client_error;
        case Signal::server_error:
            return server_error;
        case Signal::timeout:
            return timeout;
        case Signal::network_error:
        default:
            return network_error;
    }
}

EventBindings EventBindings::defaults() {
    EventBindings bindings;
    bindings.success = ResultConverter::signal_to_string(Signal::success);
    bindings.client_error = ResultConverter::signal_to_string(Signal::client_error);
    bindings.server_error = ResultConverter::signal_to_string(Signal::server_error);
    bindings.network_error = ResultConverter::signal_to_string(Signal::network_error);
    bindings.timeout = ResultConverter::signal_to_string(Signal::timeout);
    return bindings;
}

ActorSignalEmitter::ActorSignalEmitter(caf::actor host) : host_(std::move(host)) {}

void ActorSignalEmitter::emit(const std::string& event_name) {
    caf::anon_send(host_, caf::atom("signal"), event_name);
}

void ActorSignalEmitter::finish(const std::string& action_id, Signal signal, int32_t retries_used) {
    caf::anon_send(host_, caf::atom("finished"), action_id, ResultConverter::signal_to_string(signal), retries_used);
}

} // namespace action
} // namespace preflight
