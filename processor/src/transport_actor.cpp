#include "preflight/action/actors.hpp"
#include <caf/atom.hpp>
#include <exception>

namespace preflight {
namespace action {

TransportActorState::TransportActorState(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {}

transport_actor::behavior_type TransportActorState::make_behavior() {
    return {
        [this](caf::atom_value perform_atom, const TransportRequest& request) -> TransportResult {
            TransportResult result;
            if (perform_atom != caf::atom("perform")) {
                result.error_text = "Unexpected transport message";
                return result;
            }
            if (!transport_) {
                result.error_text = "No HTTP transport configured";
                return result;
            }

            try {
                return transport_->perform(request);
            } catch (const std::exception& e) {
                // perform() reports failures as values; anything thrown is unclassified
                result.error_text = e.what();
                return result;
            }
        }
    };
}

} // namespace action
} // namespace preflight
