#include "preflight/action/core.hpp"

namespace preflight {
namespace action {

namespace {

struct OutcomeKindVisitor {
    OutcomeKind operator()(const SuccessOutcome&) const { return OutcomeKind::success; }
    OutcomeKind operator()(const ClientErrorOutcome&) const { return OutcomeKind::client_error; }
    OutcomeKind operator()(const ServerErrorOutcome&) const { return OutcomeKind::server_error; }
    OutcomeKind operator()(const NetworkErrorOutcome&) const { return OutcomeKind::network_error; }
    OutcomeKind operator()(const TimeoutOutcome&) const { return OutcomeKind::timeout; }
    OutcomeKind operator()(const UnclassifiedOutcome&) const { return OutcomeKind::unclassified_error; }
};

} // namespace

OutcomeKind kind_of(const Outcome& outcome) {
    return std::visit(OutcomeKindVisitor{}, outcome);
}

Signal terminal_signal(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::success:
            return Signal::success;
        case OutcomeKind::client_error:
            return Signal::client_error;
        case OutcomeKind::server_error:
            return Signal::server_error;
        case OutcomeKind::timeout:
            return Signal::timeout;
        case OutcomeKind::network_error:
        case OutcomeKind::unclassified_error:
        default:
            return Signal::network_error;
    }
}

} // namespace action
} // namespace preflight
