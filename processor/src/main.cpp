#include <iostream>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/atom.hpp>
#include <caf/exit_reason.hpp>
#include <caf/scoped_actor.hpp>
#include <caf/send.hpp>
#include "preflight/action/action_config.hpp"
#include "preflight/action/actors.hpp"
#include "preflight/action/core.hpp"
#include "preflight/action/curl_handle.hpp"
#include "preflight/action/curl_transport.hpp"
#include "preflight/action/observability.hpp"
#include "preflight/action/result_converter.hpp"
#include <memory>
#include <optional>
#include <unistd.h>

class PreflightConfig : public caf::actor_system_config {
public:
    PreflightConfig() {
        opt_group{custom_options_, "global"}
            .add(request.url, "url", "Direct request URL (wins over base-url + endpoint-path)")
            .add(request.base_url, "base-url", "Base URL")
            .add(request.endpoint_path, "endpoint-path", "Endpoint path appended to base-url")
            .add(auth.type, "auth-type", "none | bearer | api-key | basic | custom-header")
            .add(auth.token, "auth-token", "Token for bearer, api-key and custom-header auth")
            .add(auth.username, "username", "Basic auth username")
            .add(auth.password, "password", "Basic auth password")
            .add(auth.custom_header, "custom-auth-header", "Header name for custom-header auth")
            .add(custom_headers, "custom-headers", "Key:Value lines (use \\n between lines)")
            .add(query_parameters, "query-parameters", "Key=Value lines (use \\n between lines)")
            .add(request.accept_header, "accept", "Accept header")
            .add(request.user_agent, "user-agent", "User-Agent header")
            .add(request.timeout_seconds, "timeout", "Request timeout in seconds (0 disables)")
            .add(request.follow_redirects, "follow-redirects", "Follow redirects")
            .add(request.max_retries, "max-retries", "Retries on timeout or network error")
            .add(request.retry_delay_seconds, "retry-delay", "Delay between retries in seconds")
            .add(request.log_request, "log-request", "Log the request URL")
            .add(request.log_response, "log-response", "Log the response")
            .add(request.debug_mode, "debug", "Verbose request/retry logging")
            .add(context.owner_id, "owner-id", "Owner id for log correlation")
            .add(context.state_name, "state-name", "State name for log correlation")
            .add(context.action_id, "action-id", "Action id for log correlation")
            .add(context.trace_id, "trace-id", "Trace id for log correlation")
            .add(success_event, "success-event", "Event fired on success (empty = unbound)")
            .add(client_error_event, "client-error-event", "Event fired on 4xx (empty = unbound)")
            .add(server_error_event, "server-error-event", "Event fired on 5xx (empty = unbound)")
            .add(network_error_event, "network-error-event", "Event fired on network error (empty = unbound)")
            .add(timeout_event, "timeout-event", "Event fired on timeout (empty = unbound)");
    }

    preflight::action::RequestConfig request = preflight::action::RequestConfig::defaults();
    preflight::action::AuthOptions auth;
    preflight::action::ActionContext context;
    std::string custom_headers;
    std::string query_parameters;
    std::string success_event = "success";
    std::string client_error_event = "client_error";
    std::string server_error_event = "server_error";
    std::string network_error_event = "network_error";
    std::string timeout_event = "timeout";

    preflight::action::EventBindings event_bindings() const {
        preflight::action::EventBindings events;
        events.success = bound(success_event);
        events.client_error = bound(client_error_event);
        events.server_error = bound(server_error_event);
        events.network_error = bound(network_error_event);
        events.timeout = bound(timeout_event);
        return events;
    }

private:
    static std::optional<std::string> bound(const std::string& event_name) {
        if (event_name.empty()) {
            return std::nullopt;
        }
        return event_name;
    }
};

int caf_main(caf::actor_system& system, const PreflightConfig& config,
             const preflight::action::RequestConfig& request_config) {
    using namespace preflight::action;

    std::unique_ptr<Observability> observability;

    try {
        observability = std::make_unique<Observability>("preflight_" + std::to_string(getpid()));

        ActionContext context = config.context;
        if (context.action_id.empty()) {
            context.action_id = "options_action";
        }

        OutputVariables variables;
        caf::scoped_actor self{system};

        ActionBindings bindings;
        bindings.context = context;
        bindings.slots = variables.bind_all();
        bindings.events = config.event_bindings();
        bindings.emitter = std::make_shared<ActorSignalEmitter>(caf::actor_cast<caf::actor>(self));

        auto transport = system.spawn<TransportActorImpl, caf::detached>(
            std::static_pointer_cast<HttpTransport>(std::make_shared<CurlTransport>()));
        auto action = system.spawn<OptionsAction>(request_config, bindings, transport);

        caf::anon_send(action, caf::atom("activate"));

        std::optional<std::string> fired_event;
        std::string terminal_signal;
        int32_t retries_used = 0;
        bool finished = false;

        while (!finished) {
            self->receive(
                [&](caf::atom_value signal_atom, const std::string& event_name) {
                    if (signal_atom == caf::atom("signal")) {
                        fired_event = event_name;
                    }
                },
                [&](caf::atom_value finished_atom, const std::string& /*action_id*/,
                    const std::string& signal_name, int32_t retries) {
                    if (finished_atom == caf::atom("finished")) {
                        terminal_signal = signal_name;
                        retries_used = retries;
                        finished = true;
                    }
                }
            );
        }

        std::cout << ResultConverter::to_summary_text(fired_event, retries_used, variables) << std::endl;

        caf::anon_send_exit(action, caf::exit_reason::user_shutdown);
        caf::anon_send_exit(transport, caf::exit_reason::user_shutdown);

        return terminal_signal == ResultConverter::signal_to_string(Signal::success) ? 0 : 1;

    } catch (const std::exception& e) {
        if (observability) {
            observability->log_error("Preflight fatal error", {}, {{"error", e.what()}});
        } else {
            // Fallback to stderr if observability is not initialized
            std::cerr << "Preflight fatal error (observability not initialized): " << e.what() << std::endl;
        }
        return 1;
    }
}

int main(int argc, char** argv) {
    PreflightConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 2;
    }
    if (config.cli_helptext_printed) {
        return 0;
    }

    preflight::action::RequestConfig request_config = config.request;
    request_config.custom_headers = preflight::action::unescape_text_block(config.custom_headers);
    request_config.query_parameters = preflight::action::unescape_text_block(config.query_parameters);

    auto auth = preflight::action::parse_auth_scheme(config.auth);
    if (!auth) {
        std::cerr << "Invalid configuration: " << caf::to_string(auth.error()) << std::endl;
        return 2;
    }
    request_config.auth = *auth;

    std::unique_ptr<preflight::action::CurlGlobal> curl_global;
    try {
        curl_global = std::make_unique<preflight::action::CurlGlobal>();
    } catch (const std::exception& e) {
        std::cerr << "Preflight fatal error: " << e.what() << std::endl;
        return 1;
    }

    // Run the actor system
    caf::actor_system system(config);
    return caf_main(system, config, request_config);
}
