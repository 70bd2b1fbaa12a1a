#include "preflight/action/header_composer.hpp"
#include "preflight/action/encoding.hpp"
#include "preflight/action/string_utils.hpp"
#include <variant>

namespace preflight {
namespace action {

namespace {

struct AuthHeaderVisitor {
    HeaderList& headers;

    void operator()(const NoAuth&) const {}

    void operator()(const BearerToken& auth) const {
        if (!auth.token.empty()) {
            headers.set("Authorization", "Bearer " + auth.token);
        }
    }

    void operator()(const ApiKey& auth) const {
        if (!auth.token.empty()) {
            headers.set("X-API-Key", auth.token);
        }
    }

    void operator()(const BasicAuth& auth) const {
        if (!auth.username.empty()) {
            headers.set("Authorization", "Basic " + base64_encode(auth.username + ":" + auth.password));
        }
    }

    void operator()(const CustomHeaderAuth& auth) const {
        if (!auth.header_name.empty() && !auth.token.empty()) {
            headers.set(auth.header_name, auth.token);
        }
    }
};

} // namespace

HeaderList HeaderComposer::compose(const RequestConfig& config) {
    HeaderList headers;

    if (!config.accept_header.empty()) {
        headers.set("Accept", config.accept_header);
    }
    if (!config.user_agent.empty()) {
        headers.set("User-Agent", config.user_agent);
    }

    if (!config.custom_headers.empty()) {
        apply_custom_headers(config.custom_headers, headers);
    }

    apply_authentication(config.auth, headers);
    return headers;
}

void HeaderComposer::apply_custom_headers(const std::string& custom_headers, HeaderList& headers) {
    for (const auto& line : string_utils::split_lines(custom_headers)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }

        std::string name = string_utils::trim(line.substr(0, colon));
        if (name.empty()) {
            // A header without a name cannot be sent
            continue;
        }
        headers.set(name, string_utils::trim(line.substr(colon + 1)));
    }
}

void HeaderComposer::apply_authentication(const AuthScheme& auth, HeaderList& headers) {
    std::visit(AuthHeaderVisitor{headers}, auth);
}

} // namespace action
} // namespace preflight
