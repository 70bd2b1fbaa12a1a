#include "preflight/action/action_config.hpp"
#include "preflight/action/string_utils.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>

namespace preflight {
namespace action {

caf::expected<AuthScheme> parse_auth_scheme(const AuthOptions& options) {
    std::string type = string_utils::to_lower(string_utils::trim(options.type));

    if (type.empty() || type == "none") {
        return AuthScheme{NoAuth{}};
    }
    if (type == "bearer") {
        return AuthScheme{BearerToken{options.token}};
    }
    if (type == "api-key" || type == "apikey") {
        return AuthScheme{ApiKey{options.token}};
    }
    if (type == "basic") {
        return AuthScheme{BasicAuth{options.username, options.password}};
    }
    if (type == "custom-header") {
        return AuthScheme{CustomHeaderAuth{options.custom_header, options.token}};
    }

    return caf::make_error(caf::sec::invalid_argument, "unknown auth type: " + options.type);
}

std::string unescape_text_block(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            result += text[i];
            continue;
        }

        char next = text[i + 1];
        switch (next) {
            case 'n':
                result += '\n';
                break;
            case 'r':
                result += '\r';
                break;
            case 't':
                result += '\t';
                break;
            case '\\':
                result += '\\';
                break;
            default:
                // Unknown escape: keep both characters
                result += '\\';
                result += next;
                break;
        }
        ++i;
    }

    return result;
}

} // namespace action
} // namespace preflight
