#pragma once

#include "preflight/action/core.hpp"
#include <caf/expected.hpp>
#include <string>

namespace preflight {
namespace action {

// Authentication fields as entered by the designer (or on the command line)
struct AuthOptions {
    std::string type = "none"; // none | bearer | api-key | basic | custom-header
    std::string token;
    std::string username;
    std::string password;
    std::string custom_header;
};

// Selects the active AuthScheme. An unknown type is caf::sec::invalid_argument.
caf::expected<AuthScheme> parse_auth_scheme(const AuthOptions& options);

// Expands "\n", "\r", "\t" and "\\" escapes of a single-line text block
std::string unescape_text_block(const std::string& text);

} // namespace action
} // namespace preflight
