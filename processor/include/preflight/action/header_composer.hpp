#pragma once

#include "preflight/action/core.hpp"
#include "preflight/action/http_types.hpp"
#include <string>

namespace preflight {
namespace action {

/**
 * Builds the request header set.
 *
 * Order of application: Accept and User-Agent, then the custom "Key:Value"
 * lines, then the authentication header. A later header with the same name
 * (case-insensitive) replaces the earlier value.
 */
class HeaderComposer {
public:
    static HeaderList compose(const RequestConfig& config);

    static void apply_custom_headers(const std::string& custom_headers, HeaderList& headers);

    static void apply_authentication(const AuthScheme& auth, HeaderList& headers);
};

} // namespace action
} // namespace preflight
