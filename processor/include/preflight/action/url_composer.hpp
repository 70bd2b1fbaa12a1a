#pragma once

#include "preflight/action/core.hpp"
#include <string>

namespace preflight {
namespace action {

/**
 * Builds the request URL from a RequestConfig.
 *
 * - A non-empty direct URL is used verbatim as the base.
 * - Otherwise base URL and endpoint path are joined with exactly one '/'.
 * - "key=value" lines of the query block are percent-encoded, joined with
 *   '&' and appended with '?' (or '&' when the base already has a query).
 *
 * Pure: identical configs produce identical URLs.
 */
class UrlComposer {
public:
    static std::string compose(const RequestConfig& config);

    static std::string compose_base(const RequestConfig& config);

    // Lines without '=' are skipped. Returns "" when no line qualifies.
    static std::string build_query_string(const std::string& query_parameters);
};

} // namespace action
} // namespace preflight
