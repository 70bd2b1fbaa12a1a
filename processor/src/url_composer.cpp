#include "preflight/action/url_composer.hpp"
#include "preflight/action/encoding.hpp"
#include "preflight/action/string_utils.hpp"

namespace preflight {
namespace action {

std::string UrlComposer::compose(const RequestConfig& config) {
    std::string url = compose_base(config);

    if (config.query_parameters.empty()) {
        return url;
    }

    std::string query = build_query_string(config.query_parameters);
    if (query.empty()) {
        return url;
    }

    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += query;
    return url;
}

std::string UrlComposer::compose_base(const RequestConfig& config) {
    if (!config.url.empty()) {
        return config.url;
    }

    std::string base = config.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    std::string path = config.endpoint_path;
    size_t first = path.find_first_not_of('/');
    path = (first == std::string::npos) ? std::string() : path.substr(first);

    if (base.empty()) {
        return path;
    }
    if (path.empty()) {
        return base;
    }
    return base + "/" + path;
}

std::string UrlComposer::build_query_string(const std::string& query_parameters) {
    std::string query;

    for (const auto& line : string_utils::split_lines(query_parameters)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = string_utils::trim(line.substr(0, eq));
        std::string value = string_utils::trim(line.substr(eq + 1));

        if (!query.empty()) {
            query += '&';
        }
        query += percent_encode(key);
        query += '=';
        query += percent_encode(value);
    }

    return query;
}

} // namespace action
} // namespace preflight
