#include "preflight/action/status_text.hpp"

namespace preflight {
namespace action {

std::string StatusText::message(int32_t status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default:
            return "HTTP " + std::to_string(status_code);
    }
}

std::string StatusText::format_headers(const HeaderList& headers) {
    std::string text;
    for (const auto& entry : headers.entries()) {
        if (!text.empty()) {
            text += '\n';
        }
        text += entry.first;
        text += ": ";
        text += entry.second;
    }
    return text;
}

} // namespace action
} // namespace preflight
