#include "preflight/action/encoding.hpp"
#include "preflight/action/curl_handle.hpp"
#include <limits>
#include <new>
#include <stdexcept>

namespace preflight {
namespace action {

static const char BASE64_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const unsigned char* data, size_t len) {
    std::string result;
    result.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        unsigned char b0 = data[i];
        unsigned char b1 = (i + 1 < len) ? data[i + 1] : 0;
        unsigned char b2 = (i + 2 < len) ? data[i + 2] : 0;

        result += BASE64_ALPHABET[b0 >> 2];
        result += BASE64_ALPHABET[((b0 & 0x03) << 4) | (b1 >> 4)];
        result += (i + 1 < len) ? BASE64_ALPHABET[((b1 & 0x0F) << 2) | (b2 >> 6)] : '=';
        result += (i + 2 < len) ? BASE64_ALPHABET[b2 & 0x3F] : '=';
    }

    return result;
}

std::string base64_encode(const std::string& input) {
    return base64_encode(reinterpret_cast<const unsigned char*>(input.data()), input.size());
}

std::string percent_encode(const std::string& input) {
    if (input.empty()) {
        return std::string();
    }
    if (input.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::length_error("percent_encode: input too long");
    }

    // curl_easy_escape does not use the handle argument
    CurlStringPtr escaped(curl_easy_escape(nullptr, input.data(), static_cast<int>(input.size())));
    if (!escaped) {
        throw std::bad_alloc();
    }
    return std::string(escaped.get());
}

} // namespace action
} // namespace preflight
