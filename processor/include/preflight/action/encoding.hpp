#pragma once

#include <cstddef>
#include <string>

namespace preflight {
namespace action {

// Standard Base64 (RFC 4648 alphabet, '=' padded), as used by Basic auth
std::string base64_encode(const unsigned char* data, size_t len);
std::string base64_encode(const std::string& input);

// RFC 3986 percent-encoding of everything but unreserved characters.
// Space becomes "%20", hex digits are uppercase.
std::string percent_encode(const std::string& input);

} // namespace action
} // namespace preflight
