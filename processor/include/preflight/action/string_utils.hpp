#pragma once

#include <string>
#include <vector>

namespace preflight {
namespace action {
namespace string_utils {

std::string trim(const std::string& s);

std::string to_lower(std::string s);

bool iequals(const std::string& a, const std::string& b);

bool icontains(const std::string& haystack, const std::string& needle);

// Splits a text block on '\n' and '\r', trims every line and drops the empty ones
std::vector<std::string> split_lines(const std::string& text);

} // namespace string_utils
} // namespace action
} // namespace preflight
