#include "preflight/action/string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace preflight {
namespace action {
namespace string_utils {

std::string trim(const std::string& s) {
    auto first = std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; });
    auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base();
    if (first >= last) {
        return std::string();
    }
    return std::string(first, last);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool icontains(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (;;) {
        size_t pos = text.find_first_of("\r\n", start);
        size_t end = (pos == std::string::npos) ? text.size() : pos;

        std::string line = trim(text.substr(start, end - start));
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }

        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return lines;
}

} // namespace string_utils
} // namespace action
} // namespace preflight
