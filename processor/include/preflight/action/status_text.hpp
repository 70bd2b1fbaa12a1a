#pragma once

#include "preflight/action/http_types.hpp"
#include <cstdint>
#include <string>

namespace preflight {
namespace action {

class StatusText {
public:
    // Human-readable status text; "HTTP <code>" for codes outside the table
    static std::string message(int32_t status_code);

    // One "Name: Value" line per header in received order, '\n'-joined,
    // without a trailing newline
    static std::string format_headers(const HeaderList& headers);
};

} // namespace action
} // namespace preflight
