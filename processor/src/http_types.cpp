#include "preflight/action/http_types.hpp"
#include "preflight/action/string_utils.hpp"

namespace preflight {
namespace action {

HeaderList::Entry* HeaderList::find_entry(const std::string& name) {
    for (auto& entry : entries_) {
        if (string_utils::iequals(entry.first, name)) {
            return &entry;
        }
    }
    return nullptr;
}

void HeaderList::set(const std::string& name, const std::string& value) {
    if (auto* entry = find_entry(name)) {
        entry->second = value;
        return;
    }
    entries_.emplace_back(name, value);
}

void HeaderList::append(const std::string& name, const std::string& value) {
    if (auto* entry = find_entry(name)) {
        entry->second += ", " + value;
        return;
    }
    entries_.emplace_back(name, value);
}

const std::string* HeaderList::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (string_utils::iequals(entry.first, name)) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::string to_string(TransportResultKind kind) {
    switch (kind) {
        case TransportResultKind::success:
            return "success";
        case TransportResultKind::protocol_error:
            return "protocol_error";
        case TransportResultKind::connection_error:
            return "connection_error";
        case TransportResultKind::data_processing_error:
            return "data_processing_error";
        default:
            return "unknown";
    }
}

} // namespace action
} // namespace preflight
