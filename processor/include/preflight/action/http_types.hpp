#pragma once

#include <caf/meta/type_name.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace preflight {
namespace action {

// Order-preserving header collection with case-insensitive name lookup.
// Display order is insertion order (the order the server sent them).
class HeaderList {
public:
    using Entry = std::pair<std::string, std::string>;

    // Replaces the value of an existing header in place, otherwise appends
    void set(const std::string& name, const std::string& value);

    // Adds a received header; a repeated name is folded into the first
    // occurrence as "first, second"
    void append(const std::string& name, const std::string& value);

    const std::string* find(const std::string& name) const;

    bool contains(const std::string& name) const {
        return find(name) != nullptr;
    }

    const std::vector<Entry>& entries() const {
        return entries_;
    }

    bool empty() const {
        return entries_.empty();
    }

    size_t size() const {
        return entries_.size();
    }

    void clear() {
        entries_.clear();
    }

    template <class Inspector>
    friend typename Inspector::result_type inspect(Inspector& f, HeaderList& x) {
        return f(caf::meta::type_name("HeaderList"), x.entries_);
    }

private:
    std::vector<Entry> entries_;

    Entry* find_entry(const std::string& name);
};

// Result kinds reported by an HTTP transport
enum class TransportResultKind {
    success,               // response received, status < 400
    protocol_error,        // response received, status >= 400
    connection_error,      // no response: resolve/connect/TLS/timeout/redirect failure
    data_processing_error  // anything else (handle setup, write, decoding)
};

std::string to_string(TransportResultKind kind);

// One request as handed to the transport
struct TransportRequest {
    std::string method = "OPTIONS";
    std::string url;
    HeaderList headers;
    int64_t timeout_ms = 0;          // 0 = no request timeout
    int64_t connect_timeout_ms = 0;  // 0 = transport default
    int32_t redirect_limit = 0;      // 0 = fail instead of following a redirect

    template <class Inspector>
    friend typename Inspector::result_type inspect(Inspector& f, TransportRequest& x) {
        return f(caf::meta::type_name("TransportRequest"), x.method, x.url, x.headers,
                 x.timeout_ms, x.connect_timeout_ms, x.redirect_limit);
    }
};

// Completed transport attempt. Body and headers are only meaningful when a
// response was received (success or protocol_error).
struct TransportResult {
    TransportResultKind kind = TransportResultKind::data_processing_error;
    int32_t status_code = 0;
    std::string body;
    HeaderList headers;
    std::string error_text;
    bool timed_out = false;  // explicit timeout indicator from the transport

    bool has_response() const {
        return kind == TransportResultKind::success || kind == TransportResultKind::protocol_error;
    }

    template <class Inspector>
    friend typename Inspector::result_type inspect(Inspector& f, TransportResult& x) {
        return f(caf::meta::type_name("TransportResult"), x.kind, x.status_code, x.body,
                 x.headers, x.error_text, x.timed_out);
    }
};

} // namespace action
} // namespace preflight
