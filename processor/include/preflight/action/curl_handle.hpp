#pragma once

#include <curl/curl.h>
#include <memory>

namespace preflight {
namespace action {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

struct CurlStringDeleter {
    void operator()(char* str) const {
        if (str) {
            curl_free(str);
        }
    }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

// Process-wide curl_global_init/curl_global_cleanup guard. Create one in
// main before any transport is used.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace action
} // namespace preflight
