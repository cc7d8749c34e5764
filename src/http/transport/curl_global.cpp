#include "curl_global.hpp"

#include <curl/curl.h>

#include "../error/http_error.hpp"

namespace conduit::transport {
    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw http_error::TransportError(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc), static_cast<int>(rc));
        }
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }
}  // namespace conduit::transport
