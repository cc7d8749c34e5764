#ifndef CONDUIT_RESPONSE_HEADERS_HPP
#define CONDUIT_RESPONSE_HEADERS_HPP

#include <string>
#include <string_view>

#include "../model/model.hpp"

namespace conduit::transport {
    // Collects raw header lines as a transport receives them. Every status line starts a
    // new block, so only the final response's headers survive 100 Continue and followed redirects.
    class ResponseHeaders {
       public:
        void feed(std::string_view line);

        [[nodiscard]] long status() const { return status_; }
        [[nodiscard]] const std::string& reason() const { return reason_; }
        [[nodiscard]] const model::Headers& headers() const { return headers_; }

        [[nodiscard]] std::string take_reason() { return std::move(reason_); }
        [[nodiscard]] model::Headers take_headers() { return std::move(headers_); }

       private:
        long status_ = 0;
        std::string reason_;
        model::Headers headers_;
    };
}  // namespace conduit::transport

#endif
