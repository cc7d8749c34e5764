#ifndef CONDUIT_HTTP_ERROR_HPP
#define CONDUIT_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

#include "../model/model.hpp"

namespace conduit::pipeline {
    struct PipelineResponse;
}  // namespace conduit::pipeline

namespace conduit::http_error {
    const long ERROR_MESSAGE_LENGTH = 512;

    // Connection refused, TLS failure, timeout. Raised by transports.
    struct TransportError : public std::runtime_error {
        int code_;
        bool timed_out_;
        explicit TransportError(const std::string &msg, int code = 0, bool timed_out = false);
    };

    // Raised by a policy before anything is sent.
    struct PolicyError : public std::runtime_error {
        explicit PolicyError(const std::string &msg);
    };

    struct TooManyRedirectsError : public std::runtime_error {
        size_t redirects_;
        std::string url_;
        explicit TooManyRedirectsError(size_t redirects, std::string url);
    };

    // Never raised by the pipeline itself, see throw_for_status.
    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);
    };

    void throw_for_status(const model::Response &response);

    // As above, reporting the request URL when the transport left no effective URL.
    void throw_for_status(const pipeline::PipelineResponse &response);
}  // namespace conduit::http_error

#endif
