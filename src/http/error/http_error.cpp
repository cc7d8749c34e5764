#include "http_error.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../pipeline/context.hpp"

namespace conduit::http_error {
    TransportError::TransportError(const std::string &msg, int code, bool timed_out) : std::runtime_error(msg), code_(code), timed_out_(timed_out) {}

    PolicyError::PolicyError(const std::string &msg) : std::runtime_error(msg) {}

    TooManyRedirectsError::TooManyRedirectsError(size_t redirects, std::string url)
        : std::runtime_error("Exceeded maximum number of redirects (" + std::to_string(redirects) + ")"), redirects_(redirects), url_(std::move(url)) {}

    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    void throw_for_status(const model::Response &response) {
        if (response.status_ >= constants::HTTP_OK && response.status_ < constants::HTTP_MULTIPLE_CHOICES) {
            return;
        }

        std::string msg = "HTTP request failed with status " + std::to_string(response.status_);
        if (!response.reason_.empty()) {
            msg += " (" + response.reason_ + ")";
        }
        throw HttpError(response.status_, response.effective_url_, response.body_.substr(0, ERROR_MESSAGE_LENGTH), msg);
    }

    void throw_for_status(const pipeline::PipelineResponse &response) {
        if (!response.http_response_.effective_url_.empty()) {
            throw_for_status(response.http_response_);
            return;
        }

        model::Response with_url = response.http_response_;
        with_url.effective_url_ = response.http_request_.url_;
        throw_for_status(with_url);
    }
}  // namespace conduit::http_error
