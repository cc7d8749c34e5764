#include "redirect_policy.hpp"

#include <algorithm>
#include <array>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../error/http_error.hpp"
#include "../model/url.hpp"

namespace conduit::policies {
    namespace {
        enum class RedirectStatus : long {
            MULTIPLE_CHOICES = 300,
            MOVED_PERMANENTLY = 301,
            FOUND = 302,
            SEE_OTHER = 303,
            TEMPORARY_REDIRECT = 307,
            PERMANENT_REDIRECT = 308,
        };

        constexpr std::array<RedirectStatus, 6> REDIRECT_STATUSES = {RedirectStatus::MULTIPLE_CHOICES,   RedirectStatus::MOVED_PERMANENTLY,
                                                                     RedirectStatus::FOUND,              RedirectStatus::SEE_OTHER,
                                                                     RedirectStatus::TEMPORARY_REDIRECT, RedirectStatus::PERMANENT_REDIRECT};

        bool is(long status, RedirectStatus expected) { return status == static_cast<long>(expected); }
    }  // namespace

    //
    // RedirectRules implementation
    //

    bool RedirectRules::permitted(const pipeline::PipelineRequest& request) const {
        return model::get_option<bool>(request.context_->options(), constants::PERMIT_REDIRECTS).value_or(options_.permit_redirects_);
    }

    std::optional<std::string> RedirectRules::location(const pipeline::PipelineResponse& response) {
        const long status = response.http_response_.status_;
        if (std::none_of(REDIRECT_STATUSES.begin(), REDIRECT_STATUSES.end(), [status](RedirectStatus s) { return is(status, s); })) {
            return std::nullopt;
        }
        return response.http_response_.header("location");
    }

    void RedirectRules::follow(pipeline::PipelineRequest& request, const pipeline::PipelineResponse& response, const std::string& location,
                               size_t& redirects) const {
        if (redirects >= options_.max_redirects_) {
            throw http_error::TooManyRedirectsError(redirects, request.http_request_.url_);
        }
        ++redirects;

        model::Request& http_request = request.http_request_;
        const std::string next_url = model::resolve_url(http_request.url_, location);

        if (!model::same_origin(http_request.url_, next_url)) {
            request.context_->options()[constants::INSECURE_DOMAIN_CHANGE] = true;
        }

        const long status = response.http_response_.status_;
        const bool to_get = is(status, RedirectStatus::SEE_OTHER) ||
                            (http_request.method_ == "POST" && (is(status, RedirectStatus::MOVED_PERMANENTLY) || is(status, RedirectStatus::FOUND)));
        if (to_get && http_request.method_ != "HEAD") {
            http_request.method_ = "GET";
            http_request.body_.clear();
            http_request.headers_.erase("Content-Type");
            http_request.headers_.erase("Content-Length");
        }

        logging::logger()->debug("Following {} redirect from {} to {}", status, model::redact_query(http_request.url_), model::redact_query(next_url));
        http_request.url_ = next_url;
        request.context_->data()[constants::REDIRECT_COUNT] = static_cast<long long>(redirects);
    }

    //
    // RedirectPolicy implementation
    //

    RedirectPolicy::RedirectPolicy(RedirectOptions options) : rules_(options) {}

    pipeline::PipelineResponse RedirectPolicy::send(pipeline::PipelineRequest& request) {
        const bool permitted = rules_.permitted(request);
        size_t redirects = 0;

        while (true) {
            pipeline::PipelineResponse response = next_->send(request);

            auto location = permitted ? RedirectRules::location(response) : std::nullopt;
            if (!location) {
                return response;
            }
            rules_.follow(request, response, *location, redirects);
        }
    }

    //
    // AsyncRedirectPolicy implementation
    //

    AsyncRedirectPolicy::AsyncRedirectPolicy(RedirectOptions options) : rules_(options) {}

    std::future<pipeline::PipelineResponse> AsyncRedirectPolicy::send(pipeline::PipelineRequest& request) {
        return std::async(std::launch::deferred, [this, &request]() {
            const bool permitted = rules_.permitted(request);
            size_t redirects = 0;

            while (true) {
                pipeline::PipelineResponse response = next_->send(request).get();

                auto location = permitted ? RedirectRules::location(response) : std::nullopt;
                if (!location) {
                    return response;
                }
                rules_.follow(request, response, *location, redirects);
            }
        });
    }
}  // namespace conduit::policies
