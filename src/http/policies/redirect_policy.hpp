#ifndef CONDUIT_REDIRECT_POLICY_HPP
#define CONDUIT_REDIRECT_POLICY_HPP

#include <optional>
#include <string>

#include "policy.hpp"

namespace conduit::policies {
    const size_t DEFAULT_MAX_REDIRECTS = 30;

    struct RedirectOptions {
        bool permit_redirects_ = true;
        size_t max_redirects_ = DEFAULT_MAX_REDIRECTS;
    };

    class RedirectRules {
       public:
        explicit RedirectRules(RedirectOptions options) : options_(options) {}

        [[nodiscard]] bool permitted(const pipeline::PipelineRequest& request) const;

        // Location to follow, if the response is a redirect.
        [[nodiscard]] static std::optional<std::string> location(const pipeline::PipelineResponse& response);

        // Rewrites request for the next hop; flags a cross-origin hop in the call options.
        // Throws TooManyRedirectsError once max_redirects_ hops have been followed.
        void follow(pipeline::PipelineRequest& request, const pipeline::PipelineResponse& response, const std::string& location, size_t& redirects) const;

       private:
        RedirectOptions options_;
    };

    // Follows 3xx responses. The transport is expected not to follow redirects itself.
    class RedirectPolicy final : public HttpPolicy {
       public:
        explicit RedirectPolicy(RedirectOptions options = {});

        pipeline::PipelineResponse send(pipeline::PipelineRequest& request) override;

       private:
        RedirectRules rules_;
    };

    class AsyncRedirectPolicy final : public AsyncHttpPolicy {
       public:
        explicit AsyncRedirectPolicy(RedirectOptions options = {});

        std::future<pipeline::PipelineResponse> send(pipeline::PipelineRequest& request) override;

       private:
        RedirectRules rules_;
    };
}  // namespace conduit::policies

#endif
