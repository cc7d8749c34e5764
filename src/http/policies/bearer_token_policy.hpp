#ifndef CONDUIT_BEARER_TOKEN_POLICY_HPP
#define CONDUIT_BEARER_TOKEN_POLICY_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../credentials/credential.hpp"
#include "policy.hpp"

namespace conduit::policies {
    // Refresh a cached token this long before it expires.
    inline constexpr std::chrono::seconds TOKEN_REFRESH_MARGIN{300};

    // Token cache shared by every call through one policy instance. Internally synchronised.
    class BearerTokenAuthorizer {
       public:
        BearerTokenAuthorizer(std::shared_ptr<credentials::ITokenCredential> credential, std::vector<std::string> scopes, bool enable_cae);

        // Per-call "enable_cae" option, falling back to the value given at construction.
        [[nodiscard]] bool enable_cae(const pipeline::PipelineRequest& request) const;

        // Throws PolicyError for non-https URLs or when the credential fails.
        void authorize(pipeline::PipelineRequest& request, bool enable_cae, const std::optional<std::string>& claims = std::nullopt);

        // Claims from a 401 "insufficient_claims" challenge, if the response carries one.
        [[nodiscard]] static std::optional<std::string> challenge_claims(const pipeline::PipelineResponse& response);

       private:
        std::shared_ptr<credentials::ITokenCredential> credential_;
        std::vector<std::string> scopes_;
        bool enable_cae_;

        std::mutex token_mutex_;
        std::optional<credentials::AccessToken> token_;
    };

    // Adds "Authorization: Bearer <token>" and re-sends once after a claims challenge.
    class BearerTokenPolicy final : public HttpPolicy {
       public:
        BearerTokenPolicy(std::shared_ptr<credentials::ITokenCredential> credential, std::vector<std::string> scopes, bool enable_cae = false);

        pipeline::PipelineResponse send(pipeline::PipelineRequest& request) override;

       private:
        BearerTokenAuthorizer authorizer_;
    };

    class AsyncBearerTokenPolicy final : public AsyncHttpPolicy {
       public:
        AsyncBearerTokenPolicy(std::shared_ptr<credentials::ITokenCredential> credential, std::vector<std::string> scopes, bool enable_cae = false);

        std::future<pipeline::PipelineResponse> send(pipeline::PipelineRequest& request) override;

       private:
        BearerTokenAuthorizer authorizer_;
    };
}  // namespace conduit::policies

#endif
