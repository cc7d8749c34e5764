#include "bearer_token_policy.hpp"

#include <stdexcept>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/url.hpp"

namespace conduit::policies {
    namespace {
        std::optional<std::string> challenge_parameter(const std::string& challenge, const std::string& name) {
            const std::string lowered = string_utils::to_lower(challenge);
            const std::string key = name + "=\"";
            const auto start = lowered.find(key);
            if (start == std::string::npos) {
                return std::nullopt;
            }
            const auto value_start = start + key.size();
            const auto value_end = challenge.find('"', value_start);
            if (value_end == std::string::npos) {
                return std::nullopt;
            }
            return challenge.substr(value_start, value_end - value_start);
        }
    }  // namespace

    //
    // BearerTokenAuthorizer implementation
    //

    BearerTokenAuthorizer::BearerTokenAuthorizer(std::shared_ptr<credentials::ITokenCredential> credential, std::vector<std::string> scopes, bool enable_cae)
        : credential_(std::move(credential)), scopes_(std::move(scopes)), enable_cae_(enable_cae) {
        if (credential_ == nullptr) {
            throw std::invalid_argument("BearerTokenAuthorizer requires a credential");
        }
    }

    bool BearerTokenAuthorizer::enable_cae(const pipeline::PipelineRequest& request) const {
        return model::get_option<bool>(request.context_->options(), constants::ENABLE_CAE).value_or(enable_cae_);
    }

    void BearerTokenAuthorizer::authorize(pipeline::PipelineRequest& request, bool enable_cae, const std::optional<std::string>& claims) {
        auto url = model::parse_url(request.http_request_.url_);
        if (!url || url->scheme_ != "https") {
            throw http_error::PolicyError("Bearer token authentication is not permitted for non-TLS protected (non-https) URLs.");
        }

        const credentials::TokenRequestOptions token_options{
            .enable_cae_ = enable_cae,
            .claims_ = claims,
        };

        std::string token;
        {
            const std::lock_guard<std::mutex> lock(token_mutex_);
            const auto now = std::chrono::system_clock::now();
            const bool stale = !token_ || claims || token_->expires_on_ - now < TOKEN_REFRESH_MARGIN;

            if (stale) {
                try {
                    token_ = credential_->get_token(scopes_, token_options);
                } catch (const std::exception& e) {
                    token_.reset();
                    throw http_error::PolicyError(std::string("Failed to acquire access token: ") + e.what());
                }
                logging::logger()->debug("Acquired access token for {} scope(s)", scopes_.size());
            }
            token = token_->token_;
        }

        request.http_request_.headers_["Authorization"] = "Bearer " + token;
    }

    std::optional<std::string> BearerTokenAuthorizer::challenge_claims(const pipeline::PipelineResponse& response) {
        if (response.http_response_.status_ != constants::HTTP_UNAUTHORIZED) {
            return std::nullopt;
        }

        auto challenge = response.http_response_.header("www-authenticate");
        if (!challenge) {
            return std::nullopt;
        }

        auto error = challenge_parameter(*challenge, "error");
        if (!error || *error != "insufficient_claims") {
            return std::nullopt;
        }
        return challenge_parameter(*challenge, "claims");
    }

    //
    // BearerTokenPolicy implementation
    //

    BearerTokenPolicy::BearerTokenPolicy(std::shared_ptr<credentials::ITokenCredential> credential, std::vector<std::string> scopes, bool enable_cae)
        : authorizer_(std::move(credential), std::move(scopes), enable_cae) {}

    pipeline::PipelineResponse BearerTokenPolicy::send(pipeline::PipelineRequest& request) {
        const bool enable_cae = authorizer_.enable_cae(request);
        authorizer_.authorize(request, enable_cae);
        pipeline::PipelineResponse response = next_->send(request);

        if (auto claims = BearerTokenAuthorizer::challenge_claims(response)) {
            logging::logger()->info("Received claims challenge, re-authorizing {}", model::redact_query(request.http_request_.url_));
            authorizer_.authorize(request, enable_cae, claims);
            return next_->send(request);
        }
        return response;
    }

    //
    // AsyncBearerTokenPolicy implementation
    //

    AsyncBearerTokenPolicy::AsyncBearerTokenPolicy(std::shared_ptr<credentials::ITokenCredential> credential, std::vector<std::string> scopes,
                                                   bool enable_cae)
        : authorizer_(std::move(credential), std::move(scopes), enable_cae) {}

    std::future<pipeline::PipelineResponse> AsyncBearerTokenPolicy::send(pipeline::PipelineRequest& request) {
        return std::async(std::launch::deferred, [this, &request]() {
            const bool enable_cae = authorizer_.enable_cae(request);
            authorizer_.authorize(request, enable_cae);
            pipeline::PipelineResponse response = next_->send(request).get();

            if (auto claims = BearerTokenAuthorizer::challenge_claims(response)) {
                logging::logger()->info("Received claims challenge, re-authorizing {}", model::redact_query(request.http_request_.url_));
                authorizer_.authorize(request, enable_cae, claims);
                return next_->send(request).get();
            }
            return response;
        });
    }
}  // namespace conduit::policies
