#include "pipeline_builder.hpp"

#include <stdexcept>

#include "../policies/bearer_token_policy.hpp"
#include "../policies/headers_policy.hpp"
#include "../policies/logging_policy.hpp"
#include "../policies/redirect_policy.hpp"
#include "../policies/retry_policy.hpp"
#include "../policies/sensitive_header_cleanup_policy.hpp"
#include "../policies/tracing_policy.hpp"

namespace conduit::pipeline {
    PipelineBuilder& PipelineBuilder::with_transport(std::unique_ptr<transport::ITransport> transport) {
        transport_ = std::move(transport);
        return *this;
    }

    PipelineBuilder& PipelineBuilder::with_async_transport(std::unique_ptr<transport::IAsyncTransport> transport) {
        async_transport_ = std::move(transport);
        return *this;
    }

    PipelineBuilder& PipelineBuilder::with_config(config::PipelineConfig config) {
        config_ = std::move(config);
        return *this;
    }

    PipelineBuilder& PipelineBuilder::with_credential(std::shared_ptr<credentials::ITokenCredential> credential, std::vector<std::string> scopes,
                                                      bool enable_cae) {
        credential_ = std::move(credential);
        scopes_ = std::move(scopes);
        enable_cae_ = enable_cae;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::with_hooks(policies::RequestHook request_hook, policies::ResponseHook response_hook) {
        request_hook_ = std::move(request_hook);
        response_hook_ = std::move(response_hook);
        return *this;
    }

    PipelineBuilder& PipelineBuilder::with_policy(std::shared_ptr<policies::SansIOPolicy> policy) {
        extra_policies_.push_back(std::move(policy));
        return *this;
    }

    PipelineBuilder& PipelineBuilder::validate() {
        if (transport_ == nullptr && async_transport_ == nullptr) {
            throw std::runtime_error("Transport is required");
        }
        if (credential_ != nullptr && scopes_.empty()) {
            throw std::runtime_error("Credential scopes are required");
        }
        if (config_.multipart_max_workers_ == 0) {
            throw std::runtime_error("Multipart workers must be at least 1");
        }
        return *this;
    }

    std::vector<std::shared_ptr<policies::SansIOPolicy>> PipelineBuilder::leading_policies() const {
        return {
            std::make_shared<policies::HeadersPolicy>(config_.headers_),
            std::make_shared<policies::UserAgentPolicy>(),
            std::make_shared<policies::RequestIdPolicy>(),
            std::make_shared<policies::DistributedTracingPolicy>(),
        };
    }

    std::vector<std::shared_ptr<policies::SansIOPolicy>> PipelineBuilder::trailing_policies() const {
        std::vector<std::shared_ptr<policies::SansIOPolicy>> trailing;
        if (request_hook_ || response_hook_) {
            trailing.push_back(std::make_shared<policies::CustomHookPolicy>(request_hook_, response_hook_));
        }
        trailing.insert(trailing.end(), extra_policies_.begin(), extra_policies_.end());
        trailing.push_back(config_.allowed_headers_ ? std::make_shared<policies::LoggingPolicy>(nullptr, *config_.allowed_headers_)
                                                    : std::make_shared<policies::LoggingPolicy>());
        trailing.push_back(std::make_shared<policies::SensitiveHeaderCleanupPolicy>());
        return trailing;
    }

    std::unique_ptr<Pipeline> PipelineBuilder::build() {
        validate();
        if (transport_ == nullptr) {
            throw std::runtime_error("Synchronous transport is required");
        }

        std::vector<PolicyEntry> chain;
        for (auto& policy : leading_policies()) {
            chain.emplace_back(std::move(policy));
        }
        if (config_.retry_enabled_) {
            chain.emplace_back(std::make_shared<policies::RetryPolicy>(config_.retry_));
        }
        if (credential_ != nullptr) {
            chain.emplace_back(std::make_shared<policies::BearerTokenPolicy>(credential_, scopes_, enable_cae_));
        }
        if (config_.redirect_enabled_) {
            chain.emplace_back(std::make_shared<policies::RedirectPolicy>(config_.redirect_));
        }
        for (auto& policy : trailing_policies()) {
            chain.emplace_back(std::move(policy));
        }

        return std::make_unique<Pipeline>(std::move(transport_), std::move(chain),
                                          PipelineOptions{.multipart_max_workers_ = config_.multipart_max_workers_});
    }

    std::unique_ptr<AsyncPipeline> PipelineBuilder::build_async() {
        validate();
        if (async_transport_ == nullptr) {
            throw std::runtime_error("Asynchronous transport is required");
        }

        std::vector<AsyncPolicyEntry> chain;
        for (auto& policy : leading_policies()) {
            chain.emplace_back(std::move(policy));
        }
        if (config_.retry_enabled_) {
            chain.emplace_back(std::make_shared<policies::AsyncRetryPolicy>(config_.retry_));
        }
        if (credential_ != nullptr) {
            chain.emplace_back(std::make_shared<policies::AsyncBearerTokenPolicy>(credential_, scopes_, enable_cae_));
        }
        if (config_.redirect_enabled_) {
            chain.emplace_back(std::make_shared<policies::AsyncRedirectPolicy>(config_.redirect_));
        }
        for (auto& policy : trailing_policies()) {
            chain.emplace_back(std::move(policy));
        }

        return std::make_unique<AsyncPipeline>(std::move(async_transport_), std::move(chain),
                                               PipelineOptions{.multipart_max_workers_ = config_.multipart_max_workers_});
    }
}  // namespace conduit::pipeline
