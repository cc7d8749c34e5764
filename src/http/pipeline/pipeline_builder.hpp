#ifndef CONDUIT_PIPELINE_BUILDER_HPP
#define CONDUIT_PIPELINE_BUILDER_HPP

#include <memory>
#include <string>
#include <vector>

#include "../../config/pipeline_config.hpp"
#include "../credentials/credential.hpp"
#include "../policies/custom_hook_policy.hpp"
#include "async_pipeline.hpp"
#include "pipeline.hpp"

namespace conduit::pipeline {
    // Assembles the default policy order:
    //   headers, user agent, request id, tracing, retry, auth, redirect,
    //   custom hook, extra policies, logging, sensitive header cleanup.
    // Auth is only added when a credential is given.
    class PipelineBuilder {
       public:
        PipelineBuilder() = default;

        PipelineBuilder& with_transport(std::unique_ptr<transport::ITransport> transport);
        PipelineBuilder& with_async_transport(std::unique_ptr<transport::IAsyncTransport> transport);
        PipelineBuilder& with_config(config::PipelineConfig config);
        PipelineBuilder& with_credential(std::shared_ptr<credentials::ITokenCredential> credential, std::vector<std::string> scopes,
                                         bool enable_cae = false);
        PipelineBuilder& with_hooks(policies::RequestHook request_hook, policies::ResponseHook response_hook = nullptr);
        PipelineBuilder& with_policy(std::shared_ptr<policies::SansIOPolicy> policy);
        PipelineBuilder& validate();

        std::unique_ptr<Pipeline> build();
        std::unique_ptr<AsyncPipeline> build_async();

       private:
        std::vector<std::shared_ptr<policies::SansIOPolicy>> leading_policies() const;
        std::vector<std::shared_ptr<policies::SansIOPolicy>> trailing_policies() const;

        std::unique_ptr<transport::ITransport> transport_;
        std::unique_ptr<transport::IAsyncTransport> async_transport_;
        config::PipelineConfig config_;
        std::shared_ptr<credentials::ITokenCredential> credential_;
        std::vector<std::string> scopes_;
        bool enable_cae_ = false;
        policies::RequestHook request_hook_;
        policies::ResponseHook response_hook_;
        std::vector<std::shared_ptr<policies::SansIOPolicy>> extra_policies_;
    };
}  // namespace conduit::pipeline

#endif
