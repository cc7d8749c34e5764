#ifndef CONDUIT_PIPELINE_RUNNERS_HPP
#define CONDUIT_PIPELINE_RUNNERS_HPP

#include <memory>

#include "../model/options.hpp"
#include "../policies/policy.hpp"
#include "../transport/interface.hpp"
#include "context.hpp"

namespace conduit::pipeline {
    // Copy of the per-call options without the keys only policies understand. The context
    // itself is left intact so retried attempts and post-send hooks still see them.
    [[nodiscard]] model::Options cleanup_options_for_transport(const model::Options& options);

    // Lets a SansIOPolicy sit in the chain: on_request, then next, then exactly one of
    // on_response / on_exception. Errors from next are rethrown after on_exception.
    class SansIOPolicyRunner final : public policies::HttpPolicy {
       public:
        explicit SansIOPolicyRunner(std::shared_ptr<policies::SansIOPolicy> policy);

        PipelineResponse send(PipelineRequest& request) override;

       private:
        std::shared_ptr<policies::SansIOPolicy> policy_;
    };

    // Terminal link. Has no next.
    class TransportRunner final : public policies::HttpPolicy {
       public:
        explicit TransportRunner(transport::ITransport& sender);

        PipelineResponse send(PipelineRequest& request) override;

       private:
        transport::ITransport& sender_;
    };

    class AsyncSansIOPolicyRunner final : public policies::AsyncHttpPolicy {
       public:
        explicit AsyncSansIOPolicyRunner(std::shared_ptr<policies::AsyncSansIOPolicy> policy);

        std::future<PipelineResponse> send(PipelineRequest& request) override;

       private:
        std::shared_ptr<policies::AsyncSansIOPolicy> policy_;
    };

    class AsyncTransportRunner final : public policies::AsyncHttpPolicy {
       public:
        explicit AsyncTransportRunner(transport::IAsyncTransport& sender);

        std::future<PipelineResponse> send(PipelineRequest& request) override;

       private:
        transport::IAsyncTransport& sender_;
    };
}  // namespace conduit::pipeline

#endif
