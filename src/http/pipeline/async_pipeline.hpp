#ifndef CONDUIT_ASYNC_PIPELINE_HPP
#define CONDUIT_ASYNC_PIPELINE_HPP

#include <future>
#include <memory>
#include <variant>
#include <vector>

#include "../model/model.hpp"
#include "../model/options.hpp"
#include "../policies/policy.hpp"
#include "../transport/interface.hpp"
#include "context.hpp"
#include "pipeline.hpp"
#include "runners.hpp"

namespace conduit::pipeline {
    using AsyncPolicyEntry =
        std::variant<std::shared_ptr<policies::SansIOPolicy>, std::shared_ptr<policies::AsyncSansIOPolicy>, std::shared_ptr<policies::AsyncHttpPolicy>>;

    // Asynchronous counterpart of Pipeline. Each run executes as a single task; hooks and
    // sends hand back futures and the task waits on them in chain order.
    class AsyncPipeline {
       public:
        explicit AsyncPipeline(std::unique_ptr<transport::IAsyncTransport> transport, std::vector<AsyncPolicyEntry> policies = {},
                               PipelineOptions options = {});

        ~AsyncPipeline() = default;
        AsyncPipeline(const AsyncPipeline&) = delete;
        AsyncPipeline& operator=(const AsyncPipeline&) = delete;
        AsyncPipeline(AsyncPipeline&&) = delete;
        AsyncPipeline& operator=(AsyncPipeline&&) = delete;

        void open();
        void close();

        // The pipeline must outlive the returned future.
        std::future<PipelineResponse> run(model::Request request, model::Options options = {}) const;

        [[nodiscard]] transport::IAsyncTransport& transport() const { return *transport_; }

       private:
        std::unique_ptr<transport::IAsyncTransport> transport_;
        std::vector<std::shared_ptr<policies::AsyncHttpPolicy>> impl_policies_;
        std::unique_ptr<AsyncTransportRunner> transport_runner_;
        PipelineOptions options_;
    };

    class AsyncPipelineScope {
       public:
        explicit AsyncPipelineScope(AsyncPipeline& pipeline);

        ~AsyncPipelineScope();
        AsyncPipelineScope(const AsyncPipelineScope&) = delete;
        AsyncPipelineScope& operator=(const AsyncPipelineScope&) = delete;
        AsyncPipelineScope(AsyncPipelineScope&&) = delete;
        AsyncPipelineScope& operator=(AsyncPipelineScope&&) = delete;

        AsyncPipeline& operator*() const { return pipeline_; }
        AsyncPipeline* operator->() const { return &pipeline_; }

       private:
        AsyncPipeline& pipeline_;
    };
}  // namespace conduit::pipeline

#endif
