#ifndef CONDUIT_PIPELINE_HPP
#define CONDUIT_PIPELINE_HPP

#include <memory>
#include <variant>
#include <vector>

#include "../../utils/constants.hpp"
#include "../model/model.hpp"
#include "../model/options.hpp"
#include "../policies/policy.hpp"
#include "../transport/interface.hpp"
#include "context.hpp"
#include "runners.hpp"

namespace conduit::pipeline {
    using PolicyEntry = std::variant<std::shared_ptr<policies::SansIOPolicy>, std::shared_ptr<policies::HttpPolicy>>;

    struct PipelineOptions {
        // Upper bound on concurrent multipart sub-request preparation.
        std::size_t multipart_max_workers_ = constants::DEFAULT_MULTIPART_WORKERS;
    };

    // Owns the transport and a singly linked chain of policies ending at a TransportRunner.
    // The chain is fixed at construction; run may be called concurrently as long as the
    // policies themselves keep no unsynchronised cross-call state.
    class Pipeline {
       public:
        explicit Pipeline(std::unique_ptr<transport::ITransport> transport, std::vector<PolicyEntry> policies = {}, PipelineOptions options = {});

        ~Pipeline() = default;
        Pipeline(const Pipeline&) = delete;
        Pipeline& operator=(const Pipeline&) = delete;
        Pipeline(Pipeline&&) = delete;
        Pipeline& operator=(Pipeline&&) = delete;

        void open();
        void close();

        PipelineResponse run(model::Request request, model::Options options = {}) const;

        [[nodiscard]] transport::ITransport& transport() const { return *transport_; }
        [[nodiscard]] std::size_t size() const { return impl_policies_.size(); }

       private:
        std::unique_ptr<transport::ITransport> transport_;
        std::vector<std::shared_ptr<policies::HttpPolicy>> impl_policies_;
        std::unique_ptr<TransportRunner> transport_runner_;
        PipelineOptions options_;
    };

    // Opens the pipeline's transport for the guard's lifetime and closes it on every exit path.
    class PipelineScope {
       public:
        explicit PipelineScope(Pipeline& pipeline);

        ~PipelineScope();
        PipelineScope(const PipelineScope&) = delete;
        PipelineScope& operator=(const PipelineScope&) = delete;
        PipelineScope(PipelineScope&&) = delete;
        PipelineScope& operator=(PipelineScope&&) = delete;

        Pipeline& operator*() const { return pipeline_; }
        Pipeline* operator->() const { return &pipeline_; }

       private:
        Pipeline& pipeline_;
    };
}  // namespace conduit::pipeline

#endif
