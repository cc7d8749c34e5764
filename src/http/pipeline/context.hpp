#ifndef CONDUIT_PIPELINE_CONTEXT_HPP
#define CONDUIT_PIPELINE_CONTEXT_HPP

#include <memory>

#include "../model/model.hpp"
#include "../model/options.hpp"
#include "../transport/interface.hpp"

namespace conduit::pipeline {
    // Per-call state. Created fresh by every run and never shared between calls.
    class PipelineContext {
       public:
        explicit PipelineContext(model::Options options = {}) : options_(std::move(options)) {}
        PipelineContext(transport::ITransport* transport, model::Options options) : transport_(transport), options_(std::move(options)) {}
        PipelineContext(transport::IAsyncTransport* transport, model::Options options)
            : async_transport_(transport), options_(std::move(options)) {}

        // nullptr for multipart sub-requests, which are never sent on their own.
        [[nodiscard]] transport::ITransport* transport() const { return transport_; }
        [[nodiscard]] transport::IAsyncTransport* async_transport() const { return async_transport_; }

        [[nodiscard]] model::Options& options() { return options_; }
        [[nodiscard]] const model::Options& options() const { return options_; }

        // Scratch space for policies, e.g. retry and redirect counters.
        [[nodiscard]] model::Options& data() { return data_; }
        [[nodiscard]] const model::Options& data() const { return data_; }

       private:
        transport::ITransport* transport_ = nullptr;
        transport::IAsyncTransport* async_transport_ = nullptr;
        model::Options options_;
        model::Options data_;
    };

    struct PipelineRequest {
        model::Request http_request_;
        std::shared_ptr<PipelineContext> context_;
    };

    struct PipelineResponse {
        model::Request http_request_;
        model::Response http_response_;
        std::shared_ptr<PipelineContext> context_;
    };
}  // namespace conduit::pipeline

#endif
