#include "async_pipeline.hpp"

#include <stdexcept>

#include "../../utils/logging.hpp"
#include "multipart_preparer.hpp"

namespace conduit::pipeline {

    AsyncPipeline::AsyncPipeline(std::unique_ptr<transport::IAsyncTransport> transport, std::vector<AsyncPolicyEntry> policies,
                                 PipelineOptions options)
        : transport_(std::move(transport)), options_(options) {
        if (transport_ == nullptr) {
            throw std::invalid_argument("AsyncPipeline requires a transport");
        }

        transport_runner_ = std::make_unique<AsyncTransportRunner>(*transport_);

        for (auto& entry : policies) {
            if (auto* sync_sans_io = std::get_if<std::shared_ptr<policies::SansIOPolicy>>(&entry)) {
                if (*sync_sans_io != nullptr) {
                    auto adapter = std::make_shared<policies::SyncSansIOPolicyAdapter>(std::move(*sync_sans_io));
                    impl_policies_.push_back(std::make_shared<AsyncSansIOPolicyRunner>(std::move(adapter)));
                }
            } else if (auto* sans_io = std::get_if<std::shared_ptr<policies::AsyncSansIOPolicy>>(&entry)) {
                if (*sans_io != nullptr) {
                    impl_policies_.push_back(std::make_shared<AsyncSansIOPolicyRunner>(std::move(*sans_io)));
                }
            } else if (auto* chaining = std::get_if<std::shared_ptr<policies::AsyncHttpPolicy>>(&entry)) {
                if (*chaining != nullptr) {
                    impl_policies_.push_back(std::move(*chaining));
                }
            }
        }

        for (size_t i = 0; i + 1 < impl_policies_.size(); ++i) {
            impl_policies_[i]->set_next(impl_policies_[i + 1].get());
        }
        if (!impl_policies_.empty()) {
            impl_policies_.back()->set_next(transport_runner_.get());
        }

        logging::logger()->debug("Assembled async pipeline with {} policies", impl_policies_.size());
    }

    void AsyncPipeline::open() { transport_->open(); }

    void AsyncPipeline::close() { transport_->close(); }

    std::future<PipelineResponse> AsyncPipeline::run(model::Request request, model::Options options) const {
        return std::async(std::launch::async, [this, request = std::move(request), options = std::move(options)]() mutable {
            prepare_multipart(request, options_.multipart_max_workers_);

            PipelineRequest pipeline_request{
                .http_request_ = std::move(request),
                .context_ = std::make_shared<PipelineContext>(transport_.get(), std::move(options)),
            };

            policies::AsyncHttpPolicy* first_node =
                impl_policies_.empty() ? static_cast<policies::AsyncHttpPolicy*>(transport_runner_.get()) : impl_policies_.front().get();
            return first_node->send(pipeline_request).get();
        });
    }

    AsyncPipelineScope::AsyncPipelineScope(AsyncPipeline& pipeline) : pipeline_(pipeline) { pipeline_.open(); }

    AsyncPipelineScope::~AsyncPipelineScope() {
        try {
            pipeline_.close();
        } catch (const std::exception& e) {
            logging::logger()->error("Failed to close async pipeline transport: {}", e.what());
        }
    }
}  // namespace conduit::pipeline
