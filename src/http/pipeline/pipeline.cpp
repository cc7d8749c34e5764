#include "pipeline.hpp"

#include <stdexcept>

#include "../../utils/logging.hpp"
#include "multipart_preparer.hpp"

namespace conduit::pipeline {

    //
    // Pipeline implementation
    //

    Pipeline::Pipeline(std::unique_ptr<transport::ITransport> transport, std::vector<PolicyEntry> policies, PipelineOptions options)
        : transport_(std::move(transport)), options_(options) {
        if (transport_ == nullptr) {
            throw std::invalid_argument("Pipeline requires a transport");
        }

        transport_runner_ = std::make_unique<TransportRunner>(*transport_);

        for (auto& entry : policies) {
            if (auto* sans_io = std::get_if<std::shared_ptr<policies::SansIOPolicy>>(&entry)) {
                if (*sans_io != nullptr) {
                    impl_policies_.push_back(std::make_shared<SansIOPolicyRunner>(std::move(*sans_io)));
                }
            } else if (auto* chaining = std::get_if<std::shared_ptr<policies::HttpPolicy>>(&entry)) {
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

        logging::logger()->debug("Assembled pipeline with {} policies", impl_policies_.size());
    }

    void Pipeline::open() { transport_->open(); }

    void Pipeline::close() { transport_->close(); }

    PipelineResponse Pipeline::run(model::Request request, model::Options options) const {
        prepare_multipart(request, options_.multipart_max_workers_);

        PipelineRequest pipeline_request{
            .http_request_ = std::move(request),
            .context_ = std::make_shared<PipelineContext>(transport_.get(), std::move(options)),
        };

        policies::HttpPolicy* first_node = impl_policies_.empty() ? static_cast<policies::HttpPolicy*>(transport_runner_.get()) : impl_policies_.front().get();
        return first_node->send(pipeline_request);
    }

    //
    // PipelineScope implementation
    //

    PipelineScope::PipelineScope(Pipeline& pipeline) : pipeline_(pipeline) { pipeline_.open(); }

    PipelineScope::~PipelineScope() {
        try {
            pipeline_.close();
        } catch (const std::exception& e) {
            logging::logger()->error("Failed to close pipeline transport: {}", e.what());
        }
    }
}  // namespace conduit::pipeline
