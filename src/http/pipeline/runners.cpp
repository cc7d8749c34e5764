#include "runners.hpp"

#include "../../utils/constants.hpp"

namespace conduit::pipeline {
    model::Options cleanup_options_for_transport(const model::Options& options) {
        model::Options cleaned = options;
        for (const char* key : constants::PIPELINE_ONLY_OPTIONS) {
            cleaned.erase(key);
        }
        return cleaned;
    }

    //
    // Sync runners
    //

    SansIOPolicyRunner::SansIOPolicyRunner(std::shared_ptr<policies::SansIOPolicy> policy) : policy_(std::move(policy)) {}

    PipelineResponse SansIOPolicyRunner::send(PipelineRequest& request) {
        policy_->on_request(request);

        PipelineResponse response;
        try {
            response = next_->send(request);
        } catch (...) {
            policy_->on_exception(request, std::current_exception());
            throw;
        }

        policy_->on_response(request, response);
        return response;
    }

    TransportRunner::TransportRunner(transport::ITransport& sender) : sender_(sender) {}

    PipelineResponse TransportRunner::send(PipelineRequest& request) {
        const model::Options options = cleanup_options_for_transport(request.context_->options());

        return PipelineResponse{
            .http_request_ = request.http_request_,
            .http_response_ = sender_.send(request.http_request_, options),
            .context_ = request.context_,
        };
    }

    //
    // Async runners
    //

    AsyncSansIOPolicyRunner::AsyncSansIOPolicyRunner(std::shared_ptr<policies::AsyncSansIOPolicy> policy) : policy_(std::move(policy)) {}

    std::future<PipelineResponse> AsyncSansIOPolicyRunner::send(PipelineRequest& request) {
        return std::async(std::launch::deferred, [this, &request]() {
            policy_->on_request(request).get();

            PipelineResponse response;
            try {
                response = next_->send(request).get();
            } catch (...) {
                policy_->on_exception(request, std::current_exception()).get();
                throw;
            }

            policy_->on_response(request, response).get();
            return response;
        });
    }

    AsyncTransportRunner::AsyncTransportRunner(transport::IAsyncTransport& sender) : sender_(sender) {}

    std::future<PipelineResponse> AsyncTransportRunner::send(PipelineRequest& request) {
        return std::async(std::launch::deferred, [this, &request]() {
            const model::Options options = cleanup_options_for_transport(request.context_->options());

            model::Response response = sender_.send(request.http_request_, options).get();
            return PipelineResponse{
                .http_request_ = request.http_request_,
                .http_response_ = std::move(response),
                .context_ = request.context_,
            };
        });
    }
}  // namespace conduit::pipeline
