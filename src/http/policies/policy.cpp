#include "policy.hpp"

namespace conduit::policies {
    std::future<void> ready_future() {
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }

    std::future<void> AsyncSansIOPolicy::on_request(pipeline::PipelineRequest& /*request*/) { return ready_future(); }

    std::future<void> AsyncSansIOPolicy::on_response(pipeline::PipelineRequest& /*request*/, pipeline::PipelineResponse& /*response*/) {
        return ready_future();
    }

    std::future<void> AsyncSansIOPolicy::on_exception(pipeline::PipelineRequest& /*request*/, const std::exception_ptr& /*error*/) {
        return ready_future();
    }

    std::future<void> SyncSansIOPolicyAdapter::on_request(pipeline::PipelineRequest& request) {
        policy_->on_request(request);
        return ready_future();
    }

    std::future<void> SyncSansIOPolicyAdapter::on_response(pipeline::PipelineRequest& request, pipeline::PipelineResponse& response) {
        policy_->on_response(request, response);
        return ready_future();
    }

    std::future<void> SyncSansIOPolicyAdapter::on_exception(pipeline::PipelineRequest& request, const std::exception_ptr& error) {
        policy_->on_exception(request, error);
        return ready_future();
    }

    SendResult try_send(HttpPolicy& next, pipeline::PipelineRequest& request) {
        try {
            return next.send(request);
        } catch (...) {
            return std::current_exception();
        }
    }

    SendResult try_send(AsyncHttpPolicy& next, pipeline::PipelineRequest& request) {
        try {
            return next.send(request).get();
        } catch (...) {
            return std::current_exception();
        }
    }
}  // namespace conduit::policies
