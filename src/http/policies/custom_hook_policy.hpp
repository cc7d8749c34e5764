#ifndef CONDUIT_CUSTOM_HOOK_POLICY_HPP
#define CONDUIT_CUSTOM_HOOK_POLICY_HPP

#include <functional>

#include "policy.hpp"

namespace conduit::policies {
    using RequestHook = std::function<void(pipeline::PipelineRequest&)>;
    using ResponseHook = std::function<void(pipeline::PipelineRequest&, pipeline::PipelineResponse&)>;

    // Hands the raw request and response to user callbacks. Either hook may be empty.
    class CustomHookPolicy final : public SansIOPolicy {
       public:
        explicit CustomHookPolicy(RequestHook request_hook = nullptr, ResponseHook response_hook = nullptr)
            : request_hook_(std::move(request_hook)), response_hook_(std::move(response_hook)) {}

        void on_request(pipeline::PipelineRequest& request) override {
            if (request_hook_) {
                request_hook_(request);
            }
        }

        void on_response(pipeline::PipelineRequest& request, pipeline::PipelineResponse& response) override {
            if (response_hook_) {
                response_hook_(request, response);
            }
        }

       private:
        RequestHook request_hook_;
        ResponseHook response_hook_;
    };
}  // namespace conduit::policies

#endif
