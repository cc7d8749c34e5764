#ifndef CONDUIT_TRACING_POLICY_HPP
#define CONDUIT_TRACING_POLICY_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "policy.hpp"

namespace conduit::policies {
    inline constexpr const char* TRACEPARENT_HEADER = "traceparent";

    // One span per attempt, all attempts of a call sharing a trace id. Reads the
    // "tracing_options" string map: "span_name" names the span, other keys become attributes.
    class DistributedTracingPolicy final : public SansIOPolicy {
       public:
        explicit DistributedTracingPolicy(std::shared_ptr<spdlog::logger> logger = nullptr);

        void on_request(pipeline::PipelineRequest& request) override;
        void on_response(pipeline::PipelineRequest& request, pipeline::PipelineResponse& response) override;
        void on_exception(pipeline::PipelineRequest& request, const std::exception_ptr& error) override;

       private:
        [[nodiscard]] static std::string span_name(const pipeline::PipelineRequest& request);
        [[nodiscard]] static std::string attributes(const pipeline::PipelineRequest& request);
        [[nodiscard]] static long long elapsed_ms(const pipeline::PipelineRequest& request);

        std::shared_ptr<spdlog::logger> logger_;
    };
}  // namespace conduit::policies

#endif
