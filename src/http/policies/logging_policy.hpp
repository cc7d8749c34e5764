#ifndef CONDUIT_LOGGING_POLICY_HPP
#define CONDUIT_LOGGING_POLICY_HPP

#include <memory>
#include <set>
#include <string>

#include <spdlog/spdlog.h>

#include "../model/model.hpp"
#include "policy.hpp"

namespace conduit::policies {
    inline constexpr const char* REDACTED_VALUE = "REDACTED";

    // Logs request and response lines at info. Header values outside the allow list
    // and every query parameter value are redacted.
    class LoggingPolicy final : public SansIOPolicy {
       public:
        explicit LoggingPolicy(std::shared_ptr<spdlog::logger> logger = nullptr, std::set<std::string> allowed_headers = default_allowed_headers());

        void on_request(pipeline::PipelineRequest& request) override;
        void on_response(pipeline::PipelineRequest& request, pipeline::PipelineResponse& response) override;
        void on_exception(pipeline::PipelineRequest& request, const std::exception_ptr& error) override;

        [[nodiscard]] static std::set<std::string> default_allowed_headers();
        [[nodiscard]] std::string redact_headers(const model::Headers& headers) const;

       private:
        std::shared_ptr<spdlog::logger> logger_;
        std::set<std::string> allowed_headers_;
    };
}  // namespace conduit::policies

#endif
