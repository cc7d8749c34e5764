#ifndef CONDUIT_HEADERS_POLICY_HPP
#define CONDUIT_HEADERS_POLICY_HPP

#include <string>

#include "../model/model.hpp"
#include "policy.hpp"

namespace conduit::policies {
    inline constexpr const char* DEFAULT_USER_AGENT = "conduit/1.0";
    inline constexpr const char* CLIENT_REQUEST_ID_HEADER = "x-ms-client-request-id";

    // Adds fixed headers to every request; the per-call "headers" option adds or overrides more.
    class HeadersPolicy final : public SansIOPolicy {
       public:
        explicit HeadersPolicy(model::Headers headers = {}) : headers_(std::move(headers)) {}

        void on_request(pipeline::PipelineRequest& request) override;

        [[nodiscard]] const model::Headers& headers() const { return headers_; }

       private:
        model::Headers headers_;
    };

    class UserAgentPolicy final : public SansIOPolicy {
       public:
        explicit UserAgentPolicy(std::string user_agent = DEFAULT_USER_AGENT, bool overwrite = false)
            : user_agent_(std::move(user_agent)), overwrite_(overwrite) {}

        void on_request(pipeline::PipelineRequest& request) override;

        [[nodiscard]] const std::string& user_agent() const { return user_agent_; }

       private:
        std::string user_agent_;
        bool overwrite_;
    };

    // Stamps each call with a client request id, generated unless "request_id" is passed.
    class RequestIdPolicy final : public SansIOPolicy {
       public:
        void on_request(pipeline::PipelineRequest& request) override;
    };
}  // namespace conduit::policies

#endif
