#include "headers_policy.hpp"

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace conduit::policies {
    void HeadersPolicy::on_request(pipeline::PipelineRequest& request) {
        for (const auto& [name, value] : headers_) {
            request.http_request_.headers_[name] = value;
        }

        if (auto extra = model::get_option<model::StringMap>(request.context_->options(), constants::HEADERS)) {
            for (const auto& [name, value] : *extra) {
                request.http_request_.headers_[name] = value;
            }
        }
    }

    void UserAgentPolicy::on_request(pipeline::PipelineRequest& request) {
        std::string user_agent = user_agent_;
        if (auto suffix = model::get_option<std::string>(request.context_->options(), constants::USER_AGENT)) {
            user_agent += " " + *suffix;
        }

        auto& headers = request.http_request_.headers_;
        auto existing = headers.find("User-Agent");
        if (existing == headers.end() || overwrite_) {
            headers["User-Agent"] = user_agent;
        } else {
            existing->second = user_agent + " " + existing->second;
        }
    }

    void RequestIdPolicy::on_request(pipeline::PipelineRequest& request) {
        auto& headers = request.http_request_.headers_;
        if (auto request_id = model::get_option<std::string>(request.context_->options(), constants::REQUEST_ID)) {
            headers[CLIENT_REQUEST_ID_HEADER] = *request_id;
        } else if (headers.find(CLIENT_REQUEST_ID_HEADER) == headers.end()) {
            headers[CLIENT_REQUEST_ID_HEADER] = string_utils::uuid4();
        }
    }
}  // namespace conduit::policies
