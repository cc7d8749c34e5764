#include "logging_policy.hpp"

#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/url.hpp"

namespace conduit::policies {
    LoggingPolicy::LoggingPolicy(std::shared_ptr<spdlog::logger> logger, std::set<std::string> allowed_headers)
        : logger_(logger != nullptr ? std::move(logger) : logging::logger()) {
        for (const auto& name : allowed_headers) {
            allowed_headers_.insert(string_utils::to_lower(name));
        }
    }

    std::set<std::string> LoggingPolicy::default_allowed_headers() {
        return {"x-ms-request-id",
                "x-ms-client-request-id",
                "x-ms-return-client-request-id",
                "traceparent",
                "accept",
                "cache-control",
                "connection",
                "content-length",
                "content-type",
                "date",
                "etag",
                "expires",
                "if-match",
                "if-modified-since",
                "if-none-match",
                "if-unmodified-since",
                "last-modified",
                "pragma",
                "request-id",
                "retry-after",
                "server",
                "transfer-encoding",
                "user-agent",
                "www-authenticate"};
    }

    std::string LoggingPolicy::redact_headers(const model::Headers& headers) const {
        std::string out;
        for (const auto& [name, value] : headers) {
            out += "\n    '" + name + "': '";
            out += allowed_headers_.contains(string_utils::to_lower(name)) ? value : REDACTED_VALUE;
            out += "'";
        }
        return out;
    }

    void LoggingPolicy::on_request(pipeline::PipelineRequest& request) {
        if (!logger_->should_log(spdlog::level::info)) {
            return;
        }
        const auto& http_request = request.http_request_;
        logger_->info("Request URL: '{}'", model::redact_query(http_request.url_));
        logger_->info("Request method: '{}'", http_request.method_);
        logger_->info("Request headers:{}", redact_headers(http_request.headers_));
        if (http_request.multipart_mixed_) {
            logger_->info("Request body: multipart/mixed with {} parts", http_request.multipart_mixed_->requests_.size());
        } else {
            logger_->info("Request body: {} bytes", http_request.body_.size());
        }
    }

    void LoggingPolicy::on_response(pipeline::PipelineRequest& /*request*/, pipeline::PipelineResponse& response) {
        if (!logger_->should_log(spdlog::level::info)) {
            return;
        }
        logger_->info("Response status: {}", response.http_response_.status_);
        logger_->info("Response headers:{}", redact_headers(response.http_response_.headers_));
    }

    void LoggingPolicy::on_exception(pipeline::PipelineRequest& request, const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            logger_->warn("Request to '{}' failed: {}", model::redact_query(request.http_request_.url_), e.what());
        } catch (...) {
            logger_->warn("Request to '{}' failed with a non-standard exception", model::redact_query(request.http_request_.url_));
        }
    }
}  // namespace conduit::policies
