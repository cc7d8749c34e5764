#include "tracing_policy.hpp"

#include <chrono>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"

using namespace std::chrono;

namespace conduit::policies {
    namespace {
        constexpr size_t TRACE_ID_BYTES = 16;
        constexpr size_t SPAN_ID_BYTES = 8;

        long long now_ns() { return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count(); }
    }  // namespace

    DistributedTracingPolicy::DistributedTracingPolicy(std::shared_ptr<spdlog::logger> logger)
        : logger_(logger != nullptr ? std::move(logger) : logging::logger()) {}

    void DistributedTracingPolicy::on_request(pipeline::PipelineRequest& request) {
        auto& data = request.context_->data();

        auto trace_id = model::get_option<std::string>(data, constants::TRACE_ID);
        if (!trace_id) {
            trace_id = string_utils::random_hex(TRACE_ID_BYTES);
            data[constants::TRACE_ID] = *trace_id;
        }

        request.http_request_.headers_[TRACEPARENT_HEADER] = "00-" + *trace_id + "-" + string_utils::random_hex(SPAN_ID_BYTES) + "-01";
        data[constants::SPAN_START_NS] = now_ns();
    }

    void DistributedTracingPolicy::on_response(pipeline::PipelineRequest& request, pipeline::PipelineResponse& response) {
        logger_->debug("span '{}' finished: status={} duration={}ms{}", span_name(request), response.http_response_.status_, elapsed_ms(request),
                       attributes(request));
    }

    void DistributedTracingPolicy::on_exception(pipeline::PipelineRequest& request, const std::exception_ptr& error) {
        std::string reason = "unknown error";
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            reason = e.what();
        } catch (...) {
            reason = "non-standard exception";
        }
        logger_->debug("span '{}' failed: error='{}' duration={}ms{}", span_name(request), reason, elapsed_ms(request), attributes(request));
    }

    std::string DistributedTracingPolicy::span_name(const pipeline::PipelineRequest& request) {
        if (auto tracing = model::get_option<model::StringMap>(request.context_->options(), constants::TRACING_OPTIONS)) {
            if (auto it = tracing->find(constants::SPAN_NAME); it != tracing->end()) {
                return it->second;
            }
        }
        return "HTTP " + request.http_request_.method_;
    }

    std::string DistributedTracingPolicy::attributes(const pipeline::PipelineRequest& request) {
        std::string out;
        if (auto tracing = model::get_option<model::StringMap>(request.context_->options(), constants::TRACING_OPTIONS)) {
            for (const auto& [key, value] : *tracing) {
                if (key != constants::SPAN_NAME) {
                    out += " " + key + "=" + value;
                }
            }
        }
        return out;
    }

    long long DistributedTracingPolicy::elapsed_ms(const pipeline::PipelineRequest& request) {
        auto start = model::get_option<long long>(request.context_->data(), constants::SPAN_START_NS);
        if (!start) {
            return 0;
        }
        return duration_cast<milliseconds>(nanoseconds{now_ns() - *start}).count();
    }
}  // namespace conduit::policies
