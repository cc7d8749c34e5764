#include "retry_policy.hpp"

#include <algorithm>
#include <random>
#include <thread>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

using namespace std::chrono;

namespace conduit::policies {
    namespace {
        std::string describe(const std::exception_ptr& error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                return e.what();
            } catch (...) {
                return "unknown error";
            }
        }

        void log_retry(const pipeline::PipelineRequest& request, const SendResult& outcome, size_t attempt, size_t attempts, milliseconds delay) {
            const std::string reason = std::holds_alternative<pipeline::PipelineResponse>(outcome)
                                           ? "status " + std::to_string(std::get<pipeline::PipelineResponse>(outcome).http_response_.status_)
                                           : describe(std::get<std::exception_ptr>(outcome));
            logging::logger()->warn("Retrying {} {} in {}ms after {} (attempt {}/{})", request.http_request_.method_, request.http_request_.url_,
                                    delay.count(), reason, attempt, attempts);
        }
    }  // namespace

    void blocking_sleep(milliseconds delay) { std::this_thread::sleep_for(delay); }

    std::future<void> deferred_sleep(milliseconds delay) {
        return std::async(std::launch::deferred, [delay]() { std::this_thread::sleep_for(delay); });
    }

    //
    // RetrySchedule implementation
    //

    RetrySchedule::RetrySchedule(RetryOptions options) : options_(std::move(options)) {
        if (options_.max_tries_ == 0) {
            options_.max_tries_ = 1;
        }
    }

    size_t RetrySchedule::total_attempts(const model::Options& call_options) const {
        if (auto retry_total = model::get_option<long long>(call_options, constants::RETRY_TOTAL)) {
            return static_cast<size_t>(std::max<long long>(*retry_total, 0)) + 1;
        }
        return options_.max_tries_;
    }

    bool RetrySchedule::should_retry(const SendResult& outcome) const {
        if (const auto* response = std::get_if<pipeline::PipelineResponse>(&outcome)) {
            return std::ranges::any_of(options_.retry_on_status_codes_,
                                       [status = response->http_response_.status_](long code) { return code == status; });
        }

        try {
            std::rethrow_exception(std::get<std::exception_ptr>(outcome));
        } catch (const http_error::TransportError&) {
            return true;
        } catch (...) {
            return false;
        }
    }

    milliseconds RetrySchedule::delay_for(size_t attempt, const SendResult& outcome) const {
        if (options_.respect_retry_after_) {
            if (const auto* response = std::get_if<pipeline::PipelineResponse>(&outcome)) {
                if (auto server_delay = retry_after(response->http_response_)) {
                    return *server_delay;
                }
            }
        }

        thread_local std::minstd_rand rng{std::random_device{}()};
        std::uniform_int_distribution<long long> jitter(0, options_.base_delay_.count());

        milliseconds delay = options_.base_delay_;
        for (size_t i = 1; i < attempt && delay < options_.max_delay_; ++i) {
            delay *= 2;
        }
        return std::min(delay + milliseconds{jitter(rng)}, options_.max_delay_);
    }

    std::optional<milliseconds> RetrySchedule::retry_after(const model::Response& response) {
        for (const char* header : {"retry-after-ms", "x-ms-retry-after-ms"}) {
            if (auto value = response.header(header)) {
                if (auto ms = string_utils::parse_long(*value); ms && *ms >= 0) {
                    return milliseconds{*ms};
                }
            }
        }

        if (auto value = response.header("retry-after")) {
            if (auto seconds = string_utils::parse_long(*value); seconds && *seconds >= 0) {
                return milliseconds{*seconds * constants::MS_PER_SECOND};
            }
        }
        return std::nullopt;
    }

    //
    // RetryPolicy implementation
    //

    RetryPolicy::RetryPolicy(RetryOptions options, Sleeper sleep) : schedule_(std::move(options)), sleep_(std::move(sleep)) {}

    pipeline::PipelineResponse RetryPolicy::send(pipeline::PipelineRequest& request) {
        const size_t attempts = schedule_.total_attempts(request.context_->options());

        for (size_t attempt = 1;; ++attempt) {
            request.context_->data()[constants::RETRY_COUNT] = static_cast<long long>(attempt - 1);

            pipeline::PipelineRequest attempt_request = request;
            SendResult outcome = try_send(*next_, attempt_request);

            if (attempt >= attempts || !schedule_.should_retry(outcome)) {
                if (auto* error = std::get_if<std::exception_ptr>(&outcome)) {
                    std::rethrow_exception(*error);
                }
                return std::get<pipeline::PipelineResponse>(std::move(outcome));
            }

            const milliseconds delay = schedule_.delay_for(attempt, outcome);
            log_retry(request, outcome, attempt, attempts, delay);
            sleep_(delay);
        }
    }

    //
    // AsyncRetryPolicy implementation
    //

    AsyncRetryPolicy::AsyncRetryPolicy(RetryOptions options, AsyncSleeper sleep) : schedule_(std::move(options)), sleep_(std::move(sleep)) {}

    std::future<pipeline::PipelineResponse> AsyncRetryPolicy::send(pipeline::PipelineRequest& request) {
        return std::async(std::launch::deferred, [this, &request]() {
            const size_t attempts = schedule_.total_attempts(request.context_->options());

            for (size_t attempt = 1;; ++attempt) {
                request.context_->data()[constants::RETRY_COUNT] = static_cast<long long>(attempt - 1);

                pipeline::PipelineRequest attempt_request = request;
                SendResult outcome = try_send(*next_, attempt_request);

                if (attempt >= attempts || !schedule_.should_retry(outcome)) {
                    if (auto* error = std::get_if<std::exception_ptr>(&outcome)) {
                        std::rethrow_exception(*error);
                    }
                    return std::get<pipeline::PipelineResponse>(std::move(outcome));
                }

                const milliseconds delay = schedule_.delay_for(attempt, outcome);
                log_retry(request, outcome, attempt, attempts, delay);
                sleep_(delay).get();
            }
        });
    }
}  // namespace conduit::policies
