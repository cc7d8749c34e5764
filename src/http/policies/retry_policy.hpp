#ifndef CONDUIT_RETRY_POLICY_HPP
#define CONDUIT_RETRY_POLICY_HPP

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include "policy.hpp"

namespace conduit::policies {
    const long BASE_DELAY_MS = 800;
    const long MAX_DELAY_MS = 60'000;

    struct RetryOptions {
        // Total attempts, the first one included.
        size_t max_tries_ = 3;
        std::chrono::milliseconds base_delay_{BASE_DELAY_MS};
        std::chrono::milliseconds max_delay_{MAX_DELAY_MS};
        std::vector<long> retry_on_status_codes_ = {408, 429, 500, 502, 503, 504};
        bool respect_retry_after_ = true;
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using AsyncSleeper = std::function<std::future<void>(std::chrono::milliseconds)>;

    void blocking_sleep(std::chrono::milliseconds delay);

    // Sleeps on the thread that waits on the returned future.
    std::future<void> deferred_sleep(std::chrono::milliseconds delay);

    // Decides whether and when to try again. Shared by the sync and async retry policies.
    class RetrySchedule {
       public:
        explicit RetrySchedule(RetryOptions options);

        // The per-call "retry_total" option counts retries, so it allows retry_total + 1 attempts.
        [[nodiscard]] size_t total_attempts(const model::Options& call_options) const;
        [[nodiscard]] bool should_retry(const SendResult& outcome) const;
        [[nodiscard]] std::chrono::milliseconds delay_for(size_t attempt, const SendResult& outcome) const;
        [[nodiscard]] const RetryOptions& options() const { return options_; }

        static std::optional<std::chrono::milliseconds> retry_after(const model::Response& response);

       private:
        RetryOptions options_;
    };

    // Re-sends on transport failures and retryable statuses with exponential backoff.
    // When attempts run out the final failure is rethrown, or the final response returned.
    class RetryPolicy final : public HttpPolicy {
       public:
        explicit RetryPolicy(RetryOptions options = {}, Sleeper sleep = blocking_sleep);

        pipeline::PipelineResponse send(pipeline::PipelineRequest& request) override;

        [[nodiscard]] const RetryOptions& options() const { return schedule_.options(); }

       private:
        RetrySchedule schedule_;
        Sleeper sleep_;
    };

    class AsyncRetryPolicy final : public AsyncHttpPolicy {
       public:
        explicit AsyncRetryPolicy(RetryOptions options = {}, AsyncSleeper sleep = deferred_sleep);

        std::future<pipeline::PipelineResponse> send(pipeline::PipelineRequest& request) override;

       private:
        RetrySchedule schedule_;
        AsyncSleeper sleep_;
    };
}  // namespace conduit::policies

#endif
