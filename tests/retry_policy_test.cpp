#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

#include "common/mock_transport.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/pipeline/pipeline.hpp"
#include "src/http/policies/retry_policy.hpp"
#include "src/utils/constants.hpp"

using namespace conduit;
using namespace std::chrono_literals;
using test_support::MockTransport;

namespace {
    // Appends to a header on each attempt, so leaked mutations between attempts show up as "aa".
    class AttemptMarker final : public policies::SansIOPolicy {
       public:
        void on_request(pipeline::PipelineRequest& request) override {
            request.http_request_.headers_["x-marker"] += "a";
            retry_counts_.push_back(model::get_option<long long>(request.context_->data(), constants::RETRY_COUNT).value_or(-1));
        }

        std::vector<long long> retry_counts_;
    };

    class RetryPolicyTest : public ::testing::Test {
       protected:
        std::shared_ptr<policies::RetryPolicy> make_policy(size_t max_tries = 3) {
            policies::RetryOptions options;
            options.max_tries_ = max_tries;
            options.base_delay_ = 10ms;
            options.max_delay_ = 100ms;
            return std::make_shared<policies::RetryPolicy>(options, [this](std::chrono::milliseconds delay) { delays_.push_back(delay); });
        }

        std::vector<std::chrono::milliseconds> delays_;
    };

    MockTransport& mock_of(pipeline::Pipeline& p) { return static_cast<MockTransport&>(p.transport()); }
}  // namespace

TEST_F(RetryPolicyTest, ExhaustedTransportErrorsRethrowFinalError) {
    auto transport = std::make_unique<MockTransport>();
    for (int i = 0; i < 3; ++i) {
        transport->push_error(http_error::TransportError("connection reset " + std::to_string(i)));
    }
    pipeline::Pipeline p(std::move(transport), {make_policy(3)});

    try {
        p.run(test_support::make_request("https://example.com/"));
        FAIL() << "expected TransportError";
    } catch (const http_error::TransportError& e) {
        EXPECT_STREQ(e.what(), "connection reset 2");
    }
    EXPECT_EQ(mock_of(p).send_count(), 3U);
    EXPECT_EQ(delays_.size(), 2U);
}

TEST_F(RetryPolicyTest, SucceedsAfterTransientFailure) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_error(http_error::TransportError("timed out", 28, true));
    transport->push_response(200, {}, "ok");
    pipeline::Pipeline p(std::move(transport), {make_policy()});

    auto response = p.run(test_support::make_request("https://example.com/"));

    EXPECT_EQ(response.http_response_.status_, 200);
    EXPECT_EQ(response.http_response_.body_, "ok");
    EXPECT_EQ(mock_of(p).send_count(), 2U);
}

TEST_F(RetryPolicyTest, RetryableStatusReturnsLastResponseWhenExhausted) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_response(503);
    transport->push_response(502);
    transport->push_response(500);
    pipeline::Pipeline p(std::move(transport), {make_policy(3)});

    auto response = p.run(test_support::make_request("https://example.com/"));

    EXPECT_EQ(response.http_response_.status_, 500);
    EXPECT_EQ(mock_of(p).send_count(), 3U);
}

TEST_F(RetryPolicyTest, NonRetryableStatusReturnsImmediately) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_response(404);
    pipeline::Pipeline p(std::move(transport), {make_policy()});

    EXPECT_EQ(p.run(test_support::make_request("https://example.com/")).http_response_.status_, 404);
    EXPECT_EQ(mock_of(p).send_count(), 1U);
    EXPECT_TRUE(delays_.empty());
}

TEST_F(RetryPolicyTest, NonTransportErrorsAreNotRetried) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_error(std::logic_error("bug"));
    pipeline::Pipeline p(std::move(transport), {make_policy()});

    EXPECT_THROW(p.run(test_support::make_request("https://example.com/")), std::logic_error);
    EXPECT_EQ(mock_of(p).send_count(), 1U);
}

TEST_F(RetryPolicyTest, HonoursRetryAfterSeconds) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_response(429, {{"Retry-After", "2"}});
    pipeline::Pipeline p(std::move(transport), {make_policy()});

    p.run(test_support::make_request("https://example.com/"));

    ASSERT_EQ(delays_.size(), 1U);
    EXPECT_EQ(delays_[0], 2000ms);
}

TEST_F(RetryPolicyTest, HonoursRetryAfterMilliseconds) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_response(503, {{"retry-after-ms", "150"}});
    pipeline::Pipeline p(std::move(transport), {make_policy()});

    p.run(test_support::make_request("https://example.com/"));

    ASSERT_EQ(delays_.size(), 1U);
    EXPECT_EQ(delays_[0], 150ms);
}

TEST_F(RetryPolicyTest, RetryTotalOptionOverridesMaxTries) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_response(503);
    pipeline::Pipeline p(std::move(transport), {make_policy(5)});

    auto response = p.run(test_support::make_request("https://example.com/"), {{constants::RETRY_TOTAL, 0LL}});

    EXPECT_EQ(response.http_response_.status_, 503);
    EXPECT_EQ(mock_of(p).send_count(), 1U);
}

TEST_F(RetryPolicyTest, EachAttemptStartsFromTheOriginalRequest) {
    auto marker = std::make_shared<AttemptMarker>();
    auto transport = std::make_unique<MockTransport>();
    transport->push_response(503);
    transport->push_response(503);
    pipeline::Pipeline p(std::move(transport), {make_policy(3), marker});

    p.run(test_support::make_request("https://example.com/"));

    const auto sent = mock_of(p).requests();
    ASSERT_EQ(sent.size(), 3U);
    for (const auto& request : sent) {
        EXPECT_EQ(request.headers_.at("x-marker"), "a");
    }
    EXPECT_EQ(marker->retry_counts_, (std::vector<long long>{0, 1, 2}));
}

TEST(RetryScheduleTest, BackoffGrowsExponentiallyUpToTheCap) {
    policies::RetryOptions options;
    options.base_delay_ = 100ms;
    options.max_delay_ = 300ms;
    policies::RetrySchedule schedule(options);

    const policies::SendResult outcome = pipeline::PipelineResponse{.http_response_ = test_support::make_response(503)};

    const auto first = schedule.delay_for(1, outcome);
    const auto second = schedule.delay_for(2, outcome);
    const auto fourth = schedule.delay_for(4, outcome);

    EXPECT_GE(first, 100ms);
    EXPECT_LE(first, 200ms);
    EXPECT_GE(second, 200ms);
    EXPECT_LE(second, 300ms);
    EXPECT_EQ(fourth, 300ms);
}

TEST(RetryScheduleTest, JitterNeverExceedsMaxDelay) {
    policies::RetryOptions options;
    options.base_delay_ = 250ms;
    options.max_delay_ = 300ms;
    policies::RetrySchedule schedule(options);

    const policies::SendResult outcome = std::make_exception_ptr(http_error::TransportError("refused"));
    for (int i = 0; i < 50; ++i) {
        const auto delay = schedule.delay_for(1, outcome);
        EXPECT_GE(delay, 250ms);
        EXPECT_LE(delay, 300ms);
    }
}

TEST(RetryScheduleTest, ClassifiesOutcomes) {
    policies::RetrySchedule schedule(policies::RetryOptions{});

    EXPECT_TRUE(schedule.should_retry(pipeline::PipelineResponse{.http_response_ = test_support::make_response(429)}));
    EXPECT_FALSE(schedule.should_retry(pipeline::PipelineResponse{.http_response_ = test_support::make_response(400)}));
    EXPECT_TRUE(schedule.should_retry(std::make_exception_ptr(http_error::TransportError("refused"))));
    EXPECT_FALSE(schedule.should_retry(std::make_exception_ptr(http_error::PolicyError("no"))));
}

TEST(RetryScheduleTest, ZeroMaxTriesStillMakesOneAttempt) {
    policies::RetryOptions options;
    options.max_tries_ = 0;
    policies::RetrySchedule schedule(options);

    EXPECT_EQ(schedule.total_attempts({}), 1U);
    EXPECT_EQ(schedule.total_attempts({{constants::RETRY_TOTAL, 2LL}}), 3U);
}

TEST(RetryScheduleTest, DeferredSleepWaitsOnTheAwaitingThread) {
    auto pending = policies::deferred_sleep(1ms);

    EXPECT_EQ(pending.wait_for(0ms), std::future_status::deferred);
    pending.get();
}
