#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "common/mock_transport.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/pipeline/pipeline.hpp"
#include "src/http/pipeline/pipeline_builder.hpp"
#include "src/utils/constants.hpp"

using namespace conduit;
using test_support::MockTransport;
using test_support::RecordingPolicy;

namespace {
    MockTransport& mock_of(pipeline::Pipeline& p) { return static_cast<MockTransport&>(p.transport()); }

    class FailingRequestPolicy final : public policies::SansIOPolicy {
       public:
        void on_request(pipeline::PipelineRequest& /*request*/) override { throw http_error::PolicyError("rejected before send"); }
    };

    class CannedResponsePolicy final : public policies::HttpPolicy {
       public:
        pipeline::PipelineResponse send(pipeline::PipelineRequest& request) override {
            return pipeline::PipelineResponse{
                .http_request_ = request.http_request_,
                .http_response_ = test_support::make_response(299),
                .context_ = request.context_,
            };
        }
    };

    class ContextProbe final : public policies::SansIOPolicy {
       public:
        void on_request(pipeline::PipelineRequest& request) override {
            contexts_.push_back(request.context_.get());
            saw_marker_.push_back(request.context_->data().contains("marker"));
            request.context_->data()["marker"] = true;
        }

        std::vector<pipeline::PipelineContext*> contexts_;
        std::vector<bool> saw_marker_;
    };
}  // namespace

TEST(PipelineTest, RunsRequestHooksForwardAndResponseHooksInReverse) {
    std::vector<std::string> log;
    pipeline::Pipeline p(std::make_unique<MockTransport>(),
                         {std::make_shared<RecordingPolicy>("a", log), std::make_shared<RecordingPolicy>("b", log)});

    auto response = p.run(test_support::make_request("https://example.com/"));

    EXPECT_EQ(response.http_response_.status_, 200);
    EXPECT_EQ(log, (std::vector<std::string>{"a:request", "b:request", "b:response", "a:response"}));
    EXPECT_EQ(mock_of(p).send_count(), 1U);
}

TEST(PipelineTest, ErrorStatusIsReturnedNotThrown) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_response(418, {}, "teapot");
    pipeline::Pipeline p(std::move(transport));

    auto response = p.run(test_support::make_request("https://example.com/"));

    EXPECT_EQ(response.http_response_.status_, 418);
    EXPECT_EQ(response.http_response_.body_, "teapot");
}

TEST(PipelineTest, TransportErrorRunsExceptionHooksAndPropagates) {
    std::vector<std::string> log;
    auto transport = std::make_unique<MockTransport>();
    transport->push_error(http_error::TransportError("connection refused"));
    pipeline::Pipeline p(std::move(transport), {std::make_shared<RecordingPolicy>("a", log), std::make_shared<RecordingPolicy>("b", log)});

    EXPECT_THROW(p.run(test_support::make_request("https://example.com/")), http_error::TransportError);
    EXPECT_EQ(log, (std::vector<std::string>{"a:request", "b:request", "b:exception", "a:exception"}));
}

TEST(PipelineTest, FailingRequestHookAbortsBeforeTransport) {
    std::vector<std::string> log;
    pipeline::Pipeline p(std::make_unique<MockTransport>(), {std::make_shared<RecordingPolicy>("outer", log), std::make_shared<FailingRequestPolicy>()});

    EXPECT_THROW(p.run(test_support::make_request("https://example.com/")), http_error::PolicyError);
    EXPECT_EQ(mock_of(p).send_count(), 0U);
    EXPECT_EQ(log, (std::vector<std::string>{"outer:request", "outer:exception"}));
}

TEST(PipelineTest, ChainingPolicyMayAnswerWithoutCallingNext) {
    std::vector<std::string> log;
    pipeline::Pipeline p(std::make_unique<MockTransport>(), {std::make_shared<RecordingPolicy>("a", log), std::make_shared<CannedResponsePolicy>()});

    auto response = p.run(test_support::make_request("https://example.com/"));

    EXPECT_EQ(response.http_response_.status_, 299);
    EXPECT_EQ(mock_of(p).send_count(), 0U);
    EXPECT_EQ(log, (std::vector<std::string>{"a:request", "a:response"}));
}

TEST(PipelineTest, PipelineOnlyOptionsNeverReachTransport) {
    pipeline::Pipeline p(std::make_unique<MockTransport>());

    model::Options options{
        {constants::INSECURE_DOMAIN_CHANGE, false},
        {constants::ENABLE_CAE, true},
        {constants::TRACING_OPTIONS, model::StringMap{{"span_name", "get-thing"}}},
        {constants::PERMIT_REDIRECTS, true},
        {constants::TIMEOUT_MS, 5000LL},
    };
    auto response = p.run(test_support::make_request("https://example.com/"), options);

    const auto seen = mock_of(p).options();
    ASSERT_EQ(seen.size(), 1U);
    EXPECT_EQ(seen[0].size(), 1U);
    EXPECT_EQ(model::get_option<long long>(seen[0], constants::TIMEOUT_MS), 5000LL);

    // The call's own context keeps them for post-send hooks and later attempts.
    EXPECT_EQ(response.context_->options().size(), options.size());
    EXPECT_EQ(model::get_option<bool>(response.context_->options(), constants::ENABLE_CAE), true);
}

TEST(PipelineTest, EveryRunGetsAFreshContext) {
    auto probe = std::make_shared<ContextProbe>();
    pipeline::Pipeline p(std::make_unique<MockTransport>(), {probe});

    p.run(test_support::make_request("https://example.com/1"));
    p.run(test_support::make_request("https://example.com/2"));

    ASSERT_EQ(probe->saw_marker_.size(), 2U);
    EXPECT_FALSE(probe->saw_marker_[0]);
    EXPECT_FALSE(probe->saw_marker_[1]);
}

TEST(PipelineTest, NullPolicyEntriesAreSkipped) {
    std::vector<std::string> log;
    pipeline::Pipeline p(std::make_unique<MockTransport>(),
                         {std::shared_ptr<policies::SansIOPolicy>{}, std::make_shared<RecordingPolicy>("a", log), std::shared_ptr<policies::HttpPolicy>{}});

    EXPECT_EQ(p.size(), 1U);
    p.run(test_support::make_request("https://example.com/"));
    EXPECT_EQ(log.size(), 2U);
}

TEST(PipelineTest, RequiresTransport) { EXPECT_THROW(pipeline::Pipeline(nullptr), std::invalid_argument); }

TEST(PipelineTest, ConcurrentRunsAreIndependent) {
    pipeline::Pipeline p(std::make_unique<MockTransport>(), {std::make_shared<policies::SansIOPolicy>()});

    std::vector<std::thread> callers;
    std::vector<long> statuses(8, 0);
    for (size_t i = 0; i < statuses.size(); ++i) {
        callers.emplace_back([&p, &statuses, i]() {
            statuses[i] = p.run(test_support::make_request("https://example.com/" + std::to_string(i))).http_response_.status_;
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(mock_of(p).send_count(), statuses.size());
    for (long status : statuses) {
        EXPECT_EQ(status, 200);
    }
}

TEST(PipelineScopeTest, OpensAndClosesTransport) {
    pipeline::Pipeline p(std::make_unique<MockTransport>());
    {
        pipeline::PipelineScope scope(p);
        EXPECT_EQ(mock_of(p).open_count(), 1);
        scope->run(test_support::make_request("https://example.com/"));
        EXPECT_EQ(mock_of(p).close_count(), 0);
    }
    EXPECT_EQ(mock_of(p).close_count(), 1);
}

TEST(PipelineScopeTest, ClosesTransportWhenRunThrows) {
    auto transport = std::make_unique<MockTransport>();
    transport->push_error(http_error::TransportError("reset by peer"));
    pipeline::Pipeline p(std::move(transport));

    try {
        pipeline::PipelineScope scope(p);
        scope->run(test_support::make_request("https://example.com/"));
        FAIL() << "expected TransportError";
    } catch (const http_error::TransportError&) {
    }

    EXPECT_EQ(mock_of(p).open_count(), 1);
    EXPECT_EQ(mock_of(p).close_count(), 1);
}

TEST(ThrowForStatusTest, RaisesHttpErrorOutsideSuccessRange) {
    EXPECT_NO_THROW(http_error::throw_for_status(test_support::make_response(204)));

    auto not_found = test_support::make_response(404, {}, "missing");
    not_found.effective_url_ = "https://example.com/x";
    try {
        http_error::throw_for_status(not_found);
        FAIL() << "expected HttpError";
    } catch (const http_error::HttpError& e) {
        EXPECT_EQ(e.status_, 404);
        EXPECT_EQ(e.url_, "https://example.com/x");
        EXPECT_EQ(e.body_preview_, "missing");
    }
}

TEST(ThrowForStatusTest, PipelineResponseFallsBackToRequestUrl) {
    pipeline::PipelineResponse ok{.http_response_ = test_support::make_response(200)};
    EXPECT_NO_THROW(http_error::throw_for_status(ok));

    pipeline::PipelineResponse failed{
        .http_request_ = test_support::make_request("https://example.com/orders"),
        .http_response_ = test_support::make_response(503, {}, "busy"),
    };
    try {
        http_error::throw_for_status(failed);
        FAIL() << "expected HttpError";
    } catch (const http_error::HttpError& e) {
        EXPECT_EQ(e.status_, 503);
        EXPECT_EQ(e.url_, "https://example.com/orders");
        EXPECT_EQ(e.body_preview_, "busy");
    }
}

TEST(PipelineBuilderTest, ValidateRequiresTransport) {
    pipeline::PipelineBuilder builder;
    EXPECT_THROW(builder.validate(), std::runtime_error);
}

TEST(PipelineBuilderTest, DefaultPoliciesDecorateRequestBeforeCustomHook) {
    model::Headers seen;
    config::PipelineConfig config;
    config.headers_["x-tenant"] = "contoso";

    auto p = pipeline::PipelineBuilder()
                 .with_transport(std::make_unique<MockTransport>())
                 .with_config(config)
                 .with_hooks([&seen](pipeline::PipelineRequest& request) { seen = request.http_request_.headers_; })
                 .validate()
                 .build();
    p->run(test_support::make_request("https://example.com/"));

    EXPECT_EQ(seen.at("x-tenant"), "contoso");
    EXPECT_TRUE(seen.contains("User-Agent"));
    EXPECT_TRUE(seen.contains("x-ms-client-request-id"));
    EXPECT_TRUE(seen.contains("traceparent"));
}

TEST(PipelineBuilderTest, RetryCanBeDisabledByConfig) {
    config::PipelineConfig config;
    config.retry_enabled_ = false;

    auto transport = std::make_unique<MockTransport>();
    transport->push_response(503);
    auto* mock = transport.get();

    auto p = pipeline::PipelineBuilder().with_transport(std::move(transport)).with_config(config).build();
    auto response = p->run(test_support::make_request("https://example.com/"));

    EXPECT_EQ(response.http_response_.status_, 503);
    EXPECT_EQ(mock->send_count(), 1U);
}

TEST(PipelineBuilderTest, BuildAsyncRequiresAsyncTransport) {
    pipeline::PipelineBuilder builder;
    builder.with_transport(std::make_unique<MockTransport>());
    EXPECT_THROW(builder.build_async(), std::runtime_error);
}
