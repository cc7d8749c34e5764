#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "common/mock_transport.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/model/multipart.hpp"
#include "src/http/pipeline/multipart_preparer.hpp"
#include "src/http/pipeline/pipeline.hpp"

using namespace conduit;
using test_support::make_request;
using test_support::MockTransport;

namespace {
    class TagPartPolicy final : public policies::SansIOPolicy {
       public:
        void on_request(pipeline::PipelineRequest& request) override {
            request.http_request_.headers_["x-part"] = model::get_option<std::string>(request.context_->options(), "tag").value_or("none");
            if (request.http_request_.url_.find("/bad") != std::string::npos) {
                throw http_error::PolicyError("cannot prepare " + request.http_request_.url_);
            }
        }
    };

    class ConcurrencyProbe final : public policies::SansIOPolicy {
       public:
        void on_request(pipeline::PipelineRequest& /*request*/) override {
            const int now = ++active_;
            int seen = peak_.load();
            while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --active_;
            ++calls_;
        }

        std::atomic<int> active_ = 0;
        std::atomic<int> peak_ = 0;
        std::atomic<int> calls_ = 0;
    };

    MockTransport& mock_of(pipeline::Pipeline& p) { return static_cast<MockTransport&>(p.transport()); }
}  // namespace

TEST(MultipartTest, SerialisesPartsWithSequentialContentIds) {
    auto batch = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(batch, {make_request("https://example.com/a"), make_request("https://example.com/b?x=1", "DELETE")}, {}, "batch_test");

    model::prepare_multipart_body(batch);

    const std::string expected =
        "--batch_test\r\n"
        "Content-Type: application/http\r\n"
        "Content-Transfer-Encoding: binary\r\n"
        "Content-ID: 0\r\n"
        "\r\n"
        "GET /a HTTP/1.1\r\n"
        "\r\n"
        "\r\n"
        "--batch_test\r\n"
        "Content-Type: application/http\r\n"
        "Content-Transfer-Encoding: binary\r\n"
        "Content-ID: 1\r\n"
        "\r\n"
        "DELETE /b?x=1 HTTP/1.1\r\n"
        "\r\n"
        "\r\n"
        "--batch_test--\r\n";
    EXPECT_EQ(batch.body_, expected);
    EXPECT_EQ(batch.headers_.at("Content-Type"), "multipart/mixed; boundary=batch_test");
}

TEST(MultipartTest, GeneratesBoundaryWhenMissing) {
    auto batch = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(batch, {make_request("https://example.com/a")});

    model::prepare_multipart_body(batch);

    const std::string& boundary = batch.multipart_mixed_->boundary_;
    EXPECT_EQ(boundary.rfind(model::BATCH_BOUNDARY_PREFIX, 0), 0U);
    EXPECT_EQ(batch.headers_.at("Content-Type"), "multipart/mixed; boundary=" + boundary);
}

TEST(MultipartTest, NestedChangesetNumbersContentIdsAcrossLevels) {
    auto changeset = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(changeset, {make_request("https://example.com/c1", "PUT"), make_request("https://example.com/c2", "PUT")}, {},
                               "changeset_1");

    auto batch = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(batch, {changeset, make_request("https://example.com/after")}, {}, "batch_outer");

    model::prepare_multipart_body(batch);

    const std::string& body = batch.body_;
    EXPECT_NE(body.find("Content-Type: multipart/mixed; boundary=changeset_1\r\n"), std::string::npos);
    EXPECT_NE(body.find("--changeset_1--\r\n"), std::string::npos);
    const auto c1 = body.find("PUT /c1 HTTP/1.1");
    const auto c2 = body.find("PUT /c2 HTTP/1.1");
    const auto after = body.find("GET /after HTTP/1.1");
    ASSERT_NE(c1, std::string::npos);
    ASSERT_NE(c2, std::string::npos);
    ASSERT_NE(after, std::string::npos);
    EXPECT_LT(body.find("Content-ID: 0"), c1);
    EXPECT_LT(body.find("Content-ID: 1"), c2);
    EXPECT_LT(body.find("Content-ID: 2"), after);
    EXPECT_GT(body.find("Content-ID: 2"), c2);
}

TEST(MultipartTest, PipelineRunsPartPoliciesBeforeSending) {
    pipeline::Pipeline p(std::make_unique<MockTransport>());

    auto batch = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(batch, {make_request("https://example.com/a"), make_request("https://example.com/b")},
                               {std::make_shared<TagPartPolicy>()}, "batch_tagged", {{"tag", std::string{"bundle"}}});

    p.run(std::move(batch));

    const auto sent = mock_of(p).requests();
    ASSERT_EQ(sent.size(), 1U);
    const std::string& body = sent[0].body_;
    EXPECT_NE(body.find("GET /a HTTP/1.1\r\nx-part: bundle\r\n"), std::string::npos);
    EXPECT_NE(body.find("GET /b HTTP/1.1\r\nx-part: bundle\r\n"), std::string::npos);
}

TEST(MultipartTest, PreparationFailureAbortsTheBatch) {
    pipeline::Pipeline p(std::make_unique<MockTransport>());

    auto batch = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(batch, {make_request("https://example.com/ok"), make_request("https://example.com/bad"), make_request("https://example.com/ok2")},
                               {std::make_shared<TagPartPolicy>()});

    EXPECT_THROW(p.run(std::move(batch)), http_error::PolicyError);
    EXPECT_EQ(mock_of(p).send_count(), 0U);
}

TEST(MultipartTest, PreparationIsBoundedByWorkerLimit) {
    auto probe = std::make_shared<ConcurrencyProbe>();
    std::vector<model::Request> parts;
    for (int i = 0; i < 8; ++i) {
        parts.push_back(make_request("https://example.com/" + std::to_string(i)));
    }
    auto batch = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(batch, std::move(parts), {probe});

    pipeline::prepare_multipart_mixed_request(batch, 2);

    EXPECT_EQ(probe->calls_.load(), 8);
    EXPECT_GE(probe->peak_.load(), 1);
    EXPECT_LE(probe->peak_.load(), 2);
}

TEST(MultipartTest, NestedChangesetPartsAreAlsoPrepared) {
    auto changeset = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(changeset, {make_request("https://example.com/inner")}, {std::make_shared<TagPartPolicy>()}, "changeset_n",
                               {{"tag", std::string{"inner"}}});

    auto batch = make_request("https://example.com/$batch", "POST");
    model::set_multipart_mixed(batch, {changeset}, {}, "batch_n");

    pipeline::prepare_multipart(batch, 4);

    EXPECT_NE(batch.body_.find("GET /inner HTTP/1.1\r\nx-part: inner\r\n"), std::string::npos);
}

TEST(MultipartTest, RequestsWithoutBundleAreUntouched) {
    auto plain = make_request("https://example.com/", "POST", "body");

    pipeline::prepare_multipart(plain, 4);

    EXPECT_EQ(plain.body_, "body");
    EXPECT_FALSE(plain.headers_.contains("Content-Type"));
}
