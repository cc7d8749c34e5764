#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "src/config/pipeline_config.hpp"
#include "src/utils/logging.hpp"

using namespace conduit;
using namespace std::chrono_literals;

TEST(PipelineConfigTest, EmptyObjectKeepsDefaults) {
    auto config = config::PipelineConfig::parse_string("{}");

    EXPECT_TRUE(config.retry_enabled_);
    EXPECT_EQ(config.retry_.max_tries_, 3U);
    EXPECT_EQ(config.retry_.base_delay_, 800ms);
    EXPECT_EQ(config.retry_.max_delay_, 60'000ms);
    EXPECT_EQ(config.retry_.retry_on_status_codes_, (std::vector<long>{408, 429, 500, 502, 503, 504}));
    EXPECT_TRUE(config.redirect_enabled_);
    EXPECT_EQ(config.redirect_.max_redirects_, 30U);
    EXPECT_EQ(config.transport_.timeout_ms_, 30'000);
    EXPECT_FALSE(config.transport_.follow_redirects_);
    EXPECT_TRUE(config.transport_.verify_tls_);
    EXPECT_EQ(config.log_level_, "info");
    EXPECT_FALSE(config.allowed_headers_.has_value());
    EXPECT_EQ(config.multipart_max_workers_, 4U);
    EXPECT_TRUE(config.headers_.empty());
}

TEST(PipelineConfigTest, ParsesEverySection) {
    auto config = config::PipelineConfig::parse_string(R"({
        "retry": {"enabled": true, "max_tries": 5, "base_delay_ms": 100, "max_delay_ms": 2000, "status_codes": [503, 504]},
        "redirect": {"enabled": false, "max_redirects": 3},
        "transport": {"connect_timeout_ms": 1500, "timeout_ms": 9000, "user_agent": "svc/2.0", "follow_redirects": false, "verify_tls": false},
        "logging": {"level": "debug", "allowed_headers": ["Content-Type", "x-ms-request-id"]},
        "multipart": {"max_workers": 8},
        "headers": {"x-tenant": "contoso", "Accept": "application/json"}
    })");

    EXPECT_EQ(config.retry_.max_tries_, 5U);
    EXPECT_EQ(config.retry_.base_delay_, 100ms);
    EXPECT_EQ(config.retry_.max_delay_, 2000ms);
    EXPECT_EQ(config.retry_.retry_on_status_codes_, (std::vector<long>{503, 504}));
    EXPECT_FALSE(config.redirect_enabled_);
    EXPECT_EQ(config.redirect_.max_redirects_, 3U);
    EXPECT_EQ(config.transport_.connect_timeout_ms_, 1500);
    EXPECT_EQ(config.transport_.timeout_ms_, 9000);
    EXPECT_EQ(config.transport_.user_agent_, "svc/2.0");
    EXPECT_FALSE(config.transport_.verify_tls_);
    EXPECT_EQ(config.log_level_, "debug");
    ASSERT_TRUE(config.allowed_headers_.has_value());
    EXPECT_TRUE(config.allowed_headers_->contains("content-type"));
    EXPECT_TRUE(config.allowed_headers_->contains("x-ms-request-id"));
    EXPECT_EQ(config.multipart_max_workers_, 8U);
    EXPECT_EQ(config.headers_.at("x-tenant"), "contoso");
    EXPECT_EQ(config.headers_.at("accept"), "application/json");
}

TEST(PipelineConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(config::PipelineConfig::parse_string(R"({"logging": {"level": "verbose"}})"), std::runtime_error);
    EXPECT_THROW(config::PipelineConfig::parse_string(R"({"retry": {"max_tries": 0}})"), std::runtime_error);
    EXPECT_THROW(config::PipelineConfig::parse_string(R"({"retry": {"max_tries": "three"}})"), std::runtime_error);
    EXPECT_THROW(config::PipelineConfig::parse_string(R"({"retry": {"status_codes": [42]}})"), std::runtime_error);
    EXPECT_THROW(config::PipelineConfig::parse_string(R"({"retry": {"base_delay_ms": 5000, "max_delay_ms": 10}})"), std::runtime_error);
    EXPECT_THROW(config::PipelineConfig::parse_string(R"({"multipart": {"max_workers": 0}})"), std::runtime_error);
    EXPECT_THROW(config::PipelineConfig::parse_string(R"({"headers": {"x-count": 3}})"), std::runtime_error);
    EXPECT_THROW(config::PipelineConfig::parse_string(R"({"redirect": []})"), std::runtime_error);
    EXPECT_THROW(config::PipelineConfig::parse_string(R"([1, 2])"), std::runtime_error);
}

TEST(PipelineConfigTest, ErrorNamesTheField) {
    try {
        (void)config::PipelineConfig::parse_string(R"({"multipart": {"max_workers": 0}})");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("multipart.max_workers"), std::string::npos);
    }
}

TEST(PipelineConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "conduit_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"redirect": {"max_redirects": 7}})";
    }

    auto config = config::PipelineConfig::load_from_file(path);
    std::filesystem::remove(path);

    EXPECT_EQ(config.redirect_.max_redirects_, 7U);
}

TEST(PipelineConfigTest, MissingFileThrows) {
    EXPECT_THROW(config::PipelineConfig::load_from_file("/nonexistent/conduit.json"), std::runtime_error);
}

TEST(LoggingTest, SetLevelAppliesToSharedLogger) {
    const auto previous = logging::logger()->level();

    logging::set_level("debug");
    EXPECT_EQ(logging::logger()->level(), spdlog::level::debug);
    EXPECT_EQ(logging::logger(), spdlog::get(logging::LOGGER_NAME));

    logging::set_level("off");
    EXPECT_EQ(logging::logger()->level(), spdlog::level::off);

    logging::logger()->set_level(previous);
}

TEST(LoggingTest, RejectsUnknownLevel) {
    EXPECT_FALSE(logging::is_valid_level("verbose"));
    EXPECT_TRUE(logging::is_valid_level("warn"));
    EXPECT_THROW(logging::set_level("verbose"), std::invalid_argument);
}
