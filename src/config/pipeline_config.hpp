#ifndef CONDUIT_PIPELINE_CONFIG_HPP
#define CONDUIT_PIPELINE_CONFIG_HPP

#include <simdjson.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "../http/model/model.hpp"
#include "../http/policies/redirect_policy.hpp"
#include "../http/policies/retry_policy.hpp"
#include "../http/transport/curl_transport.hpp"
#include "../utils/constants.hpp"

namespace conduit::config {

    template <typename T>
    struct ParserOptions {
        bool is_required_ = true;
        std::vector<T> allowed_values_;
        T fallback_value_;
        std::string error_message_;
    };

    const ParserOptions<bool> RETRY_ENABLED_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = true, .error_message_ = "Invalid retry.enabled"};
    const ParserOptions<bool> REDIRECT_ENABLED_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = true, .error_message_ = "Invalid redirect.enabled"};
    const ParserOptions<int64_t> MAX_TRIES_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 3, .error_message_ = "Invalid retry.max_tries"};
    const ParserOptions<int64_t> BASE_DELAY_MS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = policies::BASE_DELAY_MS, .error_message_ = "Invalid retry.base_delay_ms"};
    const ParserOptions<int64_t> MAX_DELAY_MS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = policies::MAX_DELAY_MS, .error_message_ = "Invalid retry.max_delay_ms"};
    const ParserOptions<int64_t> STATUS_CODE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid retry.status_codes"};
    const ParserOptions<bool> RESPECT_RETRY_AFTER_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = true, .error_message_ = "Invalid retry.respect_retry_after"};
    const ParserOptions<int64_t> MAX_REDIRECTS_PARSER_OPTIONS = {.is_required_ = false,
                                                                 .allowed_values_ = {},
                                                                 .fallback_value_ = static_cast<int64_t>(policies::DEFAULT_MAX_REDIRECTS),
                                                                 .error_message_ = "Invalid redirect.max_redirects"};
    const ParserOptions<int64_t> CONNECT_TIMEOUT_MS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 10'000, .error_message_ = "Invalid transport.connect_timeout_ms"};
    const ParserOptions<int64_t> TIMEOUT_MS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 30'000, .error_message_ = "Invalid transport.timeout_ms"};
    const ParserOptions<std::string_view> USER_AGENT_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "conduit/1.0", .error_message_ = "Invalid transport.user_agent"};
    const ParserOptions<bool> FOLLOW_REDIRECTS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = false, .error_message_ = "Invalid transport.follow_redirects"};
    const ParserOptions<bool> VERIFY_TLS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = true, .error_message_ = "Invalid transport.verify_tls"};
    const ParserOptions<int64_t> MAX_CONNECTIONS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 4, .error_message_ = "Invalid transport.max_connections"};
    const ParserOptions<std::string_view> LEVEL_PARSER_OPTIONS = {.is_required_ = false,
                                                                  .allowed_values_ = {"trace", "debug", "info", "warn", "error", "critical", "off"},
                                                                  .fallback_value_ = "info",
                                                                  .error_message_ = "Invalid logging.level"};
    const ParserOptions<std::string_view> ALLOWED_HEADER_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid logging.allowed_headers"};
    const ParserOptions<int64_t> MAX_WORKERS_PARSER_OPTIONS = {.is_required_ = false,
                                                               .allowed_values_ = {},
                                                               .fallback_value_ = static_cast<int64_t>(constants::DEFAULT_MULTIPART_WORKERS),
                                                               .error_message_ = "Invalid multipart.max_workers"};
    const ParserOptions<std::string_view> HEADER_VALUE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid headers value"};

    // Everything a default pipeline needs. Every JSON field is optional.
    struct PipelineConfig {
        bool retry_enabled_ = true;
        policies::RetryOptions retry_;

        bool redirect_enabled_ = true;
        policies::RedirectOptions redirect_;

        transport::CurlTransportOptions transport_;

        std::string log_level_ = "info";
        // Unset keeps the logging policy's own allow list.
        std::optional<std::set<std::string>> allowed_headers_;

        size_t multipart_max_workers_ = constants::DEFAULT_MULTIPART_WORKERS;

        model::Headers headers_;

        // Throws std::runtime_error naming the offending field.
        [[nodiscard]] static PipelineConfig load_from_file(const std::filesystem::path& path);
        [[nodiscard]] static PipelineConfig parse_string(std::string_view json);

        void parse_json(simdjson::ondemand::document& doc);
    };

}  // namespace conduit::config

#endif
