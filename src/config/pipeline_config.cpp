#include "pipeline_config.hpp"

#include <simdjson.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "../utils/string_utils.hpp"

namespace conduit::config {
    namespace parser {
        const int64_t MIN_STATUS_CODE = 100;
        const int64_t MAX_STATUS_CODE = 599;

        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, const ParserOptions<T>& options) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
                return options.fallback_value_;
            }

            if (result.error() != simdjson::error_code::SUCCESS) {
                throw std::runtime_error(options.error_message_);
            }

            auto value = result.value();

            if (options.allowed_values_.empty()) {
                return T(value);
            }

            if (!std::ranges::any_of(options.allowed_values_, [value](const T& allowed_value) { return allowed_value == value; })) {
                throw std::runtime_error(options.error_message_);
            }

            return T(value);
        }

        static int64_t parse_at_least(simdjson::simdjson_result<int64_t> result, const ParserOptions<int64_t>& options, int64_t minimum) {
            const int64_t value = parse_value(std::move(result), options);
            if (value < minimum) {
                throw std::runtime_error(options.error_message_ + ": must be at least " + std::to_string(minimum));
            }
            return value;
        }

        // Binds out to the named sub-object. Returns false when the section is absent.
        static bool find_section(simdjson::ondemand::object& root, std::string_view name, simdjson::ondemand::object& out) {
            auto field = root.find_field_unordered(name);
            if (field.error() == simdjson::error_code::NO_SUCH_FIELD) {
                return false;
            }
            if (field.get_object().get(out) != simdjson::error_code::SUCCESS) {
                throw std::runtime_error("Invalid " + std::string(name) + " section: expected an object");
            }
            return true;
        }

        static bool find_array(simdjson::ondemand::object& section, std::string_view name, simdjson::ondemand::array& out, const std::string& error_message) {
            auto field = section.find_field_unordered(name);
            if (field.error() == simdjson::error_code::NO_SUCH_FIELD) {
                return false;
            }
            if (field.get_array().get(out) != simdjson::error_code::SUCCESS) {
                throw std::runtime_error(error_message);
            }
            return true;
        }
    }  // namespace parser

    PipelineConfig PipelineConfig::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("Config file not found: " + path.string());
        }

        simdjson::padded_string json;
        if (simdjson::padded_string::load(path.string()).get(json) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Failed to read config file: " + path.string());
        }

        simdjson::ondemand::parser json_parser;
        simdjson::ondemand::document doc;
        if (json_parser.iterate(json).get(doc) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Invalid config JSON in " + path.string());
        }

        PipelineConfig config;
        config.parse_json(doc);
        return config;
    }

    PipelineConfig PipelineConfig::parse_string(std::string_view json) {
        simdjson::padded_string padded(json);
        simdjson::ondemand::parser json_parser;
        simdjson::ondemand::document doc;
        if (json_parser.iterate(padded).get(doc) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Invalid config JSON");
        }

        PipelineConfig config;
        config.parse_json(doc);
        return config;
    }

    void PipelineConfig::parse_json(simdjson::ondemand::document& doc) {
        simdjson::ondemand::object root;
        if (doc.get_object().get(root) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Invalid config: expected a JSON object");
        }

        simdjson::ondemand::object retry;
        if (parser::find_section(root, "retry", retry)) {
            retry_enabled_ = parser::parse_value(retry["enabled"].get_bool(), RETRY_ENABLED_PARSER_OPTIONS);
            retry_.max_tries_ = static_cast<size_t>(parser::parse_at_least(retry["max_tries"].get_int64(), MAX_TRIES_PARSER_OPTIONS, 1));
            retry_.base_delay_ = std::chrono::milliseconds{parser::parse_at_least(retry["base_delay_ms"].get_int64(), BASE_DELAY_MS_PARSER_OPTIONS, 0)};
            retry_.max_delay_ = std::chrono::milliseconds{parser::parse_at_least(retry["max_delay_ms"].get_int64(), MAX_DELAY_MS_PARSER_OPTIONS, 0)};
            if (retry_.base_delay_ > retry_.max_delay_) {
                throw std::runtime_error("Invalid retry.base_delay_ms: exceeds retry.max_delay_ms");
            }
            retry_.respect_retry_after_ = parser::parse_value(retry["respect_retry_after"].get_bool(), RESPECT_RETRY_AFTER_PARSER_OPTIONS);

            simdjson::ondemand::array codes;
            if (parser::find_array(retry, "status_codes", codes, STATUS_CODE_PARSER_OPTIONS.error_message_)) {
                retry_.retry_on_status_codes_.clear();
                for (auto element : codes) {
                    const int64_t code = parser::parse_value(element.get_int64(), STATUS_CODE_PARSER_OPTIONS);
                    if (code < parser::MIN_STATUS_CODE || code > parser::MAX_STATUS_CODE) {
                        throw std::runtime_error(STATUS_CODE_PARSER_OPTIONS.error_message_ + ": " + std::to_string(code));
                    }
                    retry_.retry_on_status_codes_.push_back(static_cast<long>(code));
                }
            }
        }

        simdjson::ondemand::object redirect;
        if (parser::find_section(root, "redirect", redirect)) {
            redirect_enabled_ = parser::parse_value(redirect["enabled"].get_bool(), REDIRECT_ENABLED_PARSER_OPTIONS);
            redirect_.max_redirects_ = static_cast<size_t>(parser::parse_at_least(redirect["max_redirects"].get_int64(), MAX_REDIRECTS_PARSER_OPTIONS, 0));
        }

        simdjson::ondemand::object transport;
        if (parser::find_section(root, "transport", transport)) {
            transport_.connect_timeout_ms_ =
                static_cast<long>(parser::parse_at_least(transport["connect_timeout_ms"].get_int64(), CONNECT_TIMEOUT_MS_PARSER_OPTIONS, 0));
            transport_.timeout_ms_ = static_cast<long>(parser::parse_at_least(transport["timeout_ms"].get_int64(), TIMEOUT_MS_PARSER_OPTIONS, 0));
            transport_.user_agent_ = std::string(parser::parse_value(transport["user_agent"].get_string(), USER_AGENT_PARSER_OPTIONS));
            transport_.follow_redirects_ = parser::parse_value(transport["follow_redirects"].get_bool(), FOLLOW_REDIRECTS_PARSER_OPTIONS);
            transport_.verify_tls_ = parser::parse_value(transport["verify_tls"].get_bool(), VERIFY_TLS_PARSER_OPTIONS);
            transport_.max_connections_ =
                static_cast<size_t>(parser::parse_at_least(transport["max_connections"].get_int64(), MAX_CONNECTIONS_PARSER_OPTIONS, 1));
        }

        simdjson::ondemand::object logging;
        if (parser::find_section(root, "logging", logging)) {
            log_level_ = std::string(parser::parse_value(logging["level"].get_string(), LEVEL_PARSER_OPTIONS));

            simdjson::ondemand::array allowed;
            if (parser::find_array(logging, "allowed_headers", allowed, ALLOWED_HEADER_PARSER_OPTIONS.error_message_)) {
                std::set<std::string> names;
                for (auto element : allowed) {
                    names.insert(string_utils::to_lower(std::string(parser::parse_value(element.get_string(), ALLOWED_HEADER_PARSER_OPTIONS))));
                }
                allowed_headers_ = std::move(names);
            }
        }

        simdjson::ondemand::object multipart;
        if (parser::find_section(root, "multipart", multipart)) {
            multipart_max_workers_ = static_cast<size_t>(parser::parse_at_least(multipart["max_workers"].get_int64(), MAX_WORKERS_PARSER_OPTIONS, 1));
        }

        simdjson::ondemand::object headers;
        if (parser::find_section(root, "headers", headers)) {
            for (auto field : headers) {
                std::string_view key;
                if (field.unescaped_key().get(key) != simdjson::error_code::SUCCESS || key.empty()) {
                    throw std::runtime_error("Invalid headers name");
                }
                std::string name(key);
                headers_[name] = std::string(parser::parse_value(field.value().get_string(), HEADER_VALUE_PARSER_OPTIONS));
            }
        }
    }
}  // namespace conduit::config
