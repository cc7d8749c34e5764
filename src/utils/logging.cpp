#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <stdexcept>

namespace conduit::logging {
    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag created;
        std::call_once(created, []() {
            if (spdlog::get(LOGGER_NAME) == nullptr) {
                spdlog::stderr_color_mt(LOGGER_NAME);
            }
        });
        return spdlog::get(LOGGER_NAME);
    }

    bool is_valid_level(const std::string& level) {
        return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
    }

    void set_level(const std::string& level) {
        if (!is_valid_level(level)) {
            throw std::invalid_argument("Invalid log level: " + level);
        }
        logger()->set_level(spdlog::level::from_str(level));
    }
}  // namespace conduit::logging
