#ifndef CONDUIT_LOGGING_HPP
#define CONDUIT_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace conduit::logging {
    inline constexpr const char* LOGGER_NAME = "conduit";

    // Process-wide "conduit" logger writing to stderr, created on first use.
    std::shared_ptr<spdlog::logger> logger();

    // Accepts trace, debug, info, warn, error, critical or off.
    void set_level(const std::string& level);

    [[nodiscard]] bool is_valid_level(const std::string& level);
}  // namespace conduit::logging

#endif
