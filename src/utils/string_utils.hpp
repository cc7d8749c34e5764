#ifndef CONDUIT_STRING_UTILS_HPP
#define CONDUIT_STRING_UTILS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace conduit::string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string to_lower(std::string s);

    std::string trim(std::string s);

    // Splits a raw "Name: value\r\n" header line. Returns nullopt for status lines and blank lines.
    std::optional<std::pair<std::string, std::string>> split_header_line(std::string_view line);

    // Splits "HTTP/1.1 404 Not Found\r\n" into status and reason. The reason may be empty (HTTP/2).
    std::optional<std::pair<long, std::string>> split_status_line(std::string_view line);

    std::optional<long> parse_long(std::string_view s);

    std::string random_hex(size_t n_bytes);

    std::string uuid4();
}  // namespace conduit::string_utils

#endif
