#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <random>
#include <string>

#include "constants.hpp"

namespace conduit::string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::optional<std::pair<std::string, std::string>> split_header_line(std::string_view line) {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::nullopt;
        }
        std::string name = trim(std::string(line.substr(0, colon)));
        if (name.empty() || name.find(' ') != std::string::npos) {
            return std::nullopt;
        }
        return std::make_pair(std::move(name), trim(std::string(line.substr(colon + 1))));
    }

    std::optional<std::pair<long, std::string>> split_status_line(std::string_view line) {
        if (!line.starts_with("HTTP/")) {
            return std::nullopt;
        }
        const auto code_start = line.find(' ');
        if (code_start == std::string_view::npos) {
            return std::nullopt;
        }
        const auto code_end = line.find(' ', code_start + 1);
        auto status = parse_long(line.substr(code_start + 1, code_end == std::string_view::npos ? std::string_view::npos : code_end - code_start - 1));
        if (!status) {
            return std::nullopt;
        }
        std::string reason = code_end == std::string_view::npos ? std::string{} : trim(std::string(line.substr(code_end + 1)));
        return std::make_pair(*status, std::move(reason));
    }

    std::optional<long> parse_long(std::string_view s) {
        std::string tmp = trim(std::string(s));
        if (tmp.empty()) {
            return std::nullopt;
        }
        char *end = nullptr;
        const long v = std::strtol(tmp.c_str(), &end, constants::BASE_10);
        if (end == nullptr || *end != '\0') {
            return std::nullopt;
        }
        return v;
    }

    std::string random_hex(size_t n_bytes) {
        static constexpr const char *HEX = "0123456789abcdef";
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<int> d(0, constants::BASE_16 - 1);

        std::string out;
        out.reserve(n_bytes * 2);
        for (size_t i = 0; i < n_bytes * 2; ++i) {
            out.push_back(HEX[d(rng)]);
        }
        return out;
    }

    std::string uuid4() {
        std::string hex = random_hex(16);
        hex[12] = '4';
        hex[16] = "89ab"[std::strtol(hex.substr(16, 1).c_str(), nullptr, constants::BASE_16) & 0x3];
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
    }
}  // namespace conduit::string_utils
