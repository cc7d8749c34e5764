#ifndef CONDUIT_URL_HPP
#define CONDUIT_URL_HPP

#include <optional>
#include <string>
#include <string_view>

namespace conduit::model {
    struct Url {
        std::string scheme_;
        std::string host_;
        std::string port_;
        std::string path_and_query_ = "/";

        [[nodiscard]] std::string origin() const;
        [[nodiscard]] std::string str() const;
    };

    std::optional<Url> parse_url(std::string_view url);

    // Resolves a Location header value (absolute, scheme-relative, absolute-path or relative) against base.
    std::string resolve_url(std::string_view base, std::string_view location);

    bool same_origin(std::string_view a, std::string_view b);

    std::string redact_query(std::string_view url);
}  // namespace conduit::model

#endif
