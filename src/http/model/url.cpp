#include "url.hpp"

#include "../../utils/string_utils.hpp"

namespace conduit::model {
    namespace {
        std::string default_port(const std::string& scheme) {
            if (scheme == "https") {
                return "443";
            }
            if (scheme == "http") {
                return "80";
            }
            return "";
        }
    }  // namespace

    std::string Url::origin() const {
        std::string out = scheme_ + "://" + host_;
        if (!port_.empty()) {
            out += ":" + port_;
        }
        return out;
    }

    std::string Url::str() const { return origin() + path_and_query_; }

    std::optional<Url> parse_url(std::string_view url) {
        const auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::nullopt;
        }

        Url out;
        out.scheme_ = string_utils::to_lower(std::string(url.substr(0, scheme_end)));

        std::string_view rest = url.substr(scheme_end + 3);
        const auto path_start = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, path_start);
        if (path_start != std::string_view::npos) {
            std::string_view path = rest.substr(path_start);
            const auto fragment = path.find('#');
            path = path.substr(0, fragment);
            out.path_and_query_ = path.empty() || path.front() != '/' ? "/" + std::string(path) : std::string(path);
        }

        const auto at = authority.rfind('@');
        if (at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }

        const auto colon = authority.rfind(':');
        const auto bracket = authority.rfind(']');
        if (colon != std::string_view::npos && (bracket == std::string_view::npos || colon > bracket)) {
            out.port_ = std::string(authority.substr(colon + 1));
            authority = authority.substr(0, colon);
        }
        if (authority.empty()) {
            return std::nullopt;
        }
        out.host_ = string_utils::to_lower(std::string(authority));
        return out;
    }

    std::string resolve_url(std::string_view base, std::string_view location) {
        if (parse_url(location)) {
            return std::string(location);
        }

        auto parsed_base = parse_url(base);
        if (!parsed_base) {
            return std::string(location);
        }

        if (location.substr(0, 2) == "//") {
            return parsed_base->scheme_ + ":" + std::string(location);
        }

        if (!location.empty() && location.front() == '/') {
            parsed_base->path_and_query_ = std::string(location);
            return parsed_base->str();
        }

        std::string directory = parsed_base->path_and_query_.substr(0, parsed_base->path_and_query_.find('?'));
        directory = directory.substr(0, directory.rfind('/') + 1);
        parsed_base->path_and_query_ = directory + std::string(location);
        return parsed_base->str();
    }

    bool same_origin(std::string_view a, std::string_view b) {
        auto url_a = parse_url(a);
        auto url_b = parse_url(b);
        if (!url_a || !url_b) {
            return false;
        }

        const std::string port_a = url_a->port_.empty() ? default_port(url_a->scheme_) : url_a->port_;
        const std::string port_b = url_b->port_.empty() ? default_port(url_b->scheme_) : url_b->port_;
        return url_a->scheme_ == url_b->scheme_ && url_a->host_ == url_b->host_ && port_a == port_b;
    }

    std::string redact_query(std::string_view url) {
        const auto query = url.find('?');
        if (query == std::string_view::npos) {
            return std::string(url);
        }

        std::string out(url.substr(0, query + 1));
        std::string_view params = url.substr(query + 1);
        bool first = true;
        while (!params.empty()) {
            const auto amp = params.find('&');
            std::string_view param = params.substr(0, amp);
            const auto eq = param.find('=');
            if (!first) {
                out += '&';
            }
            out += std::string(param.substr(0, eq));
            if (eq != std::string_view::npos) {
                out += "=REDACTED";
            }
            first = false;
            if (amp == std::string_view::npos) {
                break;
            }
            params = params.substr(amp + 1);
        }
        return out;
    }
}  // namespace conduit::model
