#ifndef CONDUIT_MODEL_HPP
#define CONDUIT_MODEL_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "options.hpp"

namespace conduit::policies {
    class SansIOPolicy;
}  // namespace conduit::policies

namespace conduit::model {
    struct CaseInsensitiveLess {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const;
    };

    using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

    struct Request;

    // A batch of sub-requests sent as one multipart/mixed body.
    struct MultipartMixed {
        std::vector<Request> requests_;
        std::vector<std::shared_ptr<policies::SansIOPolicy>> policies_;
        std::string boundary_;
        Options options_;
    };

    struct Request {
        std::string method_ = "GET";
        std::string url_;
        std::string body_;

        Headers headers_;
        std::optional<MultipartMixed> multipart_mixed_;
    };

    struct Response {
        long status_ = 0;

        std::string reason_;
        std::string body_;
        std::string effective_url_;

        Headers headers_;

        [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    };
}  // namespace conduit::model

#endif
