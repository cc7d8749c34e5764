#include "credential.hpp"

namespace conduit::credentials {
    StaticTokenCredential::StaticTokenCredential(std::string token, std::chrono::system_clock::time_point expires_on)
        : token_{.token_ = std::move(token), .expires_on_ = expires_on} {}

    AccessToken StaticTokenCredential::get_token(const std::vector<std::string>& /*scopes*/, const TokenRequestOptions& /*options*/) { return token_; }
}  // namespace conduit::credentials
