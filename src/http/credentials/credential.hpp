#ifndef CONDUIT_CREDENTIAL_HPP
#define CONDUIT_CREDENTIAL_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace conduit::credentials {
    struct AccessToken {
        std::string token_;
        std::chrono::system_clock::time_point expires_on_;
    };

    struct TokenRequestOptions {
        bool enable_cae_ = false;
        std::optional<std::string> claims_;
    };

    // Token acquisition lives behind this interface; the pipeline only consumes tokens.
    class ITokenCredential {
       public:
        ITokenCredential() = default;
        virtual ~ITokenCredential() = default;
        ITokenCredential(const ITokenCredential&) = delete;
        ITokenCredential& operator=(const ITokenCredential&) = delete;
        ITokenCredential(ITokenCredential&&) = delete;
        ITokenCredential& operator=(ITokenCredential&&) = delete;

        virtual AccessToken get_token(const std::vector<std::string>& scopes, const TokenRequestOptions& options) = 0;
    };

    // Hands out a fixed token, e.g. one supplied through the environment.
    class StaticTokenCredential final : public ITokenCredential {
       public:
        explicit StaticTokenCredential(std::string token,
                                       std::chrono::system_clock::time_point expires_on = std::chrono::system_clock::time_point::max());

        AccessToken get_token(const std::vector<std::string>& scopes, const TokenRequestOptions& options) override;

       private:
        AccessToken token_;
    };
}  // namespace conduit::credentials

#endif
