#ifndef CONDUIT_SENSITIVE_HEADER_CLEANUP_POLICY_HPP
#define CONDUIT_SENSITIVE_HEADER_CLEANUP_POLICY_HPP

#include <string>
#include <vector>

#include "policy.hpp"

namespace conduit::policies {
    // Strips credentials from a request that a redirect sent to another origin.
    // Consumes the "insecure_domain_change" option.
    class SensitiveHeaderCleanupPolicy final : public SansIOPolicy {
       public:
        explicit SensitiveHeaderCleanupPolicy(std::vector<std::string> blocked_headers = {"Authorization", "x-ms-authorization-auxiliary"},
                                              bool disabled = false);

        void on_request(pipeline::PipelineRequest& request) override;

       private:
        std::vector<std::string> blocked_headers_;
        bool disabled_;
    };
}  // namespace conduit::policies

#endif
