#include "sensitive_header_cleanup_policy.hpp"

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"

namespace conduit::policies {
    SensitiveHeaderCleanupPolicy::SensitiveHeaderCleanupPolicy(std::vector<std::string> blocked_headers, bool disabled)
        : blocked_headers_(std::move(blocked_headers)), disabled_(disabled) {}

    void SensitiveHeaderCleanupPolicy::on_request(pipeline::PipelineRequest& request) {
        auto flag = model::pop_option(request.context_->options(), constants::INSECURE_DOMAIN_CHANGE);
        if (disabled_ || !flag) {
            return;
        }

        const bool* changed = std::get_if<bool>(&*flag);
        if (changed == nullptr || !*changed) {
            return;
        }

        for (const auto& header : blocked_headers_) {
            if (request.http_request_.headers_.erase(header) > 0) {
                logging::logger()->debug("Removed {} header after cross-origin redirect", header);
            }
        }
    }
}  // namespace conduit::policies
