#include "multipart.hpp"

#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"
#include "url.hpp"

namespace conduit::model {
    namespace {
        constexpr const char* CRLF = "\r\n";

        std::string multipart_content_type(const std::string& boundary) { return "multipart/mixed; boundary=" + boundary; }
    }  // namespace

    void set_multipart_mixed(Request& request, std::vector<Request> requests, std::vector<std::shared_ptr<policies::SansIOPolicy>> policies,
                             std::string boundary, Options options) {
        request.multipart_mixed_ = MultipartMixed{
            .requests_ = std::move(requests),
            .policies_ = std::move(policies),
            .boundary_ = std::move(boundary),
            .options_ = std::move(options),
        };
    }

    std::string serialize_request(const Request& request) {
        std::string target = request.url_;
        if (auto url = parse_url(request.url_)) {
            target = url->path_and_query_;
        }

        std::string out = request.method_ + " " + target + " HTTP/1.1" + CRLF;
        for (const auto& [name, value] : request.headers_) {
            out += name + ": " + value + CRLF;
        }
        out += CRLF;
        out += request.body_;
        return out;
    }

    int prepare_multipart_body(Request& request, int content_index) {
        if (!request.multipart_mixed_) {
            return content_index;
        }

        MultipartMixed& bundle = *request.multipart_mixed_;
        if (bundle.boundary_.empty()) {
            bundle.boundary_ = std::string(BATCH_BOUNDARY_PREFIX) + string_utils::uuid4();
        }

        std::string body;
        for (auto& part : bundle.requests_) {
            body += "--" + bundle.boundary_ + CRLF;

            if (part.multipart_mixed_) {
                if (part.multipart_mixed_->boundary_.empty()) {
                    part.multipart_mixed_->boundary_ = std::string(CHANGESET_BOUNDARY_PREFIX) + string_utils::uuid4();
                }
                content_index = prepare_multipart_body(part, content_index);
                body += "Content-Type: " + multipart_content_type(part.multipart_mixed_->boundary_) + CRLF;
                body += CRLF;
                body += part.body_;
            } else {
                body += std::string("Content-Type: application/http") + CRLF;
                body += std::string("Content-Transfer-Encoding: binary") + CRLF;
                body += "Content-ID: " + std::to_string(content_index) + CRLF;
                body += CRLF;
                body += serialize_request(part);
                ++content_index;
            }
            body += CRLF;
        }
        body += "--" + bundle.boundary_ + "--" + CRLF;

        request.body_ = std::move(body);
        request.headers_["Content-Type"] = multipart_content_type(bundle.boundary_);
        return content_index;
    }
}  // namespace conduit::model
