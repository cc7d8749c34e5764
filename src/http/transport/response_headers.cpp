#include "response_headers.hpp"

#include "../../utils/string_utils.hpp"

namespace conduit::transport {
    void ResponseHeaders::feed(std::string_view line) {
        if (auto status_line = string_utils::split_status_line(line)) {
            status_ = status_line->first;
            reason_ = std::move(status_line->second);
            headers_.clear();
            return;
        }

        if (auto header = string_utils::split_header_line(line)) {
            auto [it, inserted] = headers_.emplace(header->first, header->second);
            if (!inserted) {
                it->second += ", " + header->second;
            }
        }
    }
}  // namespace conduit::transport
