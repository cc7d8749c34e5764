#include "model.hpp"

#include <algorithm>
#include <cctype>

namespace conduit::model {
    bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
    }

    std::optional<std::string> Response::header(std::string_view name) const {
        auto it = headers_.find(name);
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}  // namespace conduit::model
