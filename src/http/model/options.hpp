#ifndef CONDUIT_OPTIONS_HPP
#define CONDUIT_OPTIONS_HPP

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace conduit::model {
    using StringMap = std::map<std::string, std::string>;
    using OptionValue = std::variant<bool, long long, double, std::string, StringMap>;

    // Per-call option bag threaded through the pipeline context.
    using Options = std::map<std::string, OptionValue>;

    template <typename T>
    std::optional<T> get_option(const Options& options, const std::string& key) {
        auto it = options.find(key);
        if (it == options.end()) {
            return std::nullopt;
        }
        if (const T* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    inline std::optional<OptionValue> pop_option(Options& options, const std::string& key) {
        auto node = options.extract(key);
        if (node.empty()) {
            return std::nullopt;
        }
        return std::move(node.mapped());
    }
}  // namespace conduit::model

#endif
