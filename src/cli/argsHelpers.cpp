#include "cli/argsHelpers.hpp"

#include <algorithm>
#include <limits>

namespace hl::cli {

CommandResult invalid(std::string msg) { return {1, "", std::move(msg)}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

std::vector<std::string> optVals(const CommandCall& c, const std::string& key) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options) if (k == key && v) out.push_back(*v);
    return out;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& k) { return hasFlag(c, k); });
}

bool hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::optional<unsigned int> parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

}
