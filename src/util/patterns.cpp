#include "util/patterns.hpp"

#include <algorithm>
#include <fnmatch.h>

namespace hl::util {

bool matchesPattern(const std::string& path, std::string pattern) {
    if (!pattern.empty() && pattern.back() == '/') pattern += '*';
    return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
}

bool matchesAny(const std::string& path, const std::vector<std::string>& patterns) {
    return std::ranges::any_of(patterns, [&path](const auto& p) { return matchesPattern(path, p); });
}

PathFilter::PathFilter(std::vector<std::string> allow, std::vector<std::string> ignore, const bool withDefaults)
    : allow_(std::move(allow)), ignore_(std::move(ignore)) {
    if (withDefaults) ignore_.insert(ignore_.end(), DEFAULT_IGNORE_PATTERNS.begin(), DEFAULT_IGNORE_PATTERNS.end());
}

bool PathFilter::accepts(const std::string& relPath) const {
    if (!allow_.empty() && !matchesAny(relPath, allow_)) return false;
    return !matchesAny(relPath, ignore_);
}

}
