#pragma once

#include <string>
#include <vector>

namespace hl::util {

// Always excluded from uploads: VCS internals and our own sidecar/log directory.
inline const std::vector<std::string> DEFAULT_IGNORE_PATTERNS = {
    ".git",
    ".git/*",
    "*/.git",
    "**/.git/**",
    ".cache/huggingface",
    ".cache/huggingface/*",
    "*/.cache/huggingface",
    "**/.cache/huggingface/**",
};

// fnmatch(3) semantics without FNM_PATHNAME: '*' also crosses '/'.
// A pattern ending with '/' matches everything below that directory.
[[nodiscard]] bool matchesPattern(const std::string& path, std::string pattern);
[[nodiscard]] bool matchesAny(const std::string& path, const std::vector<std::string>& patterns);

class PathFilter {
public:
    PathFilter(std::vector<std::string> allow, std::vector<std::string> ignore, bool withDefaults = true);

    [[nodiscard]] bool accepts(const std::string& relPath) const;

    [[nodiscard]] const std::vector<std::string>& allowPatterns() const { return allow_; }
    [[nodiscard]] const std::vector<std::string>& ignorePatterns() const { return ignore_; }

private:
    std::vector<std::string> allow_;
    std::vector<std::string> ignore_;
};

}
