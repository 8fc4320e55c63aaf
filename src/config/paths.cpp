#include "config/paths.hpp"

#include <cstdlib>

namespace hl::paths {

namespace {
std::filesystem::path testLogPath_;
}

std::filesystem::path getConfigPath() {
    if (const char* explicitPath = std::getenv("HUBLOAD_CONFIG"); explicitPath && *explicitPath)
        return explicitPath;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "hubload" / "config.yaml";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "hubload" / "config.yaml";
    return {};
}

std::filesystem::path getCacheRoot(const std::filesystem::path& folder) {
    return folder / CACHE_SUBDIR;
}

std::filesystem::path getUploadMetadataRoot(const std::filesystem::path& folder) {
    return getCacheRoot(folder) / "upload";
}

std::filesystem::path getLogDir(const std::filesystem::path& folder) {
    if (!testLogPath_.empty()) return testLogPath_;
    return getCacheRoot(folder) / "logs";
}

void setLogPathForTesting(const std::filesystem::path& dir) {
    testLogPath_ = dir;
}

}
