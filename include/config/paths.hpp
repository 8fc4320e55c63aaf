#pragma once

#include <filesystem>
#include <string>

namespace hl::paths {

// Hidden directory kept inside the uploaded folder; excluded from uploads.
inline constexpr const char* CACHE_SUBDIR = ".cache/huggingface";

std::filesystem::path getConfigPath();

std::filesystem::path getCacheRoot(const std::filesystem::path& folder);
std::filesystem::path getUploadMetadataRoot(const std::filesystem::path& folder);
std::filesystem::path getLogDir(const std::filesystem::path& folder);

void setLogPathForTesting(const std::filesystem::path& dir);

}
