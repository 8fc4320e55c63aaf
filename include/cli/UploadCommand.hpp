#pragma once

#include "cli/types.hpp"
#include "upload/LargeFolderUpload.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace hl::cli {

inline constexpr const char* UPLOAD_COMMAND = "upload-large-folder";

struct UploadInvocation {
    upload::UploadOptions options;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> token;
};

struct ParseResult {
    bool ok = false;
    bool help = false;
    UploadInvocation invocation;
    std::string error;
};

[[nodiscard]] ParseResult parseUploadCommand(const CommandCall& call);
[[nodiscard]] ParseResult parseArgs(int argc, const char* const* argv);
[[nodiscard]] ParseResult parseArgs(const std::vector<std::string>& args);

[[nodiscard]] std::string usageText();

// Printed once before an upload starts. ANSI yellow when color is set.
[[nodiscard]] std::string uploadWarning(const std::filesystem::path& folder, bool color);

}
