#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace hl::types {

enum class UploadMode { Regular, Lfs };

struct FileTask {
    std::string path_in_repo;              // forward-slash separated, relative to repo root
    std::filesystem::path local_path;      // absolute
    uint64_t size{};

    std::optional<std::string> sha256{};   // lowercase hex
    std::optional<UploadMode> upload_mode{};
    bool should_ignore = false;
    bool is_uploaded = false;
    bool is_committed = false;

    [[nodiscard]] bool isTerminal() const { return is_committed || should_ignore; }
    [[nodiscard]] bool isLfs() const { return upload_mode == UploadMode::Lfs; }
};

[[nodiscard]] std::string to_string(UploadMode mode);
[[nodiscard]] std::optional<UploadMode> parseUploadMode(const std::string& str);

void to_json(nlohmann::json& j, const UploadMode& m);
void from_json(const nlohmann::json& j, UploadMode& m);

}
