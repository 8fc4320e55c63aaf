#pragma once

#include "types/FileTask.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace hl::hub {

inline constexpr const char* DEFAULT_REVISION = "main";

struct RepoRef {
    std::string repo_id;                  // "namespace/name"
    std::string repo_type = "model";      // model | dataset | space
    std::string revision = DEFAULT_REVISION;
};

[[nodiscard]] bool isValidRepoType(const std::string& repoType);

// "" for models, "datasets/" and "spaces/" otherwise.
[[nodiscard]] std::string repoUrlPrefix(const std::string& repoType);

struct UploadInfo {
    std::string path_in_repo;
    uint64_t size{};
    std::string sha256;
    std::string sample;                   // first 512 bytes, raw
};

struct UploadModes {
    std::unordered_map<std::string, types::UploadMode> modes;
    std::unordered_set<std::string> ignored;
};

struct LargeFile {
    std::string path_in_repo;
    std::filesystem::path local_path;
    std::string sha256;
    uint64_t size{};
};

struct CommitAddition {
    std::string path_in_repo;
    std::filesystem::path local_path;
    std::string sha256;
    uint64_t size{};
    types::UploadMode mode = types::UploadMode::Regular;
};

class HubError : public std::runtime_error {
public:
    HubError(const std::string& what, const long status)
        : std::runtime_error(what), status_(status) {}

    [[nodiscard]] long status() const { return status_; }

private:
    long status_;
};

}
