#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace hl::config {

constexpr static uintmax_t DEFAULT_HASH_CHUNK_SIZE = 1024 * 1024; // 1 MiB

struct HubConfig {
    std::string endpoint = "https://huggingface.co";
    std::string token;
    unsigned int connect_timeout_seconds = 10;
    unsigned int low_speed_timeout_seconds = 60;
    std::string commit_message = "Add files using hubload";
};

struct UploadConfig {
    unsigned int num_workers = 0; // 0 = cpu count - 2, at least 2
    std::chrono::seconds wait_interval = std::chrono::seconds(10);
    std::chrono::seconds report_interval = std::chrono::seconds(60);
    bool print_report = true;
    unsigned int commit_batch_size = 25;
    std::chrono::seconds commit_stale_after = std::chrono::minutes(5);
    unsigned int classify_batch_size = 50;
    unsigned int classify_eager_threshold = 10;
    uintmax_t hash_chunk_size_bytes = DEFAULT_HASH_CHUNK_SIZE;
    bool transfer_acceleration = false; // keeps pre-uploads strictly single-flight
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum hubload  = spdlog::level::info;  // Startup, repo creation, final report
    spdlog::level::level_enum upload   = spdlog::level::info;  // Stage failures and requeues
    spdlog::level::level_enum hash     = spdlog::level::warn;
    spdlog::level::level_enum hub      = spdlog::level::warn;  // Non-2xx replies, aborted transfers
    spdlog::level::level_enum metadata = spdlog::level::warn;  // Corrupt or stale sidecar records
    spdlog::level::level_enum cli      = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty = <folder>/.cache/huggingface/logs
    LogLevelsConfig levels;
};

struct Config {
    HubConfig hub;
    UploadConfig upload;
    LoggingConfig logging;

    void applyEnvironment();
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const HubConfig& c);
void to_json(nlohmann::json& j, const UploadConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace hl::config
