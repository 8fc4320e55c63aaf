#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace hl::config {

namespace {

bool envFlag(const char* value) {
    std::string v(value);
    std::ranges::transform(v, v.begin(), [](const unsigned char c) { return std::tolower(c); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) {
        cfg.applyEnvironment();
        return cfg;
    }

    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["hub"]) YAML::convert<HubConfig>::decode(node, cfg.hub);
    if (auto node = root["upload"]) YAML::convert<UploadConfig>::decode(node, cfg.upload);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    cfg.applyEnvironment();
    return cfg;
}

void Config::applyEnvironment() {
    if (const char* token = std::getenv("HF_TOKEN"); token && *token) hub.token = token;
    if (const char* endpoint = std::getenv("HF_ENDPOINT"); endpoint && *endpoint) hub.endpoint = endpoint;
    if (const char* accel = std::getenv("HF_HUB_ENABLE_HF_TRANSFER")) upload.transfer_acceleration = envFlag(accel);

    while (!hub.endpoint.empty() && hub.endpoint.back() == '/') hub.endpoint.pop_back();
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"hub", c.hub},
        {"upload", c.upload},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const HubConfig& c) {
    // token deliberately omitted
    j = {
        {"endpoint", c.endpoint},
        {"has_token", !c.token.empty()},
        {"connect_timeout_seconds", c.connect_timeout_seconds},
        {"low_speed_timeout_seconds", c.low_speed_timeout_seconds},
        {"commit_message", c.commit_message}
    };
}

void to_json(nlohmann::json& j, const UploadConfig& c) {
    j = {
        {"num_workers", c.num_workers},
        {"wait_interval_seconds", c.wait_interval.count()},
        {"report_interval_seconds", c.report_interval.count()},
        {"print_report", c.print_report},
        {"commit_batch_size", c.commit_batch_size},
        {"commit_stale_after_seconds", c.commit_stale_after.count()},
        {"classify_batch_size", c.classify_batch_size},
        {"classify_eager_threshold", c.classify_eager_threshold},
        {"hash_chunk_size_bytes", c.hash_chunk_size_bytes},
        {"transfer_acceleration", c.transfer_acceleration}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.console_log_level))},
        {"file_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.file_log_level))},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    const auto str = [](const spdlog::level::level_enum lvl) {
        return YAML::to_std_string(spdlog::level::to_string_view(lvl));
    };

    j = {
        {"hubload", str(c.hubload)},
        {"upload", str(c.upload)},
        {"hash", str(c.hash)},
        {"hub", str(c.hub)},
        {"metadata", str(c.metadata)},
        {"cli", str(c.cli)}
    };
}

} // namespace hl::config
