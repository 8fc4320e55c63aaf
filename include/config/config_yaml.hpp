#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace hl::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<HubConfig> {
    static Node encode(const HubConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["low_speed_timeout_seconds"] = rhs.low_speed_timeout_seconds;
        node["commit_message"] = rhs.commit_message;
        return node;
    }

    static bool decode(const Node& node, HubConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("https://huggingface.co");
        rhs.token = node["token"].as<std::string>("");
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(10);
        rhs.low_speed_timeout_seconds = node["low_speed_timeout_seconds"].as<unsigned int>(60);
        rhs.commit_message = node["commit_message"].as<std::string>("Add files using hubload");
        return true;
    }
};

template<>
struct convert<UploadConfig> {
    static Node encode(const UploadConfig& rhs) {
        Node node;
        node["num_workers"] = rhs.num_workers;
        node["wait_interval_seconds"] = rhs.wait_interval.count();
        node["report_interval_seconds"] = rhs.report_interval.count();
        node["print_report"] = rhs.print_report;
        node["commit_batch_size"] = rhs.commit_batch_size;
        node["commit_stale_after_seconds"] = rhs.commit_stale_after.count();
        node["classify_batch_size"] = rhs.classify_batch_size;
        node["classify_eager_threshold"] = rhs.classify_eager_threshold;
        node["hash_chunk_size_bytes"] = rhs.hash_chunk_size_bytes;
        node["transfer_acceleration"] = rhs.transfer_acceleration;
        return node;
    }

    static bool decode(const Node& node, UploadConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.num_workers = node["num_workers"].as<unsigned int>(0);
        rhs.wait_interval = std::chrono::seconds(node["wait_interval_seconds"].as<long>(10));
        rhs.report_interval = std::chrono::seconds(node["report_interval_seconds"].as<long>(60));
        rhs.print_report = node["print_report"].as<bool>(true);
        rhs.commit_batch_size = node["commit_batch_size"].as<unsigned int>(25);
        rhs.commit_stale_after = std::chrono::seconds(node["commit_stale_after_seconds"].as<long>(300));
        rhs.classify_batch_size = node["classify_batch_size"].as<unsigned int>(50);
        rhs.classify_eager_threshold = node["classify_eager_threshold"].as<unsigned int>(10);
        rhs.hash_chunk_size_bytes = node["hash_chunk_size_bytes"].as<uintmax_t>(DEFAULT_HASH_CHUNK_SIZE);
        rhs.transfer_acceleration = node["transfer_acceleration"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["hubload"]  = to_std_string(spdlog::level::to_string_view(rhs.hubload));
        node["upload"]   = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["hash"]     = to_std_string(spdlog::level::to_string_view(rhs.hash));
        node["hub"]      = to_std_string(spdlog::level::to_string_view(rhs.hub));
        node["metadata"] = to_std_string(spdlog::level::to_string_view(rhs.metadata));
        node["cli"]      = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.hubload = spdlog::level::from_str(node["hubload"].as<std::string>("info"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("info"));
        rhs.hash = spdlog::level::from_str(node["hash"].as<std::string>("warn"));
        rhs.hub = spdlog::level::from_str(node["hub"].as<std::string>("warn"));
        rhs.metadata = spdlog::level::from_str(node["metadata"].as<std::string>("warn"));
        rhs.cli = spdlog::level::from_str(node["cli"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
