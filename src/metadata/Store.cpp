#include "metadata/Store.hpp"
#include "metadata/FileLock.hpp"
#include "config/paths.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <nlohmann/json.hpp>

using namespace hl::metadata;
using namespace hl::types;
using namespace hl::logging;

namespace {

double nowSeconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

struct LocalStat {
    uint64_t size;
    double mtime;
};

LocalStat statLocal(const std::filesystem::path& p) {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0)
        throw std::filesystem::filesystem_error("stat failed", p, std::error_code(errno, std::generic_category()));
    return {static_cast<uint64_t>(st.st_size),
            static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9};
}

FileTask fromRecord(const nlohmann::json& j, FileTask task) {
    if (!j.is_object()) throw std::invalid_argument("metadata record is not an object");

    if (const auto& sha = j.at("sha256"); !sha.is_null()) task.sha256 = sha.get<std::string>();
    if (const auto& mode = j.at("upload_mode"); !mode.is_null()) task.upload_mode = mode.get<UploadMode>();
    task.should_ignore = j.at("should_ignore").get<bool>();
    task.is_uploaded = j.at("is_uploaded").get<bool>();
    task.is_committed = j.at("is_committed").get<bool>();
    return task;
}

nlohmann::json toRecord(const FileTask& task) {
    return {
        {"timestamp", nowSeconds()},
        {"size", task.size},
        {"sha256", task.sha256 ? nlohmann::json(*task.sha256) : nlohmann::json(nullptr)},
        {"upload_mode", task.upload_mode ? nlohmann::json(*task.upload_mode) : nlohmann::json(nullptr)},
        {"should_ignore", task.should_ignore},
        {"is_uploaded", task.is_uploaded},
        {"is_committed", task.is_committed}
    };
}

}

Store::Store(std::filesystem::path folder)
    : folder_(std::move(folder)), root_(paths::getUploadMetadataRoot(folder_)) {}

std::filesystem::path Store::localPath(const std::string& pathInRepo) const {
    return folder_ / pathInRepo;
}

std::filesystem::path Store::metadataPath(const std::string& pathInRepo) const {
    return root_ / (pathInRepo + ".metadata");
}

std::filesystem::path Store::lockPath(const std::string& pathInRepo) const {
    return root_ / (pathInRepo + ".lock");
}

void Store::ensureParentDir(const std::filesystem::path& p) const {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec && !std::filesystem::is_directory(p.parent_path()))
        throw std::filesystem::filesystem_error("Failed to create metadata directory", p.parent_path(), ec);
}

FileTask Store::load(const std::string& pathInRepo) const {
    FileTask fresh;
    fresh.path_in_repo = pathInRepo;
    fresh.local_path = localPath(pathInRepo);

    const auto local = statLocal(fresh.local_path);
    fresh.size = local.size;

    const auto metaPath = metadataPath(pathInRepo);
    ensureParentDir(metaPath);
    FileLock lock(lockPath(pathInRepo));

    if (!std::filesystem::exists(metaPath)) return fresh;

    double timestamp = 0;
    uint64_t recordedSize = 0;
    FileTask restored;

    try {
        std::ifstream in(metaPath);
        if (!in) throw std::runtime_error("cannot open for reading");
        const auto record = nlohmann::json::parse(in);

        timestamp = record.at("timestamp").get<double>();
        recordedSize = record.at("size").get<uint64_t>();
        restored = fromRecord(record, fresh);
    } catch (const std::exception& e) {
        LogRegistry::metadata()->warn("[Store] Invalid metadata file {}: {}. Removing it from disk and continuing.",
                                         metaPath.string(), e.what());
        std::error_code ec;
        std::filesystem::remove(metaPath, ec);
        if (ec) LogRegistry::metadata()->warn("[Store] Could not remove corrupted metadata file {}: {}",
                                              metaPath.string(), ec.message());
        return fresh;
    }

    if (recordedSize != local.size || local.mtime > timestamp) {
        LogRegistry::metadata()->info("[Store] Ignoring metadata for {}: file modified since metadata was saved",
                                      pathInRepo);
        return fresh;
    }

    return restored;
}

void Store::save(const FileTask& task) const {
    const auto metaPath = metadataPath(task.path_in_repo);
    ensureParentDir(metaPath);
    FileLock lock(lockPath(task.path_in_repo));

    auto tmpPath = metaPath;
    tmpPath += ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open metadata file for writing: " + tmpPath.string());
        out << toRecord(task).dump(4);
        out.flush();
        if (!out) throw std::runtime_error("Failed to write metadata file: " + tmpPath.string());
    }

    std::filesystem::rename(tmpPath, metaPath);
    LogRegistry::metadata()->debug("[Store] Saved metadata for {}", task.path_in_repo);
}
