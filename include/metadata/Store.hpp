#pragma once

#include "types/FileTask.hpp"

#include <filesystem>
#include <string>

namespace hl::metadata {

/**
 * Sidecar persistence of per-file upload progress.
 *
 * Every uploaded file gets one JSON record under
 * <folder>/.cache/huggingface/upload/<path_in_repo>.metadata, guarded by an advisory
 * lock on the sibling .lock file. Records are replaced with write-to-temp + rename so
 * that a crash leaves either the previous or the new record, never a torn one.
 *
 * Concurrent calls for different files are safe. Callers guarantee that a single file
 * is only saved by the worker that currently owns it.
 */
class Store {
public:
    explicit Store(std::filesystem::path folder);

    /**
     * Rebuilds the task for path_in_repo. Unknown, corrupt or stale records (the local
     * file changed since the record was written) yield a fresh task with only the
     * size filled in. Throws std::filesystem::filesystem_error if the local file is gone.
     */
    [[nodiscard]] types::FileTask load(const std::string& pathInRepo) const;

    void save(const types::FileTask& task) const;

    [[nodiscard]] std::filesystem::path localPath(const std::string& pathInRepo) const;
    [[nodiscard]] std::filesystem::path metadataPath(const std::string& pathInRepo) const;
    [[nodiscard]] std::filesystem::path lockPath(const std::string& pathInRepo) const;

private:
    std::filesystem::path folder_;
    std::filesystem::path root_;

    void ensureParentDir(const std::filesystem::path& p) const;
};

}
