#pragma once

#include <filesystem>

namespace hl::metadata {

// Advisory exclusive flock() held for the lifetime of the object. The lock file itself
// is left on disk; a stale file from a killed process does not block anyone.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& lockPath);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

}
