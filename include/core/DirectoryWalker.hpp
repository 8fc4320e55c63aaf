#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace hl::core {

class DirectoryWalker {
public:
    struct Entry {
        std::string rel_path;   // POSIX form, relative to the walked root
        std::uintmax_t size;
    };

    // Regular files only, sorted by rel_path. Unreadable entries are logged and skipped.
    std::vector<Entry> walk(const std::filesystem::path& root,
                            const std::function<bool(const std::string&)>& filter = nullptr) const;
};

}
