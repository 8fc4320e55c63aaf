#include "core/DirectoryWalker.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <system_error>

using namespace hl::core;
using namespace hl::logging;

namespace fs = std::filesystem;

std::vector<DirectoryWalker::Entry> DirectoryWalker::walk(
        const fs::path& root,
        const std::function<bool(const std::string&)>& filter) const
{
    std::vector<Entry> entries;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) throw fs::filesystem_error("Cannot walk directory", root, ec);

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LogRegistry::hubload()->warn("[DirectoryWalker] Error walking {}: {}", root.string(), ec.message());
            break;
        }

        const auto& dir_entry = *it;
        try {
            if (!dir_entry.is_regular_file()) continue;

            auto rel = dir_entry.path().lexically_relative(root).generic_string();
            if (filter && !filter(rel)) continue;

            entries.push_back({std::move(rel), dir_entry.file_size()});
        } catch (const fs::filesystem_error& e) {
            LogRegistry::hubload()->warn("[DirectoryWalker] Error accessing {}: {}", dir_entry.path().string(), e.what());
        }
    }

    std::ranges::sort(entries, {}, &Entry::rel_path);
    return entries;
}
