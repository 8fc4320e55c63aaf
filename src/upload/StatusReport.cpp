#include "upload/StatusReport.hpp"

#include <array>
#include <ctime>
#include <fmt/format.h>
#include <fmt/chrono.h>

using namespace hl::upload;

std::string StatusReport::formatSize(const uint64_t bytes) {
    static constexpr std::array<const char*, 8> UNITS = {"", "K", "M", "G", "T", "P", "E", "Z"};

    auto num = static_cast<double>(bytes);
    for (const auto* unit : UNITS) {
        if (num < 1000.0) return fmt::format("{:.1f}{}", num, unit);
        num /= 1000.0;
    }
    return fmt::format("{:.1f}Y", num);
}

std::string StatusReport::formatElapsed(const std::chrono::seconds elapsed) {
    const auto total = elapsed.count() < 0 ? 0 : elapsed.count();
    return fmt::format("{}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

std::string StatusReport::render(const QueueSnapshot& s, const std::time_t now, const std::chrono::seconds elapsed) {
    std::tm local{};
    localtime_r(&now, &local);

    const auto header = fmt::format("---------- {:%Y-%m-%d %H:%M:%S} ({}) ----------", local, formatElapsed(elapsed));
    const auto totalSize = formatSize(s.total_bytes);

    std::string out = header + "\n";

    out += fmt::format("Files:   hashed {}/{} ({}/{}) | pre-uploaded: {}/{} ({}/{})",
                       s.hashed, s.total, formatSize(s.hashed_bytes), totalSize,
                       s.lfs_uploaded, s.lfs, formatSize(s.lfs_uploaded_bytes), totalSize);
    if (s.unsure > 0) out += fmt::format(" (+{} unsure)", s.unsure);
    out += fmt::format(" | committed: {}/{} ({}/{}) | ignored: {}\n",
                       s.committed, s.total, formatSize(s.committed_bytes), totalSize, s.ignored);

    out += fmt::format("Workers: hashing: {} | get upload mode: {} | pre-uploading: {} | committing: {} | waiting: {}\n",
                       s.active_hash, s.active_classify, s.active_preupload, s.active_commit, s.waiting);

    out += std::string(header.size(), '-');
    return out;
}

size_t StatusReport::terminalRows(const std::string& text, const size_t width) {
    const size_t cols = width == 0 ? 1 : width;

    size_t rows = 0, start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        rows += (end - start) / cols + 1;
        start = end + 1;
    }
    return rows;
}

std::string StatusReport::eraseRows(const size_t rows) {
    std::string out;
    out.reserve(rows * 7);
    for (size_t i = 0; i < rows; ++i) out += "\033[F\033[K";
    return out;
}
