#pragma once

#include "types/FileTask.hpp"

#include <string>
#include <vector>

namespace hl::upload {

enum class StageKind { Hash, Classify, Preupload, Commit, Wait, Exit };

[[nodiscard]] std::string to_string(StageKind kind);

struct Job {
    StageKind kind = StageKind::Wait;
    std::vector<size_t> ids;                // indices into WorkQueueSet::tasks_
    std::vector<types::FileTask> items;     // private copies, written back on release

    [[nodiscard]] bool isWork() const { return kind != StageKind::Wait && kind != StageKind::Exit; }
};

struct StageResult {
    bool ok = true;
    std::string error;

    static StageResult success() { return {}; }
    static StageResult failure(std::string msg) { return {false, std::move(msg)}; }
};

}
