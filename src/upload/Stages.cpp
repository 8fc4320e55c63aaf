#include "upload/Stages.hpp"
#include "upload/errors.hpp"
#include "crypto/Hash.hpp"
#include "logging/LogRegistry.hpp"

#include <fstream>

using namespace hl::upload;
using namespace hl::types;
using namespace hl::logging;

namespace {

// Recoverable errors become a failed result; interrupts and broken invariants keep unwinding.
template <class Fn>
StageResult guarded(const std::string& what, Fn&& fn) {
    try {
        fn();
        return StageResult::success();
    } catch (const hl::concurrency::Interrupted&) {
        throw;
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::exception& e) {
        LogRegistry::upload()->error("[Stages] Failed to {}: {}", what, e.what());
        return StageResult::failure(e.what());
    }
}

std::string readSample(const std::filesystem::path& path, const size_t n) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open " + path.string());
    std::string buf(n, '\0');
    in.read(buf.data(), static_cast<std::streamsize>(n));
    buf.resize(static_cast<size_t>(in.gcount()));
    return buf;
}

const std::string& requireSha(const FileTask& task, const char* stage) {
    if (!task.sha256)
        throw InvariantViolation(std::string(stage) + " reached for " + task.path_in_repo + " without a sha256");
    return *task.sha256;
}

std::string describeBatch(const std::vector<FileTask>& tasks) {
    if (tasks.empty()) return "empty batch";
    if (tasks.size() == 1) return tasks.front().path_in_repo;
    return tasks.front().path_in_repo + " and " + std::to_string(tasks.size() - 1) + " more";
}

}

Stages::Stages(hub::Client& client,
               const metadata::Store& store,
               hub::RepoRef repo,
               StageSettings settings,
               concurrency::InterruptFlag interrupt)
    : client_(client),
      store_(store),
      repo_(std::move(repo)),
      settings_(std::move(settings)),
      interrupt_(std::move(interrupt)) {}

StageResult Stages::run(Job& job) {
    switch (job.kind) {
        case StageKind::Hash:
        case StageKind::Preupload:
            if (job.items.size() != 1)
                throw InvariantViolation(to_string(job.kind) + " job must carry exactly one task");
            return job.kind == StageKind::Hash ? hash(job.items.front()) : preupload(job.items.front());
        case StageKind::Classify: return classify(job.items);
        case StageKind::Commit: return commit(job.items);
        default: throw InvariantViolation("No handler for " + to_string(job.kind) + " job");
    }
}

void Stages::persist(const FileTask& task) const {
    // In-memory progress stands even if the sidecar write fails; the file is just redone on resume
    try {
        store_.save(task);
    } catch (const std::exception& e) {
        LogRegistry::metadata()->error("[Stages] Failed to persist state for {}: {}", task.path_in_repo, e.what());
    }
}

StageResult Stages::hash(FileTask& task) {
    return guarded("hash " + task.path_in_repo, [&] {
        const auto sha = crypto::hash::sha256File(task.local_path, settings_.hash_chunk_size, interrupt_);
        LogRegistry::hash()->debug("[Stages] {} -> {}", task.path_in_repo, sha);
        task.sha256 = sha;
        persist(task);
    });
}

StageResult Stages::classify(std::vector<FileTask>& tasks) {
    return guarded("get upload mode for " + describeBatch(tasks), [&] {
        std::vector<hub::UploadInfo> infos;
        infos.reserve(tasks.size());
        for (const auto& t : tasks)
            infos.push_back({t.path_in_repo, t.size, requireSha(t, "Classification"), readSample(t.local_path, SAMPLE_SIZE)});

        const auto modes = client_.classifyUploadModes(repo_, infos);

        for (auto& t : tasks) {
            const auto it = modes.modes.find(t.path_in_repo);
            const bool ignored = modes.ignored.contains(t.path_in_repo);
            if (it == modes.modes.end() && !ignored) {
                LogRegistry::upload()->warn("[Stages] No upload mode returned for {}, will retry", t.path_in_repo);
                continue;
            }

            if (it != modes.modes.end()) t.upload_mode = it->second;
            t.should_ignore = ignored;
            persist(t);
        }
    });
}

StageResult Stages::preupload(FileTask& task) {
    const auto& sha = requireSha(task, "Pre-upload");
    if (!task.isLfs()) throw InvariantViolation("Pre-upload reached for non-LFS file " + task.path_in_repo);

    return guarded("pre-upload " + task.path_in_repo, [&] {
        client_.preuploadLargeFile(repo_, {task.path_in_repo, task.local_path, sha, task.size});
        task.is_uploaded = true;
        persist(task);
    });
}

StageResult Stages::commit(std::vector<FileTask>& tasks) {
    std::vector<hub::CommitAddition> additions;
    additions.reserve(tasks.size());
    for (const auto& t : tasks) {
        const auto& sha = requireSha(t, "Commit");
        if (!t.upload_mode) throw InvariantViolation("Commit reached for unclassified file " + t.path_in_repo);
        if (t.isLfs() && !t.is_uploaded) throw InvariantViolation("Commit reached for LFS file " + t.path_in_repo + " before pre-upload");
        additions.push_back({t.path_in_repo, t.local_path, sha, t.size, *t.upload_mode});
    }

    return guarded("commit " + describeBatch(tasks), [&] {
        client_.createCommit(repo_, additions, settings_.commit_message);
        for (auto& t : tasks) {
            t.is_committed = true;
            persist(t);
        }
        LogRegistry::upload()->info("[Stages] Committed {} files", tasks.size());
    });
}
