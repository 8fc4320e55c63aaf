#pragma once

#include "hub/Client.hpp"
#include "config/Config.hpp"
#include "concurrency/Interrupt.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hl::upload {

class WorkQueueSet;

struct UploadOptions {
    std::string repo_id;
    std::filesystem::path folder;
    std::string repo_type = "model";
    std::optional<std::string> revision;
    bool is_private = false;
    std::vector<std::string> allow_patterns;
    std::vector<std::string> ignore_patterns;
    std::optional<unsigned int> num_workers;
    std::optional<bool> print_report;
};

enum class Phase { Setup, RepoEnsured, FilesEnumerated, WorkersRunning, Draining, Done };

[[nodiscard]] std::string to_string(Phase phase);

struct UploadSummary {
    std::string repo_id;
    size_t files_total = 0;
    size_t files_committed = 0;
    size_t files_ignored = 0;
    unsigned int workers = 0;
    bool interrupted = false;
    std::chrono::seconds elapsed{0};
};

/**
 * Uploads a local folder to a hub repo, one file per task, resumable across runs.
 *
 * Construction validates the inputs and resolves the worker count; run() then
 * ensures the repo exists, scans the folder, seeds the queues from the sidecar
 * metadata and drives the worker threads until every file is committed or ignored,
 * or until the interrupt flag is raised. Workers are always joined before run()
 * returns. An InvariantViolation raised by any worker is rethrown from run(), and a
 * file whose sidecar metadata cannot be prepared aborts with SetupError before any
 * worker starts.
 */
class LargeFolderUpload {
public:
    LargeFolderUpload(UploadOptions opts,
                      hub::Client& client,
                      const config::Config& cfg,
                      concurrency::InterruptFlag interrupt);

    UploadSummary run();

    [[nodiscard]] Phase phase() const { return phase_.load(); }
    [[nodiscard]] unsigned int workerCount() const { return workers_; }
    [[nodiscard]] const std::string& repoId() const { return repoId_; }
    [[nodiscard]] const std::string& revision() const { return revision_; }

    // Explicit count if given, else the configured count, else max(cpu - 2, 2).
    [[nodiscard]] static unsigned int resolveWorkerCount(std::optional<unsigned int> explicitCount,
                                                         unsigned int configured,
                                                         unsigned int hardware);

private:
    static constexpr auto POLL_SLICE = std::chrono::milliseconds(100);

    UploadOptions opts_;
    hub::Client& client_;
    config::UploadConfig uploadCfg_;
    std::string commitMessage_;
    concurrency::InterruptFlag interrupt_;

    std::string repoId_;
    std::string revision_;
    unsigned int workers_ = 0;
    bool printReport_ = true;
    bool interactive_ = false;          // stdout is a terminal, reports are redrawn in place
    size_t drawnRows_ = 0;
    std::atomic<Phase> phase_{Phase::Setup};
    std::chrono::steady_clock::time_point startedAt_;

    std::mutex errorMutex_;
    std::exception_ptr firstError_;

    void validate();
    void report(const WorkQueueSet& queues, bool final);
};

}
