#include "upload/LargeFolderUpload.hpp"
#include "upload/WorkQueueSet.hpp"
#include "upload/Stages.hpp"
#include "upload/Worker.hpp"
#include "upload/StatusReport.hpp"
#include "upload/errors.hpp"
#include "core/DirectoryWalker.hpp"
#include "metadata/Store.hpp"
#include "util/patterns.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <system_error>
#include <thread>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace hl::upload;
using namespace hl::logging;
using namespace hl::types;

namespace fs = std::filesystem;

namespace {

size_t terminalWidth() {
    winsize ws{};
    if (::ioctl(::fileno(stdout), TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
    return 80;
}

}

std::string hl::upload::to_string(const Phase phase) {
    switch (phase) {
        case Phase::Setup: return "setup";
        case Phase::RepoEnsured: return "repo_ensured";
        case Phase::FilesEnumerated: return "files_enumerated";
        case Phase::WorkersRunning: return "workers_running";
        case Phase::Draining: return "draining";
        case Phase::Done: return "done";
    }
    return "unknown";
}

unsigned int LargeFolderUpload::resolveWorkerCount(const std::optional<unsigned int> explicitCount,
                                                   const unsigned int configured,
                                                   const unsigned int hardware) {
    if (explicitCount && *explicitCount > 0) return *explicitCount;
    if (configured > 0) return configured;
    return std::max(hardware > 2 ? hardware - 2 : 0u, 2u);
}

LargeFolderUpload::LargeFolderUpload(UploadOptions opts,
                                     hub::Client& client,
                                     const config::Config& cfg,
                                     concurrency::InterruptFlag interrupt)
    : opts_(std::move(opts)),
      client_(client),
      uploadCfg_(cfg.upload),
      commitMessage_(cfg.hub.commit_message),
      interrupt_(interrupt ? std::move(interrupt) : concurrency::makeInterruptFlag()) {
    validate();
}

void LargeFolderUpload::validate() {
    if (opts_.repo_id.empty()) throw SetupError("Repo id must not be empty");

    if (!hub::isValidRepoType(opts_.repo_type))
        throw SetupError("Invalid repo type '" + opts_.repo_type + "', must be one of: model, dataset, space");

    std::error_code ec;
    if (!fs::is_directory(opts_.folder, ec))
        throw SetupError("Provided path '" + opts_.folder.string() + "' is not a directory");
    opts_.folder = fs::absolute(opts_.folder);

    if (opts_.num_workers && *opts_.num_workers == 0) throw SetupError("Number of workers must be at least 1");

    revision_ = opts_.revision && !opts_.revision->empty() ? *opts_.revision : hub::DEFAULT_REVISION;
    workers_ = resolveWorkerCount(opts_.num_workers, uploadCfg_.num_workers, std::thread::hardware_concurrency());
    printReport_ = opts_.print_report.value_or(uploadCfg_.print_report);
    repoId_ = opts_.repo_id;
}

void LargeFolderUpload::report(const WorkQueueSet& queues, const bool final) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startedAt_);
    const auto text = StatusReport::render(queues.snapshot(), std::time(nullptr), elapsed);

    if (printReport_) {
        if (interactive_) {
            // Redraw over the previous report
            std::cout << StatusReport::eraseRows(drawnRows_) << text << std::endl;
            drawnRows_ = StatusReport::terminalRows(text, terminalWidth());
        } else {
            std::cout << text << std::endl;
        }
    }
    if (final) LogRegistry::hubload()->info("[LargeFolderUpload] Final status:\n{}", text);
    else LogRegistry::hubload()->debug("[LargeFolderUpload] Status:\n{}", text);
}

UploadSummary LargeFolderUpload::run() {
    startedAt_ = std::chrono::steady_clock::now();
    interactive_ = ::isatty(::fileno(stdout)) != 0;
    drawnRows_ = 0;
    const auto log = LogRegistry::hubload();

    repoId_ = client_.createRepoIfMissing(opts_.repo_id, opts_.repo_type, opts_.is_private);
    phase_ = Phase::RepoEnsured;
    log->info("[LargeFolderUpload] Repo ready: {} ({}, revision {})", repoId_, opts_.repo_type, revision_);

    const util::PathFilter filter(opts_.allow_patterns, opts_.ignore_patterns);
    const auto entries = core::DirectoryWalker().walk(opts_.folder, [&filter](const std::string& p) { return filter.accepts(p); });

    const metadata::Store store(opts_.folder);
    std::vector<FileTask> tasks;
    tasks.reserve(entries.size());
    for (const auto& entry : entries) {
        try {
            tasks.push_back(store.load(entry.rel_path));
        } catch (const std::system_error& e) {
            // Only a file removed since the walk may be dropped; anything else would lose it silently
            std::error_code ec;
            if (fs::exists(store.localPath(entry.rel_path), ec) || ec)
                throw SetupError("Cannot prepare upload metadata for '" + entry.rel_path + "': " + e.what());
            log->warn("[LargeFolderUpload] Skipping {}, removed since the scan: {}", entry.rel_path, e.what());
        }
    }

    WorkQueueSet queues(std::move(tasks), SchedulerLimits::fromConfig(uploadCfg_));
    phase_ = Phase::FilesEnumerated;

    {
        const auto s = queues.snapshot();
        log->info("[LargeFolderUpload] Found {} candidate files ({} already committed, {} ignored), starting {} workers",
                  queues.size(), s.committed, s.ignored, workers_);
    }

    Stages stages(client_, store, {repoId_, opts_.repo_type, revision_},
                  {uploadCfg_.hash_chunk_size_bytes, commitMessage_}, interrupt_);

    WorkerGroup group(queues, interrupt_);
    for (unsigned int i = 0; i < workers_; ++i) {
        group.spawn([this, &queues, &stages, i] {
            try {
                Worker(queues, stages, uploadCfg_.wait_interval, interrupt_, i).run();
            } catch (const std::exception& e) {
                LogRegistry::upload()->critical("[Worker {}] Stopping upload: {}", i, e.what());
                {
                    std::scoped_lock lock(errorMutex_);
                    if (!firstError_) firstError_ = std::current_exception();
                }
                interrupt_->store(true, std::memory_order_release);
                queues.wakeAll();
            }
        });
    }
    phase_ = Phase::WorkersRunning;

    phase_ = Phase::Draining;
    auto nextReport = std::chrono::steady_clock::now() + uploadCfg_.report_interval;
    while (!queues.isDone() && !concurrency::isInterrupted(interrupt_)) {
        std::this_thread::sleep_for(POLL_SLICE);
        if (std::chrono::steady_clock::now() >= nextReport) {
            report(queues, false);
            nextReport += uploadCfg_.report_interval;
        }
    }

    if (concurrency::isInterrupted(interrupt_)) queues.wakeAll();
    group.join();

    if (firstError_) std::rethrow_exception(firstError_);

    phase_ = Phase::Done;
    report(queues, true);

    const auto s = queues.snapshot();
    UploadSummary summary;
    summary.repo_id = repoId_;
    summary.files_total = queues.size();
    summary.files_committed = s.committed;
    summary.files_ignored = s.ignored;
    summary.workers = workers_;
    summary.interrupted = !s.done;
    summary.elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startedAt_);

    if (summary.interrupted) log->warn("[LargeFolderUpload] Interrupted; progress is saved and the upload can be resumed");
    else log->info("[LargeFolderUpload] Upload of {} to {} complete in {}", opts_.folder.string(), repoId_,
                   StatusReport::formatElapsed(summary.elapsed));

    return summary;
}
