#pragma once

#include "upload/model/Job.hpp"
#include "config/Config.hpp"
#include "concurrency/Interrupt.hpp"
#include "types/FileTask.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace hl::upload {

struct SchedulerLimits {
    size_t commit_batch = 25;
    size_t classify_batch = 50;
    size_t classify_eager = 10;
    std::chrono::steady_clock::duration commit_stale_after = std::chrono::minutes(5);
    bool transfer_acceleration = false;

    static SchedulerLimits fromConfig(const config::UploadConfig& cfg);
};

// Where a task currently lives. Exactly one at any observation point.
enum class Location { HashQueue, ClassifyQueue, PreuploadQueue, CommitQueue, InFlight, Terminal };

struct QueueSnapshot {
    size_t total = 0;                   // ignored files excluded
    uint64_t total_bytes = 0;

    size_t hashed = 0;
    uint64_t hashed_bytes = 0;

    size_t lfs = 0;
    uint64_t lfs_bytes = 0;
    size_t lfs_uploaded = 0;
    uint64_t lfs_uploaded_bytes = 0;
    size_t unsure = 0;                  // upload mode not known yet

    size_t committed = 0;
    uint64_t committed_bytes = 0;
    size_t ignored = 0;

    std::array<size_t, 4> queued{};     // hash, classify, preupload, commit
    size_t active_hash = 0;
    size_t active_classify = 0;
    size_t active_preupload = 0;
    size_t active_commit = 0;
    size_t waiting = 0;

    bool done = false;
};

/**
 * All scheduler state behind a single mutex: the task table, four FIFO queues of task
 * indices, per-stage active counters, the waiting counter and the last commit attempt.
 *
 * claimNext() and release() are the only mutators. A claimed task leaves its queue and
 * is tracked as in flight until the job is released, at which point it is routed by its
 * own fields (hash missing -> hash queue, mode missing -> classify queue, LFS not yet
 * uploaded -> pre-upload queue, otherwise commit queue; committed or ignored tasks are
 * dropped). A failed handler therefore requeues its items simply by not changing them.
 */
class WorkQueueSet {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit WorkQueueSet(std::vector<types::FileTask> tasks,
                          SchedulerLimits limits = {},
                          ClockFn clock = Clock::now);

    WorkQueueSet(const WorkQueueSet&) = delete;
    WorkQueueSet& operator=(const WorkQueueSet&) = delete;

    [[nodiscard]] Job claimNext();

    void release(Job&& job);

    // Interrupted worker: frees the stage slot, leaves the items in flight.
    void abandon(const Job& job);

    // Sleeps up to `interval`, returning early on any release or when the flag is raised.
    void waitForWork(Clock::duration interval, const concurrency::InterruptFlag& interrupt);

    void wakeAll();

    [[nodiscard]] bool isDone() const;
    [[nodiscard]] QueueSnapshot snapshot() const;

    [[nodiscard]] Location location(size_t id) const;
    [[nodiscard]] types::FileTask task(size_t id) const;
    [[nodiscard]] size_t size() const { return tasks_.size(); }

    [[nodiscard]] const SchedulerLimits& limits() const { return limits_; }

private:
    static constexpr auto WAIT_SLICE = std::chrono::milliseconds(200);

    enum Q { HASH = 0, CLASSIFY = 1, PREUPLOAD = 2, COMMIT = 3 };

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::vector<types::FileTask> tasks_;
    std::vector<Location> where_;
    std::array<std::deque<size_t>, 4> queues_;
    std::array<size_t, 4> active_{};
    size_t waiting_ = 0;
    size_t terminal_ = 0;
    uint64_t generation_ = 0;
    std::optional<Clock::time_point> lastCommitAttempt_;

    SchedulerLimits limits_;
    ClockFn clock_;

    void route(size_t id);
    Job take(StageKind kind, Q q, size_t n);
    [[nodiscard]] bool commitIsDue(Clock::time_point now) const;
};

}
