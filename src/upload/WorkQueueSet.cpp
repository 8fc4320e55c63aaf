#include "upload/WorkQueueSet.hpp"
#include "upload/errors.hpp"

#include <algorithm>

using namespace hl::upload;
using namespace hl::types;

SchedulerLimits SchedulerLimits::fromConfig(const config::UploadConfig& cfg) {
    SchedulerLimits l;
    l.commit_batch = std::max(1u, cfg.commit_batch_size);
    l.classify_batch = std::max(1u, cfg.classify_batch_size);
    l.classify_eager = std::max(1u, cfg.classify_eager_threshold);
    l.commit_stale_after = cfg.commit_stale_after;
    l.transfer_acceleration = cfg.transfer_acceleration;
    return l;
}

WorkQueueSet::WorkQueueSet(std::vector<FileTask> tasks, SchedulerLimits limits, ClockFn clock)
    : tasks_(std::move(tasks)),
      where_(tasks_.size(), Location::InFlight),
      limits_(limits),
      clock_(std::move(clock)) {
    for (size_t i = 0; i < tasks_.size(); ++i) route(i);
}

void WorkQueueSet::route(const size_t id) {
    const auto& t = tasks_[id];

    if (t.isTerminal()) {
        where_[id] = Location::Terminal;
        ++terminal_;
    } else if (!t.sha256) {
        where_[id] = Location::HashQueue;
        queues_[HASH].push_back(id);
    } else if (!t.upload_mode) {
        where_[id] = Location::ClassifyQueue;
        queues_[CLASSIFY].push_back(id);
    } else if (t.isLfs() && !t.is_uploaded) {
        where_[id] = Location::PreuploadQueue;
        queues_[PREUPLOAD].push_back(id);
    } else {
        where_[id] = Location::CommitQueue;
        queues_[COMMIT].push_back(id);
    }
}

Job WorkQueueSet::take(const StageKind kind, const Q q, const size_t n) {
    Job job;
    job.kind = kind;

    auto& queue = queues_[q];
    const auto count = std::min(n, queue.size());
    job.ids.reserve(count);
    job.items.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        const auto id = queue.front();
        queue.pop_front();
        where_[id] = Location::InFlight;
        job.ids.push_back(id);
        job.items.push_back(tasks_[id]);
    }

    ++active_[q];
    return job;
}

bool WorkQueueSet::commitIsDue(const Clock::time_point now) const {
    return !lastCommitAttempt_ || now - *lastCommitAttempt_ > limits_.commit_stale_after;
}

Job WorkQueueSet::claimNext() {
    std::scoped_lock lock(mutex_);
    const auto now = clock_();

    const auto& hashQ = queues_[HASH];
    const auto& classifyQ = queues_[CLASSIFY];
    const auto& preuploadQ = queues_[PREUPLOAD];
    const auto& commitQ = queues_[COMMIT];

    // Commit eagerly when nothing was committed for a while, or when a full batch is ready
    if (active_[COMMIT] == 0 && !commitQ.empty() && commitIsDue(now))
        return take(StageKind::Commit, COMMIT, limits_.commit_batch);
    if (active_[COMMIT] == 0 && commitQ.size() >= limits_.commit_batch)
        return take(StageKind::Commit, COMMIT, limits_.commit_batch);

    if (classifyQ.size() >= limits_.classify_eager)
        return take(StageKind::Classify, CLASSIFY, limits_.classify_batch);

    // Keep one worker on each single-item stage before piling onto any of them
    if (!preuploadQ.empty() && active_[PREUPLOAD] == 0)
        return take(StageKind::Preupload, PREUPLOAD, 1);
    if (!hashQ.empty() && active_[HASH] == 0)
        return take(StageKind::Hash, HASH, 1);
    if (!classifyQ.empty() && active_[CLASSIFY] == 0)
        return take(StageKind::Classify, CLASSIFY, limits_.classify_batch);

    if (!preuploadQ.empty() && !(limits_.transfer_acceleration && active_[PREUPLOAD] > 0))
        return take(StageKind::Preupload, PREUPLOAD, 1);
    if (!hashQ.empty())
        return take(StageKind::Hash, HASH, 1);
    if (!classifyQ.empty())
        return take(StageKind::Classify, CLASSIFY, limits_.classify_batch);
    if (!commitQ.empty() && active_[COMMIT] == 0)
        return take(StageKind::Commit, COMMIT, limits_.commit_batch);

    if (terminal_ == tasks_.size()) return Job{StageKind::Exit, {}, {}};
    return Job{StageKind::Wait, {}, {}};
}

namespace {

int queueFor(const StageKind kind) {
    switch (kind) {
        case StageKind::Hash: return 0;
        case StageKind::Classify: return 1;
        case StageKind::Preupload: return 2;
        case StageKind::Commit: return 3;
        default: return -1;
    }
}

}

void WorkQueueSet::release(Job&& job) {
    const auto q = queueFor(job.kind);
    if (q < 0) throw InvariantViolation("Cannot release a " + to_string(job.kind) + " job");
    if (job.ids.size() != job.items.size())
        throw InvariantViolation("Released job has mismatched ids and items");

    {
        std::scoped_lock lock(mutex_);

        for (size_t i = 0; i < job.ids.size(); ++i) {
            const auto id = job.ids[i];
            if (id >= tasks_.size() || where_[id] != Location::InFlight)
                throw InvariantViolation("Released task " + std::to_string(id) + " was not in flight");

            if (tasks_[id].isTerminal())
                throw InvariantViolation("Terminal task " + tasks_[id].path_in_repo + " was claimed");

            tasks_[id] = std::move(job.items[i]);
            route(id);
        }

        if (active_[q] == 0) throw InvariantViolation("Active counter underflow for " + to_string(job.kind));
        --active_[q];

        if (job.kind == StageKind::Commit) lastCommitAttempt_ = clock_();
        ++generation_;
    }

    cv_.notify_all();
}

void WorkQueueSet::abandon(const Job& job) {
    const auto q = queueFor(job.kind);
    if (q < 0) return;

    {
        std::scoped_lock lock(mutex_);
        if (active_[q] > 0) --active_[q];
        ++generation_;
    }

    cv_.notify_all();
}

void WorkQueueSet::waitForWork(const Clock::duration interval, const concurrency::InterruptFlag& interrupt) {
    std::unique_lock lock(mutex_);
    const auto deadline = Clock::now() + interval;
    const auto startGen = generation_;

    ++waiting_;
    while (generation_ == startGen && !concurrency::isInterrupted(interrupt)) {
        const auto now = Clock::now();
        if (now >= deadline) break;
        cv_.wait_for(lock, std::min<Clock::duration>(deadline - now, WAIT_SLICE));
    }
    --waiting_;
}

void WorkQueueSet::wakeAll() {
    {
        std::scoped_lock lock(mutex_);
        ++generation_;
    }
    cv_.notify_all();
}

bool WorkQueueSet::isDone() const {
    std::scoped_lock lock(mutex_);
    return terminal_ == tasks_.size();
}

Location WorkQueueSet::location(const size_t id) const {
    std::scoped_lock lock(mutex_);
    return where_.at(id);
}

FileTask WorkQueueSet::task(const size_t id) const {
    std::scoped_lock lock(mutex_);
    return tasks_.at(id);
}

QueueSnapshot WorkQueueSet::snapshot() const {
    std::scoped_lock lock(mutex_);

    QueueSnapshot s;
    for (const auto& t : tasks_) {
        if (t.should_ignore) {
            ++s.ignored;
            continue;
        }

        ++s.total;
        s.total_bytes += t.size;

        if (t.sha256) {
            ++s.hashed;
            s.hashed_bytes += t.size;
        }

        if (!t.upload_mode) ++s.unsure;
        else if (t.isLfs()) {
            ++s.lfs;
            s.lfs_bytes += t.size;
        }

        if (t.is_uploaded) {
            ++s.lfs_uploaded;
            s.lfs_uploaded_bytes += t.size;
        }

        if (t.is_committed) {
            ++s.committed;
            s.committed_bytes += t.size;
        }
    }

    for (size_t q = 0; q < queues_.size(); ++q) s.queued[q] = queues_[q].size();
    s.active_hash = active_[HASH];
    s.active_classify = active_[CLASSIFY];
    s.active_preupload = active_[PREUPLOAD];
    s.active_commit = active_[COMMIT];
    s.waiting = waiting_;
    s.done = terminal_ == tasks_.size();
    return s;
}
