#include "upload/Worker.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace hl::upload;
using namespace hl::logging;

Worker::Worker(WorkQueueSet& queues,
               Stages& stages,
               const std::chrono::steady_clock::duration waitInterval,
               concurrency::InterruptFlag interrupt,
               const unsigned int id)
    : queues_(queues),
      stages_(stages),
      waitInterval_(waitInterval),
      interrupt_(std::move(interrupt)),
      id_(id) {}

void Worker::run() {
    LogRegistry::upload()->debug("[Worker {}] Started", id_);

    while (!concurrency::isInterrupted(interrupt_)) {
        auto job = queues_.claimNext();

        if (job.kind == StageKind::Exit) break;
        if (job.kind == StageKind::Wait) {
            queues_.waitForWork(waitInterval_, interrupt_);
            continue;
        }

        StageResult result;
        try {
            result = stages_.run(job);
        } catch (const concurrency::Interrupted& e) {
            LogRegistry::upload()->debug("[Worker {}] {} job abandoned: {}", id_, to_string(job.kind), e.what());
            queues_.abandon(job);
            return;
        } catch (const std::exception&) {
            queues_.abandon(job);
            throw;
        }

        if (!result.ok)
            LogRegistry::upload()->debug("[Worker {}] {} job of {} items requeued: {}",
                                         id_, to_string(job.kind), job.items.size(), result.error);

        queues_.release(std::move(job));
        ++jobsHandled_;
    }

    LogRegistry::upload()->debug("[Worker {}] Exiting after {} jobs", id_, jobsHandled_);
}

WorkerGroup::WorkerGroup(WorkQueueSet& queues, concurrency::InterruptFlag interrupt)
    : queues_(queues), interrupt_(std::move(interrupt)) {}

WorkerGroup::~WorkerGroup() {
    const bool running = std::ranges::any_of(threads_, [](const std::thread& t) { return t.joinable(); });
    if (!running) return;

    LogRegistry::upload()->debug("[WorkerGroup] Stopping {} workers during unwind", threads_.size());
    if (interrupt_) interrupt_->store(true, std::memory_order_release);
    queues_.wakeAll();
    join();
}

void WorkerGroup::join() {
    for (auto& t : threads_)
        if (t.joinable()) t.join();
}
