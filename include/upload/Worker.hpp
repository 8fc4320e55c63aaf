#pragma once

#include "upload/WorkQueueSet.hpp"
#include "upload/Stages.hpp"
#include "concurrency/Interrupt.hpp"

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

namespace hl::upload {

// The loop every upload thread runs: claim under the lock, handle without it, release.
class Worker {
public:
    Worker(WorkQueueSet& queues,
           Stages& stages,
           std::chrono::steady_clock::duration waitInterval,
           concurrency::InterruptFlag interrupt,
           unsigned int id);

    // Returns when every task is terminal or the flag is raised. Invariant violations propagate.
    void run();

    [[nodiscard]] unsigned int id() const { return id_; }
    [[nodiscard]] size_t jobsHandled() const { return jobsHandled_; }

private:
    WorkQueueSet& queues_;
    Stages& stages_;
    std::chrono::steady_clock::duration waitInterval_;
    concurrency::InterruptFlag interrupt_;
    unsigned int id_;
    size_t jobsHandled_ = 0;
};

// Owns the upload threads. Leaving scope with threads still running raises the
// interrupt flag, wakes waiting workers and joins, so no joinable thread is destroyed.
class WorkerGroup {
public:
    WorkerGroup(WorkQueueSet& queues, concurrency::InterruptFlag interrupt);
    ~WorkerGroup();

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    template <class Fn>
    void spawn(Fn&& fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

    void join();

    [[nodiscard]] size_t size() const { return threads_.size(); }

private:
    WorkQueueSet& queues_;
    concurrency::InterruptFlag interrupt_;
    std::vector<std::thread> threads_;
};

}
