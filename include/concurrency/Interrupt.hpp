#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace hl::concurrency {

using InterruptFlag = std::shared_ptr<std::atomic<bool>>;

// Raised from deep inside a stage when the process is asked to stop. Never swallowed.
struct Interrupted : std::runtime_error {
    explicit Interrupted(const std::string& where) : std::runtime_error("Interrupted during " + where) {}
};

inline InterruptFlag makeInterruptFlag() { return std::make_shared<std::atomic<bool>>(false); }

inline bool isInterrupted(const InterruptFlag& flag) {
    return flag && flag->load(std::memory_order_acquire);
}

inline void throwIfInterrupted(const InterruptFlag& flag, const std::string& where) {
    if (isInterrupted(flag)) throw Interrupted(where);
}

}
