/**
 * @file wake_signal.hpp
 * @brief Generation-counted wake-up for idle executors.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace edit_orchestrator {

/**
 * @brief Lost-wakeup-free signal.
 *
 * A waiter reads generation() before checking for work and passes it to
 * wait(); any notify() after that read ends the wait immediately.
 */
class WakeSignal {
public:
    void notify() {
        {
            std::lock_guard lock(mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    [[nodiscard]] uint64_t generation() const {
        std::lock_guard lock(mutex_);
        return generation_;
    }

    /// Returns when the generation moves past `seen`, the timeout expires, or stop is requested.
    void wait(std::stop_token stop, uint64_t seen, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, stop, timeout, [&] { return generation_ != seen; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    uint64_t generation_{0};
};

}  // namespace edit_orchestrator
