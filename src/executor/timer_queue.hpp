/**
 * @file timer_queue.hpp
 * @brief Single-thread deadline queue for delayed callbacks.
 * @author Dimitris Kafetzis
 *
 * Backoff waits run here so a job waiting for its retry never holds a
 * worker slot.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace edit_orchestrator {

class TimerQueue {
public:
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    explicit TimerQueue(Logger& logger);
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    void start();
    /// Stop the timer thread. Callbacks that have not fired are dropped.
    void stop();

    void schedule_at(Clock::time_point deadline, Callback callback);
    void schedule_after(Millis delay, Callback callback);

    [[nodiscard]] size_t pending() const;

private:
    struct Entry {
        Clock::time_point deadline;
        uint64_t sequence;
        Callback callback;
    };
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const noexcept {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.sequence > b.sequence;
        }
    };

    void run(std::stop_token stop);

    Logger& logger_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> entries_;
    uint64_t next_sequence_{0};
    std::jthread thread_;
};

}  // namespace edit_orchestrator
