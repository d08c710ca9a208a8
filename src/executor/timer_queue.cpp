/**
 * @file timer_queue.cpp
 * @brief TimerQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/timer_queue.hpp"

#include <exception>

namespace edit_orchestrator {

TimerQueue::TimerQueue(Logger& logger) : logger_(logger) {}

TimerQueue::~TimerQueue() {
    stop();
}

void TimerQueue::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void TimerQueue::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    thread_.join();

    std::lock_guard lock(mutex_);
    if (!entries_.empty()) {
        logger_.info("Timer queue stopped with " + std::to_string(entries_.size())
                     + " pending callbacks");
    }
    entries_ = {};
}

void TimerQueue::schedule_at(Clock::time_point deadline, Callback callback) {
    {
        std::lock_guard lock(mutex_);
        entries_.push(Entry{deadline, next_sequence_++, std::move(callback)});
    }
    cv_.notify_all();
}

void TimerQueue::schedule_after(Millis delay, Callback callback) {
    schedule_at(Clock::now() + delay, std::move(callback));
}

size_t TimerQueue::pending() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void TimerQueue::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (entries_.empty()) {
            cv_.wait(lock, stop, [this] { return !entries_.empty(); });
            continue;
        }

        auto deadline = entries_.top().deadline;
        if (Clock::now() < deadline) {
            // Wakes early if an earlier entry is pushed.
            cv_.wait_until(lock, stop, deadline, [this, deadline] {
                return !entries_.empty() && entries_.top().deadline < deadline;
            });
            continue;
        }

        auto callback = std::move(const_cast<Entry&>(entries_.top()).callback);
        entries_.pop();
        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            logger_.error(std::string{"Timer callback threw: "} + e.what());
        }
        lock.lock();
    }
}

}  // namespace edit_orchestrator
