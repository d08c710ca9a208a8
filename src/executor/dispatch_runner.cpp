/**
 * @file dispatch_runner.cpp
 * @brief DispatchRunner implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/dispatch_runner.hpp"

#include <chrono>
#include <exception>

namespace edit_orchestrator {

DispatchRunner::DispatchRunner(IActuator& actuator, size_t num_threads, Logger& logger)
    : actuator_(actuator), logger_(logger) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

DispatchRunner::~DispatchRunner() {
    cancel_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // jthreads join in their destructors
}

ActuatorResult<void> DispatchRunner::run(const SubjectRef& subject, const std::string& config,
                                         Millis timeout, std::stop_token caller_stop) {
    auto call = std::make_shared<Call>();
    call->subject = subject;
    call->config = config;
    auto future = call->promise.get_future();
    std::stop_callback forward(caller_stop, [call] { call->stop.request_stop(); });

    {
        std::lock_guard lock(queue_mutex_);
        queue_.push(call);
    }
    queue_cv_.notify_one();

    if (future.wait_for(timeout) != std::future_status::ready) {
        call->stop.request_stop();
        logger_.warn("Dispatch of " + subject + " timed out after "
                     + std::to_string(timeout.count()) + "ms; stop requested");
        return ActuatorError{FailureClass::Transient,
                             "dispatch timed out after " + std::to_string(timeout.count()) + "ms"};
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return ActuatorError{FailureClass::Transient,
                             std::string{"actuator threw: "} + e.what()};
    } catch (...) {
        return ActuatorError{FailureClass::Transient, "actuator threw a non-standard exception"};
    }
}

void DispatchRunner::cancel_all() {
    std::lock_guard lock(queue_mutex_);
    for (const auto& call : running_) {
        call->stop.request_stop();
    }
    auto pending = queue_;
    while (!pending.empty()) {
        pending.front()->stop.request_stop();
        pending.pop();
    }
}

void DispatchRunner::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::shared_ptr<Call> call;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            if (queue_.empty()) continue;

            call = std::move(queue_.front());
            queue_.pop();
            running_.insert(call);
        }

        ++active_calls_;
        execute(*call);
        --active_calls_;

        std::lock_guard lock(queue_mutex_);
        running_.erase(call);
    }
}

void DispatchRunner::execute(Call& call) {
    if (call.stop.stop_requested()) {
        call.promise.set_value(ActuatorError{FailureClass::Transient,
                                             "dispatch abandoned before start"});
        return;
    }
    try {
        call.promise.set_value(actuator_.dispatch(call.subject, call.config,
                                                  call.stop.get_token()));
    } catch (...) {
        // Delivered to run(), which converts it into a transient failure.
        call.promise.set_exception(std::current_exception());
    }
}

size_t DispatchRunner::active_count() const noexcept {
    return active_calls_.load();
}

size_t DispatchRunner::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return queue_.size();
}

size_t DispatchRunner::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace edit_orchestrator
