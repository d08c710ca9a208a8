/**
 * @file simulated_actuator.cpp
 * @brief SimulatedActuator implementation.
 * @author Dimitris Kafetzis
 */

#include "actuator/simulated_actuator.hpp"

#include <chrono>
#include <string_view>
#include <thread>

namespace edit_orchestrator {

SimulatedActuator::SimulatedActuator() : SimulatedActuator(Options{}) {}

SimulatedActuator::SimulatedActuator(Options options)
    : options_(options)
    , rng_(options.seed.value_or(std::random_device{}())) {}

ActuatorResult<CheckpointHandle> SimulatedActuator::checkpoint(const SubjectRef& subject) {
    std::lock_guard lock(mutex_);
    if (auto it = checkpoint_failures_.find(subject); it != checkpoint_failures_.end()) {
        return it->second;
    }
    ++checkpoints_;
    CheckpointHandle handle = "ckpt-" + subject + "-" + std::to_string(next_handle_++);
    handles_.emplace(handle, subject);
    return handle;
}

ActuatorResult<void> SimulatedActuator::dispatch(const SubjectRef& subject,
                                                 const std::string& /*config*/,
                                                 std::stop_token stop) {
    Outcome outcome;
    Millis latency = options_.dispatch_latency;
    {
        std::lock_guard lock(mutex_);
        ++dispatches_;
        ++dispatches_by_subject_[subject];
        dispatch_order_.push_back(subject);

        if (auto it = subject_latency_.find(subject); it != subject_latency_.end()) {
            latency = it->second;
        }
        if (auto it = dispatch_script_.find(subject);
            it != dispatch_script_.end() && !it->second.empty()) {
            outcome = std::move(it->second.front());
            it->second.pop_front();
        } else if (options_.failure_rate > 0.0) {
            std::bernoulli_distribution fail(options_.failure_rate);
            if (fail(rng_)) {
                outcome = ActuatorError{FailureClass::Transient, "simulated actuator busy"};
            }
        }
    }

    auto now_in_flight = ++in_flight_;
    auto peak = peak_in_flight_.load();
    while (now_in_flight > peak && !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
    }

    wait_for(latency, stop);
    --in_flight_;

    if (stop.stop_requested()) {
        return ActuatorError{FailureClass::Transient, "dispatch cancelled via stop token"};
    }
    if (outcome) return *outcome;
    return {};
}

ActuatorResult<void> SimulatedActuator::rollback(const CheckpointHandle& handle) {
    std::lock_guard lock(mutex_);
    auto subject = subject_of(handle);
    ++rollbacks_;
    ++rollbacks_by_subject_[subject];
    if (auto it = rollback_failures_.find(subject); it != rollback_failures_.end()) {
        return it->second;
    }
    return {};
}

void SimulatedActuator::script_dispatch(const SubjectRef& subject, std::vector<Outcome> outcomes) {
    std::lock_guard lock(mutex_);
    auto& queue = dispatch_script_[subject];
    for (auto& outcome : outcomes) queue.push_back(std::move(outcome));
}

void SimulatedActuator::script_checkpoint_failure(const SubjectRef& subject, ActuatorError error) {
    std::lock_guard lock(mutex_);
    checkpoint_failures_.insert_or_assign(subject, std::move(error));
}

void SimulatedActuator::script_rollback_failure(const SubjectRef& subject, ActuatorError error) {
    std::lock_guard lock(mutex_);
    rollback_failures_.insert_or_assign(subject, std::move(error));
}

void SimulatedActuator::set_subject_latency(const SubjectRef& subject, Millis duration) {
    std::lock_guard lock(mutex_);
    subject_latency_.insert_or_assign(subject, duration);
}

uint32_t SimulatedActuator::rollback_count(const SubjectRef& subject) const {
    std::lock_guard lock(mutex_);
    auto it = rollbacks_by_subject_.find(subject);
    return it == rollbacks_by_subject_.end() ? 0 : it->second;
}

uint32_t SimulatedActuator::dispatch_count(const SubjectRef& subject) const {
    std::lock_guard lock(mutex_);
    auto it = dispatches_by_subject_.find(subject);
    return it == dispatches_by_subject_.end() ? 0 : it->second;
}

std::vector<SubjectRef> SimulatedActuator::dispatch_order() const {
    std::lock_guard lock(mutex_);
    return dispatch_order_;
}

void SimulatedActuator::wait_for(Millis duration, std::stop_token stop) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

SubjectRef SimulatedActuator::subject_of(const CheckpointHandle& handle) const {
    if (auto it = handles_.find(handle); it != handles_.end()) return it->second;
    // Handle issued by an earlier instance (before a restart): ckpt-<subject>-<n>
    constexpr std::string_view prefix = "ckpt-";
    auto dash = handle.rfind('-');
    if (!handle.starts_with(prefix) || dash == std::string::npos || dash < prefix.size()) {
        return {};
    }
    return handle.substr(prefix.size(), dash - prefix.size());
}

}  // namespace edit_orchestrator
