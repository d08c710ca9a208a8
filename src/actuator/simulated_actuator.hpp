/**
 * @file simulated_actuator.hpp
 * @brief In-process actuator with scripted outcomes and synthetic latency.
 * @author Dimitris Kafetzis
 *
 * Backs the daemon's demo mode and the test suites. Outcomes can be scripted
 * per subject (consumed in order); unscripted calls succeed, or fail at
 * `failure_rate` with a transient error.
 */

#pragma once

#include "actuator/actuator.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

namespace edit_orchestrator {

class SimulatedActuator : public IActuator {
public:
    struct Options {
        Millis dispatch_latency{0};
        double failure_rate{0.0};                 ///< unscripted dispatch failure probability
        std::optional<uint32_t> seed;
    };

    /// One scripted dispatch result; nullopt = success.
    using Outcome = std::optional<ActuatorError>;

    SimulatedActuator();
    explicit SimulatedActuator(Options options);

    ActuatorResult<CheckpointHandle> checkpoint(const SubjectRef& subject) override;
    ActuatorResult<void> dispatch(const SubjectRef& subject,
                                  const std::string& config,
                                  std::stop_token stop) override;
    ActuatorResult<void> rollback(const CheckpointHandle& handle) override;

    // ── Scripting ─────────────────────────────
    void script_dispatch(const SubjectRef& subject, std::vector<Outcome> outcomes);
    void script_checkpoint_failure(const SubjectRef& subject, ActuatorError error);
    void script_rollback_failure(const SubjectRef& subject, ActuatorError error);
    /// Dispatch for `subject` blocks for `duration` (or until stopped).
    void set_subject_latency(const SubjectRef& subject, Millis duration);

    // ── Observation ───────────────────────────
    [[nodiscard]] uint32_t checkpoint_count() const noexcept { return checkpoints_.load(); }
    [[nodiscard]] uint32_t dispatch_count() const noexcept { return dispatches_.load(); }
    [[nodiscard]] uint32_t rollback_count() const noexcept { return rollbacks_.load(); }
    [[nodiscard]] uint32_t rollback_count(const SubjectRef& subject) const;
    [[nodiscard]] uint32_t dispatch_count(const SubjectRef& subject) const;
    /// Subjects in the order their dispatches started.
    [[nodiscard]] std::vector<SubjectRef> dispatch_order() const;
    [[nodiscard]] uint32_t peak_concurrency() const noexcept { return peak_in_flight_.load(); }

private:
    void wait_for(Millis duration, std::stop_token stop) const;
    [[nodiscard]] SubjectRef subject_of(const CheckpointHandle& handle) const;

    Options options_;

    mutable std::mutex mutex_;
    std::mt19937 rng_;
    std::unordered_map<SubjectRef, std::deque<Outcome>> dispatch_script_;
    std::unordered_map<SubjectRef, ActuatorError> checkpoint_failures_;
    std::unordered_map<SubjectRef, ActuatorError> rollback_failures_;
    std::unordered_map<SubjectRef, Millis> subject_latency_;
    std::unordered_map<CheckpointHandle, SubjectRef> handles_;
    std::unordered_map<SubjectRef, uint32_t> rollbacks_by_subject_;
    std::unordered_map<SubjectRef, uint32_t> dispatches_by_subject_;
    std::vector<SubjectRef> dispatch_order_;

    std::atomic<uint32_t> checkpoints_{0};
    std::atomic<uint32_t> dispatches_{0};
    std::atomic<uint32_t> rollbacks_{0};
    std::atomic<uint32_t> in_flight_{0};
    std::atomic<uint32_t> peak_in_flight_{0};
    uint64_t next_handle_{1};
};

}  // namespace edit_orchestrator
