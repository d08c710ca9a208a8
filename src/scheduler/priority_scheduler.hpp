/**
 * @file priority_scheduler.hpp
 * @brief Dynamic-score selection of the next pending job.
 * @author Dimitris Kafetzis
 *
 *   score = tier bonus + min(age_hours / age_hours_per_point, age_bonus_cap)
 *         + (quality >= quality_threshold ? quality_bonus : 0)
 *
 * The highest score wins. Scores within kScoreEpsilon are ties, broken by
 * earliest creation time and then by insertion order.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/wake_signal.hpp"
#include "store/job.hpp"
#include "store/job_store.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>

namespace edit_orchestrator {

/// Decides whether a pending job may start now.
using AdmissionPredicate = std::function<bool(const Job&)>;

class PriorityScheduler {
public:
    static constexpr double kScoreEpsilon = 1e-6;

    PriorityScheduler(JobStore& store, ScoringConfig scoring, WakeSignal& wake,
                      Logger& logger, ClockFn clock = system_clock_fn());

    /**
     * @brief Claim the best admissible pending job.
     *
     * The winner is transitioned to processing (with started_at) before the
     * selection lock is released, so concurrent callers never receive the same
     * job. Returns nullopt if nothing is admissible or the queue is paused.
     */
    std::optional<Job> select_next(const AdmissionPredicate& admissible);

    [[nodiscard]] double score(const Job& job, Timestamp now) const noexcept;
    [[nodiscard]] double score(const Job& job) const;

    /// Raise a pending job's tier. Demotion is refused so a pending score never drops.
    CommandOutcome promote(const JobId& id, PriorityTier tier);

    void pause();
    void resume();
    [[nodiscard]] bool is_paused() const noexcept;

    /// Signal idle workers that new work may be selectable.
    void notify_work_available();

private:
    [[nodiscard]] double tier_bonus(PriorityTier tier) const noexcept;

    JobStore& store_;
    ScoringConfig scoring_;
    WakeSignal& wake_;
    Logger& logger_;
    ClockFn clock_;

    std::mutex select_mutex_;
    std::atomic<bool> paused_{false};
};

}  // namespace edit_orchestrator
