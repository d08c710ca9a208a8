/**
 * @file priority_scheduler.cpp
 * @brief PriorityScheduler implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/priority_scheduler.hpp"

#include <algorithm>
#include <chrono>

namespace edit_orchestrator {

PriorityScheduler::PriorityScheduler(JobStore& store, ScoringConfig scoring, WakeSignal& wake,
                                     Logger& logger, ClockFn clock)
    : store_(store)
    , scoring_(scoring)
    , wake_(wake)
    , logger_(logger)
    , clock_(std::move(clock)) {}

double PriorityScheduler::tier_bonus(PriorityTier tier) const noexcept {
    switch (tier) {
        case 1: return scoring_.tier1_bonus;
        case 2: return scoring_.tier2_bonus;
        case 3: return scoring_.tier3_bonus;
        default: return 0.0;
    }
}

double PriorityScheduler::score(const Job& job, Timestamp now) const noexcept {
    using Hours = std::chrono::duration<double, std::ratio<3600>>;
    double age_hours = std::max(0.0, std::chrono::duration_cast<Hours>(now - job.created_at).count());
    double age_bonus = std::min(age_hours / scoring_.age_hours_per_point, scoring_.age_bonus_cap);
    double quality_bonus = job.quality_score >= scoring_.quality_threshold
                               ? scoring_.quality_bonus : 0.0;
    return tier_bonus(job.priority_tier) + age_bonus + quality_bonus;
}

double PriorityScheduler::score(const Job& job) const {
    return score(job, clock_());
}

std::optional<Job> PriorityScheduler::select_next(const AdmissionPredicate& admissible) {
    if (paused_.load()) return std::nullopt;

    std::lock_guard lock(select_mutex_);
    const Timestamp now = clock_();

    struct Candidate {
        JobId id;
        double score;
        Timestamp created_at;
        uint64_t sequence;
    };
    std::optional<Candidate> best;

    auto better = [](const Candidate& a, const Candidate& b) {
        if (a.score > b.score + kScoreEpsilon) return true;
        if (b.score > a.score + kScoreEpsilon) return false;
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.sequence < b.sequence;
    };

    store_.visit(JobStatus::Pending, [&](const Job& job) {
        if (admissible && !admissible(job)) return;
        Candidate candidate{job.id, score(job, now), job.created_at, job.sequence};
        if (!best || better(candidate, *best)) best = std::move(candidate);
    });

    if (!best) return std::nullopt;

    auto claimed = store_.transition(best->id, JobStatus::Pending, JobStatus::Processing,
                                     [now](Job& job) { job.started_at = now; });
    if (!claimed) {
        // Only a concurrent cancel or a storage failure can get here.
        logger_.warn("Claim of job " + best->id + " failed: " + claimed.error().message);
        return std::nullopt;
    }

    claimed->dynamic_score = best->score;
    logger_.debug("Selected job " + best->id + " (score " + std::to_string(best->score) + ")");
    return std::move(claimed).value();
}

CommandOutcome PriorityScheduler::promote(const JobId& id, PriorityTier tier) {
    if (!is_valid_tier(tier)) {
        return {.ok = false, .reason = "priority tier " + std::to_string(tier) + " out of range"};
    }

    std::lock_guard lock(select_mutex_);
    auto current = store_.get(id);
    if (!current) {
        return {.ok = false, .reason = "job " + id + " not found"};
    }
    if (current->priority_tier <= tier) {
        return {.ok = false,
                .reason = "job " + id + " is already tier " + std::to_string(current->priority_tier)
                          + "; only promotion is allowed"};
    }
    auto updated = store_.update(id, JobStatus::Pending,
                                 [tier](Job& job) { job.priority_tier = tier; });
    if (!updated) {
        return {.ok = false, .reason = updated.error().message};
    }

    logger_.info("Job " + id + " promoted to tier " + std::to_string(tier));
    wake_.notify();
    return {.ok = true, .reason = {}};
}

void PriorityScheduler::pause() {
    if (!paused_.exchange(true)) logger_.info("Queue paused by operator");
}

void PriorityScheduler::resume() {
    if (paused_.exchange(false)) {
        logger_.info("Queue resumed by operator");
        wake_.notify();
    }
}

bool PriorityScheduler::is_paused() const noexcept {
    return paused_.load();
}

void PriorityScheduler::notify_work_available() {
    wake_.notify();
}

}  // namespace edit_orchestrator
