/**
 * @file job.hpp
 * @brief Job record, submission request and lifecycle transition table.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace edit_orchestrator {

/**
 * @brief One failed attempt, appended to a job's failure history.
 */
struct FailureRecord {
    uint32_t attempt{0};                 ///< 1-based attempt number
    Timestamp at;
    FailureClass failure_class{FailureClass::Unclassified};
    std::string message;
    Millis delay{0};                     ///< backoff chosen for the retry (0 if none)
};

/**
 * @brief A unit of work tracked by the engine.
 *
 * `config` is an opaque payload passed through to the actuator unmodified.
 */
struct Job {
    JobId id;
    SubjectRef subject_ref;
    PriorityTier priority_tier{kLowestTier};
    double quality_score{0.0};
    std::string config;
    ResourceRequirement requirement;

    JobStatus status{JobStatus::Pending};
    uint32_t retry_count{0};
    std::optional<CheckpointHandle> checkpoint_handle;

    Timestamp created_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    std::optional<std::string> error_message;
    std::vector<FailureRecord> failure_history;

    std::optional<Timestamp> retry_at;   ///< set while a timer-driven retry is scheduled
    bool awaiting_resources{false};      ///< set while a resource retry waits on the governor
    bool resubmission_allowed{false};    ///< operator flag on dead-lettered jobs

    uint64_t sequence{0};                ///< store insertion order
    double dynamic_score{0.0};           ///< derived on read, never persisted
};

/**
 * @brief Upstream submission request.
 */
struct SubmitRequest {
    JobId id;
    SubjectRef subject_ref;
    PriorityTier priority_tier{kLowestTier};
    double quality_score{0.0};
    std::string config;
    ResourceRequirement requirement;
};

struct SubmitOutcome {
    bool accepted{false};
    std::string reason;
};

/// Outcome of an operator command (cancel, promote, allow-resubmission).
struct CommandOutcome {
    bool ok{false};
    std::string reason;
};

/**
 * @brief Filter for listing jobs; unset fields match everything.
 */
struct JobFilter {
    std::optional<JobStatus> status;
    std::optional<SubjectRef> subject_ref;

    [[nodiscard]] bool matches(const Job& job) const noexcept {
        if (status && job.status != *status) return false;
        if (subject_ref && job.subject_ref != *subject_ref) return false;
        return true;
    }
};

/**
 * @brief Lifecycle state machine. Only these edges are legal:
 *
 *   pending    → processing                 (selection)
 *   processing → completed | dead_letter    (outcome)
 *   processing → pending                    (retry re-entry)
 */
[[nodiscard]] constexpr bool can_transition(JobStatus from, JobStatus to) noexcept {
    switch (from) {
        case JobStatus::Pending:
            return to == JobStatus::Processing;
        case JobStatus::Processing:
            return to == JobStatus::Completed
                || to == JobStatus::DeadLetter
                || to == JobStatus::Pending;
        case JobStatus::Completed:
        case JobStatus::Failed:
        case JobStatus::DeadLetter:
            return false;
    }
    return false;
}

/// Build a fresh pending job from a request.
[[nodiscard]] Job make_job(const SubmitRequest& request, Timestamp now);

}  // namespace edit_orchestrator
