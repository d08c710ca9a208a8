/**
 * @file idempotency_guard.cpp
 * @brief IdempotencyGuard implementation.
 * @author Dimitris Kafetzis
 */

#include "store/idempotency_guard.hpp"

#include <cmath>

namespace edit_orchestrator {

IdempotencyGuard::IdempotencyGuard(JobStore& store, Logger& logger, ClockFn clock)
    : store_(store), logger_(logger), clock_(std::move(clock)) {}

std::optional<std::string> IdempotencyGuard::validate(const SubmitRequest& request) {
    if (request.id.empty()) {
        return "job id must not be empty";
    }
    if (!is_valid_tier(request.priority_tier)) {
        return "priority tier " + std::to_string(request.priority_tier)
               + " outside [" + std::to_string(kHighestTier) + ", "
               + std::to_string(kLowestTier) + "]";
    }
    if (!std::isfinite(request.quality_score)) {
        return "quality score must be finite";
    }
    return std::nullopt;
}

SubmitOutcome IdempotencyGuard::submit(const SubmitRequest& request) {
    if (auto invalid = validate(request)) {
        logger_.warn("Submission " + request.id + " rejected: " + *invalid);
        return {.accepted = false, .reason = *invalid};
    }

    auto result = store_.insert(make_job(request, clock_()), [](const Job* existing) -> Result<void> {
        if (!existing) return {};
        if (existing->status == JobStatus::DeadLetter && existing->resubmission_allowed) {
            return {};
        }
        return Error{ErrorCode::AlreadyExists,
                     "duplicate: job " + existing->id + " already exists with status "
                     + std::string{to_string(existing->status)}};
    });

    if (!result) {
        logger_.info("Submission " + request.id + " rejected: " + result.error().message);
        return {.accepted = false, .reason = result.error().message};
    }

    logger_.debug("Job " + request.id + " accepted (tier " + std::to_string(request.priority_tier)
                  + ", subject " + request.subject_ref + ")");
    return {.accepted = true, .reason = {}};
}

}  // namespace edit_orchestrator
