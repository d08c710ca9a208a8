/**
 * @file idempotency_guard.hpp
 * @brief Submission gate: validation and duplicate rejection.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "store/job.hpp"
#include "store/job_store.hpp"

#include <optional>
#include <string>

namespace edit_orchestrator {

/**
 * @brief Admits each job id at most once.
 *
 * The existence check and the insert happen under the store lock, so two
 * concurrent submissions of the same id cannot both be accepted. The only
 * id that may be reused is a dead-lettered one an operator has released for
 * resubmission.
 */
class IdempotencyGuard {
public:
    IdempotencyGuard(JobStore& store, Logger& logger, ClockFn clock = system_clock_fn());

    SubmitOutcome submit(const SubmitRequest& request);

    /// Validation only; no store access.
    [[nodiscard]] static std::optional<std::string> validate(const SubmitRequest& request);

private:
    JobStore& store_;
    Logger& logger_;
    ClockFn clock_;
};

}  // namespace edit_orchestrator
