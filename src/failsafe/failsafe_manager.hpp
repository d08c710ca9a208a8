/**
 * @file failsafe_manager.hpp
 * @brief Pre-dispatch checkpoints and exactly-once rollback.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "actuator/actuator.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "store/job.hpp"
#include "store/job_store.hpp"

#include <atomic>
#include <cstdint>

namespace edit_orchestrator {

struct FailsafeStats {
    uint64_t checkpoints_taken{0};
    uint64_t checkpoint_failures{0};
    uint64_t rollbacks_succeeded{0};
    uint64_t rollbacks_failed{0};
};

/**
 * @brief Keeps a subject restorable across a failed attempt.
 *
 * The checkpoint handle lives on the job record. rollback() consumes it: the
 * actuator's rollback is invoked and the handle cleared in the store, so a
 * second call for the same attempt is a no-op.
 */
class FailsafeManager {
public:
    FailsafeManager(IActuator& actuator, JobStore& store, Logger& logger);

    /// Checkpoint the subject of a processing job and record the handle.
    ActuatorResult<CheckpointHandle> checkpoint(const Job& job);

    /**
     * @brief Restore the subject of a failed attempt.
     *
     * Returns success without calling the actuator when the job holds no
     * handle (checkpoint never taken, or already rolled back).
     */
    ActuatorResult<void> rollback(const JobId& id);

    [[nodiscard]] FailsafeStats stats() const noexcept;

private:
    IActuator& actuator_;
    JobStore& store_;
    Logger& logger_;

    std::atomic<uint64_t> checkpoints_taken_{0};
    std::atomic<uint64_t> checkpoint_failures_{0};
    std::atomic<uint64_t> rollbacks_succeeded_{0};
    std::atomic<uint64_t> rollbacks_failed_{0};
};

}  // namespace edit_orchestrator
