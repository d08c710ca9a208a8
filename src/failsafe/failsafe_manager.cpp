/**
 * @file failsafe_manager.cpp
 * @brief FailsafeManager implementation.
 * @author Dimitris Kafetzis
 */

#include "failsafe/failsafe_manager.hpp"

namespace edit_orchestrator {

FailsafeManager::FailsafeManager(IActuator& actuator, JobStore& store, Logger& logger)
    : actuator_(actuator), store_(store), logger_(logger) {}

ActuatorResult<CheckpointHandle> FailsafeManager::checkpoint(const Job& job) {
    auto handle = actuator_.checkpoint(job.subject_ref);
    if (!handle) {
        ++checkpoint_failures_;
        logger_.warn("Checkpoint of " + job.subject_ref + " for job " + job.id + " failed: "
                     + handle.error().message);
        return handle;
    }

    auto recorded = store_.update(job.id, JobStatus::Processing,
                                  [&](Job& j) { j.checkpoint_handle = *handle; });
    if (!recorded) {
        // The subject is untouched at this point, so nothing to undo.
        ++checkpoint_failures_;
        return ActuatorError{FailureClass::Transient,
                             "recording checkpoint failed: " + recorded.error().message};
    }

    ++checkpoints_taken_;
    logger_.debug("Checkpoint " + *handle + " taken for job " + job.id);
    return handle;
}

ActuatorResult<void> FailsafeManager::rollback(const JobId& id) {
    auto job = store_.get(id);
    if (!job || !job->checkpoint_handle) return {};

    const CheckpointHandle handle = *job->checkpoint_handle;
    auto restored = actuator_.rollback(handle);

    // Clear the handle whatever the outcome: a rollback is attempted once per failed attempt.
    auto cleared = store_.update(id, job->status,
                                 [](Job& j) { j.checkpoint_handle.reset(); });
    if (!cleared) {
        logger_.error("Clearing checkpoint " + handle + " of job " + id + " failed: "
                      + cleared.error().message);
    }

    if (!restored) {
        ++rollbacks_failed_;
        logger_.error("Rollback of job " + id + " from " + handle + " failed: "
                      + restored.error().message);
        return restored;
    }

    ++rollbacks_succeeded_;
    logger_.info("Job " + id + " rolled back to " + handle);
    return {};
}

FailsafeStats FailsafeManager::stats() const noexcept {
    return FailsafeStats{
        .checkpoints_taken = checkpoints_taken_.load(),
        .checkpoint_failures = checkpoint_failures_.load(),
        .rollbacks_succeeded = rollbacks_succeeded_.load(),
        .rollbacks_failed = rollbacks_failed_.load(),
    };
}

}  // namespace edit_orchestrator
