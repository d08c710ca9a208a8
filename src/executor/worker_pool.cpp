/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/worker_pool.hpp"

#include <algorithm>

namespace edit_orchestrator {

namespace {

constexpr const char* kRestartMessage = "interrupted by engine restart; outcome unknown";

bool is_storage_failure(const Error& error) {
    return error.code == ErrorCode::Storage;
}

}  // anonymous namespace

WorkerPool::WorkerPool(EngineConfig config, WorkerPoolDeps deps, ClockFn clock)
    : config_(config), deps_(deps), clock_(std::move(clock)) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_.exchange(true)) return;

    workers_.reserve(config_.max_workers);
    for (uint32_t i = 0; i < config_.max_workers; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
    deps_.logger.info("Worker pool started with " + std::to_string(config_.max_workers)
                      + " workers");
}

void WorkerPool::stop() {
    if (!running_.exchange(false)) return;

    for (auto& worker : workers_) {
        worker.request_stop();
    }
    deps_.wake.notify();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
    deps_.logger.info("Worker pool stopped");
}

// ─────────────────────────────────────────────
// Worker loop
// ─────────────────────────────────────────────

void WorkerPool::worker_loop(std::stop_token stop) {
    const Millis idle_poll{config_.idle_poll_ms};

    while (!stop.stop_requested()) {
        const auto seen = deps_.wake.generation();

        if (!try_acquire_slot()) {
            deps_.wake.wait(stop, seen, idle_poll);
            continue;
        }

        std::optional<Job> job;
        {
            std::lock_guard lock(claim_mutex_);
            if (stop.stop_requested()) {
                release_slot();
                break;
            }
            job = deps_.scheduler.select_next([this](const Job& candidate) {
                return deps_.governor.admits(candidate.requirement);
            });
            if (job) {
                deps_.governor.reserve(job->id, job->requirement);
            }
        }

        if (!job) {
            release_slot();
            deps_.wake.wait(stop, seen, idle_poll);
            continue;
        }

        deps_.logger.debug("Claimed job " + job->id + " (score "
                           + std::to_string(job->dynamic_score) + ")");
        execute(*job);
        release_slot();
        deps_.wake.notify();
    }
}

bool WorkerPool::try_acquire_slot() {
    const auto limit = std::min(config_.max_workers, deps_.governor.concurrency_limit());
    std::lock_guard lock(slot_mutex_);
    if (active_ >= limit) return false;
    ++active_;
    return true;
}

void WorkerPool::release_slot() {
    std::lock_guard lock(slot_mutex_);
    if (active_ > 0) --active_;
}

uint32_t WorkerPool::active_count() const {
    std::lock_guard lock(slot_mutex_);
    return active_;
}

// ─────────────────────────────────────────────
// Attempt execution
// ─────────────────────────────────────────────

void WorkerPool::execute(const Job& job) {
    auto handle = deps_.failsafe.checkpoint(job);
    if (!handle) {
        deps_.governor.release(job.id);
        handle_failure(job.id, handle.error());
        return;
    }

    // Shutdown does not interrupt the call; the stage timeout still bounds it.
    auto outcome = deps_.dispatcher.run(job.subject_ref, job.config,
                                        Millis{config_.stage_timeout_ms});

    // The reservation must be gone before the job can re-enter pending.
    deps_.governor.release(job.id);

    if (outcome) {
        complete(job);
    } else {
        handle_failure(job.id, outcome.error());
    }
}

void WorkerPool::complete(const Job& job) {
    const auto now = clock_();
    auto result = deps_.store.transition(job.id, JobStatus::Processing, JobStatus::Completed,
        [now](Job& j) {
            j.completed_at = now;
            j.retry_at.reset();
            j.awaiting_resources = false;
        });
    if (!result) {
        deps_.logger.error("Failed to complete job " + job.id + ": " + result.error().message);
        if (is_storage_failure(result.error())) {
            settle_later(job.id, [this, job] { complete(job); });
        }
        return;
    }
    deps_.logger.info("Job " + job.id + " completed");
}

void WorkerPool::handle_failure(const JobId& id, const ActuatorError& error) {
    auto rolled_back = deps_.failsafe.rollback(id);

    auto current = deps_.store.get(id);
    if (!current) {
        deps_.logger.error("Failed job " + id + " vanished from the store");
        return;
    }

    if (!rolled_back) {
        FailureRecord record{
            .attempt = current->retry_count + 1,
            .at = clock_(),
            .failure_class = RetryManager::classify(error),
            .message = error.message + "; rollback failed: " + rolled_back.error().message,
            .delay = Millis{0}
        };
        auto message = record.message;
        dead_letter(id, std::move(record), std::move(message));
        return;
    }

    auto decision = deps_.retry.handle_failure(*current, error);
    if (deps_.metrics) {
        deps_.metrics->record_retry_decision(*current, decision);
    }
    apply(*current, error, decision);
}

void WorkerPool::apply(const Job& job, const ActuatorError& error,
                       const RetryDecision& decision) {
    const auto now = clock_();
    FailureRecord record{
        .attempt = job.retry_count + 1,
        .at = now,
        .failure_class = decision.failure_class,
        .message = error.message,
        .delay = decision.delay
    };

    switch (decision.action) {
        case RetryDecision::Action::RetryAfterDelay: {
            const Timestamp retry_at = now + decision.delay;
            auto result = deps_.store.update(job.id, JobStatus::Processing,
                [&](Job& j) {
                    ++j.retry_count;
                    j.failure_history.push_back(record);
                    j.error_message = error.message;
                    j.retry_at = retry_at;
                    j.checkpoint_handle.reset();
                });
            if (!result) {
                deps_.logger.error("Failed to record retry for job " + job.id + ": "
                                   + result.error().message);
                if (is_storage_failure(result.error())) {
                    settle_later(job.id, [this, job, error, decision] {
                        apply(job, error, decision);
                    });
                }
                return;
            }
            arm_retry(job.id, decision.delay);
            break;
        }
        case RetryDecision::Action::RetryWhenResourcesFree: {
            auto result = deps_.store.update(job.id, JobStatus::Processing,
                [&](Job& j) {
                    ++j.retry_count;
                    j.failure_history.push_back(record);
                    j.error_message = error.message;
                    j.awaiting_resources = true;
                    j.checkpoint_handle.reset();
                });
            if (!result) {
                deps_.logger.error("Failed to record resource wait for job " + job.id + ": "
                                   + result.error().message);
                if (is_storage_failure(result.error())) {
                    settle_later(job.id, [this, job, error, decision] {
                        apply(job, error, decision);
                    });
                }
                return;
            }
            park(job.id);
            break;
        }
        case RetryDecision::Action::DeadLetter:
            dead_letter(job.id, std::move(record), decision.reason);
            break;
    }
}

void WorkerPool::dead_letter(const JobId& id, FailureRecord record, std::string message) {
    const auto now = clock_();
    auto result = deps_.store.transition(id, JobStatus::Processing, JobStatus::DeadLetter,
        [&](Job& j) {
            j.failure_history.push_back(record);
            j.error_message = message;
            j.completed_at = now;
            j.retry_at.reset();
            j.awaiting_resources = false;
            j.checkpoint_handle.reset();
        });
    if (!result) {
        deps_.logger.error("Failed to dead-letter job " + id + ": " + result.error().message);
        if (is_storage_failure(result.error())) {
            settle_later(id, [this, id, record, message] { dead_letter(id, record, message); });
        }
        return;
    }
    deps_.logger.warn("Job " + id + " dead-lettered: " + message);
}

// ─────────────────────────────────────────────
// Retry re-entry
// ─────────────────────────────────────────────

void WorkerPool::arm_retry(const JobId& id, Millis delay) {
    if (delay < Millis{0}) delay = Millis{0};
    deps_.logger.debug("Retry of " + id + " armed in " + std::to_string(delay.count()) + "ms");
    deps_.timers.schedule_after(delay, [this, id] { requeue(id); });
}

void WorkerPool::park(const JobId& id) {
    {
        std::lock_guard lock(parked_mutex_);
        parked_.insert(id);
    }
    deps_.logger.info("Job " + id + " parked until accelerator resources free up");
}

void WorkerPool::settle_later(const JobId& id, std::function<void()> step) {
    const Millis delay{config_.idle_poll_ms};
    deps_.logger.warn("Settling job " + id + " again in " + std::to_string(delay.count())
                      + "ms");
    deps_.timers.schedule_after(delay, std::move(step));
}

void WorkerPool::requeue(const JobId& id) {
    auto result = deps_.store.transition(id, JobStatus::Processing, JobStatus::Pending,
        [](Job& j) {
            j.retry_at.reset();
            j.awaiting_resources = false;
            j.checkpoint_handle.reset();
            j.started_at.reset();
        });
    if (!result) {
        deps_.logger.error("Failed to requeue job " + id + ": " + result.error().message);
        if (!is_storage_failure(result.error())) {
            std::lock_guard lock(parked_mutex_);
            parked_.erase(id);
            return;
        }
        bool parked = false;
        {
            std::lock_guard lock(parked_mutex_);
            parked = parked_.contains(id);
        }
        // A parked job is retried by the next admitting governor sample.
        if (!parked) {
            settle_later(id, [this, id] { requeue(id); });
        }
        return;
    }
    {
        std::lock_guard lock(parked_mutex_);
        parked_.erase(id);
    }
    deps_.logger.debug("Job " + id + " re-entered pending");
    deps_.wake.notify();
}

void WorkerPool::on_governor_sample(const GovernorState& state, bool changed) {
    // Freed accelerator memory can make a skipped pending job admissible.
    if (changed || state.can_admit) {
        deps_.wake.notify();
    }
    if (!state.can_admit) return;

    std::vector<JobId> candidates;
    {
        std::lock_guard lock(parked_mutex_);
        candidates.assign(parked_.begin(), parked_.end());
    }

    for (const auto& id : candidates) {
        auto job = deps_.store.get(id);
        if (!job || job->status != JobStatus::Processing || !job->awaiting_resources) {
            std::lock_guard lock(parked_mutex_);
            parked_.erase(id);
            continue;
        }
        if (deps_.governor.admits(job->requirement)) {
            deps_.logger.info("Resources available again for job " + id);
            requeue(id);
        }
    }
}

size_t WorkerPool::parked_count() const {
    std::lock_guard lock(parked_mutex_);
    return parked_.size();
}

// ─────────────────────────────────────────────
// Crash recovery
// ─────────────────────────────────────────────

size_t WorkerPool::recover_in_flight() {
    std::vector<Job> interrupted;
    deps_.store.visit(JobStatus::Processing, [&](const Job& job) {
        interrupted.push_back(job);
    });

    const auto now = clock_();
    for (const auto& job : interrupted) {
        if (job.retry_at) {
            auto delay = std::chrono::duration_cast<Millis>(*job.retry_at - now);
            deps_.logger.info("Recovered scheduled retry of job " + job.id);
            arm_retry(job.id, delay);
        } else if (job.awaiting_resources) {
            deps_.logger.info("Recovered resource wait of job " + job.id);
            park(job.id);
        } else {
            deps_.logger.warn("Job " + job.id + " was in flight at shutdown; rolling back");
            handle_failure(job.id, ActuatorError{FailureClass::Transient, kRestartMessage});
        }
    }
    if (!interrupted.empty()) {
        deps_.logger.info("Recovered " + std::to_string(interrupted.size())
                          + " in-flight jobs");
    }
    return interrupted.size();
}

}  // namespace edit_orchestrator
