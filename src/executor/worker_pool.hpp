/**
 * @file worker_pool.hpp
 * @brief Executor threads that claim, checkpoint, dispatch and settle jobs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/dispatch_runner.hpp"
#include "executor/timer_queue.hpp"
#include "executor/wake_signal.hpp"
#include "failsafe/failsafe_manager.hpp"
#include "governor/resource_governor.hpp"
#include "retry/retry_manager.hpp"
#include "scheduler/priority_scheduler.hpp"
#include "store/job_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace edit_orchestrator {

/**
 * @brief Collaborators a WorkerPool drives. All must outlive the pool.
 */
struct WorkerPoolDeps {
    JobStore& store;
    PriorityScheduler& scheduler;
    ResourceGovernor& governor;
    FailsafeManager& failsafe;
    RetryManager& retry;
    DispatchRunner& dispatcher;
    TimerQueue& timers;
    WakeSignal& wake;
    Logger& logger;
    MetricsCollector* metrics{nullptr};
};

/**
 * @brief Fixed set of executor threads.
 *
 * At most min(max_workers, governor.concurrency_limit()) threads hold a job at
 * once. A job leaves a worker either settled (completed / dead_letter) or
 * waiting for a retry: on a backoff timer, or parked until the governor
 * admits its resource requirement. Neither kind of wait holds a slot.
 */
class WorkerPool {
public:
    WorkerPool(EngineConfig config, WorkerPoolDeps deps, ClockFn clock = system_clock_fn());
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();
    /**
     * @brief Stop and join all workers.
     *
     * A worker holding a job lets its dispatch run to completion (bounded by
     * the stage timeout) and settles it before exiting.
     */
    void stop();

    /**
     * @brief Resume jobs left in processing by a previous run.
     *
     * Must run before start(). Scheduled retries are re-armed, resource waits
     * re-parked, and anything else is rolled back and retried as a transient
     * failure with unknown outcome. Returns the number of jobs handled.
     */
    size_t recover_in_flight();

    /// Governor listener: wakes workers and releases parked jobs that now fit.
    void on_governor_sample(const GovernorState& state, bool changed);

    [[nodiscard]] uint32_t active_count() const;
    [[nodiscard]] size_t parked_count() const;
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

private:
    void worker_loop(std::stop_token stop);
    bool try_acquire_slot();
    void release_slot();

    void execute(const Job& job);
    void complete(const Job& job);
    void handle_failure(const JobId& id, const ActuatorError& error);
    void apply(const Job& job, const ActuatorError& error, const RetryDecision& decision);
    void dead_letter(const JobId& id, FailureRecord record, std::string message);

    void arm_retry(const JobId& id, Millis delay);
    void park(const JobId& id);
    void requeue(const JobId& id);
    /// Re-run a settle step whose store write failed, after idle_poll_ms.
    void settle_later(const JobId& id, std::function<void()> step);

    EngineConfig config_;
    WorkerPoolDeps deps_;
    ClockFn clock_;

    std::vector<std::jthread> workers_;
    std::atomic<bool> running_{false};

    mutable std::mutex slot_mutex_;
    uint32_t active_{0};

    /// Serializes select + reserve so admission sees every earlier reservation.
    std::mutex claim_mutex_;

    mutable std::mutex parked_mutex_;
    std::set<JobId> parked_;
};

}  // namespace edit_orchestrator
