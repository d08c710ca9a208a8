/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade: ties all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Submitting, cancelling and inspecting edit jobs
 *   2. Operator commands (promote, pause/resume, allow resubmission)
 *   3. Monitoring queue state and resource pressure
 *
 * Template-parameterized on MonitorT for testability (LinuxMonitor or MockMonitor).
 */

#pragma once

#include "actuator/actuator.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/dispatch_runner.hpp"
#include "executor/timer_queue.hpp"
#include "executor/wake_signal.hpp"
#include "executor/worker_pool.hpp"
#include "failsafe/failsafe_manager.hpp"
#include "governor/resource_governor.hpp"
#include "resource_monitor/monitor.hpp"
#include "retry/retry_manager.hpp"
#include "scheduler/priority_scheduler.hpp"
#include "store/idempotency_guard.hpp"
#include "store/job.hpp"
#include "store/job_repository.hpp"
#include "store/job_store.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace edit_orchestrator {

/**
 * @brief Queue-level counters for operators.
 */
struct QueueStats {
    std::map<JobStatus, size_t> by_status;
    std::map<PriorityTier, size_t> pending_by_tier;
    uint32_t active_workers = 0;
    size_t parked_jobs = 0;
    size_t scheduled_retries = 0;
    bool paused = false;
    GovernorState governor;
    FailsafeStats failsafe;
};

/**
 * @brief The top-level Orchestrator that wires all modules together.
 *
 * Template parameters allow injecting MockMonitor for testing.
 */
template <ResourceMonitorLike MonitorT = LinuxMonitor>
class Orchestrator {
public:
    struct Options {
        Config config;
        std::shared_ptr<IJobRepository> repository;      ///< in-memory if null
        std::unique_ptr<ILogSink> log_sink;              ///< discarded if null
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;          ///< metrics off if null
        std::optional<uint32_t> retry_seed;
        ClockFn clock = system_clock_fn();
    };

    /// `actuator` is not owned and must outlive the orchestrator.
    Orchestrator(Options opts, IActuator& actuator);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Lifecycle ────────────────────────────
    /// Load persisted jobs, recover in-flight work, then start all threads.
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Upstream API ─────────────────────────
    SubmitOutcome submit(const SubmitRequest& request);
    CommandOutcome cancel(const JobId& id);
    [[nodiscard]] Result<Job> get_job(const JobId& id) const;
    [[nodiscard]] std::vector<Job> list_jobs(const JobFilter& filter = {}) const;

    // ── Operator API ─────────────────────────
    CommandOutcome promote(const JobId& id, PriorityTier tier);
    CommandOutcome allow_resubmission(const JobId& id);
    void pause_queue();
    void resume_queue();
    [[nodiscard]] QueueStats stats() const;

    /// Block until nothing is pending or processing, or the timeout expires.
    bool wait_idle(Millis timeout) const;

    // ── Accessors (for testing) ─────────────
    MonitorT& monitor() { return monitor_; }
    ResourceGovernor& governor() { return governor_; }
    JobStore& store() { return store_; }
    Logger& logger() { return logger_; }
    MetricsCollector* metrics() { return metrics_.get(); }
    const Config& config() const { return config_; }

private:
    void fill_score(Job& job) const;

    Config config_;
    Logger logger_;
    ClockFn clock_;
    IActuator& actuator_;
    std::shared_ptr<IJobRepository> repository_;
    std::unique_ptr<MetricsCollector> metrics_;
    MonitorT monitor_;

    // Job state
    JobStore store_;
    WakeSignal wake_;
    IdempotencyGuard guard_;

    // Admission and selection
    ResourceGovernor governor_;
    PriorityScheduler scheduler_;

    // Execution
    RetryManager retry_;
    FailsafeManager failsafe_;
    TimerQueue timers_;
    DispatchRunner dispatcher_;
    WorkerPool workers_;

    std::atomic<bool> running_{false};
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <ResourceMonitorLike MonitorT>
Orchestrator<MonitorT>::Orchestrator(Options opts, IActuator& actuator)
    : config_(std::move(opts.config))
    , logger_(opts.log_sink ? std::move(opts.log_sink)
                            : std::unique_ptr<ILogSink>(std::make_unique<NullSink>()),
              opts.log_level)
    , clock_(std::move(opts.clock))
    , actuator_(actuator)
    , repository_(opts.repository
                  ? std::move(opts.repository)
                  : std::shared_ptr<IJobRepository>(std::make_shared<InMemoryJobRepository>()))
    , metrics_(opts.metrics_sink && config_.telemetry.metrics
               ? std::make_unique<MetricsCollector>(std::move(opts.metrics_sink))
               : nullptr)
    , monitor_(config_.governor.sampling_interval_ms)
    , store_(*repository_, logger_)
    , guard_(store_, logger_, clock_)
    , governor_(config_.governor, config_.engine.max_workers, logger_)
    , scheduler_(store_, config_.scheduler, wake_, logger_, clock_)
    , retry_(config_.retry, logger_, opts.retry_seed)
    , failsafe_(actuator_, store_, logger_)
    , timers_(logger_)
    , dispatcher_(actuator_,
                  config_.engine.dispatch_threads == 0 ? config_.engine.max_workers
                                                       : config_.engine.dispatch_threads,
                  logger_)
    , workers_(config_.engine,
               WorkerPoolDeps{
                   .store = store_,
                   .scheduler = scheduler_,
                   .governor = governor_,
                   .failsafe = failsafe_,
                   .retry = retry_,
                   .dispatcher = dispatcher_,
                   .timers = timers_,
                   .wake = wake_,
                   .logger = logger_,
                   .metrics = metrics_.get()},
               clock_) {

    monitor_.on_sample([this](const ResourceSnapshot& snap) {
        governor_.update(snap);
        if (metrics_) metrics_->record_resource_snapshot(snap);
    });

    governor_.subscribe([this](const GovernorState& state, bool changed) {
        workers_.on_governor_sample(state, changed);
        if (changed && metrics_) metrics_->record_governor_state(state);
    });

    store_.on_transition([this](const Job& job, JobStatus from, JobStatus to) {
        if (metrics_) metrics_->record_job_transition(job, from, to);
    });
}

template <ResourceMonitorLike MonitorT>
Orchestrator<MonitorT>::~Orchestrator() {
    stop();
}

template <ResourceMonitorLike MonitorT>
Result<void> Orchestrator<MonitorT>::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Already running"};
    }

    logger_.info("Orchestrator starting: workers=" + std::to_string(config_.engine.max_workers)
                 + " dispatch_threads=" + std::to_string(dispatcher_.thread_count()));

    auto loaded = store_.load();
    if (!loaded) {
        running_ = false;
        logger_.error("Failed to load jobs: " + loaded.error().message);
        return loaded.error();
    }
    logger_.info("Loaded " + std::to_string(*loaded) + " persisted jobs");

    workers_.recover_in_flight();

    timers_.start();
    workers_.start();
    monitor_.start();

    logger_.info("Orchestrator started successfully");
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
void Orchestrator<MonitorT>::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Orchestrator shutting down...");
    monitor_.stop();
    // In-flight dispatches finish and settle; only the stage timeout cuts them short.
    workers_.stop();
    timers_.stop();
    if (metrics_) metrics_->flush();
    logger_.info("Orchestrator stopped");
    logger_.flush();
}

// ── Upstream API ─────────────────────────────

template <ResourceMonitorLike MonitorT>
SubmitOutcome Orchestrator<MonitorT>::submit(const SubmitRequest& request) {
    auto outcome = guard_.submit(request);
    if (metrics_) metrics_->record_submission(request, outcome);
    if (outcome.accepted) {
        scheduler_.notify_work_available();
    }
    return outcome;
}

template <ResourceMonitorLike MonitorT>
CommandOutcome Orchestrator<MonitorT>::cancel(const JobId& id) {
    auto removed = store_.remove_pending(id);
    if (!removed) {
        return CommandOutcome{.ok = false, .reason = removed.error().message};
    }
    logger_.info("Job " + id + " cancelled");
    if (metrics_) {
        metrics_->record_custom("job_cancelled", "{\"job\":\"" + json_escape(id) + "\"}");
    }
    return CommandOutcome{.ok = true, .reason = {}};
}

template <ResourceMonitorLike MonitorT>
Result<Job> Orchestrator<MonitorT>::get_job(const JobId& id) const {
    auto job = store_.get(id);
    if (!job) {
        return make_error<Job>(ErrorCode::NotFound, "job " + id + " not found");
    }
    fill_score(*job);
    return *job;
}

template <ResourceMonitorLike MonitorT>
std::vector<Job> Orchestrator<MonitorT>::list_jobs(const JobFilter& filter) const {
    auto jobs = store_.list(filter);
    for (auto& job : jobs) {
        fill_score(job);
    }
    return jobs;
}

template <ResourceMonitorLike MonitorT>
void Orchestrator<MonitorT>::fill_score(Job& job) const {
    if (job.status == JobStatus::Pending) {
        job.dynamic_score = scheduler_.score(job, clock_());
    }
}

// ── Operator API ─────────────────────────────

template <ResourceMonitorLike MonitorT>
CommandOutcome Orchestrator<MonitorT>::promote(const JobId& id, PriorityTier tier) {
    return scheduler_.promote(id, tier);
}

template <ResourceMonitorLike MonitorT>
CommandOutcome Orchestrator<MonitorT>::allow_resubmission(const JobId& id) {
    auto job = store_.get(id);
    if (!job) {
        return CommandOutcome{.ok = false, .reason = "job " + id + " not found"};
    }
    if (job->status != JobStatus::DeadLetter) {
        return CommandOutcome{.ok = false,
                              .reason = "job " + id + " is " + std::string{to_string(job->status)}
                                        + "; only dead-lettered jobs can be resubmitted"};
    }
    auto updated = store_.update(id, JobStatus::DeadLetter, [](Job& j) {
        j.resubmission_allowed = true;
    });
    if (!updated) {
        return CommandOutcome{.ok = false, .reason = updated.error().message};
    }
    logger_.info("Resubmission allowed for job " + id);
    return CommandOutcome{.ok = true, .reason = {}};
}

template <ResourceMonitorLike MonitorT>
void Orchestrator<MonitorT>::pause_queue() {
    scheduler_.pause();
}

template <ResourceMonitorLike MonitorT>
void Orchestrator<MonitorT>::resume_queue() {
    scheduler_.resume();
}

template <ResourceMonitorLike MonitorT>
QueueStats Orchestrator<MonitorT>::stats() const {
    QueueStats out;
    out.by_status = store_.counts();
    for (PriorityTier tier = kHighestTier; tier <= kLowestTier; ++tier) {
        out.pending_by_tier[tier] = 0;
    }
    store_.visit(JobStatus::Pending, [&](const Job& job) {
        ++out.pending_by_tier[job.priority_tier];
    });
    out.active_workers = workers_.active_count();
    out.parked_jobs = workers_.parked_count();
    out.scheduled_retries = timers_.pending();
    out.paused = scheduler_.is_paused();
    out.governor = governor_.state();
    out.failsafe = failsafe_.stats();
    return out;
}

template <ResourceMonitorLike MonitorT>
bool Orchestrator<MonitorT>::wait_idle(Millis timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto counts = store_.counts();
        if (counts[JobStatus::Pending] == 0 && counts[JobStatus::Processing] == 0) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace edit_orchestrator
