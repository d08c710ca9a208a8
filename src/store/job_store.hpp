/**
 * @file job_store.hpp
 * @brief Authoritative record of all jobs and their lifecycle state.
 * @author Dimitris Kafetzis
 *
 * Every mutation is validated against the lifecycle table, written through to
 * the repository, and only then made visible. A failed write leaves the
 * in-memory record untouched, so readers always observe the last committed
 * transition.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "store/job.hpp"
#include "store/job_repository.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace edit_orchestrator {

/// Observer of committed status changes (metrics, logging).
using TransitionListener = std::function<void(const Job& job, JobStatus from, JobStatus to)>;

class JobStore {
public:
    /// Approves an insertion given the existing record with the same id (or nullptr).
    using InsertCheck = std::function<Result<void>(const Job* existing)>;
    using Mutator = std::function<void(Job&)>;

    JobStore(IJobRepository& repository, Logger& logger);

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /// Replace in-memory state with the repository contents. Returns the record count.
    Result<size_t> load();

    /**
     * @brief Insert a job atomically with respect to other inserts.
     *
     * `check` runs under the store lock; a rejection leaves the store and the
     * repository untouched. An approved insert over an existing record
     * replaces it.
     */
    Result<Job> insert(Job job, const InsertCheck& check);

    [[nodiscard]] std::optional<Job> get(const JobId& id) const;

    /// Matching jobs in insertion order.
    [[nodiscard]] std::vector<Job> list(const JobFilter& filter = {}) const;

    /// Invoke `visitor` for each job in `status` under a shared lock.
    void visit(JobStatus status, const std::function<void(const Job&)>& visitor) const;

    /**
     * @brief Compare-and-set status change.
     *
     * Fails with InvalidState if the job is not currently in `from`, or if the
     * edge is not in the lifecycle table.
     */
    Result<Job> transition(const JobId& id, JobStatus from, JobStatus to,
                           const Mutator& mutate = {});

    /// Mutate fields of a job that must currently be in `expected`; status unchanged.
    Result<Job> update(const JobId& id, JobStatus expected, const Mutator& mutate);

    /// Delete a job only if it is still pending.
    Result<Job> remove_pending(const JobId& id);

    [[nodiscard]] std::map<JobStatus, size_t> counts() const;
    [[nodiscard]] size_t size() const;

    void on_transition(TransitionListener listener);

private:
    Result<Job> commit(const JobId& id, JobStatus expected, std::optional<JobStatus> to,
                       const Mutator& mutate);
    void notify(const Job& job, JobStatus from, JobStatus to);

    IJobRepository& repository_;
    Logger& logger_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<JobId, Job> jobs_;
    uint64_t next_sequence_{1};

    std::mutex listeners_mutex_;
    std::vector<TransitionListener> listeners_;
};

}  // namespace edit_orchestrator
