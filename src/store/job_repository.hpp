/**
 * @file job_repository.hpp
 * @brief Durable storage behind the JobStore.
 * @author Dimitris Kafetzis
 *
 * Storage is chosen once at startup, so the repository is a virtual interface
 * (like ILogSink). The store writes every committed mutation through it.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "store/job.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

struct sqlite3;

namespace edit_orchestrator {

class IJobRepository {
public:
    virtual ~IJobRepository() = default;

    /// Insert or replace the full record, including its failure history.
    virtual Result<void> save(const Job& job) = 0;
    virtual Result<void> remove(const JobId& id) = 0;
    virtual Result<std::vector<Job>> load_all() = 0;
};

/**
 * @brief Volatile repository for tests and for `[store] path = ""`.
 */
class InMemoryJobRepository : public IJobRepository {
public:
    Result<void> save(const Job& job) override;
    Result<void> remove(const JobId& id) override;
    Result<std::vector<Job>> load_all() override;

    /// Make every subsequent save fail, to exercise storage error paths.
    void fail_writes(bool fail);

private:
    std::mutex mutex_;
    std::unordered_map<JobId, Job> jobs_;
    bool fail_writes_{false};
};

/**
 * @brief SQLite-backed repository.
 *
 * Schema:
 *   jobs(id PK, subject_ref, priority_tier, quality_score, config BLOB,
 *        accel_memory_mb, status, retry_count, checkpoint_handle,
 *        created_at_ms, started_at_ms, completed_at_ms, error_message,
 *        retry_at_ms, awaiting_resources, resubmission_allowed, sequence)
 *   job_failures(job_id, attempt, at_ms, failure_class, message, delay_ms)
 *
 * Each save() is one transaction: the row is upserted and the failure
 * history rewritten.
 */
struct SqliteCloser {
    void operator()(sqlite3* db) const noexcept;
};
using SqliteHandle = std::unique_ptr<sqlite3, SqliteCloser>;

class SqliteJobRepository : public IJobRepository {
public:
    /// Open (creating if needed) the database and its schema.
    static Result<std::unique_ptr<SqliteJobRepository>> open(const std::filesystem::path& path);

    explicit SqliteJobRepository(SqliteHandle db);
    ~SqliteJobRepository() override;

    SqliteJobRepository(const SqliteJobRepository&) = delete;
    SqliteJobRepository& operator=(const SqliteJobRepository&) = delete;

    Result<void> save(const Job& job) override;
    Result<void> remove(const JobId& id) override;
    Result<std::vector<Job>> load_all() override;

private:
    Result<void> exec(const char* sql);
    Result<void> save_locked(const Job& job);
    Result<void> commit();
    Result<void> abort_transaction(Error cause);

    SqliteHandle db_;
    std::mutex mutex_;
};

/// SQLite at `config.path`, or an in-memory repository when the path is empty.
Result<std::shared_ptr<IJobRepository>> open_repository(const StoreConfig& config);

}  // namespace edit_orchestrator
