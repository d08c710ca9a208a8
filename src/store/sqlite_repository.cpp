/**
 * @file sqlite_repository.cpp
 * @brief SqliteJobRepository: job records in a local SQLite database.
 * @author Dimitris Kafetzis
 */

#include "store/job_repository.hpp"

#include <sqlite3.h>

#include <unordered_map>

namespace edit_orchestrator {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS jobs (
    id                   TEXT PRIMARY KEY,
    subject_ref          TEXT NOT NULL,
    priority_tier        INTEGER NOT NULL,
    quality_score        REAL NOT NULL,
    config               BLOB,
    accel_memory_mb      INTEGER NOT NULL DEFAULT 0,
    status               TEXT NOT NULL,
    retry_count          INTEGER NOT NULL DEFAULT 0,
    checkpoint_handle    TEXT,
    created_at_ms        INTEGER NOT NULL,
    started_at_ms        INTEGER,
    completed_at_ms      INTEGER,
    error_message        TEXT,
    retry_at_ms          INTEGER,
    awaiting_resources   INTEGER NOT NULL DEFAULT 0,
    resubmission_allowed INTEGER NOT NULL DEFAULT 0,
    sequence             INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_jobs_status ON jobs(status);
CREATE TABLE IF NOT EXISTS job_failures (
    job_id        TEXT NOT NULL,
    attempt       INTEGER NOT NULL,
    at_ms         INTEGER NOT NULL,
    failure_class TEXT NOT NULL,
    message       TEXT NOT NULL,
    delay_ms      INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (job_id, attempt)
);
)sql";

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Error storage_error(sqlite3* db, std::string_view what) {
    return Error{ErrorCode::Storage,
                 std::string{what} + ": " + sqlite3_errmsg(db)};
}

Result<Statement> prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return storage_error(db, "prepare failed");
    }
    return Statement{raw};
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& text) {
    sqlite3_bind_text(stmt, idx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& text) {
    if (text) bind_text(stmt, idx, *text);
    else sqlite3_bind_null(stmt, idx);
}

void bind_optional_time(sqlite3_stmt* stmt, int idx, const std::optional<Timestamp>& ts) {
    if (ts) sqlite3_bind_int64(stmt, idx, to_epoch_ms(*ts));
    else sqlite3_bind_null(stmt, idx);
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

std::optional<Timestamp> column_optional_time(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return from_epoch_ms(sqlite3_column_int64(stmt, col));
}

std::string column_blob(sqlite3_stmt* stmt, int col) {
    const void* data = sqlite3_column_blob(stmt, col);
    if (!data) return {};
    return std::string(static_cast<const char*>(data),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

}  // anonymous namespace

Result<std::unique_ptr<SqliteJobRepository>> SqliteJobRepository::open(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::Storage,
                         "cannot create directory " + path.parent_path().string()
                         + ": " + ec.message()};
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
        Error err{ErrorCode::Storage,
                  "cannot open " + path.string() + ": "
                  + (db ? sqlite3_errmsg(db) : "out of memory")};
        sqlite3_close(db);
        return err;
    }
    sqlite3_busy_timeout(db, 5000);

    auto repo = std::make_unique<SqliteJobRepository>(SqliteHandle{db});
    if (auto r = repo->exec("PRAGMA journal_mode=WAL;"); !r) return r.error();
    if (auto r = repo->exec("PRAGMA synchronous=NORMAL;"); !r) return r.error();
    if (auto r = repo->exec(kSchema); !r) return r.error();
    return repo;
}

void SqliteCloser::operator()(sqlite3* db) const noexcept {
    sqlite3_close(db);
}

SqliteJobRepository::SqliteJobRepository(SqliteHandle db) : db_(std::move(db)) {}

SqliteJobRepository::~SqliteJobRepository() = default;

Result<void> SqliteJobRepository::exec(const char* sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        return Error{ErrorCode::Storage, "sqlite exec failed: " + message};
    }
    return {};
}

Result<void> SqliteJobRepository::save(const Job& job) {
    std::lock_guard lock(mutex_);
    if (auto r = exec("BEGIN IMMEDIATE;"); !r) return r;
    auto result = save_locked(job);
    if (!result) return abort_transaction(result.error());
    return commit();
}

Result<void> SqliteJobRepository::commit() {
    auto committed = exec("COMMIT;");
    if (!committed) return abort_transaction(committed.error());
    return committed;
}

Result<void> SqliteJobRepository::abort_transaction(Error cause) {
    // A failed COMMIT leaves the transaction open; end it so the next BEGIN works.
    if (auto rolled_back = exec("ROLLBACK;"); !rolled_back) {
        cause.message += "; rollback failed: " + rolled_back.error().message;
    }
    return cause;
}

Result<void> SqliteJobRepository::save_locked(const Job& job) {
    sqlite3* db = db_.get();

    auto upsert = prepare(db, R"sql(
        INSERT OR REPLACE INTO jobs (
            id, subject_ref, priority_tier, quality_score, config, accel_memory_mb,
            status, retry_count, checkpoint_handle, created_at_ms, started_at_ms,
            completed_at_ms, error_message, retry_at_ms, awaiting_resources,
            resubmission_allowed, sequence)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17);
    )sql");
    if (!upsert) return upsert.error();

    sqlite3_stmt* stmt = upsert->get();
    bind_text(stmt, 1, job.id);
    bind_text(stmt, 2, job.subject_ref);
    sqlite3_bind_int(stmt, 3, job.priority_tier);
    sqlite3_bind_double(stmt, 4, job.quality_score);
    sqlite3_bind_blob(stmt, 5, job.config.data(), static_cast<int>(job.config.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(job.requirement.accelerator_memory_mb));
    bind_text(stmt, 7, std::string{to_string(job.status)});
    sqlite3_bind_int(stmt, 8, static_cast<int>(job.retry_count));
    bind_optional_text(stmt, 9, job.checkpoint_handle);
    sqlite3_bind_int64(stmt, 10, to_epoch_ms(job.created_at));
    bind_optional_time(stmt, 11, job.started_at);
    bind_optional_time(stmt, 12, job.completed_at);
    bind_optional_text(stmt, 13, job.error_message);
    bind_optional_time(stmt, 14, job.retry_at);
    sqlite3_bind_int(stmt, 15, job.awaiting_resources ? 1 : 0);
    sqlite3_bind_int(stmt, 16, job.resubmission_allowed ? 1 : 0);
    sqlite3_bind_int64(stmt, 17, static_cast<sqlite3_int64>(job.sequence));
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return storage_error(db, "upsert job " + job.id);
    }

    auto clear = prepare(db, "DELETE FROM job_failures WHERE job_id = ?1;");
    if (!clear) return clear.error();
    bind_text(clear->get(), 1, job.id);
    if (sqlite3_step(clear->get()) != SQLITE_DONE) {
        return storage_error(db, "clear failures of " + job.id);
    }

    if (job.failure_history.empty()) return {};

    auto insert = prepare(db, R"sql(
        INSERT INTO job_failures (job_id, attempt, at_ms, failure_class, message, delay_ms)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6);
    )sql");
    if (!insert) return insert.error();
    for (const auto& failure : job.failure_history) {
        sqlite3_stmt* ins = insert->get();
        sqlite3_reset(ins);
        sqlite3_clear_bindings(ins);
        bind_text(ins, 1, job.id);
        sqlite3_bind_int(ins, 2, static_cast<int>(failure.attempt));
        sqlite3_bind_int64(ins, 3, to_epoch_ms(failure.at));
        bind_text(ins, 4, std::string{to_string(failure.failure_class)});
        bind_text(ins, 5, failure.message);
        sqlite3_bind_int64(ins, 6, failure.delay.count());
        if (sqlite3_step(ins) != SQLITE_DONE) {
            return storage_error(db, "insert failure of " + job.id);
        }
    }
    return {};
}

Result<void> SqliteJobRepository::remove(const JobId& id) {
    std::lock_guard lock(mutex_);
    sqlite3* db = db_.get();
    if (auto r = exec("BEGIN IMMEDIATE;"); !r) return r;

    for (const char* sql : {"DELETE FROM job_failures WHERE job_id = ?1;",
                            "DELETE FROM jobs WHERE id = ?1;"}) {
        auto stmt = prepare(db, sql);
        if (!stmt) return abort_transaction(stmt.error());
        bind_text(stmt->get(), 1, id);
        if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
            return abort_transaction(storage_error(db, "delete job " + id));
        }
    }
    return commit();
}

Result<std::vector<Job>> SqliteJobRepository::load_all() {
    std::lock_guard lock(mutex_);
    sqlite3* db = db_.get();

    auto select = prepare(db, R"sql(
        SELECT id, subject_ref, priority_tier, quality_score, config, accel_memory_mb,
               status, retry_count, checkpoint_handle, created_at_ms, started_at_ms,
               completed_at_ms, error_message, retry_at_ms, awaiting_resources,
               resubmission_allowed, sequence
        FROM jobs ORDER BY sequence;
    )sql");
    if (!select) return select.error();

    std::vector<Job> jobs;
    std::unordered_map<JobId, size_t> index;
    sqlite3_stmt* stmt = select->get();
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Job job;
        job.id = column_text(stmt, 0);
        job.subject_ref = column_text(stmt, 1);
        job.priority_tier = sqlite3_column_int(stmt, 2);
        job.quality_score = sqlite3_column_double(stmt, 3);
        job.config = column_blob(stmt, 4);
        job.requirement.accelerator_memory_mb =
            static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));

        auto status_text = column_text(stmt, 6);
        auto status = parse_job_status(status_text);
        if (!status) {
            return Error{ErrorCode::Storage,
                         "job " + job.id + " has unknown status '" + status_text + "'"};
        }
        job.status = *status;
        job.retry_count = static_cast<uint32_t>(sqlite3_column_int(stmt, 7));
        job.checkpoint_handle = column_optional_text(stmt, 8);
        job.created_at = from_epoch_ms(sqlite3_column_int64(stmt, 9));
        job.started_at = column_optional_time(stmt, 10);
        job.completed_at = column_optional_time(stmt, 11);
        job.error_message = column_optional_text(stmt, 12);
        job.retry_at = column_optional_time(stmt, 13);
        job.awaiting_resources = sqlite3_column_int(stmt, 14) != 0;
        job.resubmission_allowed = sqlite3_column_int(stmt, 15) != 0;
        job.sequence = static_cast<uint64_t>(sqlite3_column_int64(stmt, 16));

        index.emplace(job.id, jobs.size());
        jobs.push_back(std::move(job));
    }
    if (rc != SQLITE_DONE) {
        return storage_error(db, "load jobs");
    }

    auto failures = prepare(db, R"sql(
        SELECT job_id, attempt, at_ms, failure_class, message, delay_ms
        FROM job_failures ORDER BY job_id, attempt;
    )sql");
    if (!failures) return failures.error();

    stmt = failures->get();
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto it = index.find(column_text(stmt, 0));
        if (it == index.end()) continue;
        FailureRecord record;
        record.attempt = static_cast<uint32_t>(sqlite3_column_int(stmt, 1));
        record.at = from_epoch_ms(sqlite3_column_int64(stmt, 2));
        record.failure_class = parse_failure_class(column_text(stmt, 3));
        record.message = column_text(stmt, 4);
        record.delay = Millis{sqlite3_column_int64(stmt, 5)};
        jobs[it->second].failure_history.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        return storage_error(db, "load failures");
    }
    return jobs;
}

Result<std::shared_ptr<IJobRepository>> open_repository(const StoreConfig& config) {
    if (config.path.empty()) {
        return std::shared_ptr<IJobRepository>(std::make_shared<InMemoryJobRepository>());
    }
    auto repo = SqliteJobRepository::open(config.path);
    if (!repo) return repo.error();
    return std::shared_ptr<IJobRepository>(std::move(*repo));
}

}  // namespace edit_orchestrator
