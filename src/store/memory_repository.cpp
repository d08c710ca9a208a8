/**
 * @file memory_repository.cpp
 * @brief InMemoryJobRepository implementation.
 * @author Dimitris Kafetzis
 */

#include "store/job_repository.hpp"

#include <algorithm>

namespace edit_orchestrator {

Result<void> InMemoryJobRepository::save(const Job& job) {
    std::lock_guard lock(mutex_);
    if (fail_writes_) {
        return Error{ErrorCode::Storage, "write rejected for job " + job.id};
    }
    jobs_[job.id] = job;
    return {};
}

Result<void> InMemoryJobRepository::remove(const JobId& id) {
    std::lock_guard lock(mutex_);
    if (fail_writes_) {
        return Error{ErrorCode::Storage, "delete rejected for job " + id};
    }
    jobs_.erase(id);
    return {};
}

Result<std::vector<Job>> InMemoryJobRepository::load_all() {
    std::lock_guard lock(mutex_);
    std::vector<Job> out;
    out.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
        out.push_back(job);
    }
    std::sort(out.begin(), out.end(),
              [](const Job& a, const Job& b) { return a.sequence < b.sequence; });
    return out;
}

void InMemoryJobRepository::fail_writes(bool fail) {
    std::lock_guard lock(mutex_);
    fail_writes_ = fail;
}

}  // namespace edit_orchestrator
