/**
 * @file job_store.cpp
 * @brief JobStore implementation: write-through map with CAS transitions.
 * @author Dimitris Kafetzis
 */

#include "store/job_store.hpp"

#include <algorithm>

namespace edit_orchestrator {

JobStore::JobStore(IJobRepository& repository, Logger& logger)
    : repository_(repository), logger_(logger) {}

Result<size_t> JobStore::load() {
    auto loaded = repository_.load_all();
    if (!loaded) return loaded.error();

    std::unique_lock lock(mutex_);
    jobs_.clear();
    next_sequence_ = 1;
    for (auto& job : *loaded) {
        next_sequence_ = std::max(next_sequence_, job.sequence + 1);
        auto id = job.id;
        jobs_.insert_or_assign(std::move(id), std::move(job));
    }
    logger_.info("Job store loaded " + std::to_string(jobs_.size()) + " records");
    return jobs_.size();
}

Result<Job> JobStore::insert(Job job, const InsertCheck& check) {
    std::optional<JobStatus> replaced;
    {
        std::unique_lock lock(mutex_);
        auto it = jobs_.find(job.id);
        const Job* existing = it == jobs_.end() ? nullptr : &it->second;
        if (check) {
            if (auto approved = check(existing); !approved) return approved.error();
        }
        if (existing) replaced = existing->status;

        job.sequence = next_sequence_;
        if (auto saved = repository_.save(job); !saved) {
            logger_.error("Persisting job " + job.id + " failed: " + saved.error().message);
            return saved.error();
        }
        ++next_sequence_;
        jobs_.insert_or_assign(job.id, job);
    }
    if (replaced) {
        logger_.info("Job " + job.id + " resubmitted over " + std::string{to_string(*replaced)}
                     + " record");
    }
    return job;
}

std::optional<Job> JobStore::get(const JobId& id) const {
    std::shared_lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::vector<Job> JobStore::list(const JobFilter& filter) const {
    std::vector<Job> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, job] : jobs_) {
            if (filter.matches(job)) out.push_back(job);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const Job& a, const Job& b) { return a.sequence < b.sequence; });
    return out;
}

void JobStore::visit(JobStatus status, const std::function<void(const Job&)>& visitor) const {
    std::shared_lock lock(mutex_);
    for (const auto& [id, job] : jobs_) {
        if (job.status == status) visitor(job);
    }
}

Result<Job> JobStore::transition(const JobId& id, JobStatus from, JobStatus to,
                                 const Mutator& mutate) {
    if (!can_transition(from, to)) {
        return Error{ErrorCode::InvalidState,
                     "illegal transition " + std::string{to_string(from)} + " -> "
                     + std::string{to_string(to)}};
    }
    auto result = commit(id, from, to, mutate);
    if (result) notify(*result, from, to);
    return result;
}

Result<Job> JobStore::update(const JobId& id, JobStatus expected, const Mutator& mutate) {
    return commit(id, expected, std::nullopt, mutate);
}

Result<Job> JobStore::commit(const JobId& id, JobStatus expected, std::optional<JobStatus> to,
                             const Mutator& mutate) {
    std::unique_lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "job " + id + " not found"};
    }
    if (it->second.status != expected) {
        return Error{ErrorCode::InvalidState,
                     "job " + id + " is " + std::string{to_string(it->second.status)}
                     + ", expected " + std::string{to_string(expected)}};
    }

    Job next = it->second;
    if (mutate) mutate(next);
    if (to) next.status = *to;

    if (auto saved = repository_.save(next); !saved) {
        logger_.error("Persisting job " + id + " failed: " + saved.error().message);
        return saved.error();
    }
    it->second = next;
    return next;
}

Result<Job> JobStore::remove_pending(const JobId& id) {
    std::unique_lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorCode::NotFound, "job " + id + " not found"};
    }
    if (it->second.status != JobStatus::Pending) {
        return Error{ErrorCode::InvalidState,
                     "job " + id + " is " + std::string{to_string(it->second.status)}
                     + "; only pending jobs can be cancelled"};
    }
    if (auto removed = repository_.remove(id); !removed) {
        logger_.error("Deleting job " + id + " failed: " + removed.error().message);
        return removed.error();
    }
    Job job = std::move(it->second);
    jobs_.erase(it);
    return job;
}

std::map<JobStatus, size_t> JobStore::counts() const {
    std::map<JobStatus, size_t> out{
        {JobStatus::Pending, 0}, {JobStatus::Processing, 0}, {JobStatus::Completed, 0},
        {JobStatus::Failed, 0}, {JobStatus::DeadLetter, 0}};
    std::shared_lock lock(mutex_);
    for (const auto& [id, job] : jobs_) {
        ++out[job.status];
    }
    return out;
}

size_t JobStore::size() const {
    std::shared_lock lock(mutex_);
    return jobs_.size();
}

void JobStore::on_transition(TransitionListener listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void JobStore::notify(const Job& job, JobStatus from, JobStatus to) {
    std::vector<TransitionListener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(job, from, to);
    }
}

}  // namespace edit_orchestrator
