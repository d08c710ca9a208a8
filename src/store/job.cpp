/**
 * @file job.cpp
 * @brief Job construction helpers.
 * @author Dimitris Kafetzis
 */

#include "store/job.hpp"

namespace edit_orchestrator {

Job make_job(const SubmitRequest& request, Timestamp now) {
    Job job;
    job.id = request.id;
    job.subject_ref = request.subject_ref;
    job.priority_tier = request.priority_tier;
    job.quality_score = request.quality_score;
    job.config = request.config;
    job.requirement = request.requirement;
    job.status = JobStatus::Pending;
    job.retry_count = 0;
    job.created_at = now;
    return job;
}

}  // namespace edit_orchestrator
