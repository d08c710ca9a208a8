/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "governor/resource_governor.hpp"
#include "retry/retry_manager.hpp"
#include "store/job.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace edit_orchestrator {

/**
 * @brief Collects and writes structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_resource_snapshot(const ResourceSnapshot& snap);
    void record_governor_state(const GovernorState& state);
    void record_submission(const SubmitRequest& request, const SubmitOutcome& outcome);
    void record_job_transition(const Job& job, JobStatus from, JobStatus to);
    void record_retry_decision(const Job& job, const RetryDecision& decision);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace edit_orchestrator
