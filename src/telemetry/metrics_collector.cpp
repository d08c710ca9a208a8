/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace edit_orchestrator {

namespace {

constexpr const char* bool_text(bool value) { return value ? "true" : "false"; }

std::ostringstream begin_event(std::string_view event) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << R"(","ts":")" << iso8601_now() << "\"";
    return oss;
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_resource_snapshot(const ResourceSnapshot& snap) {
    auto oss = begin_event("resource_snapshot");
    oss << R"(,"cpu_pct":)" << snap.cpu_usage_percent
        << R"(,"mem_avail_mb":)" << (snap.memory_available_bytes / (1024 * 1024))
        << R"(,"accel_present":)" << bool_text(snap.accelerator_present)
        << R"(,"accel_temp_c":)" << snap.accelerator_temperature_celsius
        << R"(,"accel_free_mb":)" << snap.accelerator_memory_free_mb()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_governor_state(const GovernorState& state) {
    auto oss = begin_event("governor_state");
    oss << R"(,"can_admit":)" << bool_text(state.can_admit)
        << R"(,"thermal_paused":)" << bool_text(state.thermal_paused)
        << R"(,"cpu_throttled":)" << bool_text(state.cpu_throttled)
        << R"(,"concurrency_limit":)" << state.concurrency_limit
        << R"(,"reserved_accel_mb":)" << state.reserved_accelerator_mb
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_submission(const SubmitRequest& request,
                                         const SubmitOutcome& outcome) {
    auto oss = begin_event("job_submitted");
    oss << R"(,"job":")" << json_escape(request.id) << "\""
        << R"(,"tier":)" << request.priority_tier
        << R"(,"accepted":)" << bool_text(outcome.accepted);
    if (!outcome.accepted) {
        oss << R"(,"reason":")" << json_escape(outcome.reason) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_transition(const Job& job, JobStatus from, JobStatus to) {
    auto oss = begin_event("job_transition");
    oss << R"(,"job":")" << json_escape(job.id) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\""
        << R"(,"retry_count":)" << job.retry_count;
    if (to == JobStatus::Completed && job.started_at && job.completed_at) {
        auto ms = std::chrono::duration_cast<Millis>(*job.completed_at - *job.started_at);
        oss << R"(,"duration_ms":)" << ms.count();
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_retry_decision(const Job& job, const RetryDecision& decision) {
    auto oss = begin_event("retry_decision");
    oss << R"(,"job":")" << json_escape(job.id) << "\""
        << R"(,"attempt":)" << (job.retry_count + 1)
        << R"(,"class":")" << to_string(decision.failure_class) << "\""
        << R"(,"action":")" << to_string(decision.action) << "\""
        << R"(,"delay_ms":)" << decision.delay.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    auto oss = begin_event(event);
    oss << R"(,"data":)" << json_payload << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace edit_orchestrator
