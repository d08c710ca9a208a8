/**
 * @file types.hpp
 * @brief Fundamental types used throughout EditOrchestrator.
 * @author Dimitris Kafetzis
 *
 * Defines JobId, JobStatus, PriorityTier, ResourceSnapshot, and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace edit_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using SubjectRef = std::string;
using CheckpointHandle = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Millis = std::chrono::milliseconds;

/// Injectable wall clock; tests pin "now" to make scoring deterministic.
using ClockFn = std::function<Timestamp()>;

[[nodiscard]] inline ClockFn system_clock_fn() {
    return [] { return std::chrono::system_clock::now(); };
}

/// Milliseconds since the Unix epoch, the persisted form of a Timestamp.
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<Millis>(ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_epoch_ms(int64_t ms) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(Millis{ms})};
}

// ─────────────────────────────────────────────
// Job Status
// ─────────────────────────────────────────────

enum class JobStatus : uint8_t {
    Pending,       ///< Waiting for selection
    Processing,    ///< Claimed by a worker, or waiting for a scheduled retry
    Completed,     ///< Finished successfully (terminal)
    Failed,        ///< Record-compatible status; never assigned by the engine
    DeadLetter     ///< Retries exhausted or fatal failure (terminal)
};

[[nodiscard]] constexpr std::string_view to_string(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending:    return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed:  return "completed";
        case JobStatus::Failed:     return "failed";
        case JobStatus::DeadLetter: return "dead_letter";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<JobStatus> parse_job_status(std::string_view text) noexcept {
    if (text == "pending")     return JobStatus::Pending;
    if (text == "processing")  return JobStatus::Processing;
    if (text == "completed")   return JobStatus::Completed;
    if (text == "failed")      return JobStatus::Failed;
    if (text == "dead_letter") return JobStatus::DeadLetter;
    return std::nullopt;
}

[[nodiscard]] constexpr bool is_terminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::DeadLetter;
}

// ─────────────────────────────────────────────
// Priority
// ─────────────────────────────────────────────

/// 1 = highest priority, 3 = lowest.
using PriorityTier = int;

inline constexpr PriorityTier kHighestTier = 1;
inline constexpr PriorityTier kLowestTier = 3;

[[nodiscard]] constexpr bool is_valid_tier(PriorityTier tier) noexcept {
    return tier >= kHighestTier && tier <= kLowestTier;
}

// ─────────────────────────────────────────────
// Failure Classification
// ─────────────────────────────────────────────

enum class FailureClass : uint8_t {
    Unclassified,  ///< Actuator gave no class; the retry manager decides
    Transient,     ///< Network, timeout, busy
    Resource,      ///< Accelerator out of memory and similar
    Fatal          ///< Malformed payload, non-retryable
};

[[nodiscard]] constexpr std::string_view to_string(FailureClass cls) noexcept {
    switch (cls) {
        case FailureClass::Unclassified: return "unclassified";
        case FailureClass::Transient:    return "transient";
        case FailureClass::Resource:     return "resource";
        case FailureClass::Fatal:        return "fatal";
    }
    return "unknown";
}

[[nodiscard]] constexpr FailureClass parse_failure_class(std::string_view text) noexcept {
    if (text == "transient") return FailureClass::Transient;
    if (text == "resource")  return FailureClass::Resource;
    if (text == "fatal")     return FailureClass::Fatal;
    return FailureClass::Unclassified;
}

// ─────────────────────────────────────────────
// Resource Requirement / Snapshot
// ─────────────────────────────────────────────

/**
 * @brief Declared resource requirement of a job.
 *
 * Jobs that need no accelerator memory declare 0 and are only subject to the
 * global thermal and CPU gates.
 */
struct ResourceRequirement {
    uint64_t accelerator_memory_mb{0};

    auto operator<=>(const ResourceRequirement&) const = default;
};

/**
 * @brief A point-in-time snapshot of the host's compute resources.
 *
 * Read from Linux pseudo-filesystems (/proc, /sys) by the ResourceMonitor.
 * Immutable once constructed; safe for lock-free sharing via atomic shared_ptr.
 */
struct ResourceSnapshot {
    Timestamp timestamp;

    float cpu_usage_percent{0.0f};                    ///< Aggregate CPU [0.0, 100.0]

    uint64_t memory_available_bytes{0};
    uint64_t memory_total_bytes{0};

    float cpu_temperature_celsius{0.0f};

    bool accelerator_present{false};
    float accelerator_temperature_celsius{0.0f};
    uint64_t accelerator_memory_total_bytes{0};       ///< 0 when the driver exposes no VRAM counters
    uint64_t accelerator_memory_used_bytes{0};

    [[nodiscard]] constexpr float memory_usage_percent() const noexcept {
        if (memory_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(memory_total_bytes - memory_available_bytes)
               / static_cast<float>(memory_total_bytes);
    }

    [[nodiscard]] constexpr uint64_t accelerator_memory_free_mb() const noexcept {
        if (accelerator_memory_used_bytes >= accelerator_memory_total_bytes) return 0;
        return (accelerator_memory_total_bytes - accelerator_memory_used_bytes) / (1024 * 1024);
    }
};

}  // namespace edit_orchestrator
