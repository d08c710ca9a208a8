/**
 * @file resource_governor.hpp
 * @brief Admission control derived from periodic resource samples.
 * @author Dimitris Kafetzis
 *
 * The governor is the only writer of resource-pressure state. It applies
 * hysteresis to CPU and accelerator temperature readings, tracks accelerator
 * memory reserved by in-flight jobs, and exposes a cheap admission predicate
 * to the scheduler.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace edit_orchestrator {

/**
 * @brief Point-in-time view of the governor's decisions.
 */
struct GovernorState {
    bool can_admit{true};
    bool thermal_paused{false};
    bool cpu_throttled{false};
    uint32_t concurrency_limit{0};
    uint64_t reserved_accelerator_mb{0};
    std::optional<ResourceSnapshot> last_sample;
};

/// Invoked after every sample; `changed` is true when admission or the limit moved.
using GovernorListener = std::function<void(const GovernorState& state, bool changed)>;

class ResourceGovernor {
public:
    ResourceGovernor(GovernorConfig config, uint32_t max_workers, Logger& logger);

    /// Feed a new sample. Called from the monitor's sampling thread.
    void update(const ResourceSnapshot& snapshot);

    /// False while the thermal pause is engaged.
    [[nodiscard]] bool can_admit() const;

    /// Maximum number of concurrently executing jobs right now.
    [[nodiscard]] uint32_t concurrency_limit() const;

    /// can_admit() and enough accelerator memory for the requirement.
    [[nodiscard]] bool admits(const ResourceRequirement& requirement) const;

    /// Reserve accelerator memory for a claimed job until release().
    void reserve(const JobId& id, const ResourceRequirement& requirement);
    void release(const JobId& id);

    [[nodiscard]] GovernorState state() const;

    void subscribe(GovernorListener listener);

private:
    [[nodiscard]] uint64_t available_accelerator_mb_locked() const;
    [[nodiscard]] GovernorState state_locked() const;

    GovernorConfig config_;
    uint32_t max_workers_;
    Logger& logger_;

    mutable std::shared_mutex mutex_;
    bool thermal_paused_{false};
    bool cpu_throttled_{false};
    std::optional<ResourceSnapshot> last_sample_;
    std::unordered_map<JobId, uint64_t> reservations_;
    uint64_t reserved_mb_{0};

    std::mutex listeners_mutex_;
    std::vector<GovernorListener> listeners_;
};

}  // namespace edit_orchestrator
