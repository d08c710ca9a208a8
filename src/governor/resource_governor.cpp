/**
 * @file resource_governor.cpp
 * @brief ResourceGovernor implementation: hysteresis and memory ledger.
 * @author Dimitris Kafetzis
 */

#include "governor/resource_governor.hpp"

#include <algorithm>

namespace edit_orchestrator {

ResourceGovernor::ResourceGovernor(GovernorConfig config, uint32_t max_workers, Logger& logger)
    : config_(std::move(config))
    , max_workers_(std::max<uint32_t>(max_workers, 1))
    , logger_(logger) {}

void ResourceGovernor::update(const ResourceSnapshot& snapshot) {
    GovernorState state;
    bool changed = false;
    {
        std::unique_lock lock(mutex_);
        const bool was_paused = thermal_paused_;
        const bool was_throttled = cpu_throttled_;

        if (snapshot.accelerator_present) {
            const float temp = snapshot.accelerator_temperature_celsius;
            if (!thermal_paused_ && temp > config_.accelerator_temp_limit_celsius) {
                thermal_paused_ = true;
            } else if (thermal_paused_ && temp < config_.accelerator_temp_resume_celsius) {
                thermal_paused_ = false;
            }
        }

        const float cpu = snapshot.cpu_usage_percent;
        if (!cpu_throttled_ && cpu > config_.cpu_ceiling_percent) {
            cpu_throttled_ = true;
        } else if (cpu_throttled_ && cpu < config_.cpu_resume_percent) {
            cpu_throttled_ = false;
        }

        last_sample_ = snapshot;
        changed = was_paused != thermal_paused_ || was_throttled != cpu_throttled_;
        state = state_locked();

        if (was_paused != thermal_paused_) {
            logger_.warn(std::string{"Governor: thermal pause "}
                         + (thermal_paused_ ? "engaged" : "released")
                         + " at " + std::to_string(snapshot.accelerator_temperature_celsius) + "C");
        }
        if (was_throttled != cpu_throttled_) {
            logger_.warn(std::string{"Governor: CPU throttle "}
                         + (cpu_throttled_ ? "engaged" : "released")
                         + " at " + std::to_string(snapshot.cpu_usage_percent)
                         + "%, concurrency limit " + std::to_string(state.concurrency_limit));
        }
    }

    std::vector<GovernorListener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(state, changed);
    }
}

bool ResourceGovernor::can_admit() const {
    std::shared_lock lock(mutex_);
    return !thermal_paused_;
}

uint32_t ResourceGovernor::concurrency_limit() const {
    std::shared_lock lock(mutex_);
    return state_locked().concurrency_limit;
}

bool ResourceGovernor::admits(const ResourceRequirement& requirement) const {
    std::shared_lock lock(mutex_);
    if (thermal_paused_) return false;
    if (requirement.accelerator_memory_mb == 0) return true;
    if (!last_sample_ || last_sample_->accelerator_memory_total_bytes == 0) {
        // No VRAM telemetry: memory gating disabled.
        return true;
    }
    return requirement.accelerator_memory_mb <= available_accelerator_mb_locked();
}

void ResourceGovernor::reserve(const JobId& id, const ResourceRequirement& requirement) {
    if (requirement.accelerator_memory_mb == 0) return;
    std::unique_lock lock(mutex_);
    auto [it, inserted] = reservations_.try_emplace(id, requirement.accelerator_memory_mb);
    if (inserted) reserved_mb_ += requirement.accelerator_memory_mb;
}

void ResourceGovernor::release(const JobId& id) {
    std::unique_lock lock(mutex_);
    auto it = reservations_.find(id);
    if (it == reservations_.end()) return;
    reserved_mb_ -= it->second;
    reservations_.erase(it);
}

GovernorState ResourceGovernor::state() const {
    std::shared_lock lock(mutex_);
    return state_locked();
}

void ResourceGovernor::subscribe(GovernorListener listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

uint64_t ResourceGovernor::available_accelerator_mb_locked() const {
    uint64_t free_mb = last_sample_->accelerator_memory_free_mb();
    uint64_t committed = config_.accelerator_memory_reserve_mb + reserved_mb_;
    return free_mb > committed ? free_mb - committed : 0;
}

GovernorState ResourceGovernor::state_locked() const {
    GovernorState state;
    state.thermal_paused = thermal_paused_;
    state.cpu_throttled = cpu_throttled_;
    state.can_admit = !thermal_paused_;
    state.concurrency_limit = cpu_throttled_ ? std::max<uint32_t>(max_workers_ / 2, 1)
                                             : max_workers_;
    state.reserved_accelerator_mb = reserved_mb_;
    state.last_sample = last_sample_;
    return state;
}

}  // namespace edit_orchestrator
