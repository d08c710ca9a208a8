/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for EditOrchestrator interfaces.
 * @author Dimitris Kafetzis
 *
 * The resource monitor is sampled continuously, so it is bound statically via a
 * concept rather than a virtual interface.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <functional>

namespace edit_orchestrator {

/// Observer invoked on the sampling thread after every published snapshot.
using SampleCallback = std::function<void(const ResourceSnapshot&)>;

// ─────────────────────────────────────────────
// ResourceMonitorLike
// ─────────────────────────────────────────────

/**
 * @concept ResourceMonitorLike
 * @brief Constrains types that can provide resource snapshots to the governor.
 */
template <typename T>
concept ResourceMonitorLike = requires(T monitor, SampleCallback cb) {
    { monitor.read() } -> std::same_as<Result<ResourceSnapshot>>;
    { monitor.cpu_usage() } -> std::convertible_to<float>;
    { monitor.accelerator_temperature() } -> std::convertible_to<float>;
    { monitor.on_sample(cb) } -> std::same_as<void>;
    { monitor.start() } -> std::same_as<void>;
    { monitor.stop() } -> std::same_as<void>;
};

}  // namespace edit_orchestrator
