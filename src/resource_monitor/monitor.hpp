/**
 * @file monitor.hpp
 * @brief Resource monitor implementations.
 * @author Dimitris Kafetzis
 *
 * Provides LinuxMonitor (reads from /proc, /sys) and MockMonitor (testing).
 * Both satisfy the ResourceMonitorLike concept.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace edit_orchestrator {

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

/**
 * @brief Reads system resources from Linux pseudo-filesystems.
 *
 * Runs a dedicated sampling thread (std::jthread), stores the latest snapshot
 * atomically and notifies sample observers after each publication.
 *
 * Data sources:
 *   /proc/stat                        aggregate CPU utilization
 *   /proc/meminfo                     memory total and available
 *   /sys/class/thermal/thermal_zone0  CPU temperature
 *   /sys/class/drm/cardN/device       accelerator VRAM counters and hwmon
 *                                     temperature (amdgpu-style drivers)
 *   /sys/class/thermal/thermal_zone*  accelerator temperature fallback for
 *                                     zones whose type names a GPU
 */
class LinuxMonitor {
public:
    explicit LinuxMonitor(uint32_t sampling_interval_ms = 2000,
                          std::filesystem::path sysfs_root = "/sys");
    ~LinuxMonitor();

    LinuxMonitor(const LinuxMonitor&) = delete;
    LinuxMonitor& operator=(const LinuxMonitor&) = delete;

    // ResourceMonitorLike interface
    Result<ResourceSnapshot> read();
    float cpu_usage();
    float accelerator_temperature();
    void on_sample(SampleCallback cb);
    void start();
    void stop();

    struct CpuTimesInternal {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

private:
    void sampling_loop(std::stop_token stop);
    ResourceSnapshot sample_once();
    void sample_accelerator(ResourceSnapshot& snap) const;
    void notify(const ResourceSnapshot& snap);

    uint32_t interval_ms_;
    std::filesystem::path sysfs_root_;
    std::jthread sampling_thread_;
    std::atomic<std::shared_ptr<ResourceSnapshot>> latest_;

    CpuTimesInternal prev_cpu_times_{};

    std::mutex callbacks_mutex_;
    std::vector<SampleCallback> callbacks_;

    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Mock resource monitor for testing and simulation.
 *
 * Has no sampling thread: tests drive the governor by calling publish(),
 * which reads the next snapshot and delivers it to the observers.
 */
class MockMonitor {
public:
    explicit MockMonitor(uint32_t sampling_interval_ms = 0);

    // ResourceMonitorLike interface
    Result<ResourceSnapshot> read();
    float cpu_usage();
    float accelerator_temperature();
    void on_sample(SampleCallback cb);
    void start();
    void stop();

    // Test helpers: configure what snapshots are returned
    void push_snapshot(ResourceSnapshot snapshot);
    void set_static_snapshot(ResourceSnapshot snapshot);
    void set_cpu(float percent);
    void set_accelerator_temperature(float celsius);
    void set_accelerator_memory(uint64_t used_mb, uint64_t total_mb);

    /// Read the next snapshot and deliver it to every observer.
    Result<ResourceSnapshot> publish();

private:
    std::mutex mutex_;
    std::vector<ResourceSnapshot> sequence_;
    size_t index_{0};
    ResourceSnapshot static_snapshot_;
    std::optional<ResourceSnapshot> last_;
    bool use_static_{true};
    std::vector<SampleCallback> callbacks_;
};

static_assert(ResourceMonitorLike<LinuxMonitor>);
static_assert(ResourceMonitorLike<MockMonitor>);

}  // namespace edit_orchestrator
