/**
 * @file linux_monitor.cpp
 * @brief LinuxMonitor: reads CPU, memory, thermal and accelerator metrics
 *        from Linux pseudo-filesystems (/proc, /sys).
 * @author Dimitris Kafetzis
 *
 * Sampling is performed by a dedicated std::jthread at a configurable
 * interval. The latest snapshot is published atomically for lock-free reads,
 * then handed to the registered observers (the resource governor).
 */

#include "resource_monitor/monitor.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace edit_orchestrator {

using CpuTimes = LinuxMonitor::CpuTimesInternal;
namespace fs = std::filesystem;

// ─────────────────────────────────────────────
// Internal helpers for /proc and /sys parsing
// ─────────────────────────────────────────────
namespace {

std::string read_file_line(const fs::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::vector<std::string> read_file_lines(const fs::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

std::optional<uint64_t> read_u64(const fs::path& path) {
    auto line = read_file_line(path);
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), value);
    if (ec != std::errc{} || ptr == line.data()) return std::nullopt;
    return value;
}

/// sysfs temperatures are reported in millidegrees Celsius.
std::optional<float> read_millidegrees(const fs::path& path) {
    auto value = read_u64(path);
    if (!value) return std::nullopt;
    return static_cast<float>(*value) / 1000.0f;
}

/**
 * @brief Parse a CPU line from /proc/stat.
 * Format: "cpu[N] user nice system idle iowait irq softirq steal ..."
 */
CpuTimes parse_cpu_line(const std::string& line) {
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev.user + prev.nice + prev.system
                     + prev.irq + prev.softirq + prev.steal;
    auto curr_active = curr.user + curr.nice + curr.system
                     + curr.irq + curr.softirq + curr.steal;

    if (curr_total <= prev_total || curr_active < prev_active) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = curr_active - prev_active;
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

MemInfo parse_meminfo() {
    MemInfo info;
    for (const auto& line : read_file_lines("/proc/meminfo")) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        }
    }
    return info;
}

/// First hwmon temp1_input below a DRM device directory.
std::optional<float> read_hwmon_temperature(const fs::path& device_dir) {
    std::error_code ec;
    fs::directory_iterator it(device_dir / "hwmon", ec);
    if (ec) return std::nullopt;
    for (const auto& entry : it) {
        if (auto t = read_millidegrees(entry.path() / "temp1_input")) return t;
    }
    return std::nullopt;
}

/// Thermal zone whose type mentions a GPU, for SoCs without a DRM hwmon.
std::optional<float> read_gpu_thermal_zone(const fs::path& thermal_dir) {
    std::error_code ec;
    fs::directory_iterator it(thermal_dir, ec);
    if (ec) return std::nullopt;
    for (const auto& entry : it) {
        if (!entry.path().filename().string().starts_with("thermal_zone")) continue;
        auto type = read_file_line(entry.path() / "type");
        if (type.find("gpu") == std::string::npos && type.find("GPU") == std::string::npos) {
            continue;
        }
        if (auto t = read_millidegrees(entry.path() / "temp")) return t;
    }
    return std::nullopt;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// LinuxMonitor implementation
// ─────────────────────────────────────────────

LinuxMonitor::LinuxMonitor(uint32_t sampling_interval_ms, fs::path sysfs_root)
    : interval_ms_(sampling_interval_ms), sysfs_root_(std::move(sysfs_root)) {}

LinuxMonitor::~LinuxMonitor() {
    stop();
}

void LinuxMonitor::start() {
    if (sampling_thread_.joinable()) return;

    auto lines = read_file_lines("/proc/stat");
    prev_cpu_times_ = lines.empty() ? CpuTimes{} : parse_cpu_line(lines[0]);

    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
}

void LinuxMonitor::stop() {
    if (sampling_thread_.joinable()) {
        sampling_thread_.request_stop();
        sleep_cv_.notify_all();
        sampling_thread_.join();
    }
}

Result<ResourceSnapshot> LinuxMonitor::read() {
    auto snapshot = latest_.load();
    if (!snapshot) {
        return Error{ErrorCode::Unavailable, "No snapshot available yet"};
    }
    return *snapshot;
}

float LinuxMonitor::cpu_usage() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->cpu_usage_percent : 0.0f;
}

float LinuxMonitor::accelerator_temperature() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->accelerator_temperature_celsius : 0.0f;
}

void LinuxMonitor::on_sample(SampleCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    callbacks_.push_back(std::move(cb));
}

void LinuxMonitor::sampling_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep first so the first CPU delta spans a whole interval.
        {
            std::unique_lock lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, stop, std::chrono::milliseconds(interval_ms_),
                               [] { return false; });
        }
        if (stop.stop_requested()) break;

        auto snapshot = sample_once();
        latest_.store(std::make_shared<ResourceSnapshot>(snapshot));
        notify(snapshot);
    }
}

ResourceSnapshot LinuxMonitor::sample_once() {
    ResourceSnapshot snap;
    snap.timestamp = std::chrono::system_clock::now();

    // CPU Usage
    auto stat_lines = read_file_lines("/proc/stat");
    if (!stat_lines.empty()) {
        auto curr = parse_cpu_line(stat_lines[0]);
        snap.cpu_usage_percent = compute_cpu_percent(prev_cpu_times_, curr);
        prev_cpu_times_ = curr;
    }

    // Memory
    auto mem = parse_meminfo();
    snap.memory_total_bytes = mem.total_kb * 1024;
    snap.memory_available_bytes = mem.available_kb * 1024;

    snap.cpu_temperature_celsius =
        read_millidegrees(sysfs_root_ / "class/thermal/thermal_zone0/temp").value_or(0.0f);

    sample_accelerator(snap);
    return snap;
}

void LinuxMonitor::sample_accelerator(ResourceSnapshot& snap) const {
    std::error_code ec;
    fs::directory_iterator it(sysfs_root_ / "class/drm", ec);
    if (!ec) {
        for (const auto& entry : it) {
            auto name = entry.path().filename().string();
            // card0, card1 ... but not connector nodes such as card0-HDMI-A-1
            if (!name.starts_with("card") || name.find('-') != std::string::npos) continue;

            auto device = entry.path() / "device";
            auto total = read_u64(device / "mem_info_vram_total");
            auto used = read_u64(device / "mem_info_vram_used");
            auto temp = read_hwmon_temperature(device);
            if (!total && !temp) continue;

            snap.accelerator_present = true;
            if (total && used) {
                snap.accelerator_memory_total_bytes = *total;
                snap.accelerator_memory_used_bytes = *used;
            }
            if (temp) snap.accelerator_temperature_celsius = *temp;
            return;
        }
    }

    if (auto temp = read_gpu_thermal_zone(sysfs_root_ / "class/thermal")) {
        snap.accelerator_present = true;
        snap.accelerator_temperature_celsius = *temp;
    }
}

void LinuxMonitor::notify(const ResourceSnapshot& snap) {
    std::lock_guard lock(callbacks_mutex_);
    for (const auto& cb : callbacks_) {
        cb(snap);
    }
}

}  // namespace edit_orchestrator
