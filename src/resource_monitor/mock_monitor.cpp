/**
 * @file mock_monitor.cpp
 * @brief MockMonitor implementation: configurable resource snapshots for testing.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/monitor.hpp"

namespace edit_orchestrator {

namespace {
constexpr uint64_t kMiB = 1024ULL * 1024;
}

MockMonitor::MockMonitor(uint32_t /*sampling_interval_ms*/) {
    // A workstation with an 8 GB accelerator, idle and cool
    static_snapshot_.memory_total_bytes = 16ULL * 1024 * kMiB;
    static_snapshot_.memory_available_bytes = 12ULL * 1024 * kMiB;
    static_snapshot_.cpu_usage_percent = 25.0f;
    static_snapshot_.cpu_temperature_celsius = 45.0f;
    static_snapshot_.accelerator_present = true;
    static_snapshot_.accelerator_temperature_celsius = 50.0f;
    static_snapshot_.accelerator_memory_total_bytes = 8192 * kMiB;
    static_snapshot_.accelerator_memory_used_bytes = 1024 * kMiB;
}

Result<ResourceSnapshot> MockMonitor::read() {
    std::lock_guard lock(mutex_);
    if (use_static_) {
        static_snapshot_.timestamp = std::chrono::system_clock::now();
        last_ = static_snapshot_;
        return static_snapshot_;
    }
    if (index_ >= sequence_.size()) {
        return Error{ErrorCode::Unavailable, "Mock sequence exhausted"};
    }
    auto snap = sequence_[index_++];
    snap.timestamp = std::chrono::system_clock::now();
    last_ = snap;
    return snap;
}

float MockMonitor::cpu_usage() {
    std::lock_guard lock(mutex_);
    return last_ ? last_->cpu_usage_percent : static_snapshot_.cpu_usage_percent;
}

float MockMonitor::accelerator_temperature() {
    std::lock_guard lock(mutex_);
    return last_ ? last_->accelerator_temperature_celsius
                 : static_snapshot_.accelerator_temperature_celsius;
}

void MockMonitor::on_sample(SampleCallback cb) {
    std::lock_guard lock(mutex_);
    callbacks_.push_back(std::move(cb));
}

void MockMonitor::start() { /* no sampling thread; see publish() */ }
void MockMonitor::stop()  { /* no-op for mock */ }

Result<ResourceSnapshot> MockMonitor::publish() {
    auto snap = read();
    if (!snap) return snap;

    std::vector<SampleCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        callbacks = callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(*snap);
    }
    return snap;
}

void MockMonitor::push_snapshot(ResourceSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    use_static_ = false;
    sequence_.push_back(std::move(snapshot));
}

void MockMonitor::set_static_snapshot(ResourceSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    use_static_ = true;
    static_snapshot_ = std::move(snapshot);
}

void MockMonitor::set_cpu(float percent) {
    std::lock_guard lock(mutex_);
    static_snapshot_.cpu_usage_percent = percent;
}

void MockMonitor::set_accelerator_temperature(float celsius) {
    std::lock_guard lock(mutex_);
    static_snapshot_.accelerator_present = true;
    static_snapshot_.accelerator_temperature_celsius = celsius;
}

void MockMonitor::set_accelerator_memory(uint64_t used_mb, uint64_t total_mb) {
    std::lock_guard lock(mutex_);
    static_snapshot_.accelerator_present = true;
    static_snapshot_.accelerator_memory_used_bytes = used_mb * kMiB;
    static_snapshot_.accelerator_memory_total_bytes = total_mb * kMiB;
}

}  // namespace edit_orchestrator
