/**
 * @file test_monitor.cpp
 * @brief Unit tests for MockMonitor and LinuxMonitor.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/monitor.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace edit_orchestrator;

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024;

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path);
    ofs << content << '\n';
}

}  // namespace

// ─── MockMonitor ─────────────────────────────

TEST(MockMonitorTest, DefaultSnapshot) {
    MockMonitor monitor;
    monitor.start();

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(result->cpu_usage_percent, 25.0f);
    EXPECT_TRUE(result->accelerator_present);
    EXPECT_FLOAT_EQ(result->accelerator_temperature_celsius, 50.0f);
    EXPECT_EQ(result->accelerator_memory_free_mb(), 7168u);
}

TEST(MockMonitorTest, SetCpuAndTemperature) {
    MockMonitor monitor;
    monitor.set_cpu(85.5f);
    monitor.set_accelerator_temperature(77.0f);

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(result->cpu_usage_percent, 85.5f);
    EXPECT_FLOAT_EQ(monitor.cpu_usage(), 85.5f);
    EXPECT_FLOAT_EQ(monitor.accelerator_temperature(), 77.0f);
}

TEST(MockMonitorTest, SetAcceleratorMemory) {
    MockMonitor monitor;
    monitor.set_accelerator_memory(6000, 8000);

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->accelerator_memory_total_bytes, 8000 * kMiB);
    EXPECT_EQ(result->accelerator_memory_free_mb(), 2000u);
}

TEST(MockMonitorTest, SequenceMode) {
    MockMonitor monitor;

    ResourceSnapshot snap1;
    snap1.cpu_usage_percent = 10.0f;
    ResourceSnapshot snap2;
    snap2.cpu_usage_percent = 90.0f;

    monitor.push_snapshot(snap1);
    monitor.push_snapshot(snap2);

    auto r1 = monitor.read();
    ASSERT_TRUE(r1.has_value());
    EXPECT_FLOAT_EQ(r1->cpu_usage_percent, 10.0f);

    auto r2 = monitor.read();
    ASSERT_TRUE(r2.has_value());
    EXPECT_FLOAT_EQ(r2->cpu_usage_percent, 90.0f);

    // Sequence exhausted
    auto r3 = monitor.read();
    ASSERT_FALSE(r3.has_value());
    EXPECT_EQ(r3.error().code, ErrorCode::Unavailable);
}

TEST(MockMonitorTest, SetStaticAfterSequence) {
    MockMonitor monitor;

    ResourceSnapshot snap;
    snap.cpu_usage_percent = 50.0f;
    monitor.push_snapshot(snap);
    (void)monitor.read();  // consume sequence

    ResourceSnapshot static_snap;
    static_snap.cpu_usage_percent = 30.0f;
    monitor.set_static_snapshot(static_snap);

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(result->cpu_usage_percent, 30.0f);
}

TEST(MockMonitorTest, PublishNotifiesObservers) {
    MockMonitor monitor;
    int calls = 0;
    float seen_cpu = 0.0f;
    monitor.on_sample([&](const ResourceSnapshot& snap) {
        ++calls;
        seen_cpu = snap.cpu_usage_percent;
    });

    monitor.set_cpu(42.0f);
    ASSERT_TRUE(monitor.publish().has_value());
    ASSERT_TRUE(monitor.publish().has_value());
    EXPECT_EQ(calls, 2);
    EXPECT_FLOAT_EQ(seen_cpu, 42.0f);
}

TEST(MockMonitorTest, PublishOnExhaustedSequenceSkipsObservers) {
    MockMonitor monitor;
    int calls = 0;
    monitor.on_sample([&](const ResourceSnapshot&) { ++calls; });

    monitor.push_snapshot(ResourceSnapshot{});
    EXPECT_TRUE(monitor.publish().has_value());
    EXPECT_FALSE(monitor.publish().has_value());
    EXPECT_EQ(calls, 1);
}

TEST(MockMonitorTest, TimestampIsRecent) {
    MockMonitor monitor;
    auto before = std::chrono::system_clock::now();
    auto result = monitor.read();
    auto after = std::chrono::system_clock::now();

    ASSERT_TRUE(result.has_value());
    EXPECT_GE(result->timestamp, before);
    EXPECT_LE(result->timestamp, after);
}

// ─── LinuxMonitor (can test on any Linux host) ───

class LinuxMonitorTest : public ::testing::Test {
protected:
    std::filesystem::path sysfs_;

    void SetUp() override {
        sysfs_ = std::filesystem::temp_directory_path() / "edit_orch_test_sysfs";
        std::filesystem::remove_all(sysfs_);
        std::filesystem::create_directories(sysfs_);
    }

    void TearDown() override {
        std::filesystem::remove_all(sysfs_);
    }
};

TEST_F(LinuxMonitorTest, ReadBeforeStart) {
    LinuxMonitor monitor(500, sysfs_);
    auto result = monitor.read();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "No snapshot available yet");
}

TEST_F(LinuxMonitorTest, StartAndRead) {
    LinuxMonitor monitor(100, sysfs_);
    monitor.start();

    // Give the sampling thread time to produce a snapshot
    std::this_thread::sleep_for(std::chrono::milliseconds(350));

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());

    // On any Linux host these should be non-zero
    EXPECT_GT(result->memory_total_bytes, 0u);
    EXPECT_GT(result->memory_available_bytes, 0u);
    EXPECT_LE(result->memory_available_bytes, result->memory_total_bytes);
    EXPECT_GE(result->cpu_usage_percent, 0.0f);
    EXPECT_LE(result->cpu_usage_percent, 100.0f);

    monitor.stop();
}

TEST_F(LinuxMonitorTest, NoAcceleratorInEmptySysfs) {
    LinuxMonitor monitor(50, sysfs_);
    monitor.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    monitor.stop();

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->accelerator_present);
    EXPECT_EQ(result->accelerator_memory_total_bytes, 0u);
}

TEST_F(LinuxMonitorTest, ReadsDrmCountersAndHwmonTemperature) {
    auto device = sysfs_ / "class/drm/card0/device";
    write_file(device / "mem_info_vram_total", std::to_string(8192 * kMiB));
    write_file(device / "mem_info_vram_used", std::to_string(2048 * kMiB));
    write_file(device / "hwmon/hwmon3/temp1_input", "68000");
    // Connector nodes are ignored
    write_file(sysfs_ / "class/drm/card0-HDMI-A-1/status", "connected");

    LinuxMonitor monitor(50, sysfs_);
    monitor.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    monitor.stop();

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->accelerator_present);
    EXPECT_EQ(result->accelerator_memory_free_mb(), 6144u);
    EXPECT_FLOAT_EQ(result->accelerator_temperature_celsius, 68.0f);
    EXPECT_FLOAT_EQ(monitor.accelerator_temperature(), 68.0f);
}

TEST_F(LinuxMonitorTest, FallsBackToGpuThermalZone) {
    write_file(sysfs_ / "class/thermal/thermal_zone0/type", "cpu-thermal");
    write_file(sysfs_ / "class/thermal/thermal_zone0/temp", "45000");
    write_file(sysfs_ / "class/thermal/thermal_zone1/type", "gpu-thermal");
    write_file(sysfs_ / "class/thermal/thermal_zone1/temp", "71500");

    LinuxMonitor monitor(50, sysfs_);
    monitor.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    monitor.stop();

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_FLOAT_EQ(result->cpu_temperature_celsius, 45.0f);
    EXPECT_TRUE(result->accelerator_present);
    EXPECT_FLOAT_EQ(result->accelerator_temperature_celsius, 71.5f);
    // Temperature only: no memory telemetry
    EXPECT_EQ(result->accelerator_memory_total_bytes, 0u);
}

TEST_F(LinuxMonitorTest, SampleCallback) {
    LinuxMonitor monitor(50, sysfs_);
    std::atomic<int> samples{0};
    monitor.on_sample([&](const ResourceSnapshot&) { ++samples; });

    monitor.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    monitor.stop();

    EXPECT_GE(samples.load(), 2);
}
