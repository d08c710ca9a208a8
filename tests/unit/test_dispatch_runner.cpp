/**
 * @file test_dispatch_runner.cpp
 * @brief Unit tests for dispatch execution under a stage timeout.
 * @author Dimitris Kafetzis
 */

#include "actuator/simulated_actuator.hpp"
#include "executor/dispatch_runner.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace edit_orchestrator;
using namespace std::chrono_literals;

namespace {

/// Actuator whose dispatch always throws.
class ThrowingActuator : public IActuator {
public:
    ActuatorResult<CheckpointHandle> checkpoint(const SubjectRef& subject) override {
        return CheckpointHandle{"ckpt-" + subject};
    }
    ActuatorResult<void> dispatch(const SubjectRef&, const std::string&, std::stop_token) override {
        throw std::runtime_error("driver crashed");
    }
    ActuatorResult<void> rollback(const CheckpointHandle&) override { return {}; }
};

}  // namespace

class DispatchRunnerTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    SimulatedActuator actuator_;
};

TEST_F(DispatchRunnerTest, SuccessfulDispatch) {
    DispatchRunner runner(actuator_, 2, logger_);
    EXPECT_EQ(runner.thread_count(), 2u);

    auto result = runner.run("photo-1", R"({"preset":"warm"})", 1000ms);
    EXPECT_TRUE(result);
    EXPECT_EQ(actuator_.dispatch_count("photo-1"), 1u);
}

TEST_F(DispatchRunnerTest, ActuatorErrorPassesThrough) {
    DispatchRunner runner(actuator_, 1, logger_);
    actuator_.script_dispatch("photo-1", {ActuatorError{FailureClass::Fatal, "malformed config"}});

    auto result = runner.run("photo-1", "{}", 1000ms);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().failure_class, FailureClass::Fatal);
    EXPECT_EQ(result.error().message, "malformed config");
}

TEST_F(DispatchRunnerTest, TimeoutIsTransientAndStopsActuator) {
    DispatchRunner runner(actuator_, 1, logger_);
    actuator_.set_subject_latency("slow", 5s);

    auto start = std::chrono::steady_clock::now();
    auto result = runner.run("slow", "{}", 50ms);
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().failure_class, FailureClass::Transient);
    EXPECT_EQ(result.error().message, "dispatch timed out after 50ms");
    EXPECT_LT(waited, 2s);

    // The stop request frees the pool thread for the next call
    EXPECT_TRUE(runner.run("fast", "{}", 2000ms));
}

TEST_F(DispatchRunnerTest, ThrownExceptionBecomesTransient) {
    ThrowingActuator throwing;
    DispatchRunner runner(throwing, 1, logger_);

    auto result = runner.run("photo-1", "{}", 1000ms);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().failure_class, FailureClass::Transient);
    EXPECT_EQ(result.error().message, "actuator threw: driver crashed");
}

TEST_F(DispatchRunnerTest, CallerStopIsForwarded) {
    DispatchRunner runner(actuator_, 1, logger_);
    actuator_.set_subject_latency("slow", 5s);

    std::stop_source caller;
    auto pending = std::async(std::launch::async, [&] {
        return runner.run("slow", "{}", 3000ms, caller.get_token());
    });
    std::this_thread::sleep_for(30ms);
    caller.request_stop();

    auto result = pending.get();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "dispatch cancelled via stop token");
}

TEST_F(DispatchRunnerTest, CancelAllStopsRunningCalls) {
    DispatchRunner runner(actuator_, 2, logger_);
    actuator_.set_subject_latency("slow-a", 5s);
    actuator_.set_subject_latency("slow-b", 5s);

    auto a = std::async(std::launch::async, [&] { return runner.run("slow-a", "{}", 3000ms); });
    auto b = std::async(std::launch::async, [&] { return runner.run("slow-b", "{}", 3000ms); });
    std::this_thread::sleep_for(50ms);
    runner.cancel_all();

    EXPECT_FALSE(a.get());
    EXPECT_FALSE(b.get());
    EXPECT_LE(actuator_.peak_concurrency(), 2u);
}

TEST_F(DispatchRunnerTest, PoolBoundsConcurrency) {
    SimulatedActuator actuator(SimulatedActuator::Options{.dispatch_latency = 20ms});
    DispatchRunner runner(actuator, 2, logger_);

    std::vector<std::future<ActuatorResult<void>>> calls;
    for (int i = 0; i < 6; ++i) {
        calls.push_back(std::async(std::launch::async, [&runner, i] {
            return runner.run("photo-" + std::to_string(i), "{}", 2000ms);
        }));
    }
    for (auto& call : calls) EXPECT_TRUE(call.get());
    EXPECT_EQ(actuator.dispatch_count(), 6u);
    EXPECT_LE(actuator.peak_concurrency(), 2u);
}
