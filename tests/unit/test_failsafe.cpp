/**
 * @file test_failsafe.cpp
 * @brief Unit tests for checkpoint recording and exactly-once rollback.
 * @author Dimitris Kafetzis
 */

#include "actuator/simulated_actuator.hpp"
#include "failsafe/failsafe_manager.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace edit_orchestrator;

class FailsafeTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    InMemoryJobRepository repo_;
    JobStore store_{repo_, logger_};
    SimulatedActuator actuator_;
    FailsafeManager failsafe_{actuator_, store_, logger_};

    Job processing_job(const std::string& id) {
        SubmitRequest request{.id = id, .subject_ref = "photo-" + id, .priority_tier = 2};
        EXPECT_TRUE(store_.insert(make_job(request, std::chrono::system_clock::now()), {}));
        auto claimed = store_.transition(id, JobStatus::Pending, JobStatus::Processing);
        EXPECT_TRUE(claimed);
        return *claimed;
    }
};

TEST_F(FailsafeTest, CheckpointRecordsHandleOnJob) {
    auto job = processing_job("a");
    auto handle = failsafe_.checkpoint(job);
    ASSERT_TRUE(handle);
    EXPECT_EQ(*handle, "ckpt-photo-a-1");
    EXPECT_EQ(store_.get("a")->checkpoint_handle, *handle);
    EXPECT_EQ(failsafe_.stats().checkpoints_taken, 1u);
}

TEST_F(FailsafeTest, CheckpointFailurePropagates) {
    auto job = processing_job("a");
    actuator_.script_checkpoint_failure("photo-a", {FailureClass::Transient, "snapshot busy"});

    auto handle = failsafe_.checkpoint(job);
    ASSERT_FALSE(handle);
    EXPECT_EQ(handle.error().message, "snapshot busy");
    EXPECT_FALSE(store_.get("a")->checkpoint_handle.has_value());
    EXPECT_EQ(failsafe_.stats().checkpoint_failures, 1u);
}

TEST_F(FailsafeTest, CheckpointNeedsProcessingJob) {
    SubmitRequest request{.id = "p", .subject_ref = "photo-p"};
    ASSERT_TRUE(store_.insert(make_job(request, std::chrono::system_clock::now()), {}));

    auto handle = failsafe_.checkpoint(*store_.get("p"));
    ASSERT_FALSE(handle);
    EXPECT_EQ(handle.error().failure_class, FailureClass::Transient);
    EXPECT_EQ(failsafe_.stats().checkpoints_taken, 0u);
}

TEST_F(FailsafeTest, RollbackRunsOncePerCheckpoint) {
    auto job = processing_job("a");
    ASSERT_TRUE(failsafe_.checkpoint(job));

    EXPECT_TRUE(failsafe_.rollback("a"));
    EXPECT_TRUE(failsafe_.rollback("a"));
    EXPECT_EQ(actuator_.rollback_count("photo-a"), 1u);
    EXPECT_FALSE(store_.get("a")->checkpoint_handle.has_value());
    EXPECT_EQ(failsafe_.stats().rollbacks_succeeded, 1u);
}

TEST_F(FailsafeTest, RollbackWithoutCheckpointIsNoOp) {
    processing_job("a");
    EXPECT_TRUE(failsafe_.rollback("a"));
    EXPECT_TRUE(failsafe_.rollback("ghost"));
    EXPECT_EQ(actuator_.rollback_count(), 0u);
}

TEST_F(FailsafeTest, RollbackFailureReportedAndHandleCleared) {
    auto job = processing_job("a");
    ASSERT_TRUE(failsafe_.checkpoint(job));
    actuator_.script_rollback_failure("photo-a", {FailureClass::Fatal, "snapshot lost"});

    auto restored = failsafe_.rollback("a");
    ASSERT_FALSE(restored);
    EXPECT_EQ(restored.error().message, "snapshot lost");
    EXPECT_FALSE(store_.get("a")->checkpoint_handle.has_value());
    EXPECT_EQ(failsafe_.stats().rollbacks_failed, 1u);

    // Not retried on a second call
    EXPECT_TRUE(failsafe_.rollback("a"));
    EXPECT_EQ(actuator_.rollback_count("photo-a"), 1u);
}

TEST_F(FailsafeTest, EachAttemptGetsFreshCheckpoint) {
    auto job = processing_job("a");
    ASSERT_TRUE(failsafe_.checkpoint(job));
    ASSERT_TRUE(failsafe_.rollback("a"));
    auto second = failsafe_.checkpoint(job);
    ASSERT_TRUE(second);
    EXPECT_EQ(*second, "ckpt-photo-a-2");
    ASSERT_TRUE(failsafe_.rollback("a"));
    EXPECT_EQ(actuator_.rollback_count("photo-a"), 2u);
}
