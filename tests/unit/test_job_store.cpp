/**
 * @file test_job_store.cpp
 * @brief Unit tests for JobStore lifecycle enforcement and write-through.
 * @author Dimitris Kafetzis
 */

#include "store/job_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>
#include <tuple>
#include <vector>

using namespace edit_orchestrator;

namespace {

Job pending_job(const std::string& id, PriorityTier tier = 2) {
    SubmitRequest request{.id = id, .subject_ref = "photo-" + id, .priority_tier = tier};
    return make_job(request, std::chrono::system_clock::now());
}

}  // namespace

class JobStoreTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    InMemoryJobRepository repo_;
    JobStore store_{repo_, logger_};

    void add(const std::string& id, PriorityTier tier = 2) {
        ASSERT_TRUE(store_.insert(pending_job(id, tier), {}).has_value());
    }
};

TEST_F(JobStoreTest, InsertAssignsIncreasingSequence) {
    add("a");
    add("b");
    auto a = store_.get("a");
    auto b = store_.get("b");
    ASSERT_TRUE(a && b);
    EXPECT_LT(a->sequence, b->sequence);
    EXPECT_EQ(a->status, JobStatus::Pending);
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(JobStoreTest, InsertCheckCanReject) {
    add("a");
    auto rejected = store_.insert(pending_job("a"), [](const Job* existing) -> Result<void> {
        if (existing) return Error{ErrorCode::AlreadyExists, "taken"};
        return {};
    });
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(JobStoreTest, ListIsInInsertionOrderAndFiltered) {
    add("c");
    add("a");
    add("b");
    ASSERT_TRUE(store_.transition("a", JobStatus::Pending, JobStatus::Processing));

    auto all = store_.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "c");
    EXPECT_EQ(all[1].id, "a");
    EXPECT_EQ(all[2].id, "b");

    auto pending = store_.list(JobFilter{.status = JobStatus::Pending});
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].id, "c");

    auto by_subject = store_.list(JobFilter{.subject_ref = "photo-b"});
    ASSERT_EQ(by_subject.size(), 1u);
    EXPECT_EQ(by_subject[0].id, "b");
}

TEST_F(JobStoreTest, TransitionIsCompareAndSet) {
    add("a");
    ASSERT_TRUE(store_.transition("a", JobStatus::Pending, JobStatus::Processing));

    auto again = store_.transition("a", JobStatus::Pending, JobStatus::Processing);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(again.error().message, "job a is processing, expected pending");
}

TEST_F(JobStoreTest, IllegalEdgesRejected) {
    add("a");
    auto skip = store_.transition("a", JobStatus::Pending, JobStatus::Completed);
    ASSERT_FALSE(skip);
    EXPECT_EQ(skip.error().message, "illegal transition pending -> completed");

    ASSERT_TRUE(store_.transition("a", JobStatus::Pending, JobStatus::Processing));
    ASSERT_TRUE(store_.transition("a", JobStatus::Processing, JobStatus::Completed));
    auto revive = store_.transition("a", JobStatus::Completed, JobStatus::Pending);
    EXPECT_FALSE(revive);
    EXPECT_EQ(store_.get("a")->status, JobStatus::Completed);
}

TEST_F(JobStoreTest, MissingJobIsNotFound) {
    auto result = store_.transition("ghost", JobStatus::Pending, JobStatus::Processing);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(result.error().message, "job ghost not found");
}

TEST_F(JobStoreTest, MutatorAppliedWithTransition) {
    add("a");
    auto now = std::chrono::system_clock::now();
    auto result = store_.transition("a", JobStatus::Pending, JobStatus::Processing,
                                    [now](Job& j) { j.started_at = now; });
    ASSERT_TRUE(result);
    EXPECT_EQ(result->started_at, now);
    EXPECT_EQ(store_.get("a")->started_at, now);
}

TEST_F(JobStoreTest, UpdateRequiresExpectedStatus) {
    add("a");
    auto wrong = store_.update("a", JobStatus::Processing, [](Job& j) { j.retry_count = 7; });
    ASSERT_FALSE(wrong);
    EXPECT_EQ(store_.get("a")->retry_count, 0u);

    auto ok = store_.update("a", JobStatus::Pending, [](Job& j) { j.priority_tier = 1; });
    ASSERT_TRUE(ok);
    EXPECT_EQ(store_.get("a")->priority_tier, 1);
    EXPECT_EQ(store_.get("a")->status, JobStatus::Pending);
}

TEST_F(JobStoreTest, FailedWriteLeavesRecordUntouched) {
    add("a");
    repo_.fail_writes(true);

    auto result = store_.transition("a", JobStatus::Pending, JobStatus::Processing);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Storage);
    EXPECT_EQ(store_.get("a")->status, JobStatus::Pending);

    auto insert = store_.insert(pending_job("b"), {});
    EXPECT_FALSE(insert);
    EXPECT_FALSE(store_.get("b").has_value());

    repo_.fail_writes(false);
    EXPECT_TRUE(store_.transition("a", JobStatus::Pending, JobStatus::Processing));
}

TEST_F(JobStoreTest, WritesGoThroughToRepository) {
    add("a");
    ASSERT_TRUE(store_.transition("a", JobStatus::Pending, JobStatus::Processing));

    auto persisted = repo_.load_all();
    ASSERT_TRUE(persisted);
    ASSERT_EQ(persisted->size(), 1u);
    EXPECT_EQ(persisted->front().status, JobStatus::Processing);
}

TEST_F(JobStoreTest, LoadRestoresSequence) {
    add("a");
    add("b");

    JobStore reopened(repo_, logger_);
    auto loaded = reopened.load();
    ASSERT_TRUE(loaded);
    EXPECT_EQ(*loaded, 2u);

    ASSERT_TRUE(reopened.insert(pending_job("c"), {}));
    EXPECT_GT(reopened.get("c")->sequence, reopened.get("b")->sequence);
}

TEST_F(JobStoreTest, RemovePendingOnly) {
    add("a");
    add("b");
    ASSERT_TRUE(store_.transition("b", JobStatus::Pending, JobStatus::Processing));

    EXPECT_TRUE(store_.remove_pending("a"));
    EXPECT_FALSE(store_.get("a").has_value());
    EXPECT_TRUE(repo_.load_all()->size() == 1u);

    auto busy = store_.remove_pending("b");
    ASSERT_FALSE(busy);
    EXPECT_EQ(busy.error().message, "job b is processing; only pending jobs can be cancelled");
    EXPECT_FALSE(store_.remove_pending("a"));
}

TEST_F(JobStoreTest, ListenersSeeCommittedTransitionsOnly) {
    std::vector<std::tuple<JobId, JobStatus, JobStatus>> seen;
    store_.on_transition([&](const Job& job, JobStatus from, JobStatus to) {
        seen.emplace_back(job.id, from, to);
    });

    add("a");
    ASSERT_TRUE(store_.transition("a", JobStatus::Pending, JobStatus::Processing));
    EXPECT_FALSE(store_.transition("a", JobStatus::Pending, JobStatus::Processing));
    ASSERT_TRUE(store_.update("a", JobStatus::Processing, [](Job& j) { j.retry_count = 1; }));
    ASSERT_TRUE(store_.transition("a", JobStatus::Processing, JobStatus::Pending));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], std::make_tuple(JobId{"a"}, JobStatus::Pending, JobStatus::Processing));
    EXPECT_EQ(seen[1], std::make_tuple(JobId{"a"}, JobStatus::Processing, JobStatus::Pending));
}

TEST_F(JobStoreTest, CountsCoverEveryStatus) {
    add("a");
    add("b");
    ASSERT_TRUE(store_.transition("b", JobStatus::Pending, JobStatus::Processing));
    ASSERT_TRUE(store_.transition("b", JobStatus::Processing, JobStatus::DeadLetter));

    auto counts = store_.counts();
    EXPECT_EQ(counts.at(JobStatus::Pending), 1u);
    EXPECT_EQ(counts.at(JobStatus::Processing), 0u);
    EXPECT_EQ(counts.at(JobStatus::DeadLetter), 1u);
    EXPECT_EQ(counts.at(JobStatus::Failed), 0u);
}

TEST_F(JobStoreTest, ConcurrentClaimsHaveOneWinner) {
    add("a");
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (store_.transition("a", JobStatus::Pending, JobStatus::Processing)) ++winners;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
}
