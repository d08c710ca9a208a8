/**
 * @file test_generator.cpp
 * @brief Unit tests for synthetic job batch generation.
 * @author Dimitris Kafetzis
 */

#include "store/idempotency_guard.hpp"
#include "workload/generator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <random>
#include <set>

using namespace edit_orchestrator;

TEST(GeneratorTest, RandomBatchIdsAreUniqueAndValid) {
    std::mt19937 rng(42);
    auto batch = JobBatchGenerator::random_batch(500, BatchProfile{}, rng);
    ASSERT_EQ(batch.size(), 500u);

    std::set<JobId> ids;
    for (const auto& request : batch) {
        ids.insert(request.id);
        EXPECT_FALSE(IdempotencyGuard::validate(request).has_value()) << request.id;
        EXPECT_GE(request.quality_score, 1.0);
        EXPECT_LE(request.quality_score, 5.0);
    }
    EXPECT_EQ(ids.size(), batch.size());
    EXPECT_EQ(batch.front().id, "job-0");
    EXPECT_EQ(batch.front().subject_ref, "photo-0");
}

TEST(GeneratorTest, FirstIndexOffsetsIds) {
    std::mt19937 rng(1);
    BatchProfile profile;
    profile.id_prefix = "night";
    auto batch = JobBatchGenerator::random_batch(3, profile, rng, 100);
    EXPECT_EQ(batch[0].id, "night-100");
    EXPECT_EQ(batch[2].id, "night-102");
}

TEST(GeneratorTest, TierMixFollowsProfile) {
    std::mt19937 rng(7);
    BatchProfile profile;
    profile.tier1_fraction = 1.0;
    profile.tier2_fraction = 0.0;
    for (const auto& request : JobBatchGenerator::random_batch(50, profile, rng)) {
        EXPECT_EQ(request.priority_tier, 1);
    }

    profile.tier1_fraction = 0.2;
    profile.tier2_fraction = 0.3;
    std::map<PriorityTier, int> tiers;
    for (const auto& request : JobBatchGenerator::random_batch(3000, profile, rng)) {
        ++tiers[request.priority_tier];
    }
    EXPECT_NEAR(tiers[1] / 3000.0, 0.2, 0.05);
    EXPECT_NEAR(tiers[2] / 3000.0, 0.3, 0.05);
    EXPECT_NEAR(tiers[3] / 3000.0, 0.5, 0.05);
}

TEST(GeneratorTest, AcceleratorRequirementFromProfile) {
    std::mt19937 rng(3);
    BatchProfile profile;
    profile.accelerator_fraction = 1.0;
    profile.accelerator_memory_mb = 1536;
    for (const auto& request : JobBatchGenerator::random_batch(20, profile, rng)) {
        EXPECT_EQ(request.requirement.accelerator_memory_mb, 1536u);
    }

    profile.accelerator_fraction = 0.0;
    for (const auto& request : JobBatchGenerator::random_batch(20, profile, rng)) {
        EXPECT_EQ(request.requirement.accelerator_memory_mb, 0u);
    }
}

TEST(GeneratorTest, SameSeedSameBatch) {
    std::mt19937 a(99);
    std::mt19937 b(99);
    auto first = JobBatchGenerator::random_batch(20, BatchProfile{}, a);
    auto second = JobBatchGenerator::random_batch(20, BatchProfile{}, b);
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].priority_tier, second[i].priority_tier);
        EXPECT_EQ(first[i].config, second[i].config);
    }
}

TEST(GeneratorTest, TierSweepLowestTierFirst) {
    auto batch = JobBatchGenerator::tier_sweep(2);
    ASSERT_EQ(batch.size(), 6u);
    EXPECT_EQ(batch[0].id, "sweep-t3-0");
    EXPECT_EQ(batch[0].priority_tier, 3);
    EXPECT_EQ(batch[5].id, "sweep-t1-1");
    EXPECT_EQ(batch[5].subject_ref, "subject-1-1");
    EXPECT_TRUE(std::all_of(batch.begin(), batch.end(), [](const SubmitRequest& r) {
        return r.quality_score == 3.0 && r.requirement.accelerator_memory_mb == 0;
    }));
}

TEST(GeneratorTest, EditConfigIsCompactJson) {
    EXPECT_EQ(JobBatchGenerator::edit_config("mono-film", -0.5),
              R"({"preset":"mono-film","exposure":-0.50})");
    EXPECT_EQ(JobBatchGenerator::edit_config("neutral", 0.0),
              R"({"preset":"neutral","exposure":0.00})");
}
