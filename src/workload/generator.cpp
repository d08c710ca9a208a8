/**
 * @file generator.cpp
 * @brief JobBatchGenerator implementation.
 * @author Dimitris Kafetzis
 */

#include "workload/generator.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace edit_orchestrator {

namespace {

constexpr std::array<const char*, 5> kPresets{
    "portrait-warm", "landscape-vivid", "mono-film", "product-clean", "night-denoise"};

}  // anonymous namespace

std::string JobBatchGenerator::edit_config(const std::string& preset, double exposure) {
    std::ostringstream oss;
    oss << R"({"preset":")" << preset << R"(","exposure":)"
        << std::fixed << std::setprecision(2) << exposure << "}";
    return oss.str();
}

std::vector<SubmitRequest> JobBatchGenerator::random_batch(size_t count,
                                                           const BatchProfile& profile,
                                                           std::mt19937& rng,
                                                           size_t first_index) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> high_quality(4.5, 5.0);
    std::uniform_real_distribution<double> low_quality(1.0, 4.5);
    std::uniform_real_distribution<double> exposure(-1.0, 1.0);
    std::uniform_int_distribution<size_t> preset(0, kPresets.size() - 1);

    std::vector<SubmitRequest> batch;
    batch.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const auto index = std::to_string(first_index + i);

        PriorityTier tier = kLowestTier;
        const double tier_roll = unit(rng);
        if (tier_roll < profile.tier1_fraction) {
            tier = 1;
        } else if (tier_roll < profile.tier1_fraction + profile.tier2_fraction) {
            tier = 2;
        }

        SubmitRequest request;
        request.id = profile.id_prefix + "-" + index;
        request.subject_ref = profile.subject_prefix + "-" + index;
        request.priority_tier = tier;
        request.quality_score = unit(rng) < profile.high_quality_fraction
                                ? high_quality(rng) : low_quality(rng);
        request.config = edit_config(kPresets[preset(rng)], exposure(rng));
        if (unit(rng) < profile.accelerator_fraction) {
            request.requirement.accelerator_memory_mb = profile.accelerator_memory_mb;
        }
        batch.push_back(std::move(request));
    }
    return batch;
}

std::vector<SubmitRequest> JobBatchGenerator::tier_sweep(size_t per_tier,
                                                         const std::string& id_prefix) {
    std::vector<SubmitRequest> batch;
    batch.reserve(per_tier * 3);
    for (PriorityTier tier = kLowestTier; tier >= kHighestTier; --tier) {
        for (size_t i = 0; i < per_tier; ++i) {
            const auto suffix = std::to_string(tier) + "-" + std::to_string(i);
            SubmitRequest request;
            request.id = id_prefix + "-t" + suffix;
            request.subject_ref = "subject-" + suffix;
            request.priority_tier = tier;
            request.quality_score = 3.0;
            request.config = edit_config("neutral", 0.0);
            batch.push_back(std::move(request));
        }
    }
    return batch;
}

}  // namespace edit_orchestrator
