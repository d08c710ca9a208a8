/**
 * @file generator.hpp
 * @brief Synthetic edit-job batches for the demo daemon and benchmarks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "store/job.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace edit_orchestrator {

/**
 * @brief Shape of a generated batch. Fractions are probabilities per job.
 */
struct BatchProfile {
    std::string id_prefix = "job";
    std::string subject_prefix = "photo";
    double tier1_fraction = 0.2;
    double tier2_fraction = 0.3;          ///< the rest is tier 3
    double high_quality_fraction = 0.4;   ///< quality drawn from [4.5, 5], else [1, 4.5)
    double accelerator_fraction = 0.25;   ///< jobs that need accelerator memory
    uint64_t accelerator_memory_mb = 2048;
};

/**
 * @brief Factory for submission requests modelling a photo-editing backlog.
 */
class JobBatchGenerator {
public:
    /// `count` random jobs; ids are `<prefix>-<first_index + i>`.
    static std::vector<SubmitRequest> random_batch(size_t count,
                                                   const BatchProfile& profile,
                                                   std::mt19937& rng,
                                                   size_t first_index = 0);

    /// `per_tier` jobs for each tier, tier 3 first, neutral quality and no accelerator need.
    static std::vector<SubmitRequest> tier_sweep(size_t per_tier,
                                                 const std::string& id_prefix = "sweep");

    /// Opaque edit payload handed to the actuator.
    static std::string edit_config(const std::string& preset, double exposure);
};

}  // namespace edit_orchestrator
