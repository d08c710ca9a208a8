/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace edit_orchestrator {

struct EngineConfig {
    uint32_t max_workers = 4;
    uint32_t dispatch_threads = 0;      ///< 0 = max_workers
    uint32_t stage_timeout_ms = 15000;
    uint32_t idle_poll_ms = 1000;
};

struct GovernorConfig {
    uint32_t sampling_interval_ms = 2000;
    bool mock = false;
    float cpu_ceiling_percent = 80.0f;
    float cpu_resume_percent = 60.0f;
    float accelerator_temp_limit_celsius = 75.0f;
    float accelerator_temp_resume_celsius = 65.0f;
    uint64_t accelerator_memory_reserve_mb = 512;
};

struct ScoringConfig {
    double tier1_bonus = 3.0;
    double tier2_bonus = 2.0;
    double tier3_bonus = 1.0;
    double age_hours_per_point = 24.0;
    double age_bonus_cap = 2.0;
    double quality_threshold = 4.5;
    double quality_bonus = 1.0;
};

struct RetryConfig {
    uint32_t max_retries = 3;
    std::string strategy = "exponential";   ///< "exponential", "linear", "fixed", "immediate"
    uint32_t base_delay_ms = 1000;
    uint32_t max_delay_ms = 60000;
    double multiplier = 2.0;
    double jitter_fraction = 0.1;
};

struct StoreConfig {
    std::filesystem::path path = "data/jobs.db";   ///< empty = in-memory only
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool metrics = true;
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    EngineConfig engine;
    GovernorConfig governor;
    ScoringConfig scheduler;
    RetryConfig retry;
    StoreConfig store;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. Missing keys take defaults;
 *        the result is validated before it is returned.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check cross-field constraints (resume thresholds below limits, etc).
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace edit_orchestrator
