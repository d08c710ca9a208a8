/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace edit_orchestrator {

namespace {

Error config_error(std::string message) {
    return Error{ErrorCode::Config, std::move(message)};
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("Configuration file not found: " + path.string());
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.max_workers = static_cast<uint32_t>(
                engine["max_workers"].value_or(int64_t{4}));
            config.engine.dispatch_threads = static_cast<uint32_t>(
                engine["dispatch_threads"].value_or(int64_t{0}));
            config.engine.stage_timeout_ms = static_cast<uint32_t>(
                engine["stage_timeout_ms"].value_or(int64_t{15000}));
            config.engine.idle_poll_ms = static_cast<uint32_t>(
                engine["idle_poll_ms"].value_or(int64_t{1000}));
        }

        // [governor]
        if (auto gov = tbl["governor"]; gov.is_table()) {
            config.governor.sampling_interval_ms = static_cast<uint32_t>(
                gov["sampling_interval_ms"].value_or(int64_t{2000}));
            config.governor.mock = gov["mock"].value_or(false);
            config.governor.cpu_ceiling_percent =
                static_cast<float>(gov["cpu_ceiling_percent"].value_or(80.0));
            config.governor.cpu_resume_percent =
                static_cast<float>(gov["cpu_resume_percent"].value_or(60.0));
            config.governor.accelerator_temp_limit_celsius =
                static_cast<float>(gov["accelerator_temp_limit_celsius"].value_or(75.0));
            config.governor.accelerator_temp_resume_celsius =
                static_cast<float>(gov["accelerator_temp_resume_celsius"].value_or(65.0));
            config.governor.accelerator_memory_reserve_mb = static_cast<uint64_t>(
                gov["accelerator_memory_reserve_mb"].value_or(int64_t{512}));
        }

        // [scheduler]
        if (auto sched = tbl["scheduler"]; sched.is_table()) {
            config.scheduler.tier1_bonus = sched["tier1_bonus"].value_or(3.0);
            config.scheduler.tier2_bonus = sched["tier2_bonus"].value_or(2.0);
            config.scheduler.tier3_bonus = sched["tier3_bonus"].value_or(1.0);
            config.scheduler.age_hours_per_point = sched["age_hours_per_point"].value_or(24.0);
            config.scheduler.age_bonus_cap = sched["age_bonus_cap"].value_or(2.0);
            config.scheduler.quality_threshold = sched["quality_threshold"].value_or(4.5);
            config.scheduler.quality_bonus = sched["quality_bonus"].value_or(1.0);
        }

        // [retry]
        if (auto retry = tbl["retry"]; retry.is_table()) {
            config.retry.max_retries = static_cast<uint32_t>(
                retry["max_retries"].value_or(int64_t{3}));
            config.retry.strategy = retry["strategy"].value_or(std::string{"exponential"});
            config.retry.base_delay_ms = static_cast<uint32_t>(
                retry["base_delay_ms"].value_or(int64_t{1000}));
            config.retry.max_delay_ms = static_cast<uint32_t>(
                retry["max_delay_ms"].value_or(int64_t{60000}));
            config.retry.multiplier = retry["multiplier"].value_or(2.0);
            config.retry.jitter_fraction = retry["jitter_fraction"].value_or(0.1);
        }

        // [store]
        if (auto store = tbl["store"]; store.is_table()) {
            config.store.path = store["path"].value_or(std::string{"data/jobs.db"});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics = telemetry["metrics"].value_or(true);
        }

    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    if (config.engine.max_workers == 0) {
        return config_error("engine.max_workers must be at least 1");
    }
    if (config.engine.stage_timeout_ms == 0) {
        return config_error("engine.stage_timeout_ms must be positive");
    }
    if (config.governor.sampling_interval_ms == 0) {
        return config_error("governor.sampling_interval_ms must be positive");
    }
    if (config.governor.cpu_resume_percent >= config.governor.cpu_ceiling_percent) {
        return config_error("governor.cpu_resume_percent must be below cpu_ceiling_percent");
    }
    if (config.governor.accelerator_temp_resume_celsius
        >= config.governor.accelerator_temp_limit_celsius) {
        return config_error(
            "governor.accelerator_temp_resume_celsius must be below accelerator_temp_limit_celsius");
    }
    const auto& s = config.scheduler;
    if (s.tier1_bonus < 0.0 || s.tier2_bonus < 0.0 || s.tier3_bonus < 0.0
        || s.quality_bonus < 0.0 || s.age_bonus_cap < 0.0) {
        return config_error("scheduler bonuses must be non-negative");
    }
    if (s.age_hours_per_point <= 0.0) {
        return config_error("scheduler.age_hours_per_point must be positive");
    }
    const auto& r = config.retry;
    if (r.strategy != "exponential" && r.strategy != "linear"
        && r.strategy != "fixed" && r.strategy != "immediate") {
        return config_error("retry.strategy must be one of exponential, linear, fixed, immediate");
    }
    if (r.jitter_fraction < 0.0 || r.jitter_fraction >= 1.0) {
        return config_error("retry.jitter_fraction must be in [0, 1)");
    }
    if (r.multiplier < 1.0) {
        return config_error("retry.multiplier must be at least 1.0");
    }
    if (r.max_delay_ms < r.base_delay_ms) {
        return config_error("retry.max_delay_ms must not be below base_delay_ms");
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return config_error("telemetry.log_level must be debug, info, warn or error");
    }
    return {};
}

Config default_config() {
    return Config{};
}

}  // namespace edit_orchestrator
