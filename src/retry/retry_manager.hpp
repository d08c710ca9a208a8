/**
 * @file retry_manager.hpp
 * @brief Failure classification and bounded retry decisions.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "actuator/actuator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "store/job.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace edit_orchestrator {

enum class BackoffStrategy : uint8_t {
    Exponential,   ///< base * multiplier^retry_count
    Linear,        ///< base * (retry_count + 1)
    Fixed,         ///< base
    Immediate      ///< 0
};

[[nodiscard]] constexpr std::string_view to_string(BackoffStrategy strategy) noexcept {
    switch (strategy) {
        case BackoffStrategy::Exponential: return "exponential";
        case BackoffStrategy::Linear:      return "linear";
        case BackoffStrategy::Fixed:       return "fixed";
        case BackoffStrategy::Immediate:   return "immediate";
    }
    return "unknown";
}

[[nodiscard]] std::optional<BackoffStrategy> parse_backoff_strategy(std::string_view text) noexcept;

/**
 * @brief What to do with a job whose attempt just failed.
 */
struct RetryDecision {
    enum class Action : uint8_t {
        RetryAfterDelay,        ///< re-enter pending when the backoff timer fires
        RetryWhenResourcesFree, ///< re-enter pending once the governor admits the requirement
        DeadLetter              ///< terminal
    };

    Action action{Action::DeadLetter};
    FailureClass failure_class{FailureClass::Transient};
    Millis delay{0};
    std::string reason;

    [[nodiscard]] bool is_retry() const noexcept { return action != Action::DeadLetter; }
};

[[nodiscard]] constexpr std::string_view to_string(RetryDecision::Action action) noexcept {
    switch (action) {
        case RetryDecision::Action::RetryAfterDelay:        return "retry_after_delay";
        case RetryDecision::Action::RetryWhenResourcesFree: return "retry_when_resources_free";
        case RetryDecision::Action::DeadLetter:             return "dead_letter";
    }
    return "unknown";
}

/**
 * @brief Maps a failure to retry / dead-letter.
 *
 * A job may fail at most max_retries + 1 times: the failure that finds
 * retry_count == max_retries dead-letters it.
 */
class RetryManager {
public:
    RetryManager(RetryConfig config, Logger& logger,
                 std::optional<uint32_t> seed = std::nullopt);

    [[nodiscard]] RetryDecision handle_failure(const Job& job, const ActuatorError& error);

    /// Actuator-supplied class, or a keyword heuristic over the message.
    [[nodiscard]] static FailureClass classify(const ActuatorError& error);

    /// Jittered, capped delay before attempt retry_count + 1.
    [[nodiscard]] Millis backoff_delay(uint32_t retry_count);

    /// Deterministic part of the delay (no jitter), capped at max_delay.
    [[nodiscard]] Millis base_delay(uint32_t retry_count) const noexcept;

    [[nodiscard]] uint32_t max_retries() const noexcept { return config_.max_retries; }
    [[nodiscard]] BackoffStrategy strategy() const noexcept { return strategy_; }

private:
    RetryConfig config_;
    BackoffStrategy strategy_;
    Logger& logger_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

}  // namespace edit_orchestrator
