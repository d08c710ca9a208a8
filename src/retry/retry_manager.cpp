/**
 * @file retry_manager.cpp
 * @brief RetryManager implementation.
 * @author Dimitris Kafetzis
 */

#include "retry/retry_manager.hpp"

#include <algorithm>
#include <initializer_list>
#include <cctype>
#include <cmath>

namespace edit_orchestrator {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(const std::string& haystack, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

}  // anonymous namespace

std::optional<BackoffStrategy> parse_backoff_strategy(std::string_view text) noexcept {
    if (text == "exponential") return BackoffStrategy::Exponential;
    if (text == "linear")      return BackoffStrategy::Linear;
    if (text == "fixed")       return BackoffStrategy::Fixed;
    if (text == "immediate")   return BackoffStrategy::Immediate;
    return std::nullopt;
}

RetryManager::RetryManager(RetryConfig config, Logger& logger, std::optional<uint32_t> seed)
    : config_(std::move(config))
    , strategy_(parse_backoff_strategy(config_.strategy).value_or(BackoffStrategy::Exponential))
    , logger_(logger)
    , rng_(seed.value_or(std::random_device{}())) {}

FailureClass RetryManager::classify(const ActuatorError& error) {
    if (error.failure_class != FailureClass::Unclassified) {
        return error.failure_class;
    }

    auto text = lowercase(error.message);
    if (contains_any(text, {"out of memory", "oom", "insufficient memory", "vram"})) {
        return FailureClass::Resource;
    }
    if (contains_any(text, {"invalid", "malformed", "unsupported", "rejected", "corrupt"})) {
        return FailureClass::Fatal;
    }
    // timeout, connection refused, busy and anything unrecognised
    return FailureClass::Transient;
}

Millis RetryManager::base_delay(uint32_t retry_count) const noexcept {
    const double base = static_cast<double>(config_.base_delay_ms);
    double delay_ms = 0.0;
    switch (strategy_) {
        case BackoffStrategy::Exponential:
            delay_ms = base * std::pow(config_.multiplier, static_cast<double>(retry_count));
            break;
        case BackoffStrategy::Linear:
            delay_ms = base * static_cast<double>(retry_count + 1);
            break;
        case BackoffStrategy::Fixed:
            delay_ms = base;
            break;
        case BackoffStrategy::Immediate:
            delay_ms = 0.0;
            break;
    }
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay_ms));
    return Millis{static_cast<int64_t>(delay_ms)};
}

Millis RetryManager::backoff_delay(uint32_t retry_count) {
    const auto base = base_delay(retry_count);
    if (base.count() == 0 || config_.jitter_fraction <= 0.0) return base;

    const double spread = static_cast<double>(base.count()) * config_.jitter_fraction;
    double jitter = 0.0;
    {
        std::lock_guard lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(-spread, spread);
        jitter = dist(rng_);
    }
    double delay_ms = std::clamp(static_cast<double>(base.count()) + jitter,
                                 0.0, static_cast<double>(config_.max_delay_ms));
    return Millis{static_cast<int64_t>(std::llround(delay_ms))};
}

RetryDecision RetryManager::handle_failure(const Job& job, const ActuatorError& error) {
    RetryDecision decision;
    decision.failure_class = classify(error);

    if (decision.failure_class == FailureClass::Fatal) {
        decision.action = RetryDecision::Action::DeadLetter;
        decision.reason = "fatal: " + error.message;
    } else if (job.retry_count >= config_.max_retries) {
        decision.action = RetryDecision::Action::DeadLetter;
        decision.reason = "retries exhausted after " + std::to_string(job.retry_count + 1)
                          + " attempts: " + error.message;
    } else if (decision.failure_class == FailureClass::Resource) {
        decision.action = RetryDecision::Action::RetryWhenResourcesFree;
        decision.reason = "resource: " + error.message;
    } else {
        decision.action = RetryDecision::Action::RetryAfterDelay;
        decision.delay = backoff_delay(job.retry_count);
        decision.reason = std::string{to_string(decision.failure_class)} + ": " + error.message;
    }

    logger_.info("Job " + job.id + " attempt " + std::to_string(job.retry_count + 1)
                 + " failed (" + std::string{to_string(decision.failure_class)} + "): "
                 + std::string{to_string(decision.action)}
                 + (decision.action == RetryDecision::Action::RetryAfterDelay
                        ? " in " + std::to_string(decision.delay.count()) + "ms"
                        : std::string{}));
    return decision;
}

}  // namespace edit_orchestrator
