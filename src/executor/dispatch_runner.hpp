/**
 * @file dispatch_runner.hpp
 * @brief std::jthread pool that runs actuator dispatches under a stage timeout.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "actuator/actuator.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <unordered_set>
#include <vector>

namespace edit_orchestrator {

/**
 * @brief Bounded pool for actuator dispatch calls.
 *
 * run() blocks the calling worker until the dispatch returns or the stage
 * timeout expires. On timeout the call's stop_token is triggered and the
 * caller gets a transient error immediately; the pool thread stays with the
 * actuator until it returns (no forced interruption).
 */
class DispatchRunner {
public:
    DispatchRunner(IActuator& actuator, size_t num_threads, Logger& logger);
    ~DispatchRunner();

    DispatchRunner(const DispatchRunner&) = delete;
    DispatchRunner& operator=(const DispatchRunner&) = delete;

    /**
     * @brief Dispatch `subject` with `config` and wait up to `timeout`.
     *
     * A stop request on `caller_stop` is forwarded to the
     * actuator call; the wait still ends at the timeout at the latest.
     */
    ActuatorResult<void> run(const SubjectRef& subject, const std::string& config,
                             Millis timeout, std::stop_token caller_stop = {});

    /// Ask every queued and running call to stop.
    void cancel_all();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    struct Call {
        SubjectRef subject;
        std::string config;
        std::stop_source stop;
        std::promise<ActuatorResult<void>> promise;
    };

    void worker_loop(std::stop_token stop);
    void execute(Call& call);

    IActuator& actuator_;
    Logger& logger_;

    std::vector<std::jthread> workers_;
    std::queue<std::shared_ptr<Call>> queue_;
    std::unordered_set<std::shared_ptr<Call>> running_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_calls_{0};
};

}  // namespace edit_orchestrator
