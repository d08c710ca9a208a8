/**
 * @file actuator.hpp
 * @brief Downstream actuator interface.
 * @author Dimitris Kafetzis
 *
 * The actuator is the host-controlled component that actually mutates a
 * subject. It is chosen once at startup, so it is a virtual interface.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string>

namespace edit_orchestrator {

/**
 * @brief Failure reported by the actuator. The class may be Unclassified, in
 *        which case the retry manager classifies by message.
 */
struct ActuatorError {
    FailureClass failure_class{FailureClass::Unclassified};
    std::string message;
};

template <typename T>
using ActuatorResult = Result<T, ActuatorError>;

class IActuator {
public:
    virtual ~IActuator() = default;

    /// Snapshot the subject so a later rollback can restore it.
    virtual ActuatorResult<CheckpointHandle> checkpoint(const SubjectRef& subject) = 0;

    /**
     * @brief Apply the job's opaque config to the subject.
     *
     * Long-running implementations should poll `stop`; the engine requests
     * stop when the stage timeout expires and no longer waits for the result.
     */
    virtual ActuatorResult<void> dispatch(const SubjectRef& subject,
                                          const std::string& config,
                                          std::stop_token stop) = 0;

    virtual ActuatorResult<void> rollback(const CheckpointHandle& handle) = 0;
};

}  // namespace edit_orchestrator
