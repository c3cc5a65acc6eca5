/**
 * @file FailurePolicy.hpp
 * @brief What the session loop does when an operation fails
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#pragma once

#ifndef TETHER_PORTAL_FAILURE_POLICY_HPP
#define TETHER_PORTAL_FAILURE_POLICY_HPP

#include <string_view>

namespace Tether::Portal {

/**
 * @brief Session operations that can fail
 */
enum class Operation {
    Construct,
    Probe,
    Authenticate,
    Heartbeat,
    Logout
};

/**
 * @brief Handling applied to a failed operation
 */
enum class FailurePolicy {
    Fatal,                ///< Abort; no session is produced
    LogAndContinue,       ///< Log and carry on as if it succeeded
    LogAndRetryNextTick   ///< Log and try again at the next scheduled tick
};

/**
 * @brief Policy table
 *
 * | Operation    | Policy              |
 * |--------------|---------------------|
 * | Construct    | Fatal               |
 * | Probe        | LogAndRetryNextTick |
 * | Authenticate | LogAndContinue      |
 * | Heartbeat    | LogAndRetryNextTick |
 * | Logout       | LogAndContinue      |
 */
constexpr FailurePolicy policyFor(Operation operation) noexcept {
    switch (operation) {
        case Operation::Construct:    return FailurePolicy::Fatal;
        case Operation::Probe:        return FailurePolicy::LogAndRetryNextTick;
        case Operation::Authenticate: return FailurePolicy::LogAndContinue;
        case Operation::Heartbeat:    return FailurePolicy::LogAndRetryNextTick;
        case Operation::Logout:       return FailurePolicy::LogAndContinue;
    }
    return FailurePolicy::Fatal;
}

std::string_view operationName(Operation operation) noexcept;
std::string_view policyName(FailurePolicy policy) noexcept;

} // namespace Tether::Portal

#endif // TETHER_PORTAL_FAILURE_POLICY_HPP
