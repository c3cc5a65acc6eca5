/**
 * @file FailurePolicy.cpp
 * @brief Names for operations and failure policies
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/FailurePolicy.hpp>

namespace Tether::Portal {

std::string_view operationName(Operation operation) noexcept {
    switch (operation) {
        case Operation::Construct:    return "construct";
        case Operation::Probe:        return "probe";
        case Operation::Authenticate: return "authenticate";
        case Operation::Heartbeat:    return "heartbeat";
        case Operation::Logout:       return "logout";
    }
    return "unknown";
}

std::string_view policyName(FailurePolicy policy) noexcept {
    switch (policy) {
        case FailurePolicy::Fatal:               return "fatal";
        case FailurePolicy::LogAndContinue:      return "log-and-continue";
        case FailurePolicy::LogAndRetryNextTick: return "log-and-retry-next-tick";
    }
    return "unknown";
}

} // namespace Tether::Portal
