/**
 * @file Session.hpp
 * @brief The mutable record of one portal connection
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#pragma once

#ifndef TETHER_PORTAL_SESSION_HPP
#define TETHER_PORTAL_SESSION_HPP

#include <Tether/Core/Types.hpp>
#include <Tether/Portal/Cipher.hpp>
#include <Tether/Portal/HeartbeatSchedule.hpp>
#include <memory>
#include <string>

namespace Tether::Portal {

/**
 * @brief Who this client is to the portal
 */
struct SessionIdentity {
    std::string userIp;
    std::string acIp;        ///< Access concentrator
    std::string domain;
    std::string area;
    std::string schoolId;
    std::string clientId;    ///< Random v4 UUID, fixed for the session
    std::string hostname;
    std::string macAddress;
    std::string ticket;
    std::string algoId = kZeroAlgorithmId;
};

/**
 * @brief Portal URLs discovered during authentication
 */
struct PortalEndpoints {
    std::string indexUrl;
    std::string ticketUrl;
    std::string authUrl;
    std::string keepUrl;     ///< Heartbeat target
    std::string termUrl;     ///< Logout target
    std::string redirectUrl;
};

/**
 * @brief Lifecycle state of a session
 */
enum class SessionState {
    Unauthenticated,
    Authenticating,
    Authenticated,
    LoggedOut
};

std::string_view sessionStateName(SessionState state) noexcept;

/**
 * @brief Session record, owned and mutated by a single engine thread
 *
 * cipher is null until the first successful authentication. The
 * heartbeat is disabled until then and again whenever the probe sees a
 * redirect.
 */
struct Session {
    SessionIdentity identity;
    PortalEndpoints endpoints;

    std::unique_ptr<Cipher> cipher;
    HeartbeatSchedule heartbeat;
    SessionState state = SessionState::Unauthenticated;

    Milliseconds pollInterval{10000};
    Milliseconds retryInterval{10000};

    [[nodiscard]] bool hasCipher() const noexcept {
        return cipher != nullptr;
    }
};

} // namespace Tether::Portal

#endif // TETHER_PORTAL_SESSION_HPP
