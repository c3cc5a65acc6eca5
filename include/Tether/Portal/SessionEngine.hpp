/**
 * @file SessionEngine.hpp
 * @brief Captive-portal session lifecycle
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * The engine owns one Session and drives it from a single thread:
 *
 * - every poll interval it probes the network; a redirect disables the
 *   heartbeat and triggers authentication
 * - when the heartbeat deadline passes it sends a sealed heartbeat and
 *   re-arms to the interval the portal returns
 * - when the lifetime is cancelled, or the loop exits for any other reason,
 *   it logs out once and stops both timers
 *
 * Failures are contained according to policyFor().
 */

#pragma once

#ifndef TETHER_PORTAL_SESSION_ENGINE_HPP
#define TETHER_PORTAL_SESSION_ENGINE_HPP

#include <Tether/Core/Config.hpp>
#include <Tether/Core/ErrorCodes.hpp>
#include <Tether/Core/HttpClient.hpp>
#include <Tether/Portal/Cipher.hpp>
#include <Tether/Portal/Lifetime.hpp>
#include <Tether/Portal/Session.hpp>
#include <memory>
#include <string>

namespace Tether::Portal {

/// Bound on the terminate request sent at logout
inline constexpr Milliseconds kLogoutTimeout{5000};

class SessionEngine {
public:
    /**
     * @brief Build an engine from @p config
     *
     * The configuration is normalized first. When @p transport is null one
     * is built from the bind interface and proxy settings.
     *
     * @return ConfigMissing for empty credentials, InterfaceNotFound or
     *         TransportBuildFailed when the transport cannot be built,
     *         RandomGenerationFailed when no client id can be drawn
     */
    static Result<std::unique_ptr<SessionEngine>> create(
        const Config::KeeperConfig& config,
        std::unique_ptr<Network::HttpTransport> transport = nullptr,
        CipherRegistry registry = CipherRegistry::withDefaults());

    ~SessionEngine();

    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;

    /**
     * @brief Run until the lifetime is cancelled
     *
     * Probes once immediately, then serves poll and heartbeat deadlines.
     * Logout runs exactly once on the way out, including when a
     * collaborator throws.
     */
    void run();

    /**
     * @brief Probe the network once
     *
     * 204 succeeds without touching the session. A redirect disables the
     * heartbeat and hands the Location to handleRedirect().
     *
     * @return UnexpectedStatus for any other status, or the transport error
     */
    Result<void> checkNetwork();

    /**
     * @brief Authenticate from a redirect; failures are logged, not returned
     */
    Result<void> handleRedirect(const std::string& location);

    /**
     * @brief Run the portal handshake and commit its result
     *
     * On success the heartbeat is armed with the advertised interval, or
     * heartbeat_default when the portal advertises none. On failure the
     * session keeps its previous cipher and endpoints.
     */
    Result<void> authenticate(const std::string& location);

    /**
     * @brief Send one heartbeat and re-arm to the returned interval
     * @return NotAuthenticated without a cipher; any failure leaves the
     *         current interval in place
     */
    Result<void> sendHeartbeat();

    /**
     * @brief Best-effort logout; later calls do nothing
     */
    void logout();

    /// Cancellation handle; cancel() from any thread stops run()
    std::shared_ptr<Lifetime> lifetime() const;

    /// Session snapshot; only stable while run() is not executing
    const Session& session() const noexcept;
    SessionState state() const noexcept;

    /// "[<rid>][user:<name> bind_device:<iface>] "
    const std::string& logPrefix() const noexcept;

    int logoutAttempts() const noexcept;

    /// Neither the poll timer nor the heartbeat is armed
    bool timersStopped() const noexcept;

private:
    class Impl;
    explicit SessionEngine(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> m_impl;
};

} // namespace Tether::Portal

#endif // TETHER_PORTAL_SESSION_ENGINE_HPP
