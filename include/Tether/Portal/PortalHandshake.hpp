/**
 * @file PortalHandshake.hpp
 * @brief Authentication handshake against the captive portal
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * Sequence, starting from the Location of the probe redirect:
 *  1. The Location is the index URL. Its query carries wlanuserip,
 *     wlanacip and optionally redirect (where the portal returns the user).
 *  2. GET index URL -> <config> with ticket-url and auth-url.
 *  3. POST sealed <state> (plain cipher) to ticket-url -> ticket, algo-id.
 *  4. Build the cipher registered for algo-id.
 *  5. POST sealed <login> (new cipher) to auth-url -> keep-url, term-url
 *     and optionally the first heartbeat interval.
 *
 * Nothing is written to the session; the engine commits the result only
 * when every step succeeded.
 */

#pragma once

#ifndef TETHER_PORTAL_PORTAL_HANDSHAKE_HPP
#define TETHER_PORTAL_PORTAL_HANDSHAKE_HPP

#include <Tether/Core/ErrorCodes.hpp>
#include <Tether/Core/HttpClient.hpp>
#include <Tether/Portal/Cipher.hpp>
#include <Tether/Portal/Session.hpp>
#include <Tether/Portal/StateCodec.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Tether::Portal {

// ============================================================================
// URL helpers
// ============================================================================

/**
 * @brief Portal parameters carried by the probe redirect
 */
struct RedirectTarget {
    std::string indexUrl;
    std::string userIp;
    std::string acIp;
    std::string redirectUrl;
};

/**
 * @brief Split a query string into decoded key/value pairs
 *
 * '+' decodes to a space; a key without '=' maps to an empty value.
 */
std::map<std::string, std::string> parseQuery(std::string_view query);

/**
 * @brief Resolve @p reference against @p base (RFC 3986)
 * @return Absolute URL, or InvalidUrl
 */
Result<std::string> resolveUrl(const std::string& base, const std::string& reference);

/**
 * @brief Decode a probe redirect Location
 * @param location Absolute URL from the Location header
 * @param fallbackRedirect Used when the query has no redirect parameter
 * @return MissingLocation for an empty location, InvalidUrl when it does
 *         not parse as an absolute URL
 */
Result<RedirectTarget> parseRedirectLocation(const std::string& location,
                                             const std::string& fallbackRedirect);

// ============================================================================
// Sealed state exchange
// ============================================================================

/**
 * @brief Headers sent with every sealed document
 */
Network::HttpHeaders stateHeaders(const std::string& clientId, std::string_view algoId);

/**
 * @brief Seal @p plaintext, POST it to @p url, open and parse the reply
 * @param timeout Zero uses the transport default
 * @return UnexpectedStatus for a non-2xx reply, otherwise the first error
 *         from sealing, transport, opening or parsing
 */
Result<StateResponse> exchangeState(Network::HttpTransport& transport,
                                    const std::string& url,
                                    ByteSpan plaintext,
                                    Cipher& cipher,
                                    const std::string& clientId,
                                    Milliseconds timeout = Milliseconds{0});

// ============================================================================
// Handshake
// ============================================================================

/**
 * @brief Everything a successful handshake establishes
 */
struct HandshakeResult {
    SessionIdentity identity;
    PortalEndpoints endpoints;
    std::unique_ptr<Cipher> cipher;
    std::optional<Seconds> heartbeatInterval;
};

/**
 * @brief Runs the handshake over a borrowed transport and registry
 */
class PortalHandshake {
public:
    PortalHandshake(Network::HttpTransport& transport,
                    const CipherRegistry& registry,
                    std::string logPrefix = {});

    /**
     * @brief Authenticate starting from a probe redirect
     * @param identity Current identity; client id, host name and MAC are kept
     * @param location Location header of the probe redirect
     * @return AuthenticationFailed when the ticket is refused,
     *         CredentialsRejected when the login is refused,
     *         UnsupportedAlgorithm for an unknown algo-id, or the first
     *         transport or decode error
     */
    Result<HandshakeResult> run(const SessionIdentity& identity,
                                const std::string& location,
                                const std::string& username,
                                const std::string& password,
                                const std::string& fallbackRedirect);

private:
    Network::HttpTransport& m_transport;
    const CipherRegistry& m_registry;
    std::string m_logPrefix;
};

} // namespace Tether::Portal

#endif // TETHER_PORTAL_PORTAL_HANDSHAKE_HPP
