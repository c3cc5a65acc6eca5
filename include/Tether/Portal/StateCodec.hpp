/**
 * @file StateCodec.hpp
 * @brief XML documents exchanged with the portal
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * Outgoing documents:
 * @code
 * <state>
 *   <client-id>..</client-id> <ticket>..</ticket> <user-ip>..</user-ip>
 *   <ac-ip>..</ac-ip> <area>..</area> <school-id>..</school-id>
 *   <domain>..</domain> <host-name>..</host-name>
 *   <mac-address>..</mac-address> <algo-id>..</algo-id>
 *   <timestamp>1735689600000</timestamp>
 * </state>
 * @endcode
 * The login document carries the same fields plus username and password
 * under a <login> root.
 *
 * Portal replies use a <response> root with a required integer <result>
 * (0 = accepted) and optional <interval>, <message>, <ticket>, <algo-id>,
 * <keep-url> and <term-url>. The portal index page is a <config> document
 * naming <ticket-url> and <auth-url>.
 */

#pragma once

#ifndef TETHER_PORTAL_STATE_CODEC_HPP
#define TETHER_PORTAL_STATE_CODEC_HPP

#include <Tether/Core/Types.hpp>
#include <Tether/Core/ErrorCodes.hpp>
#include <Tether/Portal/Session.hpp>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>

namespace Tether::Portal {

/**
 * @brief Canonical description of the client sent with every request
 */
struct StateDocument {
    std::string clientId;
    std::string ticket;
    std::string userIp;
    std::string acIp;
    std::string area;
    std::string schoolId;
    std::string domain;
    std::string hostname;
    std::string macAddress;
    std::string algoId;
    int64_t timestampMs = 0;  ///< UTC milliseconds, replay marker

    bool operator==(const StateDocument&) const = default;
};

/**
 * @brief Typed portal reply
 */
struct StateResponse {
    int result = 0;
    std::optional<Seconds> interval;
    std::string message;
    std::string ticket;
    std::string algoId;
    std::string keepUrl;
    std::string termUrl;

    /// Child elements without a typed field above
    std::map<std::string, std::string> fields;
};

/**
 * @brief Endpoints and identifiers announced by the portal index page
 */
struct PortalConfig {
    std::string ticketUrl;
    std::string authUrl;
    std::optional<std::string> domain;
    std::optional<std::string> area;
    std::optional<std::string> schoolId;
};

/**
 * @brief Snapshot the identity fields with a timestamp of @p now
 */
StateDocument buildStateDocument(const SessionIdentity& identity,
                                 WallClock::time_point now = WallClock::now());

StateDocument buildStateDocument(const Session& session);

/**
 * @brief Encode under a <state> root
 */
ByteBuffer serialize(const StateDocument& document);

/**
 * @brief Inverse of serialize()
 * @return MalformedResponse when the bytes are not XML, the root is not
 *         <state>, a field is missing, or the timestamp is not an integer
 */
Result<StateDocument> deserialize(ByteSpan bytes);

/**
 * @brief State fields plus credentials, under a <login> root
 */
ByteBuffer buildLoginDocument(const StateDocument& document,
                              const std::string& username,
                              const std::string& password);

/**
 * @brief Decode a portal <response>
 * @return MalformedResponse when <result> is missing or not an integer,
 *         or when a present <interval> is not an integer
 */
Result<StateResponse> parseResponse(ByteSpan bytes);

/// Longest heartbeat interval a portal may request
inline constexpr Seconds kMaxHeartbeatInterval{std::numeric_limits<int32_t>::max()};

/**
 * @brief Heartbeat interval of @p response
 * @return MalformedResponse when absent, not positive or above
 *         kMaxHeartbeatInterval
 */
Result<Seconds> requireInterval(const StateResponse& response);

/**
 * @brief Decode the portal index <config> document
 * @return MalformedResponse when ticket-url or auth-url is missing
 */
Result<PortalConfig> parsePortalConfig(ByteSpan bytes);

} // namespace Tether::Portal

#endif // TETHER_PORTAL_STATE_CODEC_HPP
