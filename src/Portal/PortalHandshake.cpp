/**
 * @file PortalHandshake.cpp
 * @brief Index, ticket and login exchanges with the captive portal
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/PortalHandshake.hpp>
#include <Tether/Core/Crypto.hpp>
#include <Tether/Core/Logger.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <limits>

namespace Tether::Portal {

namespace {

struct CurlUrlGuard {
    CURLU* handle;
    ~CurlUrlGuard() { if (handle) curl_url_cleanup(handle); }
};

/// Form-style decoding: '+' is a space, malformed escapes are kept literally
std::string decodeComponent(std::string_view text) {
    std::string spaced(text);
    std::replace(spaced.begin(), spaced.end(), '+', ' ');
    if (spaced.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return spaced;
    }

    int length = 0;
    char* decoded = curl_easy_unescape(nullptr, spaced.data(), static_cast<int>(spaced.size()), &length);
    if (decoded == nullptr) {
        return spaced;
    }
    std::string out(decoded, static_cast<size_t>(length));
    curl_free(decoded);
    return out;
}

/// Query part of an absolute URL, empty when there is none
Result<std::string> urlQuery(const std::string& url) {
    CurlUrlGuard guard{curl_url()};
    if (!guard.handle) {
        return ErrorCode::InternalError;
    }
    if (curl_url_set(guard.handle, CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return ErrorCode::InvalidUrl;
    }

    char* query = nullptr;
    CURLUcode rc = curl_url_get(guard.handle, CURLUPART_QUERY, &query, 0);
    if (rc != CURLUE_OK) {
        // No query part
        return std::string();
    }
    std::string result(query);
    curl_free(query);
    return result;
}

void logDebug(const std::string& prefix, const char* step, const std::string& detail) {
    TETHER_LOG_DEBUG_F("%s%s %s", prefix.c_str(), step, detail.c_str());
}

} // namespace

// ============================================================================
// URL helpers
// ============================================================================

std::map<std::string, std::string> parseQuery(std::string_view query) {
    std::map<std::string, std::string> params;
    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);

        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        std::string key = decodeComponent(pair.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string() : decodeComponent(pair.substr(eq + 1));
        if (!key.empty()) {
            params.emplace(std::move(key), std::move(value));
        }
    }
    return params;
}

Result<std::string> resolveUrl(const std::string& base, const std::string& reference) {
    CurlUrlGuard guard{curl_url()};
    if (!guard.handle) {
        return ErrorCode::InternalError;
    }

    if (!base.empty() && curl_url_set(guard.handle, CURLUPART_URL, base.c_str(), 0) != CURLUE_OK) {
        return ErrorCode::InvalidUrl;
    }
    // With a base already set, a relative reference is resolved against it
    if (curl_url_set(guard.handle, CURLUPART_URL, reference.c_str(), 0) != CURLUE_OK) {
        return ErrorCode::InvalidUrl;
    }

    char* full = nullptr;
    if (curl_url_get(guard.handle, CURLUPART_URL, &full, 0) != CURLUE_OK) {
        return ErrorCode::InvalidUrl;
    }
    std::string result(full);
    curl_free(full);
    return result;
}

Result<RedirectTarget> parseRedirectLocation(const std::string& location,
                                             const std::string& fallbackRedirect) {
    if (location.empty()) {
        return ErrorCode::MissingLocation;
    }

    auto indexUrl = resolveUrl("", location);
    if (indexUrl.isFailure()) {
        return indexUrl.error();
    }
    auto query = urlQuery(indexUrl.value());
    if (query.isFailure()) {
        return query.error();
    }

    auto params = parseQuery(query.value());

    RedirectTarget target;
    target.indexUrl = indexUrl.value();
    target.userIp = params["wlanuserip"];
    target.acIp = params["wlanacip"];
    target.redirectUrl = params["redirect"].empty() ? fallbackRedirect : params["redirect"];
    return target;
}

// ============================================================================
// Sealed state exchange
// ============================================================================

Network::HttpHeaders stateHeaders(const std::string& clientId, std::string_view algoId) {
    Network::HttpHeaders headers;
    headers["Content-Type"] = "application/xml";
    headers["Client-ID"] = clientId;
    headers["Algo-ID"] = std::string(algoId);
    return headers;
}

Result<StateResponse> exchangeState(Network::HttpTransport& transport,
                                    const std::string& url,
                                    ByteSpan plaintext,
                                    Cipher& cipher,
                                    const std::string& clientId,
                                    Milliseconds timeout) {
    if (url.empty()) {
        return ErrorCode::InvalidUrl;
    }

    auto sealed = cipher.seal(plaintext);
    if (sealed.isFailure()) {
        return sealed.error();
    }

    Network::HttpRequest request;
    request.method = Network::HttpMethod::POST;
    request.url = url;
    request.headers = stateHeaders(clientId, cipher.algorithmId());
    request.body = std::move(sealed.value());
    request.timeout = timeout;

    auto response = transport.send(request);
    if (response.isFailure()) {
        return response.error();
    }
    if (!response.value().isSuccess()) {
        return ErrorCode::UnexpectedStatus;
    }

    auto opened = cipher.open(response.value().body);
    if (opened.isFailure()) {
        return opened.error();
    }

    return parseResponse(opened.value());
}

// ============================================================================
// PortalHandshake
// ============================================================================

PortalHandshake::PortalHandshake(Network::HttpTransport& transport,
                                 const CipherRegistry& registry,
                                 std::string logPrefix)
    : m_transport(transport)
    , m_registry(registry)
    , m_logPrefix(std::move(logPrefix)) {
}

Result<HandshakeResult> PortalHandshake::run(const SessionIdentity& identity,
                                             const std::string& location,
                                             const std::string& username,
                                             const std::string& password,
                                             const std::string& fallbackRedirect) {
    auto target = parseRedirectLocation(location, fallbackRedirect);
    if (target.isFailure()) {
        return target.error();
    }

    HandshakeResult result;
    result.identity = identity;
    result.identity.ticket.clear();
    result.identity.algoId = kZeroAlgorithmId;
    if (!target.value().userIp.empty()) result.identity.userIp = target.value().userIp;
    if (!target.value().acIp.empty()) result.identity.acIp = target.value().acIp;

    PortalEndpoints& endpoints = result.endpoints;
    endpoints.indexUrl = target.value().indexUrl;
    endpoints.redirectUrl = target.value().redirectUrl;

    // Index page
    logDebug(m_logPrefix, "portal index", endpoints.indexUrl);
    Network::HttpRequest indexRequest;
    indexRequest.url = endpoints.indexUrl;
    auto indexResponse = m_transport.send(indexRequest);
    if (indexResponse.isFailure()) {
        return indexResponse.error();
    }
    if (!indexResponse.value().isSuccess()) {
        return ErrorCode::UnexpectedStatus;
    }

    auto config = parsePortalConfig(indexResponse.value().body);
    if (config.isFailure()) {
        return config.error();
    }

    auto ticketUrl = resolveUrl(endpoints.indexUrl, config.value().ticketUrl);
    auto authUrl = resolveUrl(endpoints.indexUrl, config.value().authUrl);
    if (ticketUrl.isFailure() || authUrl.isFailure()) {
        return ErrorCode::InvalidUrl;
    }
    endpoints.ticketUrl = ticketUrl.value();
    endpoints.authUrl = authUrl.value();

    if (config.value().domain) result.identity.domain = *config.value().domain;
    if (config.value().area) result.identity.area = *config.value().area;
    if (config.value().schoolId) result.identity.schoolId = *config.value().schoolId;

    // Ticket, sealed with the plain cipher
    const std::string& clientId = result.identity.clientId;
    auto plain = m_registry.create({clientId, "", kZeroAlgorithmId});
    if (plain.isFailure()) {
        return plain.error();
    }

    logDebug(m_logPrefix, "requesting ticket from", endpoints.ticketUrl);
    ByteBuffer stateBody = serialize(buildStateDocument(result.identity));
    auto ticketResponse = exchangeState(m_transport, endpoints.ticketUrl, stateBody,
                                        *plain.value(), clientId);
    if (ticketResponse.isFailure()) {
        return ticketResponse.error();
    }
    if (ticketResponse.value().result != 0) {
        logDebug(m_logPrefix, "ticket refused:", ticketResponse.value().message);
        return ErrorCode::AuthenticationFailed;
    }
    if (ticketResponse.value().ticket.empty()) {
        return ErrorCode::MalformedResponse;
    }

    result.identity.ticket = ticketResponse.value().ticket;
    if (!ticketResponse.value().algoId.empty()) {
        result.identity.algoId = ticketResponse.value().algoId;
    }

    // Negotiated cipher
    auto cipher = m_registry.create({clientId, result.identity.ticket, result.identity.algoId});
    if (cipher.isFailure()) {
        return cipher.error();
    }

    // Login, sealed with the negotiated cipher
    logDebug(m_logPrefix, "logging in at", endpoints.authUrl);
    ByteBuffer loginBody = buildLoginDocument(buildStateDocument(result.identity), username, password);
    auto loginResponse = exchangeState(m_transport, endpoints.authUrl, loginBody,
                                       *cipher.value(), clientId);
    Crypto::secureZero(loginBody.data(), loginBody.size());
    if (loginResponse.isFailure()) {
        return loginResponse.error();
    }
    if (loginResponse.value().result != 0) {
        logDebug(m_logPrefix, "login refused:", loginResponse.value().message);
        return ErrorCode::CredentialsRejected;
    }
    if (loginResponse.value().keepUrl.empty() || loginResponse.value().termUrl.empty()) {
        return ErrorCode::MalformedResponse;
    }

    auto keepUrl = resolveUrl(endpoints.authUrl, loginResponse.value().keepUrl);
    auto termUrl = resolveUrl(endpoints.authUrl, loginResponse.value().termUrl);
    if (keepUrl.isFailure() || termUrl.isFailure()) {
        return ErrorCode::InvalidUrl;
    }
    endpoints.keepUrl = keepUrl.value();
    endpoints.termUrl = termUrl.value();

    if (loginResponse.value().interval) {
        auto interval = requireInterval(loginResponse.value());
        if (interval.isFailure()) {
            return interval.error();
        }
        result.heartbeatInterval = interval.value();
    }

    result.cipher = std::move(cipher.value());
    return Result<HandshakeResult>(std::move(result));
}

} // namespace Tether::Portal
