/**
 * @file HttpClient.hpp
 * @brief HTTP transport used for probing and portal exchanges
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * Redirects are never followed unless a request asks for it, so callers
 * observe the portal's 302 and its Location header.
 */

#pragma once

#ifndef TETHER_CORE_HTTP_CLIENT_HPP
#define TETHER_CORE_HTTP_CLIENT_HPP

#include <Tether/Core/Types.hpp>
#include <Tether/Core/ErrorCodes.hpp>
#include <string>
#include <map>
#include <memory>
#include <chrono>

namespace Tether::Network {

// ============================================================================
// HTTP Types
// ============================================================================

/**
 * @brief HTTP methods
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief HTTP header map
 */
using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    ByteBuffer body;

    /// Zero uses the transport's default timeout
    Milliseconds timeout{0};

    /// Follow redirects
    bool followRedirects = false;

    /// Maximum redirects when following
    int maxRedirects = 5;
};

/**
 * @brief HTTP response
 */
struct HttpResponse {
    /// HTTP status code
    int statusCode = 0;

    /// Response headers, names lowercased
    HttpHeaders headers;

    /// Response body
    ByteBuffer body;

    /// Total time taken
    Milliseconds elapsed{0};

    /// Check if request was successful (2xx)
    [[nodiscard]] bool isSuccess() const noexcept {
        return statusCode >= 200 && statusCode < 300;
    }

    /// Check if request was redirected (3xx)
    [[nodiscard]] bool isRedirect() const noexcept {
        return statusCode >= 300 && statusCode < 400;
    }

    /// Get body as string
    [[nodiscard]] std::string bodyAsString() const {
        return std::string(body.begin(), body.end());
    }

    /// Get header value (case-insensitive), empty when absent
    [[nodiscard]] std::string getHeader(const std::string& name) const;
};

// ============================================================================
// Transport
// ============================================================================

/**
 * @brief Request executor the session engine talks through
 *
 * Implementations are used from a single engine thread.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Execute a request
     * @return Response for any HTTP status, or a network error code
     */
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief Settings a transport is built from
 */
struct TransportOptions {
    std::string bindInterface;           ///< Outgoing interface, empty = system routing
    std::string proxy;                   ///< Proxy URL, empty = direct
    std::string userAgent = "Tether/1.0";
    Milliseconds defaultTimeout{10000};
    bool verifyTls = true;
    size_t maxResponseBytes = 1024 * 1024;  ///< Larger bodies fail with ResponseTooLarge
};

// ============================================================================
// HTTP Client
// ============================================================================

/**
 * @brief libcurl-backed transport
 *
 * @example
 * ```cpp
 * TransportOptions options;
 * options.bindInterface = "eth0";
 * HttpClient client(options);
 *
 * auto response = client.get("http://connect.rom.miui.com/generate_204");
 * if (response.isSuccess() && response.value().statusCode == 204) {
 *     // online
 * }
 * ```
 */
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const TransportOptions& options = {});
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

    /**
     * @brief Send GET request
     */
    Result<HttpResponse> get(const std::string& url, const HttpHeaders& headers = {});

    /**
     * @brief Send POST request
     */
    Result<HttpResponse> post(
        const std::string& url,
        const ByteBuffer& body,
        const HttpHeaders& headers = {}
    );

    [[nodiscard]] const TransportOptions& options() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Build a transport for @p options
 * @return InterfaceNotFound when the bind interface does not exist,
 *         TransportBuildFailed when libcurl cannot be initialised or the
 *         proxy URL does not parse
 */
Result<std::unique_ptr<HttpTransport>> buildTransport(const TransportOptions& options);

} // namespace Tether::Network

#endif // TETHER_CORE_HTTP_CLIENT_HPP
