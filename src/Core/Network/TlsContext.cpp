/**
 * @file TlsContext.cpp
 * @brief TLS settings applied to every HTTPS portal request
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Core/HttpClient.hpp>
#include <Tether/Core/ErrorCodes.hpp>
#include <curl/curl.h>

namespace Tether::Network {

/**
 * @brief Require TLS 1.2 or newer
 * @param curl The cURL handle to configure
 */
ErrorCode configureTlsVersion(CURL* curl) {
    if (!curl) {
        return ErrorCode::InvalidArgument;
    }

    CURLcode res = curl_easy_setopt(curl, CURLOPT_SSLVERSION, CURL_SSLVERSION_TLSv1_2);
    if (res != CURLE_OK) {
        return ErrorCode::TlsHandshakeFailed;
    }

    return ErrorCode::Success;
}

/**
 * @brief Peer and host verification
 *
 * Some campus portals present self-signed certificates, so verification
 * can be turned off through TransportOptions::verifyTls.
 */
ErrorCode configureTlsVerification(CURL* curl, bool verifyPeer, bool verifyHost) {
    if (!curl) {
        return ErrorCode::InvalidArgument;
    }

    if (curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verifyPeer ? 1L : 0L) != CURLE_OK ||
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verifyHost ? 2L : 0L) != CURLE_OK) {
        return ErrorCode::TlsHandshakeFailed;
    }

    return ErrorCode::Success;
}

} // namespace Tether::Network
