/**
 * @file ErrorCodes.cpp
 * @brief Human-readable error and category names
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Core/ErrorCodes.hpp>

namespace Tether {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                return "success";

        case ErrorCode::SystemError:            return "system error";
        case ErrorCode::ThreadCreationFailed:   return "thread creation failed";
        case ErrorCode::Timeout:                return "operation timed out";
        case ErrorCode::Cancelled:              return "operation cancelled";
        case ErrorCode::NotSupported:           return "not supported";
        case ErrorCode::InterfaceNotFound:      return "network interface not found";

        case ErrorCode::CryptoError:            return "cryptographic error";
        case ErrorCode::EncryptionFailed:       return "encryption failed";
        case ErrorCode::DecryptionFailed:       return "decryption failed";
        case ErrorCode::HashFailed:             return "hash computation failed";
        case ErrorCode::InvalidKey:             return "invalid key";
        case ErrorCode::RandomGenerationFailed: return "random generation failed";
        case ErrorCode::UnsupportedAlgorithm:   return "unsupported cipher algorithm";

        case ErrorCode::NetworkError:           return "network error";
        case ErrorCode::ConnectionFailed:       return "connection failed";
        case ErrorCode::DnsResolutionFailed:    return "DNS resolution failed";
        case ErrorCode::TlsHandshakeFailed:     return "TLS handshake failed";
        case ErrorCode::HttpRequestFailed:      return "HTTP request failed";
        case ErrorCode::HttpResponseInvalid:    return "invalid HTTP response";
        case ErrorCode::UnexpectedStatus:       return "unexpected status code";
        case ErrorCode::MissingLocation:        return "redirect without Location header";
        case ErrorCode::CurlInitFailed:         return "cURL initialization failed";
        case ErrorCode::CertificateInvalid:     return "certificate validation failed";
        case ErrorCode::ResponseTooLarge:       return "response body too large";

        case ErrorCode::ConfigError:            return "configuration error";
        case ErrorCode::ConfigMissing:          return "missing required configuration";
        case ErrorCode::ConfigInvalid:          return "invalid configuration value";
        case ErrorCode::ConfigFileNotFound:     return "configuration file not found";
        case ErrorCode::ConfigParseFailed:      return "configuration parse error";
        case ErrorCode::TransportBuildFailed:   return "failed to create transport";

        case ErrorCode::IOError:                return "I/O error";
        case ErrorCode::FileNotFound:           return "file not found";
        case ErrorCode::FileTooLarge:           return "file too large";
        case ErrorCode::InvalidPath:            return "invalid path";

        case ErrorCode::ParseError:             return "parse error";
        case ErrorCode::MalformedResponse:      return "malformed response";
        case ErrorCode::MissingField:           return "missing required field";
        case ErrorCode::InvalidHexString:       return "invalid hex string";
        case ErrorCode::InvalidUrl:             return "invalid URL";

        case ErrorCode::AuthError:              return "authentication error";
        case ErrorCode::AuthenticationFailed:   return "authentication failed";
        case ErrorCode::CredentialsRejected:    return "credentials rejected by portal";
        case ErrorCode::NotAuthenticated:       return "session not authenticated";

        case ErrorCode::InternalError:          return "internal error";
        case ErrorCode::NotImplemented:         return "not implemented";
        case ErrorCode::InvalidState:           return "invalid state";
        case ErrorCode::NullPointer:            return "null pointer";
        case ErrorCode::InvalidArgument:        return "invalid argument";
        case ErrorCode::OutOfRange:             return "out of range";
    }
    return "unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::System:   return "System";
        case ErrorCategory::Crypto:   return "Crypto";
        case ErrorCategory::Network:  return "Network";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::Auth:     return "Auth";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Tether
