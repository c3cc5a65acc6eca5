/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for Tether
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * This file defines all error codes used throughout Tether, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef TETHER_CORE_ERROR_CODES_HPP
#define TETHER_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Tether {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system errors
    Crypto      = 0x03,  ///< Cryptographic errors
    Network     = 0x04,  ///< Network communication errors
    Config      = 0x08,  ///< Configuration errors
    IO          = 0x09,  ///< File I/O errors
    Parse       = 0x0A,  ///< Parsing errors
    Auth        = 0x0B,  ///< Authentication errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all Tether operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0300-0x03FF: Crypto errors
 * - 0x0400-0x04FF: Network errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0A00-0x0AFF: Parse errors
 * - 0x0B00-0x0BFF: Auth errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Generic system error
    SystemError = 0x0100,

    /// Thread creation failed
    ThreadCreationFailed = 0x0103,

    /// Operation timed out
    Timeout = 0x0105,

    /// Operation was cancelled
    Cancelled = 0x0106,

    /// Feature not supported on this platform
    NotSupported = 0x0107,

    /// Network interface does not exist
    InterfaceNotFound = 0x010A,

    // ========================================================================
    // Cryptographic Errors (0x0300-0x03FF)
    // ========================================================================

    /// Generic cryptographic error
    CryptoError = 0x0300,

    /// Encryption failed
    EncryptionFailed = 0x0301,

    /// Decryption failed
    DecryptionFailed = 0x0302,

    /// Hash computation failed
    HashFailed = 0x0303,

    /// Invalid key format or size
    InvalidKey = 0x0306,

    /// Random number generation failed
    RandomGenerationFailed = 0x0307,

    /// Portal negotiated an algorithm no registered cipher implements
    UnsupportedAlgorithm = 0x030D,

    // ========================================================================
    // Network Errors (0x0400-0x04FF)
    // ========================================================================

    /// Generic network error
    NetworkError = 0x0400,

    /// Failed to connect to server
    ConnectionFailed = 0x0401,

    /// DNS resolution failed
    DnsResolutionFailed = 0x0403,

    /// TLS handshake failed
    TlsHandshakeFailed = 0x0404,

    /// HTTP request failed
    HttpRequestFailed = 0x0406,

    /// Invalid HTTP response
    HttpResponseInvalid = 0x0407,

    /// Probe endpoint answered with neither 204 nor a redirect
    UnexpectedStatus = 0x040D,

    /// Redirect response carried no Location header
    MissingLocation = 0x040E,

    /// cURL initialization failed
    CurlInitFailed = 0x040C,

    /// Certificate validation failed
    CertificateInvalid = 0x040F,

    /// Response body exceeded TransportOptions::maxResponseBytes
    ResponseTooLarge = 0x0410,

    // ========================================================================
    // Configuration Errors (0x0800-0x08FF)
    // ========================================================================

    /// Generic configuration error
    ConfigError = 0x0800,

    /// Missing required configuration
    ConfigMissing = 0x0801,

    /// Invalid configuration value
    ConfigInvalid = 0x0802,

    /// Configuration file not found
    ConfigFileNotFound = 0x0803,

    /// Configuration parse error
    ConfigParseFailed = 0x0804,

    /// Transport could not be built from the configuration
    TransportBuildFailed = 0x0808,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0900,

    /// File not found
    FileNotFound = 0x0901,

    /// File too large
    FileTooLarge = 0x0909,

    /// Invalid file path
    InvalidPath = 0x090A,

    // ========================================================================
    // Parse Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// Generic parse error
    ParseError = 0x0A00,

    /// Portal response is not a well-formed document or lacks required fields
    MalformedResponse = 0x0A01,

    /// Missing required field
    MissingField = 0x0A03,

    /// Invalid hex string
    InvalidHexString = 0x0A05,

    /// Invalid URL
    InvalidUrl = 0x0A07,

    // ========================================================================
    // Authentication Errors (0x0B00-0x0BFF)
    // ========================================================================

    /// Generic authentication error
    AuthError = 0x0B00,

    /// Authentication failed (tag mismatch or portal rejection)
    AuthenticationFailed = 0x0B01,

    /// Portal refused the credentials
    CredentialsRejected = 0x0B07,

    /// No session cipher has been negotiated yet
    NotAuthenticated = 0x0B08,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,

    /// Not implemented
    NotImplemented = 0xFF02,

    /// Invalid state
    InvalidState = 0xFF03,

    /// Null pointer
    NullPointer = 0xFF04,

    /// Invalid argument
    InvalidArgument = 0xFF05,

    /// Out of range
    OutOfRange = 0xFF06
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * This is a discriminated union that holds either a value of type T
 * or an ErrorCode. Use this for error handling without exceptions.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * Result<int> parsePort(const std::string& text) {
 *     if (text.empty()) return ErrorCode::InvalidArgument;
 *     return std::stoi(text);
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// Explicit conversion to bool (true if success)
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 *
 * Used for operations that can fail but don't return a value.
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    /// Static method to create success result
    [[nodiscard]] static Result Success() {
        return Result();
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the error code
    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * TETHER_TRY(someOperation());
 * ```
 */
#define TETHER_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 *
 * Usage:
 * ```cpp
 * TETHER_TRY_ASSIGN(value, someOperation());
 * ```
 */
#define TETHER_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace Tether

#endif // TETHER_CORE_ERROR_CODES_HPP
