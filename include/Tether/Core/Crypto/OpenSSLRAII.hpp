/**
 * @file OpenSSLRAII.hpp
 * @brief Scoped ownership of OpenSSL EVP contexts
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * A session keeper runs for days; every early return in the cipher and
 * digest code must release its context.
 *
 * @code
 * EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
 * if (!ctx) {
 *     return ErrorCode::CryptoError;
 * }
 * EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
 * @endcode
 */

#pragma once

#ifndef TETHER_CRYPTO_OPENSSL_RAII_HPP
#define TETHER_CRYPTO_OPENSSL_RAII_HPP

#include <openssl/evp.h>
#include <utility>

namespace Tether::Crypto {

/**
 * @brief Unique owner of an OpenSSL object freed by @p Deleter
 *
 * @tparam T OpenSSL object type (e.g. EVP_CIPHER_CTX)
 * @tparam Deleter OpenSSL free function for T
 */
template<typename T, void (*Deleter)(T*)>
class OpenSSLRAII {
public:
    explicit OpenSSLRAII(T* ptr = nullptr) noexcept
        : m_ptr(ptr) {
    }

    ~OpenSSLRAII() noexcept {
        reset();
    }

    OpenSSLRAII(const OpenSSLRAII&) = delete;
    OpenSSLRAII& operator=(const OpenSSLRAII&) = delete;

    OpenSSLRAII(OpenSSLRAII&& other) noexcept
        : m_ptr(std::exchange(other.m_ptr, nullptr)) {
    }

    OpenSSLRAII& operator=(OpenSSLRAII&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.m_ptr, nullptr));
        }
        return *this;
    }

    /// Free the held object and take @p ptr
    void reset(T* ptr = nullptr) noexcept {
        if (m_ptr != nullptr) {
            Deleter(m_ptr);
        }
        m_ptr = ptr;
    }

    [[nodiscard]] T* get() const noexcept {
        return m_ptr;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return m_ptr != nullptr;
    }

    /// Implicit conversion for passing straight into EVP_* calls
    operator T*() const noexcept {
        return m_ptr;
    }

private:
    T* m_ptr;
};

/// Symmetric cipher context (AES-GCM)
using EVPCipherCtxPtr = OpenSSLRAII<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free>;

/// Message digest context (SHA-2)
using EVPMDCtxPtr = OpenSSLRAII<EVP_MD_CTX, EVP_MD_CTX_free>;

} // namespace Tether::Crypto

#endif // TETHER_CRYPTO_OPENSSL_RAII_HPP
