/**
 * @file Crypto.hpp
 * @brief Cryptographic utilities for Tether
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * This module provides the primitives the portal ciphers and the session
 * identity are built from:
 * - AES-256-GCM encryption/decryption
 * - SHA-256/SHA-512 hashing
 * - Secure random bytes, request tokens and client UUIDs
 * - Hex encoding
 */

#pragma once

#ifndef TETHER_CORE_CRYPTO_HPP
#define TETHER_CORE_CRYPTO_HPP

#include <Tether/Core/Types.hpp>
#include <Tether/Core/ErrorCodes.hpp>
#include <memory>
#include <string>

namespace Tether::Crypto {

// ============================================================================
// Secure Random Number Generator
// ============================================================================

/**
 * @brief Cryptographically secure random number generator
 *
 * Reads from /dev/urandom, retrying on EINTR.
 */
class SecureRandom {
public:
    SecureRandom();
    ~SecureRandom();

    /**
     * @brief Fill a buffer with random bytes
     * @param buffer Buffer to fill
     * @param size Number of bytes to generate
     * @return Result indicating success or failure
     */
    Result<void> generate(Byte* buffer, size_t size);

    /**
     * @brief Generate random byte buffer
     * @param size Number of bytes to generate
     * @return Random bytes or error
     */
    Result<ByteBuffer> generate(size_t size);

    /**
     * @brief Generate random value of type T
     * @tparam T Trivially copyable type
     */
    template<typename T>
    Result<T> generateValue() {
        T value;
        auto result = generate(reinterpret_cast<Byte*>(&value), sizeof(T));
        if (result.isFailure()) return result.error();
        return value;
    }

    /**
     * @brief Generate random 12-byte GCM nonce
     */
    Result<AESNonce> generateNonce();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Random alphanumeric token ([0-9A-Za-z]), used as a request id
 * @param length Number of characters
 */
Result<std::string> randomToken(size_t length);

/**
 * @brief Random RFC 4122 version 4 UUID in lowercase 8-4-4-4-12 form
 */
Result<std::string> generateUuid();

// ============================================================================
// Hash Engine
// ============================================================================

/**
 * @brief Hash algorithm types
 */
enum class HashAlgorithm {
    SHA256,
    SHA512
};

/**
 * @brief Cryptographic hash engine
 *
 * Provides one-shot and streaming hash computation.
 *
 * @example
 * ```cpp
 * HashEngine hasher(HashAlgorithm::SHA256);
 * hasher.init();
 * hasher.update(clientId);
 * hasher.update(ticket);
 * auto digest = hasher.finalize();
 * ```
 */
class HashEngine {
public:
    explicit HashEngine(HashAlgorithm algorithm = HashAlgorithm::SHA256);
    ~HashEngine();

    /**
     * @brief Compute hash of data (one-shot)
     */
    Result<ByteBuffer> hash(ByteSpan data);

    /**
     * @brief Compute SHA-256 hash
     * @param data Data to hash
     * @return SHA256Hash or error
     */
    static Result<SHA256Hash> sha256(ByteSpan data);

    Result<void> init();
    Result<void> update(ByteSpan data);
    Result<ByteBuffer> finalize();

    /**
     * @brief Digest size in bytes for @p algorithm
     */
    static size_t getHashSize(HashAlgorithm algorithm) noexcept;

    HashAlgorithm getAlgorithm() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// AES Cipher
// ============================================================================

/**
 * @brief AES-256-GCM cipher for authenticated encryption
 *
 * Every encrypt() call draws a fresh random nonce. Output layout is
 * nonce (12) + ciphertext + tag (16).
 *
 * @warning Nonce reuse with the same key breaks confidentiality and
 * authenticity. Keys derived per session are never reused across sessions.
 */
class AESCipher {
public:
    /**
     * @brief Construct cipher with key
     * @param key AES-256 key (32 bytes)
     */
    explicit AESCipher(const AESKey& key);

    ~AESCipher();

    AESCipher(const AESCipher&) = delete;
    AESCipher& operator=(const AESCipher&) = delete;

    /**
     * @brief Encrypt data with AES-256-GCM
     * @param plaintext Data to encrypt
     * @param associatedData Additional authenticated data (optional)
     * @return nonce + ciphertext + tag, or error
     */
    Result<ByteBuffer> encrypt(ByteSpan plaintext, ByteSpan associatedData = {});

    /**
     * @brief Decrypt and verify data produced by encrypt()
     * @param ciphertext nonce + ciphertext + tag
     * @param associatedData Additional authenticated data (optional)
     * @return Plaintext, InvalidArgument for short input, or
     *         AuthenticationFailed when the tag does not verify
     */
    Result<ByteBuffer> decrypt(ByteSpan ciphertext, ByteSpan associatedData = {});

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Convert bytes to lowercase hex string
 */
std::string toHex(ByteSpan data);

/**
 * @brief Convert hex string (either case) to bytes
 * @return Bytes, or InvalidHexString on odd length or a non-hex digit
 */
Result<ByteBuffer> fromHex(std::string_view hex);

/**
 * @brief Securely zero memory
 * @param data Memory to zero
 * @param size Size of memory
 */
void secureZero(void* data, size_t size) noexcept;

} // namespace Tether::Crypto

#endif // TETHER_CORE_CRYPTO_HPP
