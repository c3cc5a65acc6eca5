/**
 * @file Cipher.hpp
 * @brief Sealing and opening of portal state payloads
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * The portal names the algorithm during authentication. The registry maps
 * that id to a factory; the resulting cipher is owned by the session
 * until the next successful authentication replaces it.
 */

#pragma once

#ifndef TETHER_PORTAL_CIPHER_HPP
#define TETHER_PORTAL_CIPHER_HPP

#include <Tether/Core/Types.hpp>
#include <Tether/Core/ErrorCodes.hpp>
#include <Tether/Core/Crypto.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace Tether::Portal {

/// Algorithm id meaning "no cipher negotiated yet"
inline constexpr const char* kZeroAlgorithmId = "00000000-0000-0000-0000-000000000000";

/**
 * @brief Session secrets a cipher is keyed from
 */
struct CipherKeyMaterial {
    std::string clientId;
    std::string ticket;
    std::string algoId;
};

/**
 * @brief Capability that turns a plaintext payload into wire bytes and back
 */
class Cipher {
public:
    virtual ~Cipher() = default;

    /**
     * @brief Plaintext to wire form
     */
    virtual Result<ByteBuffer> seal(ByteSpan plaintext) = 0;

    /**
     * @brief Wire form to plaintext
     */
    virtual Result<ByteBuffer> open(ByteSpan wire) = 0;

    /**
     * @brief Id this cipher was registered under (sent as Algo-ID)
     */
    [[nodiscard]] virtual std::string_view algorithmId() const noexcept = 0;
};

/**
 * @brief Identity cipher used before an algorithm is negotiated
 */
class PlainCipher final : public Cipher {
public:
    Result<ByteBuffer> seal(ByteSpan plaintext) override;
    Result<ByteBuffer> open(ByteSpan wire) override;
    [[nodiscard]] std::string_view algorithmId() const noexcept override;
};

/**
 * @brief AES-256-GCM keyed from SHA-256(clientId ":" ticket)
 *
 * Wire form is the lowercase hex of nonce (12) + ciphertext + tag (16).
 * Surrounding whitespace on the wire is ignored by open().
 */
class AesGcmCipher final : public Cipher {
public:
    static constexpr const char* kAlgorithmId = "a9b3c1d0-6e4f-4c2a-8d7b-5f1e0a2c3b4d";

    /**
     * @brief Derive the key and build the cipher
     * @return InvalidKey when the ticket is empty
     */
    static Result<std::unique_ptr<Cipher>> create(const CipherKeyMaterial& material);

    explicit AesGcmCipher(const AESKey& key);
    ~AesGcmCipher() override;

    Result<ByteBuffer> seal(ByteSpan plaintext) override;
    Result<ByteBuffer> open(ByteSpan wire) override;
    [[nodiscard]] std::string_view algorithmId() const noexcept override;

private:
    Crypto::AESCipher m_aes;
};

/// Builds a cipher for one algorithm id
using CipherFactory = std::function<Result<std::unique_ptr<Cipher>>(const CipherKeyMaterial&)>;

/**
 * @brief Algorithm id to cipher factory
 *
 * @example
 * ```cpp
 * auto registry = CipherRegistry::withDefaults();
 * auto cipher = registry.create({clientId, ticket, algoId});
 * if (cipher.isFailure()) {
 *     // ErrorCode::UnsupportedAlgorithm
 * }
 * ```
 */
class CipherRegistry {
public:
    CipherRegistry() = default;

    /**
     * @brief Registry holding PlainCipher (zero id) and AesGcmCipher
     */
    static CipherRegistry withDefaults();

    /// Register or replace the factory for @p algoId
    void add(std::string algoId, CipherFactory factory);

    [[nodiscard]] bool contains(std::string_view algoId) const;

    /**
     * @brief Build the cipher named by @p material.algoId
     * @return UnsupportedAlgorithm for an unregistered id
     */
    Result<std::unique_ptr<Cipher>> create(const CipherKeyMaterial& material) const;

private:
    std::map<std::string, CipherFactory, std::less<>> m_factories;
};

} // namespace Tether::Portal

#endif // TETHER_PORTAL_CIPHER_HPP
