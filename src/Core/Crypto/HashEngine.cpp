/**
 * @file HashEngine.cpp
 * @brief Cryptographic hash engine implementation using OpenSSL EVP API
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Core/Crypto.hpp>
#include <Tether/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/evp.h>
#include <algorithm>

namespace Tether::Crypto {

// ============================================================================
// HashEngine::Impl - OpenSSL EVP implementation
// ============================================================================

class HashEngine::Impl {
public:
    explicit Impl(HashAlgorithm algorithm)
        : m_algorithm(algorithm)
        , m_ctx(EVP_MD_CTX_new())
        , m_md(algorithm == HashAlgorithm::SHA512 ? EVP_sha512() : EVP_sha256())
        , m_finalized(false)
    {
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    Result<void> init() {
        if (!m_ctx || m_md == nullptr) {
            return ErrorCode::CryptoError;
        }

        if (EVP_DigestInit_ex(m_ctx, m_md, nullptr) != 1) {
            return ErrorCode::HashFailed;
        }

        m_finalized = false;
        return Result<void>::Success();
    }

    Result<void> update(const Byte* data, size_t size) {
        if (!m_ctx) {
            return ErrorCode::CryptoError;
        }

        if (m_finalized) {
            return ErrorCode::InvalidState;
        }

        if (data == nullptr && size > 0) {
            return ErrorCode::InvalidArgument;
        }

        if (size == 0) {
            return Result<void>::Success();
        }

        if (EVP_DigestUpdate(m_ctx, data, size) != 1) {
            return ErrorCode::HashFailed;
        }

        return Result<void>::Success();
    }

    Result<ByteBuffer> finalize() {
        if (!m_ctx) {
            return ErrorCode::CryptoError;
        }

        if (m_finalized) {
            return ErrorCode::InvalidState;
        }

        int hashSize = EVP_MD_size(m_md);
        if (hashSize <= 0) {
            return ErrorCode::CryptoError;
        }

        ByteBuffer digest(static_cast<size_t>(hashSize));
        unsigned int len = 0;

        if (EVP_DigestFinal_ex(m_ctx, digest.data(), &len) != 1) {
            return ErrorCode::HashFailed;
        }

        if (len != static_cast<unsigned int>(hashSize)) {
            return ErrorCode::HashFailed;
        }

        m_finalized = true;
        return digest;
    }

    Result<ByteBuffer> hash(const Byte* data, size_t size) {
        TETHER_TRY(init());
        TETHER_TRY(update(data, size));
        return finalize();
    }

    HashAlgorithm getAlgorithm() const noexcept {
        return m_algorithm;
    }

private:
    HashAlgorithm m_algorithm;
    EVPMDCtxPtr m_ctx;
    const EVP_MD* m_md;
    bool m_finalized;
};

// ============================================================================
// HashEngine - Public API
// ============================================================================

HashEngine::HashEngine(HashAlgorithm algorithm)
    : m_impl(std::make_unique<Impl>(algorithm)) {
}

HashEngine::~HashEngine() = default;

Result<ByteBuffer> HashEngine::hash(ByteSpan data) {
    return m_impl->hash(data.data(), data.size());
}

Result<SHA256Hash> HashEngine::sha256(ByteSpan data) {
    HashEngine engine(HashAlgorithm::SHA256);
    auto result = engine.hash(data);

    if (result.isFailure()) {
        return result.error();
    }

    const auto& hashBytes = result.value();
    if (hashBytes.size() != 32) {
        return ErrorCode::HashFailed;
    }

    SHA256Hash digest;
    std::copy(hashBytes.begin(), hashBytes.end(), digest.begin());
    return digest;
}

Result<void> HashEngine::init() {
    return m_impl->init();
}

Result<void> HashEngine::update(ByteSpan data) {
    return m_impl->update(data.data(), data.size());
}

Result<ByteBuffer> HashEngine::finalize() {
    return m_impl->finalize();
}

size_t HashEngine::getHashSize(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::SHA256:
            return 32;
        case HashAlgorithm::SHA512:
            return 64;
    }
    return 0;
}

HashAlgorithm HashEngine::getAlgorithm() const noexcept {
    return m_impl->getAlgorithm();
}

} // namespace Tether::Crypto
