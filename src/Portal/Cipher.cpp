/**
 * @file Cipher.cpp
 * @brief Built-in portal ciphers and the cipher registry
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/Cipher.hpp>

#include <algorithm>

namespace Tether::Portal {

// ============================================================================
// PlainCipher
// ============================================================================

Result<ByteBuffer> PlainCipher::seal(ByteSpan plaintext) {
    return ByteBuffer(plaintext.begin(), plaintext.end());
}

Result<ByteBuffer> PlainCipher::open(ByteSpan wire) {
    return ByteBuffer(wire.begin(), wire.end());
}

std::string_view PlainCipher::algorithmId() const noexcept {
    return kZeroAlgorithmId;
}

// ============================================================================
// AesGcmCipher
// ============================================================================

Result<std::unique_ptr<Cipher>> AesGcmCipher::create(const CipherKeyMaterial& material) {
    if (material.ticket.empty()) {
        return ErrorCode::InvalidKey;
    }

    std::string seed = material.clientId + ":" + material.ticket;
    auto digest = Crypto::HashEngine::sha256(asBytes(seed));
    Crypto::secureZero(seed.data(), seed.size());
    if (digest.isFailure()) {
        return digest.error();
    }

    AESKey key = digest.value();
    std::unique_ptr<Cipher> cipher = std::make_unique<AesGcmCipher>(key);
    Crypto::secureZero(key.data(), key.size());
    return Result<std::unique_ptr<Cipher>>(std::move(cipher));
}

AesGcmCipher::AesGcmCipher(const AESKey& key)
    : m_aes(key) {
}

AesGcmCipher::~AesGcmCipher() = default;

Result<ByteBuffer> AesGcmCipher::seal(ByteSpan plaintext) {
    auto sealed = m_aes.encrypt(plaintext);
    if (sealed.isFailure()) {
        return sealed.error();
    }
    std::string hex = Crypto::toHex(sealed.value());
    return ByteBuffer(hex.begin(), hex.end());
}

Result<ByteBuffer> AesGcmCipher::open(ByteSpan wire) {
    auto isSpace = [](Byte b) { return b == ' ' || b == '\t' || b == '\r' || b == '\n'; };
    auto first = std::find_if_not(wire.begin(), wire.end(), isSpace);
    auto last = std::find_if_not(wire.rbegin(), std::make_reverse_iterator(first), isSpace).base();

    std::string_view hex(reinterpret_cast<const char*>(wire.data()) + (first - wire.begin()),
                         static_cast<size_t>(last - first));
    auto raw = Crypto::fromHex(hex);
    if (raw.isFailure()) {
        return ErrorCode::DecryptionFailed;
    }
    return m_aes.decrypt(raw.value());
}

std::string_view AesGcmCipher::algorithmId() const noexcept {
    return kAlgorithmId;
}

// ============================================================================
// CipherRegistry
// ============================================================================

CipherRegistry CipherRegistry::withDefaults() {
    CipherRegistry registry;
    registry.add(kZeroAlgorithmId, [](const CipherKeyMaterial&) -> Result<std::unique_ptr<Cipher>> {
        std::unique_ptr<Cipher> cipher = std::make_unique<PlainCipher>();
        return Result<std::unique_ptr<Cipher>>(std::move(cipher));
    });
    registry.add(AesGcmCipher::kAlgorithmId, &AesGcmCipher::create);
    return registry;
}

void CipherRegistry::add(std::string algoId, CipherFactory factory) {
    m_factories[std::move(algoId)] = std::move(factory);
}

bool CipherRegistry::contains(std::string_view algoId) const {
    return m_factories.find(algoId) != m_factories.end();
}

Result<std::unique_ptr<Cipher>> CipherRegistry::create(const CipherKeyMaterial& material) const {
    auto it = m_factories.find(std::string_view(material.algoId));
    if (it == m_factories.end() || !it->second) {
        return ErrorCode::UnsupportedAlgorithm;
    }
    return it->second(material);
}

} // namespace Tether::Portal
