/**
 * @file AESCipher.cpp
 * @brief AES-256-GCM authenticated encryption using the OpenSSL EVP API
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * - 256-bit key (32 bytes)
 * - 96-bit nonce (12 bytes), fresh from the CSPRNG for every message
 * - 128-bit authentication tag (16 bytes)
 * - Optional Additional Authenticated Data (AAD)
 *
 * OpenSSL performs the tag comparison in EVP_DecryptFinal_ex; no plaintext
 * is returned when it fails.
 */

#include <Tether/Core/Crypto.hpp>
#include <Tether/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/evp.h>
#include <algorithm>

namespace Tether::Crypto {

namespace {

constexpr size_t kNonceSize = 12;
constexpr size_t kTagSize = 16;

} // namespace

void secureZero(void* data, size_t size) noexcept {
    if (data == nullptr || size == 0) {
        return;
    }

    // volatile keeps the stores from being optimized away
    volatile unsigned char* p = static_cast<volatile unsigned char*>(data);
    while (size--) {
        *p++ = 0;
    }
}

// ============================================================================
// AESCipher::Impl
// ============================================================================

class AESCipher::Impl {
public:
    explicit Impl(const AESKey& key)
        : m_key(key)
    {
    }

    ~Impl() {
        secureZero(m_key.data(), m_key.size());
    }

    Result<ByteBuffer> encrypt(ByteSpan plaintext, ByteSpan associatedData) {
        auto nonceResult = m_rng.generateNonce();
        if (nonceResult.isFailure()) {
            return nonceResult.error();
        }
        const AESNonce& nonce = nonceResult.value();

        EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return ErrorCode::CryptoError;
        }

        if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx, nullptr, nullptr, m_key.data(), nonce.data()) != 1) {
            return ErrorCode::EncryptionFailed;
        }

        if (!associatedData.empty()) {
            int aadLen = 0;
            if (EVP_EncryptUpdate(ctx, nullptr, &aadLen,
                                  associatedData.data(),
                                  static_cast<int>(associatedData.size())) != 1) {
                return ErrorCode::EncryptionFailed;
            }
        }

        // nonce (12) + ciphertext + tag (16)
        ByteBuffer output(kNonceSize + plaintext.size() + kTagSize);
        std::copy(nonce.begin(), nonce.end(), output.begin());
        Byte* body = output.data() + kNonceSize;

        int len = 0;
        int ciphertextLen = 0;

        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx, body, &len,
                                  plaintext.data(),
                                  static_cast<int>(plaintext.size())) != 1) {
                return ErrorCode::EncryptionFailed;
            }
            ciphertextLen = len;
        }

        if (EVP_EncryptFinal_ex(ctx, body + ciphertextLen, &len) != 1) {
            return ErrorCode::EncryptionFailed;
        }
        ciphertextLen += len;

        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                                body + ciphertextLen) != 1) {
            return ErrorCode::EncryptionFailed;
        }

        output.resize(kNonceSize + static_cast<size_t>(ciphertextLen) + kTagSize);
        return output;
    }

    Result<ByteBuffer> decrypt(ByteSpan input, ByteSpan associatedData) {
        if (input.size() < kNonceSize + kTagSize) {
            return ErrorCode::InvalidArgument;
        }

        const Byte* nonce = input.data();
        size_t ctLen = input.size() - kNonceSize - kTagSize;
        const Byte* ct = input.data() + kNonceSize;
        const Byte* tag = ct + ctLen;

        EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return ErrorCode::CryptoError;
        }

        if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx, nullptr, nullptr, m_key.data(), nonce) != 1) {
            return ErrorCode::DecryptionFailed;
        }

        if (!associatedData.empty()) {
            int aadLen = 0;
            if (EVP_DecryptUpdate(ctx, nullptr, &aadLen,
                                  associatedData.data(),
                                  static_cast<int>(associatedData.size())) != 1) {
                return ErrorCode::DecryptionFailed;
            }
        }

        ByteBuffer output(ctLen);
        int len = 0;
        int plaintextLen = 0;

        if (ctLen > 0) {
            if (EVP_DecryptUpdate(ctx, output.data(), &len, ct,
                                  static_cast<int>(ctLen)) != 1) {
                return ErrorCode::DecryptionFailed;
            }
            plaintextLen = len;
        }

        // Expected tag must be set before EVP_DecryptFinal_ex.
        // OpenSSL does not write through the pointer.
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                                const_cast<Byte*>(tag)) != 1) {
            return ErrorCode::DecryptionFailed;
        }

        if (EVP_DecryptFinal_ex(ctx, output.data() + plaintextLen, &len) != 1) {
            secureZero(output.data(), output.size());
            return ErrorCode::AuthenticationFailed;
        }
        plaintextLen += len;

        output.resize(static_cast<size_t>(plaintextLen));
        return output;
    }

private:
    AESKey m_key;
    SecureRandom m_rng;
};

// ============================================================================
// AESCipher - Public API
// ============================================================================

AESCipher::AESCipher(const AESKey& key)
    : m_impl(std::make_unique<Impl>(key)) {
}

AESCipher::~AESCipher() = default;

Result<ByteBuffer> AESCipher::encrypt(ByteSpan plaintext, ByteSpan associatedData) {
    return m_impl->encrypt(plaintext, associatedData);
}

Result<ByteBuffer> AESCipher::decrypt(ByteSpan ciphertext, ByteSpan associatedData) {
    return m_impl->decrypt(ciphertext, associatedData);
}

} // namespace Tether::Crypto
