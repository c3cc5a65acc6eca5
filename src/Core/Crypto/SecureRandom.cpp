/**
 * @file SecureRandom.cpp
 * @brief Cryptographically secure random number generator implementation
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * Random bytes come from /dev/urandom with retry on EINTR. Request tokens
 * and client UUIDs are derived from the same source.
 */

#include <Tether/Core/Crypto.hpp>

#include <stdexcept>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdio>
#include <mutex>

namespace Tether::Crypto {

// ============================================================================
// SecureRandom::Impl
// ============================================================================

class SecureRandom::Impl {
public:
    Impl() {
        m_fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
        if (m_fd < 0) {
            throw std::runtime_error("Failed to open /dev/urandom");
        }
    }

    ~Impl() {
        if (m_fd >= 0) {
            close(m_fd);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    Result<void> generate(Byte* buffer, size_t size) {
        if (buffer == nullptr && size > 0) {
            return ErrorCode::InvalidArgument;
        }

        if (size == 0) {
            return Result<void>::Success();
        }

        std::lock_guard<std::mutex> lock(m_mutex);

        size_t total = 0;
        while (total < size) {
            ssize_t n = read(m_fd, buffer + total, size - total);

            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ErrorCode::RandomGenerationFailed;
            }

            if (n == 0) {
                // Unexpected EOF
                return ErrorCode::RandomGenerationFailed;
            }

            total += static_cast<size_t>(n);
        }

        return Result<void>::Success();
    }

private:
    int m_fd = -1;
    std::mutex m_mutex;
};

// ============================================================================
// SecureRandom - Public API
// ============================================================================

SecureRandom::SecureRandom()
    : m_impl(std::make_unique<Impl>()) {
}

SecureRandom::~SecureRandom() = default;

Result<void> SecureRandom::generate(Byte* buffer, size_t size) {
    return m_impl->generate(buffer, size);
}

Result<ByteBuffer> SecureRandom::generate(size_t size) {
    ByteBuffer buffer(size);
    auto result = m_impl->generate(buffer.data(), size);

    if (result.isFailure()) {
        return result.error();
    }

    return buffer;
}

Result<AESNonce> SecureRandom::generateNonce() {
    AESNonce nonce;
    auto result = m_impl->generate(nonce.data(), nonce.size());

    if (result.isFailure()) {
        return result.error();
    }

    return nonce;
}

// ============================================================================
// Tokens
// ============================================================================

Result<std::string> randomToken(size_t length) {
    static constexpr char kAlphabet[] =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    static constexpr size_t kAlphabetSize = sizeof(kAlphabet) - 1;

    SecureRandom rng;
    std::string token;
    token.reserve(length);

    // Rejection sampling keeps the distribution uniform over 62 symbols
    Byte chunk[32];
    while (token.size() < length) {
        auto result = rng.generate(chunk, sizeof(chunk));
        if (result.isFailure()) {
            return result.error();
        }
        for (Byte b : chunk) {
            if (b >= 248) {
                continue;
            }
            token.push_back(kAlphabet[b % kAlphabetSize]);
            if (token.size() == length) {
                break;
            }
        }
    }

    return token;
}

Result<std::string> generateUuid() {
    SecureRandom rng;
    std::array<Byte, 16> bytes;
    auto result = rng.generate(bytes.data(), bytes.size());
    if (result.isFailure()) {
        return result.error();
    }

    bytes[6] = static_cast<Byte>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<Byte>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex = toHex(ByteSpan(bytes.data(), bytes.size()));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace Tether::Crypto
