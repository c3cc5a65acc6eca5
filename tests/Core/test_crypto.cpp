/**
 * @file test_crypto.cpp
 * @brief Unit tests for cryptographic utilities
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Core/Crypto.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <thread>
#include <vector>

using namespace Tether;
using namespace Tether::Crypto;
using namespace Tether::Testing;

namespace {

AESKey testKey(Byte seed) {
    AESKey key;
    for (size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<Byte>(seed + i);
    }
    return key;
}

} // namespace

// ============================================================================
// SecureRandom
// ============================================================================

TEST(SecureRandom, GenerateBytes_ReturnsCorrectSize) {
    SecureRandom rng;

    for (size_t size : {1u, 12u, 32u, 256u}) {
        auto result = rng.generate(size);
        ASSERT_TRUE(result.isSuccess()) << "Failed to generate " << size << " bytes";
        EXPECT_EQ(result.value().size(), size);
    }
}

TEST(SecureRandom, GenerateNonce_Returns12Bytes) {
    SecureRandom rng;

    auto first = rng.generateNonce();
    auto second = rng.generateNonce();
    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_NE(first.value(), second.value());
}

TEST(SecureRandom, NullPointerWithNonZeroSize_Fails) {
    SecureRandom rng;

    EXPECT_TRUE(rng.generate(nullptr, 0).isSuccess());
    EXPECT_RESULT_ERROR(rng.generate(nullptr, 16), ErrorCode::InvalidArgument);
}

TEST(SecureRandom, GenerateValue) {
    SecureRandom rng;

    std::set<uint64_t> values;
    for (int i = 0; i < 16; ++i) {
        auto value = rng.generateValue<uint64_t>();
        ASSERT_TRUE(value.isSuccess());
        values.insert(value.value());
    }
    EXPECT_EQ(values.size(), 16u);
}

// ============================================================================
// Tokens and client ids
// ============================================================================

// Test request-id tokens used in log prefixes
TEST(RandomToken, LengthAndAlphabet) {
    for (size_t length : {0u, 1u, 5u, 64u}) {
        auto token = randomToken(length);
        ASSERT_TRUE(token.isSuccess());
        EXPECT_EQ(token.value().size(), length);
        EXPECT_TRUE(std::all_of(token.value().begin(), token.value().end(),
                                [](unsigned char c) { return std::isalnum(c) != 0; }))
            << token.value();
    }
}

TEST(RandomToken, TokensDiffer) {
    std::set<std::string> tokens;
    for (int i = 0; i < 50; ++i) {
        auto token = randomToken(16);
        ASSERT_TRUE(token.isSuccess());
        tokens.insert(token.value());
    }
    EXPECT_EQ(tokens.size(), 50u);
}

TEST(GenerateUuid, VersionFourLayout) {
    auto uuid = generateUuid();
    ASSERT_TRUE(uuid.isSuccess());

    const std::string& text = uuid.value();
    ASSERT_EQ(text.size(), 36u);
    EXPECT_EQ(text[8], '-');
    EXPECT_EQ(text[13], '-');
    EXPECT_EQ(text[18], '-');
    EXPECT_EQ(text[23], '-');
    EXPECT_EQ(text[14], '4');
    EXPECT_NE(std::string("89ab").find(text[19]), std::string::npos) << text;

    auto other = generateUuid();
    ASSERT_TRUE(other.isSuccess());
    EXPECT_NE(text, other.value());
}

// ============================================================================
// HashEngine
// ============================================================================

// Test FIPS 180-2 vector "abc"
TEST(HashEngine, Sha256KnownVector) {
    auto digest = HashEngine::sha256(asBytes("abc"));
    ASSERT_TRUE(digest.isSuccess());
    EXPECT_EQ(toHex(digest.value()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashEngine, Sha256Empty) {
    auto digest = HashEngine::sha256(ByteSpan{});
    ASSERT_TRUE(digest.isSuccess());
    EXPECT_EQ(toHex(digest.value()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashEngine, IncrementalMatchesOneShot) {
    HashEngine engine;
    ASSERT_RESULT_OK(engine.init());
    ASSERT_RESULT_OK(engine.update(asBytes("client-id")));
    ASSERT_RESULT_OK(engine.update(asBytes(":")));
    ASSERT_RESULT_OK(engine.update(asBytes("ticket")));
    auto incremental = engine.finalize();
    ASSERT_TRUE(incremental.isSuccess());

    auto oneShot = HashEngine::sha256(asBytes("client-id:ticket"));
    ASSERT_TRUE(oneShot.isSuccess());

    EXPECT_TRUE(std::equal(incremental.value().begin(), incremental.value().end(),
                           oneShot.value().begin(), oneShot.value().end()));
}

TEST(HashEngine, FinalizeTwiceFails) {
    HashEngine engine;
    ASSERT_RESULT_OK(engine.init());
    ASSERT_TRUE(engine.finalize().isSuccess());
    EXPECT_RESULT_ERROR(engine.finalize(), ErrorCode::InvalidState);
}

TEST(HashEngine, Sha512Size) {
    HashEngine engine(HashAlgorithm::SHA512);
    auto digest = engine.hash(asBytes("abc"));
    ASSERT_TRUE(digest.isSuccess());
    EXPECT_EQ(digest.value().size(), HashEngine::getHashSize(HashAlgorithm::SHA512));
    EXPECT_EQ(engine.getAlgorithm(), HashAlgorithm::SHA512);
}

// ============================================================================
// AESCipher
// ============================================================================

TEST(AESCipher, EncryptDecryptRoundTrip) {
    AESCipher cipher(testKey(1));
    ByteBuffer plaintext = randomBytes(300);

    auto sealed = cipher.encrypt(plaintext);
    ASSERT_TRUE(sealed.isSuccess());
    // nonce + ciphertext + tag
    EXPECT_EQ(sealed.value().size(), 12 + plaintext.size() + 16);

    auto opened = cipher.decrypt(sealed.value());
    ASSERT_TRUE(opened.isSuccess());
    EXPECT_EQ(opened.value(), plaintext);
}

TEST(AESCipher, FreshNoncePerMessage) {
    AESCipher cipher(testKey(2));
    auto first = cipher.encrypt(asBytes("same"));
    auto second = cipher.encrypt(asBytes("same"));
    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_NE(first.value(), second.value());
}

// Test that any single flipped bit is detected by the tag
TEST(AESCipher, TamperedCiphertextRejected) {
    AESCipher cipher(testKey(3));
    auto sealed = cipher.encrypt(asBytes("<state><ticket>T</ticket></state>"));
    ASSERT_TRUE(sealed.isSuccess());

    for (size_t bit : {0u, 100u, 8u * 12u + 3u}) {
        ByteBuffer tampered = sealed.value();
        BitFlipper::flipBit(tampered, bit);
        EXPECT_RESULT_ERROR(cipher.decrypt(tampered), ErrorCode::AuthenticationFailed);
    }
}

TEST(AESCipher, WrongKeyRejected) {
    AESCipher sender(testKey(4));
    AESCipher receiver(testKey(5));

    auto sealed = sender.encrypt(asBytes("payload"));
    ASSERT_TRUE(sealed.isSuccess());
    EXPECT_RESULT_ERROR(receiver.decrypt(sealed.value()), ErrorCode::AuthenticationFailed);
}

TEST(AESCipher, ShortInputRejected) {
    AESCipher cipher(testKey(6));
    ByteBuffer tooShort(27, 0x00);
    EXPECT_RESULT_ERROR(cipher.decrypt(tooShort), ErrorCode::InvalidArgument);
}

TEST(AESCipher, EmptyPlaintext) {
    AESCipher cipher(testKey(7));
    auto sealed = cipher.encrypt(ByteSpan{});
    ASSERT_TRUE(sealed.isSuccess());
    EXPECT_EQ(sealed.value().size(), 28u);

    auto opened = cipher.decrypt(sealed.value());
    ASSERT_TRUE(opened.isSuccess());
    EXPECT_TRUE(opened.value().empty());
}

TEST(AESCipher, ConcurrentUse) {
    AESCipher cipher(testKey(8));
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                auto sealed = cipher.encrypt(asBytes("heartbeat"));
                if (!sealed.isSuccess() || !cipher.decrypt(sealed.value()).isSuccess()) {
                    failures++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
}

// ============================================================================
// Hex and secureZero
// ============================================================================

TEST(Hex, EncodeLowercase) {
    ByteBuffer data = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(toHex(data), "000fa5ff");
    EXPECT_EQ(toHex(ByteSpan{}), "");
}

TEST(Hex, DecodeAcceptsBothCases) {
    auto lower = fromHex("deadbeef");
    auto upper = fromHex("DEADBEEF");
    ASSERT_TRUE(lower.isSuccess());
    ASSERT_TRUE(upper.isSuccess());
    EXPECT_EQ(lower.value(), upper.value());
    EXPECT_EQ(lower.value(), (ByteBuffer{0xde, 0xad, 0xbe, 0xef}));
}

TEST(Hex, DecodeRejectsMalformed) {
    EXPECT_RESULT_ERROR(fromHex("abc"), ErrorCode::InvalidHexString);
    EXPECT_RESULT_ERROR(fromHex("zz"), ErrorCode::InvalidHexString);
    EXPECT_RESULT_ERROR(fromHex("0g"), ErrorCode::InvalidHexString);
}

TEST(SecureZero, ClearsBuffer) {
    ByteBuffer secret = randomBytes(64);
    secret[0] = 0x5a;
    secureZero(secret.data(), secret.size());
    ASSERT_ZEROED(secret.data(), secret.size());
}
