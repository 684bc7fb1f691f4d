/**
 * @file test_crypto_utils.cpp
 * @brief Layer 2 tests for crypto_utils (base64, BLAKE2b, constant-time comparison).
 *
 * libsodium is initialized on first use, so the pure functions run in-process. The lifecycle
 * module and the concurrency check run in worker processes.
 */
#include "test_patterns.h"
#include "crypto_workers.h"
#include "fbr_service.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace filebridge::tests;
using namespace filebridge::crypto;

namespace
{
std::vector<uint8_t> bytes_of(std::string_view s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}
} // namespace

class CryptoPureTest : public PureApiTest
{
};

// ============================================================================
// Base64
// ============================================================================

TEST_F(CryptoPureTest, Base64_EncodesKnownVectors)
{
    EXPECT_EQ(encode_base64(bytes_of("f")), "Zg==");
    EXPECT_EQ(encode_base64(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(encode_base64(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(encode_base64(bytes_of("foobar")), "Zm9vYmFy");
}

TEST_F(CryptoPureTest, Base64_DecodesKnownVectors)
{
    auto r = decode_base64("Zm9vYg==");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content(), bytes_of("foob"));
}

TEST_F(CryptoPureTest, Base64_EmptyIsEmpty)
{
    EXPECT_EQ(encode_base64({}), "");
    auto r = decode_base64("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.content().empty());
}

TEST_F(CryptoPureTest, Base64_BinaryRoundTrip)
{
    std::vector<uint8_t> all(256);
    for (size_t i = 0; i < all.size(); ++i)
        all[i] = static_cast<uint8_t>(i);
    auto r = decode_base64(encode_base64(all));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content(), all);
}

TEST_F(CryptoPureTest, Base64_RejectsMalformedInput)
{
    auto bad_char = decode_base64("Zm9v!");
    ASSERT_TRUE(bad_char.is_error());
    EXPECT_EQ(bad_char.error(), Base64Error::Malformed);
    EXPECT_EQ(bad_char.error_code(), 4) << "error_code is the offset where decoding stopped";

    EXPECT_TRUE(decode_base64("Zm9").is_error()) << "missing padding";
    EXPECT_TRUE(decode_base64("Zm 9v").is_error()) << "whitespace is not ignored";
    EXPECT_STREQ(to_string(Base64Error::Malformed), "Malformed");
}

// ============================================================================
// BLAKE2b
// ============================================================================

TEST_F(CryptoPureTest, Blake2b_EmptyInputKnownDigest)
{
    const auto digest = compute_blake2b_array({});
    EXPECT_EQ(digest_to_hex(digest),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

TEST_F(CryptoPureTest, Blake2b_DeterministicAndSensitive)
{
    auto a = bytes_of("shared buffer contents");
    auto b = a;
    EXPECT_EQ(compute_blake2b_array(a), compute_blake2b_array(b));
    b.back() ^= 0x01;
    EXPECT_NE(compute_blake2b_array(a), compute_blake2b_array(b));
}

TEST_F(CryptoPureTest, Blake2b_RawMatchesArray)
{
    auto data = bytes_of("abc");
    uint8_t raw[BLAKE2B_HASH_BYTES];
    ASSERT_TRUE(compute_blake2b(raw, data.data(), data.size()));
    const auto arr = compute_blake2b_array(data);
    EXPECT_TRUE(std::equal(arr.begin(), arr.end(), raw));
}

TEST_F(CryptoPureTest, Blake2b_NullArgumentsFail)
{
    uint8_t out[BLAKE2B_HASH_BYTES];
    EXPECT_FALSE(compute_blake2b(nullptr, "x", 1));
    EXPECT_FALSE(compute_blake2b(out, nullptr, 4));
    EXPECT_TRUE(compute_blake2b(out, nullptr, 0));
}

// ============================================================================
// constant_time_equal
// ============================================================================

TEST_F(CryptoPureTest, ConstantTimeEqual)
{
    auto a = bytes_of("0123456789");
    auto b = a;
    EXPECT_TRUE(constant_time_equal(a, b));
    b[9] = 'x';
    EXPECT_FALSE(constant_time_equal(a, b));
    EXPECT_FALSE(constant_time_equal(a, bytes_of("0123"))) << "length mismatch";
    EXPECT_TRUE(constant_time_equal({}, {}));
}

// ============================================================================
// Lifecycle and concurrency (isolated)
// ============================================================================

class CryptoUtilsTest : public IsolatedProcessTest
{
};

TEST_F(CryptoUtilsTest, Lifecycle_FunctionsWorkAfterInit)
{
    auto w = SpawnWorker("crypto.lifecycle_after_init");
    ExpectWorkerOk(w);
}

TEST_F(CryptoUtilsTest, Base64_IsThreadSafe)
{
    auto w = SpawnWorker("crypto.base64_thread_safe");
    ExpectWorkerOk(w);
}
