#include "crypto/encoding.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace devauth::crypto;

namespace {
std::vector<uint8_t> bytes_of(const std::string &s) { return std::vector<uint8_t>(s.begin(), s.end()); }
}  // namespace

TEST(EncodingTest, HexIsLowercaseTwoCharsPerByte) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(to_hex(bytes), "000fa0ff");
    EXPECT_EQ(to_hex(std::vector<uint8_t>{}), "");
}

// RFC 4648 section 10
TEST(EncodingTest, Base64KnownVectors) {
    EXPECT_EQ(base64_encode(bytes_of("")), "");
    EXPECT_EQ(base64_encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes_of("foob")), "Zm9vYg==");
    EXPECT_EQ(base64_encode(bytes_of("fooba")), "Zm9vYmE=");
    EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(EncodingTest, Base64DecodeKnownVectors) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(base64_decode("Zm9vYmFy", out));
    EXPECT_EQ(out, bytes_of("foobar"));

    ASSERT_TRUE(base64_decode("Zm8=", out));
    EXPECT_EQ(out, bytes_of("fo"));

    ASSERT_TRUE(base64_decode("", out));
    EXPECT_TRUE(out.empty());
}

TEST(EncodingTest, Base64DecodeHandlesAllByteValues) {
    std::vector<uint8_t> all(256);
    for (int i = 0; i < 256; ++i) {
        all[i] = static_cast<uint8_t>(i);
    }
    std::vector<uint8_t> decoded;
    ASSERT_TRUE(base64_decode(base64_encode(all), decoded));
    EXPECT_EQ(decoded, all);
}

TEST(EncodingTest, Base64DecodeRejectsMalformedInput) {
    std::vector<uint8_t> out;
    EXPECT_FALSE(base64_decode("Zm9", out));       // Not a multiple of 4
    EXPECT_FALSE(base64_decode("Zm9v!mFy", out));  // Outside the alphabet
    EXPECT_FALSE(base64_decode("Z===", out));      // Too much padding
    EXPECT_FALSE(base64_decode("Zg==Zm9v", out));  // Padding before the tail
    EXPECT_FALSE(base64_decode("Zm-_", out));      // URL-safe alphabet is not accepted
}
