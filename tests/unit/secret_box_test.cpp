#include "crypto/secret_box.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace devauth::crypto;

class SecretBoxTest : public ::testing::Test {
protected:
    SecretBoxTest() : box("0123456789abcdef0123456789abcdef") {}

    SecretBytes make_secret() {
        std::vector<uint8_t> raw(32);
        for (size_t i = 0; i < raw.size(); ++i) {
            raw[i] = static_cast<uint8_t>(i * 7 + 3);
        }
        return SecretBytes(raw);
    }

    SecretBox box;
};

TEST_F(SecretBoxTest, SealedLayout) {
    SecretBytes secret = make_secret();
    std::vector<uint8_t> sealed = box.seal(secret, "sensor-001");

    EXPECT_EQ(sealed.size(), SecretBox::kNonceSize + secret.size() + SecretBox::kTagSize);

    // Ciphertext must not carry the plaintext
    std::vector<uint8_t> body(sealed.begin() + SecretBox::kNonceSize, sealed.end() - SecretBox::kTagSize);
    EXPECT_NE(body, secret.bytes());
}

TEST_F(SecretBoxTest, OpenRecoversSecret) {
    SecretBytes secret = make_secret();
    std::vector<uint8_t> sealed = box.seal(secret, "sensor-001");

    SecretBytes opened;
    std::string error;
    ASSERT_TRUE(box.open(sealed, "sensor-001", opened, error)) << error;
    EXPECT_EQ(opened.bytes(), secret.bytes());
}

TEST_F(SecretBoxTest, FreshNoncePerSeal) {
    SecretBytes secret = make_secret();
    EXPECT_NE(box.seal(secret, "sensor-001"), box.seal(secret, "sensor-001"));
}

TEST_F(SecretBoxTest, WrongDeviceIdFailsToOpen) {
    std::vector<uint8_t> sealed = box.seal(make_secret(), "sensor-001");

    SecretBytes opened;
    std::string error;
    EXPECT_FALSE(box.open(sealed, "sensor-002", opened, error));
    EXPECT_FALSE(error.empty());
    EXPECT_TRUE(opened.empty());
}

TEST_F(SecretBoxTest, TamperedBlobFailsToOpen) {
    std::vector<uint8_t> sealed = box.seal(make_secret(), "sensor-001");
    SecretBytes opened;
    std::string error;

    std::vector<uint8_t> flipped_ciphertext = sealed;
    flipped_ciphertext[SecretBox::kNonceSize] ^= 0x80;
    EXPECT_FALSE(box.open(flipped_ciphertext, "sensor-001", opened, error));

    std::vector<uint8_t> flipped_tag = sealed;
    flipped_tag.back() ^= 0x01;
    EXPECT_FALSE(box.open(flipped_tag, "sensor-001", opened, error));

    std::vector<uint8_t> flipped_nonce = sealed;
    flipped_nonce[0] ^= 0x01;
    EXPECT_FALSE(box.open(flipped_nonce, "sensor-001", opened, error));

    std::vector<uint8_t> truncated(sealed.begin(), sealed.begin() + SecretBox::kNonceSize);
    EXPECT_FALSE(box.open(truncated, "sensor-001", opened, error));
    EXPECT_NE(error.find("too short"), std::string::npos);
}

TEST_F(SecretBoxTest, DifferentMasterKeyFailsToOpen) {
    std::vector<uint8_t> sealed = box.seal(make_secret(), "sensor-001");

    SecretBox other("another-master-key-of-enough-length");
    SecretBytes opened;
    std::string error;
    EXPECT_FALSE(other.open(sealed, "sensor-001", opened, error));
}
