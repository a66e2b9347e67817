#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "primitives.hpp"

namespace devauth {
namespace crypto {

/**
 * @brief Authenticated encryption of device secrets at rest
 *
 * OTP verification needs the raw secret as HMAC key, so a one-way hash alone
 * cannot be the stored form. Secrets are sealed with AES-256-GCM under a
 * process-wide key derived from the configured master key. The device_id is
 * bound as associated data, so a sealed blob copied onto another device row
 * fails to open.
 *
 * Sealed layout: nonce (12) || ciphertext || tag (16)
 */
class SecretBox {
public:
    static constexpr size_t kKeySize = 32;
    static constexpr size_t kNonceSize = 12;
    static constexpr size_t kTagSize = 16;

    // master_key is arbitrary-length key material; the AES key is
    // HKDF-SHA256(master_key, info="devauth/secret-box/v1").
    explicit SecretBox(const std::string &master_key);

    // Throws CryptoError on OpenSSL failure
    std::vector<uint8_t> seal(const SecretBytes &secret, const std::string &device_id) const;

    // Returns false if the blob is malformed or authentication fails
    bool open(const std::vector<uint8_t> &sealed, const std::string &device_id, SecretBytes &out,
              std::string &error) const;

private:
    SecretBytes key_;
};

}  // namespace crypto
}  // namespace devauth
