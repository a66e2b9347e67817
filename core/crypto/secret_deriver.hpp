#pragma once

#include <string>

#include "primitives.hpp"

namespace devauth {
namespace crypto {

// Fresh device secret and the hash that is persisted in its place
struct DerivedSecret {
    SecretBytes secret;
    std::string hash;  // 64 lowercase hex chars (SHA-256)
};

/**
 * @brief Produces per-device OTP key material at registration
 *
 * The secret is HKDF-SHA256 over fresh CSPRNG output, with the device and user
 * identifiers bound into the HKDF info so two registrations can never share
 * key material even if the generator repeats. Only the hash is meant for
 * storage; the raw secret is handed back once for delivery to the device.
 */
class SecretDeriver {
public:
    static constexpr size_t kDefaultSecretLength = 32;

    explicit SecretDeriver(size_t secret_length = kDefaultSecretLength);

    // Returns false (with error) if the random source or KDF fails
    bool derive(const std::string &device_id, const std::string &user_id, DerivedSecret &out,
                std::string &error) const;

    static std::string hash(const SecretBytes &secret);

    // Constant-time comparison of hash(secret) against a stored hash
    static bool hash_matches(const std::string &stored_hash, const SecretBytes &secret);

    size_t secret_length() const { return secret_length_; }

private:
    size_t secret_length_;
};

}  // namespace crypto
}  // namespace devauth
