#include "secret_deriver.hpp"

#include "encoding.hpp"
#include "logging/logger.hpp"

namespace devauth {
namespace crypto {

namespace {
const char kSecretInfoLabel[] = "devauth/device-secret/v1";
constexpr size_t kEntropyBytes = 32;
}  // namespace

SecretDeriver::SecretDeriver(size_t secret_length) : secret_length_(secret_length) {}

bool SecretDeriver::derive(const std::string &device_id, const std::string &user_id, DerivedSecret &out,
                           std::string &error) const {
    try {
        SecretBytes entropy(kEntropyBytes);
        random_bytes(entropy.data(), entropy.size());

        // info = label || 0x00 || device_id || 0x00 || user_id
        std::vector<uint8_t> info(kSecretInfoLabel, kSecretInfoLabel + sizeof(kSecretInfoLabel) - 1);
        info.push_back(0);
        info.insert(info.end(), device_id.begin(), device_id.end());
        info.push_back(0);
        info.insert(info.end(), user_id.begin(), user_id.end());

        out.secret = hkdf_sha256(entropy.data(), entropy.size(), {}, info, secret_length_);
        out.hash = hash(out.secret);
    } catch (const CryptoError &e) {
        error = std::string("Secret derivation failed: ") + e.what();
        LOG_ERROR("[Secrets] " << error);
        return false;
    }

    LOG_DEBUG("[Secrets] Derived " << secret_length_ << "-byte secret for device " << device_id);
    return true;
}

std::string SecretDeriver::hash(const SecretBytes &secret) {
    return to_hex(sha256(secret.data(), secret.size()));
}

bool SecretDeriver::hash_matches(const std::string &stored_hash, const SecretBytes &secret) {
    return constant_time_equals(hash(secret), stored_hash);
}

}  // namespace crypto
}  // namespace devauth
