#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace devauth {
namespace crypto {

// Thrown by the OpenSSL wrappers below. Callers convert it into a status
// at the component boundary; it never crosses into the HTTP layer.
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string &what) : std::runtime_error(what) {}
};

enum class HashAlgorithm { SHA1, SHA256, SHA512 };

/**
 * @brief Byte buffer for secret material
 *
 * Move-only. Contents are wiped with OPENSSL_cleanse when the buffer is
 * destroyed or overwritten, so a raw device secret never outlives the scope
 * that needed it.
 */
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(size_t size) : bytes_(size, 0) {}
    explicit SecretBytes(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}
    ~SecretBytes() { wipe(); }

    SecretBytes(const SecretBytes &) = delete;
    SecretBytes &operator=(const SecretBytes &) = delete;

    SecretBytes(SecretBytes &&other) noexcept : bytes_(std::move(other.bytes_)) { other.bytes_.clear(); }
    SecretBytes &operator=(SecretBytes &&other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    uint8_t *data() { return bytes_.data(); }
    const uint8_t *data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    const std::vector<uint8_t> &bytes() const { return bytes_; }

private:
    void wipe() noexcept;

    std::vector<uint8_t> bytes_;
};

// CSPRNG (RAND_bytes). Throws CryptoError if the generator is not seeded.
void random_bytes(uint8_t *out, size_t len);
std::vector<uint8_t> random_bytes(size_t len);

std::vector<uint8_t> sha256(const uint8_t *data, size_t len);

std::vector<uint8_t> hmac(HashAlgorithm algorithm, const uint8_t *key, size_t key_len, const uint8_t *msg,
                          size_t msg_len);

// HKDF-SHA256 (RFC 5869) producing out_len bytes
SecretBytes hkdf_sha256(const uint8_t *ikm, size_t ikm_len, const std::vector<uint8_t> &salt,
                        const std::vector<uint8_t> &info, size_t out_len);

// Length-checked CRYPTO_memcmp. Length mismatch returns false without
// comparing contents.
bool constant_time_equals(const uint8_t *a, size_t a_len, const uint8_t *b, size_t b_len);
bool constant_time_equals(const std::string &a, const std::string &b);

bool parse_hash_algorithm(const std::string &name, HashAlgorithm &out);

}  // namespace crypto
}  // namespace devauth
