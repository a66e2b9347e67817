#include "primitives.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <memory>

namespace devauth {
namespace crypto {

namespace {

std::string openssl_error(const char *step) {
    std::string message = std::string(step) + " failed";
    unsigned long code = ERR_get_error();
    if (code != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += ": ";
        message += buffer;
    }
    ERR_clear_error();
    return message;
}

const EVP_MD *to_evp_md(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA1:
            return EVP_sha1();
        case HashAlgorithm::SHA256:
            return EVP_sha256();
        case HashAlgorithm::SHA512:
            return EVP_sha512();
    }
    return EVP_sha1();
}

}  // namespace

void SecretBytes::wipe() noexcept {
    if (!bytes_.empty()) {
        OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }
}

void random_bytes(uint8_t *out, size_t len) {
    if (len == 0) {
        return;
    }
    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        throw CryptoError(openssl_error("RAND_bytes"));
    }
}

std::vector<uint8_t> random_bytes(size_t len) {
    std::vector<uint8_t> out(len);
    random_bytes(out.data(), out.size());
    return out;
}

std::vector<uint8_t> sha256(const uint8_t *data, size_t len) {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        throw CryptoError(openssl_error("EVP_Digest(EVP_sha256)"));
    }
    out.resize(out_len);
    return out;
}

std::vector<uint8_t> hmac(HashAlgorithm algorithm, const uint8_t *key, size_t key_len, const uint8_t *msg,
                          size_t msg_len) {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    if (HMAC(to_evp_md(algorithm), key, static_cast<int>(key_len), msg, msg_len, out.data(), &out_len) ==
        nullptr) {
        throw CryptoError(openssl_error("HMAC"));
    }
    out.resize(out_len);
    return out;
}

SecretBytes hkdf_sha256(const uint8_t *ikm, size_t ikm_len, const std::vector<uint8_t> &salt,
                        const std::vector<uint8_t> &info, size_t out_len) {
    EVP_PKEY_CTX *raw_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (raw_ctx == nullptr) {
        throw CryptoError(openssl_error("EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF)"));
    }
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(raw_ctx, &EVP_PKEY_CTX_free);

    auto check = [](int status, const char *step) {
        if (status <= 0) {
            throw CryptoError(openssl_error(step));
        }
    };

    check(EVP_PKEY_derive_init(ctx.get()), "HKDF derive_init");
    check(EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()), "HKDF set_md");
    if (!salt.empty()) {
        check(EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())), "HKDF set_salt");
    }
    check(EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm, static_cast<int>(ikm_len)), "HKDF set_key");
    if (!info.empty()) {
        check(EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(), static_cast<int>(info.size())), "HKDF set_info");
    }

    SecretBytes out(out_len);
    size_t len = out.size();
    check(EVP_PKEY_derive(ctx.get(), out.data(), &len), "HKDF derive");
    if (len != out_len) {
        throw CryptoError("HKDF derive produced unexpected length");
    }
    return out;
}

bool constant_time_equals(const uint8_t *a, size_t a_len, const uint8_t *b, size_t b_len) {
    if (a_len != b_len) {
        return false;
    }
    if (a_len == 0) {
        return true;
    }
    return CRYPTO_memcmp(a, b, a_len) == 0;
}

bool constant_time_equals(const std::string &a, const std::string &b) {
    return constant_time_equals(reinterpret_cast<const uint8_t *>(a.data()), a.size(),
                                reinterpret_cast<const uint8_t *>(b.data()), b.size());
}

bool parse_hash_algorithm(const std::string &name, HashAlgorithm &out) {
    if (name == "SHA1") {
        out = HashAlgorithm::SHA1;
        return true;
    }
    if (name == "SHA256") {
        out = HashAlgorithm::SHA256;
        return true;
    }
    if (name == "SHA512") {
        out = HashAlgorithm::SHA512;
        return true;
    }
    return false;
}

}  // namespace crypto
}  // namespace devauth
