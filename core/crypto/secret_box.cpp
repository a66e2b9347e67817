#include "secret_box.hpp"

#include <openssl/evp.h>

#include <memory>

namespace devauth {
namespace crypto {

namespace {

const char kBoxInfoLabel[] = "devauth/secret-box/v1";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX *ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

}  // namespace

SecretBox::SecretBox(const std::string &master_key) {
    std::vector<uint8_t> info(kBoxInfoLabel, kBoxInfoLabel + sizeof(kBoxInfoLabel) - 1);
    key_ = hkdf_sha256(reinterpret_cast<const uint8_t *>(master_key.data()), master_key.size(), {}, info,
                       kKeySize);
}

std::vector<uint8_t> SecretBox::seal(const SecretBytes &secret, const std::string &device_id) const {
    std::vector<uint8_t> sealed(kNonceSize + secret.size() + kTagSize);
    random_bytes(sealed.data(), kNonceSize);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_CIPHER_CTX_new failed");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw CryptoError("EVP_EncryptInit_ex failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1) {
        throw CryptoError("EVP_CTRL_GCM_SET_IVLEN failed");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), sealed.data()) != 1) {
        throw CryptoError("EVP_EncryptInit_ex key/iv failed");
    }

    int len = 0;
    if (!device_id.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const uint8_t *>(device_id.data()),
                              static_cast<int>(device_id.size())) != 1) {
            throw CryptoError("EVP_EncryptUpdate aad failed");
        }
    }

    uint8_t *ciphertext = sealed.data() + kNonceSize;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len, secret.data(), static_cast<int>(secret.size())) != 1) {
        throw CryptoError("EVP_EncryptUpdate plaintext failed");
    }
    int total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + total, &len) != 1) {
        throw CryptoError("EVP_EncryptFinal_ex failed");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            sealed.data() + kNonceSize + total) != 1) {
        throw CryptoError("EVP_CTRL_GCM_GET_TAG failed");
    }
    return sealed;
}

bool SecretBox::open(const std::vector<uint8_t> &sealed, const std::string &device_id, SecretBytes &out,
                     std::string &error) const {
    if (sealed.size() < kNonceSize + kTagSize) {
        error = "Sealed secret too short";
        return false;
    }

    const size_t ciphertext_len = sealed.size() - kNonceSize - kTagSize;
    const uint8_t *nonce = sealed.data();
    const uint8_t *ciphertext = sealed.data() + kNonceSize;
    std::vector<uint8_t> tag(sealed.end() - kTagSize, sealed.end());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        error = "EVP_CIPHER_CTX_new failed";
        return false;
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        error = "AES-256-GCM decrypt init failed";
        return false;
    }

    int len = 0;
    if (!device_id.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const uint8_t *>(device_id.data()),
                              static_cast<int>(device_id.size())) != 1) {
            error = "AES-256-GCM aad update failed";
            return false;
        }
    }

    SecretBytes plaintext(ciphertext_len);
    int total = 0;
    if (ciphertext_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext, static_cast<int>(ciphertext_len)) !=
            1) {
            error = "AES-256-GCM decrypt update failed";
            return false;
        }
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        error = "EVP_CTRL_GCM_SET_TAG failed";
        return false;
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        error = "Sealed secret failed authentication";
        return false;
    }

    out = std::move(plaintext);
    return true;
}

}  // namespace crypto
}  // namespace devauth
