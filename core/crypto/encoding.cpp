#include "encoding.hpp"

namespace devauth {
namespace crypto {

static const char kHexDigits[] = "0123456789abcdef";

static const std::string base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::string to_hex(const uint8_t *data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t> &bytes) { return to_hex(bytes.data(), bytes.size()); }

std::string base64_encode(const uint8_t *data, size_t len) {
    std::string encoded;
    encoded.reserve(((len + 2) / 3) * 4);
    int val = 0;
    int bits = -6;

    for (size_t i = 0; i < len; ++i) {
        val = ((val << 8) + data[i]) & 0xFFFF;
        bits += 8;
        while (bits >= 0) {
            encoded.push_back(base64_chars[(val >> bits) & 0x3F]);
            bits -= 6;
        }
    }
    if (bits > -6) {
        encoded.push_back(base64_chars[((val << 8) >> (bits + 8)) & 0x3F]);
    }
    while ((encoded.size() % 4) != 0) {
        encoded.push_back('=');
    }
    return encoded;
}

std::string base64_encode(const std::vector<uint8_t> &bytes) { return base64_encode(bytes.data(), bytes.size()); }

bool base64_decode(const std::string &encoded, std::vector<uint8_t> &out) {
    out.clear();
    if (encoded.size() % 4 != 0) {
        return false;
    }

    std::vector<int> T(256, -1);
    for (int i = 0; i < 64; i++) {
        T[static_cast<unsigned char>(base64_chars[i])] = i;
    }

    size_t padding = 0;
    int val = 0;
    int bits = -8;
    for (size_t i = 0; i < encoded.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(encoded[i]);
        if (c == '=') {
            // Padding only at the tail, at most two characters
            ++padding;
            if (padding > 2 || encoded.size() - i > 2) {
                return false;
            }
            continue;
        }
        if (padding > 0 || T[c] == -1) {
            return false;
        }
        val = ((val << 6) + T[c]) & 0xFFFFFF;
        bits += 6;
        if (bits >= 0) {
            out.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return true;
}

}  // namespace crypto
}  // namespace devauth
