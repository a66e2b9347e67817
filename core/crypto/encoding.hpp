#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace devauth {
namespace crypto {

// Lowercase hex, two characters per byte
std::string to_hex(const uint8_t *data, size_t len);
std::string to_hex(const std::vector<uint8_t> &bytes);

// Standard alphabet with '=' padding
std::string base64_encode(const uint8_t *data, size_t len);
std::string base64_encode(const std::vector<uint8_t> &bytes);

// Returns false on characters outside the alphabet or bad padding
bool base64_decode(const std::string &encoded, std::vector<uint8_t> &out);

}  // namespace crypto
}  // namespace devauth
