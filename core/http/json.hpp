#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "audit/i_audit_log.hpp"
#include "otp/otp_engine.hpp"
#include "registry/device.hpp"

namespace devauth {
namespace http {

/**
 * @brief JSON encoding utilities for API types
 *
 * Timestamps are emitted as epoch milliseconds; unset optional timestamps
 * are null. Secret material (sealed blob, hash) is never encoded.
 */

nlohmann::json encode_device_info(const registry::Device &device);
nlohmann::json encode_audit_entry(const audit::AuditEntry &entry);

// Decode functions for incoming requests. A decode that fails after
// "device_id" was read leaves device_id set.
bool decode_register_request(const nlohmann::json &json, std::string &device_id, std::string &user_id,
                             std::string &error);

// "otp" may be a string of exactly `digits` digits or a non-negative JSON
// integer, which is zero padded to `digits`
bool decode_verify_request(const nlohmann::json &json, const otp::OtpEngine &engine, std::string &device_id,
                           std::string &otp, std::string &error);

// True if json[key] exists and is a string
bool has_string_field(const nlohmann::json &json, const char *key);

// {"secret": base64, "timestamp": optional unix seconds}
bool decode_generate_otp_request(const nlohmann::json &json, std::vector<uint8_t> &secret,
                                 std::optional<int64_t> &timestamp, std::string &error);

}  // namespace http
}  // namespace devauth
