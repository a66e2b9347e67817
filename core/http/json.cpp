#include "json.hpp"

#include "crypto/encoding.hpp"

namespace devauth {
namespace http {

namespace {

nlohmann::json optional_ms(const std::optional<int64_t> &value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

bool read_string_field(const nlohmann::json &json, const char *key, std::string &out, std::string &error) {
    if (!json.contains(key)) {
        error = std::string("Missing '") + key + "'";
        return false;
    }
    const auto &value = json.at(key);
    if (!value.is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = value.get<std::string>();
    return true;
}

}  // namespace

nlohmann::json encode_device_info(const registry::Device &device) {
    return {{"device_id", device.device_id},
            {"user_id", device.user_id},
            {"is_active", device.is_active},
            {"created_at", device.created_at_ms},
            {"last_used", optional_ms(device.last_used_ms)},
            {"usage_count", device.usage_count},
            {"deactivated_at", optional_ms(device.deactivated_at_ms)}};
}

nlohmann::json encode_audit_entry(const audit::AuditEntry &entry) {
    nlohmann::json json = {{"id", entry.id},
                           {"device_id", entry.device_id},
                           {"action", entry.action},
                           {"success", entry.success},
                           {"timestamp", entry.timestamp_ms}};
    json["ip_address"] = entry.ip_address ? nlohmann::json(*entry.ip_address) : nlohmann::json(nullptr);
    json["user_agent"] = entry.user_agent ? nlohmann::json(*entry.user_agent) : nlohmann::json(nullptr);
    json["additional_data"] = entry.additional_data;
    return json;
}

bool has_string_field(const nlohmann::json &json, const char *key) {
    return json.contains(key) && json.at(key).is_string();
}

bool decode_register_request(const nlohmann::json &json, std::string &device_id, std::string &user_id,
                             std::string &error) {
    if (!read_string_field(json, "device_id", device_id, error)) {
        return false;
    }
    return read_string_field(json, "user_id", user_id, error);
}

bool decode_verify_request(const nlohmann::json &json, const otp::OtpEngine &engine, std::string &device_id,
                           std::string &otp, std::string &error) {
    if (!read_string_field(json, "device_id", device_id, error)) {
        return false;
    }
    if (!json.contains("otp")) {
        error = "Missing 'otp'";
        return false;
    }

    const auto &value = json.at("otp");
    if (value.is_string()) {
        otp = value.get<std::string>();
        return true;
    }
    if (value.is_number_unsigned()) {
        if (!engine.format_code(value.get<uint64_t>(), otp)) {
            error = "'otp' has more than " + std::to_string(engine.settings().digits) + " digits";
            return false;
        }
        return true;
    }
    error = "'otp' must be a string or a non-negative integer";
    return false;
}

bool decode_generate_otp_request(const nlohmann::json &json, std::vector<uint8_t> &secret,
                                 std::optional<int64_t> &timestamp, std::string &error) {
    std::string encoded;
    if (!read_string_field(json, "secret", encoded, error)) {
        return false;
    }
    if (!crypto::base64_decode(encoded, secret) || secret.empty()) {
        error = "'secret' is not valid base64";
        return false;
    }

    timestamp.reset();
    if (json.contains("timestamp")) {
        const auto &value = json.at("timestamp");
        if (!value.is_number_integer() || value.get<int64_t>() < 0) {
            error = "'timestamp' must be a non-negative integer";
            return false;
        }
        timestamp = value.get<int64_t>();
    }
    return true;
}

}  // namespace http
}  // namespace devauth
