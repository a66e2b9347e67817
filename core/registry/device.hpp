#ifndef DEVAUTH_REGISTRY_DEVICE_HPP
#define DEVAUTH_REGISTRY_DEVICE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devauth {
namespace registry {

// Persisted device row. sealed_secret is the AES-GCM blob produced by
// crypto::SecretBox; the raw secret is never stored.
struct Device {
    std::string device_id;
    std::string user_id;
    std::string derived_key_hash;  // SHA-256 hex of the raw secret
    std::vector<uint8_t> sealed_secret;
    bool is_active = true;
    int64_t created_at_ms = 0;
    std::optional<int64_t> last_used_ms;  // Unset until the first accepted code
    int64_t usage_count = 0;
    int64_t last_step = -1;  // Replay high-water mark (highest accepted OTP step)
    std::optional<int64_t> deactivated_at_ms;
};

// Outcome of registry/store operations
enum class RegistryStatus {
    OK,
    NOT_FOUND,
    DUPLICATE,
    INACTIVE,          // record_success against a deactivated device
    ALREADY_INACTIVE,  // deactivate against a deactivated device
    REPLAY,            // moving factor at or below the high-water mark
    STORAGE_TIMEOUT,
    STORAGE_UNAVAILABLE,
    INTERNAL_ERROR     // Crypto failure or unreadable secret material
};

inline const char *registry_status_to_string(RegistryStatus status) {
    switch (status) {
        case RegistryStatus::OK:
            return "OK";
        case RegistryStatus::NOT_FOUND:
            return "NOT_FOUND";
        case RegistryStatus::DUPLICATE:
            return "DUPLICATE";
        case RegistryStatus::INACTIVE:
            return "INACTIVE";
        case RegistryStatus::ALREADY_INACTIVE:
            return "ALREADY_INACTIVE";
        case RegistryStatus::REPLAY:
            return "REPLAY";
        case RegistryStatus::STORAGE_TIMEOUT:
            return "STORAGE_TIMEOUT";
        case RegistryStatus::STORAGE_UNAVAILABLE:
            return "STORAGE_UNAVAILABLE";
        case RegistryStatus::INTERNAL_ERROR:
            return "INTERNAL_ERROR";
        default:
            return "UNKNOWN";
    }
}

inline bool is_storage_failure(RegistryStatus status) {
    return status == RegistryStatus::STORAGE_TIMEOUT || status == RegistryStatus::STORAGE_UNAVAILABLE;
}

}  // namespace registry
}  // namespace devauth

#endif  // DEVAUTH_REGISTRY_DEVICE_HPP
