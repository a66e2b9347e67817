#ifndef DEVAUTH_REGISTRY_DEVICE_REGISTRY_HPP
#define DEVAUTH_REGISTRY_DEVICE_REGISTRY_HPP

#include <string>

#include "common/clock.hpp"
#include "crypto/secret_box.hpp"
#include "crypto/secret_deriver.hpp"
#include "device.hpp"
#include "storage/i_device_store.hpp"

namespace devauth {
namespace registry {

struct RegistryOptions {
    int read_retries = 2;       // Extra attempts for idempotent reads only
    int retry_backoff_ms = 25;  // Linear backoff between read attempts
};

// Result of a successful registration. The raw secret is handed out here
// exactly once; it is not retrievable afterwards.
struct Registration {
    Device device;
    crypto::SecretBytes secret;
};

// Device Registry - lifecycle owner for devices
/**
 * State machine: Unregistered -> Active -> Inactive (terminal)
 *
 * Thread Safety:
 * - Holds no device state of its own; every call goes to the store
 * - All cross-request coordination is the store's (uniqueness constraint,
 *   conditional updates), so several service instances may share one store
 *
 * Retry policy:
 * - load() retries storage faults read_retries times
 * - register_device(), record_successful_verification() and deactivate()
 *   never retry; an ambiguous timeout is reported as-is
 */
class DeviceRegistry {
public:
    DeviceRegistry(storage::IDeviceStore &store, const crypto::SecretDeriver &deriver,
                   const crypto::SecretBox &secret_box, const common::IClock &clock,
                   RegistryOptions options = RegistryOptions());

    // Identifier syntax: 1..100 chars of [A-Za-z0-9._:@-]
    static bool is_valid_identifier(const std::string &id);

    // Atomic create. DUPLICATE if device_id exists, including inactive devices.
    RegistryStatus register_device(const std::string &device_id, const std::string &user_id, Registration &out);

    RegistryStatus load(const std::string &device_id, Device &out);

    // Unseals the device secret and checks it against derived_key_hash.
    // The caller owns the returned bytes for the duration of one verification.
    RegistryStatus open_secret(const Device &device, crypto::SecretBytes &out) const;

    // Bumps usage_count, advances last_used and the step high-water mark.
    // REPLAY if step was already consumed, INACTIVE if deactivated meanwhile.
    RegistryStatus record_successful_verification(const std::string &device_id, int64_t step);

    // One-way. ALREADY_INACTIVE on every call after the first success.
    RegistryStatus deactivate(const std::string &device_id);

    bool is_healthy();

private:
    storage::IDeviceStore &store_;
    const crypto::SecretDeriver &deriver_;
    const crypto::SecretBox &secret_box_;
    const common::IClock &clock_;
    RegistryOptions options_;

    void backoff(int attempt) const;
};

}  // namespace registry
}  // namespace devauth

#endif  // DEVAUTH_REGISTRY_DEVICE_REGISTRY_HPP
