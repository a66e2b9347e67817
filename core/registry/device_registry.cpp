#include "device_registry.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include "logging/logger.hpp"

namespace devauth {
namespace registry {

namespace {
constexpr size_t kMaxIdentifierLength = 100;
}  // namespace

DeviceRegistry::DeviceRegistry(storage::IDeviceStore &store, const crypto::SecretDeriver &deriver,
                               const crypto::SecretBox &secret_box, const common::IClock &clock,
                               RegistryOptions options)
    : store_(store), deriver_(deriver), secret_box_(secret_box), clock_(clock), options_(options) {}

bool DeviceRegistry::is_valid_identifier(const std::string &id) {
    if (id.empty() || id.size() > kMaxIdentifierLength) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' ||
               c == ':' || c == '@' || c == '-';
    });
}

RegistryStatus DeviceRegistry::register_device(const std::string &device_id, const std::string &user_id,
                                               Registration &out) {
    LOG_INFO("[Registry] Registering device: " << device_id << " (user " << user_id << ")");

    crypto::DerivedSecret derived;
    std::string error;
    if (!deriver_.derive(device_id, user_id, derived, error)) {
        return RegistryStatus::INTERNAL_ERROR;
    }

    Device device;
    device.device_id = device_id;
    device.user_id = user_id;
    device.derived_key_hash = derived.hash;
    device.is_active = true;
    device.created_at_ms = clock_.now_epoch_ms();
    device.usage_count = 0;
    device.last_step = -1;

    try {
        device.sealed_secret = secret_box_.seal(derived.secret, device_id);
    } catch (const crypto::CryptoError &e) {
        LOG_ERROR("[Registry] Sealing secret for " << device_id << " failed: " << e.what());
        return RegistryStatus::INTERNAL_ERROR;
    }

    RegistryStatus status = store_.insert(device);
    if (status == RegistryStatus::DUPLICATE) {
        LOG_WARN("[Registry] Device already registered: " << device_id);
        return status;
    }
    if (status != RegistryStatus::OK) {
        LOG_ERROR("[Registry] Registration of " << device_id << " failed: " << registry_status_to_string(status));
        return status;
    }

    out.device = std::move(device);
    out.secret = std::move(derived.secret);
    LOG_INFO("[Registry] Registered: " << device_id);
    return RegistryStatus::OK;
}

RegistryStatus DeviceRegistry::load(const std::string &device_id, Device &out) {
    RegistryStatus status = RegistryStatus::STORAGE_UNAVAILABLE;
    for (int attempt = 0; attempt <= options_.read_retries; ++attempt) {
        if (attempt > 0) {
            backoff(attempt);
            LOG_WARN("[Registry] Retrying load(" << device_id << "), attempt " << attempt + 1);
        }
        status = store_.load(device_id, out);
        if (!is_storage_failure(status)) {
            return status;
        }
    }
    LOG_ERROR("[Registry] load(" << device_id << ") gave up: " << registry_status_to_string(status));
    return status;
}

RegistryStatus DeviceRegistry::open_secret(const Device &device, crypto::SecretBytes &out) const {
    std::string error;
    crypto::SecretBytes secret;
    if (!secret_box_.open(device.sealed_secret, device.device_id, secret, error)) {
        LOG_ERROR("[Registry] Cannot open secret for " << device.device_id << ": " << error);
        return RegistryStatus::INTERNAL_ERROR;
    }

    try {
        if (!crypto::SecretDeriver::hash_matches(device.derived_key_hash, secret)) {
            LOG_ERROR("[Registry] Secret for " << device.device_id << " does not match stored hash");
            return RegistryStatus::INTERNAL_ERROR;
        }
    } catch (const crypto::CryptoError &e) {
        LOG_ERROR("[Registry] Hashing secret for " << device.device_id << " failed: " << e.what());
        return RegistryStatus::INTERNAL_ERROR;
    }

    out = std::move(secret);
    return RegistryStatus::OK;
}

RegistryStatus DeviceRegistry::record_successful_verification(const std::string &device_id, int64_t step) {
    RegistryStatus status = store_.record_success(device_id, step, clock_.now_epoch_ms());
    if (status == RegistryStatus::OK) {
        LOG_DEBUG("[Registry] " << device_id << " high-water step now " << step);
    } else {
        LOG_WARN("[Registry] record_successful_verification(" << device_id << ", step " << step
                                                             << "): " << registry_status_to_string(status));
    }
    return status;
}

RegistryStatus DeviceRegistry::deactivate(const std::string &device_id) {
    LOG_INFO("[Registry] Deactivating device: " << device_id);

    RegistryStatus status = store_.deactivate(device_id, clock_.now_epoch_ms());
    if (status == RegistryStatus::OK) {
        LOG_INFO("[Registry] Device deactivated: " << device_id);
    } else {
        LOG_WARN("[Registry] deactivate(" << device_id << "): " << registry_status_to_string(status));
    }
    return status;
}

bool DeviceRegistry::is_healthy() { return store_.is_healthy(); }

void DeviceRegistry::backoff(int attempt) const {
    if (options_.retry_backoff_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(options_.retry_backoff_ms * attempt));
    }
}

}  // namespace registry
}  // namespace devauth
