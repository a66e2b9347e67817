#pragma once

#include <cstdint>
#include <string>

#include "registry/device.hpp"

namespace devauth {
namespace storage {

// Interface for the durable device table to enable mocking
//
// Every method is a single atomic unit against the store. Implementations
// must not cache device state between calls.
class IDeviceStore {
public:
    virtual ~IDeviceStore() = default;

    // DUPLICATE if device_id already exists (active or not)
    virtual registry::RegistryStatus insert(const registry::Device &device) = 0;

    virtual registry::RegistryStatus load(const std::string &device_id, registry::Device &out) = 0;

    // Conditional update: succeeds only while the device is active and
    // step is strictly above the stored high-water mark. Otherwise reports
    // NOT_FOUND, INACTIVE or REPLAY.
    virtual registry::RegistryStatus record_success(const std::string &device_id, int64_t step,
                                                    int64_t used_at_ms) = 0;

    // ALREADY_INACTIVE if the device was deactivated before this call
    virtual registry::RegistryStatus deactivate(const std::string &device_id, int64_t deactivated_at_ms) = 0;

    virtual bool is_healthy() = 0;
};

}  // namespace storage
}  // namespace devauth
