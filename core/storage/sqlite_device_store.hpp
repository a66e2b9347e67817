#pragma once

#include <string>

#include "database.hpp"
#include "i_device_store.hpp"

namespace devauth {
namespace storage {

/**
 * @brief SQLite implementation of the device table
 *
 * Thread-safe: every call opens its own connection. Cross-request
 * coordination relies only on SQLite:
 * - insert: BEGIN IMMEDIATE, existence check, INSERT (PRIMARY KEY as the
 *   final guard), COMMIT
 * - record_success: one conditional UPDATE on (is_active, last_step)
 * - deactivate: one conditional UPDATE on is_active
 */
class SqliteDeviceStore : public IDeviceStore {
public:
    explicit SqliteDeviceStore(const Database &database);

    registry::RegistryStatus insert(const registry::Device &device) override;
    registry::RegistryStatus load(const std::string &device_id, registry::Device &out) override;
    registry::RegistryStatus record_success(const std::string &device_id, int64_t step, int64_t used_at_ms) override;
    registry::RegistryStatus deactivate(const std::string &device_id, int64_t deactivated_at_ms) override;
    bool is_healthy() override;

private:
    const Database &database_;

    // Reads the row on an existing connection (used to explain a failed
    // conditional update inside the same transaction)
    registry::RegistryStatus load_on(Connection &conn, const std::string &device_id, registry::Device &out);

    static registry::RegistryStatus to_status(StorageFault fault);
    static void read_row(const Statement &stmt, registry::Device &out);
};

}  // namespace storage
}  // namespace devauth
