#include "sqlite_device_store.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace devauth {
namespace storage {

using registry::Device;
using registry::RegistryStatus;

namespace {

const char kSelectColumns[] =
    "SELECT device_id, user_id, derived_key_hash, sealed_secret, is_active, created_at, last_used, "
    "usage_count, last_step, deactivated_at FROM devices ";

}  // namespace

SqliteDeviceStore::SqliteDeviceStore(const Database &database) : database_(database) {}

RegistryStatus SqliteDeviceStore::to_status(StorageFault fault) {
    return fault == StorageFault::TIMEOUT ? RegistryStatus::STORAGE_TIMEOUT : RegistryStatus::STORAGE_UNAVAILABLE;
}

void SqliteDeviceStore::read_row(const Statement &stmt, Device &out) {
    out.device_id = stmt.column_text(0);
    out.user_id = stmt.column_text(1);
    out.derived_key_hash = stmt.column_text(2);
    out.sealed_secret = stmt.column_blob(3);
    out.is_active = stmt.column_int64(4) != 0;
    out.created_at_ms = stmt.column_int64(5);
    out.last_used_ms = stmt.column_optional_int64(6);
    out.usage_count = stmt.column_int64(7);
    out.last_step = stmt.column_int64(8);
    out.deactivated_at_ms = stmt.column_optional_int64(9);
}

//=============================================================================
// insert
//=============================================================================
RegistryStatus SqliteDeviceStore::insert(const Device &device) {
    StorageFault fault = StorageFault::NONE;
    std::string error;

    auto conn = database_.connect(fault, error);
    if (!conn) {
        LOG_ERROR("[Storage] insert(" << device.device_id << "): " << error);
        return to_status(fault);
    }

    Transaction txn(*conn);
    if (!txn.begin(fault, error)) {
        LOG_ERROR("[Storage] insert(" << device.device_id << ") begin: " << error);
        return to_status(fault);
    }

    auto exists = conn->prepare("SELECT 1 FROM devices WHERE device_id = ?1;", fault, error);
    if (!exists) {
        LOG_ERROR("[Storage] insert(" << device.device_id << "): " << error);
        return to_status(fault);
    }
    exists.bind_text(1, device.device_id);
    int rc = exists.step();
    if (rc == SQLITE_ROW) {
        return RegistryStatus::DUPLICATE;
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR("[Storage] insert(" << device.device_id << ") lookup: " << conn->error_message());
        return to_status(classify_result(rc));
    }

    auto stmt = conn->prepare(
        "INSERT INTO devices (device_id, user_id, derived_key_hash, sealed_secret, is_active, created_at, "
        "last_used, usage_count, last_step, deactivated_at) VALUES (?1, ?2, ?3, ?4, 1, ?5, NULL, 0, -1, NULL);",
        fault, error);
    if (!stmt) {
        LOG_ERROR("[Storage] insert(" << device.device_id << "): " << error);
        return to_status(fault);
    }
    stmt.bind_text(1, device.device_id);
    stmt.bind_text(2, device.user_id);
    stmt.bind_text(3, device.derived_key_hash);
    stmt.bind_blob(4, device.sealed_secret);
    stmt.bind_int64(5, device.created_at_ms);

    rc = stmt.step();
    if (rc != SQLITE_DONE) {
        fault = classify_result(rc);
        if (fault == StorageFault::CONSTRAINT) {
            return RegistryStatus::DUPLICATE;
        }
        LOG_ERROR("[Storage] insert(" << device.device_id << "): " << conn->error_message());
        return to_status(fault);
    }

    if (!txn.commit(fault, error)) {
        LOG_ERROR("[Storage] insert(" << device.device_id << ") commit: " << error);
        return to_status(fault);
    }
    return RegistryStatus::OK;
}

//=============================================================================
// load
//=============================================================================
RegistryStatus SqliteDeviceStore::load(const std::string &device_id, Device &out) {
    StorageFault fault = StorageFault::NONE;
    std::string error;

    auto conn = database_.connect(fault, error);
    if (!conn) {
        LOG_ERROR("[Storage] load(" << device_id << "): " << error);
        return to_status(fault);
    }
    return load_on(*conn, device_id, out);
}

RegistryStatus SqliteDeviceStore::load_on(Connection &conn, const std::string &device_id, Device &out) {
    StorageFault fault = StorageFault::NONE;
    std::string error;

    auto stmt = conn.prepare(std::string(kSelectColumns) + "WHERE device_id = ?1;", fault, error);
    if (!stmt) {
        LOG_ERROR("[Storage] load(" << device_id << "): " << error);
        return to_status(fault);
    }
    stmt.bind_text(1, device_id);

    int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return RegistryStatus::NOT_FOUND;
    }
    if (rc != SQLITE_ROW) {
        LOG_ERROR("[Storage] load(" << device_id << "): " << conn.error_message());
        return to_status(classify_result(rc));
    }

    read_row(stmt, out);
    return RegistryStatus::OK;
}

//=============================================================================
// record_success
//=============================================================================
RegistryStatus SqliteDeviceStore::record_success(const std::string &device_id, int64_t step, int64_t used_at_ms) {
    StorageFault fault = StorageFault::NONE;
    std::string error;

    auto conn = database_.connect(fault, error);
    if (!conn) {
        LOG_ERROR("[Storage] record_success(" << device_id << "): " << error);
        return to_status(fault);
    }

    Transaction txn(*conn);
    if (!txn.begin(fault, error)) {
        LOG_ERROR("[Storage] record_success(" << device_id << ") begin: " << error);
        return to_status(fault);
    }

    // Compare-and-swap on the high-water mark. Two submissions of the same
    // code race here; the second sees last_step >= step and changes no row.
    auto stmt = conn->prepare(
        "UPDATE devices SET usage_count = usage_count + 1, "
        "last_used = MAX(COALESCE(last_used, ?2), ?2), last_step = ?3 "
        "WHERE device_id = ?1 AND is_active = 1 AND last_step < ?3;",
        fault, error);
    if (!stmt) {
        LOG_ERROR("[Storage] record_success(" << device_id << "): " << error);
        return to_status(fault);
    }
    stmt.bind_text(1, device_id);
    stmt.bind_int64(2, used_at_ms);
    stmt.bind_int64(3, step);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        LOG_ERROR("[Storage] record_success(" << device_id << "): " << conn->error_message());
        return to_status(classify_result(rc));
    }

    if (conn->changes() == 1) {
        if (!txn.commit(fault, error)) {
            LOG_ERROR("[Storage] record_success(" << device_id << ") commit: " << error);
            return to_status(fault);
        }
        return RegistryStatus::OK;
    }

    // No row changed: explain why from the same snapshot
    Device current;
    RegistryStatus status = load_on(*conn, device_id, current);
    if (status != RegistryStatus::OK) {
        return status;
    }
    if (!current.is_active) {
        return RegistryStatus::INACTIVE;
    }
    return RegistryStatus::REPLAY;
}

//=============================================================================
// deactivate
//=============================================================================
RegistryStatus SqliteDeviceStore::deactivate(const std::string &device_id, int64_t deactivated_at_ms) {
    StorageFault fault = StorageFault::NONE;
    std::string error;

    auto conn = database_.connect(fault, error);
    if (!conn) {
        LOG_ERROR("[Storage] deactivate(" << device_id << "): " << error);
        return to_status(fault);
    }

    Transaction txn(*conn);
    if (!txn.begin(fault, error)) {
        LOG_ERROR("[Storage] deactivate(" << device_id << ") begin: " << error);
        return to_status(fault);
    }

    auto stmt = conn->prepare(
        "UPDATE devices SET is_active = 0, deactivated_at = ?2 WHERE device_id = ?1 AND is_active = 1;", fault,
        error);
    if (!stmt) {
        LOG_ERROR("[Storage] deactivate(" << device_id << "): " << error);
        return to_status(fault);
    }
    stmt.bind_text(1, device_id);
    stmt.bind_int64(2, deactivated_at_ms);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        LOG_ERROR("[Storage] deactivate(" << device_id << "): " << conn->error_message());
        return to_status(classify_result(rc));
    }

    if (conn->changes() == 1) {
        if (!txn.commit(fault, error)) {
            LOG_ERROR("[Storage] deactivate(" << device_id << ") commit: " << error);
            return to_status(fault);
        }
        return RegistryStatus::OK;
    }

    Device current;
    RegistryStatus status = load_on(*conn, device_id, current);
    if (status != RegistryStatus::OK) {
        return status;
    }
    return RegistryStatus::ALREADY_INACTIVE;
}

bool SqliteDeviceStore::is_healthy() {
    std::string error;
    if (!database_.ping(error)) {
        LOG_WARN("[Storage] Health check failed: " << error);
        return false;
    }
    return true;
}

}  // namespace storage
}  // namespace devauth
