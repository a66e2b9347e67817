#include "audit_log_writer.hpp"

#include <exception>
#include <utility>

#include "logging/logger.hpp"

namespace devauth {
namespace audit {

using storage::StorageFault;

AuditLogWriter::AuditLogWriter(const storage::Database &database, const common::IClock &clock)
    : database_(database), clock_(clock) {}

bool AuditLogWriter::record(const std::string &device_id, AuditAction action, bool success,
                            const Provenance &provenance, const nlohmann::json &details) {
    std::string error;
    bool written = false;
    try {
        written = insert(device_id, action, success, provenance, details, error);
    } catch (const std::exception &e) {
        error = e.what();
    }

    if (!written) {
        ++failed_writes_;
        LOG_ERROR("[Audit] Failed to record " << audit_action_to_string(action) << " for " << device_id
                                              << " (success=" << (success ? "true" : "false") << "): " << error);
        return false;
    }

    LOG_DEBUG("[Audit] " << audit_action_to_string(action) << " " << device_id << " success=" << success);
    return true;
}

bool AuditLogWriter::insert(const std::string &device_id, AuditAction action, bool success,
                            const Provenance &provenance, const nlohmann::json &details, std::string &error) {
    StorageFault fault = StorageFault::NONE;
    auto conn = database_.connect(fault, error);
    if (!conn) {
        return false;
    }

    auto stmt = conn->prepare(
        "INSERT INTO audit_logs (device_id, action, success, timestamp, ip_address, user_agent, additional_data) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7);",
        fault, error);
    if (!stmt) {
        return false;
    }

    stmt.bind_text(1, device_id);
    stmt.bind_text(2, audit_action_to_string(action));
    stmt.bind_int64(3, success ? 1 : 0);
    stmt.bind_int64(4, clock_.now_epoch_ms());
    if (provenance.ip_address) {
        stmt.bind_text(5, *provenance.ip_address);
    } else {
        stmt.bind_null(5);
    }
    if (provenance.user_agent) {
        stmt.bind_text(6, *provenance.user_agent);
    } else {
        stmt.bind_null(6);
    }
    if (details.is_null()) {
        stmt.bind_null(7);
    } else {
        stmt.bind_text(7, details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
        error = conn->error_message();
        return false;
    }
    return true;
}

StorageFault AuditLogWriter::count_recent(const std::string &device_id, AuditAction action, int64_t since_ms,
                                          int64_t &count) {
    StorageFault fault = StorageFault::NONE;
    std::string error;

    auto conn = database_.connect(fault, error);
    if (!conn) {
        LOG_ERROR("[Audit] count_recent(" << device_id << "): " << error);
        return fault;
    }

    auto stmt = conn->prepare(
        "SELECT COUNT(*) FROM audit_logs WHERE device_id = ?1 AND action = ?2 AND timestamp >= ?3 "
        "AND COALESCE(json_extract(additional_data, '$.reason'), '') != ?4;",
        fault, error);
    if (!stmt) {
        LOG_ERROR("[Audit] count_recent(" << device_id << "): " << error);
        return fault;
    }
    stmt.bind_text(1, device_id);
    stmt.bind_text(2, audit_action_to_string(action));
    stmt.bind_int64(3, since_ms);
    stmt.bind_text(4, kRateLimitedReason);

    int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        LOG_ERROR("[Audit] count_recent(" << device_id << "): " << conn->error_message());
        return storage::classify_result(rc);
    }
    count = stmt.column_int64(0);
    return StorageFault::NONE;
}

StorageFault AuditLogWriter::entries_for_device(const std::string &device_id, size_t limit,
                                                std::vector<AuditEntry> &out) {
    StorageFault fault = StorageFault::NONE;
    std::string error;
    out.clear();

    auto conn = database_.connect(fault, error);
    if (!conn) {
        LOG_ERROR("[Audit] entries_for_device(" << device_id << "): " << error);
        return fault;
    }

    auto stmt = conn->prepare(
        "SELECT id, device_id, action, success, timestamp, ip_address, user_agent, additional_data "
        "FROM audit_logs WHERE device_id = ?1 ORDER BY id ASC LIMIT ?2;",
        fault, error);
    if (!stmt) {
        LOG_ERROR("[Audit] entries_for_device(" << device_id << "): " << error);
        return fault;
    }
    stmt.bind_text(1, device_id);
    stmt.bind_int64(2, static_cast<int64_t>(limit));

    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        AuditEntry entry;
        entry.id = stmt.column_int64(0);
        entry.device_id = stmt.column_text(1);
        entry.action = stmt.column_text(2);
        entry.success = stmt.column_int64(3) != 0;
        entry.timestamp_ms = stmt.column_int64(4);
        if (!stmt.column_is_null(5)) {
            entry.ip_address = stmt.column_text(5);
        }
        if (!stmt.column_is_null(6)) {
            entry.user_agent = stmt.column_text(6);
        }
        if (!stmt.column_is_null(7)) {
            std::string raw = stmt.column_text(7);
            entry.additional_data = nlohmann::json::parse(raw, nullptr, false);
            if (entry.additional_data.is_discarded()) {
                entry.additional_data = raw;
            }
        }
        out.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR("[Audit] entries_for_device(" << device_id << "): " << conn->error_message());
        out.clear();
        return storage::classify_result(rc);
    }
    return StorageFault::NONE;
}

}  // namespace audit
}  // namespace devauth
