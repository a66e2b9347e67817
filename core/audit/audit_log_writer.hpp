#pragma once

#include <atomic>

#include "common/clock.hpp"
#include "i_audit_log.hpp"
#include "storage/database.hpp"

namespace devauth {
namespace audit {

/**
 * @brief SQLite-backed audit trail
 *
 * Each record() is one autocommit INSERT on its own connection, so an audit
 * write never joins (or rolls back with) the transaction it documents.
 * The table rejects UPDATE and DELETE via triggers.
 */
class AuditLogWriter : public IAuditLog {
public:
    AuditLogWriter(const storage::Database &database, const common::IClock &clock);

    bool record(const std::string &device_id, AuditAction action, bool success, const Provenance &provenance,
                const nlohmann::json &details) override;

    storage::StorageFault count_recent(const std::string &device_id, AuditAction action, int64_t since_ms,
                                       int64_t &count) override;

    storage::StorageFault entries_for_device(const std::string &device_id, size_t limit,
                                             std::vector<AuditEntry> &out) override;

    uint64_t failed_writes() const override { return failed_writes_.load(); }

private:
    const storage::Database &database_;
    const common::IClock &clock_;
    std::atomic<uint64_t> failed_writes_{0};

    bool insert(const std::string &device_id, AuditAction action, bool success, const Provenance &provenance,
                const nlohmann::json &details, std::string &error);
};

}  // namespace audit
}  // namespace devauth
