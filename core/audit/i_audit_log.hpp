#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "storage/database.hpp"

namespace devauth {
namespace audit {

enum class AuditAction { REGISTER, VERIFY, DEACTIVATE };

inline const char *audit_action_to_string(AuditAction action) {
    switch (action) {
        case AuditAction::REGISTER:
            return "register";
        case AuditAction::VERIFY:
            return "verify";
        case AuditAction::DEACTIVATE:
            return "deactivate";
        default:
            return "unknown";
    }
}

// additional_data.reason of a failed attempt that was turned away by the rate
// limit before its code was evaluated
constexpr char kRateLimitedReason[] = "rate_limited";

// Request origin as seen by the transport
struct Provenance {
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
};

struct AuditEntry {
    int64_t id = 0;
    std::string device_id;
    std::string action;
    bool success = false;
    int64_t timestamp_ms = 0;
    std::optional<std::string> ip_address;
    std::optional<std::string> user_agent;
    nlohmann::json additional_data;  // null when absent
};

// Interface for the append-only audit trail to enable mocking
class IAuditLog {
public:
    virtual ~IAuditLog() = default;

    // Best-effort append. Never throws; returns false if the write did not
    // happen (the failure is logged and counted).
    virtual bool record(const std::string &device_id, AuditAction action, bool success, const Provenance &provenance,
                        const nlohmann::json &details) = 0;

    // Number of entries for (device_id, action) with timestamp >= since_ms.
    // Entries whose reason is kRateLimitedReason are not counted.
    virtual storage::StorageFault count_recent(const std::string &device_id, AuditAction action, int64_t since_ms,
                                               int64_t &count) = 0;

    // Forensic read: oldest first, at most limit entries
    virtual storage::StorageFault entries_for_device(const std::string &device_id, size_t limit,
                                                     std::vector<AuditEntry> &out) = 0;

    virtual uint64_t failed_writes() const = 0;
};

}  // namespace audit
}  // namespace devauth
