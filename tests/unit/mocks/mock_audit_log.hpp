#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "audit/i_audit_log.hpp"

namespace devauth::tests {

using namespace devauth;
using namespace testing;

class MockAuditLog : public audit::IAuditLog {
public:
    MOCK_METHOD(bool, record,
                (const std::string &, audit::AuditAction, bool, const audit::Provenance &, const nlohmann::json &),
                (override));
    MOCK_METHOD(storage::StorageFault, count_recent, (const std::string &, audit::AuditAction, int64_t, int64_t &),
                (override));
    MOCK_METHOD(storage::StorageFault, entries_for_device,
                (const std::string &, size_t, std::vector<audit::AuditEntry> &), (override));
    MOCK_METHOD(uint64_t, failed_writes, (), (const, override));
};

}  // namespace devauth::tests
