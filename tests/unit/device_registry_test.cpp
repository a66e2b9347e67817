#include "registry/device_registry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fixtures/temp_database.hpp"
#include "mocks/fake_clock.hpp"
#include "mocks/mock_device_store.hpp"
#include "storage/sqlite_device_store.hpp"

using namespace devauth;
using namespace devauth::tests;
using namespace testing;
using registry::Device;
using registry::DeviceRegistry;
using registry::Registration;
using registry::RegistryOptions;
using registry::RegistryStatus;

namespace {
const char kMasterKey[] = "0123456789abcdef0123456789abcdef";
constexpr int64_t kStartMs = 1700000000000;
}  // namespace

// Registry over a real SQLite store
class DeviceRegistryTest : public Test {
protected:
    DeviceRegistryTest()
        : store(temp.db()), box(kMasterKey), clock(kStartMs), registry(store, deriver, box, clock) {}

    TempDatabase temp;
    storage::SqliteDeviceStore store;
    crypto::SecretDeriver deriver;
    crypto::SecretBox box;
    FakeClock clock;
    DeviceRegistry registry;
};

TEST_F(DeviceRegistryTest, IdentifierSyntax) {
    EXPECT_TRUE(DeviceRegistry::is_valid_identifier("sensor-001"));
    EXPECT_TRUE(DeviceRegistry::is_valid_identifier("user@example.com"));
    EXPECT_TRUE(DeviceRegistry::is_valid_identifier("rack_7:slot.2"));
    EXPECT_TRUE(DeviceRegistry::is_valid_identifier(std::string(100, 'x')));

    EXPECT_FALSE(DeviceRegistry::is_valid_identifier(""));
    EXPECT_FALSE(DeviceRegistry::is_valid_identifier(std::string(101, 'x')));
    EXPECT_FALSE(DeviceRegistry::is_valid_identifier("has space"));
    EXPECT_FALSE(DeviceRegistry::is_valid_identifier("slash/inside"));
    EXPECT_FALSE(DeviceRegistry::is_valid_identifier("quote'"));
}

TEST_F(DeviceRegistryTest, RegisterPersistsSealedSecretAndHash) {
    Registration registration;
    ASSERT_EQ(registry.register_device("sensor-001", "alice", registration), RegistryStatus::OK);

    EXPECT_EQ(registration.secret.size(), crypto::SecretDeriver::kDefaultSecretLength);
    EXPECT_EQ(registration.device.device_id, "sensor-001");
    EXPECT_EQ(registration.device.created_at_ms, kStartMs);

    Device loaded;
    ASSERT_EQ(registry.load("sensor-001", loaded), RegistryStatus::OK);
    EXPECT_EQ(loaded.user_id, "alice");
    EXPECT_TRUE(loaded.is_active);
    EXPECT_EQ(loaded.usage_count, 0);
    EXPECT_FALSE(loaded.last_used_ms.has_value());
    EXPECT_EQ(loaded.derived_key_hash, crypto::SecretDeriver::hash(registration.secret));

    // Raw secret never lands in the row
    EXPECT_NE(loaded.sealed_secret, registration.secret.bytes());

    crypto::SecretBytes opened;
    ASSERT_EQ(registry.open_secret(loaded, opened), RegistryStatus::OK);
    EXPECT_EQ(opened.bytes(), registration.secret.bytes());
}

TEST_F(DeviceRegistryTest, DuplicateRegistration) {
    Registration first;
    ASSERT_EQ(registry.register_device("sensor-001", "alice", first), RegistryStatus::OK);

    Registration second;
    EXPECT_EQ(registry.register_device("sensor-001", "alice", second), RegistryStatus::DUPLICATE);
    EXPECT_TRUE(second.secret.empty());

    // The stored secret is still the first one
    Device loaded;
    ASSERT_EQ(registry.load("sensor-001", loaded), RegistryStatus::OK);
    EXPECT_EQ(loaded.derived_key_hash, crypto::SecretDeriver::hash(first.secret));
}

TEST_F(DeviceRegistryTest, OpenSecretRejectsHashMismatch) {
    Registration registration;
    ASSERT_EQ(registry.register_device("sensor-001", "alice", registration), RegistryStatus::OK);

    Device loaded;
    ASSERT_EQ(registry.load("sensor-001", loaded), RegistryStatus::OK);
    loaded.derived_key_hash = std::string(64, '0');

    crypto::SecretBytes opened;
    EXPECT_EQ(registry.open_secret(loaded, opened), RegistryStatus::INTERNAL_ERROR);
    EXPECT_TRUE(opened.empty());
}

TEST_F(DeviceRegistryTest, OpenSecretRejectsForeignRow) {
    Registration a;
    Registration b;
    ASSERT_EQ(registry.register_device("sensor-a", "alice", a), RegistryStatus::OK);
    ASSERT_EQ(registry.register_device("sensor-b", "alice", b), RegistryStatus::OK);

    Device device_a;
    Device device_b;
    ASSERT_EQ(registry.load("sensor-a", device_a), RegistryStatus::OK);
    ASSERT_EQ(registry.load("sensor-b", device_b), RegistryStatus::OK);

    // Sealed blob moved onto another device id does not open
    device_b.sealed_secret = device_a.sealed_secret;
    device_b.derived_key_hash = device_a.derived_key_hash;
    crypto::SecretBytes opened;
    EXPECT_EQ(registry.open_secret(device_b, opened), RegistryStatus::INTERNAL_ERROR);
}

TEST_F(DeviceRegistryTest, RecordSuccessfulVerificationUsesClock) {
    Registration registration;
    ASSERT_EQ(registry.register_device("sensor-001", "alice", registration), RegistryStatus::OK);

    clock.advance_seconds(60);
    ASSERT_EQ(registry.record_successful_verification("sensor-001", 42), RegistryStatus::OK);
    EXPECT_EQ(registry.record_successful_verification("sensor-001", 42), RegistryStatus::REPLAY);

    Device loaded;
    ASSERT_EQ(registry.load("sensor-001", loaded), RegistryStatus::OK);
    EXPECT_EQ(loaded.usage_count, 1);
    EXPECT_EQ(loaded.last_step, 42);
    ASSERT_TRUE(loaded.last_used_ms.has_value());
    EXPECT_EQ(*loaded.last_used_ms, kStartMs + 60000);
}

TEST_F(DeviceRegistryTest, DeactivateLifecycle) {
    Registration registration;
    ASSERT_EQ(registry.register_device("sensor-001", "alice", registration), RegistryStatus::OK);

    clock.advance_seconds(5);
    ASSERT_EQ(registry.deactivate("sensor-001"), RegistryStatus::OK);
    EXPECT_EQ(registry.deactivate("sensor-001"), RegistryStatus::ALREADY_INACTIVE);
    EXPECT_EQ(registry.deactivate("ghost"), RegistryStatus::NOT_FOUND);
    EXPECT_EQ(registry.record_successful_verification("sensor-001", 1), RegistryStatus::INACTIVE);

    Device loaded;
    ASSERT_EQ(registry.load("sensor-001", loaded), RegistryStatus::OK);
    EXPECT_FALSE(loaded.is_active);
    EXPECT_EQ(*loaded.deactivated_at_ms, kStartMs + 5000);
}

TEST_F(DeviceRegistryTest, HealthFollowsStore) { EXPECT_TRUE(registry.is_healthy()); }

// Registry over a mocked store, for retry policy
class DeviceRegistryRetryTest : public Test {
protected:
    DeviceRegistryRetryTest() : box(kMasterKey), clock(kStartMs) {
        options.read_retries = 2;
        options.retry_backoff_ms = 0;
    }

    StrictMock<MockDeviceStore> store;
    crypto::SecretDeriver deriver;
    crypto::SecretBox box;
    FakeClock clock;
    RegistryOptions options;
};

TEST_F(DeviceRegistryRetryTest, LoadRetriesTransientFaults) {
    DeviceRegistry registry(store, deriver, box, clock, options);

    EXPECT_CALL(store, load("sensor-001", _))
        .WillOnce(Return(RegistryStatus::STORAGE_TIMEOUT))
        .WillOnce(Invoke([](const std::string &id, Device &out) {
            out.device_id = id;
            return RegistryStatus::OK;
        }));

    Device loaded;
    EXPECT_EQ(registry.load("sensor-001", loaded), RegistryStatus::OK);
    EXPECT_EQ(loaded.device_id, "sensor-001");
}

TEST_F(DeviceRegistryRetryTest, LoadGivesUpAfterConfiguredRetries) {
    DeviceRegistry registry(store, deriver, box, clock, options);

    EXPECT_CALL(store, load("sensor-001", _)).Times(3).WillRepeatedly(Return(RegistryStatus::STORAGE_UNAVAILABLE));

    Device loaded;
    EXPECT_EQ(registry.load("sensor-001", loaded), RegistryStatus::STORAGE_UNAVAILABLE);
}

TEST_F(DeviceRegistryRetryTest, LoadDoesNotRetryDefinitiveAnswers) {
    DeviceRegistry registry(store, deriver, box, clock, options);

    EXPECT_CALL(store, load("ghost", _)).WillOnce(Return(RegistryStatus::NOT_FOUND));

    Device loaded;
    EXPECT_EQ(registry.load("ghost", loaded), RegistryStatus::NOT_FOUND);
}

TEST_F(DeviceRegistryRetryTest, WritesAreNeverRetried) {
    DeviceRegistry registry(store, deriver, box, clock, options);

    EXPECT_CALL(store, insert(_)).WillOnce(Return(RegistryStatus::STORAGE_TIMEOUT));
    EXPECT_CALL(store, record_success("sensor-001", 7, kStartMs)).WillOnce(Return(RegistryStatus::STORAGE_TIMEOUT));
    EXPECT_CALL(store, deactivate("sensor-001", kStartMs)).WillOnce(Return(RegistryStatus::STORAGE_UNAVAILABLE));

    Registration registration;
    EXPECT_EQ(registry.register_device("sensor-001", "alice", registration), RegistryStatus::STORAGE_TIMEOUT);
    EXPECT_TRUE(registration.secret.empty());
    EXPECT_EQ(registry.record_successful_verification("sensor-001", 7), RegistryStatus::STORAGE_TIMEOUT);
    EXPECT_EQ(registry.deactivate("sensor-001"), RegistryStatus::STORAGE_UNAVAILABLE);
}

TEST_F(DeviceRegistryRetryTest, RegisterHandsStoreAFullyFormedRow) {
    DeviceRegistry registry(store, deriver, box, clock, options);

    Device inserted;
    EXPECT_CALL(store, insert(_)).WillOnce(DoAll(SaveArg<0>(&inserted), Return(RegistryStatus::OK)));

    Registration registration;
    ASSERT_EQ(registry.register_device("sensor-001", "alice", registration), RegistryStatus::OK);
    EXPECT_EQ(inserted.device_id, "sensor-001");
    EXPECT_EQ(inserted.user_id, "alice");
    EXPECT_TRUE(inserted.is_active);
    EXPECT_EQ(inserted.last_step, -1);
    EXPECT_EQ(inserted.created_at_ms, kStartMs);
    EXPECT_EQ(inserted.sealed_secret.size(),
              crypto::SecretBox::kNonceSize + registration.secret.size() + crypto::SecretBox::kTagSize);
}
