#pragma once

#include <cstdint>
#include <string>

#include "audit/i_audit_log.hpp"
#include "common/clock.hpp"
#include "crypto/primitives.hpp"
#include "otp/otp_engine.hpp"
#include "registry/device_registry.hpp"

namespace devauth {
namespace verification {

enum class RegistrationOutcome {
    REGISTERED,
    DUPLICATE_DEVICE,
    INVALID_REQUEST,
    STORAGE_TIMEOUT,
    STORAGE_UNAVAILABLE,
    INTERNAL_ERROR
};

enum class VerificationOutcome {
    ACCEPTED,
    INVALID_CODE,
    REPLAY_DETECTED,
    DEVICE_INACTIVE,
    DEVICE_NOT_FOUND,
    RATE_LIMITED,
    INVALID_REQUEST,
    STORAGE_TIMEOUT,
    STORAGE_UNAVAILABLE,
    INTERNAL_ERROR
};

enum class DeactivationOutcome {
    DEACTIVATED,
    DEVICE_NOT_FOUND,
    ALREADY_INACTIVE,
    INVALID_REQUEST,
    STORAGE_TIMEOUT,
    STORAGE_UNAVAILABLE
};

// Stable names, e.g. "DUPLICATE_DEVICE"
const char *outcome_to_string(RegistrationOutcome outcome);
const char *outcome_to_string(VerificationOutcome outcome);
const char *outcome_to_string(DeactivationOutcome outcome);

struct RegistrationResult {
    RegistrationOutcome outcome = RegistrationOutcome::INTERNAL_ERROR;
    std::string device_id;
    crypto::SecretBytes secret;  // Set only when REGISTERED
};

struct VerificationResult {
    VerificationOutcome outcome = VerificationOutcome::INTERNAL_ERROR;
    int matched_offset = 0;  // Valid when ACCEPTED
    int64_t step = -1;       // Valid when ACCEPTED
};

struct DeactivationResult {
    DeactivationOutcome outcome = DeactivationOutcome::STORAGE_UNAVAILABLE;
};

struct RateLimitOptions {
    bool enabled = true;
    int max_attempts = 10;
    int window_seconds = 300;
};

/**
 * @brief Entry point for register / verify / deactivate
 *
 * Every call writes exactly one audit entry describing its outcome, after the
 * primary operation has finished. A failed audit write is logged by the audit
 * log and never changes the result returned here.
 *
 * verify_otp:
 *   1. validate identifiers and code shape
 *   2. load device (NOT_FOUND / inactive)
 *   3. rate limit on recent verify attempts
 *   4. unseal secret, evaluate the window against last_step
 *   5. on a fresh match, conditional update in the registry; losing a race
 *      there turns into REPLAY_DETECTED or DEVICE_INACTIVE
 */
class VerificationOrchestrator {
public:
    VerificationOrchestrator(registry::DeviceRegistry &registry, audit::IAuditLog &audit_log,
                             const otp::OtpEngine &engine, const common::IClock &clock,
                             RateLimitOptions rate_limit = RateLimitOptions());

    RegistrationResult register_device(const std::string &device_id, const std::string &user_id,
                                       const audit::Provenance &provenance);

    VerificationResult verify_otp(const std::string &device_id, const std::string &code,
                                  const audit::Provenance &provenance);

    DeactivationResult deactivate_device(const std::string &device_id, const audit::Provenance &provenance);

    const otp::OtpEngine &engine() const { return engine_; }

private:
    registry::DeviceRegistry &registry_;
    audit::IAuditLog &audit_log_;
    const otp::OtpEngine &engine_;
    const common::IClock &clock_;
    RateLimitOptions rate_limit_;

    // Returns true (and sets outcome) if the attempt must stop here
    bool check_rate_limit(const std::string &device_id, VerificationOutcome &outcome);

    void audit_failure(const std::string &device_id, audit::AuditAction action, const audit::Provenance &provenance,
                       const char *reason);
};

}  // namespace verification
}  // namespace devauth
