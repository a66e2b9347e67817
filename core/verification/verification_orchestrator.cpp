#include "verification_orchestrator.hpp"

#include <cctype>
#include <utility>

#include "logging/logger.hpp"

namespace devauth {
namespace verification {

using audit::AuditAction;
using registry::RegistryStatus;

namespace {

// Audit reason tag: lowercase outcome name ("DEVICE_NOT_FOUND" -> "device_not_found")
std::string reason_tag(const char *outcome_name) {
    std::string tag(outcome_name);
    for (auto &c : tag) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return tag;
}

}  // namespace

//=============================================================================
// Outcome names
//=============================================================================
const char *outcome_to_string(RegistrationOutcome outcome) {
    switch (outcome) {
        case RegistrationOutcome::REGISTERED:
            return "REGISTERED";
        case RegistrationOutcome::DUPLICATE_DEVICE:
            return "DUPLICATE_DEVICE";
        case RegistrationOutcome::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case RegistrationOutcome::STORAGE_TIMEOUT:
            return "STORAGE_TIMEOUT";
        case RegistrationOutcome::STORAGE_UNAVAILABLE:
            return "STORAGE_UNAVAILABLE";
        case RegistrationOutcome::INTERNAL_ERROR:
            return "INTERNAL_ERROR";
        default:
            return "UNKNOWN";
    }
}

const char *outcome_to_string(VerificationOutcome outcome) {
    switch (outcome) {
        case VerificationOutcome::ACCEPTED:
            return "ACCEPTED";
        case VerificationOutcome::INVALID_CODE:
            return "INVALID_CODE";
        case VerificationOutcome::REPLAY_DETECTED:
            return "REPLAY_DETECTED";
        case VerificationOutcome::DEVICE_INACTIVE:
            return "DEVICE_INACTIVE";
        case VerificationOutcome::DEVICE_NOT_FOUND:
            return "DEVICE_NOT_FOUND";
        case VerificationOutcome::RATE_LIMITED:
            return "RATE_LIMITED";
        case VerificationOutcome::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case VerificationOutcome::STORAGE_TIMEOUT:
            return "STORAGE_TIMEOUT";
        case VerificationOutcome::STORAGE_UNAVAILABLE:
            return "STORAGE_UNAVAILABLE";
        case VerificationOutcome::INTERNAL_ERROR:
            return "INTERNAL_ERROR";
        default:
            return "UNKNOWN";
    }
}

const char *outcome_to_string(DeactivationOutcome outcome) {
    switch (outcome) {
        case DeactivationOutcome::DEACTIVATED:
            return "DEACTIVATED";
        case DeactivationOutcome::DEVICE_NOT_FOUND:
            return "DEVICE_NOT_FOUND";
        case DeactivationOutcome::ALREADY_INACTIVE:
            return "ALREADY_INACTIVE";
        case DeactivationOutcome::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case DeactivationOutcome::STORAGE_TIMEOUT:
            return "STORAGE_TIMEOUT";
        case DeactivationOutcome::STORAGE_UNAVAILABLE:
            return "STORAGE_UNAVAILABLE";
        default:
            return "UNKNOWN";
    }
}

VerificationOrchestrator::VerificationOrchestrator(registry::DeviceRegistry &registry, audit::IAuditLog &audit_log,
                                                   const otp::OtpEngine &engine, const common::IClock &clock,
                                                   RateLimitOptions rate_limit)
    : registry_(registry), audit_log_(audit_log), engine_(engine), clock_(clock), rate_limit_(rate_limit) {}

void VerificationOrchestrator::audit_failure(const std::string &device_id, AuditAction action,
                                             const audit::Provenance &provenance, const char *reason) {
    nlohmann::json details = {{"reason", reason_tag(reason)}};
    audit_log_.record(device_id, action, false, provenance, details);
}

//=============================================================================
// register_device
//=============================================================================
RegistrationResult VerificationOrchestrator::register_device(const std::string &device_id,
                                                             const std::string &user_id,
                                                             const audit::Provenance &provenance) {
    RegistrationResult result;
    result.device_id = device_id;

    if (!registry::DeviceRegistry::is_valid_identifier(device_id) ||
        !registry::DeviceRegistry::is_valid_identifier(user_id)) {
        result.outcome = RegistrationOutcome::INVALID_REQUEST;
        audit_failure(device_id, AuditAction::REGISTER, provenance, outcome_to_string(result.outcome));
        return result;
    }

    registry::Registration registration;
    RegistryStatus status = registry_.register_device(device_id, user_id, registration);
    switch (status) {
        case RegistryStatus::OK:
            result.outcome = RegistrationOutcome::REGISTERED;
            result.secret = std::move(registration.secret);
            break;
        case RegistryStatus::DUPLICATE:
            result.outcome = RegistrationOutcome::DUPLICATE_DEVICE;
            break;
        case RegistryStatus::STORAGE_TIMEOUT:
            result.outcome = RegistrationOutcome::STORAGE_TIMEOUT;
            break;
        case RegistryStatus::STORAGE_UNAVAILABLE:
            result.outcome = RegistrationOutcome::STORAGE_UNAVAILABLE;
            break;
        default:
            result.outcome = RegistrationOutcome::INTERNAL_ERROR;
            break;
    }

    if (result.outcome == RegistrationOutcome::REGISTERED) {
        audit_log_.record(device_id, AuditAction::REGISTER, true, provenance, {{"user_id", user_id}});
    } else {
        audit_failure(device_id, AuditAction::REGISTER, provenance, outcome_to_string(result.outcome));
    }
    return result;
}

//=============================================================================
// verify_otp
//=============================================================================
bool VerificationOrchestrator::check_rate_limit(const std::string &device_id, VerificationOutcome &outcome) {
    if (!rate_limit_.enabled) {
        return false;
    }

    const int64_t since_ms = clock_.now_epoch_ms() - static_cast<int64_t>(rate_limit_.window_seconds) * 1000;
    int64_t attempts = 0;
    storage::StorageFault fault = audit_log_.count_recent(device_id, AuditAction::VERIFY, since_ms, attempts);
    if (fault != storage::StorageFault::NONE) {
        // Cannot tell how many attempts were made; do not evaluate the code
        outcome = fault == storage::StorageFault::TIMEOUT ? VerificationOutcome::STORAGE_TIMEOUT
                                                          : VerificationOutcome::STORAGE_UNAVAILABLE;
        return true;
    }

    if (attempts >= rate_limit_.max_attempts) {
        LOG_WARN("[Verify] Rate limit hit for " << device_id << ": " << attempts << " attempts in "
                                                << rate_limit_.window_seconds << "s");
        outcome = VerificationOutcome::RATE_LIMITED;
        return true;
    }
    return false;
}

VerificationResult VerificationOrchestrator::verify_otp(const std::string &device_id, const std::string &code,
                                                        const audit::Provenance &provenance) {
    VerificationResult result;

    if (!registry::DeviceRegistry::is_valid_identifier(device_id) || !engine_.is_well_formed(code)) {
        result.outcome = VerificationOutcome::INVALID_REQUEST;
        audit_failure(device_id, AuditAction::VERIFY, provenance, outcome_to_string(result.outcome));
        return result;
    }

    registry::Device device;
    RegistryStatus status = registry_.load(device_id, device);
    if (status != RegistryStatus::OK) {
        switch (status) {
            case RegistryStatus::NOT_FOUND:
                result.outcome = VerificationOutcome::DEVICE_NOT_FOUND;
                break;
            case RegistryStatus::STORAGE_TIMEOUT:
                result.outcome = VerificationOutcome::STORAGE_TIMEOUT;
                break;
            case RegistryStatus::STORAGE_UNAVAILABLE:
                result.outcome = VerificationOutcome::STORAGE_UNAVAILABLE;
                break;
            default:
                result.outcome = VerificationOutcome::INTERNAL_ERROR;
                break;
        }
        LOG_INFO("[Verify] " << device_id << ": " << outcome_to_string(result.outcome));
        audit_failure(device_id, AuditAction::VERIFY, provenance, outcome_to_string(result.outcome));
        return result;
    }

    if (!device.is_active) {
        result.outcome = VerificationOutcome::DEVICE_INACTIVE;
        LOG_INFO("[Verify] " << device_id << ": device inactive");
        audit_failure(device_id, AuditAction::VERIFY, provenance, outcome_to_string(result.outcome));
        return result;
    }

    VerificationOutcome limited = VerificationOutcome::RATE_LIMITED;
    if (check_rate_limit(device_id, limited)) {
        result.outcome = limited;
        // Rejections under the limit are recorded with kRateLimitedReason and
        // do not count against the next window
        audit_failure(device_id, AuditAction::VERIFY, provenance,
                      limited == VerificationOutcome::RATE_LIMITED ? audit::kRateLimitedReason
                                                                    : outcome_to_string(result.outcome));
        return result;
    }

    otp::OtpCheck check;
    {
        crypto::SecretBytes secret;
        if (registry_.open_secret(device, secret) != RegistryStatus::OK) {
            result.outcome = VerificationOutcome::INTERNAL_ERROR;
            audit_failure(device_id, AuditAction::VERIFY, provenance, outcome_to_string(result.outcome));
            return result;
        }
        check = engine_.verify(secret, code, clock_.now_epoch_seconds(), device.last_step);
    }

    if (check.outcome == otp::OtpCheckOutcome::INVALID_CODE) {
        result.outcome = VerificationOutcome::INVALID_CODE;
        LOG_INFO("[Verify] " << device_id << ": invalid code");
        audit_failure(device_id, AuditAction::VERIFY, provenance, outcome_to_string(result.outcome));
        return result;
    }
    if (check.outcome == otp::OtpCheckOutcome::REPLAY_DETECTED) {
        result.outcome = VerificationOutcome::REPLAY_DETECTED;
        LOG_WARN("[Verify] " << device_id << ": replay of step " << check.matched_step);
        audit_log_.record(device_id, AuditAction::VERIFY, false, provenance,
                          {{"reason", reason_tag(outcome_to_string(result.outcome))}, {"step", check.matched_step}});
        return result;
    }

    // Fresh match: consume the step. A concurrent acceptance of the same or a
    // later step, or a deactivation that committed first, makes this fail.
    status = registry_.record_successful_verification(device_id, check.matched_step);
    switch (status) {
        case RegistryStatus::OK:
            result.outcome = VerificationOutcome::ACCEPTED;
            result.matched_offset = check.matched_offset;
            result.step = check.matched_step;
            break;
        case RegistryStatus::REPLAY:
            result.outcome = VerificationOutcome::REPLAY_DETECTED;
            break;
        case RegistryStatus::INACTIVE:
            result.outcome = VerificationOutcome::DEVICE_INACTIVE;
            break;
        case RegistryStatus::NOT_FOUND:
            result.outcome = VerificationOutcome::DEVICE_NOT_FOUND;
            break;
        case RegistryStatus::STORAGE_TIMEOUT:
            result.outcome = VerificationOutcome::STORAGE_TIMEOUT;
            break;
        case RegistryStatus::STORAGE_UNAVAILABLE:
            result.outcome = VerificationOutcome::STORAGE_UNAVAILABLE;
            break;
        default:
            result.outcome = VerificationOutcome::INTERNAL_ERROR;
            break;
    }

    if (result.outcome == VerificationOutcome::ACCEPTED) {
        LOG_INFO("[Verify] " << device_id << ": accepted (offset " << result.matched_offset << ")");
        audit_log_.record(device_id, AuditAction::VERIFY, true, provenance,
                          {{"matched_offset", result.matched_offset}, {"step", result.step}});
    } else {
        LOG_WARN("[Verify] " << device_id << ": matched step " << check.matched_step << " not recorded: "
                             << outcome_to_string(result.outcome));
        audit_failure(device_id, AuditAction::VERIFY, provenance, outcome_to_string(result.outcome));
    }
    return result;
}

//=============================================================================
// deactivate_device
//=============================================================================
DeactivationResult VerificationOrchestrator::deactivate_device(const std::string &device_id,
                                                               const audit::Provenance &provenance) {
    DeactivationResult result;

    if (!registry::DeviceRegistry::is_valid_identifier(device_id)) {
        result.outcome = DeactivationOutcome::INVALID_REQUEST;
        audit_failure(device_id, AuditAction::DEACTIVATE, provenance, outcome_to_string(result.outcome));
        return result;
    }

    switch (registry_.deactivate(device_id)) {
        case RegistryStatus::OK:
            result.outcome = DeactivationOutcome::DEACTIVATED;
            break;
        case RegistryStatus::NOT_FOUND:
            result.outcome = DeactivationOutcome::DEVICE_NOT_FOUND;
            break;
        case RegistryStatus::ALREADY_INACTIVE:
            result.outcome = DeactivationOutcome::ALREADY_INACTIVE;
            break;
        case RegistryStatus::STORAGE_TIMEOUT:
            result.outcome = DeactivationOutcome::STORAGE_TIMEOUT;
            break;
        default:
            result.outcome = DeactivationOutcome::STORAGE_UNAVAILABLE;
            break;
    }

    if (result.outcome == DeactivationOutcome::DEACTIVATED) {
        audit_log_.record(device_id, AuditAction::DEACTIVATE, true, provenance, nlohmann::json());
    } else {
        audit_failure(device_id, AuditAction::DEACTIVATE, provenance, outcome_to_string(result.outcome));
    }
    return result;
}

}  // namespace verification
}  // namespace devauth
