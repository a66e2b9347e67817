#pragma once

#include <cstdint>
#include <string>

#include "crypto/primitives.hpp"

namespace devauth {
namespace otp {

struct OtpSettings {
    int digits = 6;             // 6..8
    int interval_seconds = 30;  // TOTP step size
    int window = 1;             // Adjacent steps tolerated on each side
    crypto::HashAlgorithm algorithm = crypto::HashAlgorithm::SHA1;
};

enum class OtpCheckOutcome {
    ACCEPTED,
    INVALID_CODE,
    REPLAY_DETECTED
};

struct OtpCheck {
    OtpCheckOutcome outcome = OtpCheckOutcome::INVALID_CODE;
    int matched_offset = 0;     // Offset from the current step (valid unless INVALID_CODE)
    int64_t matched_step = -1;  // Absolute step that matched
};

/**
 * @brief HOTP/TOTP computation and windowed verification
 *
 * HOTP follows RFC 4226 (HMAC over the big-endian counter, dynamic
 * truncation, 31-bit mask, modulo 10^digits). TOTP (RFC 6238) uses
 * floor(unix_time / interval) as the counter.
 *
 * verify() evaluates every offset in [-window, +window] and compares with
 * CRYPTO_memcmp, without early exit, so timing does not reveal which offset
 * matched. A match at a step at or below last_accepted_step is a replay.
 *
 * Stateless and thread-safe; the replay high-water mark is owned by the
 * device registry.
 */
class OtpEngine {
public:
    explicit OtpEngine(const OtpSettings &settings);

    std::string compute_hotp(const crypto::SecretBytes &secret, uint64_t counter) const;

    // Expected code for the step containing unix_seconds
    std::string compute_expected(const crypto::SecretBytes &secret, int64_t unix_seconds) const;

    int64_t time_step(int64_t unix_seconds) const;

    // last_accepted_step < 0 means no code has been accepted yet
    OtpCheck verify(const crypto::SecretBytes &secret, const std::string &submitted_code, int64_t unix_seconds,
                    int64_t last_accepted_step) const;

    // Exactly `digits` ASCII digits
    bool is_well_formed(const std::string &code) const;

    // Zero-pads a numeric code to `digits` characters. Returns false if the
    // value does not fit.
    bool format_code(uint64_t value, std::string &out) const;

    const OtpSettings &settings() const { return settings_; }

private:
    OtpSettings settings_;
    uint32_t modulus_;
};

}  // namespace otp
}  // namespace devauth
