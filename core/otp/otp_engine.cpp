#include "otp_engine.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace devauth {
namespace otp {

OtpEngine::OtpEngine(const OtpSettings &settings) : settings_(settings), modulus_(1) {
    for (int i = 0; i < settings_.digits; ++i) {
        modulus_ *= 10;
    }
}

std::string OtpEngine::compute_hotp(const crypto::SecretBytes &secret, uint64_t counter) const {
    uint8_t msg[8];
    for (int i = 7; i >= 0; --i) {
        msg[i] = static_cast<uint8_t>(counter & 0xFF);
        counter >>= 8;
    }

    std::vector<uint8_t> mac = crypto::hmac(settings_.algorithm, secret.data(), secret.size(), msg, sizeof(msg));

    // Dynamic truncation
    size_t offset = mac.back() & 0x0F;
    uint32_t code = (static_cast<uint32_t>(mac[offset] & 0x7F) << 24) |
                    (static_cast<uint32_t>(mac[offset + 1]) << 16) |
                    (static_cast<uint32_t>(mac[offset + 2]) << 8) | static_cast<uint32_t>(mac[offset + 3]);

    std::string out;
    format_code(code % modulus_, out);
    return out;
}

int64_t OtpEngine::time_step(int64_t unix_seconds) const {
    if (unix_seconds < 0) {
        return 0;
    }
    return unix_seconds / settings_.interval_seconds;
}

std::string OtpEngine::compute_expected(const crypto::SecretBytes &secret, int64_t unix_seconds) const {
    return compute_hotp(secret, static_cast<uint64_t>(time_step(unix_seconds)));
}

OtpCheck OtpEngine::verify(const crypto::SecretBytes &secret, const std::string &submitted_code,
                           int64_t unix_seconds, int64_t last_accepted_step) const {
    OtpCheck result;
    if (!is_well_formed(submitted_code)) {
        return result;
    }

    const int64_t current = time_step(unix_seconds);

    bool have_fresh = false;
    bool have_consumed = false;
    OtpCheck fresh;
    OtpCheck consumed;

    for (int offset = -settings_.window; offset <= settings_.window; ++offset) {
        const int64_t step = current + offset;
        if (step < 0) {
            continue;
        }

        const std::string expected = compute_hotp(secret, static_cast<uint64_t>(step));
        const bool match = crypto::constant_time_equals(expected, submitted_code);

        if (match && step > last_accepted_step) {
            // Prefer the match closest to the current step
            if (!have_fresh || std::abs(offset) < std::abs(fresh.matched_offset)) {
                fresh.matched_offset = offset;
                fresh.matched_step = step;
            }
            have_fresh = true;
        } else if (match) {
            consumed.matched_offset = offset;
            consumed.matched_step = step;
            have_consumed = true;
        }
    }

    if (have_fresh) {
        fresh.outcome = OtpCheckOutcome::ACCEPTED;
        return fresh;
    }
    if (have_consumed) {
        consumed.outcome = OtpCheckOutcome::REPLAY_DETECTED;
        return consumed;
    }
    return result;
}

bool OtpEngine::is_well_formed(const std::string &code) const {
    if (code.size() != static_cast<size_t>(settings_.digits)) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; });
}

bool OtpEngine::format_code(uint64_t value, std::string &out) const {
    if (value >= modulus_) {
        return false;
    }
    std::string digits = std::to_string(value);
    out = std::string(static_cast<size_t>(settings_.digits) - digits.size(), '0') + digits;
    return true;
}

}  // namespace otp
}  // namespace devauth
