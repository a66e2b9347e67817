#include "../../logging/logger.hpp"
#include "../../verification/verification_orchestrator.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace devauth {
namespace http {

namespace {

StatusCode to_status_code(verification::VerificationOutcome outcome) {
    using verification::VerificationOutcome;
    switch (outcome) {
        case VerificationOutcome::ACCEPTED:
            return StatusCode::OK;
        case VerificationOutcome::INVALID_CODE:
            return StatusCode::INVALID_CODE;
        case VerificationOutcome::REPLAY_DETECTED:
            return StatusCode::REPLAY_DETECTED;
        case VerificationOutcome::DEVICE_INACTIVE:
            return StatusCode::PERMISSION_DENIED;
        case VerificationOutcome::DEVICE_NOT_FOUND:
            return StatusCode::NOT_FOUND;
        case VerificationOutcome::RATE_LIMITED:
            return StatusCode::RESOURCE_EXHAUSTED;
        case VerificationOutcome::INVALID_REQUEST:
            return StatusCode::INVALID_ARGUMENT;
        case VerificationOutcome::STORAGE_TIMEOUT:
            return StatusCode::DEADLINE_EXCEEDED;
        case VerificationOutcome::STORAGE_UNAVAILABLE:
            return StatusCode::UNAVAILABLE;
        default:
            return StatusCode::INTERNAL;
    }
}

const char *describe(verification::VerificationOutcome outcome) {
    using verification::VerificationOutcome;
    switch (outcome) {
        case VerificationOutcome::ACCEPTED:
            return "OTP accepted";
        case VerificationOutcome::INVALID_CODE:
            return "Invalid OTP";
        case VerificationOutcome::REPLAY_DETECTED:
            return "OTP already used";
        case VerificationOutcome::DEVICE_INACTIVE:
            return "Device is inactive";
        case VerificationOutcome::DEVICE_NOT_FOUND:
            return "Device not found";
        case VerificationOutcome::RATE_LIMITED:
            return "Rate limit exceeded";
        case VerificationOutcome::INVALID_REQUEST:
            return "Malformed device_id or otp";
        case VerificationOutcome::STORAGE_TIMEOUT:
            return "Storage timeout";
        case VerificationOutcome::STORAGE_UNAVAILABLE:
            return "Storage unavailable";
        default:
            return "Verification failed";
    }
}

}  // namespace

//=============================================================================
// POST /api/v1/otp/verify
//=============================================================================
void HttpServer::handle_post_verify(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!parse_json_body(req, body, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    std::string device_id, otp;
    if (!decode_verify_request(body, orchestrator_.engine(), device_id, otp, error)) {
        if (!has_string_field(body, "device_id")) {
            send_error(res, StatusCode::INVALID_ARGUMENT, error);
            return;
        }
        // Known device: an empty code is rejected and audited as INVALID_REQUEST
        LOG_DEBUG("[HTTP] Verify " << device_id << ": " << error);
        otp.clear();
    }

    auto result = orchestrator_.verify_otp(device_id, otp, provenance_from(req));
    const StatusCode code = to_status_code(result.outcome);
    const bool valid = result.outcome == verification::VerificationOutcome::ACCEPTED;

    const bool decode_failed = !error.empty() && result.outcome == verification::VerificationOutcome::INVALID_REQUEST;
    nlohmann::json response = {{"status", make_status(code, decode_failed ? error : describe(result.outcome))},
                               {"device_id", device_id},
                               {"valid", valid}};
    if (valid) {
        response["matched_offset"] = result.matched_offset;
    }
    send_json(res, code, response);
}

//=============================================================================
// POST /api/v1/test/generate-otp (debug only)
//=============================================================================
void HttpServer::handle_post_generate_otp(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!parse_json_body(req, body, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    std::vector<uint8_t> raw_secret;
    std::optional<int64_t> timestamp;
    if (!decode_generate_otp_request(body, raw_secret, timestamp, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    const int64_t unix_seconds = timestamp ? *timestamp : clock_.now_epoch_seconds();

    crypto::SecretBytes secret(std::move(raw_secret));
    const auto &engine = orchestrator_.engine();
    nlohmann::json response = {{"status", make_status(StatusCode::OK, "OTP generated for testing")},
                               {"otp", engine.compute_expected(secret, unix_seconds)},
                               {"step", engine.time_step(unix_seconds)}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace devauth
