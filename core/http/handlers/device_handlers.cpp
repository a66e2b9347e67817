#include <cstdlib>

#include "../../crypto/encoding.hpp"
#include "../../logging/logger.hpp"
#include "../../registry/device_registry.hpp"
#include "../../verification/verification_orchestrator.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace devauth {
namespace http {

namespace {

constexpr size_t kDefaultAuditLimit = 100;
constexpr size_t kMaxAuditLimit = 1000;

StatusCode to_status_code(verification::RegistrationOutcome outcome) {
    using verification::RegistrationOutcome;
    switch (outcome) {
        case RegistrationOutcome::REGISTERED:
            return StatusCode::CREATED;
        case RegistrationOutcome::DUPLICATE_DEVICE:
            return StatusCode::ALREADY_EXISTS;
        case RegistrationOutcome::INVALID_REQUEST:
            return StatusCode::INVALID_ARGUMENT;
        case RegistrationOutcome::STORAGE_TIMEOUT:
            return StatusCode::DEADLINE_EXCEEDED;
        case RegistrationOutcome::STORAGE_UNAVAILABLE:
            return StatusCode::UNAVAILABLE;
        default:
            return StatusCode::INTERNAL;
    }
}

StatusCode to_status_code(verification::DeactivationOutcome outcome) {
    using verification::DeactivationOutcome;
    switch (outcome) {
        case DeactivationOutcome::DEACTIVATED:
            return StatusCode::OK;
        case DeactivationOutcome::DEVICE_NOT_FOUND:
            return StatusCode::NOT_FOUND;
        case DeactivationOutcome::ALREADY_INACTIVE:
            return StatusCode::FAILED_PRECONDITION;
        case DeactivationOutcome::INVALID_REQUEST:
            return StatusCode::INVALID_ARGUMENT;
        case DeactivationOutcome::STORAGE_TIMEOUT:
            return StatusCode::DEADLINE_EXCEEDED;
        default:
            return StatusCode::UNAVAILABLE;
    }
}

StatusCode to_status_code(registry::RegistryStatus status) {
    switch (status) {
        case registry::RegistryStatus::OK:
            return StatusCode::OK;
        case registry::RegistryStatus::NOT_FOUND:
            return StatusCode::NOT_FOUND;
        case registry::RegistryStatus::STORAGE_TIMEOUT:
            return StatusCode::DEADLINE_EXCEEDED;
        case registry::RegistryStatus::STORAGE_UNAVAILABLE:
            return StatusCode::UNAVAILABLE;
        default:
            return StatusCode::INTERNAL;
    }
}

}  // namespace

//=============================================================================
// POST /api/v1/devices/register
//=============================================================================
void HttpServer::handle_post_register(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!parse_json_body(req, body, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    std::string device_id, user_id;
    if (!decode_register_request(body, device_id, user_id, error)) {
        if (!has_string_field(body, "device_id")) {
            send_error(res, StatusCode::INVALID_ARGUMENT, error);
            return;
        }
        // Known device: the orchestrator rejects and audits the attempt
        LOG_DEBUG("[HTTP] Register " << device_id << ": " << error);
        user_id.clear();
    }

    auto result = orchestrator_.register_device(device_id, user_id, provenance_from(req));
    const StatusCode code = to_status_code(result.outcome);

    switch (result.outcome) {
        case verification::RegistrationOutcome::REGISTERED: {
            nlohmann::json response = {{"status", make_status(code, "Device registered")},
                                       {"device_id", result.device_id},
                                       {"secret", crypto::base64_encode(result.secret.data(), result.secret.size())}};
            send_json(res, code, response);
            return;
        }
        case verification::RegistrationOutcome::DUPLICATE_DEVICE:
            send_error(res, code, "Device already registered: " + device_id);
            return;
        case verification::RegistrationOutcome::INVALID_REQUEST:
            send_error(res, code,
                       error.empty() ? "device_id and user_id must be 1-100 characters of [A-Za-z0-9._:@-]" : error);
            return;
        default:
            send_error(res, code, std::string("Registration failed: ") + verification::outcome_to_string(result.outcome));
            return;
    }
}

//=============================================================================
// POST /api/v1/devices/{device_id}/deactivate
//=============================================================================
void HttpServer::handle_post_deactivate(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_path_params(req, device_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path parameters");
        return;
    }

    auto result = orchestrator_.deactivate_device(device_id, provenance_from(req));
    const StatusCode code = to_status_code(result.outcome);

    switch (result.outcome) {
        case verification::DeactivationOutcome::DEACTIVATED: {
            nlohmann::json response = {{"status", make_status(code, "Device deactivated")},
                                       {"device_id", device_id}};
            send_json(res, code, response);
            return;
        }
        case verification::DeactivationOutcome::DEVICE_NOT_FOUND:
            send_error(res, code, "Device not found: " + device_id);
            return;
        case verification::DeactivationOutcome::ALREADY_INACTIVE:
            send_error(res, code, "Device already inactive: " + device_id);
            return;
        case verification::DeactivationOutcome::INVALID_REQUEST:
            send_error(res, code, "Invalid device_id");
            return;
        default:
            send_error(res, code,
                       std::string("Deactivation failed: ") + verification::outcome_to_string(result.outcome));
            return;
    }
}

//=============================================================================
// GET /api/v1/devices/{device_id}
//=============================================================================
void HttpServer::handle_get_device(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_path_params(req, device_id) || !registry::DeviceRegistry::is_valid_identifier(device_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid device_id");
        return;
    }

    registry::Device device;
    auto status = registry_.load(device_id, device);
    if (status != registry::RegistryStatus::OK) {
        const StatusCode code = to_status_code(status);
        send_error(res, code,
                   code == StatusCode::NOT_FOUND ? "Device not found: " + device_id
                                                 : std::string(registry::registry_status_to_string(status)));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"device", encode_device_info(device)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /api/v1/devices/{device_id}/audit?limit=N
//=============================================================================
void HttpServer::handle_get_device_audit(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_path_params(req, device_id) || !registry::DeviceRegistry::is_valid_identifier(device_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid device_id");
        return;
    }

    size_t limit = kDefaultAuditLimit;
    if (req.has_param("limit")) {
        const std::string raw = req.get_param_value("limit");
        char *end = nullptr;
        const long parsed = std::strtol(raw.c_str(), &end, 10);
        if (raw.empty() || end == nullptr || *end != '\0' || parsed < 1 ||
            parsed > static_cast<long>(kMaxAuditLimit)) {
            send_error(res, StatusCode::INVALID_ARGUMENT,
                       "limit must be an integer between 1 and " + std::to_string(kMaxAuditLimit));
            return;
        }
        limit = static_cast<size_t>(parsed);
    }

    std::vector<audit::AuditEntry> entries;
    auto fault = audit_log_.entries_for_device(device_id, limit, entries);
    if (fault != storage::StorageFault::NONE) {
        const StatusCode code =
            fault == storage::StorageFault::TIMEOUT ? StatusCode::DEADLINE_EXCEEDED : StatusCode::UNAVAILABLE;
        send_error(res, code, "Audit log unavailable");
        return;
    }

    nlohmann::json entries_json = nlohmann::json::array();
    for (const auto &entry : entries) {
        entries_json.push_back(encode_audit_entry(entry));
    }

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"device_id", device_id}, {"entries", entries_json}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace devauth
