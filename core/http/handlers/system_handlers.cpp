#include "../../audit/i_audit_log.hpp"
#include "../../logging/logger.hpp"
#include "../../registry/device_registry.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace devauth {
namespace http {

//=============================================================================
// GET /
//=============================================================================
void HttpServer::handle_get_root(const httplib::Request &, httplib::Response &res) {
    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"service", kServiceName},
                               {"version", kVersion},
                               {"state", "running"}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /health
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    const bool database_healthy = registry_.is_healthy();
    if (!database_healthy) {
        LOG_WARN("[HTTP] Health check: database unhealthy");
    }

    // Liveness only: always 200, the body reports dependency state
    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"service", kServiceName},
                               {"version", kVersion},
                               {"health", database_healthy ? "healthy" : "unhealthy"},
                               {"database", database_healthy ? "healthy" : "unhealthy"},
                               {"audit_write_failures", audit_log_.failed_writes()},
                               {"timestamp", clock_.now_epoch_ms()}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace devauth
