#include "server.hpp"

#include <algorithm>
#include <utility>

#include "crypto/primitives.hpp"
#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"

namespace devauth {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;

const char kApiPrefix[] = "/api/v1/";
const char kBearerPrefix[] = "Bearer ";
const char kAllowMethods[] = "GET, POST, OPTIONS";
const char kAllowHeaders[] = "Content-Type, Authorization";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, std::string api_key, bool debug_endpoints,
                       verification::VerificationOrchestrator &orchestrator, registry::DeviceRegistry &registry,
                       audit::IAuditLog &audit_log, const common::IClock &clock)
    : config_(config),
      api_key_(std::move(api_key)),
      debug_endpoints_(debug_endpoints),
      orchestrator_(orchestrator),
      registry_(registry),
      audit_log_(audit_log),
      clock_(clock) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::is_authorized(const httplib::Request &req) const {
    if (api_key_.empty() || !req.has_header("Authorization")) {
        return false;
    }
    const std::string header = req.get_header_value("Authorization");
    const std::string prefix(kBearerPrefix);
    if (header.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return crypto::constant_time_equals(header.substr(prefix.size()), api_key_);
}

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    // Create server
    server_ = std::make_unique<httplib::Server>();

    // Configure server
    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Bearer authentication for everything under /api/v1 except CORS preflight
    server_->set_pre_routing_handler([this](const httplib::Request &req, httplib::Response &res) {
        if (req.method == "OPTIONS" || req.path.compare(0, sizeof(kApiPrefix) - 1, kApiPrefix) != 0) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        if (is_authorized(req)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        LOG_WARN("[HTTP] Rejected unauthenticated " << req.method << " " << req.path << " from " << req.remote_addr);
        res.set_header("WWW-Authenticate", "Bearer");
        send_error(res, StatusCode::UNAUTHENTICATED, "Invalid or missing API key");
        return httplib::Server::HandlerResponse::Handled;
    });

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        // A credentialed response may not use the wildcard
        const std::string &allowed = *matched;
        const std::string response_origin = (allowed == "*" && !allow_credentials) ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    // Set up routes
    setup_routes();

    // Set error handler for JSON error responses (called for HTTP errors like 404)
    // Only override content if no content has been set
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        } else if (res.status == kStatusMethodNotAllowed) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Method not allowed: " + req.method + " " + req.path;
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    // Set exception handler
    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            LOG_ERROR("[HTTP] Unknown exception");
        }

        // Exception text is logged, not returned
        nlohmann::json response = make_error_response(StatusCode::INTERNAL, "Internal server error");
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        return false;
    }

    // Start server thread
    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET / - Service banner
    server_->Get("/", [this](const httplib::Request &req, httplib::Response &res) { handle_get_root(req, res); });

    // GET /health - Liveness and database status
    server_->Get("/health",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });

    // POST /api/v1/devices/register - Register a device
    server_->Post("/api/v1/devices/register",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_register(req, res); });

    // POST /api/v1/otp/verify - Verify an OTP
    server_->Post("/api/v1/otp/verify",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_verify(req, res); });

    // POST /api/v1/devices/:device_id/deactivate - Deactivate a device
    server_->Post(R"(/api/v1/devices/([^/]+)/deactivate)",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_deactivate(req, res); });

    // GET /api/v1/devices/:device_id/audit - Audit trail for a device
    server_->Get(R"(/api/v1/devices/([^/]+)/audit)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_device_audit(req, res); });

    // GET /api/v1/devices/:device_id - Device metadata
    server_->Get(R"(/api/v1/devices/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_device(req, res); });

    if (debug_endpoints_) {
        // POST /api/v1/test/generate-otp - Compute a code from a raw secret
        server_->Post("/api/v1/test/generate-otp", [this](const httplib::Request &req, httplib::Response &res) {
            handle_post_generate_otp(req, res);
        });
    }

    // OPTIONS catch-all for CORS preflight on all API routes
    server_->Options(R"(/api/v1/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET  /");
    LOG_INFO("[HTTP]   GET  /health");
    LOG_INFO("[HTTP]   POST /api/v1/devices/register");
    LOG_INFO("[HTTP]   POST /api/v1/otp/verify");
    LOG_INFO("[HTTP]   POST /api/v1/devices/{device_id}/deactivate");
    LOG_INFO("[HTTP]   GET  /api/v1/devices/{device_id}");
    LOG_INFO("[HTTP]   GET  /api/v1/devices/{device_id}/audit");
    if (debug_endpoints_) {
        LOG_INFO("[HTTP]   POST /api/v1/test/generate-otp (debug)");
    }
}

}  // namespace http
}  // namespace devauth
