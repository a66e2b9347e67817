#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>
#include "common/clock.hpp"
#include "runtime/config.hpp"

// Forward declarations
namespace devauth {
namespace registry { class DeviceRegistry; }
namespace audit { class IAuditLog; }
namespace verification { class VerificationOrchestrator; }
}

namespace devauth {
namespace http {

/**
 * @brief HTTP server wrapper for the devauth service
 *
 * The HTTP server is an external adapter layer: it authenticates the
 * caller (bearer API key), parses requests and delegates every audited
 * operation to the VerificationOrchestrator. Read-only device and audit
 * lookups go to the registry and audit log directly.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Components behind it keep no per-request shared state
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @param config HTTP configuration (bind address, port, CORS)
     * @param api_key Bearer credential required on /api/v1
     * @param debug_endpoints Expose /api/v1/test/*
     * @param clock Time source for /health and the debug OTP generator
     */
    HttpServer(const runtime::HttpConfig &config, std::string api_key, bool debug_endpoints,
               verification::VerificationOrchestrator &orchestrator, registry::DeviceRegistry &registry,
               audit::IAuditLog &audit_log, const common::IClock &clock);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    static constexpr const char *kServiceName = "devauth";
    static constexpr const char *kVersion = "1.0.0";

private:
    // Configuration
    runtime::HttpConfig config_;
    std::string api_key_;
    bool debug_endpoints_;

    // Component references
    verification::VerificationOrchestrator &orchestrator_;
    registry::DeviceRegistry &registry_;
    audit::IAuditLog &audit_log_;
    const common::IClock &clock_;

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    // Route setup
    void setup_routes();

    // Constant-time check of "Authorization: Bearer <api_key>"
    bool is_authorized(const httplib::Request &req) const;

    // System handlers (system_handlers.cpp)
    void handle_get_root(const httplib::Request &req, httplib::Response &res);
    void handle_get_health(const httplib::Request &req, httplib::Response &res);

    // Device handlers (device_handlers.cpp)
    void handle_post_register(const httplib::Request &req, httplib::Response &res);
    void handle_post_deactivate(const httplib::Request &req, httplib::Response &res);
    void handle_get_device(const httplib::Request &req, httplib::Response &res);
    void handle_get_device_audit(const httplib::Request &req, httplib::Response &res);

    // OTP handlers (otp_handlers.cpp)
    void handle_post_verify(const httplib::Request &req, httplib::Response &res);
    void handle_post_generate_otp(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace devauth
