#pragma once

#include <atomic>
#include <memory>

#include "audit/audit_log_writer.hpp"
#include "common/clock.hpp"
#include "config.hpp"
#include "crypto/secret_box.hpp"
#include "crypto/secret_deriver.hpp"
#include "http/server.hpp"
#include "otp/otp_engine.hpp"
#include "registry/device_registry.hpp"
#include "storage/database.hpp"
#include "storage/sqlite_device_store.hpp"
#include "verification/verification_orchestrator.hpp"

namespace devauth {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Initialize all components (storage, crypto, registry, audit, HTTP)
    bool initialize(std::string &error);

    // Main runtime loop (blocking until a shutdown signal)
    void run();

    // Stop the HTTP server
    void shutdown();

private:
    // Staged initialization helpers
    bool init_storage(std::string &error);
    bool init_crypto(std::string &error);
    bool init_core_services(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    common::SystemClock clock_;
    std::unique_ptr<storage::Database> database_;
    std::unique_ptr<storage::SqliteDeviceStore> device_store_;
    std::unique_ptr<crypto::SecretDeriver> deriver_;
    std::unique_ptr<crypto::SecretBox> secret_box_;
    std::unique_ptr<otp::OtpEngine> otp_engine_;
    std::unique_ptr<registry::DeviceRegistry> registry_;
    std::unique_ptr<audit::AuditLogWriter> audit_log_;
    std::unique_ptr<verification::VerificationOrchestrator> orchestrator_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace devauth
