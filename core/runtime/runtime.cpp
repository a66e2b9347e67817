#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace devauth {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing devauth");

    if (!init_storage(error)) {
        return false;
    }

    if (!init_crypto(error)) {
        return false;
    }

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_storage(std::string &error) {
    storage::DatabaseOptions options;
    options.path = config_.storage.path;
    options.busy_timeout_ms = config_.storage.busy_timeout_ms;

    database_ = std::make_unique<storage::Database>(options);
    if (!database_->initialize(error)) {
        error = "Database initialization failed: " + error;
        return false;
    }
    LOG_INFO("[Runtime] Database ready: " << options.path);

    device_store_ = std::make_unique<storage::SqliteDeviceStore>(*database_);
    return true;
}

bool Runtime::init_crypto(std::string &error) {
    deriver_ = std::make_unique<crypto::SecretDeriver>();

    try {
        secret_box_ = std::make_unique<crypto::SecretBox>(config_.security.master_key);
    } catch (const crypto::CryptoError &e) {
        error = std::string("Failed to derive sealing key: ") + e.what();
        return false;
    }

    otp::OtpSettings settings;
    settings.digits = config_.otp.digits;
    settings.interval_seconds = config_.otp.interval_seconds;
    settings.window = config_.otp.window;
    if (!crypto::parse_hash_algorithm(config_.otp.algorithm, settings.algorithm)) {
        error = "Invalid otp.algorithm: " + config_.otp.algorithm;
        return false;
    }
    otp_engine_ = std::make_unique<otp::OtpEngine>(settings);

    LOG_INFO("[Runtime] Secret box and OTP engine created");
    return true;
}

bool Runtime::init_core_services(std::string &) {
    registry::RegistryOptions registry_options;
    registry_options.read_retries = config_.storage.read_retries;
    registry_options.retry_backoff_ms = config_.storage.retry_backoff_ms;
    registry_ = std::make_unique<registry::DeviceRegistry>(*device_store_, *deriver_, *secret_box_, clock_,
                                                           registry_options);

    audit_log_ = std::make_unique<audit::AuditLogWriter>(*database_, clock_);

    verification::RateLimitOptions rate_limit;
    rate_limit.enabled = config_.rate_limit.enabled;
    rate_limit.max_attempts = config_.rate_limit.max_attempts;
    rate_limit.window_seconds = config_.rate_limit.window_seconds;
    orchestrator_ = std::make_unique<verification::VerificationOrchestrator>(*registry_, *audit_log_, *otp_engine_,
                                                                             clock_, rate_limit);

    LOG_INFO("[Runtime] Registry, audit log and orchestrator created");
    return true;
}

bool Runtime::init_http(std::string &error) {
    // Create and start HTTP server if enabled
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, config_.security.api_key, config_.debug,
                                                          *orchestrator_, *registry_, *audit_log_, clock_);

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    bool last_healthy = true;
    auto last_health_check = std::chrono::steady_clock::now();

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Check for shutdown signal
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }

        // Report database health transitions
        auto now = std::chrono::steady_clock::now();
        if (now - last_health_check >= std::chrono::seconds(10)) {
            last_health_check = now;
            const bool healthy = registry_->is_healthy();
            if (healthy != last_healthy) {
                if (healthy) {
                    LOG_INFO("[Runtime] Database recovered");
                } else {
                    LOG_ERROR("[Runtime] Database unhealthy");
                }
                last_healthy = healthy;
            }
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (audit_log_ && audit_log_->failed_writes() > 0) {
        LOG_WARN("[Runtime] " << audit_log_->failed_writes() << " audit write(s) failed during this run");
    }
}

}  // namespace runtime
}  // namespace devauth
