#pragma once

#include <string>
#include <vector>

namespace devauth {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";   // debug, info, warn, error
    std::string format = "text";  // text, json
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8000;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 16;                           // Worker thread pool size
};

struct StorageConfig {
    std::string path = "devauth.db";  // SQLite database file
    int busy_timeout_ms = 5000;       // Bounded wait on a locked database (100-60000ms)
    int read_retries = 2;             // Retries for idempotent reads only (0-10)
    int retry_backoff_ms = 25;        // Linear backoff between read retries
};

struct SecurityConfig {
    std::string master_key;  // Seals device secrets at rest (env DEVAUTH_MASTER_KEY)
    std::string api_key;     // Bearer credential for /api/v1 (env DEVAUTH_API_KEY)
};

struct OtpConfig {
    int digits = 6;                   // 6-8
    int interval_seconds = 30;        // 1-300
    int window = 1;                   // Steps tolerated on each side (0-2)
    std::string algorithm = "SHA1";   // SHA1, SHA256, SHA512
};

struct RateLimitConfig {
    bool enabled = true;
    int max_attempts = 10;     // Verify attempts allowed per device per window
    int window_seconds = 300;
};

struct RuntimeConfig {
    HttpConfig http;
    StorageConfig storage;
    SecurityConfig security;
    OtpConfig otp;
    RateLimitConfig rate_limit;
    LoggingConfig logging;
    bool debug = false;  // Enables /api/v1/test/* endpoints
};

// Minimum master key length in bytes
constexpr size_t kMinMasterKeyLength = 16;

// Loads configuration from a YAML file, then fills unset keys from the
// environment and validates
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace devauth
