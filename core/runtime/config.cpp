#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "../crypto/primitives.hpp"
#include "../logging/logger.hpp"

namespace devauth {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key: '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

std::string env_or_empty(const char *name) {
    const char *value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
        if (config.security.api_key.empty()) {
            error = "security.api_key (or DEVAUTH_API_KEY) is required when HTTP is enabled";
            return false;
        }
    }

    // Validate storage settings
    if (config.storage.path.empty()) {
        error = "storage.path must not be empty";
        return false;
    }
    if (config.storage.busy_timeout_ms < 100 || config.storage.busy_timeout_ms > 60000) {
        error = "storage.busy_timeout_ms must be between 100 and 60000";
        return false;
    }
    if (config.storage.read_retries < 0 || config.storage.read_retries > 10) {
        error = "storage.read_retries must be between 0 and 10";
        return false;
    }
    if (config.storage.retry_backoff_ms < 0) {
        error = "storage.retry_backoff_ms must be >= 0";
        return false;
    }

    // Validate security settings
    if (config.security.master_key.empty()) {
        error = "security.master_key (or DEVAUTH_MASTER_KEY) is required";
        return false;
    }
    if (config.security.master_key.size() < kMinMasterKeyLength) {
        error = "security.master_key must be at least " + std::to_string(kMinMasterKeyLength) + " bytes";
        return false;
    }

    // Validate OTP settings
    if (config.otp.digits < 6 || config.otp.digits > 8) {
        error = "otp.digits must be between 6 and 8";
        return false;
    }
    if (config.otp.interval_seconds < 1 || config.otp.interval_seconds > 300) {
        error = "otp.interval_seconds must be between 1 and 300";
        return false;
    }
    if (config.otp.window < 0 || config.otp.window > 2) {
        error = "otp.window must be between 0 and 2";
        return false;
    }
    crypto::HashAlgorithm algorithm = crypto::HashAlgorithm::SHA1;
    if (!crypto::parse_hash_algorithm(config.otp.algorithm, algorithm)) {
        error = "Invalid otp.algorithm '" + config.otp.algorithm + "': must be SHA1, SHA256 or SHA512";
        return false;
    }

    // Validate rate limit settings
    if (config.rate_limit.enabled) {
        if (config.rate_limit.max_attempts < 1) {
            error = "rate_limit.max_attempts must be >= 1";
            return false;
        }
        if (config.rate_limit.window_seconds < 1) {
            error = "rate_limit.window_seconds must be >= 1";
            return false;
        }
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }
    if (config.logging.format != "text" && config.logging.format != "json") {
        error = "Invalid log format: " + config.logging.format + " (must be text or json)";
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        warn_unknown_keys(yaml, "", {"http", "storage", "security", "otp", "rate_limit", "logging", "debug"});

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            warn_unknown_keys(http, "http",
                              {"enabled", "bind", "port", "cors_allowed_origins", "cors_allow_credentials",
                               "thread_pool_size"});
            if (http["enabled"]) {
                config.http.enabled = http["enabled"].as<bool>();
            }
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load storage config
        if (yaml["storage"]) {
            const auto &storage = yaml["storage"];
            warn_unknown_keys(storage, "storage", {"path", "busy_timeout_ms", "read_retries", "retry_backoff_ms"});
            if (storage["path"]) {
                config.storage.path = storage["path"].as<std::string>();
            }
            if (storage["busy_timeout_ms"]) {
                config.storage.busy_timeout_ms = storage["busy_timeout_ms"].as<int>();
            }
            if (storage["read_retries"]) {
                config.storage.read_retries = storage["read_retries"].as<int>();
            }
            if (storage["retry_backoff_ms"]) {
                config.storage.retry_backoff_ms = storage["retry_backoff_ms"].as<int>();
            }
        }

        // Load security config
        if (yaml["security"]) {
            const auto &security = yaml["security"];
            warn_unknown_keys(security, "security", {"master_key", "api_key"});
            if (security["master_key"]) {
                config.security.master_key = security["master_key"].as<std::string>();
            }
            if (security["api_key"]) {
                config.security.api_key = security["api_key"].as<std::string>();
            }
        }

        // Secrets from environment if not in config
        if (config.security.master_key.empty()) {
            config.security.master_key = env_or_empty("DEVAUTH_MASTER_KEY");
        }
        if (config.security.api_key.empty()) {
            config.security.api_key = env_or_empty("DEVAUTH_API_KEY");
        }

        // Load OTP config
        if (yaml["otp"]) {
            const auto &otp = yaml["otp"];
            warn_unknown_keys(otp, "otp", {"digits", "interval_seconds", "window", "algorithm"});
            if (otp["digits"]) {
                config.otp.digits = otp["digits"].as<int>();
            }
            if (otp["interval_seconds"]) {
                config.otp.interval_seconds = otp["interval_seconds"].as<int>();
            }
            if (otp["window"]) {
                config.otp.window = otp["window"].as<int>();
            }
            if (otp["algorithm"]) {
                config.otp.algorithm = otp["algorithm"].as<std::string>();
            }
        }

        // Load rate limit config
        if (yaml["rate_limit"]) {
            const auto &rate_limit = yaml["rate_limit"];
            warn_unknown_keys(rate_limit, "rate_limit", {"enabled", "max_attempts", "window_seconds"});
            if (rate_limit["enabled"]) {
                config.rate_limit.enabled = rate_limit["enabled"].as<bool>();
            }
            if (rate_limit["max_attempts"]) {
                config.rate_limit.max_attempts = rate_limit["max_attempts"].as<int>();
            }
            if (rate_limit["window_seconds"]) {
                config.rate_limit.window_seconds = rate_limit["window_seconds"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
            if (yaml["logging"]["format"]) {
                config.logging.format = yaml["logging"]["format"].as<std::string>();
            }
        }

        if (yaml["debug"]) {
            config.debug = yaml["debug"].as<bool>();
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Storage: " << config.storage.path << " (busy timeout " << config.storage.busy_timeout_ms
                                      << "ms, " << config.storage.read_retries << " read retries)");
        LOG_INFO("[Config] OTP: " << config.otp.digits << " digits, " << config.otp.interval_seconds << "s step, "
                                  << config.otp.algorithm << ", window +/-" << config.otp.window);

        std::stringstream rate_msg;
        rate_msg << "[Config] Rate limit: " << (config.rate_limit.enabled ? "enabled" : "disabled");
        if (config.rate_limit.enabled) {
            rate_msg << " (" << config.rate_limit.max_attempts << " per " << config.rate_limit.window_seconds
                     << "s)";
        }
        LOG_INFO(rate_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level << ", format: " << config.logging.format);
        if (config.debug) {
            LOG_WARN("[Config] Debug mode enabled: test endpoints are exposed");
        }

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace devauth
