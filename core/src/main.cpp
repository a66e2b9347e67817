// devauth server
// Config-based device authentication service with CLI argument parsing

#include <iostream>
#include <string>
#include <filesystem>
#include "runtime/runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "devauth.yaml"; // Default

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: devauth-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: devauth.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  DEVAUTH_MASTER_KEY   Used when security.master_key is not set\n";
            std::cerr << "  DEVAUTH_API_KEY      Used when security.api_key is not set\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("devauth server starting...");
    LOG_INFO("Loading config: " + config_path);

    // Load configuration
    devauth::runtime::RuntimeConfig config;
    std::string error;

    if (!devauth::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    // Apply logging settings
    devauth::logging::Logger::init(devauth::logging::string_to_level(config.logging.level),
                                   devauth::logging::string_to_format(config.logging.format));

    // Create and initialize runtime
    devauth::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    // Install signal handler for graceful shutdown
    devauth::runtime::SignalHandler::install();

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Database: " << config.storage.path);
    LOG_INFO("  OTP: " << config.otp.digits << " digits / " << config.otp.interval_seconds << "s");

    // Run main loop (blocking)
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
