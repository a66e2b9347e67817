#pragma once

#include <mutex>
#include <sstream>
#include <string>

namespace devauth {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// TEXT: "[2024-01-01 12:00:00.000] [INFO]  message"
// JSON: {"timestamp":"...","level":"info","source":"file:line","message":"..."}
enum class Format {
    TEXT,
    JSON
};

class Logger {
public:
    static void init(Level threshold, Format format = Format::TEXT);
    static void log(Level level, const char* file, int line, const std::string& message);
    static Level level();

private:
    static Level threshold_;
    static Format format_;
    static std::mutex mutex_;
};

// Helpers to convert config strings
Level string_to_level(const std::string& level_str);
Format string_to_format(const std::string& format_str);
const char* level_to_string(Level level);

} // namespace logging
} // namespace devauth

// Macro macros to handle string building
#define LOG_INTERNAL(lvl, msg) \
    do { \
        if ((lvl) >= devauth::logging::Logger::level()) { \
            std::stringstream ss; \
            ss << msg; \
            devauth::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(devauth::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(devauth::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(devauth::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(devauth::logging::Level::LVL_ERROR, msg)
