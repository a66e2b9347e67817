#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

namespace devauth {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
Format Logger::format_ = Format::TEXT;
std::mutex Logger::mutex_;

namespace {

// Strip directories so JSON "source" stays short
const char* base_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
#ifdef _WIN32
    const char* backslash = std::strrchr(path, '\\');
    if (backslash != nullptr && (slash == nullptr || backslash > slash)) {
        slash = backslash;
    }
#endif
    return slash != nullptr ? slash + 1 : path;
}

}  // namespace

void Logger::init(Level threshold, Format format) {
    threshold_ = threshold;
    format_ = format;
}

Level Logger::level() {
    return threshold_;
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    if (level < threshold_ || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif

    std::ostringstream ts;
    ts << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    ts << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    std::lock_guard<std::mutex> lock(mutex_);

    if (format_ == Format::JSON) {
        nlohmann::json entry = {
            {"timestamp", ts.str()},
            {"level", level_to_string(level)},
            {"source", std::string(base_name(file)) + ":" + std::to_string(line)},
            {"message", message}};
        // Replace invalid UTF-8 rather than throwing from inside the logger
        std::cerr << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    } else {
        std::cerr << "[" << ts.str() << "]";

        switch (level) {
            case Level::LVL_DEBUG: std::cerr << " [DEBUG] "; break;
            case Level::LVL_INFO:  std::cerr << " [INFO]  "; break;
            case Level::LVL_WARN:  std::cerr << " [WARN]  "; break;
            case Level::LVL_ERROR: std::cerr << " [ERROR] "; break;
            default: break;
        }

        std::cerr << message << "\n";
    }

    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;

    return Level::LVL_INFO; // Default
}

Format string_to_format(const std::string& format_str) {
    std::string s = format_str;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s == "json" ? Format::JSON : Format::TEXT;
}

const char* level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "debug";
        case Level::LVL_INFO:  return "info";
        case Level::LVL_WARN:  return "warn";
        case Level::LVL_ERROR: return "error";
        default: return "none";
    }
}

} // namespace logging
} // namespace devauth
