#pragma once

#include "kaddht_export.h"
#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>
#include <functional>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#else
    #include <unistd.h>
#endif

namespace kaddht {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Receives formatted log lines instead of the console when installed
 */
using LogSink = std::function<void(LogLevel level, const std::string& module, const std::string& message)>;

/**
 * Parse a level name ("debug", "info", "warn", "error"), case-insensitive
 * @param name Level name
 * @param level Receives the parsed level
 * @return true if the name was recognised
 */
KADDHT_API bool parse_log_level(const std::string& name, LogLevel& level);

KADDHT_API const char* log_level_to_string(LogLevel level);

class KADDHT_API Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    // Pass an empty function to go back to console output
    void set_sink(LogSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    bool is_enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::string get_level_string(LogLevel level) const;
    std::string get_color_code(LogLevel level) const;
    std::string get_module_color(const std::string& module) const;
    std::string get_reset_code() const;
    static uint32_t hash_string(const std::string& str);

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    LogSink sink_;
};

} // namespace kaddht

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        if (kaddht::Logger::getInstance().is_enabled(kaddht::LogLevel::DEBUG)) { \
            std::ostringstream oss; \
            oss << message; \
            kaddht::Logger::getInstance().log(kaddht::LogLevel::DEBUG, module, oss.str()); \
        } \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        kaddht::Logger::getInstance().log(kaddht::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        kaddht::Logger::getInstance().log(kaddht::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        kaddht::Logger::getInstance().log(kaddht::LogLevel::ERROR, module, oss.str()); \
    } while(0)
