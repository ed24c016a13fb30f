#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>
#include <unistd.h>

namespace cloudless {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a textual log level ("debug", "info", "warn"/"warning", "error").
 * @param text Level name, case-insensitive
 * @param out_level Parsed level
 * @return true if the name was recognized
 */
bool parse_log_level(const std::string& text, LogLevel& out_level);

class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    /**
     * Mirror every log line into a file (appended). An empty path closes the file sink.
     * @param path File to append to
     * @return true if the sink is open (or was closed on request)
     */
    bool set_log_file(const std::string& path);

    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    static const char* get_level_string(LogLevel level);
    std::string get_color_code(LogLevel level) const;
    std::string get_module_color(const std::string& module) const;
    std::string get_reset_code() const;
    static uint32_t hash_string(const std::string& str);

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool is_terminal_;
    std::ofstream file_sink_;
};

} // namespace cloudless

#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        cloudless::Logger::getInstance().log(cloudless::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        cloudless::Logger::getInstance().log(cloudless::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        cloudless::Logger::getInstance().log(cloudless::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        cloudless::Logger::getInstance().log(cloudless::LogLevel::ERROR, module, oss.str()); \
    } while(0)
