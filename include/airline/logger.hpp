#pragma once

#include <fstream>
#include <mutex>
#include <string>

/**
 * @file logger.hpp
 * @brief Leveled, thread-safe line logger shared by all engine components.
 */

namespace airline {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/** @brief Parses "debug", "info", "warn", "error" or "off". */
bool try_parse_log_level(const std::string& text, LogLevel& out);

/** @brief Upper-case level name used in log lines. */
const char* to_string(LogLevel level);

/**
 * @brief Writes "YYYY-MM-DD HH:MM:SS [LEVEL] [component] message" lines.
 *
 * @details
 * Lines go to the file given at construction, or to std::clog when the
 * file name is empty. A single mutex serializes writers so lines from
 * concurrent bookings never interleave.
 */
class Logger {
public:
    explicit Logger(const std::string& filename = "", LogLevel min_level = LogLevel::Info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& component, const std::string& msg);

    void debug(const std::string& component, const std::string& msg) { log(LogLevel::Debug, component, msg); }
    void info(const std::string& component, const std::string& msg) { log(LogLevel::Info, component, msg); }
    void warn(const std::string& component, const std::string& msg) { log(LogLevel::Warn, component, msg); }
    void error(const std::string& component, const std::string& msg) { log(LogLevel::Error, component, msg); }

    bool enabled(LogLevel level) const { return level >= min_level_ && level != LogLevel::Off; }

private:
    std::ofstream out_;
    bool to_file_ = false;
    LogLevel min_level_;
    std::mutex mtx_;
};

} // namespace airline
