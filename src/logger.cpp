#include "airline/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace airline {

bool try_parse_log_level(const std::string& text, LogLevel& out) {
    if (text == "debug") out = LogLevel::Debug;
    else if (text == "info") out = LogLevel::Info;
    else if (text == "warn") out = LogLevel::Warn;
    else if (text == "error") out = LogLevel::Error;
    else if (text == "off") out = LogLevel::Off;
    else return false;
    return true;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "OFF";
}

Logger::Logger(const std::string& filename, LogLevel min_level) : min_level_(min_level) {
    if (!filename.empty()) {
        out_.open(filename, std::ios::app);
        to_file_ = static_cast<bool>(out_);
        if (!to_file_) {
            std::cerr << "Cannot open log file " << filename << ", logging to stderr\n";
        }
    }
}

void Logger::log(LogLevel level, const std::string& component, const std::string& msg) {
    if (!enabled(level)) return;

    auto now = std::chrono::system_clock::now();
    auto tt = std::chrono::system_clock::to_time_t(now);
    std::tm tmv{};
    localtime_r(&tt, &tmv);

    std::lock_guard<std::mutex> lock(mtx_);
    std::ostream& os = to_file_ ? static_cast<std::ostream&>(out_) : std::clog;
    os << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S")
       << " [" << to_string(level) << "] [" << component << "] " << msg << "\n";
    os.flush();
}

} // namespace airline
