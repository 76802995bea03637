#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

namespace ufwctl {

LogLevel Logger::current_level_ = LogLevel::Warning;

void Logger::setLevel(LogLevel level) {
    LogLevel old_level = current_level_;
    current_level_ = level;

    log(LogLevel::Debug, "Logger",
        "Log level changed from " + levelToString(old_level) + " to " + levelToString(level));
}

LogLevel Logger::getLevel() {
    return current_level_;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level == LogLevel::None || level > current_level_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream timestamp;
    timestamp << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    timestamp << '.' << std::setfill('0') << std::setw(3) << ms.count();

    std::string level_str;
    std::ostream* output_stream = &std::cout;

    switch (level) {
        case LogLevel::Error:
            level_str = "ERROR";
            output_stream = &std::cerr;
            break;
        case LogLevel::Warning:
            level_str = "WARN ";
            output_stream = &std::cerr;
            break;
        case LogLevel::Info:
            level_str = "INFO ";
            break;
        case LogLevel::Debug:
            level_str = "DEBUG";
            break;
        case LogLevel::None:
            return;
    }

    *output_stream << "[" << timestamp.str() << "] [" << level_str << "] " << component << ": "
                   << message << std::endl;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "error";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Info:
            return "info";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::None:
            return "none";
        default:
            return "unknown";
    }
}

LogLevel Logger::levelFromString(const std::string& name) {
    if (name == "none") return LogLevel::None;
    if (name == "error") return LogLevel::Error;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace ufwctl
