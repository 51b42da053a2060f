#pragma once
#include <string>

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3,
};

LogLevel parse_log_level(const std::string& name);
void set_log_level(LogLevel level);
LogLevel log_level();

// Writes "[tag] message". Warnings and errors go to stderr.
void log_message(LogLevel level, const std::string& tag, const std::string& message);

inline void log_debug(const std::string& tag, const std::string& message) { log_message(LogLevel::debug, tag, message); }
inline void log_info(const std::string& tag, const std::string& message) { log_message(LogLevel::info, tag, message); }
inline void log_warn(const std::string& tag, const std::string& message) { log_message(LogLevel::warn, tag, message); }
inline void log_error(const std::string& tag, const std::string& message) { log_message(LogLevel::error, tag, message); }
