#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

static std::mutex g_log_mtx;

static std::atomic<int>& level_slot() {
    static std::atomic<int> level{static_cast<int>(parse_log_level(getenv_or("DOCQA_LOG_LEVEL", "info")))};
    return level;
}

LogLevel parse_log_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (n == "debug") return LogLevel::debug;
    if (n == "warn" || n == "warning") return LogLevel::warn;
    if (n == "error") return LogLevel::error;
    return LogLevel::info;
}

void set_log_level(LogLevel level) {
    level_slot().store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_slot().load());
}

void log_message(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < level_slot().load()) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    switch (level) {
    case LogLevel::debug:
        std::cout << "[" << tag << "] DEBUG: " << message << std::endl;
        break;
    case LogLevel::info:
        std::cout << "[" << tag << "] " << message << std::endl;
        break;
    case LogLevel::warn:
        std::cerr << "[" << tag << "] WARN: " << message << std::endl;
        break;
    case LogLevel::error:
        std::cerr << "[" << tag << "] ERROR: " << message << std::endl;
        break;
    }
}
