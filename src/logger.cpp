#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace tproxy {

namespace {

std::atomic<LogLevel> current_log_level{LogLevel::Info};
std::mutex output_mutex;

} // namespace

void Logger::setLevel(LogLevel level) {
    LogLevel old_level = current_log_level.exchange(level);
    log(LogLevel::Info, "Logger",
        "Log level changed from " + levelToString(old_level) + " to " + levelToString(level));
}

LogLevel Logger::getLevel() {
    return current_log_level.load();
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level == LogLevel::None || level > current_log_level.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_time{};
    localtime_r(&time_t, &local_time);

    std::ostringstream timestamp;
    timestamp << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
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

    std::lock_guard<std::mutex> lock(output_mutex);
    *output_stream << "[" << timestamp.str() << "] [" << level_str << "] " << component << ": "
                   << message << std::endl;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::None:
            return "NONE";
        default:
            return "UNKNOWN";
    }
}

} // namespace tproxy
