#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace tether {
namespace logging {

std::atomic<Level> Logger::threshold_{Level::LVL_INFO};
Logger::Sink Logger::sink_;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) { set_level(threshold); }

void Logger::set_level(Level level) { threshold_.store(level); }

Level Logger::level() { return threshold_.load(); }

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    (void)file;
    (void)line;
    if (level < Logger::level() || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream formatted;

    // Timestamp
    formatted << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    formatted << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    // Level
    switch (level) {
        case Level::LVL_DEBUG:
            formatted << " [DEBUG] ";
            break;
        case Level::LVL_INFO:
            formatted << " [INFO]  ";
            break;
        case Level::LVL_WARN:
            formatted << " [WARN]  ";
            break;
        case Level::LVL_ERROR:
            formatted << " [ERROR] ";
            break;
        default:
            break;
    }

    formatted << message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, formatted.str());
        return;
    }

    std::cerr << formatted.str() << "\n";

    // Flush on error
    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;  // Default
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "debug";
        case Level::LVL_INFO:
            return "info";
        case Level::LVL_WARN:
            return "warn";
        case Level::LVL_ERROR:
            return "error";
        case Level::LVL_NONE:
            return "none";
    }
    return "info";
}

}  // namespace logging
}  // namespace tether
