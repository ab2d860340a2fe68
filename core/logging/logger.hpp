#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace tether {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    // Receives every line that passes the threshold, already formatted
    using Sink = std::function<void(Level level, const std::string &line)>;

    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Replaces stderr output. Pass an empty function to restore stderr.
    static void set_sink(Sink sink);

private:
    static std::atomic<Level> threshold_;
    static Sink sink_;
    static std::mutex mutex_;
};

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace tether

// The message expression is only evaluated when lvl_ passes the threshold
#define LOG_INTERNAL(lvl_, msg)                                                 \
    do {                                                                        \
        if ((lvl_) >= tether::logging::Logger::level()) {                       \
            std::stringstream log_stream_;                                      \
            log_stream_ << msg;                                                 \
            tether::logging::Logger::log(lvl_, __FILE__, __LINE__, log_stream_.str()); \
        }                                                                       \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(tether::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(tether::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(tether::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(tether::logging::Level::LVL_ERROR, msg)
