#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace tether {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

// Process-wide logger. Writes timestamped lines to stderr; stdout stays free for
// CLI results and never touches a child process's streams.
class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();

    // Cheap pre-check used by the LOG_* macros to skip message formatting
    static bool is_enabled(Level level) { return level >= threshold_.load(std::memory_order_relaxed); }

    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Config string -> Level ("debug", "info", "warn", "error", "none"); unknown maps to INFO
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace tether

#define TETHER_LOG_INTERNAL(level, msg)                                             \
    do {                                                                            \
        if (tether::logging::Logger::is_enabled(level)) {                           \
            std::ostringstream tether_log_ss_;                                      \
            tether_log_ss_ << msg;                                                  \
            tether::logging::Logger::log(level, __FILE__, __LINE__, tether_log_ss_.str()); \
        }                                                                           \
    } while (0)

#define LOG_DEBUG(msg) TETHER_LOG_INTERNAL(tether::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) TETHER_LOG_INTERNAL(tether::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) TETHER_LOG_INTERNAL(tether::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) TETHER_LOG_INTERNAL(tether::logging::Level::LVL_ERROR, msg)
