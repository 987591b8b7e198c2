#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace daemon_runner {
namespace logging {

enum class Level {
    LVL_TRACE,
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);

    // Redirect output (nullptr restores std::cerr). Used by tests to capture log lines.
    static void set_output(std::ostream* out);

private:
    static std::ostream* out_;
    static std::mutex mutex_;
};

// Parse a config level string ("trace", "debug", "info", "warn", "error").
// Unknown strings map to INFO.
Level string_to_level(const std::string& level_str);

// Returns true if level_str names a known level
bool is_valid_level(const std::string& level_str);

} // namespace logging
} // namespace daemon_runner

// The message expression is only evaluated when the level is enabled, so
// trace logging of every daemon line costs nothing at the default level.
#define LOG_INTERNAL(level, msg) \
    do { \
        if (daemon_runner::logging::Logger::enabled(level)) { \
            std::stringstream ss; \
            ss << msg; \
            daemon_runner::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        } \
    } while(0)

#define LOG_TRACE(msg) LOG_INTERNAL(daemon_runner::logging::Level::LVL_TRACE, msg)
#define LOG_DEBUG(msg) LOG_INTERNAL(daemon_runner::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(daemon_runner::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(daemon_runner::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(daemon_runner::logging::Level::LVL_ERROR, msg)
