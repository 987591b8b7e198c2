#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace daemon_runner {
namespace logging {

namespace {
// Threshold is read on every LOG_* call from reader threads without taking the mutex
std::atomic<int> g_threshold{static_cast<int>(Level::LVL_INFO)};
}  // namespace

std::ostream* Logger::out_ = nullptr;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) {
    set_level(threshold);
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    g_threshold.store(static_cast<int>(level));
}

Level Logger::level() {
    return static_cast<Level>(g_threshold.load());
}

bool Logger::enabled(Level level) {
    return static_cast<int>(level) >= g_threshold.load() && level != Level::LVL_NONE;
}

void Logger::set_output(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    (void)file;
    (void)line;
    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = out_ != nullptr ? *out_ : std::cerr;

    // Timestamp
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    // Level
    switch (level) {
        case Level::LVL_TRACE: out << " [TRACE] "; break;
        case Level::LVL_DEBUG: out << " [DEBUG] "; break;
        case Level::LVL_INFO:  out << " [INFO]  "; break;
        case Level::LVL_WARN:  out << " [WARN]  "; break;
        case Level::LVL_ERROR: out << " [ERROR] "; break;
        default: break;
    }

    out << message << "\n";

    if (level >= Level::LVL_WARN) {
        out << std::flush;
    }
}

Level string_to_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "TRACE") return Level::LVL_TRACE;
    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;

    return Level::LVL_INFO; // Default
}

bool is_valid_level(const std::string& level_str) {
    return level_str == "trace" || level_str == "debug" || level_str == "info" || level_str == "warn" ||
           level_str == "error";
}

} // namespace logging
} // namespace daemon_runner
