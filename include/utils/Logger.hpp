#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace verhoeff {
namespace utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

/**
 * @brief Parse a level name ("trace" .. "fatal", case-insensitive)
 * @return nullopt if the name is not a known level
 */
inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

/**
 * @brief Process-wide logger writing to std::clog
 *
 * The level check is lock-free so that callers on the checksum path do not
 * contend with each other; only emitting a line takes the mutex.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        current_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return current_level_.load(std::memory_order_relaxed);
    }

    bool isEnabled(LogLevel level) const {
        return level >= getLevel();
    }

    template<typename... Args>
    void log(LogLevel level, const Args&... args) {
        if (!isEnabled(level)) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] [" << levelToString(level) << "] ";

        ((oss << args), ...);
        oss << '\n';

        std::clog << oss.str() << std::flush;
    }

    template<typename... Args>
    void trace(const Args&... args) { log(LogLevel::TRACE, args...); }

    template<typename... Args>
    void debug(const Args&... args) { log(LogLevel::DEBUG, args...); }

    template<typename... Args>
    void info(const Args&... args) { log(LogLevel::INFO, args...); }

    template<typename... Args>
    void warn(const Args&... args) { log(LogLevel::WARN, args...); }

    template<typename... Args>
    void error(const Args&... args) { log(LogLevel::ERROR, args...); }

    template<typename... Args>
    void fatal(const Args&... args) { log(LogLevel::FATAL, args...); }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

private:
    Logger() : current_level_(LogLevel::INFO) {}

    std::atomic<LogLevel> current_level_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(...) verhoeff::utils::Logger::getInstance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) verhoeff::utils::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...)  verhoeff::utils::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...)  verhoeff::utils::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) verhoeff::utils::Logger::getInstance().error(__VA_ARGS__)
#define LOG_FATAL(...) verhoeff::utils::Logger::getInstance().fatal(__VA_ARGS__)

} // namespace utils
} // namespace verhoeff
