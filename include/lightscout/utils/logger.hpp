/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for LightScout.
 *
 * Zero external dependencies. Provides structured logging with
 * configurable levels, component tags, timestamps and a replaceable
 * output sink.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#include "lightscout/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace lightscout {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Convert LogLevel to its fixed-width display name.
 */
inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

/**
 * @brief Parse a level name ("TRACE" .. "FATAL", "OFF").
 * @return The level, or INFO if the name is not recognised.
 */
LIGHTSCOUT_UTILS_API LogLevel logLevelFromString(const std::string& name);

/**
 * @brief Receives every formatted log line that passes the level filter.
 * @param level Severity of the line.
 * @param component Component tag passed to the LOG_* macro.
 * @param line Fully formatted line (timestamp, level, component, message).
 */
using LogSink = std::function<void(LogLevel level,
                                   const std::string& component,
                                   const std::string& line)>;

/**
 * @class Logger
 * @brief Thread-safe singleton logger with configurable output.
 *
 * Lines go to stderr unless a sink is installed with setSink().
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Found bulb: {}", device.id);
 * LOG_ERROR("UdpSocket", "Bind failed: error {}", err);
 * @endcode
 */
class LIGHTSCOUT_UTILS_API Logger {
public:
    /**
     * @brief Get the singleton logger instance.
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Set the minimum log level. Messages below this are ignored.
     */
    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    /**
     * @brief Get the current log level.
     */
    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    /**
     * @brief Check if a level would be logged.
     */
    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable colored output (ANSI terminals).
     * Only applies to the default stderr output.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Route log lines to a custom sink instead of stderr.
     */
    void setSink(LogSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    /**
     * @brief Restore the default stderr output.
     */
    void resetSink() {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = nullptr;
    }

    /**
     * @brief Log a message with the given level and component.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        // Timestamp: [YYYY-MM-DD HH:MM:SS.mmm]
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif

        std::ostringstream prefix;
        prefix << "["
               << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
               << "." << std::setfill('0') << std::setw(3) << ms.count()
               << "] ";

        std::string body = std::string("[") + logLevelToString(level) + "] [" +
                           component + "] " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(level, component, prefix.str() + body);
            return;
        }

        if (colorEnabled_.load(std::memory_order_relaxed)) {
            std::cerr << prefix.str() << getColorCode(level) << body.substr(0, 7)
                      << "\033[0m" << body.substr(7) << std::endl;
        } else {
            std::cerr << prefix.str() << body << std::endl;
        }
    }

private:
    Logger() : level_(static_cast<int>(LogLevel::INFO)), colorEnabled_(true) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    const char* getColorCode(LogLevel level) const {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";    // Gray
            case LogLevel::DEBUG: return "\033[36m";    // Cyan
            case LogLevel::INFO:  return "\033[32m";    // Green
            case LogLevel::WARN:  return "\033[33m";    // Yellow
            case LogLevel::ERROR: return "\033[31m";    // Red
            case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
            default:              return "";
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    LogSink sink_;
};

}  // namespace utils
}  // namespace lightscout

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::lightscout::utils::Logger::instance().log(::lightscout::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::lightscout::utils::Logger::instance().log(::lightscout::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::lightscout::utils::Logger::instance().log(::lightscout::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::lightscout::utils::Logger::instance().log(::lightscout::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::lightscout::utils::Logger::instance().log(::lightscout::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::lightscout::utils::Logger::instance().log(::lightscout::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Conditional logging (avoid evaluation if level disabled)
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::lightscout::utils::Logger::instance().isEnabled(level)) { \
            ::lightscout::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
