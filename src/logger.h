/**
 * @file logger.h
 * @brief Tagged, levelled logging to stderr for the monitor daemons
 */

#ifndef LOGGER_H
#define LOGGER_H

#include <stdarg.h>
#include <stdint.h>

// Fixed-size formatting buffer, messages are truncated beyond this
#ifndef LOGGER_MAX_MESSAGE_LEN
#define LOGGER_MAX_MESSAGE_LEN 256
#endif

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN,
    INFO,
    DEBUG
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Parses "error", "warn", "info" or "debug"; returns false if unknown
    static bool parseLevel(const char* name, LogLevel& level);
    static const char* levelToString(LogLevel level);

    static void error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    static void warn(const char* tag, const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
    static void info(const char* tag, const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
    static void debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    // Number of messages at or above WARN since start (used by tests)
    static uint32_t getWarningCount() { return warningCount_; }

private:
    static void logFormatted(LogLevel level, const char* tag, const char* fmt, va_list args);

    static LogLevel level_;
    static uint32_t warningCount_;
};

#define LOG_ERROR(TAG, FMT, ...) Logger::error((TAG), (FMT), ##__VA_ARGS__)
#define LOG_WARN(TAG, FMT, ...)  Logger::warn((TAG),  (FMT), ##__VA_ARGS__)
#define LOG_INFO(TAG, FMT, ...)  Logger::info((TAG),  (FMT), ##__VA_ARGS__)
#define LOG_DEBUG(TAG, FMT, ...) Logger::debug((TAG), (FMT), ##__VA_ARGS__)

#endif // LOGGER_H
