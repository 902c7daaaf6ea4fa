/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "logger.h"
#include "sys_clock.h"

#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <time.h>

LogLevel Logger::level_ = LogLevel::INFO;
uint32_t Logger::warningCount_ = 0;

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

LogLevel Logger::getLevel() {
    return level_;
}

bool Logger::parseLevel(const char* name, LogLevel& level) {
    if (strcasecmp(name, "error") == 0) {
        level = LogLevel::ERROR;
    } else if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) {
        level = LogLevel::WARN;
    } else if (strcasecmp(name, "info") == 0) {
        level = LogLevel::INFO;
    } else if (strcasecmp(name, "debug") == 0) {
        level = LogLevel::DEBUG;
    } else {
        return false;
    }
    return true;
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "E";
        case LogLevel::WARN:  return "W";
        case LogLevel::INFO:  return "I";
        case LogLevel::DEBUG: return "D";
        default: return "?";
    }
}

void Logger::logFormatted(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (level <= LogLevel::WARN) {
        warningCount_++;
    }
    if (static_cast<int>(level_) < static_cast<int>(level)) {
        return;
    }

    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        strcpy(buffer, "formatting error");
    }
    buffer[sizeof(buffer) - 1] = '\0';

    uint64_t nowMs = epochMillis();
    time_t seconds = (time_t)(nowMs / 1000);
    struct tm tmUtc;
    gmtime_r(&seconds, &tmUtc);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tmUtc);

    fprintf(stderr, "%s.%03uZ %s [%s] %s\n", stamp, (unsigned)(nowMs % 1000),
            levelToString(level), tag, buffer);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
