#pragma once

enum LogLevel {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARN,
    LOG_ERROR
};

typedef void (*LogSink)(LogLevel level, const char* line);

// Lines are dropped until a sink is installed.
void setLogSink(LogSink sink);
const char* logLevelName(LogLevel level);

void logMessage(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void logDebug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void logInfo(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void logWarn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void logError(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
