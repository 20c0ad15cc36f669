#include "logging.h"

#include <stdarg.h>
#include <stdio.h>

static const int LOG_LINE_SIZE = 256;
static LogSink activeSink = nullptr;

static void emit(LogLevel level, const char* fmt, va_list args) {
    LogSink sink = activeSink;
    if (sink == nullptr) return;

    char line[LOG_LINE_SIZE];
    int prefix = snprintf(line, sizeof(line), "%-5s ", logLevelName(level));
    if (prefix < 0) prefix = 0;
    vsnprintf(line + prefix, sizeof(line) - prefix, fmt, args);
    sink(level, line);
}

void setLogSink(LogSink sink) {
    activeSink = sink;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO:  return "INFO";
        case LOG_WARN:  return "WARN";
        case LOG_ERROR: return "ERROR";
    }
    return "?";
}

void logMessage(LogLevel level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(level, fmt, args);
    va_end(args);
}

void logDebug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LOG_DEBUG, fmt, args);
    va_end(args);
}

void logInfo(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LOG_INFO, fmt, args);
    va_end(args);
}

void logWarn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LOG_WARN, fmt, args);
    va_end(args);
}

void logError(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LOG_ERROR, fmt, args);
    va_end(args);
}
