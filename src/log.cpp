/**
 * @file log.cpp
 * @brief VeeBridge logging - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "log.h"
#include "config.h"
#include <stdio.h>

static LogSink g_logSink = nullptr;

void setLogSink(LogSink sink) {
    g_logSink = sink;
}

LogSink getLogSink() {
    return g_logSink;
}

void logPrintf(const char* fmt, ...) {
    if (!g_logSink || !fmt) {
        return;
    }

    char line[LOG_LINE_SIZE];
    va_list args;
    va_start(args, fmt);
    vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    g_logSink(line);
}

void logPrint(const char* text) {
    if (g_logSink && text) {
        g_logSink(text);
    }
}
