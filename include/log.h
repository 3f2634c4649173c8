/**
 * @file log.h
 * @brief VeeBridge logging - Tagged printf-style log lines
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Protocol modules never touch the serial port directly. They format lines
 * with logPrintf() and the application installs a sink (Serial on target).
 * Without a sink, log output is discarded.
 *
 * Usage:
 *   setLogSink([](const char* line) { Serial.print(line); });
 *   logPrintf("[CONN] %s -> %s\n", "IDLE", "SCANNING");
 */

#ifndef LOG_H
#define LOG_H

#include <stdint.h>
#include <stdarg.h>

/**
 * @brief Receives one fully formatted log chunk
 */
typedef void (*LogSink)(const char* text);

/**
 * @brief Install (or clear with nullptr) the log sink
 */
void setLogSink(LogSink sink);

/**
 * @brief Get the currently installed sink
 */
LogSink getLogSink();

/**
 * @brief Format and emit a log line
 *
 * Output longer than LOG_LINE_SIZE is truncated.
 */
void logPrintf(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

/**
 * @brief Emit a constant string without formatting
 */
void logPrint(const char* text);

#endif // LOG_H
