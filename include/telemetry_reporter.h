/**
 * @file telemetry_reporter.h
 * @brief VeeBridge telemetry reporter - Bridge events as console lines
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Asynchronous lines, one per event, newline terminated (no EOT):
 *   STATE:<to>:<trigger>[:<reason>]
 *   LINK_LOST
 *   SAMPLE:<ticks>:<pos>:<vel>:<kg>:<W>:<status hex>
 *   DELOAD:<ticks>   DELOAD_WARN:<ticks>
 *   REP:<up>:<down>:<warmup>:<working>
 *   DIAG:<uptime>:<fault0..3>[:FAULT]
 *   HEUR:<con kg avg>:<con kg max>:<ecc kg avg>:<ecc kg max>
 *   FWVER:<hex>   MODE:<n>   UPDATE:<n>   UART:<len>
 *   DECODE_ERR:<characteristic>:<status>
 *
 * SAMPLE lines are rate limited to one per TELEMETRY_REPORT_INTERVAL_MS
 * unless verbose mode is on. Samples with a cable outside the travel range
 * are counted and never printed. Status flags are checked on every sample
 * before the rate limit: DELOAD is debounced to DELOAD_REPORT_DEBOUNCE_MS,
 * DELOAD_WARN is printed when the flag rises.
 */

#ifndef TELEMETRY_REPORTER_H
#define TELEMETRY_REPORTER_H

#include <stdint.h>
#include "config.h"
#include "event_broadcaster.h"

typedef void (*ReportLineCallback)(const char* line);

class TelemetryReporter {
public:
    TelemetryReporter();

    /**
     * @brief Subscribe to every event type
     * @return false if the broadcaster has no free slot
     */
    bool begin(EventBroadcaster* events, ReportLineCallback output);

    void setVerbose(bool verbose) { _verbose = verbose; }
    bool isVerbose() const { return _verbose; }

    uint32_t getSuppressedSamples() const { return _suppressedSamples; }
    uint32_t getInvalidSamples() const { return _invalidSamples; }

    /**
     * @brief Format one event into `line`
     * @return false if the event produces no line
     */
    static bool formatEvent(const BridgeEvent& event, char* line, size_t size);

private:
    ReportLineCallback _output;
    bool _verbose;
    bool _haveSample;
    uint32_t _lastSampleAt;
    uint32_t _suppressedSamples;
    uint32_t _invalidSamples;

    // Status flag tracking
    bool _haveDeload;
    uint32_t _lastDeloadAt;
    bool _deloadWarnActive;
    bool _spotterActive;

    static void handleEvent(const BridgeEvent& event, void* context);
    void report(const BridgeEvent& event);
    void reportStatusFlags(const TelemetrySample& sample, uint32_t now);
    void emit(const char* line);
};

#endif // TELEMETRY_REPORTER_H
