/**
 * @file telemetry_reporter.cpp
 * @brief VeeBridge telemetry reporter - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "telemetry_reporter.h"
#include "log.h"
#include <stdio.h>

TelemetryReporter::TelemetryReporter() :
    _output(nullptr),
    _verbose(false),
    _haveSample(false),
    _lastSampleAt(0),
    _suppressedSamples(0),
    _invalidSamples(0),
    _haveDeload(false),
    _lastDeloadAt(0),
    _deloadWarnActive(false),
    _spotterActive(false)
{
}

bool TelemetryReporter::begin(EventBroadcaster* events, ReportLineCallback output) {
    _output = output;
    if (!events) {
        return false;
    }
    return events->subscribe(handleEvent, this, EVENT_MASK_ALL) != EventBroadcaster::INVALID_SUBSCRIBER;
}

void TelemetryReporter::handleEvent(const BridgeEvent& event, void* context) {
    static_cast<TelemetryReporter*>(context)->report(event);
}

void TelemetryReporter::report(const BridgeEvent& event) {
    if (event.type == BridgeEventType::TELEMETRY && event.telemetry.type == TelemetryType::SAMPLE) {
        const TelemetrySample& sample = event.telemetry.sample;
        reportStatusFlags(sample, event.timestampMs);

        if (!sample.isPositionValid()) {
            _invalidSamples++;
            DEBUG_PRINTF("[TELEM] Sample %lu skipped: position out of range (%.1f, %.1f)\n",
                         (unsigned long)sample.ticks,
                         sample.cables[0].positionMm, sample.cables[1].positionMm);
            return;
        }

        if (!_verbose) {
            if (_haveSample && (event.timestampMs - _lastSampleAt) < TELEMETRY_REPORT_INTERVAL_MS) {
                _suppressedSamples++;
                return;
            }
            _haveSample = true;
            _lastSampleAt = event.timestampMs;
        }
    }

    char line[128];
    if (formatEvent(event, line, sizeof(line))) {
        emit(line);
    }
}

void TelemetryReporter::reportStatusFlags(const TelemetrySample& sample, uint32_t now) {
    char line[32];

    if (sample.isDeloadOccurred()) {
        if (!_haveDeload || (now - _lastDeloadAt) >= DELOAD_REPORT_DEBOUNCE_MS) {
            _haveDeload = true;
            _lastDeloadAt = now;
            logPrintf("[TELEM] Deload occurred (status=0x%04X)\n", sample.status);
            snprintf(line, sizeof(line), "DELOAD:%lu\n", (unsigned long)sample.ticks);
            emit(line);
        }
    }

    bool warn = sample.isDeloadWarning();
    if (warn && !_deloadWarnActive) {
        logPrintf("[TELEM] Deload warning (status=0x%04X)\n", sample.status);
        snprintf(line, sizeof(line), "DELOAD_WARN:%lu\n", (unsigned long)sample.ticks);
        emit(line);
    }
    _deloadWarnActive = warn;

    bool spotter = sample.isSpotterActive();
    if (spotter != _spotterActive) {
        DEBUG_PRINTF("[TELEM] Spotter %s\n", spotter ? "active" : "released");
    }
    _spotterActive = spotter;
}

void TelemetryReporter::emit(const char* line) {
    if (_output) {
        _output(line);
    }
}

// =============================================================================
// FORMATTING
// =============================================================================

static int formatTelemetry(const TelemetryEvent& telemetry, char* line, size_t size) {
    switch (telemetry.type) {
        case TelemetryType::SAMPLE: {
            const TelemetrySample& s = telemetry.sample;
            return snprintf(line, size, "SAMPLE:%lu:%.1f:%.1f:%.2f:%.2f:%04X\n",
                            (unsigned long)s.ticks, s.positionMm, s.velocityMmS,
                            s.loadKg, s.powerW, s.status);
        }

        case TelemetryType::REP: {
            const RepEvent& r = telemetry.rep;
            return snprintf(line, size, "REP:%ld:%ld:%u:%u\n",
                            (long)r.upCounter, (long)r.downCounter, r.warmupReps, r.workingReps);
        }

        case TelemetryType::DIAGNOSTIC: {
            const DiagnosticReport& d = telemetry.diagnostic;
            return snprintf(line, size, "DIAG:%lu:%d:%d:%d:%d%s\n",
                            (unsigned long)d.uptimeSec, d.faults[0], d.faults[1], d.faults[2], d.faults[3],
                            d.hasFaults() ? ":FAULT" : "");
        }

        case TelemetryType::HEURISTIC: {
            const HeuristicReport& h = telemetry.heuristic;
            return snprintf(line, size, "HEUR:%.2f:%.2f:%.2f:%.2f\n",
                            h.concentric.kgAvg, h.concentric.kgMax, h.eccentric.kgAvg, h.eccentric.kgMax);
        }

        case TelemetryType::VERSION: {
            int n = snprintf(line, size, "FWVER:");
            for (uint8_t i = 0; i < telemetry.version.length && n + 3 < (int)size; i++) {
                n += snprintf(line + n, size - n, "%02X", telemetry.version.bytes[i]);
            }
            n += snprintf(line + n, size - n, "\n");
            return n;
        }

        case TelemetryType::MODE:
            return snprintf(line, size, "MODE:%lu\n", (unsigned long)telemetry.mode.mode);

        case TelemetryType::UPDATE_STATE:
            return snprintf(line, size, "UPDATE:%u\n", telemetry.updateState);

        case TelemetryType::UART_DATA:
            return snprintf(line, size, "UART:%u\n", telemetry.uartLength);

        default:
            return 0;
    }
}

bool TelemetryReporter::formatEvent(const BridgeEvent& event, char* line, size_t size) {
    if (!line || size == 0) {
        return false;
    }

    int n = 0;
    switch (event.type) {
        case BridgeEventType::STATE_CHANGED:
            if (event.transition.reason != FailureReason::NONE) {
                n = snprintf(line, size, "STATE:%s:%s:%s\n",
                             connectionStateToString(event.transition.toState),
                             connectionTriggerToString(event.transition.trigger),
                             failureReasonToString(event.transition.reason));
            } else {
                n = snprintf(line, size, "STATE:%s:%s\n",
                             connectionStateToString(event.transition.toState),
                             connectionTriggerToString(event.transition.trigger));
            }
            break;

        case BridgeEventType::LINK_LOST:
            n = snprintf(line, size, "LINK_LOST\n");
            break;

        case BridgeEventType::TELEMETRY:
            n = formatTelemetry(event.telemetry, line, size);
            break;

        case BridgeEventType::DECODE_ERROR:
            n = snprintf(line, size, "DECODE_ERR:%s:%s\n",
                         characteristicToString(event.source),
                         decodeStatusToString(event.decodeStatus));
            break;

        default:
            break;
    }
    return n > 0;
}
