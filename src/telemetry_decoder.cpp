/**
 * @file telemetry_decoder.cpp
 * @brief VeeBridge telemetry decoder - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "telemetry_decoder.h"
#include "config.h"
#include "log.h"
#include <string.h>
#include <math.h>

// =============================================================================
// PAYLOAD HELPERS
// =============================================================================

bool TelemetrySample::isPositionValid() const {
    for (int i = 0; i < 2; i++) {
        if (cables[i].positionMm < POSITION_MIN_MM || cables[i].positionMm > POSITION_MAX_MM) {
            return false;
        }
    }
    return true;
}

bool DiagnosticReport::hasFaults() const {
    for (int i = 0; i < DIAGNOSTIC_FAULT_COUNT; i++) {
        if (faults[i] != 0) return true;
    }
    return false;
}

// =============================================================================
// LITTLE-ENDIAN READERS
// =============================================================================

uint16_t TelemetryDecoder::getU16(const uint8_t* buf, size_t offset) {
    return static_cast<uint16_t>(buf[offset] | (buf[offset + 1] << 8));
}

int16_t TelemetryDecoder::getI16(const uint8_t* buf, size_t offset) {
    return static_cast<int16_t>(getU16(buf, offset));
}

uint32_t TelemetryDecoder::getU32(const uint8_t* buf, size_t offset) {
    return static_cast<uint32_t>(buf[offset]) |
           (static_cast<uint32_t>(buf[offset + 1]) << 8) |
           (static_cast<uint32_t>(buf[offset + 2]) << 16) |
           (static_cast<uint32_t>(buf[offset + 3]) << 24);
}

int32_t TelemetryDecoder::getI32(const uint8_t* buf, size_t offset) {
    return static_cast<int32_t>(getU32(buf, offset));
}

float TelemetryDecoder::getFloat(const uint8_t* buf, size_t offset) {
    uint32_t bits = getU32(buf, offset);
    float value;
    memcpy(&value, &bits, sizeof(value));
    return value;
}

// =============================================================================
// DISPATCH
// =============================================================================

size_t TelemetryDecoder::expectedLength(Characteristic source) {
    switch (source) {
        case Characteristic::SAMPLE: return SAMPLE_FRAME_SIZE;
        case Characteristic::REPS: return REPS_FRAME_SIZE;
        case Characteristic::DIAGNOSTIC: return DIAGNOSTIC_FRAME_SIZE;
        case Characteristic::HEURISTIC: return HEURISTIC_FRAME_SIZE;
        case Characteristic::MODE: return MODE_FRAME_SIZE;
        case Characteristic::VERSION:
        case Characteristic::UPDATE_STATE:
        case Characteristic::NUS_TX:
            return 1;
        default:
            return 0;
    }
}

DecodeStatus TelemetryDecoder::decode(Characteristic source, const uint8_t* data, size_t length,
                                      TelemetryEvent& out) {
    out.type = TelemetryType::NONE;

    if (!data) {
        return DecodeStatus::NULL_DATA;
    }

    DecodeStatus status = DecodeStatus::OK;

    switch (source) {
        case Characteristic::SAMPLE:
            status = decodeSample(data, length, out.sample);
            if (status == DecodeStatus::OK) out.type = TelemetryType::SAMPLE;
            break;

        case Characteristic::REPS:
            status = decodeRep(data, length, out.rep);
            if (status == DecodeStatus::OK) out.type = TelemetryType::REP;
            break;

        case Characteristic::DIAGNOSTIC:
            status = decodeDiagnostic(data, length, out.diagnostic);
            if (status == DecodeStatus::OK) out.type = TelemetryType::DIAGNOSTIC;
            break;

        case Characteristic::HEURISTIC:
            status = decodeHeuristic(data, length, out.heuristic);
            if (status == DecodeStatus::OK) out.type = TelemetryType::HEURISTIC;
            break;

        case Characteristic::MODE:
            if (length < MODE_FRAME_SIZE) {
                status = DecodeStatus::UNEXPECTED_LENGTH;
                break;
            }
            out.mode.mode = getU32(data, 0);
            out.type = TelemetryType::MODE;
            break;

        case Characteristic::VERSION: {
            if (length == 0) {
                status = DecodeStatus::UNEXPECTED_LENGTH;
                break;
            }
            size_t n = length < VERSION_MAX_LEN ? length : VERSION_MAX_LEN;
            memset(out.version.bytes, 0, sizeof(out.version.bytes));
            memcpy(out.version.bytes, data, n);
            out.version.length = static_cast<uint8_t>(n);
            out.type = TelemetryType::VERSION;
            break;
        }

        case Characteristic::UPDATE_STATE:
            if (length == 0) {
                status = DecodeStatus::UNEXPECTED_LENGTH;
                break;
            }
            out.updateState = data[0];
            out.type = TelemetryType::UPDATE_STATE;
            break;

        case Characteristic::NUS_TX:
            if (length == 0) {
                status = DecodeStatus::UNEXPECTED_LENGTH;
                break;
            }
            out.uartLength = length > 0xFF ? 0xFF : static_cast<uint8_t>(length);
            out.type = TelemetryType::UART_DATA;
            break;

        default:
            status = DecodeStatus::UNKNOWN_CHARACTERISTIC;
            break;
    }

    if (status != DecodeStatus::OK) {
        DEBUG_PRINTF("[DECODE] %s frame dropped: %s (len=%u)\n",
                     characteristicToString(source), decodeStatusToString(status),
                     static_cast<unsigned>(length));
    }
    return status;
}

// =============================================================================
// FRAME DECODERS
// =============================================================================

void TelemetryDecoder::decodeCable(const uint8_t* buf, size_t offset, CableSample& out) {
    out.positionMm = getI16(buf, offset) / POSITION_SCALE;
    out.velocityMmS = getI16(buf, offset + 2) / VELOCITY_SCALE;
    out.loadKg = getU16(buf, offset + 4) / FORCE_SCALE;
}

DecodeStatus TelemetryDecoder::decodeSample(const uint8_t* data, size_t length, TelemetrySample& out) {
    if (!data) {
        return DecodeStatus::NULL_DATA;
    }
    if (length != SAMPLE_FRAME_SIZE) {
        return DecodeStatus::UNEXPECTED_LENGTH;
    }

    out.ticks = getU32(data, 0x00);
    decodeCable(data, 0x04, out.cables[0]);
    decodeCable(data, 0x04 + CABLE_RECORD_SIZE, out.cables[1]);
    out.status = getU16(data, 0x10);

    out.positionMm = (out.cables[0].positionMm + out.cables[1].positionMm) / 2.0f;
    out.velocityMmS = (out.cables[0].velocityMmS + out.cables[1].velocityMmS) / 2.0f;
    out.loadKg = out.cables[0].loadKg + out.cables[1].loadKg;
    // kg * g * m/s
    out.powerW = out.loadKg * GRAVITY_MS2 * fabsf(out.velocityMmS) / 1000.0f;
    return DecodeStatus::OK;
}

DecodeStatus TelemetryDecoder::decodeRep(const uint8_t* data, size_t length, RepEvent& out) {
    if (!data) {
        return DecodeStatus::NULL_DATA;
    }
    if (length != REPS_FRAME_SIZE) {
        return DecodeStatus::UNEXPECTED_LENGTH;
    }

    out.upCounter = getI32(data, 0x00);
    out.downCounter = getI32(data, 0x04);
    out.rangeTop = getFloat(data, 0x08);
    out.rangeBottom = getFloat(data, 0x0C);
    out.warmupReps = getU16(data, 0x10);
    out.workingReps = getU16(data, 0x14);
    return DecodeStatus::OK;
}

DecodeStatus TelemetryDecoder::decodeDiagnostic(const uint8_t* data, size_t length, DiagnosticReport& out) {
    if (!data) {
        return DecodeStatus::NULL_DATA;
    }
    // Firmware may append fields; the first 20 bytes are stable
    if (length < DIAGNOSTIC_FRAME_SIZE) {
        return DecodeStatus::UNEXPECTED_LENGTH;
    }

    out.uptimeSec = getU32(data, 0);
    for (int i = 0; i < DIAGNOSTIC_FAULT_COUNT; i++) {
        out.faults[i] = getI16(data, 4 + i * 2);
    }
    for (int i = 0; i < DIAGNOSTIC_TEMP_COUNT; i++) {
        out.temperatures[i] = static_cast<int8_t>(data[12 + i]);
    }
    return DecodeStatus::OK;
}

static void decodePhase(const uint8_t* data, size_t offset, PhaseStatistics& out) {
    out.kgAvg = TelemetryDecoder::getFloat(data, offset);
    out.kgMax = TelemetryDecoder::getFloat(data, offset + 4);
    out.velocityAvg = TelemetryDecoder::getFloat(data, offset + 8);
    out.velocityMax = TelemetryDecoder::getFloat(data, offset + 12);
    out.wattAvg = TelemetryDecoder::getFloat(data, offset + 16);
    out.wattMax = TelemetryDecoder::getFloat(data, offset + 20);
}

DecodeStatus TelemetryDecoder::decodeHeuristic(const uint8_t* data, size_t length, HeuristicReport& out) {
    if (!data) {
        return DecodeStatus::NULL_DATA;
    }
    if (length != HEURISTIC_FRAME_SIZE) {
        return DecodeStatus::UNEXPECTED_LENGTH;
    }

    decodePhase(data, 0, out.concentric);
    decodePhase(data, 24, out.eccentric);
    return DecodeStatus::OK;
}
