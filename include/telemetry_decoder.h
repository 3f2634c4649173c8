/**
 * @file telemetry_decoder.h
 * @brief VeeBridge telemetry decoder - Notification frames to typed events
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Stateless. Dispatch is by characteristic identity plus frame length. A
 * frame of the wrong size is reported as UNEXPECTED_LENGTH and dropped;
 * malformed input never aborts and never blocks.
 *
 * Sample frame (28 bytes, little-endian):
 *   0x00 u32  device ticks
 *   0x04 6B   cable A: i16 position x10, i16 velocity x10, u16 load x100
 *   0x0A 6B   cable B: same layout
 *   0x10 u16  status flags
 *   0x12 10B  reserved, not decoded
 *
 * The device sends no combined channel. positionMm and velocityMmS are the
 * mean of the two cables, loadKg is their sum and powerW is derived from
 * the total load and the mean speed.
 *
 * Reps frame (24 bytes):
 *   0x00 i32 up counter, 0x04 i32 down counter, 0x08 f32 range top,
 *   0x0C f32 range bottom, 0x10 u16 warmup reps, 0x14 u16 working reps
 */

#ifndef TELEMETRY_DECODER_H
#define TELEMETRY_DECODER_H

#include <stdint.h>
#include <stddef.h>
#include "protocol_constants.h"

// =============================================================================
// DECODE STATUS
// =============================================================================

enum class DecodeStatus : uint8_t {
    OK = 0,
    UNEXPECTED_LENGTH,
    UNKNOWN_CHARACTERISTIC,
    NULL_DATA
};

inline const char* decodeStatusToString(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::OK: return "OK";
        case DecodeStatus::UNEXPECTED_LENGTH: return "UNEXPECTED_LENGTH";
        case DecodeStatus::UNKNOWN_CHARACTERISTIC: return "UNKNOWN_CHARACTERISTIC";
        case DecodeStatus::NULL_DATA: return "NULL_DATA";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// EVENT PAYLOADS
// =============================================================================

/**
 * @brief One cable's 6-byte sub-record, descaled
 */
struct CableSample {
    float positionMm;
    float velocityMmS;
    float loadKg;
};

/**
 * @brief Decoded sample/monitor frame
 */
struct TelemetrySample {
    uint32_t ticks;
    float positionMm;
    float velocityMmS;
    float loadKg;
    float powerW;
    CableSample cables[2];
    uint16_t status;

    bool isDeloadOccurred() const { return (status & STATUS_DELOAD_OCCURRED) != 0; }
    bool isDeloadWarning() const { return (status & STATUS_DELOAD_WARN) != 0; }
    bool isSpotterActive() const { return (status & STATUS_SPOTTER_ACTIVE) != 0; }

    /**
     * @brief Both cable positions inside the machine's travel range
     */
    bool isPositionValid() const;
};

/**
 * @brief Decoded reps frame
 */
struct RepEvent {
    int32_t upCounter;      // Top-of-rep events since set start
    int32_t downCounter;    // Bottom-of-rep events since set start
    float rangeTop;
    float rangeBottom;
    uint16_t warmupReps;
    uint16_t workingReps;
};

#define DIAGNOSTIC_FAULT_COUNT 4
#define DIAGNOSTIC_TEMP_COUNT 8

struct DiagnosticReport {
    uint32_t uptimeSec;
    int16_t faults[DIAGNOSTIC_FAULT_COUNT];
    int8_t temperatures[DIAGNOSTIC_TEMP_COUNT];

    bool hasFaults() const;
};

struct PhaseStatistics {
    float kgAvg;
    float kgMax;
    float velocityAvg;
    float velocityMax;
    float wattAvg;
    float wattMax;
};

struct HeuristicReport {
    PhaseStatistics concentric;
    PhaseStatistics eccentric;
};

#define VERSION_MAX_LEN 16

struct VersionInfo {
    uint8_t bytes[VERSION_MAX_LEN];
    uint8_t length;
};

struct ModeInfo {
    uint32_t mode;
};

// =============================================================================
// TELEMETRY EVENT
// =============================================================================

enum class TelemetryType : uint8_t {
    NONE = 0,
    SAMPLE,
    REP,
    DIAGNOSTIC,
    HEURISTIC,
    VERSION,
    MODE,
    UPDATE_STATE,
    UART_DATA
};

inline const char* telemetryTypeToString(TelemetryType type) {
    switch (type) {
        case TelemetryType::NONE: return "NONE";
        case TelemetryType::SAMPLE: return "SAMPLE";
        case TelemetryType::REP: return "REP";
        case TelemetryType::DIAGNOSTIC: return "DIAGNOSTIC";
        case TelemetryType::HEURISTIC: return "HEURISTIC";
        case TelemetryType::VERSION: return "VERSION";
        case TelemetryType::MODE: return "MODE";
        case TelemetryType::UPDATE_STATE: return "UPDATE_STATE";
        case TelemetryType::UART_DATA: return "UART_DATA";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Tagged result of decoding one notification
 */
struct TelemetryEvent {
    TelemetryType type;
    union {
        TelemetrySample sample;
        RepEvent rep;
        DiagnosticReport diagnostic;
        HeuristicReport heuristic;
        VersionInfo version;
        ModeInfo mode;
        uint8_t updateState;
        uint8_t uartLength;
    };

    TelemetryEvent() : type(TelemetryType::NONE), version() {}
};

// =============================================================================
// TELEMETRY DECODER
// =============================================================================

class TelemetryDecoder {
public:
    /**
     * @brief Decode a notification frame
     * @param source Characteristic the frame arrived on
     * @param data Frame bytes
     * @param length Frame length
     * @param out Decoded event (type NONE on failure)
     */
    static DecodeStatus decode(Characteristic source, const uint8_t* data, size_t length,
                               TelemetryEvent& out);

    static DecodeStatus decodeSample(const uint8_t* data, size_t length, TelemetrySample& out);
    static DecodeStatus decodeRep(const uint8_t* data, size_t length, RepEvent& out);
    static DecodeStatus decodeDiagnostic(const uint8_t* data, size_t length, DiagnosticReport& out);
    static DecodeStatus decodeHeuristic(const uint8_t* data, size_t length, HeuristicReport& out);

    /**
     * @brief Expected length for a characteristic's frames
     * @return Exact size, minimum size for variable frames, 0 if unknown
     */
    static size_t expectedLength(Characteristic source);

    // Little-endian readers
    static uint16_t getU16(const uint8_t* buf, size_t offset);
    static int16_t getI16(const uint8_t* buf, size_t offset);
    static uint32_t getU32(const uint8_t* buf, size_t offset);
    static int32_t getI32(const uint8_t* buf, size_t offset);
    static float getFloat(const uint8_t* buf, size_t offset);

private:
    static void decodeCable(const uint8_t* buf, size_t offset, CableSample& out);
};

#endif // TELEMETRY_DECODER_H
