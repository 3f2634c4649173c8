/**
 * @file types.h
 * @brief VeeBridge type definitions - Enums, structs, and string helpers
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#ifndef TYPES_H
#define TYPES_H

#include <stdint.h>
#include <string.h>

// =============================================================================
// RESULT CODES
// =============================================================================

/**
 * @brief Standard result codes for function returns
 */
enum class Result : uint8_t {
    OK = 0,
    ERROR_TIMEOUT,
    ERROR_INVALID_PARAM,
    ERROR_NOT_CONNECTED,
    ERROR_BUSY,
    ERROR_QUEUE_FULL,
    ERROR_TRANSPORT,
    ERROR_NOT_FOUND
};

/**
 * @brief Get string representation of result code
 */
inline const char* resultToString(Result result) {
    switch (result) {
        case Result::OK: return "OK";
        case Result::ERROR_TIMEOUT: return "TIMEOUT";
        case Result::ERROR_INVALID_PARAM: return "INVALID_PARAM";
        case Result::ERROR_NOT_CONNECTED: return "NOT_CONNECTED";
        case Result::ERROR_BUSY: return "BUSY";
        case Result::ERROR_QUEUE_FULL: return "QUEUE_FULL";
        case Result::ERROR_TRANSPORT: return "TRANSPORT";
        case Result::ERROR_NOT_FOUND: return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// ERROR TAXONOMY
// =============================================================================

/**
 * @brief Classification every protocol failure falls into
 */
enum class ErrorKind : uint8_t {
    NONE = 0,
    ENCODING,           // Invalid input to the encoder, caller bug
    DECODING,           // Malformed inbound frame, dropped
    TRANSPORT,          // Scan/connect/write/subscribe failure
    PROTOCOL_MISMATCH,  // Required characteristic missing
    LINK_LOST           // Unexpected drop while READY
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::ENCODING: return "ENCODING";
        case ErrorKind::DECODING: return "DECODING";
        case ErrorKind::TRANSPORT: return "TRANSPORT";
        case ErrorKind::PROTOCOL_MISMATCH: return "PROTOCOL_MISMATCH";
        case ErrorKind::LINK_LOST: return "LINK_LOST";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Why a connection attempt or session ended in FAILED
 */
enum class FailureReason : uint8_t {
    NONE = 0,
    SCAN_TIMEOUT,
    SCAN_FAILED,
    CONNECTION_TIMEOUT,
    CONNECT_REJECTED,
    PROTOCOL_MISMATCH,
    TRANSPORT_ERROR,
    LINK_LOST
};

inline const char* failureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "NONE";
        case FailureReason::SCAN_TIMEOUT: return "SCAN_TIMEOUT";
        case FailureReason::SCAN_FAILED: return "SCAN_FAILED";
        case FailureReason::CONNECTION_TIMEOUT: return "CONNECTION_TIMEOUT";
        case FailureReason::CONNECT_REJECTED: return "CONNECT_REJECTED";
        case FailureReason::PROTOCOL_MISMATCH: return "PROTOCOL_MISMATCH";
        case FailureReason::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case FailureReason::LINK_LOST: return "LINK_LOST";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Map a failure reason onto the error taxonomy
 */
inline ErrorKind failureReasonToKind(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return ErrorKind::NONE;
        case FailureReason::PROTOCOL_MISMATCH: return ErrorKind::PROTOCOL_MISMATCH;
        case FailureReason::LINK_LOST: return ErrorKind::LINK_LOST;
        case FailureReason::SCAN_TIMEOUT:
        case FailureReason::SCAN_FAILED:
        case FailureReason::CONNECTION_TIMEOUT:
        case FailureReason::CONNECT_REJECTED:
        case FailureReason::TRANSPORT_ERROR:
        default:
            return ErrorKind::TRANSPORT;
    }
}

// =============================================================================
// CONNECTION STATE
// =============================================================================

/**
 * @brief Connection lifecycle states
 */
enum class ConnectionState : uint8_t {
    DISCONNECTED = 0,   // No link, idle
    SCANNING,           // Looking for an advertiser with our name prefix
    CONNECTING,         // Link establishment and service discovery
    READY,              // All required characteristics subscribed
    DISCONNECTING,      // Cleanup in progress
    FAILED              // Attempt failed, cleanup then DISCONNECTED
};

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::SCANNING: return "SCANNING";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::READY: return "READY";
        case ConnectionState::DISCONNECTING: return "DISCONNECTING";
        case ConnectionState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Events that drive connection state transitions
 */
enum class ConnectionTrigger : uint8_t {
    START_SCAN = 0,
    DEVICE_FOUND,
    SERVICES_DISCOVERED,
    DISCOVERY_FAILED,
    CONNECT_FAILED,
    DISCONNECT_REQUESTED,
    LINK_DOWN,
    TIMEOUT,
    CLEANUP_DONE
};

inline const char* connectionTriggerToString(ConnectionTrigger trigger) {
    switch (trigger) {
        case ConnectionTrigger::START_SCAN: return "START_SCAN";
        case ConnectionTrigger::DEVICE_FOUND: return "DEVICE_FOUND";
        case ConnectionTrigger::SERVICES_DISCOVERED: return "SERVICES_DISCOVERED";
        case ConnectionTrigger::DISCOVERY_FAILED: return "DISCOVERY_FAILED";
        case ConnectionTrigger::CONNECT_FAILED: return "CONNECT_FAILED";
        case ConnectionTrigger::DISCONNECT_REQUESTED: return "DISCONNECT_REQUESTED";
        case ConnectionTrigger::LINK_DOWN: return "LINK_DOWN";
        case ConnectionTrigger::TIMEOUT: return "TIMEOUT";
        case ConnectionTrigger::CLEANUP_DONE: return "CLEANUP_DONE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Check if the link is up (write path usable or being torn down)
 */
inline bool isLinkState(ConnectionState state) {
    return state == ConnectionState::CONNECTING ||
           state == ConnectionState::READY ||
           state == ConnectionState::DISCONNECTING;
}

// =============================================================================
// WORKOUT MODES
// =============================================================================

/**
 * @brief Fixed-profile program modes (values are the machine's mode ids)
 */
enum class ProgramMode : uint8_t {
    OLD_SCHOOL = 0,
    PUMP = 2,
    TUT = 3,
    TUT_BEAST = 4,
    ECCENTRIC_ONLY = 6,
    ECHO = 10
};

inline const char* programModeToString(ProgramMode mode) {
    switch (mode) {
        case ProgramMode::OLD_SCHOOL: return "OLD_SCHOOL";
        case ProgramMode::PUMP: return "PUMP";
        case ProgramMode::TUT: return "TUT";
        case ProgramMode::TUT_BEAST: return "TUT_BEAST";
        case ProgramMode::ECCENTRIC_ONLY: return "ECCENTRIC_ONLY";
        case ProgramMode::ECHO: return "ECHO";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Check that a raw byte names a known program mode
 */
inline bool isValidProgramMode(uint8_t value) {
    return value == 0 || value == 2 || value == 3 ||
           value == 4 || value == 6 || value == 10;
}

/**
 * @brief Echo (adaptive resistance) difficulty levels
 */
enum class EchoLevel : uint8_t {
    HARD = 0,
    HARDER = 1,
    HARDEST = 2,
    EPIC = 3
};

inline const char* echoLevelToString(EchoLevel level) {
    switch (level) {
        case EchoLevel::HARD: return "HARD";
        case EchoLevel::HARDER: return "HARDER";
        case EchoLevel::HARDEST: return "HARDEST";
        case EchoLevel::EPIC: return "EPIC";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// STRUCTS
// =============================================================================

/**
 * @brief RGB color triplet as sent to the machine's LED ring
 */
struct RGBColor {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    RGBColor() : r(0), g(0), b(0) {}
    RGBColor(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    bool operator==(const RGBColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }

    bool operator!=(const RGBColor& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Bluetooth device address (little-endian, as reported by the stack)
 */
struct BleAddress {
    uint8_t bytes[6];

    BleAddress() {
        memset(bytes, 0, sizeof(bytes));
    }

    bool isZero() const {
        for (int i = 0; i < 6; i++) {
            if (bytes[i] != 0) return false;
        }
        return true;
    }

    bool operator==(const BleAddress& other) const {
        return memcmp(bytes, other.bytes, sizeof(bytes)) == 0;
    }
};

#endif // TYPES_H
