/**
 * @file packet_encoder.h
 * @brief VeeBridge packet encoder - DeviceCommand to binary frame
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Stateless. Every multi-byte field is little-endian; floats are IEEE-754
 * single precision. Invalid input is rejected with INVALID_ARGUMENT, never
 * clamped (the one exception being the legacy 125% eccentric load, which
 * maps to 120%).
 */

#ifndef PACKET_ENCODER_H
#define PACKET_ENCODER_H

#include <stdint.h>
#include <stddef.h>
#include "types.h"
#include "protocol_constants.h"
#include "device_command.h"

// =============================================================================
// ENCODE STATUS
// =============================================================================

enum class EncodeStatus : uint8_t {
    OK = 0,
    INVALID_ARGUMENT
};

inline const char* encodeStatusToString(EncodeStatus status) {
    switch (status) {
        case EncodeStatus::OK: return "OK";
        case EncodeStatus::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// OUTBOUND FRAME
// =============================================================================

/**
 * @brief Encoded frame ready for a GATT write
 *
 * Only PacketEncoder fills it. Length is 0 until a successful encode.
 */
class OutboundFrame {
public:
    OutboundFrame();

    const uint8_t* data() const { return _data; }
    uint8_t length() const { return _length; }
    bool isEmpty() const { return _length == 0; }

    uint8_t operator[](size_t index) const {
        return index < _length ? _data[index] : 0;
    }

    bool operator==(const OutboundFrame& other) const;
    bool operator!=(const OutboundFrame& other) const { return !(*this == other); }

private:
    friend class PacketEncoder;

    uint8_t _data[MAX_FRAME_SIZE];
    uint8_t _length;
};

// =============================================================================
// COLOR SCHEMES
// =============================================================================

#define COLOR_SCHEME_COUNT 8

/**
 * @brief Predefined LED scheme
 */
struct ColorSchemePreset {
    const char* name;
    float brightness;
    RGBColor colors[3];
};

extern const ColorSchemePreset COLOR_SCHEMES[COLOR_SCHEME_COUNT];

// =============================================================================
// PACKET ENCODER
// =============================================================================

class PacketEncoder {
public:
    /**
     * @brief Encode a command into its wire frame
     * @param command Command to encode
     * @param frame Output frame (left empty on failure)
     * @return OK or INVALID_ARGUMENT
     */
    static EncodeStatus encode(const DeviceCommand& command, OutboundFrame& frame);

    /**
     * @brief Expected frame length for a command
     */
    static uint8_t frameLength(const DeviceCommand& command);

    /**
     * @brief Scale a weight by 100 into a little-endian u16
     *
     * 25.5 kg -> 2550 -> { 0xF6, 0x09 }
     */
    static EncodeStatus encodeWeight(float weightKg, uint8_t out[2]);

    /**
     * @brief Copy the 32-byte resistance profile for a program mode
     * @return false for a mode without a profile (ECHO)
     */
    static bool getModeProfile(ProgramMode mode, uint8_t out[MODE_PROFILE_SIZE]);

    /**
     * @brief Build a color scheme command from a preset index
     *
     * Out-of-range indices select the first preset.
     */
    static DeviceCommand colorSchemeCommand(uint8_t schemeIndex);

    /**
     * @brief Normalise an eccentric load percentage
     * @return Mapped value, or -1 if out of range
     */
    static int normalizeEccentricLoad(uint16_t pct);

    // Little-endian writers (exposed for the telemetry tests)
    static void putU16(uint8_t* buf, size_t offset, uint16_t value);
    static void putU32(uint8_t* buf, size_t offset, uint32_t value);
    static void putFloat(uint8_t* buf, size_t offset, float value);

private:
    static EncodeStatus encodeProgram(const WorkoutParameters& params, uint8_t* buf);
    static EncodeStatus encodeEcho(const EchoSettings& echo, uint8_t* buf);
    static EncodeStatus encodeColor(const ColorSettings& color, uint8_t* buf);
    static EncodeStatus encodeLegacy(const LegacyWorkoutSettings& legacy, uint8_t* buf);
    static bool isValidWeight(float weightKg);
};

#endif // PACKET_ENCODER_H
