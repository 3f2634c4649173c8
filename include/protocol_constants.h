/**
 * @file protocol_constants.h
 * @brief VeeBridge wire protocol constants - UUIDs, command bytes, scales, sizes
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * These values are a closed contract with the machine's firmware. Changing any
 * byte value, offset or size breaks compatibility with deployed units.
 */

#ifndef PROTOCOL_CONSTANTS_H
#define PROTOCOL_CONSTANTS_H

#include <stdint.h>

// =============================================================================
// SERVICE AND CHARACTERISTIC UUIDS
// =============================================================================

// Nordic UART Service layout
#define NUS_SERVICE_UUID        "6e400001-b5a3-f393-e0a9-e50e24dcca9e"
#define NUS_RX_CHAR_UUID        "6e400002-b5a3-f393-e0a9-e50e24dcca9e"  // Write
#define NUS_TX_CHAR_UUID        "6e400003-b5a3-f393-e0a9-e50e24dcca9e"  // Notify

// Machine-specific characteristics (inside the NUS service)
#define SAMPLE_CHAR_UUID        "90e991a6-c548-44ed-969b-eb541014eae3"
#define REPS_CHAR_UUID          "8308f2a6-0875-4a94-a86f-5c5c5e1b068a"
#define MODE_CHAR_UUID          "67d0dae0-5bfc-4ea2-acc9-ac784dee7f29"
#define VERSION_CHAR_UUID       "74e994ac-0e80-4c02-9cd0-76cb31d3959b"
#define HEURISTIC_CHAR_UUID     "c7b73007-b245-4503-a1ed-9e4e97eb9802"
#define UPDATE_STATE_CHAR_UUID  "383f7276-49af-4335-9072-f01b0f8acad6"
#define DIAGNOSTIC_CHAR_UUID    "5fa538ec-d041-42f6-bbd6-c30d475387b7"  // Read only

/**
 * @brief Characteristics the bridge talks to
 *
 * The first NOTIFY_CHARACTERISTIC_COUNT entries are the notification
 * characteristics, in subscription order.
 */
enum class Characteristic : uint8_t {
    NUS_TX = 0,
    SAMPLE,
    REPS,
    MODE,
    VERSION,
    HEURISTIC,
    UPDATE_STATE,
    DIAGNOSTIC,
    NUS_RX,
    UNKNOWN
};

#define NOTIFY_CHARACTERISTIC_COUNT 7

/**
 * @brief One entry of the notification subscription table
 */
struct NotifyCharacteristicInfo {
    Characteristic id;
    const char* uuid;
    bool required;      // Missing required characteristic = protocol mismatch
};

extern const NotifyCharacteristicInfo NOTIFY_CHARACTERISTICS[NOTIFY_CHARACTERISTIC_COUNT];

/**
 * @brief Bit for a characteristic in a subscription mask
 */
inline uint16_t characteristicBit(Characteristic id) {
    return static_cast<uint16_t>(1u << static_cast<uint8_t>(id));
}

/**
 * @brief Mask of all characteristics that must be subscribed before READY
 */
uint16_t requiredCharacteristicMask();

/**
 * @brief Get canonical UUID string for a characteristic
 * @return UUID string, or nullptr for UNKNOWN
 */
const char* characteristicUuid(Characteristic id);

/**
 * @brief Look up a characteristic by UUID string (case-insensitive)
 */
Characteristic characteristicFromUuid(const char* uuid);

const char* characteristicToString(Characteristic id);

// =============================================================================
// COMMAND IDENTIFIERS
// =============================================================================

#define CMD_STOP            0x50    // Soft ("official") stop, 2 bytes
#define CMD_RESET           0x0A    // Init/Reset, 4 bytes
#define CMD_REGULAR         0x4F    // Legacy workout command
#define CMD_ECHO            0x4E    // Echo control frame
#define CMD_ACTIVATION      0x04    // Program parameters frame
#define CMD_START           0x03
#define CMD_HARD_STOP       0x05
#define CMD_COLOR           0x11    // Color scheme / init preset

#define DEFAULT_ROM_REPS    3       // Range-of-motion calibration reps
#define REPS_UNLIMITED      0xFF    // Just-lift / AMRAP sentinel
#define MAX_REP_COUNT       0xFE

// =============================================================================
// FIXED-POINT SCALES
// =============================================================================

#define POSITION_SCALE      10.0f   // raw / 10 = mm
#define VELOCITY_SCALE      10.0f   // raw / 10 = mm/s
#define FORCE_SCALE         100.0f  // raw / 100 = kg
#define WEIGHT_SCALE        100     // kg * 100 on the wire
#define GRAVITY_MS2         9.80665f  // kg -> N for derived power

// =============================================================================
// FRAME SIZES
// =============================================================================

#define CABLE_RECORD_SIZE       6
#define SAMPLE_FRAME_SIZE       28
#define REPS_FRAME_SIZE         24
#define DIAGNOSTIC_FRAME_SIZE   20
#define HEURISTIC_FRAME_SIZE    48
#define MODE_FRAME_SIZE         4

#define SHORT_FRAME_SIZE        4       // Init/Reset/Start/Stop/Heartbeat
#define SOFT_STOP_FRAME_SIZE    2
#define LEGACY_WORKOUT_FRAME_SIZE 25
#define ECHO_FRAME_SIZE         32
#define COLOR_FRAME_SIZE        34
#define PROGRAM_FRAME_SIZE      96
#define MODE_PROFILE_SIZE       32
#define MAX_FRAME_SIZE          PROGRAM_FRAME_SIZE

// =============================================================================
// DEVICE LIMITS
// =============================================================================

#define MAX_WEIGHT_PER_CABLE_KG 220.0f
#define MAX_ECCENTRIC_LOAD_PCT  150
#define LEGACY_ECCENTRIC_PCT    125     // Silently mapped to 120
#define DEFAULT_ECCENTRIC_PCT   75
#define DEFAULT_ECHO_TARGET_REPS 2
#define POSITION_MIN_MM         -1000.0f
#define POSITION_MAX_MM         1000.0f

// Sample status flags
#define STATUS_DELOAD_OCCURRED  0x8000
#define STATUS_SPOTTER_ACTIVE   0x0080
#define STATUS_DELOAD_WARN      0x0040

// =============================================================================
// SCAN FILTER
// =============================================================================

#define DEVICE_NAME_PREFIX      "Vee"   // Older units advertise "VIT", see SET:PREFIX

// =============================================================================
// TIMEOUTS (milliseconds)
// =============================================================================

#define CONNECTION_TIMEOUT_MS   15000
#define GATT_TIMEOUT_MS         5000
#define SCAN_TIMEOUT_MS         30000
#define HEARTBEAT_INTERVAL_MS   2000

#endif // PROTOCOL_CONSTANTS_H
