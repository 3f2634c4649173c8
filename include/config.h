/**
 * @file config.h
 * @brief VeeBridge firmware configuration - Identity, timing and buffer sizes
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Wire-level protocol values live in protocol_constants.h. This file only
 * holds bridge-side tuning.
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>

// =============================================================================
// FIRMWARE VERSION
// =============================================================================

#define FIRMWARE_VERSION "1.0.0"
#define FIRMWARE_NAME "VeeBridge"

// =============================================================================
// SERIAL CONSOLE
// =============================================================================

#define SERIAL_BAUD_RATE 115200
#define SERIAL_LINE_MAX 128             // Longest accepted console line

// =============================================================================
// BLE CENTRAL PARAMETERS
// =============================================================================

#define BLE_SCAN_INTERVAL 160           // 100ms (0.625ms units)
#define BLE_SCAN_WINDOW 80              // 50ms
#define BLE_SCAN_MIN_RSSI -90           // Ignore weaker advertisers
#define BLE_MTU_SIZE 247                // Program frames are 96 bytes
#define BLE_ADDR_LEN 6

// =============================================================================
// CONNECTION POLICY
// =============================================================================

#define CONNECT_RETRY_COUNT 3           // Connect attempts before giving up
#define CONNECT_RETRY_DELAY_MS 100      // Back-off between attempts
#define DISCONNECT_GRACE_MS 1000        // Max wait for link teardown

// =============================================================================
// COMMAND DISPATCH
// =============================================================================

#define COMMAND_QUEUE_SIZE 8            // Pending commands incl. in-flight
#define COMMAND_HISTORY_SIZE 16         // Resolved handles kept for STATUS queries
#define DEFAULT_GATT_RETRIES 1          // Retries after a GATT timeout

// =============================================================================
// EVENT FAN-OUT
// =============================================================================

#define MAX_EVENT_SUBSCRIBERS 4
#define SUBSCRIBER_MAILBOX_SIZE 16      // Events buffered per subscriber
#define EVENT_DELIVERY_BUDGET 4         // Events delivered per subscriber per update()
#define TRANSPORT_EVENT_QUEUE_SIZE 32   // BLE callback -> loop handoff (power of 2)

// =============================================================================
// TELEMETRY REPORTING
// =============================================================================

#define TELEMETRY_REPORT_INTERVAL_MS 500    // Console sample rate limit
#define DELOAD_REPORT_DEBOUNCE_MS 2000      // Minimum gap between DELOAD lines

// =============================================================================
// STATUS LED
// =============================================================================

// NeoPixel LED - Uses built-in PIN_NEOPIXEL on Feather nRF52840
#define NEOPIXEL_PIN PIN_NEOPIXEL
#define NEOPIXEL_COUNT 1
#define LED_BRIGHTNESS 4                // NeoPixel brightness (0-255), ~1.5%

#define LED_BREATHE_SLOW_MS     2000    // DISCONNECTED: 2s full cycle
#define LED_BLINK_SCAN_MS       500     // SCANNING: 500ms on/off
#define LED_BLINK_CONNECT_MS    250     // CONNECTING/DISCONNECTING: 250ms on/off
#define LED_BLINK_URGENT_MS     150     // FAILED: 150ms on/off
#define LED_FAILURE_HOLD_MS     3000    // Failure color kept after cleanup

// =============================================================================
// DEVELOPMENT/DEBUG FLAGS
// =============================================================================

#ifndef DEBUG_ENABLED
#define DEBUG_ENABLED 0
#endif

// Debug macros
#if DEBUG_ENABLED
    #define DEBUG_PRINTF(...) logPrintf(__VA_ARGS__)
#else
    #define DEBUG_PRINTF(...)
#endif

// =============================================================================
// MEMORY MANAGEMENT
// =============================================================================

#define NOTIFY_BUFFER_SIZE 64           // Largest notification we keep
#define LOG_LINE_SIZE 160               // Formatted log line

#endif // CONFIG_H
