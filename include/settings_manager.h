/**
 * @file settings_manager.h
 * @brief VeeBridge settings - Runtime parameters and persistence
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Manages bridge settings including:
 * - Write retry policy and GATT timeout
 * - Connect retries and scan name prefix
 * - Heartbeat and default color scheme
 * - Binary persistence through a SettingsStore
 */

#ifndef SETTINGS_MANAGER_H
#define SETTINGS_MANAGER_H

#include <stdint.h>
#include "config.h"
#include "types.h"
#include "settings_store.h"
#include "connection_state_machine.h"
#include "command_dispatcher.h"

// =============================================================================
// CONSTANTS
// =============================================================================

// Settings file path and format
#define SETTINGS_FILE "/bridge.bin"
#define SETTINGS_MAGIC 0x56
#define SETTINGS_VERSION 1

#define MAX_GATT_RETRIES 5
#define MAX_CONNECT_RETRIES 5
#define MIN_GATT_TIMEOUT_MS 1000
#define MAX_GATT_TIMEOUT_MS 30000

// =============================================================================
// BINARY SETTINGS STRUCTURE (for persistent storage)
// =============================================================================

struct __attribute__((packed)) SettingsData {
    uint8_t magic;               // 0x56 to validate file
    uint8_t version;
    uint8_t gattRetries;         // 0-5
    uint32_t gattTimeoutMs;      // 1000-30000
    uint8_t connectRetries;      // 0-5, attempts after the first
    uint8_t heartbeat;           // 0 or 1
    uint8_t colorScheme;         // COLOR_SCHEMES index
    char namePrefix[NAME_PREFIX_MAX];
    uint8_t debugMode;           // 0 or 1
    uint8_t reserved[4];
};

// =============================================================================
// BRIDGE SETTINGS
// =============================================================================

struct BridgeSettings {
    uint8_t gattRetries;
    uint32_t gattTimeoutMs;
    uint8_t connectRetries;
    bool heartbeatEnabled;
    uint8_t colorScheme;
    char namePrefix[NAME_PREFIX_MAX];
    bool debugMode;

    BridgeSettings() :
        gattRetries(DEFAULT_GATT_RETRIES),
        gattTimeoutMs(GATT_TIMEOUT_MS),
        connectRetries(CONNECT_RETRY_COUNT - 1),
        heartbeatEnabled(true),
        colorScheme(0),
        debugMode(false)
    {
        memset(namePrefix, 0, sizeof(namePrefix));
        strncpy(namePrefix, DEVICE_NAME_PREFIX, sizeof(namePrefix) - 1);
    }
};

// =============================================================================
// SETTINGS MANAGER CLASS
// =============================================================================

/**
 * @brief Bridge settings manager
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.begin(&store);
 *
 *   settings.setParameter("RETRIES", "2");
 *   settings.saveSettings();
 *
 *   connection.setPolicy(settings.toConnectionPolicy());
 */
class SettingsManager {
public:
    SettingsManager();

    /**
     * @brief Mount storage and optionally load saved settings
     * @return true (defaults are used when storage is unavailable)
     */
    bool begin(SettingsStore* store, bool loadFromStorage = true);

    const BridgeSettings& getSettings() const { return _settings; }

    /**
     * @brief Set parameter by name (case-insensitive)
     * @return false for an unknown name or out-of-range value
     */
    bool setParameter(const char* paramName, const char* value);

    void resetToDefaults();

    // =========================================================================
    // POLICIES
    // =========================================================================

    ConnectionPolicy toConnectionPolicy() const;
    RetryPolicy toRetryPolicy() const;

    // =========================================================================
    // PERSISTENCE
    // =========================================================================

    bool saveSettings();
    bool loadSettings();

    bool isStorageAvailable() const { return _storageAvailable; }

private:
    SettingsStore* _store;
    bool _storageAvailable;
    BridgeSettings _settings;
};

#endif // SETTINGS_MANAGER_H
