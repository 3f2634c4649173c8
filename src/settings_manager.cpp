/**
 * @file settings_manager.cpp
 * @brief VeeBridge settings - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "settings_manager.h"
#include "packet_encoder.h"
#include "log.h"
#include <ctype.h>
#include <stdlib.h>
#include <string.h>

// =============================================================================
// CONSTRUCTOR
// =============================================================================

SettingsManager::SettingsManager() :
    _store(nullptr),
    _storageAvailable(false)
{
}

// =============================================================================
// INITIALIZATION
// =============================================================================

bool SettingsManager::begin(SettingsStore* store, bool loadFromStorage) {
    _store = store;

    if (_store && _store->begin()) {
        _storageAvailable = true;
        logPrint("[SETTINGS] Storage mounted\n");

        if (loadFromStorage) {
            loadSettings();
        }
    } else {
        _storageAvailable = false;
        logPrint("[SETTINGS] Storage not available, using defaults\n");
    }
    return true;
}

// =============================================================================
// PARAMETERS
// =============================================================================

static bool parseInt(const char* value, long minValue, long maxValue, long& out) {
    if (!value || *value == '\0') {
        return false;
    }
    char* end = nullptr;
    long parsed = strtol(value, &end, 10);
    if (*end != '\0' || parsed < minValue || parsed > maxValue) {
        return false;
    }
    out = parsed;
    return true;
}

bool SettingsManager::setParameter(const char* paramName, const char* value) {
    if (!paramName || !value) {
        return false;
    }

    // Convert param name to uppercase for comparison
    char paramUpper[32];
    strncpy(paramUpper, paramName, sizeof(paramUpper) - 1);
    paramUpper[sizeof(paramUpper) - 1] = '\0';
    for (char* c = paramUpper; *c; c++) {
        *c = static_cast<char>(toupper(static_cast<unsigned char>(*c)));
    }

    long number = 0;

    if (strcmp(paramUpper, "RETRIES") == 0) {
        if (!parseInt(value, 0, MAX_GATT_RETRIES, number)) return false;
        _settings.gattRetries = static_cast<uint8_t>(number);
    }
    else if (strcmp(paramUpper, "GATT_TIMEOUT") == 0) {
        if (!parseInt(value, MIN_GATT_TIMEOUT_MS, MAX_GATT_TIMEOUT_MS, number)) return false;
        _settings.gattTimeoutMs = static_cast<uint32_t>(number);
    }
    else if (strcmp(paramUpper, "CONNECT_RETRIES") == 0) {
        if (!parseInt(value, 0, MAX_CONNECT_RETRIES, number)) return false;
        _settings.connectRetries = static_cast<uint8_t>(number);
    }
    else if (strcmp(paramUpper, "HEARTBEAT") == 0) {
        if (!parseInt(value, 0, 1, number)) return false;
        _settings.heartbeatEnabled = (number != 0);
    }
    else if (strcmp(paramUpper, "COLOR") == 0) {
        if (!parseInt(value, 0, COLOR_SCHEME_COUNT - 1, number)) return false;
        _settings.colorScheme = static_cast<uint8_t>(number);
    }
    else if (strcmp(paramUpper, "PREFIX") == 0) {
        size_t len = strlen(value);
        if (len == 0 || len >= NAME_PREFIX_MAX) return false;
        memset(_settings.namePrefix, 0, sizeof(_settings.namePrefix));
        memcpy(_settings.namePrefix, value, len);
    }
    else if (strcmp(paramUpper, "DEBUG") == 0) {
        if (!parseInt(value, 0, 1, number)) return false;
        _settings.debugMode = (number != 0);
    }
    else {
        logPrintf("[SETTINGS] Unknown parameter: %s\n", paramName);
        return false;
    }

    logPrintf("[SETTINGS] Set %s = %s\n", paramUpper, value);
    return true;
}

void SettingsManager::resetToDefaults() {
    _settings = BridgeSettings();
    logPrint("[SETTINGS] Reset to defaults\n");
}

// =============================================================================
// POLICIES
// =============================================================================

ConnectionPolicy SettingsManager::toConnectionPolicy() const {
    ConnectionPolicy policy;
    policy.connectAttempts = static_cast<uint8_t>(_settings.connectRetries + 1);
    memcpy(policy.namePrefix, _settings.namePrefix, sizeof(policy.namePrefix));
    policy.namePrefix[sizeof(policy.namePrefix) - 1] = '\0';
    return policy;
}

RetryPolicy SettingsManager::toRetryPolicy() const {
    RetryPolicy policy;
    policy.maxRetries = _settings.gattRetries;
    policy.gattTimeoutMs = _settings.gattTimeoutMs;
    return policy;
}

// =============================================================================
// SETTINGS PERSISTENCE (Binary format)
// =============================================================================

bool SettingsManager::saveSettings() {
    if (!_storageAvailable) {
        return false;
    }

    SettingsData data{};

    // Header
    data.magic = SETTINGS_MAGIC;
    data.version = SETTINGS_VERSION;

    data.gattRetries = _settings.gattRetries;
    data.gattTimeoutMs = _settings.gattTimeoutMs;
    data.connectRetries = _settings.connectRetries;
    data.heartbeat = _settings.heartbeatEnabled ? 1 : 0;
    data.colorScheme = _settings.colorScheme;
    memcpy(data.namePrefix, _settings.namePrefix, sizeof(data.namePrefix));
    data.debugMode = _settings.debugMode ? 1 : 0;

    size_t written = _store->write(SETTINGS_FILE, reinterpret_cast<const uint8_t*>(&data), sizeof(data));
    if (written != sizeof(data)) {
        logPrint("[SETTINGS] Write failed\n");
        return false;
    }

    logPrint("[SETTINGS] Saved\n");
    return true;
}

bool SettingsManager::loadSettings() {
    if (!_storageAvailable) {
        return false;
    }

    if (!_store->exists(SETTINGS_FILE)) {
        logPrint("[SETTINGS] No settings file found\n");
        return false;
    }

    SettingsData data;
    size_t bytesRead = _store->read(SETTINGS_FILE, reinterpret_cast<uint8_t*>(&data), sizeof(data));

    if (bytesRead != sizeof(data) || data.magic != SETTINGS_MAGIC) {
        logPrint("[SETTINGS] Invalid file format\n");
        return false;
    }
    if (data.version != SETTINGS_VERSION) {
        logPrintf("[SETTINGS] Unsupported version %u\n", data.version);
        return false;
    }

    // Reject out-of-range fields one by one, keeping the default
    BridgeSettings defaults;
    _settings = defaults;

    if (data.gattRetries <= MAX_GATT_RETRIES) {
        _settings.gattRetries = data.gattRetries;
    } else {
        logPrintf("[SETTINGS] WARNING: Invalid retries %u, keeping %u\n",
                  data.gattRetries, defaults.gattRetries);
    }

    uint32_t timeoutMs = data.gattTimeoutMs;
    if (timeoutMs >= MIN_GATT_TIMEOUT_MS && timeoutMs <= MAX_GATT_TIMEOUT_MS) {
        _settings.gattTimeoutMs = timeoutMs;
    } else {
        logPrintf("[SETTINGS] WARNING: Invalid GATT timeout %lu, keeping %lu\n",
                  static_cast<unsigned long>(timeoutMs),
                  static_cast<unsigned long>(defaults.gattTimeoutMs));
    }

    if (data.connectRetries <= MAX_CONNECT_RETRIES) {
        _settings.connectRetries = data.connectRetries;
    }
    if (data.colorScheme < COLOR_SCHEME_COUNT) {
        _settings.colorScheme = data.colorScheme;
    }

    data.namePrefix[NAME_PREFIX_MAX - 1] = '\0';
    if (data.namePrefix[0] != '\0') {
        memcpy(_settings.namePrefix, data.namePrefix, sizeof(_settings.namePrefix));
    }

    _settings.heartbeatEnabled = (data.heartbeat != 0);
    _settings.debugMode = (data.debugMode != 0);

    logPrintf("[SETTINGS] Loaded: prefix=%s retries=%u timeout=%lums\n",
              _settings.namePrefix, _settings.gattRetries,
              static_cast<unsigned long>(_settings.gattTimeoutMs));
    return true;
}
