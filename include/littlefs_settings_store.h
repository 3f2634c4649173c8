/**
 * @file littlefs_settings_store.h
 * @brief VeeBridge settings storage on the nRF52 internal flash (InternalFS)
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#ifndef LITTLEFS_SETTINGS_STORE_H
#define LITTLEFS_SETTINGS_STORE_H

#include "settings_store.h"

class LittleFsSettingsStore : public SettingsStore {
public:
    bool begin() override;
    bool exists(const char* path) override;
    size_t read(const char* path, uint8_t* buffer, size_t length) override;
    size_t write(const char* path, const uint8_t* data, size_t length) override;
    bool remove(const char* path) override;
};

#endif // LITTLEFS_SETTINGS_STORE_H
