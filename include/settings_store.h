/**
 * @file settings_store.h
 * @brief VeeBridge settings storage backend interface
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H

#include <stddef.h>
#include <stdint.h>

/**
 * @brief Whole-file storage used by SettingsManager
 *
 * The firmware uses LittleFsSettingsStore (InternalFS).
 */
class SettingsStore {
public:
    virtual ~SettingsStore() {}

    /**
     * @brief Mount the backing filesystem
     */
    virtual bool begin() = 0;

    virtual bool exists(const char* path) = 0;

    /**
     * @return Bytes read, 0 on failure
     */
    virtual size_t read(const char* path, uint8_t* buffer, size_t length) = 0;

    /**
     * @brief Replace the file contents
     * @return Bytes written
     */
    virtual size_t write(const char* path, const uint8_t* data, size_t length) = 0;

    virtual bool remove(const char* path) = 0;
};

#endif // SETTINGS_STORE_H
