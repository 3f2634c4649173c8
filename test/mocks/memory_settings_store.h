/**
 * @file memory_settings_store.h
 * @brief RAM-backed SettingsStore for native unit testing
 * @note Holds a single file; the path of the last write is remembered.
 */

#ifndef MEMORY_SETTINGS_STORE_H
#define MEMORY_SETTINGS_STORE_H

#include <stdint.h>
#include <string.h>
#include "settings_store.h"

#define MEMORY_STORE_CAPACITY 128

class MemorySettingsStore : public SettingsStore {
public:
    bool mountResult;
    bool failWrites;
    uint8_t contents[MEMORY_STORE_CAPACITY];
    size_t size;
    bool present;
    char path[32];
    int writeCount;

    MemorySettingsStore() {
        reset();
    }

    void reset() {
        mountResult = true;
        failWrites = false;
        memset(contents, 0, sizeof(contents));
        size = 0;
        present = false;
        memset(path, 0, sizeof(path));
        writeCount = 0;
    }

    bool begin() override {
        return mountResult;
    }

    bool exists(const char* filePath) override {
        return present && strcmp(filePath, path) == 0;
    }

    size_t read(const char* filePath, uint8_t* buffer, size_t length) override {
        if (!exists(filePath)) {
            return 0;
        }
        size_t n = length < size ? length : size;
        memcpy(buffer, contents, n);
        return n;
    }

    size_t write(const char* filePath, const uint8_t* data, size_t length) override {
        writeCount++;
        if (failWrites || length > sizeof(contents)) {
            return 0;
        }
        memcpy(contents, data, length);
        size = length;
        present = true;
        strncpy(path, filePath, sizeof(path) - 1);
        return length;
    }

    bool remove(const char* filePath) override {
        if (!exists(filePath)) {
            return false;
        }
        present = false;
        size = 0;
        return true;
    }
};

#endif // MEMORY_SETTINGS_STORE_H
