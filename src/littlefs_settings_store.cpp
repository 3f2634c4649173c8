/**
 * @file littlefs_settings_store.cpp
 * @brief VeeBridge settings storage on InternalFS - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "littlefs_settings_store.h"
#include <Adafruit_LittleFS.h>
#include <InternalFileSystem.h>

using namespace Adafruit_LittleFS_Namespace;

bool LittleFsSettingsStore::begin() {
    return InternalFS.begin();
}

bool LittleFsSettingsStore::exists(const char* path) {
    return InternalFS.exists(path);
}

size_t LittleFsSettingsStore::read(const char* path, uint8_t* buffer, size_t length) {
    File file(InternalFS);
    if (!file.open(path, FILE_O_READ)) {
        return 0;
    }
    size_t bytesRead = file.read(buffer, length);
    file.close();
    return bytesRead;
}

size_t LittleFsSettingsStore::write(const char* path, const uint8_t* data, size_t length) {
    File file(InternalFS);
    if (!file.open(path, FILE_O_WRITE)) {
        return 0;
    }

    // FILE_O_WRITE positions at EOF
    file.seek(0);
    size_t written = file.write(data, length);
    file.truncate(length);
    file.flush();
    file.close();
    return written;
}

bool LittleFsSettingsStore::remove(const char* path) {
    return InternalFS.remove(path);
}
