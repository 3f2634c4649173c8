/**
 * @file protocol_constants.cpp
 * @brief VeeBridge wire protocol constants - Characteristic table
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "protocol_constants.h"
#include <string.h>
#include <ctype.h>

const NotifyCharacteristicInfo NOTIFY_CHARACTERISTICS[NOTIFY_CHARACTERISTIC_COUNT] = {
    { Characteristic::NUS_TX,       NUS_TX_CHAR_UUID,       true  },
    { Characteristic::SAMPLE,       SAMPLE_CHAR_UUID,       true  },
    { Characteristic::REPS,         REPS_CHAR_UUID,         true  },
    { Characteristic::MODE,         MODE_CHAR_UUID,         true  },
    { Characteristic::VERSION,      VERSION_CHAR_UUID,      true  },
    { Characteristic::HEURISTIC,    HEURISTIC_CHAR_UUID,    true  },
    { Characteristic::UPDATE_STATE, UPDATE_STATE_CHAR_UUID, false },  // Newer firmware only
};

uint16_t requiredCharacteristicMask() {
    uint16_t mask = 0;
    for (uint8_t i = 0; i < NOTIFY_CHARACTERISTIC_COUNT; i++) {
        if (NOTIFY_CHARACTERISTICS[i].required) {
            mask |= characteristicBit(NOTIFY_CHARACTERISTICS[i].id);
        }
    }
    return mask;
}

const char* characteristicUuid(Characteristic id) {
    switch (id) {
        case Characteristic::NUS_TX: return NUS_TX_CHAR_UUID;
        case Characteristic::SAMPLE: return SAMPLE_CHAR_UUID;
        case Characteristic::REPS: return REPS_CHAR_UUID;
        case Characteristic::MODE: return MODE_CHAR_UUID;
        case Characteristic::VERSION: return VERSION_CHAR_UUID;
        case Characteristic::HEURISTIC: return HEURISTIC_CHAR_UUID;
        case Characteristic::UPDATE_STATE: return UPDATE_STATE_CHAR_UUID;
        case Characteristic::DIAGNOSTIC: return DIAGNOSTIC_CHAR_UUID;
        case Characteristic::NUS_RX: return NUS_RX_CHAR_UUID;
        default: return nullptr;
    }
}

static bool uuidEquals(const char* a, const char* b) {
    while (*a && *b) {
        if (tolower(static_cast<unsigned char>(*a)) != tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
        a++;
        b++;
    }
    return *a == *b;
}

Characteristic characteristicFromUuid(const char* uuid) {
    if (!uuid) {
        return Characteristic::UNKNOWN;
    }

    for (uint8_t i = 0; i < static_cast<uint8_t>(Characteristic::UNKNOWN); i++) {
        Characteristic id = static_cast<Characteristic>(i);
        if (uuidEquals(uuid, characteristicUuid(id))) {
            return id;
        }
    }
    return Characteristic::UNKNOWN;
}

const char* characteristicToString(Characteristic id) {
    switch (id) {
        case Characteristic::NUS_TX: return "NUS_TX";
        case Characteristic::SAMPLE: return "SAMPLE";
        case Characteristic::REPS: return "REPS";
        case Characteristic::MODE: return "MODE";
        case Characteristic::VERSION: return "VERSION";
        case Characteristic::HEURISTIC: return "HEURISTIC";
        case Characteristic::UPDATE_STATE: return "UPDATE_STATE";
        case Characteristic::DIAGNOSTIC: return "DIAGNOSTIC";
        case Characteristic::NUS_RX: return "NUS_RX";
        default: return "UNKNOWN";
    }
}
