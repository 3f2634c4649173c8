/**
 * @file packet_encoder.cpp
 * @brief VeeBridge packet encoder - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "packet_encoder.h"
#include "config.h"
#include "log.h"
#include <string.h>
#include <cmath>

// =============================================================================
// MODE PROFILES
// =============================================================================

/**
 * @brief Resistance curve written at offset 0x30 of the program frame
 *
 * Layout (LE): i16 @0x00, i16 @0x02, f32 @0x04, i16 @0x08, i16 @0x0A,
 * f32 @0x0C, i16 @0x10, i16 @0x12, f32 @0x14, i16 @0x18, i16 @0x1A, f32 @0x1C
 */
struct ModeProfileValues {
    ProgramMode mode;
    int16_t s00, s02; float f04;
    int16_t s08, s0a; float f0c;
    int16_t s10, s12; float f14;
    int16_t s18, s1a; float f1c;
};

static const ModeProfileValues MODE_PROFILES[] = {
    { ProgramMode::OLD_SCHOOL,     0,   20,  3.0f, 75,  600, 50.0f, -1300, -1200, 100.0f, -260, -110,  0.0f },
    { ProgramMode::PUMP,           50,  450, 10.0f, 500, 600, 50.0f, -700,  -550,  1.0f,   -100, -50,   1.0f },
    { ProgramMode::TUT,            250, 350, 7.0f, 450, 600, 50.0f, -900,  -700,  70.0f,  -100, -50,  14.0f },
    { ProgramMode::TUT_BEAST,      150, 250, 7.0f, 350, 450, 50.0f, -900,  -700,  70.0f,  -100, -50,  28.0f },
    { ProgramMode::ECCENTRIC_ONLY, 50,  550, 50.0f, 650, 750, 10.0f, -900, -700,  70.0f,  -100, -50,  20.0f },
};

static const uint8_t MODE_PROFILE_COUNT = sizeof(MODE_PROFILES) / sizeof(MODE_PROFILES[0]);

// =============================================================================
// ECHO LEVELS
// =============================================================================

struct EchoLevelValues {
    float gain;
    float cap;
};

// Indexed by EchoLevel
static const EchoLevelValues ECHO_LEVELS[] = {
    { 1.0f,   50.0f },  // HARD
    { 1.25f,  40.0f },  // HARDER
    { 1.667f, 30.0f },  // HARDEST
    { 3.333f, 15.0f },  // EPIC
};

#define ECHO_CONCENTRIC_PCT 50
#define ECHO_SMOOTHING 0.1f
#define ECHO_FLOOR 0.0f
#define ECHO_NEG_LIMIT -100.0f

// =============================================================================
// COLOR SCHEMES
// =============================================================================

const ColorSchemePreset COLOR_SCHEMES[COLOR_SCHEME_COUNT] = {
    { "Blue",   0.4f, { {0x00, 0xA8, 0xDD}, {0x00, 0xCF, 0xFC}, {0x5D, 0xDF, 0xFC} } },
    { "Green",  0.4f, { {0x7D, 0xC1, 0x47}, {0xA1, 0xD8, 0x6A}, {0xBA, 0xE0, 0x94} } },
    { "Teal",   0.4f, { {0x3E, 0x9A, 0xB7}, {0x83, 0xBE, 0xD1}, {0xC2, 0xDF, 0xE8} } },
    { "Yellow", 0.4f, { {0xFF, 0x90, 0x51}, {0xFF, 0xD6, 0x47}, {0xFF, 0xB7, 0x00} } },
    { "Pink",   0.4f, { {0xFF, 0x00, 0x4C}, {0xFF, 0x23, 0x8C}, {0xFF, 0x8C, 0x8C} } },
    { "Red",    0.4f, { {0xFF, 0x00, 0x00}, {0xFF, 0x55, 0x55}, {0xFF, 0xAA, 0xAA} } },
    { "Purple", 0.4f, { {0x88, 0x00, 0xFF}, {0xAA, 0x55, 0xFF}, {0xDD, 0xAA, 0xFF} } },
    { "None",   0.4f, { {0x00, 0x00, 0x00}, {0x00, 0x00, 0x00}, {0x00, 0x00, 0x00} } },
};

// Factory default preset sent right after connecting (Pink, brightness 0.4)
static const uint8_t INIT_PRESET_FRAME[COLOR_FRAME_SIZE] = {
    0x11, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00,
    0xCD, 0xCC, 0xCC, 0x3E,
    0xFF, 0x00, 0x4C, 0xFF, 0x23, 0x8C, 0xFF, 0x8C, 0x8C,
    0xFF, 0x00, 0x4C, 0xFF, 0x23, 0x8C, 0xFF, 0x8C, 0x8C
};

// =============================================================================
// OUTBOUND FRAME
// =============================================================================

OutboundFrame::OutboundFrame() :
    _length(0)
{
    memset(_data, 0, sizeof(_data));
}

bool OutboundFrame::operator==(const OutboundFrame& other) const {
    return _length == other._length && memcmp(_data, other._data, _length) == 0;
}

// =============================================================================
// LITTLE-ENDIAN WRITERS
// =============================================================================

void PacketEncoder::putU16(uint8_t* buf, size_t offset, uint16_t value) {
    buf[offset] = static_cast<uint8_t>(value & 0xFF);
    buf[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void PacketEncoder::putU32(uint8_t* buf, size_t offset, uint32_t value) {
    buf[offset] = static_cast<uint8_t>(value & 0xFF);
    buf[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buf[offset + 2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buf[offset + 3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

void PacketEncoder::putFloat(uint8_t* buf, size_t offset, float value) {
    uint32_t bits;
    memcpy(&bits, &value, sizeof(bits));
    putU32(buf, offset, bits);
}

// =============================================================================
// ENCODE
// =============================================================================

uint8_t PacketEncoder::frameLength(const DeviceCommand& command) {
    switch (command.getType()) {
        case CommandType::INIT:
        case CommandType::RESET:
        case CommandType::START:
        case CommandType::HEARTBEAT:
            return SHORT_FRAME_SIZE;
        case CommandType::STOP:
            return command.isSoftStop() ? SOFT_STOP_FRAME_SIZE : SHORT_FRAME_SIZE;
        case CommandType::INIT_PRESET:
        case CommandType::COLOR_SCHEME:
            return COLOR_FRAME_SIZE;
        case CommandType::PROGRAM_PARAMS:
            return PROGRAM_FRAME_SIZE;
        case CommandType::ECHO_CONTROL:
            return ECHO_FRAME_SIZE;
        case CommandType::LEGACY_WORKOUT:
            return LEGACY_WORKOUT_FRAME_SIZE;
        default:
            return 0;
    }
}

EncodeStatus PacketEncoder::encode(const DeviceCommand& command, OutboundFrame& frame) {
    uint8_t buf[MAX_FRAME_SIZE];
    memset(buf, 0, sizeof(buf));

    EncodeStatus status = EncodeStatus::OK;

    switch (command.getType()) {
        case CommandType::INIT:
        case CommandType::RESET:
            putU32(buf, 0, CMD_RESET);
            break;

        case CommandType::START:
            putU32(buf, 0, CMD_START);
            break;

        case CommandType::STOP:
            if (command.isSoftStop()) {
                buf[0] = CMD_STOP;
                buf[1] = 0x00;
            } else {
                putU32(buf, 0, CMD_HARD_STOP);
            }
            break;

        case CommandType::HEARTBEAT:
            // All zero
            break;

        case CommandType::INIT_PRESET:
            memcpy(buf, INIT_PRESET_FRAME, sizeof(INIT_PRESET_FRAME));
            break;

        case CommandType::PROGRAM_PARAMS:
            status = encodeProgram(command.getWorkout(), buf);
            break;

        case CommandType::ECHO_CONTROL:
            status = encodeEcho(command.getEcho(), buf);
            break;

        case CommandType::COLOR_SCHEME:
            status = encodeColor(command.getColor(), buf);
            break;

        case CommandType::LEGACY_WORKOUT:
            status = encodeLegacy(command.getLegacy(), buf);
            break;

        default:
            status = EncodeStatus::INVALID_ARGUMENT;
            break;
    }

    if (status != EncodeStatus::OK) {
        logPrintf("[ENCODE] Rejected %s: invalid argument\n", command.getName());
        frame._length = 0;
        return status;
    }

    uint8_t length = frameLength(command);
    memcpy(frame._data, buf, length);
    frame._length = length;
    return EncodeStatus::OK;
}

// =============================================================================
// PROGRAM FRAME (96 bytes)
// =============================================================================

EncodeStatus PacketEncoder::encodeProgram(const WorkoutParameters& params, uint8_t* buf) {
    if (!isValidWeight(params.weightPerCableKg)) {
        return EncodeStatus::INVALID_ARGUMENT;
    }
    if (!std::isfinite(params.progressionKg) ||
        std::fabs(params.progressionKg) > MAX_WEIGHT_PER_CABLE_KG) {
        return EncodeStatus::INVALID_ARGUMENT;
    }
    if (params.reps > MAX_REP_COUNT || params.warmupReps > MAX_REP_COUNT) {
        return EncodeStatus::INVALID_ARGUMENT;
    }
    if (!isValidProgramMode(static_cast<uint8_t>(params.mode))) {
        return EncodeStatus::INVALID_ARGUMENT;
    }

    putU32(buf, 0x00, CMD_ACTIVATION);

    buf[0x04] = params.isUnlimited()
        ? REPS_UNLIMITED
        : static_cast<uint8_t>((params.reps + params.warmupReps) & 0xFF);
    buf[0x05] = 0x03;
    buf[0x06] = 0x03;
    buf[0x07] = 0x00;

    putFloat(buf, 0x08, 5.0f);
    putFloat(buf, 0x0C, 5.0f);
    putFloat(buf, 0x1C, 5.0f);

    static const uint8_t RAMP[] = { 0xFA, 0x00, 0xFA, 0x00, 0xC8, 0x00, 0x1E, 0x00 };
    memcpy(buf + 0x14, RAMP, sizeof(RAMP));
    memcpy(buf + 0x24, RAMP, sizeof(RAMP));

    buf[0x2C] = 0xFA;
    buf[0x2D] = 0x00;
    buf[0x2E] = 0x50;
    buf[0x2F] = 0x00;

    // Echo sets and just-lift use the flat OldSchool curve
    ProgramMode profileMode = params.mode;
    if (params.isJustLift || params.kind == WorkoutKind::ECHO || profileMode == ProgramMode::ECHO) {
        profileMode = ProgramMode::OLD_SCHOOL;
    }
    getModeProfile(profileMode, buf + 0x30);

    float adjustedKg = params.weightPerCableKg;
    if (params.progressionKg != 0.0f) {
        adjustedKg = params.weightPerCableKg - params.progressionKg;
    }
    float effectiveKg = adjustedKg + 10.0f;

    putFloat(buf, 0x54, effectiveKg);
    putFloat(buf, 0x58, adjustedKg);
    putFloat(buf, 0x5C, params.progressionKg);

    DEBUG_PRINTF("[ENCODE] Program %s reps=%u weight=%.2fkg\n",
                 programModeToString(params.mode), buf[0x04], params.weightPerCableKg);
    return EncodeStatus::OK;
}

// =============================================================================
// ECHO FRAME (32 bytes)
// =============================================================================

int PacketEncoder::normalizeEccentricLoad(uint16_t pct) {
    if (pct == LEGACY_ECCENTRIC_PCT) {
        return 120;
    }
    if (pct > MAX_ECCENTRIC_LOAD_PCT) {
        return -1;
    }
    return pct;
}

EncodeStatus PacketEncoder::encodeEcho(const EchoSettings& echo, uint8_t* buf) {
    uint8_t level = static_cast<uint8_t>(echo.level);
    if (level >= sizeof(ECHO_LEVELS) / sizeof(ECHO_LEVELS[0])) {
        return EncodeStatus::INVALID_ARGUMENT;
    }
    if (echo.warmupReps > MAX_REP_COUNT || echo.targetReps > MAX_REP_COUNT) {
        return EncodeStatus::INVALID_ARGUMENT;
    }
    int eccentric = normalizeEccentricLoad(echo.eccentricPct);
    if (eccentric < 0) {
        return EncodeStatus::INVALID_ARGUMENT;
    }

    putU32(buf, 0x00, CMD_ECHO);
    buf[0x04] = echo.warmupReps;
    buf[0x05] = (echo.isJustLift || echo.isAMRAP) ? REPS_UNLIMITED : echo.targetReps;
    putU16(buf, 0x06, 0);

    putU16(buf, 0x08, static_cast<uint16_t>(eccentric));
    putU16(buf, 0x0A, ECHO_CONCENTRIC_PCT);
    putFloat(buf, 0x0C, ECHO_SMOOTHING);
    putFloat(buf, 0x10, ECHO_LEVELS[level].gain);
    putFloat(buf, 0x14, ECHO_LEVELS[level].cap);
    putFloat(buf, 0x18, ECHO_FLOOR);
    putFloat(buf, 0x1C, ECHO_NEG_LIMIT);

    DEBUG_PRINTF("[ENCODE] Echo %s eccentric=%d%%\n", echoLevelToString(echo.level), eccentric);
    return EncodeStatus::OK;
}

// =============================================================================
// COLOR FRAME (34 bytes)
// =============================================================================

EncodeStatus PacketEncoder::encodeColor(const ColorSettings& color, uint8_t* buf) {
    if (!std::isfinite(color.brightness) || color.brightness < 0.0f || color.brightness > 1.0f) {
        return EncodeStatus::INVALID_ARGUMENT;
    }

    putU32(buf, 0, CMD_COLOR);
    putU32(buf, 4, 0);
    putU32(buf, 8, 0);
    putFloat(buf, 12, color.brightness);

    // Triplets are sent twice
    size_t offset = 16;
    for (int pass = 0; pass < 2; pass++) {
        for (int i = 0; i < 3; i++) {
            buf[offset++] = color.colors[i].r;
            buf[offset++] = color.colors[i].g;
            buf[offset++] = color.colors[i].b;
        }
    }
    return EncodeStatus::OK;
}

DeviceCommand PacketEncoder::colorSchemeCommand(uint8_t schemeIndex) {
    if (schemeIndex >= COLOR_SCHEME_COUNT) {
        schemeIndex = 0;
    }
    const ColorSchemePreset& scheme = COLOR_SCHEMES[schemeIndex];
    return DeviceCommand::colorScheme(scheme.brightness, scheme.colors);
}

// =============================================================================
// LEGACY WORKOUT FRAME (25 bytes)
// =============================================================================

EncodeStatus PacketEncoder::encodeLegacy(const LegacyWorkoutSettings& legacy, uint8_t* buf) {
    if (!isValidProgramMode(static_cast<uint8_t>(legacy.mode)) || legacy.reps > MAX_REP_COUNT) {
        return EncodeStatus::INVALID_ARGUMENT;
    }

    uint8_t weight[2];
    if (encodeWeight(legacy.weightPerCableKg, weight) != EncodeStatus::OK) {
        return EncodeStatus::INVALID_ARGUMENT;
    }

    buf[0] = CMD_REGULAR;
    buf[1] = static_cast<uint8_t>(legacy.mode);
    buf[2] = weight[0];
    buf[3] = weight[1];
    buf[4] = legacy.reps;
    return EncodeStatus::OK;
}

// =============================================================================
// HELPERS
// =============================================================================

bool PacketEncoder::isValidWeight(float weightKg) {
    return std::isfinite(weightKg) && weightKg >= 0.0f && weightKg <= MAX_WEIGHT_PER_CABLE_KG;
}

EncodeStatus PacketEncoder::encodeWeight(float weightKg, uint8_t out[2]) {
    if (!isValidWeight(weightKg)) {
        return EncodeStatus::INVALID_ARGUMENT;
    }
    long scaled = std::lround(weightKg * WEIGHT_SCALE);
    putU16(out, 0, static_cast<uint16_t>(scaled));
    return EncodeStatus::OK;
}

bool PacketEncoder::getModeProfile(ProgramMode mode, uint8_t out[MODE_PROFILE_SIZE]) {
    for (uint8_t i = 0; i < MODE_PROFILE_COUNT; i++) {
        const ModeProfileValues& p = MODE_PROFILES[i];
        if (p.mode != mode) {
            continue;
        }

        memset(out, 0, MODE_PROFILE_SIZE);
        putU16(out, 0x00, static_cast<uint16_t>(p.s00));
        putU16(out, 0x02, static_cast<uint16_t>(p.s02));
        putFloat(out, 0x04, p.f04);
        putU16(out, 0x08, static_cast<uint16_t>(p.s08));
        putU16(out, 0x0A, static_cast<uint16_t>(p.s0a));
        putFloat(out, 0x0C, p.f0c);
        putU16(out, 0x10, static_cast<uint16_t>(p.s10));
        putU16(out, 0x12, static_cast<uint16_t>(p.s12));
        putFloat(out, 0x14, p.f14);
        putU16(out, 0x18, static_cast<uint16_t>(p.s18));
        putU16(out, 0x1A, static_cast<uint16_t>(p.s1a));
        putFloat(out, 0x1C, p.f1c);
        return true;
    }
    return false;
}
