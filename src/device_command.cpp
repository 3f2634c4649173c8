/**
 * @file device_command.cpp
 * @brief VeeBridge device commands - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "device_command.h"

// =============================================================================
// CONSTRUCTORS
// =============================================================================

DeviceCommand::DeviceCommand() :
    DeviceCommand(CommandType::INIT)
{
}

DeviceCommand::DeviceCommand(CommandType type) :
    _type(type),
    _softStop(false)
{
    _echo.level = EchoLevel::HARD;
    _echo.warmupReps = DEFAULT_ROM_REPS;
    _echo.targetReps = DEFAULT_ECHO_TARGET_REPS;
    _echo.isJustLift = false;
    _echo.isAMRAP = false;
    _echo.eccentricPct = DEFAULT_ECCENTRIC_PCT;

    _color.brightness = 0.0f;

    _legacy.mode = ProgramMode::OLD_SCHOOL;
    _legacy.weightPerCableKg = 0.0f;
    _legacy.reps = 0;
}

// =============================================================================
// FACTORIES
// =============================================================================

DeviceCommand DeviceCommand::init() {
    return DeviceCommand(CommandType::INIT);
}

DeviceCommand DeviceCommand::start() {
    return DeviceCommand(CommandType::START);
}

DeviceCommand DeviceCommand::stop(bool soft) {
    DeviceCommand cmd(CommandType::STOP);
    cmd._softStop = soft;
    return cmd;
}

DeviceCommand DeviceCommand::reset() {
    return DeviceCommand(CommandType::RESET);
}

DeviceCommand DeviceCommand::initPreset() {
    return DeviceCommand(CommandType::INIT_PRESET);
}

DeviceCommand DeviceCommand::heartbeat() {
    return DeviceCommand(CommandType::HEARTBEAT);
}

DeviceCommand DeviceCommand::programParams(const WorkoutParameters& params) {
    DeviceCommand cmd(CommandType::PROGRAM_PARAMS);
    cmd._workout = params;
    return cmd;
}

DeviceCommand DeviceCommand::echoControl(EchoLevel level, uint8_t warmupReps, uint8_t targetReps,
                                         bool isJustLift, bool isAMRAP, uint16_t eccentricPct) {
    DeviceCommand cmd(CommandType::ECHO_CONTROL);
    cmd._echo.level = level;
    cmd._echo.warmupReps = warmupReps;
    cmd._echo.targetReps = targetReps;
    cmd._echo.isJustLift = isJustLift;
    cmd._echo.isAMRAP = isAMRAP;
    cmd._echo.eccentricPct = eccentricPct;
    return cmd;
}

DeviceCommand DeviceCommand::colorScheme(float brightness, const RGBColor colors[3]) {
    DeviceCommand cmd(CommandType::COLOR_SCHEME);
    cmd._color.brightness = brightness;
    for (int i = 0; i < 3; i++) {
        cmd._color.colors[i] = colors[i];
    }
    return cmd;
}

DeviceCommand DeviceCommand::legacyWorkout(ProgramMode mode, float weightPerCableKg, uint8_t reps) {
    DeviceCommand cmd(CommandType::LEGACY_WORKOUT);
    cmd._legacy.mode = mode;
    cmd._legacy.weightPerCableKg = weightPerCableKg;
    cmd._legacy.reps = reps;
    return cmd;
}

DeviceCommand DeviceCommand::forWorkout(const WorkoutParameters& params) {
    if (params.kind == WorkoutKind::ECHO) {
        return echoControl(params.echoLevel, params.warmupReps, params.reps,
                           params.isJustLift, params.isAMRAP, params.eccentricLoadPct);
    }
    return programParams(params);
}

// =============================================================================
// CLASSIFICATION
// =============================================================================

bool DeviceCommand::isIdempotent() const {
    switch (_type) {
        case CommandType::INIT:
        case CommandType::START:
        case CommandType::STOP:
        case CommandType::RESET:
        case CommandType::INIT_PRESET:
        case CommandType::COLOR_SCHEME:
        case CommandType::HEARTBEAT:
            return true;
        case CommandType::PROGRAM_PARAMS:
        case CommandType::ECHO_CONTROL:
        case CommandType::LEGACY_WORKOUT:
        default:
            return false;
    }
}

bool DeviceCommand::isStopOrReset() const {
    return _type == CommandType::STOP || _type == CommandType::RESET;
}

bool DeviceCommand::startsWorkout() const {
    return _type == CommandType::PROGRAM_PARAMS ||
           _type == CommandType::ECHO_CONTROL ||
           _type == CommandType::LEGACY_WORKOUT;
}
