/**
 * @file device_command.h
 * @brief VeeBridge device commands - Typed requests sent to the machine
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * A DeviceCommand is a closed tagged variant. Construct it through the static
 * factories; it is never modified afterwards. PacketEncoder turns it into
 * the wire frame with an exhaustive switch over CommandType.
 */

#ifndef DEVICE_COMMAND_H
#define DEVICE_COMMAND_H

#include <stdint.h>
#include "types.h"
#include "protocol_constants.h"

// =============================================================================
// COMMAND TYPE
// =============================================================================

enum class CommandType : uint8_t {
    INIT = 0,
    START,
    STOP,
    RESET,
    INIT_PRESET,
    PROGRAM_PARAMS,
    ECHO_CONTROL,
    COLOR_SCHEME,
    HEARTBEAT,
    LEGACY_WORKOUT
};

inline const char* commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::INIT: return "INIT";
        case CommandType::START: return "START";
        case CommandType::STOP: return "STOP";
        case CommandType::RESET: return "RESET";
        case CommandType::INIT_PRESET: return "INIT_PRESET";
        case CommandType::PROGRAM_PARAMS: return "PROGRAM_PARAMS";
        case CommandType::ECHO_CONTROL: return "ECHO_CONTROL";
        case CommandType::COLOR_SCHEME: return "COLOR_SCHEME";
        case CommandType::HEARTBEAT: return "HEARTBEAT";
        case CommandType::LEGACY_WORKOUT: return "LEGACY_WORKOUT";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// PAYLOADS
// =============================================================================

enum class WorkoutKind : uint8_t {
    PROGRAM = 0,
    ECHO
};

/**
 * @brief Parameters for one set
 *
 * For PROGRAM sets `mode` selects the resistance profile. For ECHO sets
 * `echoLevel` and `eccentricLoadPct` apply and the profile falls back to
 * OLD_SCHOOL when the set is encoded as a program frame.
 */
struct WorkoutParameters {
    WorkoutKind kind;
    ProgramMode mode;
    EchoLevel echoLevel;
    uint16_t eccentricLoadPct;
    uint8_t reps;               // Working reps
    uint8_t warmupReps;
    float weightPerCableKg;
    float progressionKg;        // Per-rep progression (+) or regression (-)
    bool isJustLift;
    bool isAMRAP;

    WorkoutParameters() :
        kind(WorkoutKind::PROGRAM),
        mode(ProgramMode::OLD_SCHOOL),
        echoLevel(EchoLevel::HARD),
        eccentricLoadPct(100),
        reps(10),
        warmupReps(DEFAULT_ROM_REPS),
        weightPerCableKg(0.0f),
        progressionKg(0.0f),
        isJustLift(false),
        isAMRAP(false) {}

    static WorkoutParameters program(ProgramMode mode, uint8_t reps, float weightKg) {
        WorkoutParameters p;
        p.kind = WorkoutKind::PROGRAM;
        p.mode = mode;
        p.reps = reps;
        p.weightPerCableKg = weightKg;
        return p;
    }

    static WorkoutParameters echo(EchoLevel level, uint16_t eccentricPct, uint8_t reps) {
        WorkoutParameters p;
        p.kind = WorkoutKind::ECHO;
        p.mode = ProgramMode::ECHO;
        p.echoLevel = level;
        p.eccentricLoadPct = eccentricPct;
        p.reps = reps;
        return p;
    }

    /**
     * @brief True when the machine should count reps open-ended
     */
    bool isUnlimited() const { return isJustLift || isAMRAP; }
};

struct EchoSettings {
    EchoLevel level;
    uint8_t warmupReps;
    uint8_t targetReps;
    bool isJustLift;
    bool isAMRAP;
    uint16_t eccentricPct;
};

struct ColorSettings {
    float brightness;
    RGBColor colors[3];
};

struct LegacyWorkoutSettings {
    ProgramMode mode;
    float weightPerCableKg;
    uint8_t reps;
};

// =============================================================================
// DEVICE COMMAND
// =============================================================================

/**
 * @brief Typed command for the machine
 *
 * Usage:
 *   DeviceCommand stop = DeviceCommand::stop(true);
 *   DeviceCommand set = DeviceCommand::programParams(
 *       WorkoutParameters::program(ProgramMode::PUMP, 12, 20.0f));
 *
 *   OutboundFrame frame;
 *   if (PacketEncoder::encode(set, frame) == EncodeStatus::OK) { ... }
 */
class DeviceCommand {
public:
    DeviceCommand();

    static DeviceCommand init();
    static DeviceCommand start();
    static DeviceCommand stop(bool soft = false);
    static DeviceCommand reset();
    static DeviceCommand initPreset();
    static DeviceCommand heartbeat();
    static DeviceCommand programParams(const WorkoutParameters& params);
    static DeviceCommand echoControl(EchoLevel level,
                                     uint8_t warmupReps = DEFAULT_ROM_REPS,
                                     uint8_t targetReps = DEFAULT_ECHO_TARGET_REPS,
                                     bool isJustLift = false,
                                     bool isAMRAP = false,
                                     uint16_t eccentricPct = DEFAULT_ECCENTRIC_PCT);
    static DeviceCommand colorScheme(float brightness, const RGBColor colors[3]);
    static DeviceCommand legacyWorkout(ProgramMode mode, float weightPerCableKg, uint8_t reps);

    /**
     * @brief Build the command that starts a set
     *
     * Echo sets use the dedicated echo control frame, everything else the
     * 96-byte program frame.
     */
    static DeviceCommand forWorkout(const WorkoutParameters& params);

    CommandType getType() const { return _type; }
    const char* getName() const { return commandTypeToString(_type); }

    bool isSoftStop() const { return _type == CommandType::STOP && _softStop; }

    const WorkoutParameters& getWorkout() const { return _workout; }
    const EchoSettings& getEcho() const { return _echo; }
    const ColorSettings& getColor() const { return _color; }
    const LegacyWorkoutSettings& getLegacy() const { return _legacy; }

    /**
     * @brief Safe to resend after a GATT timeout
     */
    bool isIdempotent() const;

    /**
     * @brief Stop/Reset: later workout commands must wait for it
     */
    bool isStopOrReset() const;

    /**
     * @brief Loads a new set into the machine
     */
    bool startsWorkout() const;

private:
    explicit DeviceCommand(CommandType type);

    CommandType _type;
    bool _softStop;
    WorkoutParameters _workout;
    EchoSettings _echo;
    ColorSettings _color;
    LegacyWorkoutSettings _legacy;
};

#endif // DEVICE_COMMAND_H
