/**
 * @file serial_console.cpp
 * @brief VeeBridge serial console - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "serial_console.h"
#include "connection_state_machine.h"
#include "command_dispatcher.h"
#include "settings_manager.h"
#include "packet_encoder.h"
#include "log.h"
#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

// =============================================================================
// CONSTRUCTOR
// =============================================================================

SerialConsole::SerialConsole() :
    _connection(nullptr),
    _dispatcher(nullptr),
    _settings(nullptr),
    _sendCallback(nullptr),
    _lastHandle(INVALID_COMMAND_HANDLE),
    _now(0)
{
    _responseBuffer[0] = '\0';
}

void SerialConsole::begin(ConnectionStateMachine* connection,
                          CommandDispatcher* dispatcher,
                          SettingsManager* settings) {
    _connection = connection;
    _dispatcher = dispatcher;
    _settings = settings;
}

void SerialConsole::applySettings() {
    if (!_settings) {
        return;
    }
    if (_connection) {
        _connection->setPolicy(_settings->toConnectionPolicy());
    }
    if (_dispatcher) {
        _dispatcher->setRetryPolicy(_settings->toRetryPolicy());
        _dispatcher->setHeartbeatEnabled(_settings->getSettings().heartbeatEnabled);
    }
}

// =============================================================================
// COMMAND PROCESSING
// =============================================================================

bool SerialConsole::handleCommand(const char* message, uint32_t now) {
    if (!message || strlen(message) == 0) {
        return false;
    }

    _now = now;

    char command[PARAM_BUFFER_SIZE];
    char params[MAX_COMMAND_PARAMS][PARAM_BUFFER_SIZE];
    uint8_t paramCount = 0;

    if (!parseCommand(message, command, params, paramCount)) {
        sendError("Invalid command format");
        return false;
    }

    DEBUG_PRINTF("[CONSOLE] Command: %s, Params: %d\n", command, paramCount);

    if (strcmp(command, "SCAN") == 0) {
        return handleScan();
    } else if (strcmp(command, "DISCONNECT") == 0) {
        return handleDisconnect();
    } else if (strcmp(command, "STATUS") == 0) {
        return handleStatus();
    } else if (strcmp(command, "DIAG") == 0) {
        return handleDiag();
    } else if (strcmp(command, "INIT") == 0) {
        return submitCommand(DeviceCommand::init());
    } else if (strcmp(command, "PRESET") == 0) {
        return submitCommand(DeviceCommand::initPreset());
    } else if (strcmp(command, "START") == 0) {
        return submitCommand(DeviceCommand::start());
    } else if (strcmp(command, "STOP") == 0) {
        return submitCommand(DeviceCommand::stop());
    } else if (strcmp(command, "SOFTSTOP") == 0) {
        return submitCommand(DeviceCommand::stop(true));
    } else if (strcmp(command, "RESET") == 0) {
        return submitCommand(DeviceCommand::reset());
    } else if (strcmp(command, "PROGRAM") == 0) {
        return handleProgram(params, paramCount);
    } else if (strcmp(command, "ECHO") == 0) {
        return handleEcho(params, paramCount);
    } else if (strcmp(command, "LEGACY") == 0) {
        return handleLegacy(params, paramCount);
    } else if (strcmp(command, "COLOR") == 0) {
        return handleColor(params, paramCount);
    } else if (strcmp(command, "CANCEL") == 0) {
        return handleCancel(params, paramCount);
    } else if (strcmp(command, "SET") == 0) {
        return handleSet(params, paramCount);
    } else if (strcmp(command, "SAVE") == 0) {
        return handleSave();
    } else if (strcmp(command, "DEFAULTS") == 0) {
        return handleDefaults();
    } else if (strcmp(command, "VERSION") == 0) {
        return handleVersion();
    } else if (strcmp(command, "HELP") == 0) {
        return handleHelp();
    }

    char errorMsg[64];
    snprintf(errorMsg, sizeof(errorMsg), "Unknown command: %s", command);
    sendError(errorMsg);
    return false;
}

// =============================================================================
// COMMAND PARSING
// =============================================================================

bool SerialConsole::parseCommand(const char* message, char* command, char params[][PARAM_BUFFER_SIZE], uint8_t& paramCount) {
    if (!message || !command || !params) {
        return false;
    }

    // Create a working copy
    char buffer[SERIAL_LINE_MAX];
    strncpy(buffer, message, sizeof(buffer) - 1);
    buffer[sizeof(buffer) - 1] = '\0';

    // Strip newlines and EOT
    char* p = buffer;
    while (*p) {
        if (*p == '\n' || *p == '\r' || *p == EOT_CHAR) {
            *p = '\0';
            break;
        }
        p++;
    }

    // Trim leading whitespace
    p = buffer;
    while (*p == ' ') p++;

    if (strlen(p) == 0) {
        return false;
    }

    // Split on colon
    paramCount = 0;
    char* token = strtok(p, ":");

    if (!token) {
        return false;
    }

    // First token is the command (uppercase it)
    strncpy(command, token, PARAM_BUFFER_SIZE - 1);
    command[PARAM_BUFFER_SIZE - 1] = '\0';

    for (char* c = command; *c; c++) {
        *c = static_cast<char>(toupper(static_cast<unsigned char>(*c)));
    }

    // Remaining tokens are parameters
    while ((token = strtok(nullptr, ":")) != nullptr && paramCount < MAX_COMMAND_PARAMS) {
        strncpy(params[paramCount], token, PARAM_BUFFER_SIZE - 1);
        params[paramCount][PARAM_BUFFER_SIZE - 1] = '\0';
        paramCount++;
    }

    return true;
}

static bool parseNumber(const char* token, long minValue, long maxValue, long& out) {
    if (!token || *token == '\0') {
        return false;
    }
    char* end = nullptr;
    long value = strtol(token, &end, 10);
    if (*end != '\0' || value < minValue || value > maxValue) {
        return false;
    }
    out = value;
    return true;
}

static bool parseFloat(const char* token, float& out) {
    if (!token || *token == '\0') {
        return false;
    }
    char* end = nullptr;
    float value = strtof(token, &end);
    if (*end != '\0') {
        return false;
    }
    out = value;
    return true;
}

bool SerialConsole::parseProgramMode(const char* token, ProgramMode& mode) {
    if (!token) {
        return false;
    }

    static const struct {
        const char* name;
        ProgramMode mode;
    } MODE_NAMES[] = {
        { "OLDSCHOOL", ProgramMode::OLD_SCHOOL },
        { "PUMP", ProgramMode::PUMP },
        { "TUT", ProgramMode::TUT },
        { "TUTBEAST", ProgramMode::TUT_BEAST },
        { "ECCENTRIC", ProgramMode::ECCENTRIC_ONLY }
    };

    for (size_t i = 0; i < sizeof(MODE_NAMES) / sizeof(MODE_NAMES[0]); i++) {
        if (strcasecmp(token, MODE_NAMES[i].name) == 0) {
            mode = MODE_NAMES[i].mode;
            return true;
        }
    }

    long value = 0;
    if (parseNumber(token, 0, 255, value) && isValidProgramMode(static_cast<uint8_t>(value))) {
        mode = static_cast<ProgramMode>(value);
        return true;
    }
    return false;
}

bool SerialConsole::parseEchoLevel(const char* token, EchoLevel& level) {
    if (!token) {
        return false;
    }

    for (uint8_t i = 0; i <= static_cast<uint8_t>(EchoLevel::EPIC); i++) {
        EchoLevel candidate = static_cast<EchoLevel>(i);
        if (strcasecmp(token, echoLevelToString(candidate)) == 0) {
            level = candidate;
            return true;
        }
    }

    long value = 0;
    if (parseNumber(token, 0, static_cast<long>(EchoLevel::EPIC), value)) {
        level = static_cast<EchoLevel>(value);
        return true;
    }
    return false;
}

// =============================================================================
// RESPONSE FORMATTING
// =============================================================================

void SerialConsole::beginResponse() {
    _responseBuffer[0] = '\0';
}

void SerialConsole::addResponseLine(const char* key, const char* value) {
    char line[128];
    snprintf(line, sizeof(line), "%s:%s\n", key, value ? value : "");

    size_t currentLen = strlen(_responseBuffer);
    size_t lineLen = strlen(line);

    if (currentLen + lineLen < RESPONSE_BUFFER_SIZE - 2) {
        strcat(_responseBuffer, line);
    }
}

void SerialConsole::addResponseLine(const char* key, int32_t value) {
    char valueStr[16];
    snprintf(valueStr, sizeof(valueStr), "%ld", (long)value);
    addResponseLine(key, valueStr);
}

void SerialConsole::addResponseLine(const char* key, float value, uint8_t decimals) {
    char valueStr[16];
    char format[8];
    snprintf(format, sizeof(format), "%%.%df", decimals);
    snprintf(valueStr, sizeof(valueStr), format, value);
    addResponseLine(key, valueStr);
}

void SerialConsole::sendResponse() {
    // Add EOT terminator
    size_t len = strlen(_responseBuffer);
    if (len < RESPONSE_BUFFER_SIZE - 1) {
        _responseBuffer[len] = EOT_CHAR;
        _responseBuffer[len + 1] = '\0';
    }

    if (_sendCallback) {
        _sendCallback(_responseBuffer);
    }
}

void SerialConsole::sendError(const char* message) {
    beginResponse();
    addResponseLine("ERROR", message);
    sendResponse();
}

// =============================================================================
// LINK COMMANDS
// =============================================================================

bool SerialConsole::handleScan() {
    if (!_connection) {
        sendError("No connection");
        return false;
    }
    if (!_connection->startScan(_now)) {
        char errorMsg[64];
        snprintf(errorMsg, sizeof(errorMsg), "Cannot scan while %s",
                 connectionStateToString(_connection->getState()));
        sendError(errorMsg);
        return false;
    }

    beginResponse();
    addResponseLine("SCAN", _connection->getPolicy().namePrefix);
    sendResponse();
    return true;
}

bool SerialConsole::handleDisconnect() {
    if (!_connection || !_connection->disconnect(_now)) {
        sendError("Not connected");
        return false;
    }

    beginResponse();
    addResponseLine("STATE", connectionStateToString(_connection->getState()));
    sendResponse();
    return true;
}

bool SerialConsole::handleStatus() {
    if (!_connection) {
        sendError("No connection");
        return false;
    }

    const ConnectionSession& session = _connection->getSession();

    beginResponse();
    addResponseLine("STATE", connectionStateToString(session.state));
    if (session.state != ConnectionState::DISCONNECTED) {
        addResponseLine("DEVICE", session.deviceName);
        addResponseLine("RSSI", static_cast<int32_t>(session.rssi));
        addResponseLine("NOTIFY", static_cast<int32_t>(session.notificationCount));
        addResponseLine("DECODE_ERR", static_cast<int32_t>(session.decodeErrorCount));
    }

    FailureReason failure = _connection->getLastFailure();
    if (failure != FailureReason::NONE) {
        addResponseLine("FAILURE", failureReasonToString(failure));
        addResponseLine("KIND", errorKindToString(failureReasonToKind(failure)));
    }

    if (_dispatcher) {
        addResponseLine("QUEUE", static_cast<int32_t>(_dispatcher->getQueueDepth()));
        if (_lastHandle != INVALID_COMMAND_HANDLE) {
            char last[32];
            snprintf(last, sizeof(last), "%u:%s", _lastHandle,
                     commandStatusToString(_dispatcher->getStatus(_lastHandle)));
            addResponseLine("LAST", last);
        }
    }
    sendResponse();
    return true;
}

bool SerialConsole::handleDiag() {
    if (!_connection) {
        sendError("No connection");
        return false;
    }

    Result result = _connection->requestDiagnostics();
    if (result != Result::OK) {
        sendError(resultToString(result));
        return false;
    }

    beginResponse();
    addResponseLine("DIAG", "REQUESTED");
    sendResponse();
    return true;
}

// =============================================================================
// MACHINE COMMANDS
// =============================================================================

bool SerialConsole::submitCommand(const DeviceCommand& command) {
    if (!_dispatcher) {
        sendError("No dispatcher");
        return false;
    }

    CommandHandle handle = INVALID_COMMAND_HANDLE;
    Result result = _dispatcher->submit(command, handle);

    if (result != Result::OK) {
        char errorMsg[64];
        if (result == Result::ERROR_INVALID_PARAM) {
            snprintf(errorMsg, sizeof(errorMsg), "Invalid %s parameters", command.getName());
        } else {
            snprintf(errorMsg, sizeof(errorMsg), "%s not sent: %s", command.getName(), resultToString(result));
        }
        sendError(errorMsg);
        return false;
    }

    _lastHandle = handle;

    beginResponse();
    addResponseLine("CMD", static_cast<int32_t>(handle));
    addResponseLine("TYPE", command.getName());
    sendResponse();
    return true;
}

bool SerialConsole::handleProgram(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount) {
    // PROGRAM:mode:reps:warmup:kg[:progression[:JUSTLIFT|AMRAP]]
    if (paramCount < 4) {
        sendError("Usage: PROGRAM:mode:reps:warmup:kg[:progression[:JUSTLIFT|AMRAP]]");
        return false;
    }

    WorkoutParameters workout;
    long reps = 0;
    long warmup = 0;
    float weight = 0.0f;

    if (!parseProgramMode(params[0], workout.mode)) {
        sendError("Invalid mode");
        return false;
    }
    if (!parseNumber(params[1], 0, 255, reps) || !parseNumber(params[2], 0, 255, warmup)) {
        sendError("Invalid rep count");
        return false;
    }
    if (!parseFloat(params[3], weight)) {
        sendError("Invalid weight");
        return false;
    }

    workout.kind = WorkoutKind::PROGRAM;
    workout.reps = static_cast<uint8_t>(reps);
    workout.warmupReps = static_cast<uint8_t>(warmup);
    workout.weightPerCableKg = weight;

    if (paramCount > 4 && !parseFloat(params[4], workout.progressionKg)) {
        sendError("Invalid progression");
        return false;
    }
    if (paramCount > 5) {
        if (strcasecmp(params[5], "JUSTLIFT") == 0) {
            workout.isJustLift = true;
        } else if (strcasecmp(params[5], "AMRAP") == 0) {
            workout.isAMRAP = true;
        } else {
            sendError("Expected JUSTLIFT or AMRAP");
            return false;
        }
    }

    return submitCommand(DeviceCommand::forWorkout(workout));
}

bool SerialConsole::handleEcho(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount) {
    // ECHO:level:eccentric:warmup:target[:JUSTLIFT|AMRAP]
    if (paramCount < 4) {
        sendError("Usage: ECHO:level:eccentric:warmup:target[:JUSTLIFT|AMRAP]");
        return false;
    }

    EchoLevel level;
    long eccentric = 0;
    long warmup = 0;
    long target = 0;

    if (!parseEchoLevel(params[0], level)) {
        sendError("Invalid echo level");
        return false;
    }
    if (!parseNumber(params[1], 0, 1000, eccentric)) {
        sendError("Invalid eccentric load");
        return false;
    }
    if (!parseNumber(params[2], 0, 255, warmup) || !parseNumber(params[3], 0, 255, target)) {
        sendError("Invalid rep count");
        return false;
    }

    WorkoutParameters workout = WorkoutParameters::echo(level, static_cast<uint16_t>(eccentric),
                                                        static_cast<uint8_t>(target));
    workout.warmupReps = static_cast<uint8_t>(warmup);

    if (paramCount > 4) {
        if (strcasecmp(params[4], "JUSTLIFT") == 0) {
            workout.isJustLift = true;
        } else if (strcasecmp(params[4], "AMRAP") == 0) {
            workout.isAMRAP = true;
        } else {
            sendError("Expected JUSTLIFT or AMRAP");
            return false;
        }
    }

    return submitCommand(DeviceCommand::forWorkout(workout));
}

bool SerialConsole::handleLegacy(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount) {
    // LEGACY:mode:kg:reps
    if (paramCount < 3) {
        sendError("Usage: LEGACY:mode:kg:reps");
        return false;
    }

    ProgramMode mode;
    float weight = 0.0f;
    long reps = 0;

    if (!parseProgramMode(params[0], mode)) {
        sendError("Invalid mode");
        return false;
    }
    if (!parseFloat(params[1], weight)) {
        sendError("Invalid weight");
        return false;
    }
    if (!parseNumber(params[2], 0, 255, reps)) {
        sendError("Invalid rep count");
        return false;
    }

    return submitCommand(DeviceCommand::legacyWorkout(mode, weight, static_cast<uint8_t>(reps)));
}

bool SerialConsole::handleColor(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount) {
    long index = _settings ? _settings->getSettings().colorScheme : 0;

    if (paramCount > 0 && !parseNumber(params[0], 0, COLOR_SCHEME_COUNT - 1, index)) {
        sendError("Invalid color scheme (0-7)");
        return false;
    }

    return submitCommand(PacketEncoder::colorSchemeCommand(static_cast<uint8_t>(index)));
}

bool SerialConsole::handleCancel(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount) {
    long handle = 0;
    if (paramCount < 1 || !parseNumber(params[0], 1, 0xFFFF, handle)) {
        sendError("Usage: CANCEL:id");
        return false;
    }
    if (!_dispatcher || _dispatcher->cancel(static_cast<CommandHandle>(handle)) != Result::OK) {
        sendError("No such pending command");
        return false;
    }

    beginResponse();
    addResponseLine("CANCELLED", static_cast<int32_t>(handle));
    sendResponse();
    return true;
}

// =============================================================================
// SETTINGS COMMANDS
// =============================================================================

bool SerialConsole::handleSet(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount) {
    if (paramCount < 2) {
        sendError("Usage: SET:param:value");
        return false;
    }
    if (!_settings || !_settings->setParameter(params[0], params[1])) {
        char errorMsg[64];
        snprintf(errorMsg, sizeof(errorMsg), "Invalid value for %s", params[0]);
        sendError(errorMsg);
        return false;
    }

    applySettings();

    beginResponse();
    addResponseLine(params[0], params[1]);
    sendResponse();
    return true;
}

bool SerialConsole::handleSave() {
    if (!_settings || !_settings->saveSettings()) {
        sendError("Save failed");
        return false;
    }

    beginResponse();
    addResponseLine("SAVED", SETTINGS_FILE);
    sendResponse();
    return true;
}

bool SerialConsole::handleDefaults() {
    if (!_settings) {
        sendError("No settings");
        return false;
    }

    _settings->resetToDefaults();
    applySettings();

    beginResponse();
    addResponseLine("DEFAULTS", "OK");
    sendResponse();
    return true;
}

// =============================================================================
// SYSTEM COMMANDS
// =============================================================================

bool SerialConsole::handleVersion() {
    beginResponse();
    addResponseLine("NAME", FIRMWARE_NAME);
    addResponseLine("FW", FIRMWARE_VERSION);
    sendResponse();
    return true;
}

bool SerialConsole::handleHelp() {
    beginResponse();
    addResponseLine("LINK", "SCAN,DISCONNECT,STATUS,DIAG");
    addResponseLine("MACHINE", "INIT,PRESET,START,STOP,SOFTSTOP,RESET,COLOR[:0-7]");
    addResponseLine("PROGRAM", "mode:reps:warmup:kg[:progression[:JUSTLIFT|AMRAP]]");
    addResponseLine("ECHO", "level:eccentric:warmup:target[:JUSTLIFT|AMRAP]");
    addResponseLine("LEGACY", "mode:kg:reps");
    addResponseLine("QUEUE", "CANCEL:id");
    addResponseLine("SETTINGS", "SET:param:value,SAVE,DEFAULTS");
    addResponseLine("PARAMS", "RETRIES,GATT_TIMEOUT,CONNECT_RETRIES,HEARTBEAT,COLOR,PREFIX,DEBUG");
    sendResponse();
    return true;
}
