/**
 * @file serial_console.h
 * @brief VeeBridge serial console - Text command processing
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Colon-separated commands, one per line, case-insensitive:
 * - Link: SCAN, DISCONNECT, STATUS, DIAG
 * - Machine: INIT, PRESET, START, STOP, SOFTSTOP, RESET, COLOR
 * - Sets: PROGRAM, ECHO, LEGACY
 * - Queue: CANCEL
 * - Settings: SET, SAVE, DEFAULTS
 * - System: VERSION, HELP
 */

#ifndef SERIAL_CONSOLE_H
#define SERIAL_CONSOLE_H

#include <stdint.h>
#include "config.h"
#include "types.h"
#include "device_command.h"
#include "command_dispatcher.h"

class ConnectionStateMachine;
class SettingsManager;

// =============================================================================
// CONSTANTS
// =============================================================================

// Message terminator (EOT character)
#define EOT_CHAR '\x04'

#define RESPONSE_BUFFER_SIZE 512
#define PARAM_BUFFER_SIZE 32
#define MAX_COMMAND_PARAMS 8

/**
 * @brief Callback for writing a response to the host
 */
typedef void (*SendResponseCallback)(const char* response);

// =============================================================================
// SERIAL CONSOLE CLASS
// =============================================================================

/**
 * @brief Host command controller for VeeBridge
 *
 * Responses are KEY:VALUE lines terminated by EOT; failures are a single
 * ERROR:message line.
 *
 * Usage:
 *   SerialConsole console;
 *   console.begin(&connection, &dispatcher, &settings);
 *   console.setSendCallback(onSendResponse);
 *
 *   console.handleCommand("PROGRAM:PUMP:10:3:20.5", millis());
 *   // Callback receives: "CMD:7\nTYPE:PROGRAM_PARAMS\n\x04"
 */
class SerialConsole {
public:
    SerialConsole();

    void begin(ConnectionStateMachine* connection,
               CommandDispatcher* dispatcher,
               SettingsManager* settings);

    void setSendCallback(SendResponseCallback callback) { _sendCallback = callback; }

    /**
     * @brief Handle one command line and send the response
     * @return true if the command was recognised and succeeded
     */
    bool handleCommand(const char* message, uint32_t now);

    /**
     * @brief Push current settings into the connection and dispatcher
     */
    void applySettings();

    CommandHandle getLastHandle() const { return _lastHandle; }

    // =========================================================================
    // PARSING HELPERS
    // =========================================================================

    static bool parseProgramMode(const char* token, ProgramMode& mode);
    static bool parseEchoLevel(const char* token, EchoLevel& level);

private:
    ConnectionStateMachine* _connection;
    CommandDispatcher* _dispatcher;
    SettingsManager* _settings;

    SendResponseCallback _sendCallback;
    CommandHandle _lastHandle;
    uint32_t _now;

    char _responseBuffer[RESPONSE_BUFFER_SIZE];

    bool parseCommand(const char* message, char* command, char params[][PARAM_BUFFER_SIZE], uint8_t& paramCount);

    // =========================================================================
    // RESPONSE FORMATTING
    // =========================================================================

    void beginResponse();
    void addResponseLine(const char* key, const char* value);
    void addResponseLine(const char* key, int32_t value);
    void addResponseLine(const char* key, float value, uint8_t decimals = 2);
    void sendResponse();
    void sendError(const char* message);

    // =========================================================================
    // COMMAND HANDLERS
    // =========================================================================

    bool handleScan();
    bool handleDisconnect();
    bool handleStatus();
    bool handleDiag();
    bool handleProgram(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount);
    bool handleEcho(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount);
    bool handleLegacy(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount);
    bool handleColor(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount);
    bool handleCancel(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount);
    bool handleSet(char params[][PARAM_BUFFER_SIZE], uint8_t paramCount);
    bool handleSave();
    bool handleDefaults();
    bool handleVersion();
    bool handleHelp();

    /**
     * @brief Submit to the dispatcher and report the handle or the error
     */
    bool submitCommand(const DeviceCommand& command);
};

#endif // SERIAL_CONSOLE_H
