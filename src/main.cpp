/**
 * @file main.cpp
 * @brief VeeBridge Firmware - Main Application
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * USB serial to Vitruvian trainer bridge:
 * - Scans for and connects to one machine as BLE central
 * - Serial console commands are encoded and written one at a time
 * - Machine telemetry is decoded and streamed back as text lines
 * - Settings persist in InternalFS
 * - Onboard NeoPixel shows the link state
 */

#include <Arduino.h>
#include "config.h"
#include "types.h"
#include "log.h"
#include "bluefruit_transport.h"
#include "connection_state_machine.h"
#include "command_dispatcher.h"
#include "event_broadcaster.h"
#include "littlefs_settings_store.h"
#include "settings_manager.h"
#include "serial_console.h"
#include "telemetry_reporter.h"
#include "status_led.h"
#include "neopixel_status_led.h"

// =============================================================================
// GLOBAL INSTANCES
// =============================================================================

BluefruitTransport transport;
EventBroadcaster events;
ConnectionStateMachine connection;
CommandDispatcher dispatcher;
LittleFsSettingsStore settingsStore;
SettingsManager settings;
SerialConsole console;
TelemetryReporter reporter;
StatusLed statusLed;
NeoPixelStatusLed statusPixel;

// =============================================================================
// STATE VARIABLES
// =============================================================================

bool bleReady = false;

// Serial line assembly
char serialLine[SERIAL_LINE_MAX];
uint8_t serialLineLength = 0;
bool serialLineOverflow = false;

// =============================================================================
// FUNCTION PROTOTYPES
// =============================================================================

void printBanner();
void pollSerial();

// Output sinks
void onLogLine(const char *text);
void onConsoleResponse(const char *response);
void onReportLine(const char *line);

// =============================================================================
// SETUP
// =============================================================================

void setup()
{
    // Initialize serial
    Serial.begin(SERIAL_BAUD_RATE);

    // Wait for serial with timeout
    uint32_t serialWaitStart = millis();
    while (!Serial && (millis() - serialWaitStart < 3000))
    {
        delay(10);
    }

    setLogSink(onLogLine);
    logPrintf("\n[BOOT] Serial ready at millis=%lu\n", (unsigned long)millis());

    printBanner();

    statusPixel.begin(&statusLed);

    // Settings first, the connection and dispatcher policies come from them
    logPrint("\n--- Settings Initialization ---\n");
    settings.begin(&settingsStore);

    logPrint("\n--- BLE Initialization ---\n");
    bleReady = transport.begin();
    if (!bleReady)
    {
        logPrint("[ERROR] BLE initialization failed\n");
    }

    connection.begin(&transport, &events);
    dispatcher.begin(&connection, &events);

    console.begin(&connection, &dispatcher, &settings);
    console.setSendCallback(onConsoleResponse);
    console.applySettings();

    if (!reporter.begin(&events, onReportLine))
    {
        logPrint("[WARNING] Telemetry reporter not subscribed\n");
    }
    reporter.setVerbose(settings.getSettings().debugMode);

    if (!statusLed.begin(&events))
    {
        logPrint("[WARNING] Status LED not subscribed\n");
    }

    logPrint("\n[SUCCESS] Ready. Send HELP for commands.\n");
}

// =============================================================================
// LOOP
// =============================================================================

void loop()
{
    uint32_t now = millis();

    // Host commands
    pollSerial();

    // Transport events, deadlines, state transitions
    connection.update(now);

    // Fan-out (dispatcher sees LINK_LOST here, reporter prints)
    events.deliver();

    // Write timeouts, next queued write, heartbeat
    dispatcher.update(now);

    reporter.setVerbose(settings.getSettings().debugMode);

    statusPixel.update(now);

    // Yield to the BLE stack task
    delay(1);
}

// =============================================================================
// SERIAL INPUT
// =============================================================================

void pollSerial()
{
    while (Serial.available())
    {
        int c = Serial.read();
        if (c < 0)
        {
            break;
        }

        if (c == '\n' || c == '\r' || c == EOT_CHAR)
        {
            if (serialLineOverflow)
            {
                onConsoleResponse("ERROR:Line too long\n\x04");
            }
            else if (serialLineLength > 0)
            {
                serialLine[serialLineLength] = '\0';
                DEBUG_PRINTF("[SERIAL] Command: %s\n", serialLine);
                console.handleCommand(serialLine, millis());
            }
            serialLineLength = 0;
            serialLineOverflow = false;
            continue;
        }

        if (serialLineLength < SERIAL_LINE_MAX - 1)
        {
            serialLine[serialLineLength++] = static_cast<char>(c);
        }
        else
        {
            serialLineOverflow = true;
        }
    }
}

// =============================================================================
// OUTPUT SINKS
// =============================================================================

void onLogLine(const char *text)
{
    Serial.print(text);
}

void onConsoleResponse(const char *response)
{
    Serial.print(response);
    Serial.flush();
}

void onReportLine(const char *line)
{
    Serial.print(line);
}

// =============================================================================
// BANNER
// =============================================================================

void printBanner()
{
    Serial.println(F("\n"));
    Serial.println(F("+============================================================+"));
    Serial.println(F("|                  VeeBridge Firmware                        |"));
    Serial.println(F("+============================================================+"));
    Serial.printf("|  Firmware: %-47s |\n", FIRMWARE_VERSION);
    Serial.println(F("|  Platform: Adafruit Feather nRF52840 Express              |"));
    Serial.println(F("+============================================================+"));
}
