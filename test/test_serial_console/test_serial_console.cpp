/**
 * @file test_serial_console.cpp
 * @brief Unit tests for SerialConsole - Command parsing and responses
 */

#include <unity.h>
#include <string.h>
#include "serial_console.h"
#include "connection_state_machine.h"
#include "command_dispatcher.h"
#include "settings_manager.h"
#include "../mocks/mock_ble_transport.h"
#include "../mocks/memory_settings_store.h"

// Include source files directly for native testing
#include "../../src/log.cpp"
#include "../../src/protocol_constants.cpp"
#include "../../src/device_command.cpp"
#include "../../src/packet_encoder.cpp"
#include "../../src/telemetry_decoder.cpp"
#include "../../src/event_broadcaster.cpp"
#include "../../src/connection_state_machine.cpp"
#include "../../src/command_dispatcher.cpp"
#include "../../src/settings_manager.cpp"
#include "../../src/serial_console.cpp"

// =============================================================================
// TEST FIXTURES
// =============================================================================

static MockBleTransport transport;
static MemorySettingsStore store;
static EventBroadcaster events;
static ConnectionStateMachine connection;
static CommandDispatcher dispatcher;
static SettingsManager settings;
static SerialConsole console;

static char lastResponse[RESPONSE_BUFFER_SIZE];
static int responseCount;

static void captureResponse(const char* response) {
    strncpy(lastResponse, response, sizeof(lastResponse) - 1);
    lastResponse[sizeof(lastResponse) - 1] = '\0';
    responseCount++;
}

static bool responseContains(const char* text) {
    return strstr(lastResponse, text) != nullptr;
}

static void bringUp() {
    TEST_ASSERT_TRUE(console.handleCommand("SCAN", 1000));
    transport.fireAdvertisement("Vee-1234");
    transport.fireConnected();
    events.deliver();
    TEST_ASSERT_EQUAL(ConnectionState::READY, connection.getState());
    dispatcher.update(1000);
}

void setUp(void) {
    setLogSink(nullptr);
    transport.reset();
    store.reset();
    events.clear();

    connection = ConnectionStateMachine();
    connection.begin(&transport, &events);
    dispatcher = CommandDispatcher();
    dispatcher.begin(&connection, &events);
    settings = SettingsManager();
    settings.begin(&store);

    console = SerialConsole();
    console.begin(&connection, &dispatcher, &settings);
    console.setSendCallback(captureResponse);
    console.applySettings();
    dispatcher.setHeartbeatEnabled(false);

    memset(lastResponse, 0, sizeof(lastResponse));
    responseCount = 0;
}

void tearDown(void) {
}

// =============================================================================
// PARSING TESTS
// =============================================================================

void test_empty_message_ignored(void) {
    TEST_ASSERT_FALSE(console.handleCommand("", 0));
    TEST_ASSERT_FALSE(console.handleCommand(nullptr, 0));
    TEST_ASSERT_EQUAL(0, responseCount);
}

void test_blank_line_is_format_error(void) {
    TEST_ASSERT_FALSE(console.handleCommand("   \n", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Invalid command format\n\x04", lastResponse);
}

void test_unknown_command(void) {
    TEST_ASSERT_FALSE(console.handleCommand("JUMP", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Unknown command: JUMP\n\x04", lastResponse);
}

void test_high_bit_command_bytes_pass_through(void) {
    TEST_ASSERT_FALSE(console.handleCommand("j\xC9mp", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Unknown command: J\xC9MP\n\x04", lastResponse);
}

void test_command_is_case_insensitive_and_strips_newline(void) {
    TEST_ASSERT_TRUE(console.handleCommand("version\r\n", 0));
    TEST_ASSERT_EQUAL_STRING("NAME:" FIRMWARE_NAME "\nFW:" FIRMWARE_VERSION "\n\x04", lastResponse);
}

void test_help_lists_command_groups(void) {
    TEST_ASSERT_TRUE(console.handleCommand("HELP", 0));
    TEST_ASSERT_TRUE(responseContains("LINK:SCAN,DISCONNECT,STATUS,DIAG\n"));
    TEST_ASSERT_TRUE(responseContains("QUEUE:CANCEL:id\n"));
}

void test_parseProgramMode_names_and_numbers(void) {
    ProgramMode mode = ProgramMode::OLD_SCHOOL;
    TEST_ASSERT_TRUE(SerialConsole::parseProgramMode("pump", mode));
    TEST_ASSERT_EQUAL(ProgramMode::PUMP, mode);
    TEST_ASSERT_TRUE(SerialConsole::parseProgramMode("TUTBEAST", mode));
    TEST_ASSERT_EQUAL(ProgramMode::TUT_BEAST, mode);
    TEST_ASSERT_TRUE(SerialConsole::parseProgramMode("2", mode));
    TEST_ASSERT_EQUAL(ProgramMode::TUT, mode);
    TEST_ASSERT_FALSE(SerialConsole::parseProgramMode("7", mode));
    TEST_ASSERT_FALSE(SerialConsole::parseProgramMode("CARDIO", mode));
    TEST_ASSERT_FALSE(SerialConsole::parseProgramMode(nullptr, mode));
}

void test_parseEchoLevel_names_and_numbers(void) {
    EchoLevel level = EchoLevel::HARD;
    TEST_ASSERT_TRUE(SerialConsole::parseEchoLevel("epic", level));
    TEST_ASSERT_EQUAL(EchoLevel::EPIC, level);
    TEST_ASSERT_TRUE(SerialConsole::parseEchoLevel("1", level));
    TEST_ASSERT_EQUAL(EchoLevel::HARDER, level);
    TEST_ASSERT_FALSE(SerialConsole::parseEchoLevel("4", level));
    TEST_ASSERT_FALSE(SerialConsole::parseEchoLevel("EASY", level));
}

// =============================================================================
// LINK COMMAND TESTS
// =============================================================================

void test_scan_reports_prefix(void) {
    TEST_ASSERT_TRUE(console.handleCommand("SCAN", 100));
    TEST_ASSERT_EQUAL_STRING("SCAN:Vee\n\x04", lastResponse);
    TEST_ASSERT_EQUAL(ConnectionState::SCANNING, connection.getState());
    TEST_ASSERT_EQUAL_STRING("Vee", transport.lastScanPrefix);
}

void test_scan_uses_configured_prefix(void) {
    TEST_ASSERT_TRUE(console.handleCommand("SET:PREFIX:VIT", 0));
    TEST_ASSERT_EQUAL_STRING("PREFIX:VIT\n\x04", lastResponse);
    TEST_ASSERT_TRUE(console.handleCommand("SCAN", 100));
    TEST_ASSERT_EQUAL_STRING("VIT", transport.lastScanPrefix);
}

void test_scan_while_scanning_is_error(void) {
    console.handleCommand("SCAN", 100);
    TEST_ASSERT_FALSE(console.handleCommand("SCAN", 200));
    TEST_ASSERT_EQUAL_STRING("ERROR:Cannot scan while SCANNING\n\x04", lastResponse);
}

void test_status_when_disconnected(void) {
    TEST_ASSERT_TRUE(console.handleCommand("STATUS", 0));
    TEST_ASSERT_EQUAL_STRING("STATE:DISCONNECTED\nQUEUE:0\n\x04", lastResponse);
}

void test_status_when_ready(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("STATUS", 1100));
    TEST_ASSERT_TRUE(responseContains("STATE:READY\n"));
    TEST_ASSERT_TRUE(responseContains("DEVICE:Vee-1234\n"));
    TEST_ASSERT_TRUE(responseContains("RSSI:-60\n"));
    TEST_ASSERT_FALSE(responseContains("FAILURE"));
}

void test_status_reports_last_failure(void) {
    console.handleCommand("SCAN", 0);
    connection.update(SCAN_TIMEOUT_MS + 1);
    TEST_ASSERT_TRUE(console.handleCommand("STATUS", SCAN_TIMEOUT_MS + 2));
    TEST_ASSERT_TRUE(responseContains("FAILURE:SCAN_TIMEOUT\n"));
}

void test_disconnect_when_idle_is_error(void) {
    TEST_ASSERT_FALSE(console.handleCommand("DISCONNECT", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Not connected\n\x04", lastResponse);
}

void test_disconnect_when_ready(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("DISCONNECT", 1200));
    TEST_ASSERT_EQUAL_STRING("STATE:DISCONNECTING\n\x04", lastResponse);
    TEST_ASSERT_EQUAL(1, transport.disconnectCalls);
}

void test_diag_requires_connection(void) {
    TEST_ASSERT_FALSE(console.handleCommand("DIAG", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:NOT_CONNECTED\n\x04", lastResponse);
}

void test_diag_when_ready(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("DIAG", 1100));
    TEST_ASSERT_EQUAL_STRING("DIAG:REQUESTED\n\x04", lastResponse);
}

// =============================================================================
// MACHINE COMMAND TESTS
// =============================================================================

void test_machine_command_requires_connection(void) {
    TEST_ASSERT_FALSE(console.handleCommand("START", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:START not sent: NOT_CONNECTED\n\x04", lastResponse);
}

void test_start_reports_handle(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("START", 1100));
    TEST_ASSERT_EQUAL_STRING("CMD:1\nTYPE:START\n\x04", lastResponse);
    TEST_ASSERT_EQUAL_UINT16(1, console.getLastHandle());
    TEST_ASSERT_EQUAL(1, transport.writeCalls);
    TEST_ASSERT_EQUAL_HEX8(CMD_START, transport.writes[0][0]);
}

void test_softstop_sends_two_byte_frame(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("SOFTSTOP", 1100));
    TEST_ASSERT_TRUE(responseContains("TYPE:STOP\n"));
    TEST_ASSERT_EQUAL(2, transport.writeLengths[0]);
    TEST_ASSERT_EQUAL_HEX8(CMD_STOP, transport.writes[0][0]);
}

void test_program_command(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("PROGRAM:PUMP:10:3:20.5", 1100));
    TEST_ASSERT_EQUAL_STRING("CMD:1\nTYPE:PROGRAM_PARAMS\n\x04", lastResponse);
    TEST_ASSERT_EQUAL(PROGRAM_FRAME_SIZE, transport.writeLengths[0]);
    TEST_ASSERT_EQUAL_HEX8(13, transport.writes[0][4]);
}

void test_program_just_lift(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("PROGRAM:0:10:3:20:0.5:JUSTLIFT", 1100));
    TEST_ASSERT_EQUAL_HEX8(REPS_UNLIMITED, transport.writes[0][4]);
}

void test_program_usage_and_field_errors(void) {
    TEST_ASSERT_FALSE(console.handleCommand("PROGRAM:PUMP:10", 0));
    TEST_ASSERT_TRUE(responseContains("ERROR:Usage: PROGRAM"));

    TEST_ASSERT_FALSE(console.handleCommand("PROGRAM:CARDIO:10:3:20", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Invalid mode\n\x04", lastResponse);

    TEST_ASSERT_FALSE(console.handleCommand("PROGRAM:PUMP:ten:3:20", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Invalid rep count\n\x04", lastResponse);

    TEST_ASSERT_FALSE(console.handleCommand("PROGRAM:PUMP:10:3:heavy", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Invalid weight\n\x04", lastResponse);

    TEST_ASSERT_FALSE(console.handleCommand("PROGRAM:PUMP:10:3:20:0:FOREVER", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Expected JUSTLIFT or AMRAP\n\x04", lastResponse);
}

void test_program_negative_weight_is_rejected(void) {
    bringUp();
    TEST_ASSERT_FALSE(console.handleCommand("PROGRAM:PUMP:10:3:-5", 1100));
    TEST_ASSERT_EQUAL_STRING("ERROR:Invalid PROGRAM_PARAMS parameters\n\x04", lastResponse);
    TEST_ASSERT_EQUAL(0, transport.writeCalls);
}

void test_echo_command(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("ECHO:HARDER:120:3:8", 1100));
    TEST_ASSERT_TRUE(responseContains("TYPE:ECHO_CONTROL\n"));
    TEST_ASSERT_EQUAL(1, transport.writeCalls);
}

void test_echo_rejects_bad_level(void) {
    TEST_ASSERT_FALSE(console.handleCommand("ECHO:EASY:100:3:8", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Invalid echo level\n\x04", lastResponse);
}

void test_legacy_command(void) {
    bringUp();
    TEST_ASSERT_TRUE(console.handleCommand("LEGACY:OLDSCHOOL:25:10", 1100));
    TEST_ASSERT_TRUE(responseContains("TYPE:LEGACY_WORKOUT\n"));
    TEST_ASSERT_EQUAL_HEX8(CMD_REGULAR, transport.writes[0][0]);
}

void test_color_uses_saved_scheme_by_default(void) {
    bringUp();
    console.handleCommand("SET:COLOR:3", 1100);
    TEST_ASSERT_TRUE(console.handleCommand("COLOR", 1100));
    TEST_ASSERT_TRUE(responseContains("TYPE:COLOR_SCHEME\n"));
    TEST_ASSERT_EQUAL_HEX8(CMD_COLOR, transport.writes[0][0]);
}

void test_color_rejects_out_of_range(void) {
    TEST_ASSERT_FALSE(console.handleCommand("COLOR:8", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Invalid color scheme (0-7)\n\x04", lastResponse);
}

// =============================================================================
// QUEUE COMMAND TESTS
// =============================================================================

void test_cancel_queued_command(void) {
    bringUp();
    console.handleCommand("START", 1100);
    console.handleCommand("STOP", 1100);
    TEST_ASSERT_EQUAL(2, dispatcher.getQueueDepth());

    TEST_ASSERT_TRUE(console.handleCommand("CANCEL:2", 1100));
    TEST_ASSERT_EQUAL_STRING("CANCELLED:2\n\x04", lastResponse);
    TEST_ASSERT_EQUAL(CommandStatus::CANCELLED, dispatcher.getStatus(2));
}

void test_cancel_unknown_handle(void) {
    TEST_ASSERT_FALSE(console.handleCommand("CANCEL:99", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:No such pending command\n\x04", lastResponse);
    TEST_ASSERT_FALSE(console.handleCommand("CANCEL", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Usage: CANCEL:id\n\x04", lastResponse);
}

void test_status_shows_last_command(void) {
    bringUp();
    console.handleCommand("START", 1100);
    console.handleCommand("STATUS", 1100);
    TEST_ASSERT_TRUE(responseContains("QUEUE:1\n"));
    TEST_ASSERT_TRUE(responseContains("LAST:1:IN_FLIGHT\n"));
}

// =============================================================================
// SETTINGS COMMAND TESTS
// =============================================================================

void test_set_applies_retry_policy(void) {
    TEST_ASSERT_TRUE(console.handleCommand("SET:GATT_TIMEOUT:2500", 0));
    TEST_ASSERT_EQUAL_STRING("GATT_TIMEOUT:2500\n\x04", lastResponse);
    TEST_ASSERT_EQUAL_UINT32(2500, dispatcher.getRetryPolicy().gattTimeoutMs);
}

void test_set_applies_connect_retries(void) {
    TEST_ASSERT_TRUE(console.handleCommand("SET:CONNECT_RETRIES:0", 0));
    TEST_ASSERT_EQUAL_UINT8(1, connection.getPolicy().connectAttempts);
}

void test_set_rejects_bad_value(void) {
    TEST_ASSERT_FALSE(console.handleCommand("SET:RETRIES:9", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Invalid value for RETRIES\n\x04", lastResponse);
    TEST_ASSERT_FALSE(console.handleCommand("SET:RETRIES", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Usage: SET:param:value\n\x04", lastResponse);
}

void test_save_persists_settings(void) {
    console.handleCommand("SET:RETRIES:2", 0);
    TEST_ASSERT_TRUE(console.handleCommand("SAVE", 0));
    TEST_ASSERT_EQUAL_STRING("SAVED:" SETTINGS_FILE "\n\x04", lastResponse);
    TEST_ASSERT_EQUAL(1, store.writeCount);
}

void test_save_failure(void) {
    store.failWrites = true;
    TEST_ASSERT_FALSE(console.handleCommand("SAVE", 0));
    TEST_ASSERT_EQUAL_STRING("ERROR:Save failed\n\x04", lastResponse);
}

void test_defaults_restores_policies(void) {
    console.handleCommand("SET:PREFIX:VIT", 0);
    TEST_ASSERT_TRUE(console.handleCommand("DEFAULTS", 0));
    TEST_ASSERT_EQUAL_STRING("DEFAULTS:OK\n\x04", lastResponse);
    TEST_ASSERT_EQUAL_STRING("Vee", connection.getPolicy().namePrefix);
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Parsing
    RUN_TEST(test_empty_message_ignored);
    RUN_TEST(test_blank_line_is_format_error);
    RUN_TEST(test_unknown_command);
    RUN_TEST(test_high_bit_command_bytes_pass_through);
    RUN_TEST(test_command_is_case_insensitive_and_strips_newline);
    RUN_TEST(test_help_lists_command_groups);
    RUN_TEST(test_parseProgramMode_names_and_numbers);
    RUN_TEST(test_parseEchoLevel_names_and_numbers);

    // Link
    RUN_TEST(test_scan_reports_prefix);
    RUN_TEST(test_scan_uses_configured_prefix);
    RUN_TEST(test_scan_while_scanning_is_error);
    RUN_TEST(test_status_when_disconnected);
    RUN_TEST(test_status_when_ready);
    RUN_TEST(test_status_reports_last_failure);
    RUN_TEST(test_disconnect_when_idle_is_error);
    RUN_TEST(test_disconnect_when_ready);
    RUN_TEST(test_diag_requires_connection);
    RUN_TEST(test_diag_when_ready);

    // Machine
    RUN_TEST(test_machine_command_requires_connection);
    RUN_TEST(test_start_reports_handle);
    RUN_TEST(test_softstop_sends_two_byte_frame);
    RUN_TEST(test_program_command);
    RUN_TEST(test_program_just_lift);
    RUN_TEST(test_program_usage_and_field_errors);
    RUN_TEST(test_program_negative_weight_is_rejected);
    RUN_TEST(test_echo_command);
    RUN_TEST(test_echo_rejects_bad_level);
    RUN_TEST(test_legacy_command);
    RUN_TEST(test_color_uses_saved_scheme_by_default);
    RUN_TEST(test_color_rejects_out_of_range);

    // Queue
    RUN_TEST(test_cancel_queued_command);
    RUN_TEST(test_cancel_unknown_handle);
    RUN_TEST(test_status_shows_last_command);

    // Settings
    RUN_TEST(test_set_applies_retry_policy);
    RUN_TEST(test_set_applies_connect_retries);
    RUN_TEST(test_set_rejects_bad_value);
    RUN_TEST(test_save_persists_settings);
    RUN_TEST(test_save_failure);
    RUN_TEST(test_defaults_restores_policies);

    return UNITY_END();
}
