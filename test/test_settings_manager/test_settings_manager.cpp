/**
 * @file test_settings_manager.cpp
 * @brief Unit tests for SettingsManager class
 *
 * Tests:
 * - Defaults and policy conversion
 * - Parameter parsing and range checks
 * - Binary save/load round trip and corrupt file handling
 */

#include <unity.h>
#include <cstring>
#include "settings_manager.h"
#include "../mocks/memory_settings_store.h"

// Include source files directly for native testing
#include "../../src/log.cpp"
#include "../../src/settings_manager.cpp"

// =============================================================================
// TEST FIXTURES
// =============================================================================

static MemorySettingsStore store;
static SettingsManager* settings = nullptr;

void setUp(void) {
    setLogSink(nullptr);
    store.reset();
    settings = new SettingsManager();
    settings->begin(&store);
}

void tearDown(void) {
    delete settings;
    settings = nullptr;
}

static SettingsData* storedData() {
    return reinterpret_cast<SettingsData*>(store.contents);
}

// =============================================================================
// DEFAULTS
// =============================================================================

void test_defaults(void) {
    const BridgeSettings& s = settings->getSettings();
    TEST_ASSERT_EQUAL_UINT8(DEFAULT_GATT_RETRIES, s.gattRetries);
    TEST_ASSERT_EQUAL_UINT32(GATT_TIMEOUT_MS, s.gattTimeoutMs);
    TEST_ASSERT_EQUAL_UINT8(CONNECT_RETRY_COUNT - 1, s.connectRetries);
    TEST_ASSERT_TRUE(s.heartbeatEnabled);
    TEST_ASSERT_EQUAL_UINT8(0, s.colorScheme);
    TEST_ASSERT_EQUAL_STRING("Vee", s.namePrefix);
    TEST_ASSERT_FALSE(s.debugMode);
}

void test_storage_available_after_begin(void) {
    TEST_ASSERT_TRUE(settings->isStorageAvailable());
}

void test_begin_without_storage_uses_defaults(void) {
    store.mountResult = false;
    SettingsManager local;
    TEST_ASSERT_TRUE(local.begin(&store));
    TEST_ASSERT_FALSE(local.isStorageAvailable());
    TEST_ASSERT_FALSE(local.saveSettings());
    TEST_ASSERT_EQUAL_STRING("Vee", local.getSettings().namePrefix);
}

// =============================================================================
// POLICY CONVERSION
// =============================================================================

void test_connection_policy_from_settings(void) {
    settings->setParameter("CONNECT_RETRIES", "4");
    settings->setParameter("PREFIX", "VIT");

    ConnectionPolicy policy = settings->toConnectionPolicy();
    TEST_ASSERT_EQUAL_UINT8(5, policy.connectAttempts);
    TEST_ASSERT_EQUAL_STRING("VIT", policy.namePrefix);
    TEST_ASSERT_EQUAL_UINT32(SCAN_TIMEOUT_MS, policy.scanTimeoutMs);
    TEST_ASSERT_EQUAL_UINT32(CONNECTION_TIMEOUT_MS, policy.connectionTimeoutMs);
}

void test_default_connection_policy_matches_config(void) {
    ConnectionPolicy policy = settings->toConnectionPolicy();
    TEST_ASSERT_EQUAL_UINT8(CONNECT_RETRY_COUNT, policy.connectAttempts);
}

void test_retry_policy_from_settings(void) {
    settings->setParameter("RETRIES", "3");
    settings->setParameter("GATT_TIMEOUT", "2500");

    RetryPolicy policy = settings->toRetryPolicy();
    TEST_ASSERT_EQUAL_UINT8(3, policy.maxRetries);
    TEST_ASSERT_EQUAL_UINT32(2500, policy.gattTimeoutMs);
}

// =============================================================================
// SET PARAMETER
// =============================================================================

void test_setParameter_case_insensitive(void) {
    TEST_ASSERT_TRUE(settings->setParameter("retries", "0"));
    TEST_ASSERT_EQUAL_UINT8(0, settings->getSettings().gattRetries);
}

void test_setParameter_high_bit_name_rejected(void) {
    TEST_ASSERT_FALSE(settings->setParameter("retri\xC9s", "0"));
    TEST_ASSERT_FALSE(settings->setParameter("\xFF", "0"));
    TEST_ASSERT_EQUAL_UINT8(DEFAULT_GATT_RETRIES, settings->getSettings().gattRetries);
}

void test_setParameter_rejects_out_of_range(void) {
    TEST_ASSERT_FALSE(settings->setParameter("RETRIES", "6"));
    TEST_ASSERT_FALSE(settings->setParameter("GATT_TIMEOUT", "999"));
    TEST_ASSERT_FALSE(settings->setParameter("GATT_TIMEOUT", "30001"));
    TEST_ASSERT_FALSE(settings->setParameter("COLOR", "8"));
    TEST_ASSERT_FALSE(settings->setParameter("HEARTBEAT", "2"));
    TEST_ASSERT_EQUAL_UINT8(DEFAULT_GATT_RETRIES, settings->getSettings().gattRetries);
}

void test_setParameter_rejects_non_numeric(void) {
    TEST_ASSERT_FALSE(settings->setParameter("RETRIES", "two"));
    TEST_ASSERT_FALSE(settings->setParameter("RETRIES", "1x"));
    TEST_ASSERT_FALSE(settings->setParameter("RETRIES", ""));
}

void test_setParameter_unknown_name(void) {
    TEST_ASSERT_FALSE(settings->setParameter("VOLUME", "3"));
    TEST_ASSERT_FALSE(settings->setParameter(nullptr, "3"));
}

void test_setParameter_prefix_length(void) {
    TEST_ASSERT_FALSE(settings->setParameter("PREFIX", ""));
    TEST_ASSERT_FALSE(settings->setParameter("PREFIX", "ABCDEFGHIJKLMNOP"));
    TEST_ASSERT_TRUE(settings->setParameter("PREFIX", "ABCDEFGHIJKLMNO"));
    TEST_ASSERT_EQUAL_STRING("ABCDEFGHIJKLMNO", settings->getSettings().namePrefix);
}

void test_setParameter_flags(void) {
    TEST_ASSERT_TRUE(settings->setParameter("HEARTBEAT", "0"));
    TEST_ASSERT_TRUE(settings->setParameter("DEBUG", "1"));
    TEST_ASSERT_TRUE(settings->setParameter("COLOR", "4"));
    TEST_ASSERT_FALSE(settings->getSettings().heartbeatEnabled);
    TEST_ASSERT_TRUE(settings->getSettings().debugMode);
    TEST_ASSERT_EQUAL_UINT8(4, settings->getSettings().colorScheme);
}

void test_resetToDefaults(void) {
    settings->setParameter("RETRIES", "5");
    settings->setParameter("PREFIX", "XYZ");
    settings->resetToDefaults();
    TEST_ASSERT_EQUAL_UINT8(DEFAULT_GATT_RETRIES, settings->getSettings().gattRetries);
    TEST_ASSERT_EQUAL_STRING("Vee", settings->getSettings().namePrefix);
}

// =============================================================================
// PERSISTENCE
// =============================================================================

void test_save_writes_header(void) {
    TEST_ASSERT_TRUE(settings->saveSettings());
    TEST_ASSERT_TRUE(store.exists(SETTINGS_FILE));
    TEST_ASSERT_EQUAL(sizeof(SettingsData), store.size);
    TEST_ASSERT_EQUAL_HEX8(SETTINGS_MAGIC, storedData()->magic);
    TEST_ASSERT_EQUAL_UINT8(SETTINGS_VERSION, storedData()->version);
}

void test_save_then_load_restores_values(void) {
    settings->setParameter("RETRIES", "2");
    settings->setParameter("GATT_TIMEOUT", "8000");
    settings->setParameter("HEARTBEAT", "0");
    settings->setParameter("PREFIX", "VIT");
    TEST_ASSERT_TRUE(settings->saveSettings());

    SettingsManager reloaded;
    reloaded.begin(&store);
    const BridgeSettings& s = reloaded.getSettings();
    TEST_ASSERT_EQUAL_UINT8(2, s.gattRetries);
    TEST_ASSERT_EQUAL_UINT32(8000, s.gattTimeoutMs);
    TEST_ASSERT_FALSE(s.heartbeatEnabled);
    TEST_ASSERT_EQUAL_STRING("VIT", s.namePrefix);
}

void test_begin_without_load_keeps_defaults(void) {
    settings->setParameter("RETRIES", "4");
    settings->saveSettings();

    SettingsManager fresh;
    fresh.begin(&store, false);
    TEST_ASSERT_EQUAL_UINT8(DEFAULT_GATT_RETRIES, fresh.getSettings().gattRetries);
}

void test_load_missing_file(void) {
    TEST_ASSERT_FALSE(settings->loadSettings());
}

void test_load_rejects_bad_magic(void) {
    settings->saveSettings();
    storedData()->magic = 0x00;
    TEST_ASSERT_FALSE(settings->loadSettings());
}

void test_load_rejects_wrong_version(void) {
    settings->saveSettings();
    storedData()->version = SETTINGS_VERSION + 1;
    TEST_ASSERT_FALSE(settings->loadSettings());
}

void test_load_rejects_truncated_file(void) {
    settings->saveSettings();
    store.size = sizeof(SettingsData) - 1;
    TEST_ASSERT_FALSE(settings->loadSettings());
}

void test_load_keeps_default_for_invalid_field(void) {
    settings->setParameter("CONNECT_RETRIES", "1");
    settings->saveSettings();
    storedData()->gattRetries = 42;
    storedData()->gattTimeoutMs = 10;

    TEST_ASSERT_TRUE(settings->loadSettings());
    TEST_ASSERT_EQUAL_UINT8(DEFAULT_GATT_RETRIES, settings->getSettings().gattRetries);
    TEST_ASSERT_EQUAL_UINT32(GATT_TIMEOUT_MS, settings->getSettings().gattTimeoutMs);
    TEST_ASSERT_EQUAL_UINT8(1, settings->getSettings().connectRetries);
}

void test_save_reports_write_failure(void) {
    store.failWrites = true;
    TEST_ASSERT_FALSE(settings->saveSettings());
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Defaults
    RUN_TEST(test_defaults);
    RUN_TEST(test_storage_available_after_begin);
    RUN_TEST(test_begin_without_storage_uses_defaults);

    // Policies
    RUN_TEST(test_connection_policy_from_settings);
    RUN_TEST(test_default_connection_policy_matches_config);
    RUN_TEST(test_retry_policy_from_settings);

    // Parameters
    RUN_TEST(test_setParameter_case_insensitive);
    RUN_TEST(test_setParameter_high_bit_name_rejected);
    RUN_TEST(test_setParameter_rejects_out_of_range);
    RUN_TEST(test_setParameter_rejects_non_numeric);
    RUN_TEST(test_setParameter_unknown_name);
    RUN_TEST(test_setParameter_prefix_length);
    RUN_TEST(test_setParameter_flags);
    RUN_TEST(test_resetToDefaults);

    // Persistence
    RUN_TEST(test_save_writes_header);
    RUN_TEST(test_save_then_load_restores_values);
    RUN_TEST(test_begin_without_load_keeps_defaults);
    RUN_TEST(test_load_missing_file);
    RUN_TEST(test_load_rejects_bad_magic);
    RUN_TEST(test_load_rejects_wrong_version);
    RUN_TEST(test_load_rejects_truncated_file);
    RUN_TEST(test_load_keeps_default_for_invalid_field);
    RUN_TEST(test_save_reports_write_failure);

    return UNITY_END();
}
