/**
 * @file test_telemetry_decoder.cpp
 * @brief Unit tests for TelemetryDecoder - Frame dispatch, descaling, length checks
 */

#include <unity.h>
#include <string.h>
#include "telemetry_decoder.h"

// Include source files directly for native testing
#include "../../src/log.cpp"
#include "../../src/protocol_constants.cpp"
#include "../../src/telemetry_decoder.cpp"

// =============================================================================
// TEST HELPERS
// =============================================================================

static void putU16(uint8_t* buf, size_t offset, uint16_t value) {
    buf[offset] = value & 0xFF;
    buf[offset + 1] = (value >> 8) & 0xFF;
}

static void putU32(uint8_t* buf, size_t offset, uint32_t value) {
    for (int i = 0; i < 4; i++) {
        buf[offset + i] = (value >> (8 * i)) & 0xFF;
    }
}

static void putFloat(uint8_t* buf, size_t offset, float value) {
    uint32_t bits;
    memcpy(&bits, &value, sizeof(bits));
    putU32(buf, offset, bits);
}

static void buildSample(uint8_t* frame) {
    memset(frame, 0, SAMPLE_FRAME_SIZE);
    putU32(frame, 0x00, 123456);
    // Cable A
    putU16(frame, 0x04, static_cast<uint16_t>(1234));       // 123.4 mm
    putU16(frame, 0x06, static_cast<uint16_t>(-250));       // -25.0 mm/s
    putU16(frame, 0x08, 2550);                              // 25.50 kg
    // Cable B
    putU16(frame, 0x0A, static_cast<uint16_t>(1200));
    putU16(frame, 0x0C, static_cast<uint16_t>(-150));
    putU16(frame, 0x0E, 2400);
    putU16(frame, 0x10, STATUS_SPOTTER_ACTIVE);
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    setLogSink(nullptr);
}

void tearDown(void) {
}

// =============================================================================
// SAMPLE FRAME TESTS
// =============================================================================

void test_sample_frame_decodes(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE];
    buildSample(frame);

    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::OK,
        TelemetryDecoder::decode(Characteristic::SAMPLE, frame, sizeof(frame), event));
    TEST_ASSERT_EQUAL(TelemetryType::SAMPLE, event.type);
    TEST_ASSERT_EQUAL_UINT32(123456, event.sample.ticks);
}

void test_sample_descaling(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE];
    buildSample(frame);

    TelemetrySample sample;
    TEST_ASSERT_EQUAL(DecodeStatus::OK, TelemetryDecoder::decodeSample(frame, sizeof(frame), sample));

    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 1234 / POSITION_SCALE, sample.cables[0].positionMm);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, -250 / VELOCITY_SCALE, sample.cables[0].velocityMmS);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 2550 / FORCE_SCALE, sample.cables[0].loadKg);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 120.0f, sample.cables[1].positionMm);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 24.0f, sample.cables[1].loadKg);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, -15.0f, sample.cables[1].velocityMmS);
}

void test_sample_combined_fields_derived_from_cables(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE];
    buildSample(frame);

    TelemetrySample sample;
    TEST_ASSERT_EQUAL(DecodeStatus::OK, TelemetryDecoder::decodeSample(frame, sizeof(frame), sample));

    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 121.7f, sample.positionMm);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, -20.0f, sample.velocityMmS);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 49.5f, sample.loadKg);
    // 49.5 kg * 9.80665 * 0.020 m/s
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 9.7086f, sample.powerW);
}

void test_sample_reserved_tail_ignored(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE];
    buildSample(frame);
    memset(frame + 0x12, 0xFF, SAMPLE_FRAME_SIZE - 0x12);

    TelemetrySample sample;
    TEST_ASSERT_EQUAL(DecodeStatus::OK, TelemetryDecoder::decodeSample(frame, sizeof(frame), sample));
    TEST_ASSERT_EQUAL_HEX16(STATUS_SPOTTER_ACTIVE, sample.status);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 49.5f, sample.loadKg);
}

void test_sample_status_flags(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE];
    buildSample(frame);

    TelemetrySample sample;
    TelemetryDecoder::decodeSample(frame, sizeof(frame), sample);
    TEST_ASSERT_TRUE(sample.isSpotterActive());
    TEST_ASSERT_FALSE(sample.isDeloadOccurred());
    TEST_ASSERT_FALSE(sample.isDeloadWarning());
}

void test_sample_deload_frame(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE];
    memset(frame, 0, sizeof(frame));
    putU32(frame, 0x00, 777);
    putU16(frame, 0x04, 1000);                  // cable A 100.0 mm
    putU16(frame, 0x08, 2500);                  // cable A 25.00 kg
    putU16(frame, 0x0A, 1000);                  // cable B 100.0 mm
    putU16(frame, 0x0E, 2500);                  // cable B 25.00 kg
    putU16(frame, 0x10, STATUS_DELOAD_OCCURRED);

    TelemetrySample sample;
    TEST_ASSERT_EQUAL(DecodeStatus::OK, TelemetryDecoder::decodeSample(frame, sizeof(frame), sample));
    TEST_ASSERT_EQUAL_HEX16(0x8000, sample.status);
    TEST_ASSERT_TRUE(sample.isDeloadOccurred());
    TEST_ASSERT_FALSE(sample.isDeloadWarning());
    TEST_ASSERT_FALSE(sample.isSpotterActive());
    TEST_ASSERT_TRUE(sample.isPositionValid());
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 100.0f, sample.positionMm);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 25.0f, sample.cables[0].loadKg);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 25.0f, sample.cables[1].loadKg);
}

void test_sample_position_range(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE];
    buildSample(frame);

    TelemetrySample sample;
    TelemetryDecoder::decodeSample(frame, sizeof(frame), sample);
    TEST_ASSERT_TRUE(sample.isPositionValid());

    putU16(frame, 0x04, static_cast<uint16_t>(-20000));    // -2000 mm
    TelemetryDecoder::decodeSample(frame, sizeof(frame), sample);
    TEST_ASSERT_FALSE(sample.isPositionValid());
}

void test_sample_wrong_length_rejected(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE + 4];
    memset(frame, 0, sizeof(frame));

    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::UNEXPECTED_LENGTH,
        TelemetryDecoder::decode(Characteristic::SAMPLE, frame, SAMPLE_FRAME_SIZE - 1, event));
    TEST_ASSERT_EQUAL(TelemetryType::NONE, event.type);

    TEST_ASSERT_EQUAL(DecodeStatus::UNEXPECTED_LENGTH,
        TelemetryDecoder::decode(Characteristic::SAMPLE, frame, sizeof(frame), event));
}

// =============================================================================
// REPS FRAME TESTS
// =============================================================================

void test_rep_frame_decodes(void) {
    uint8_t frame[REPS_FRAME_SIZE];
    memset(frame, 0, sizeof(frame));
    putU32(frame, 0x00, 7);
    putU32(frame, 0x04, 6);
    putFloat(frame, 0x08, 812.5f);
    putFloat(frame, 0x0C, 105.0f);
    putU16(frame, 0x10, 3);
    putU16(frame, 0x14, 4);

    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::OK,
        TelemetryDecoder::decode(Characteristic::REPS, frame, sizeof(frame), event));
    TEST_ASSERT_EQUAL(TelemetryType::REP, event.type);
    TEST_ASSERT_EQUAL_INT32(7, event.rep.upCounter);
    TEST_ASSERT_EQUAL_INT32(6, event.rep.downCounter);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 812.5f, event.rep.rangeTop);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 105.0f, event.rep.rangeBottom);
    TEST_ASSERT_EQUAL_UINT16(3, event.rep.warmupReps);
    TEST_ASSERT_EQUAL_UINT16(4, event.rep.workingReps);
}

void test_rep_frame_wrong_length(void) {
    uint8_t frame[SAMPLE_FRAME_SIZE];
    memset(frame, 0, sizeof(frame));

    // A sample-sized frame on the reps characteristic is still wrong
    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::UNEXPECTED_LENGTH,
        TelemetryDecoder::decode(Characteristic::REPS, frame, sizeof(frame), event));
}

// =============================================================================
// OTHER CHARACTERISTICS
// =============================================================================

void test_diagnostic_frame(void) {
    uint8_t frame[DIAGNOSTIC_FRAME_SIZE + 4];
    memset(frame, 0, sizeof(frame));
    putU32(frame, 0, 3600);
    putU16(frame, 6, 12);
    frame[12] = static_cast<uint8_t>(-5);
    frame[13] = 41;

    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::OK,
        TelemetryDecoder::decode(Characteristic::DIAGNOSTIC, frame, sizeof(frame), event));
    TEST_ASSERT_EQUAL(TelemetryType::DIAGNOSTIC, event.type);
    TEST_ASSERT_EQUAL_UINT32(3600, event.diagnostic.uptimeSec);
    TEST_ASSERT_EQUAL_INT16(12, event.diagnostic.faults[1]);
    TEST_ASSERT_EQUAL_INT8(-5, event.diagnostic.temperatures[0]);
    TEST_ASSERT_EQUAL_INT8(41, event.diagnostic.temperatures[1]);
    TEST_ASSERT_TRUE(event.diagnostic.hasFaults());
}

void test_diagnostic_too_short(void) {
    uint8_t frame[DIAGNOSTIC_FRAME_SIZE - 1];
    memset(frame, 0, sizeof(frame));

    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::UNEXPECTED_LENGTH,
        TelemetryDecoder::decode(Characteristic::DIAGNOSTIC, frame, sizeof(frame), event));
}

void test_heuristic_frame(void) {
    uint8_t frame[HEURISTIC_FRAME_SIZE];
    memset(frame, 0, sizeof(frame));
    putFloat(frame, 0, 22.5f);
    putFloat(frame, 20, 310.0f);
    putFloat(frame, 24, 18.0f);

    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::OK,
        TelemetryDecoder::decode(Characteristic::HEURISTIC, frame, sizeof(frame), event));
    TEST_ASSERT_EQUAL(TelemetryType::HEURISTIC, event.type);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 22.5f, event.heuristic.concentric.kgAvg);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 310.0f, event.heuristic.concentric.wattMax);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 18.0f, event.heuristic.eccentric.kgAvg);
}

void test_mode_frame(void) {
    uint8_t frame[MODE_FRAME_SIZE] = { 0x02, 0x00, 0x00, 0x00 };

    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::OK,
        TelemetryDecoder::decode(Characteristic::MODE, frame, sizeof(frame), event));
    TEST_ASSERT_EQUAL(TelemetryType::MODE, event.type);
    TEST_ASSERT_EQUAL_UINT32(2, event.mode.mode);
}

void test_version_frame_truncated_to_max(void) {
    uint8_t frame[VERSION_MAX_LEN + 8];
    for (size_t i = 0; i < sizeof(frame); i++) {
        frame[i] = static_cast<uint8_t>(i);
    }

    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::OK,
        TelemetryDecoder::decode(Characteristic::VERSION, frame, sizeof(frame), event));
    TEST_ASSERT_EQUAL(TelemetryType::VERSION, event.type);
    TEST_ASSERT_EQUAL_UINT8(VERSION_MAX_LEN, event.version.length);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(frame, event.version.bytes, VERSION_MAX_LEN);
}

void test_empty_frames_rejected(void) {
    uint8_t frame[1] = { 0 };
    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::UNEXPECTED_LENGTH,
        TelemetryDecoder::decode(Characteristic::UPDATE_STATE, frame, 0, event));
    TEST_ASSERT_EQUAL(DecodeStatus::UNEXPECTED_LENGTH,
        TelemetryDecoder::decode(Characteristic::VERSION, frame, 0, event));
}

void test_unknown_characteristic(void) {
    uint8_t frame[4] = { 0 };
    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::UNKNOWN_CHARACTERISTIC,
        TelemetryDecoder::decode(Characteristic::NUS_RX, frame, sizeof(frame), event));
    TEST_ASSERT_EQUAL(DecodeStatus::UNKNOWN_CHARACTERISTIC,
        TelemetryDecoder::decode(Characteristic::UNKNOWN, frame, sizeof(frame), event));
}

void test_null_data(void) {
    TelemetryEvent event;
    TEST_ASSERT_EQUAL(DecodeStatus::NULL_DATA,
        TelemetryDecoder::decode(Characteristic::SAMPLE, nullptr, SAMPLE_FRAME_SIZE, event));
}

void test_expected_lengths(void) {
    TEST_ASSERT_EQUAL(28, TelemetryDecoder::expectedLength(Characteristic::SAMPLE));
    TEST_ASSERT_EQUAL(24, TelemetryDecoder::expectedLength(Characteristic::REPS));
    TEST_ASSERT_EQUAL(0, TelemetryDecoder::expectedLength(Characteristic::UNKNOWN));
}

// =============================================================================
// LITTLE-ENDIAN READER TESTS
// =============================================================================

void test_readers_are_little_endian(void) {
    const uint8_t buf[] = { 0x78, 0x56, 0x34, 0x12, 0xFF, 0xFF };
    TEST_ASSERT_EQUAL_HEX16(0x5678, TelemetryDecoder::getU16(buf, 0));
    TEST_ASSERT_EQUAL_HEX32(0x12345678, TelemetryDecoder::getU32(buf, 0));
    TEST_ASSERT_EQUAL_INT16(-1, TelemetryDecoder::getI16(buf, 4));
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Sample frame
    RUN_TEST(test_sample_frame_decodes);
    RUN_TEST(test_sample_descaling);
    RUN_TEST(test_sample_combined_fields_derived_from_cables);
    RUN_TEST(test_sample_reserved_tail_ignored);
    RUN_TEST(test_sample_status_flags);
    RUN_TEST(test_sample_deload_frame);
    RUN_TEST(test_sample_position_range);
    RUN_TEST(test_sample_wrong_length_rejected);

    // Reps frame
    RUN_TEST(test_rep_frame_decodes);
    RUN_TEST(test_rep_frame_wrong_length);

    // Other characteristics
    RUN_TEST(test_diagnostic_frame);
    RUN_TEST(test_diagnostic_too_short);
    RUN_TEST(test_heuristic_frame);
    RUN_TEST(test_mode_frame);
    RUN_TEST(test_version_frame_truncated_to_max);
    RUN_TEST(test_empty_frames_rejected);
    RUN_TEST(test_unknown_characteristic);
    RUN_TEST(test_null_data);
    RUN_TEST(test_expected_lengths);

    // Readers
    RUN_TEST(test_readers_are_little_endian);

    return UNITY_END();
}
