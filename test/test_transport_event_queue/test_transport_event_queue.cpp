/**
 * @file test_transport_event_queue.cpp
 * @brief Unit tests for TransportEventQueue single-producer ring
 */

#include <unity.h>
#include "transport_event_queue.h"

// =============================================================================
// TEST FIXTURES
// =============================================================================

// Use a local instance for testing to avoid global state issues
static TransportEventQueue queue;

/**
 * @brief Records what a delivered event turned into
 */
class RecordingListener : public BleTransportListener {
public:
    int advertisements = 0;
    int connected = 0;
    uint8_t lastReason = 0;
    int connectFailures = 0;
    Characteristic lastSource = Characteristic::UNKNOWN;
    size_t lastLength = 0;

    void onAdvertisement(const Advertisement& adv) override { advertisements++; }
    void onConnected() override { connected++; }
    void onConnectFailed(uint8_t reason) override { connectFailures++; lastReason = reason; }
    void onDisconnected(uint8_t reason) override { lastReason = reason; }
    void onWriteComplete(bool success) override {}
    void onNotification(Characteristic source, const uint8_t* data, size_t length) override {
        lastSource = source;
        lastLength = length;
    }
};

static TransportEvent makeEvent(TransportEventType type) {
    TransportEvent event;
    event.type = type;
    return event;
}

void setUp(void) {
    queue.clear();
}

void tearDown(void) {
    queue.clear();
}

// =============================================================================
// TRANSPORT EVENT TESTS
// =============================================================================

void test_TransportEvent_default_constructor(void) {
    TransportEvent event;
    TEST_ASSERT_EQUAL(TransportEventType::NONE, event.type);
    TEST_ASSERT_EQUAL_UINT8(0, event.length);
    TEST_ASSERT_EQUAL(Characteristic::UNKNOWN, event.source);
    TEST_ASSERT_EQUAL_UINT8(0, event.reason);
}

void test_TransportEvent_deliver_routes_by_type(void) {
    RecordingListener listener;

    makeEvent(TransportEventType::CONNECTED).deliver(listener);
    TEST_ASSERT_EQUAL(1, listener.connected);

    TransportEvent down = makeEvent(TransportEventType::DISCONNECTED);
    down.reason = 0x13;
    down.deliver(listener);
    TEST_ASSERT_EQUAL_HEX8(0x13, listener.lastReason);

    TransportEvent failed = makeEvent(TransportEventType::CONNECT_FAILED);
    failed.reason = 0x3E;
    failed.deliver(listener);
    TEST_ASSERT_EQUAL(1, listener.connectFailures);
    TEST_ASSERT_EQUAL_HEX8(0x3E, listener.lastReason);
}

void test_TransportEvent_none_delivers_nothing(void) {
    RecordingListener listener;
    makeEvent(TransportEventType::NONE).deliver(listener);
    TEST_ASSERT_EQUAL(0, listener.connected);
    TEST_ASSERT_EQUAL(0, listener.advertisements);
}

// =============================================================================
// QUEUE TESTS
// =============================================================================

void test_queue_initial_state_empty(void) {
    TransportEvent event;
    TEST_ASSERT_FALSE(queue.hasPending());
    TEST_ASSERT_EQUAL_UINT8(0, queue.getPendingCount());
    TEST_ASSERT_FALSE(queue.pop(event));
}

void test_queue_preserves_order(void) {
    queue.push(makeEvent(TransportEventType::CONNECTED));
    queue.push(makeEvent(TransportEventType::NOTIFICATION));
    queue.push(makeEvent(TransportEventType::DISCONNECTED));
    TEST_ASSERT_EQUAL_UINT8(3, queue.getPendingCount());

    TransportEvent event;
    TEST_ASSERT_TRUE(queue.pop(event));
    TEST_ASSERT_EQUAL(TransportEventType::CONNECTED, event.type);
    TEST_ASSERT_TRUE(queue.pop(event));
    TEST_ASSERT_EQUAL(TransportEventType::NOTIFICATION, event.type);
    TEST_ASSERT_TRUE(queue.pop(event));
    TEST_ASSERT_EQUAL(TransportEventType::DISCONNECTED, event.type);
    TEST_ASSERT_FALSE(queue.hasPending());
}

void test_queue_full_drops_and_counts(void) {
    for (uint8_t i = 0; i < TransportEventQueue::MAX_EVENTS - 1; i++) {
        TEST_ASSERT_TRUE(queue.push(makeEvent(TransportEventType::CONNECTED)));
    }
    TEST_ASSERT_FALSE(queue.push(makeEvent(TransportEventType::DISCONNECTED)));
    TEST_ASSERT_EQUAL_UINT32(1, queue.getDroppedCount());
    TEST_ASSERT_EQUAL_UINT8(TransportEventQueue::MAX_EVENTS - 1, queue.getPendingCount());
}

void test_queue_wraps_around(void) {
    TransportEvent event;
    for (int round = 0; round < 3; round++) {
        for (uint8_t i = 0; i < TransportEventQueue::MAX_EVENTS - 1; i++) {
            queue.push(makeEvent(TransportEventType::CONNECTED));
        }
        for (uint8_t i = 0; i < TransportEventQueue::MAX_EVENTS - 1; i++) {
            TEST_ASSERT_TRUE(queue.pop(event));
        }
    }
    TEST_ASSERT_FALSE(queue.hasPending());
    TEST_ASSERT_EQUAL_UINT32(0, queue.getDroppedCount());
}

void test_push_notification_copies_payload(void) {
    const uint8_t payload[] = { 1, 2, 3, 4 };
    TEST_ASSERT_TRUE(queue.pushNotification(Characteristic::REPS, payload, sizeof(payload)));

    TransportEvent event;
    TEST_ASSERT_TRUE(queue.pop(event));
    TEST_ASSERT_EQUAL(TransportEventType::NOTIFICATION, event.type);
    TEST_ASSERT_EQUAL(Characteristic::REPS, event.source);
    TEST_ASSERT_EQUAL_UINT8(4, event.length);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(payload, event.data, 4);
}

void test_push_notification_truncates_oversized(void) {
    uint8_t payload[NOTIFY_BUFFER_SIZE + 10];
    memset(payload, 0xAB, sizeof(payload));
    queue.pushNotification(Characteristic::SAMPLE, payload, sizeof(payload));

    TransportEvent event;
    queue.pop(event);
    TEST_ASSERT_EQUAL_UINT8(NOTIFY_BUFFER_SIZE, event.length);

    RecordingListener listener;
    event.deliver(listener);
    TEST_ASSERT_EQUAL(Characteristic::SAMPLE, listener.lastSource);
    TEST_ASSERT_EQUAL(NOTIFY_BUFFER_SIZE, listener.lastLength);
}

void test_clear_resets_counters(void) {
    for (uint8_t i = 0; i < TransportEventQueue::MAX_EVENTS; i++) {
        queue.push(makeEvent(TransportEventType::CONNECTED));
    }
    queue.clear();
    TEST_ASSERT_FALSE(queue.hasPending());
    TEST_ASSERT_EQUAL_UINT32(0, queue.getDroppedCount());
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // TransportEvent
    RUN_TEST(test_TransportEvent_default_constructor);
    RUN_TEST(test_TransportEvent_deliver_routes_by_type);
    RUN_TEST(test_TransportEvent_none_delivers_nothing);

    // Queue
    RUN_TEST(test_queue_initial_state_empty);
    RUN_TEST(test_queue_preserves_order);
    RUN_TEST(test_queue_full_drops_and_counts);
    RUN_TEST(test_queue_wraps_around);
    RUN_TEST(test_push_notification_copies_payload);
    RUN_TEST(test_push_notification_truncates_oversized);
    RUN_TEST(test_clear_resets_counters);

    return UNITY_END();
}
