/**
 * @file event_broadcaster.h
 * @brief VeeBridge event fan-out - State and telemetry to multiple listeners
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Each subscriber owns a bounded mailbox. publish() copies the event into
 * every interested mailbox and never blocks; when a mailbox is full the
 * event is dropped for that subscriber only and counted. deliver() drains
 * at most a fixed budget per subscriber per call, so one slow consumer
 * cannot stall the others.
 */

#ifndef EVENT_BROADCASTER_H
#define EVENT_BROADCASTER_H

#include <stdint.h>
#include "config.h"
#include "types.h"
#include "telemetry_decoder.h"

// =============================================================================
// EVENTS
// =============================================================================

enum class BridgeEventType : uint8_t {
    STATE_CHANGED = 0,
    LINK_LOST,
    TELEMETRY,
    DECODE_ERROR
};

inline const char* bridgeEventTypeToString(BridgeEventType type) {
    switch (type) {
        case BridgeEventType::STATE_CHANGED: return "STATE_CHANGED";
        case BridgeEventType::LINK_LOST: return "LINK_LOST";
        case BridgeEventType::TELEMETRY: return "TELEMETRY";
        case BridgeEventType::DECODE_ERROR: return "DECODE_ERROR";
        default: return "UNKNOWN";
    }
}

// Subscription masks
#define EVENT_MASK_STATE      0x01
#define EVENT_MASK_LINK_LOST  0x02
#define EVENT_MASK_TELEMETRY  0x04
#define EVENT_MASK_ERRORS     0x08
#define EVENT_MASK_ALL        0x0F

inline uint8_t bridgeEventMask(BridgeEventType type) {
    return static_cast<uint8_t>(1u << static_cast<uint8_t>(type));
}

/**
 * @brief Represents a connection state transition
 */
struct ConnectionTransition {
    ConnectionState fromState;
    ConnectionState toState;
    ConnectionTrigger trigger;
    FailureReason reason;

    ConnectionTransition() :
        fromState(ConnectionState::DISCONNECTED),
        toState(ConnectionState::DISCONNECTED),
        trigger(ConnectionTrigger::CLEANUP_DONE),
        reason(FailureReason::NONE) {}

    ConnectionTransition(ConnectionState from, ConnectionState to, ConnectionTrigger trig,
                         FailureReason rsn = FailureReason::NONE) :
        fromState(from),
        toState(to),
        trigger(trig),
        reason(rsn) {}
};

/**
 * @brief Everything the core publishes
 *
 * STATE_CHANGED and LINK_LOST carry `transition`; TELEMETRY carries
 * `telemetry`; DECODE_ERROR carries `source` and `decodeStatus`.
 */
struct BridgeEvent {
    BridgeEventType type;
    uint32_t timestampMs;
    ConnectionTransition transition;
    TelemetryEvent telemetry;
    Characteristic source;
    DecodeStatus decodeStatus;

    BridgeEvent() :
        type(BridgeEventType::STATE_CHANGED),
        timestampMs(0),
        source(Characteristic::UNKNOWN),
        decodeStatus(DecodeStatus::OK) {}
};

typedef void (*BridgeEventCallback)(const BridgeEvent& event, void* context);

// =============================================================================
// BROADCASTER
// =============================================================================

class EventBroadcaster {
public:
    static constexpr int8_t INVALID_SUBSCRIBER = -1;

    EventBroadcaster();

    /**
     * @brief Register a subscriber
     * @param callback Called from deliver(); nullptr for a poll-only subscriber
     * @param context Passed back to the callback
     * @param mask EVENT_MASK_* bits the subscriber wants
     * @return Subscriber id, or INVALID_SUBSCRIBER if all slots are taken
     */
    int8_t subscribe(BridgeEventCallback callback, void* context, uint8_t mask = EVENT_MASK_ALL);

    bool unsubscribe(int8_t id);

    /**
     * @brief Remove all subscribers
     */
    void clear();

    /**
     * @brief Copy an event into each interested mailbox
     * @return Number of mailboxes that accepted it
     */
    uint8_t publish(const BridgeEvent& event);

    /**
     * @brief Run callbacks for queued events
     * @param budget Max events per subscriber in this call
     */
    void deliver(uint8_t budget = EVENT_DELIVERY_BUDGET);

    /**
     * @brief Take the oldest event from a subscriber's mailbox
     */
    bool poll(int8_t id, BridgeEvent& event);

    uint8_t getPendingCount(int8_t id) const;
    uint32_t getDroppedCount(int8_t id) const;
    uint8_t getSubscriberCount() const;

private:
    struct Mailbox {
        bool active;
        BridgeEventCallback callback;
        void* context;
        uint8_t mask;
        BridgeEvent events[SUBSCRIBER_MAILBOX_SIZE];
        uint8_t head;
        uint8_t count;
        uint32_t dropped;

        void reset() {
            active = false;
            callback = nullptr;
            context = nullptr;
            mask = 0;
            head = 0;
            count = 0;
            dropped = 0;
        }
    };

    Mailbox _mailboxes[MAX_EVENT_SUBSCRIBERS];

    bool isValid(int8_t id) const;
    bool take(Mailbox& box, BridgeEvent& event);
};

#endif // EVENT_BROADCASTER_H
