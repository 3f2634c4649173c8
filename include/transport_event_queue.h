/**
 * @file transport_event_queue.h
 * @brief VeeBridge transport event queue - BLE callback to loop handoff
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Single-producer/single-consumer ring. Only the BLE stack callbacks
 * (SoftDevice task) push, loop() pops. Anything that runs on the loop task
 * must call the listener directly instead of pushing here. One slot is kept free to tell full from empty,
 * so the queue holds MAX_EVENTS - 1 events.
 */

#ifndef TRANSPORT_EVENT_QUEUE_H
#define TRANSPORT_EVENT_QUEUE_H

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include "config.h"
#include "ble_transport.h"

// =============================================================================
// TRANSPORT EVENT
// =============================================================================

enum class TransportEventType : uint8_t {
    NONE = 0,
    ADVERTISEMENT,
    CONNECTED,
    CONNECT_FAILED,
    DISCONNECTED,
    NOTIFICATION
};

/**
 * @brief Snapshot of one stack callback
 */
struct TransportEvent {
    TransportEventType type;
    Advertisement adv;              // ADVERTISEMENT
    uint8_t reason;                 // CONNECT_FAILED, DISCONNECTED
    Characteristic source;          // NOTIFICATION
    uint8_t data[NOTIFY_BUFFER_SIZE];
    uint8_t length;

    TransportEvent() :
        type(TransportEventType::NONE),
        reason(0),
        source(Characteristic::UNKNOWN),
        length(0)
    {
        memset(data, 0, sizeof(data));
    }

    /**
     * @brief Hand the event to a listener
     */
    void deliver(BleTransportListener& listener) const {
        switch (type) {
            case TransportEventType::ADVERTISEMENT:
                listener.onAdvertisement(adv);
                break;
            case TransportEventType::CONNECTED:
                listener.onConnected();
                break;
            case TransportEventType::CONNECT_FAILED:
                listener.onConnectFailed(reason);
                break;
            case TransportEventType::DISCONNECTED:
                listener.onDisconnected(reason);
                break;
            case TransportEventType::NOTIFICATION:
                listener.onNotification(source, data, length);
                break;
            default:
                break;
        }
    }
};

// =============================================================================
// QUEUE
// =============================================================================

class TransportEventQueue {
public:
    static constexpr uint8_t MAX_EVENTS = TRANSPORT_EVENT_QUEUE_SIZE;

    TransportEventQueue() : _head(0), _tail(0), _dropped(0) {}

    /**
     * @brief Producer side: copy an event into the ring
     * @return false if full (event dropped and counted)
     */
    bool push(const TransportEvent& event) {
        uint8_t next = static_cast<uint8_t>((_head + 1) % MAX_EVENTS);
        if (next == _tail) {
            _dropped++;
            return false;
        }
        _events[_head] = event;
        _head = next;
        return true;
    }

    /**
     * @brief Convenience producer for notifications
     *
     * Payloads longer than NOTIFY_BUFFER_SIZE are truncated; the decoder
     * then rejects them on length.
     */
    bool pushNotification(Characteristic source, const uint8_t* data, size_t length) {
        TransportEvent event;
        event.type = TransportEventType::NOTIFICATION;
        event.source = source;
        size_t n = length < NOTIFY_BUFFER_SIZE ? length : NOTIFY_BUFFER_SIZE;
        if (data && n > 0) {
            memcpy(event.data, data, n);
        }
        event.length = static_cast<uint8_t>(n);
        return push(event);
    }

    /**
     * @brief Consumer side: take the oldest event
     * @return false if empty
     */
    bool pop(TransportEvent& event) {
        if (_tail == _head) {
            return false;
        }
        event = _events[_tail];
        _tail = static_cast<uint8_t>((_tail + 1) % MAX_EVENTS);
        return true;
    }

    bool hasPending() const { return _head != _tail; }

    uint8_t getPendingCount() const {
        return static_cast<uint8_t>((_head + MAX_EVENTS - _tail) % MAX_EVENTS);
    }

    uint32_t getDroppedCount() const { return _dropped; }

    void clear() {
        _head = 0;
        _tail = 0;
        _dropped = 0;
    }

private:
    TransportEvent _events[MAX_EVENTS];
    volatile uint8_t _head;     // Written by producer only
    volatile uint8_t _tail;     // Written by consumer only
    volatile uint32_t _dropped;
};

#endif // TRANSPORT_EVENT_QUEUE_H
