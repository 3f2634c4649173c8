/**
 * @file event_broadcaster.cpp
 * @brief VeeBridge event fan-out - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "event_broadcaster.h"
#include "log.h"

EventBroadcaster::EventBroadcaster() {
    clear();
}

// =============================================================================
// SUBSCRIPTION
// =============================================================================

int8_t EventBroadcaster::subscribe(BridgeEventCallback callback, void* context, uint8_t mask) {
    for (int8_t i = 0; i < MAX_EVENT_SUBSCRIBERS; i++) {
        Mailbox& box = _mailboxes[i];
        if (!box.active) {
            box.reset();
            box.active = true;
            box.callback = callback;
            box.context = context;
            box.mask = mask;
            return i;
        }
    }

    logPrint("[EVENTS] WARNING: Max subscribers reached\n");
    return INVALID_SUBSCRIBER;
}

bool EventBroadcaster::unsubscribe(int8_t id) {
    if (!isValid(id)) {
        return false;
    }
    _mailboxes[id].reset();
    return true;
}

void EventBroadcaster::clear() {
    for (int i = 0; i < MAX_EVENT_SUBSCRIBERS; i++) {
        _mailboxes[i].reset();
    }
}

bool EventBroadcaster::isValid(int8_t id) const {
    return id >= 0 && id < MAX_EVENT_SUBSCRIBERS && _mailboxes[id].active;
}

uint8_t EventBroadcaster::getSubscriberCount() const {
    uint8_t count = 0;
    for (int i = 0; i < MAX_EVENT_SUBSCRIBERS; i++) {
        if (_mailboxes[i].active) count++;
    }
    return count;
}

// =============================================================================
// PUBLISH / DELIVER
// =============================================================================

uint8_t EventBroadcaster::publish(const BridgeEvent& event) {
    uint8_t accepted = 0;
    uint8_t bit = bridgeEventMask(event.type);

    for (int i = 0; i < MAX_EVENT_SUBSCRIBERS; i++) {
        Mailbox& box = _mailboxes[i];
        if (!box.active || !(box.mask & bit)) {
            continue;
        }

        if (box.count >= SUBSCRIBER_MAILBOX_SIZE) {
            // Subscriber fell behind, drop for it alone
            box.dropped++;
            continue;
        }

        uint8_t slot = static_cast<uint8_t>((box.head + box.count) % SUBSCRIBER_MAILBOX_SIZE);
        box.events[slot] = event;
        box.count++;
        accepted++;
    }
    return accepted;
}

bool EventBroadcaster::take(Mailbox& box, BridgeEvent& event) {
    if (box.count == 0) {
        return false;
    }
    event = box.events[box.head];
    box.head = static_cast<uint8_t>((box.head + 1) % SUBSCRIBER_MAILBOX_SIZE);
    box.count--;
    return true;
}

void EventBroadcaster::deliver(uint8_t budget) {
    BridgeEvent event;
    for (int i = 0; i < MAX_EVENT_SUBSCRIBERS; i++) {
        for (uint8_t n = 0; n < budget; n++) {
            Mailbox& box = _mailboxes[i];
            // Callback may have unsubscribed itself
            if (!box.active || !box.callback) {
                break;
            }
            if (!take(box, event)) {
                break;
            }
            box.callback(event, box.context);
        }
    }
}

bool EventBroadcaster::poll(int8_t id, BridgeEvent& event) {
    if (!isValid(id)) {
        return false;
    }
    return take(_mailboxes[id], event);
}

uint8_t EventBroadcaster::getPendingCount(int8_t id) const {
    return isValid(id) ? _mailboxes[id].count : 0;
}

uint32_t EventBroadcaster::getDroppedCount(int8_t id) const {
    return isValid(id) ? _mailboxes[id].dropped : 0;
}
