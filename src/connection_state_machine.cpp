/**
 * @file connection_state_machine.cpp
 * @brief VeeBridge connection lifecycle - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "connection_state_machine.h"
#include "log.h"
#include <string.h>

// =============================================================================
// CONSTRUCTOR
// =============================================================================

ConnectionStateMachine::ConnectionStateMachine() :
    _transport(nullptr),
    _events(nullptr),
    _ackListener(nullptr),
    _lastFailure(FailureReason::NONE),
    _now(0)
{
}

// =============================================================================
// INITIALIZATION
// =============================================================================

void ConnectionStateMachine::begin(BleTransport* transport, EventBroadcaster* events) {
    _transport = transport;
    _events = events;
    _session.reset();
    _lastFailure = FailureReason::NONE;

    if (_transport) {
        _transport->setListener(this);
    }
    logPrintf("[CONN] Initialized: %s\n", connectionStateToString(_session.state));
}

// =============================================================================
// COMMANDS
// =============================================================================

bool ConnectionStateMachine::startScan(uint32_t now) {
    _now = now;

    if (!_transport || _session.state != ConnectionState::DISCONNECTED) {
        return false;
    }

    _lastFailure = FailureReason::NONE;
    _session.reset();
    transition(ConnectionTrigger::START_SCAN);

    logPrintf("[CONN] Scanning for '%s*' (%lums)\n", _policy.namePrefix,
              static_cast<unsigned long>(_policy.scanTimeoutMs));

    if (!_transport->startScan(_policy.namePrefix)) {
        logPrint("[CONN] ERROR: Scanner failed to start\n");
        fail(ConnectionTrigger::CONNECT_FAILED, FailureReason::SCAN_FAILED);
        return false;
    }
    return true;
}

bool ConnectionStateMachine::disconnect(uint32_t now) {
    _now = now;

    switch (_session.state) {
        case ConnectionState::SCANNING:
            _transport->stopScan();
            transition(ConnectionTrigger::DISCONNECT_REQUESTED);
            cleanup();
            return true;

        case ConnectionState::CONNECTING:
        case ConnectionState::READY:
            transition(ConnectionTrigger::DISCONNECT_REQUESTED);
            // Completion arrives as onDisconnected() or the grace timeout
            cleanup();
            return true;

        default:
            return false;
    }
}

Result ConnectionStateMachine::requestDiagnostics() {
    if (!isReady()) {
        return Result::ERROR_NOT_CONNECTED;
    }
    if (!_transport->hasCharacteristic(Characteristic::DIAGNOSTIC)) {
        return Result::ERROR_NOT_FOUND;
    }

    uint8_t buffer[NOTIFY_BUFFER_SIZE];
    size_t length = 0;
    Result result = _transport->read(Characteristic::DIAGNOSTIC, buffer, sizeof(buffer), length);
    if (result != Result::OK) {
        logPrintf("[CONN] Diagnostic read failed: %s\n", resultToString(result));
        return Result::ERROR_TRANSPORT;
    }

    onNotification(Characteristic::DIAGNOSTIC, buffer, length);
    return Result::OK;
}

// =============================================================================
// UPDATE (call in loop)
// =============================================================================

void ConnectionStateMachine::update(uint32_t now) {
    _now = now;

    if (!_transport) {
        return;
    }

    // Deferred stack callbacks land in the listener methods below
    _transport->poll();

    uint32_t elapsed = _now - _session.stateEnteredAt;

    switch (_session.state) {
        case ConnectionState::SCANNING:
            if (elapsed >= _policy.scanTimeoutMs) {
                logPrint("[CONN] Scan timeout, no matching device\n");
                _transport->stopScan();
                fail(ConnectionTrigger::TIMEOUT, FailureReason::SCAN_TIMEOUT);
            }
            break;

        case ConnectionState::CONNECTING:
            if (_session.retryAt != 0 && static_cast<int32_t>(_now - _session.retryAt) >= 0) {
                _session.retryAt = 0;
                attemptConnect();
            }
            if (_session.state == ConnectionState::CONNECTING && elapsed >= _policy.connectionTimeoutMs) {
                logPrint("[CONN] Connection timeout\n");
                fail(ConnectionTrigger::TIMEOUT, FailureReason::CONNECTION_TIMEOUT);
            }
            break;

        case ConnectionState::DISCONNECTING:
            if (elapsed >= DISCONNECT_GRACE_MS) {
                logPrint("[CONN] WARNING: No disconnect confirmation, forcing\n");
                transition(ConnectionTrigger::CLEANUP_DONE);
                cleanup();
            }
            break;

        default:
            break;
    }
}

// =============================================================================
// FRAME SINK
// =============================================================================

Result ConnectionStateMachine::writeFrame(const uint8_t* data, size_t length) {
    if (!isReady()) {
        return Result::ERROR_NOT_CONNECTED;
    }
    if (!data || length == 0) {
        return Result::ERROR_INVALID_PARAM;
    }
    return _transport->write(data, length);
}

// =============================================================================
// TRANSPORT LISTENER
// =============================================================================

void ConnectionStateMachine::onAdvertisement(const Advertisement& adv) {
    if (_session.state != ConnectionState::SCANNING || !matchesPrefix(adv.name)) {
        return;
    }

    logPrintf("[SCAN] Found '%s' RSSI:%d, connecting...\n", adv.name, adv.rssi);

    _transport->stopScan();
    _session.address = adv.address;
    strncpy(_session.deviceName, adv.name, sizeof(_session.deviceName) - 1);
    _session.deviceName[sizeof(_session.deviceName) - 1] = '\0';
    _session.rssi = adv.rssi;

    transition(ConnectionTrigger::DEVICE_FOUND);
    attemptConnect();
}

void ConnectionStateMachine::onConnected() {
    if (_session.state != ConnectionState::CONNECTING) {
        logPrintf("[CONN] WARNING: Unexpected link in %s, dropping\n",
                  connectionStateToString(_session.state));
        _transport->disconnect();
        return;
    }

    logPrintf("[CONN] Link up after %u attempt(s), discovering services...\n", _session.connectAttempts);
    discoverAndSubscribe();
}

void ConnectionStateMachine::onConnectFailed(uint8_t reason) {
    if (_session.state != ConnectionState::CONNECTING) {
        return;
    }

    logPrintf("[CONN] Connect attempt %u failed (reason=0x%02X)\n", _session.connectAttempts, reason);

    if (_session.connectAttempts < _policy.connectAttempts) {
        _session.retryAt = _now + _policy.connectRetryDelayMs;
        if (_session.retryAt == 0) {
            _session.retryAt = 1;
        }
        return;
    }

    fail(ConnectionTrigger::CONNECT_FAILED, FailureReason::CONNECT_REJECTED);
}

void ConnectionStateMachine::onDisconnected(uint8_t reason) {
    switch (_session.state) {
        case ConnectionState::READY: {
            logPrintf("[CONN] Link lost (reason=0x%02X)\n", reason);
            ConnectionState from = _session.state;
            _lastFailure = FailureReason::LINK_LOST;
            transition(ConnectionTrigger::LINK_DOWN, FailureReason::LINK_LOST);
            cleanup();
            publishLinkLost(ConnectionTransition(from, _session.state,
                                                 ConnectionTrigger::LINK_DOWN, FailureReason::LINK_LOST));
            break;
        }

        case ConnectionState::DISCONNECTING:
            logPrintf("[CONN] Disconnected (reason=0x%02X)\n", reason);
            transition(ConnectionTrigger::CLEANUP_DONE);
            cleanup();
            break;

        case ConnectionState::CONNECTING:
            logPrintf("[CONN] Link dropped during setup (reason=0x%02X)\n", reason);
            fail(ConnectionTrigger::LINK_DOWN, FailureReason::TRANSPORT_ERROR);
            break;

        default:
            break;
    }
}

void ConnectionStateMachine::onWriteComplete(bool success) {
    if (_ackListener) {
        _ackListener->onWriteAck(success);
    }
}

void ConnectionStateMachine::onNotification(Characteristic source, const uint8_t* data, size_t length) {
    if (_session.state != ConnectionState::READY && _session.state != ConnectionState::CONNECTING) {
        return;
    }

    _session.lastSeenAt = _now;
    _session.notificationCount++;

    BridgeEvent event;
    event.timestampMs = _now;
    event.source = source;
    event.decodeStatus = TelemetryDecoder::decode(source, data, length, event.telemetry);

    if (event.decodeStatus != DecodeStatus::OK) {
        // Local to the stream: counted, reported, connection unaffected
        _session.decodeErrorCount++;
        event.type = BridgeEventType::DECODE_ERROR;
        logPrintf("[DECODE] Dropped %s frame: %s (len=%u)\n", characteristicToString(source),
                  decodeStatusToString(event.decodeStatus), static_cast<unsigned>(length));
    } else {
        event.type = BridgeEventType::TELEMETRY;
    }

    if (_events) {
        _events->publish(event);
    }
}

// =============================================================================
// CONNECTION HELPERS
// =============================================================================

bool ConnectionStateMachine::matchesPrefix(const char* name) const {
    size_t prefixLen = strlen(_policy.namePrefix);
    return name && prefixLen > 0 && strncmp(name, _policy.namePrefix, prefixLen) == 0;
}

void ConnectionStateMachine::attemptConnect() {
    _session.connectAttempts++;

    Result result = _transport->connect(_session.address);
    if (result != Result::OK) {
        logPrintf("[CONN] connect() refused: %s\n", resultToString(result));
        onConnectFailed(0);
    }
}

void ConnectionStateMachine::discoverAndSubscribe() {
    if (_transport->discoverServices() != Result::OK) {
        logPrint("[CONN] ERROR: UART service not found\n");
        fail(ConnectionTrigger::DISCOVERY_FAILED, FailureReason::PROTOCOL_MISMATCH);
        return;
    }

    if (!_transport->hasCharacteristic(Characteristic::NUS_RX)) {
        logPrint("[CONN] ERROR: Command characteristic missing\n");
        fail(ConnectionTrigger::DISCOVERY_FAILED, FailureReason::PROTOCOL_MISMATCH);
        return;
    }

    for (uint8_t i = 0; i < NOTIFY_CHARACTERISTIC_COUNT; i++) {
        const NotifyCharacteristicInfo& info = NOTIFY_CHARACTERISTICS[i];

        if (!_transport->hasCharacteristic(info.id)) {
            if (info.required) {
                logPrintf("[CONN] ERROR: Required characteristic %s missing\n",
                          characteristicToString(info.id));
                fail(ConnectionTrigger::DISCOVERY_FAILED, FailureReason::PROTOCOL_MISMATCH);
                return;
            }
            logPrintf("[CONN] Optional characteristic %s not present\n", characteristicToString(info.id));
            continue;
        }

        Result result = _transport->subscribe(info.id);
        if (result != Result::OK) {
            logPrintf("[CONN] Subscribe %s failed: %s\n", characteristicToString(info.id),
                      resultToString(result));
            if (info.required) {
                fail(ConnectionTrigger::DISCOVERY_FAILED, FailureReason::TRANSPORT_ERROR);
                return;
            }
            continue;
        }

        _session.subscribedMask |= characteristicBit(info.id);
    }

    transition(ConnectionTrigger::SERVICES_DISCOVERED);
}

void ConnectionStateMachine::fail(ConnectionTrigger trigger, FailureReason reason) {
    _lastFailure = reason;
    transition(trigger, reason);
    cleanup();
    transition(ConnectionTrigger::CLEANUP_DONE, reason);
}

void ConnectionStateMachine::cleanup() {
    // Release every subscription even if the link is already gone
    for (uint8_t i = 0; i < NOTIFY_CHARACTERISTIC_COUNT; i++) {
        Characteristic id = NOTIFY_CHARACTERISTICS[i].id;
        if (!_session.isSubscribed(id)) {
            continue;
        }
        Result result = _transport->unsubscribe(id);
        if (result != Result::OK) {
            DEBUG_PRINTF("[CONN] Unsubscribe %s: %s\n", characteristicToString(id), resultToString(result));
        }
        _session.subscribedMask &= static_cast<uint16_t>(~characteristicBit(id));
    }

    _transport->disconnect();

    if (_session.state != ConnectionState::DISCONNECTING) {
        ConnectionState state = _session.state;
        uint32_t enteredAt = _session.stateEnteredAt;
        _session.reset();
        _session.state = state;
        _session.stateEnteredAt = enteredAt;
    }
}

// =============================================================================
// STATE TRANSITIONS
// =============================================================================

bool ConnectionStateMachine::transition(ConnectionTrigger trigger, FailureReason reason) {
    ConnectionState newState = determineNextState(trigger);

    if (newState == _session.state) {
        return false;
    }

    ConnectionState oldState = _session.state;
    _session.state = newState;
    _session.stateEnteredAt = _now;

    if (reason != FailureReason::NONE) {
        logPrintf("[CONN] %s -> %s [%s] (%s)\n",
                  connectionStateToString(oldState),
                  connectionStateToString(newState),
                  connectionTriggerToString(trigger),
                  failureReasonToString(reason));
    } else {
        logPrintf("[CONN] %s -> %s [%s]\n",
                  connectionStateToString(oldState),
                  connectionStateToString(newState),
                  connectionTriggerToString(trigger));
    }

    publishTransition(ConnectionTransition(oldState, newState, trigger, reason));
    return true;
}

void ConnectionStateMachine::publishTransition(const ConnectionTransition& transition) {
    if (!_events) {
        return;
    }
    BridgeEvent event;
    event.type = BridgeEventType::STATE_CHANGED;
    event.timestampMs = _now;
    event.transition = transition;
    _events->publish(event);
}

void ConnectionStateMachine::publishLinkLost(const ConnectionTransition& transition) {
    if (!_events) {
        return;
    }
    BridgeEvent event;
    event.type = BridgeEventType::LINK_LOST;
    event.timestampMs = _now;
    event.transition = transition;
    _events->publish(event);
}

ConnectionState ConnectionStateMachine::determineNextState(ConnectionTrigger trigger) const {
    ConnectionState current = _session.state;

    switch (trigger) {
        case ConnectionTrigger::START_SCAN:
            if (current == ConnectionState::DISCONNECTED) {
                return ConnectionState::SCANNING;
            }
            break;

        case ConnectionTrigger::DEVICE_FOUND:
            if (current == ConnectionState::SCANNING) {
                return ConnectionState::CONNECTING;
            }
            break;

        case ConnectionTrigger::SERVICES_DISCOVERED:
            if (current == ConnectionState::CONNECTING) {
                return ConnectionState::READY;
            }
            break;

        // =====================================================================
        // FAILURES
        // =====================================================================
        case ConnectionTrigger::TIMEOUT:
        case ConnectionTrigger::CONNECT_FAILED:
        case ConnectionTrigger::DISCOVERY_FAILED:
            if (current == ConnectionState::SCANNING || current == ConnectionState::CONNECTING) {
                return ConnectionState::FAILED;
            }
            break;

        case ConnectionTrigger::LINK_DOWN:
            if (current == ConnectionState::READY) {
                // Bypasses DISCONNECTING
                return ConnectionState::DISCONNECTED;
            }
            if (current == ConnectionState::CONNECTING) {
                return ConnectionState::FAILED;
            }
            break;

        // =====================================================================
        // TEARDOWN
        // =====================================================================
        case ConnectionTrigger::DISCONNECT_REQUESTED:
            if (current == ConnectionState::SCANNING) {
                return ConnectionState::DISCONNECTED;
            }
            if (current == ConnectionState::CONNECTING || current == ConnectionState::READY) {
                return ConnectionState::DISCONNECTING;
            }
            break;

        case ConnectionTrigger::CLEANUP_DONE:
            if (current == ConnectionState::FAILED || current == ConnectionState::DISCONNECTING) {
                return ConnectionState::DISCONNECTED;
            }
            break;

        default:
            break;
    }

    // No valid transition - stay in current state
    return current;
}
