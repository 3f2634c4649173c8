/**
 * @file command_dispatcher.cpp
 * @brief VeeBridge command dispatcher - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "command_dispatcher.h"
#include "log.h"

// =============================================================================
// CONSTRUCTOR
// =============================================================================

CommandDispatcher::CommandDispatcher() :
    _sink(nullptr),
    _events(nullptr),
    _count(0),
    _inFlight(false),
    _historyNext(0),
    _nextHandle(1),
    _heartbeatEnabled(true),
    _lastActivityAt(0),
    _discardedAcks(0),
    _staleAcks(0),
    _now(0)
{
}

// =============================================================================
// INITIALIZATION
// =============================================================================

void CommandDispatcher::begin(FrameSink* sink, EventBroadcaster* events) {
    _sink = sink;
    _events = events;
    _count = 0;
    _inFlight = false;
    _staleAcks = 0;

    if (_sink) {
        _sink->setWriteAckListener(this);
    }
    if (_events) {
        int8_t id = _events->subscribe(handleBridgeEvent, this, EVENT_MASK_STATE | EVENT_MASK_LINK_LOST);
        if (id == EventBroadcaster::INVALID_SUBSCRIBER) {
            logPrint("[CMD] WARNING: No event slot, link loss detected by polling only\n");
        }
    }
}

// =============================================================================
// SUBMIT / CANCEL
// =============================================================================

Result CommandDispatcher::submit(const DeviceCommand& command, CommandHandle& handle,
                                 CommandCompleteCallback callback, void* context) {
    handle = INVALID_COMMAND_HANDLE;

    PendingCommand entry;
    entry.type = command.getType();
    entry.idempotent = command.isIdempotent();
    entry.cancelled = false;
    entry.attempts = 0;
    entry.sentAt = 0;
    entry.callback = callback;
    entry.context = context;

    // Encoding errors are caller bugs: reported now, never queued
    if (PacketEncoder::encode(command, entry.frame) != EncodeStatus::OK) {
        entry.handle = allocateHandle();
        handle = entry.handle;
        finish(entry, CommandStatus::REJECTED, ErrorKind::ENCODING);
        return Result::ERROR_INVALID_PARAM;
    }

    if (!_sink || !_sink->isWritable()) {
        return Result::ERROR_NOT_CONNECTED;
    }

    if (_count >= COMMAND_QUEUE_SIZE) {
        logPrintf("[CMD] Queue full, %s refused\n", command.getName());
        return Result::ERROR_QUEUE_FULL;
    }

    entry.handle = allocateHandle();
    _queue[_count++] = entry;
    handle = entry.handle;

    if (entry.type == CommandType::HEARTBEAT) {
        DEBUG_PRINTF("[CMD] #%u HEARTBEAT queued\n", handle);
    } else {
        logPrintf("[CMD] #%u %s queued (%u bytes, depth %u)\n", handle, command.getName(),
                  static_cast<unsigned>(entry.frame.length()), _count);
    }

    if (!_inFlight) {
        sendHead();
    }
    return Result::OK;
}

Result CommandDispatcher::cancel(CommandHandle handle) {
    for (uint8_t i = 0; i < _count; i++) {
        if (_queue[i].handle != handle) {
            continue;
        }

        if (i == 0 && _inFlight) {
            if (_queue[0].cancelled) {
                return Result::ERROR_NOT_FOUND;
            }
            // Keep the slot until the ack or timeout so the link stays single-flight
            _queue[0].cancelled = true;
            logPrintf("[CMD] #%u cancelled while in flight\n", handle);
            finish(_queue[0], CommandStatus::CANCELLED, ErrorKind::NONE);
            return Result::OK;
        }

        PendingCommand entry = _queue[i];
        removeAt(i);
        logPrintf("[CMD] #%u cancelled\n", handle);
        finish(entry, CommandStatus::CANCELLED, ErrorKind::NONE);
        return Result::OK;
    }
    return Result::ERROR_NOT_FOUND;
}

// =============================================================================
// UPDATE (call in loop)
// =============================================================================

void CommandDispatcher::update(uint32_t now) {
    _now = now;

    if (_inFlight && (_now - _queue[0].sentAt) >= _policy.gattTimeoutMs) {
        _inFlight = false;
        _staleAcks++;
        if (_queue[0].cancelled) {
            removeAt(0);
        } else {
            logPrintf("[CMD] #%u %s write timeout (attempt %u)\n", _queue[0].handle,
                      commandTypeToString(_queue[0].type), _queue[0].attempts);
            retryOrResolve(CommandStatus::TIMED_OUT, ErrorKind::TRANSPORT);
        }
    }

    if (!_inFlight && _count > 0) {
        if (!_sink || !_sink->isWritable()) {
            resolveAll(CommandStatus::LINK_LOST, ErrorKind::LINK_LOST);
        } else {
            sendHead();
        }
    }

    sendHeartbeatIfIdle();
}

// =============================================================================
// WRITE ACK
// =============================================================================

// The transport reports exactly one ack per accepted write, in write order,
// and the acks carry no id. A write that timed out still owes its ack, so
// the next _staleAcks acks belong to abandoned writes and are dropped rather
// than credited to whatever is in flight now.
void CommandDispatcher::onWriteAck(bool success) {
    if (_staleAcks > 0) {
        _staleAcks--;
        _discardedAcks++;
        DEBUG_PRINTF("[CMD] Ack for timed-out write discarded\n");
        return;
    }
    if (!_inFlight || _count == 0) {
        _discardedAcks++;
        DEBUG_PRINTF("[CMD] Late ack discarded\n");
        return;
    }

    _inFlight = false;
    _lastActivityAt = _now;

    if (_queue[0].cancelled) {
        _discardedAcks++;
        removeAt(0);
        return;
    }

    if (success) {
        resolveHead(CommandStatus::COMPLETED, ErrorKind::NONE);
    } else {
        logPrintf("[CMD] #%u %s write rejected by peer\n", _queue[0].handle,
                  commandTypeToString(_queue[0].type));
        retryOrResolve(CommandStatus::FAILED, ErrorKind::TRANSPORT);
    }
}

// =============================================================================
// EVENTS
// =============================================================================

void CommandDispatcher::handleBridgeEvent(const BridgeEvent& event, void* context) {
    static_cast<CommandDispatcher*>(context)->onBridgeEvent(event);
}

void CommandDispatcher::onBridgeEvent(const BridgeEvent& event) {
    if (event.type == BridgeEventType::LINK_LOST) {
        if (_count > 0) {
            logPrintf("[CMD] Link lost, discarding %u command(s)\n", _count);
        }
        resolveAll(CommandStatus::LINK_LOST, ErrorKind::LINK_LOST);
        return;
    }

    if (event.type != BridgeEventType::STATE_CHANGED) {
        return;
    }

    if (event.transition.toState == ConnectionState::READY) {
        _lastActivityAt = event.timestampMs;
    } else if (event.transition.fromState == ConnectionState::READY) {
        resolveAll(CommandStatus::LINK_LOST, ErrorKind::LINK_LOST);
    }
}

// =============================================================================
// STATUS
// =============================================================================

CommandStatus CommandDispatcher::getStatus(CommandHandle handle) const {
    if (handle == INVALID_COMMAND_HANDLE) {
        return CommandStatus::UNKNOWN;
    }

    for (uint8_t i = 0; i < _count; i++) {
        if (_queue[i].handle == handle && !_queue[i].cancelled) {
            return (i == 0 && _inFlight) ? CommandStatus::IN_FLIGHT : CommandStatus::PENDING;
        }
    }

    CommandOutcome outcome;
    if (getOutcome(handle, outcome)) {
        return outcome.status;
    }
    return CommandStatus::UNKNOWN;
}

bool CommandDispatcher::getOutcome(CommandHandle handle, CommandOutcome& outcome) const {
    for (uint8_t i = 0; i < COMMAND_HISTORY_SIZE; i++) {
        if (_history[i].handle == handle && handle != INVALID_COMMAND_HANDLE) {
            outcome = _history[i];
            return true;
        }
    }
    return false;
}

// =============================================================================
// INTERNALS
// =============================================================================

CommandHandle CommandDispatcher::allocateHandle() {
    CommandHandle handle = _nextHandle++;
    if (_nextHandle == INVALID_COMMAND_HANDLE) {
        _nextHandle = 1;
    }
    return handle;
}

void CommandDispatcher::sendHead() {
    if (_count == 0 || _inFlight) {
        return;
    }

    PendingCommand& head = _queue[0];
    head.attempts++;
    head.sentAt = _now;
    _lastActivityAt = _now;

    // Ack may be delivered from inside writeFrame()
    _inFlight = true;
    CommandHandle handle = head.handle;
    Result result = _sink->writeFrame(head.frame.data(), head.frame.length());

    if (result != Result::OK && _inFlight && _count > 0 && _queue[0].handle == handle) {
        _inFlight = false;
        logPrintf("[CMD] #%u write failed: %s\n", handle, resultToString(result));
        if (result == Result::ERROR_NOT_CONNECTED) {
            resolveAll(CommandStatus::LINK_LOST, ErrorKind::LINK_LOST);
        } else {
            retryOrResolve(CommandStatus::FAILED, ErrorKind::TRANSPORT);
        }
    }
}

void CommandDispatcher::retryOrResolve(CommandStatus status, ErrorKind error) {
    PendingCommand& head = _queue[0];

    if (head.idempotent && head.attempts <= _policy.maxRetries) {
        logPrintf("[CMD] #%u retrying %s (%u/%u)\n", head.handle, commandTypeToString(head.type),
                  head.attempts, _policy.maxRetries);
        // Resent on the next update()
        return;
    }
    resolveHead(status, error);
}

void CommandDispatcher::resolveHead(CommandStatus status, ErrorKind error) {
    PendingCommand entry = _queue[0];
    removeAt(0);
    finish(entry, status, error);
}

void CommandDispatcher::resolveAll(CommandStatus status, ErrorKind error) {
    _inFlight = false;
    // Nothing owed on a link that is gone
    _staleAcks = 0;

    while (_count > 0) {
        PendingCommand entry = _queue[0];
        removeAt(0);
        if (!entry.cancelled) {
            finish(entry, status, error);
        }
    }
}

void CommandDispatcher::removeAt(uint8_t index) {
    for (uint8_t i = index; i + 1 < _count; i++) {
        _queue[i] = _queue[i + 1];
    }
    _count--;
}

void CommandDispatcher::finish(const PendingCommand& command, CommandStatus status, ErrorKind error) {
    CommandOutcome outcome;
    outcome.handle = command.handle;
    outcome.type = command.type;
    outcome.status = status;
    outcome.error = error;
    outcome.attempts = command.attempts;
    outcome.resolvedAt = _now;

    record(outcome);

    if (command.type != CommandType::HEARTBEAT || status != CommandStatus::COMPLETED) {
        logPrintf("[CMD] #%u %s -> %s\n", command.handle, commandTypeToString(command.type),
                  commandStatusToString(status));
    }

    // Queue is consistent here, the callback may submit again
    if (command.callback) {
        command.callback(outcome, command.context);
    }
}

void CommandDispatcher::record(const CommandOutcome& outcome) {
    for (uint8_t i = 0; i < COMMAND_HISTORY_SIZE; i++) {
        if (_history[i].handle == outcome.handle) {
            _history[i] = outcome;
            return;
        }
    }
    _history[_historyNext] = outcome;
    _historyNext = (_historyNext + 1) % COMMAND_HISTORY_SIZE;
}

void CommandDispatcher::sendHeartbeatIfIdle() {
    if (!_heartbeatEnabled || _count > 0 || !_sink || !_sink->isWritable()) {
        return;
    }
    if ((_now - _lastActivityAt) < HEARTBEAT_INTERVAL_MS) {
        return;
    }

    CommandHandle handle;
    Result result = submit(DeviceCommand::heartbeat(), handle);
    if (result != Result::OK) {
        logPrintf("[CMD] Heartbeat not sent: %s\n", resultToString(result));
    }
}
