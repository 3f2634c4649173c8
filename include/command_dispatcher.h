/**
 * @file command_dispatcher.h
 * @brief VeeBridge command dispatcher - Single-flight GATT write queue
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Commands are encoded at submit() time and written strictly in submission
 * order, one write at a time. Only the head of the queue is ever on the
 * transport, so a ProgramParams/EchoControl submitted after a Stop/Reset is
 * not written until that Stop/Reset has been acknowledged or timed out.
 *
 * A write that is not acknowledged within the GATT timeout is retried up to
 * RetryPolicy::maxRetries times, but only for idempotent commands.
 */

#ifndef COMMAND_DISPATCHER_H
#define COMMAND_DISPATCHER_H

#include <stdint.h>
#include "config.h"
#include "types.h"
#include "device_command.h"
#include "packet_encoder.h"
#include "connection_state_machine.h"
#include "event_broadcaster.h"

// =============================================================================
// COMMAND STATUS
// =============================================================================

typedef uint16_t CommandHandle;

#define INVALID_COMMAND_HANDLE 0

enum class CommandStatus : uint8_t {
    UNKNOWN = 0,    // Handle never issued or aged out of the history
    PENDING,
    IN_FLIGHT,
    COMPLETED,
    TIMED_OUT,
    FAILED,
    CANCELLED,
    LINK_LOST,
    REJECTED        // Encoder refused the command
};

inline const char* commandStatusToString(CommandStatus status) {
    switch (status) {
        case CommandStatus::UNKNOWN: return "UNKNOWN";
        case CommandStatus::PENDING: return "PENDING";
        case CommandStatus::IN_FLIGHT: return "IN_FLIGHT";
        case CommandStatus::COMPLETED: return "COMPLETED";
        case CommandStatus::TIMED_OUT: return "TIMED_OUT";
        case CommandStatus::FAILED: return "FAILED";
        case CommandStatus::CANCELLED: return "CANCELLED";
        case CommandStatus::LINK_LOST: return "LINK_LOST";
        case CommandStatus::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Final outcome of a submitted command
 */
struct CommandOutcome {
    CommandHandle handle;
    CommandType type;
    CommandStatus status;
    ErrorKind error;
    uint8_t attempts;
    uint32_t resolvedAt;

    CommandOutcome() :
        handle(INVALID_COMMAND_HANDLE),
        type(CommandType::INIT),
        status(CommandStatus::UNKNOWN),
        error(ErrorKind::NONE),
        attempts(0),
        resolvedAt(0) {}
};

typedef void (*CommandCompleteCallback)(const CommandOutcome& outcome, void* context);

/**
 * @brief GATT write timeout and retry budget
 */
struct RetryPolicy {
    uint8_t maxRetries;         // Extra attempts after a timeout or failed write
    uint32_t gattTimeoutMs;

    RetryPolicy() :
        maxRetries(DEFAULT_GATT_RETRIES),
        gattTimeoutMs(GATT_TIMEOUT_MS) {}
};

// =============================================================================
// DISPATCHER
// =============================================================================

/**
 * @brief Serializes DeviceCommands onto one FrameSink
 *
 * Usage:
 *   CommandDispatcher dispatcher;
 *   dispatcher.begin(&connection, &events);
 *
 *   CommandHandle handle;
 *   dispatcher.submit(DeviceCommand::stop(), handle);
 *
 *   void loop() {
 *       dispatcher.update(millis());
 *   }
 */
class CommandDispatcher : public WriteAckListener {
public:
    CommandDispatcher();

    /**
     * @brief Attach to the write path and the event stream
     *
     * Registers as the sink's ack listener and subscribes to state and
     * link-lost events.
     */
    void begin(FrameSink* sink, EventBroadcaster* events);

    void setRetryPolicy(const RetryPolicy& policy) { _policy = policy; }
    const RetryPolicy& getRetryPolicy() const { return _policy; }

    void setHeartbeatEnabled(bool enabled) { _heartbeatEnabled = enabled; }
    bool isHeartbeatEnabled() const { return _heartbeatEnabled; }

    // =========================================================================
    // COMMANDS
    // =========================================================================

    /**
     * @brief Encode and enqueue a command
     * @param handle Set to the new handle (also for REJECTED)
     * @param callback Called once when the command resolves
     * @return OK, ERROR_INVALID_PARAM (encode error), ERROR_NOT_CONNECTED
     *         or ERROR_QUEUE_FULL
     */
    Result submit(const DeviceCommand& command, CommandHandle& handle,
                  CommandCompleteCallback callback = nullptr, void* context = nullptr);

    /**
     * @brief Cancel a command
     *
     * A queued command is removed. An in-flight command resolves CANCELLED
     * now; its write may still land and the late ack is discarded.
     * @return OK or ERROR_NOT_FOUND
     */
    Result cancel(CommandHandle handle);

    /**
     * @brief Check write timeouts, start the next write, send heartbeats
     */
    void update(uint32_t now);

    // =========================================================================
    // STATUS
    // =========================================================================

    CommandStatus getStatus(CommandHandle handle) const;
    bool getOutcome(CommandHandle handle, CommandOutcome& outcome) const;

    uint8_t getQueueDepth() const { return _count; }
    bool isInFlight() const { return _inFlight; }
    uint32_t getDiscardedAckCount() const { return _discardedAcks; }

    // =========================================================================
    // WRITE ACK
    // =========================================================================

    void onWriteAck(bool success) override;

private:
    struct PendingCommand {
        CommandHandle handle;
        CommandType type;
        OutboundFrame frame;
        bool idempotent;
        bool cancelled;         // Resolved while in flight, awaiting the ack
        uint8_t attempts;
        uint32_t sentAt;
        CommandCompleteCallback callback;
        void* context;
    };

    FrameSink* _sink;
    EventBroadcaster* _events;
    RetryPolicy _policy;

    PendingCommand _queue[COMMAND_QUEUE_SIZE];
    uint8_t _count;
    bool _inFlight;             // _queue[0] is on the transport

    CommandOutcome _history[COMMAND_HISTORY_SIZE];
    uint8_t _historyNext;

    CommandHandle _nextHandle;
    bool _heartbeatEnabled;
    uint32_t _lastActivityAt;
    uint32_t _discardedAcks;
    uint8_t _staleAcks;         // Acks still owed by timed-out writes
    uint32_t _now;

    static void handleBridgeEvent(const BridgeEvent& event, void* context);
    void onBridgeEvent(const BridgeEvent& event);

    CommandHandle allocateHandle();
    void sendHead();
    void retryOrResolve(CommandStatus status, ErrorKind error);
    void resolveHead(CommandStatus status, ErrorKind error);
    void resolveAll(CommandStatus status, ErrorKind error);
    void removeAt(uint8_t index);
    void finish(const PendingCommand& command, CommandStatus status, ErrorKind error);
    void record(const CommandOutcome& outcome);
    void sendHeartbeatIfIdle();
};

#endif // COMMAND_DISPATCHER_H
