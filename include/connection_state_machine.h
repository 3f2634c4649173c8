/**
 * @file connection_state_machine.h
 * @brief VeeBridge connection lifecycle - Scan, connect, discover, ready, teardown
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Owns the one ConnectionSession and is the only code that mutates it.
 *
 *   DISCONNECTED --START_SCAN--> SCANNING --DEVICE_FOUND--> CONNECTING
 *   CONNECTING --SERVICES_DISCOVERED--> READY
 *   READY/CONNECTING --DISCONNECT_REQUESTED--> DISCONNECTING --CLEANUP_DONE--> DISCONNECTED
 *   READY --LINK_DOWN--> DISCONNECTED (publishes LINK_LOST)
 *   SCANNING/CONNECTING --TIMEOUT/CONNECT_FAILED/DISCOVERY_FAILED--> FAILED
 *   FAILED --CLEANUP_DONE--> DISCONNECTED (same update)
 *
 * Cleanup (unsubscribe everything, drop the link, reset the session) runs on
 * every path back to DISCONNECTED. All deadlines are checked in update().
 */

#ifndef CONNECTION_STATE_MACHINE_H
#define CONNECTION_STATE_MACHINE_H

#include <stdint.h>
#include "config.h"
#include "types.h"
#include "protocol_constants.h"
#include "ble_transport.h"
#include "event_broadcaster.h"
#include "telemetry_decoder.h"

#define NAME_PREFIX_MAX 16

// =============================================================================
// FRAME SINK
// =============================================================================

/**
 * @brief Receives the outcome of a frame write
 */
class WriteAckListener {
public:
    virtual ~WriteAckListener() {}
    virtual void onWriteAck(bool success) = 0;
};

/**
 * @brief Where the dispatcher sends encoded frames
 */
class FrameSink {
public:
    virtual ~FrameSink() {}

    /**
     * @brief True when a write may be issued now
     */
    virtual bool isWritable() const = 0;

    /**
     * @brief Start one write; the outcome arrives through WriteAckListener
     */
    virtual Result writeFrame(const uint8_t* data, size_t length) = 0;

    virtual void setWriteAckListener(WriteAckListener* listener) = 0;
};

// =============================================================================
// SESSION AND POLICY
// =============================================================================

/**
 * @brief Live state of the one device connection
 */
struct ConnectionSession {
    ConnectionState state;
    BleAddress address;
    char deviceName[ADV_NAME_MAX];
    int8_t rssi;
    uint16_t subscribedMask;        // characteristicBit() of each subscribed characteristic
    uint32_t stateEnteredAt;
    uint32_t lastSeenAt;            // Last notification
    uint8_t connectAttempts;
    uint32_t retryAt;               // Pending connect retry, 0 = none
    uint32_t notificationCount;
    uint32_t decodeErrorCount;

    ConnectionSession() {
        reset();
    }

    void reset() {
        state = ConnectionState::DISCONNECTED;
        address = BleAddress();
        memset(deviceName, 0, sizeof(deviceName));
        rssi = 0;
        subscribedMask = 0;
        stateEnteredAt = 0;
        lastSeenAt = 0;
        connectAttempts = 0;
        retryAt = 0;
        notificationCount = 0;
        decodeErrorCount = 0;
    }

    bool isSubscribed(Characteristic id) const {
        return (subscribedMask & characteristicBit(id)) != 0;
    }
};

/**
 * @brief Tunables for scanning and connecting
 */
struct ConnectionPolicy {
    uint32_t scanTimeoutMs;
    uint32_t connectionTimeoutMs;
    uint8_t connectAttempts;        // Total attempts including the first
    uint32_t connectRetryDelayMs;
    char namePrefix[NAME_PREFIX_MAX];

    ConnectionPolicy() :
        scanTimeoutMs(SCAN_TIMEOUT_MS),
        connectionTimeoutMs(CONNECTION_TIMEOUT_MS),
        connectAttempts(CONNECT_RETRY_COUNT),
        connectRetryDelayMs(CONNECT_RETRY_DELAY_MS)
    {
        memset(namePrefix, 0, sizeof(namePrefix));
        strncpy(namePrefix, DEVICE_NAME_PREFIX, sizeof(namePrefix) - 1);
    }
};

// =============================================================================
// CONNECTION STATE MACHINE
// =============================================================================

/**
 * @brief Drives one machine connection through its lifecycle
 *
 * Usage:
 *   ConnectionStateMachine connection;
 *   connection.begin(&transport, &events);
 *   connection.startScan(millis());
 *
 *   void loop() {
 *       connection.update(millis());
 *       events.deliver();
 *   }
 */
class ConnectionStateMachine : public BleTransportListener, public FrameSink {
public:
    ConnectionStateMachine();

    /**
     * @brief Attach transport and event sink
     *
     * Registers itself as the transport's listener.
     */
    void begin(BleTransport* transport, EventBroadcaster* events);

    void setPolicy(const ConnectionPolicy& policy) { _policy = policy; }
    const ConnectionPolicy& getPolicy() const { return _policy; }

    // =========================================================================
    // COMMANDS
    // =========================================================================

    /**
     * @brief Begin scanning for a machine
     * @return false unless DISCONNECTED
     */
    bool startScan(uint32_t now);

    /**
     * @brief Tear the connection down (user initiated)
     * @return false if already DISCONNECTED
     */
    bool disconnect(uint32_t now);

    /**
     * @brief Read and publish the diagnostic characteristic
     * @return OK, ERROR_NOT_CONNECTED, ERROR_NOT_FOUND or ERROR_TRANSPORT
     */
    Result requestDiagnostics();

    /**
     * @brief Pump transport events and check deadlines (call from loop)
     */
    void update(uint32_t now);

    // =========================================================================
    // STATE
    // =========================================================================

    ConnectionState getState() const { return _session.state; }
    const ConnectionSession& getSession() const { return _session; }
    FailureReason getLastFailure() const { return _lastFailure; }

    bool isReady() const { return _session.state == ConnectionState::READY; }
    bool isIdle() const { return _session.state == ConnectionState::DISCONNECTED; }

    // =========================================================================
    // FRAME SINK
    // =========================================================================

    bool isWritable() const override { return isReady(); }
    Result writeFrame(const uint8_t* data, size_t length) override;
    void setWriteAckListener(WriteAckListener* listener) override { _ackListener = listener; }

    // =========================================================================
    // TRANSPORT LISTENER
    // =========================================================================

    void onAdvertisement(const Advertisement& adv) override;
    void onConnected() override;
    void onConnectFailed(uint8_t reason) override;
    void onDisconnected(uint8_t reason) override;
    void onWriteComplete(bool success) override;
    void onNotification(Characteristic source, const uint8_t* data, size_t length) override;

private:
    BleTransport* _transport;
    EventBroadcaster* _events;
    WriteAckListener* _ackListener;
    ConnectionPolicy _policy;
    ConnectionSession _session;
    FailureReason _lastFailure;
    uint32_t _now;

    /**
     * @brief Apply a trigger
     * @return true if the state changed
     */
    bool transition(ConnectionTrigger trigger, FailureReason reason = FailureReason::NONE);

    ConnectionState determineNextState(ConnectionTrigger trigger) const;

    /**
     * @brief FAILED -> cleanup -> DISCONNECTED
     */
    void fail(ConnectionTrigger trigger, FailureReason reason);

    /**
     * @brief Release subscriptions and the link
     *
     * The session is reset unless we are still waiting in DISCONNECTING
     * for the link-down confirmation.
     */
    void cleanup();

    void discoverAndSubscribe();
    void attemptConnect();
    bool matchesPrefix(const char* name) const;

    void publishTransition(const ConnectionTransition& transition);
    void publishLinkLost(const ConnectionTransition& transition);
};

#endif // CONNECTION_STATE_MACHINE_H
