/**
 * @file ble_transport.h
 * @brief VeeBridge BLE transport interface - Abstract central-side link
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * The protocol core depends only on this capability set. Completion of
 * asynchronous operations (connect, write, disconnect) and incoming data
 * are reported to a single BleTransportListener, always from loop context.
 */

#ifndef BLE_TRANSPORT_H
#define BLE_TRANSPORT_H

#include <stdint.h>
#include <stddef.h>
#include "types.h"
#include "protocol_constants.h"

#define ADV_NAME_MAX 32

/**
 * @brief One advertisement that passed the name filter
 */
struct Advertisement {
    BleAddress address;
    char name[ADV_NAME_MAX];
    int8_t rssi;

    Advertisement() : rssi(0) {
        memset(name, 0, sizeof(name));
    }
};

// =============================================================================
// LISTENER
// =============================================================================

/**
 * @brief Receives transport events
 */
class BleTransportListener {
public:
    virtual ~BleTransportListener() {}

    virtual void onAdvertisement(const Advertisement& adv) = 0;
    virtual void onConnected() = 0;
    virtual void onConnectFailed(uint8_t reason) = 0;
    virtual void onDisconnected(uint8_t reason) = 0;
    virtual void onWriteComplete(bool success) = 0;
    virtual void onNotification(Characteristic source, const uint8_t* data, size_t length) = 0;
};

// =============================================================================
// TRANSPORT
// =============================================================================

/**
 * @brief Abstract BLE central link to one machine
 *
 * discoverServices(), subscribe() and unsubscribe() complete synchronously.
 * connect() only starts the operation; the listener is told about the
 * outcome later. write() may complete before it returns.
 */
class BleTransport {
public:
    BleTransport() : _listener(nullptr) {}
    virtual ~BleTransport() {}

    void setListener(BleTransportListener* listener) { _listener = listener; }
    BleTransportListener* getListener() const { return _listener; }

    /**
     * @brief Start scanning, reporting advertisers whose name starts with prefix
     */
    virtual bool startScan(const char* namePrefix) = 0;
    virtual void stopScan() = 0;

    virtual Result connect(const BleAddress& address) = 0;

    /**
     * @brief Discover the NUS service and its characteristics
     * @return OK, or ERROR_NOT_FOUND if the service is missing
     */
    virtual Result discoverServices() = 0;

    virtual bool hasCharacteristic(Characteristic id) const = 0;
    virtual Result subscribe(Characteristic id) = 0;
    virtual Result unsubscribe(Characteristic id) = 0;

    /**
     * @brief Synchronous read of a readable characteristic
     * @param length Set to the number of bytes read
     */
    virtual Result read(Characteristic id, uint8_t* buffer, size_t capacity, size_t& length) = 0;

    /**
     * @brief Start a write to the NUS RX characteristic
     *
     * On OK the listener receives exactly one onWriteComplete(), either
     * later from poll() or before write() returns. Call from the loop task.
     */
    virtual Result write(const uint8_t* data, size_t length) = 0;

    /**
     * @brief Drop the link (no-op when not connected)
     */
    virtual void disconnect() = 0;

    /**
     * @brief Deliver deferred events to the listener (call from loop)
     */
    virtual void poll() {}

protected:
    BleTransportListener* _listener;
};

#endif // BLE_TRANSPORT_H
