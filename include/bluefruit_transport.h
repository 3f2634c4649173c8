/**
 * @file bluefruit_transport.h
 * @brief VeeBridge BLE central transport on the Adafruit Bluefruit nRF52 stack
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Bluefruit callbacks run in the SoftDevice task. They only copy what they
 * were given into a TransportEventQueue; poll() replays it to the listener
 * from loop context.
 */

#ifndef BLUEFRUIT_TRANSPORT_H
#define BLUEFRUIT_TRANSPORT_H

#include <Arduino.h>
#include <bluefruit.h>
#include "config.h"
#include "ble_transport.h"
#include "transport_event_queue.h"

// Characteristic enum values up to and including NUS_RX
#define CLIENT_CHARACTERISTIC_COUNT (static_cast<uint8_t>(Characteristic::NUS_RX) + 1)

class BluefruitTransport : public BleTransport {
public:
    BluefruitTransport();

    /**
     * @brief Bring up the stack in central-only mode
     */
    bool begin();

    bool startScan(const char* namePrefix) override;
    void stopScan() override;

    Result connect(const BleAddress& address) override;
    Result discoverServices() override;

    bool hasCharacteristic(Characteristic id) const override;
    Result subscribe(Characteristic id) override;
    Result unsubscribe(Characteristic id) override;
    Result read(Characteristic id, uint8_t* buffer, size_t capacity, size_t& length) override;
    Result write(const uint8_t* data, size_t length) override;
    void disconnect() override;

    void poll() override;

    uint32_t getDroppedEventCount() const { return _events.getDroppedCount(); }

private:
    BLEClientService _service;
    BLEClientCharacteristic _chars[CLIENT_CHARACTERISTIC_COUNT];
    TransportEventQueue _events;

    uint16_t _connHandle;
    bool _connectPending;
    ble_gap_addr_t _lastPeer;       // Address type of the last reported advertiser
    char _namePrefix[ADV_NAME_MAX];

    BLEClientCharacteristic* clientFor(Characteristic id);
    const BLEClientCharacteristic* clientFor(Characteristic id) const;
    Characteristic idFor(const BLEClientCharacteristic* chr) const;

    // Static callbacks for Bluefruit
    static void _onScanCallback(ble_gap_evt_adv_report_t* report);
    static void _onCentralConnect(uint16_t connHandle);
    static void _onCentralDisconnect(uint16_t connHandle, uint8_t reason);
    static void _onNotify(BLEClientCharacteristic* chr, uint8_t* data, uint16_t len);
};

#endif // BLUEFRUIT_TRANSPORT_H
