/**
 * @file bluefruit_transport.cpp
 * @brief VeeBridge Bluefruit central transport - Implementation
 * @version 1.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#include "bluefruit_transport.h"
#include "log.h"

// =============================================================================
// GLOBAL INSTANCE (needed for static callbacks)
// =============================================================================

static BluefruitTransport* g_transport = nullptr;

// =============================================================================
// CONSTRUCTOR
// =============================================================================

BluefruitTransport::BluefruitTransport() :
    _service(BLEUuid(NUS_SERVICE_UUID)),
    _connHandle(BLE_CONN_HANDLE_INVALID),
    _connectPending(false)
{
    memset(&_lastPeer, 0, sizeof(_lastPeer));
    memset(_namePrefix, 0, sizeof(_namePrefix));
}

// =============================================================================
// INITIALIZATION
// =============================================================================

bool BluefruitTransport::begin() {
    g_transport = this;

    // Connection parameters must be configured BEFORE Bluefruit.begin()
    const uint16_t BLE_EVENT_LEN = 6;      // Connection event length (in 1.25ms units)
    const uint8_t  BLE_HVN_QSIZE = 8;      // Handle Value Notification queue size
    const uint8_t  BLE_WRCMD_QSIZE = 8;    // Write Command queue size
    Bluefruit.configCentralConn(BLE_MTU_SIZE, BLE_EVENT_LEN, BLE_HVN_QSIZE, BLE_WRCMD_QSIZE);

    if (!Bluefruit.begin(0, 1)) {
        logPrint("[BLE] ERROR: Bluefruit.begin() failed\n");
        return false;
    }
    Bluefruit.setName(FIRMWARE_NAME);

    Bluefruit.Central.setConnectCallback(_onCentralConnect);
    Bluefruit.Central.setDisconnectCallback(_onCentralDisconnect);

    _service.begin();
    for (uint8_t i = 0; i < CLIENT_CHARACTERISTIC_COUNT; i++) {
        Characteristic id = static_cast<Characteristic>(i);
        _chars[i].setUuid(BLEUuid(characteristicUuid(id)));
        _chars[i].begin(&_service);
        if (id != Characteristic::NUS_RX && id != Characteristic::DIAGNOSTIC) {
            _chars[i].setNotifyCallback(_onNotify);
        }
    }

    Bluefruit.Scanner.setRxCallback(_onScanCallback);
    Bluefruit.Scanner.restartOnDisconnect(false);
    Bluefruit.Scanner.filterRssi(BLE_SCAN_MIN_RSSI);
    Bluefruit.Scanner.setInterval(BLE_SCAN_INTERVAL, BLE_SCAN_WINDOW);
    Bluefruit.Scanner.useActiveScan(true);   // Request scan response for name

    logPrint("[BLE] Central ready\n");
    return true;
}

// =============================================================================
// SCANNING
// =============================================================================

bool BluefruitTransport::startScan(const char* namePrefix) {
    memset(_namePrefix, 0, sizeof(_namePrefix));
    if (namePrefix) {
        strncpy(_namePrefix, namePrefix, sizeof(_namePrefix) - 1);
    }

    bool started = Bluefruit.Scanner.start(0);  // 0 = Don't stop, timeout is ours
    DEBUG_PRINTF("[BLE] Scanner.start() returned: %s\n", started ? "true" : "false");
    return started;
}

void BluefruitTransport::stopScan() {
    Bluefruit.Scanner.stop();
}

// =============================================================================
// CONNECTION
// =============================================================================

Result BluefruitTransport::connect(const BleAddress& address) {
    ble_gap_addr_t peer = _lastPeer;
    if (memcmp(peer.addr, address.bytes, BLE_ADDR_LEN) != 0) {
        memset(&peer, 0, sizeof(peer));
        peer.addr_type = BLE_GAP_ADDR_TYPE_RANDOM_STATIC;
        memcpy(peer.addr, address.bytes, BLE_ADDR_LEN);
    }

    if (!Bluefruit.Central.connect(&peer)) {
        return Result::ERROR_TRANSPORT;
    }
    _connectPending = true;
    return Result::OK;
}

Result BluefruitTransport::discoverServices() {
    if (_connHandle == BLE_CONN_HANDLE_INVALID) {
        return Result::ERROR_NOT_CONNECTED;
    }

    BLEConnection* conn = Bluefruit.Connection(_connHandle);
    if (conn) {
        // Program frames are 96 bytes, larger than the default ATT MTU
        conn->requestMtuExchange(BLE_MTU_SIZE);
    }

    if (!_service.discover(_connHandle)) {
        return Result::ERROR_NOT_FOUND;
    }

    BLEClientCharacteristic* list[CLIENT_CHARACTERISTIC_COUNT];
    for (uint8_t i = 0; i < CLIENT_CHARACTERISTIC_COUNT; i++) {
        list[i] = &_chars[i];
    }
    uint8_t found = Bluefruit.Discovery.discoverCharacteristic(_connHandle, list, CLIENT_CHARACTERISTIC_COUNT);
    logPrintf("[BLE] Discovered %u of %u characteristics\n", found, CLIENT_CHARACTERISTIC_COUNT);
    return Result::OK;
}

void BluefruitTransport::disconnect() {
    if (_connHandle != BLE_CONN_HANDLE_INVALID) {
        Bluefruit.disconnect(_connHandle);
    } else if (_connectPending) {
        sd_ble_gap_connect_cancel();
        _connectPending = false;
    }
}

// =============================================================================
// CHARACTERISTICS
// =============================================================================

BLEClientCharacteristic* BluefruitTransport::clientFor(Characteristic id) {
    uint8_t index = static_cast<uint8_t>(id);
    return index < CLIENT_CHARACTERISTIC_COUNT ? &_chars[index] : nullptr;
}

const BLEClientCharacteristic* BluefruitTransport::clientFor(Characteristic id) const {
    uint8_t index = static_cast<uint8_t>(id);
    return index < CLIENT_CHARACTERISTIC_COUNT ? &_chars[index] : nullptr;
}

Characteristic BluefruitTransport::idFor(const BLEClientCharacteristic* chr) const {
    for (uint8_t i = 0; i < CLIENT_CHARACTERISTIC_COUNT; i++) {
        if (&_chars[i] == chr) {
            return static_cast<Characteristic>(i);
        }
    }
    return Characteristic::UNKNOWN;
}

bool BluefruitTransport::hasCharacteristic(Characteristic id) const {
    const BLEClientCharacteristic* chr = clientFor(id);
    return chr && const_cast<BLEClientCharacteristic*>(chr)->discovered();
}

Result BluefruitTransport::subscribe(Characteristic id) {
    BLEClientCharacteristic* chr = clientFor(id);
    if (!chr || !chr->discovered()) {
        return Result::ERROR_NOT_FOUND;
    }
    return chr->enableNotify() ? Result::OK : Result::ERROR_TRANSPORT;
}

Result BluefruitTransport::unsubscribe(Characteristic id) {
    BLEClientCharacteristic* chr = clientFor(id);
    if (!chr || !chr->discovered()) {
        return Result::ERROR_NOT_FOUND;
    }
    if (_connHandle == BLE_CONN_HANDLE_INVALID) {
        return Result::ERROR_NOT_CONNECTED;
    }
    return chr->disableNotify() ? Result::OK : Result::ERROR_TRANSPORT;
}

Result BluefruitTransport::read(Characteristic id, uint8_t* buffer, size_t capacity, size_t& length) {
    length = 0;
    BLEClientCharacteristic* chr = clientFor(id);
    if (!chr || !chr->discovered()) {
        return Result::ERROR_NOT_FOUND;
    }

    uint16_t n = chr->read(buffer, static_cast<uint16_t>(capacity));
    if (n == 0) {
        return Result::ERROR_TRANSPORT;
    }
    length = n;
    return Result::OK;
}

Result BluefruitTransport::write(const uint8_t* data, size_t length) {
    BLEClientCharacteristic* rx = clientFor(Characteristic::NUS_RX);
    if (_connHandle == BLE_CONN_HANDLE_INVALID || !rx->discovered()) {
        return Result::ERROR_NOT_CONNECTED;
    }

    // write_resp blocks until the peer's response. This runs on the loop task,
    // so the outcome goes straight to the listener and never through _events.
    uint16_t written = rx->write_resp(data, static_cast<uint16_t>(length));
    if (_listener) {
        _listener->onWriteComplete(written == length);
    }
    return Result::OK;
}

// =============================================================================
// EVENT PUMP
// =============================================================================

void BluefruitTransport::poll() {
    if (!_listener) {
        _events.clear();
        return;
    }

    TransportEvent event;
    while (_events.pop(event)) {
        event.deliver(*_listener);
    }
}

// =============================================================================
// STATIC CALLBACKS (SoftDevice task context)
// =============================================================================

void BluefruitTransport::_onScanCallback(ble_gap_evt_adv_report_t* report) {
    if (!g_transport) return;

    TransportEvent event;
    event.type = TransportEventType::ADVERTISEMENT;

    uint8_t nameLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_COMPLETE_LOCAL_NAME,
                                                          (uint8_t*)event.adv.name, ADV_NAME_MAX - 1);
    if (nameLen == 0) {
        nameLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_SHORT_LOCAL_NAME,
                                                      (uint8_t*)event.adv.name, ADV_NAME_MAX - 1);
    }

    size_t prefixLen = strlen(g_transport->_namePrefix);
    if (nameLen > 0 && strncmp(event.adv.name, g_transport->_namePrefix, prefixLen) == 0) {
        event.adv.name[nameLen] = '\0';
        memcpy(event.adv.address.bytes, report->peer_addr.addr, BLE_ADDR_LEN);
        event.adv.rssi = report->rssi;
        g_transport->_lastPeer = report->peer_addr;
        g_transport->_events.push(event);
        return;  // Don't resume scanner - the state machine stops it
    }

    // Must resume scanner to receive more results
    Bluefruit.Scanner.resume();
}

void BluefruitTransport::_onCentralConnect(uint16_t connHandle) {
    if (!g_transport) return;

    g_transport->_connHandle = connHandle;
    g_transport->_connectPending = false;

    TransportEvent event;
    event.type = TransportEventType::CONNECTED;
    g_transport->_events.push(event);
}

void BluefruitTransport::_onCentralDisconnect(uint16_t connHandle, uint8_t reason) {
    if (!g_transport) return;

    if (connHandle == g_transport->_connHandle) {
        g_transport->_connHandle = BLE_CONN_HANDLE_INVALID;
    }

    TransportEvent event;
    event.type = TransportEventType::DISCONNECTED;
    event.reason = reason;
    g_transport->_events.push(event);
}

void BluefruitTransport::_onNotify(BLEClientCharacteristic* chr, uint8_t* data, uint16_t len) {
    if (!g_transport) return;

    g_transport->_events.pushNotification(g_transport->idFor(chr), data, len);
}
