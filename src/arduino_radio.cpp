#include "arduino_radio.h"
#include "config.h"
#include "log.h"

// ─── Scan callback (BLE host task) ───────────────────────────────────────────

void ArduinoRadio::ScanCallbacks::onResult(BLEAdvertisedDevice dev) {
    RadioFrame f;
    f.deviceId = dev.getAddress().toString();
    f.rssi     = dev.getRSSI();
    if (dev.haveName()) f.localName = dev.getName();
    if (dev.haveServiceUUID()) {
        for (int i = 0; i < dev.getServiceUUIDCount(); i++) {
            f.serviceUuids.push_back(dev.getServiceUUID(i).toString());
        }
    }
    if (dev.haveManufacturerData()) f.manufacturerData = dev.getManufacturerData();

    _owner->enqueue(f);
}

// ─── Public API ──────────────────────────────────────────────────────────────

ArduinoRadio::ArduinoRadio() : _callbacks(this) {}

ArduinoRadio::~ArduinoRadio() {
    end();
}

bool ArduinoRadio::begin(const char *deviceName) {
    if (BLEDevice::getInitialized()) return true;

    setState(RadioState::RESETTING);
    BLEDevice::init(deviceName);
    if (!BLEDevice::getInitialized()) {
        LOG_E("BLE controller init failed");
        setState(RadioState::UNSUPPORTED);
        return false;
    }

    _scan        = BLEDevice::getScan();
    _advertising = BLEDevice::getAdvertising();
    setState(RadioState::POWERED_ON);
    return true;
}

void ArduinoRadio::end() {
    if (!BLEDevice::getInitialized()) return;
    stopScan();
    stopAdvertising();
    BLEDevice::deinit(false);
    _scan        = nullptr;
    _advertising = nullptr;
    setState(RadioState::POWERED_OFF);
}

RadioState ArduinoRadio::state() {
    return _state;
}

RadioCapabilities ArduinoRadio::capabilities() const {
    // Bluedroid exposes the raw advertisement, so every strategy is available
    RadioCapabilities caps;
    caps.serviceIdentifierBroadcast = true;
    caps.iBeaconBroadcast           = true;
    caps.reportsServiceUuids        = true;
    caps.reportsLocalName           = true;
    caps.reportsManufacturerData    = true;
    return caps;
}

uint32_t ArduinoRadio::addStateListener(RadioStateListener listener) {
    uint32_t id;
    {
        std::lock_guard<std::mutex> guard(_listenerLock);
        id = _nextListenerId++;
        _listeners[id] = listener;
    }
    listener(_state);
    return id;
}

void ArduinoRadio::removeStateListener(uint32_t id) {
    std::lock_guard<std::mutex> guard(_listenerLock);
    _listeners.erase(id);
}

bool ArduinoRadio::requestPermissions(const std::vector<RadioPermission> &perms) {
    // No runtime permission model on the ESP32
    (void)perms;
    return _state != RadioState::UNSUPPORTED;
}

void ArduinoRadio::setState(RadioState s) {
    std::vector<RadioStateListener> listeners;
    {
        std::lock_guard<std::mutex> guard(_listenerLock);
        if (_state == s) return;
        _state = s;
        for (std::map<uint32_t, RadioStateListener>::iterator it = _listeners.begin();
             it != _listeners.end(); ++it) {
            listeners.push_back(it->second);
        }
    }
    LOG_I("BLE state: %s", radioStateName(s));
    for (size_t i = 0; i < listeners.size(); i++) listeners[i](s);
}

// ─── Advertising ─────────────────────────────────────────────────────────────

bool ArduinoRadio::startAdvertising(const AdvertisePayload &payload) {
    if (_state != RadioState::POWERED_ON || !_advertising) return false;

    if (_advertisingActive) {
        _advertising->stop();
        _advertisingActive = false;
    }

    BLEAdvertisementData adv;
    BLEAdvertisementData scanResp;
    adv.setFlags(0x06);   // general discoverable, BR/EDR not supported

    switch (payload.kind) {
        case BroadcastCapability::SERVICE_IDENTIFIER: {
            BLEUUID uuid(payload.serviceIdentifier);
            if (uuid.bitSize() != 128) {
                LOG_E("Bad service identifier %s", payload.serviceIdentifier.c_str());
                return false;
            }
            adv.setCompleteServices(uuid);
            // 128-bit UUID fills the primary packet; the name rides in the scan response
            std::string name = payload.localName.substr(0, ADV_LOCAL_NAME_MAX);
            if (!name.empty()) scanResp.setName(name);
            break;
        }
        case BroadcastCapability::IBEACON:
            if (payload.manufacturerData.size() != 25) {
                LOG_E("Bad iBeacon payload length %u", (unsigned)payload.manufacturerData.size());
                return false;
            }
            adv.setManufacturerData(payload.manufacturerData);
            break;
    }

    _advertising->setAdvertisementData(adv);
    _advertising->setScanResponseData(scanResp);
    _advertising->setMinInterval(160);   // 100 ms in 0.625 ms units
    _advertising->setMaxInterval(240);   // 150 ms
    _advertising->start();
    _advertisingActive = true;
    return true;
}

bool ArduinoRadio::stopAdvertising() {
    if (!_advertising) return false;
    if (_advertisingActive) {
        _advertising->stop();
        _advertisingActive = false;
    }
    return true;
}

// ─── Scanning ────────────────────────────────────────────────────────────────

bool ArduinoRadio::startScan(RadioFrameHandler handler, bool allowDuplicates) {
    if (_state != RadioState::POWERED_ON || !_scan) return false;

    _handler = handler;
    {
        std::lock_guard<std::mutex> guard(_queueLock);
        _queue.clear();
    }

    _scan->setAdvertisedDeviceCallbacks(&_callbacks, allowDuplicates);
    _scan->setActiveScan(true);   // scan responses carry the device-name fallback
    _scan->setInterval(100);
    _scan->setWindow(99);

    // Duration 0 runs until stop()
    if (!_scan->start(0, nullptr, false)) {
        LOG_E("BLE scan start failed");
        _handler = RadioFrameHandler();
        return false;
    }
    _scanning      = true;
    _scanStartedAt = millis();
    return true;
}

void ArduinoRadio::stopScan() {
    if (_scan && _scanning) {
        _scan->stop();
        _scan->clearResults();
    }
    _scanning = false;
    _handler  = RadioFrameHandler();

    std::lock_guard<std::mutex> guard(_queueLock);
    _queue.clear();
}

void ArduinoRadio::enqueue(const RadioFrame &frame) {
    std::lock_guard<std::mutex> guard(_queueLock);
    if (_queue.size() >= SCAN_FRAME_QUEUE_MAX) {
        _queue.pop_front();
        _dropped++;
    }
    _queue.push_back(frame);
}

// BLEScan keeps every device it has seen until clearResults(), and with
// duplicates on a repeat report is never freed. Cycle the scan to bound it.
void ArduinoRadio::flushScanResults() {
    _scan->stop();
    _scan->clearResults();
    _scanStartedAt = millis();
    if (!_scan->start(0, nullptr, false)) {
        LOG_E("BLE scan restart failed, retrying");
        _scanStartedAt = millis() - SCAN_RESULT_FLUSH_MS + 1000;
    }
}

void ArduinoRadio::dispatchFrames() {
    if (_scanning && _scan && millis() - _scanStartedAt >= SCAN_RESULT_FLUSH_MS) {
        flushScanResults();
    }

    std::deque<RadioFrame> batch;
    {
        std::lock_guard<std::mutex> guard(_queueLock);
        batch.swap(_queue);
    }
    if (!_handler) return;
    for (size_t i = 0; i < batch.size(); i++) {
        _handler(batch[i]);
        // Handler may stop the scan mid-batch
        if (!_handler) break;
    }
}
