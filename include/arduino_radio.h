#pragma once
#include <Arduino.h>
#include <BLEDevice.h>
#include <BLEScan.h>
#include <BLEAdvertisedDevice.h>
#include <BLEAdvertising.h>
#include <deque>
#include <map>
#include <mutex>
#include "radio.h"

// Radio handle backed by the ESP32 Arduino BLE stack.
// Scan results arrive on the BLE host task and are queued; dispatchFrames()
// hands them to the scan handler from the main loop.
class ArduinoRadio : public Radio {
public:
    ArduinoRadio();
    ~ArduinoRadio();

    // Bring up the controller. Call once from setup().
    bool begin(const char *deviceName = "");
    void end();

    RadioState        state() override;
    RadioCapabilities capabilities() const override;

    uint32_t addStateListener(RadioStateListener listener) override;
    void     removeStateListener(uint32_t id) override;

    PermissionModel permissionModel() const override { return PermissionModel::IMPLICIT; }
    bool requestPermissions(const std::vector<RadioPermission> &perms) override;

    bool startAdvertising(const AdvertisePayload &payload) override;
    bool stopAdvertising() override;

    bool startScan(RadioFrameHandler handler, bool allowDuplicates) override;
    void stopScan() override;

    // Drain queued frames into the scan handler. Main loop only.
    void dispatchFrames();

    // Frames dropped because the queue was full
    uint32_t droppedFrames() const { return _dropped; }

    // BLE host task side
    void enqueue(const RadioFrame &frame);

private:
    class ScanCallbacks : public BLEAdvertisedDeviceCallbacks {
    public:
        explicit ScanCallbacks(ArduinoRadio *owner) : _owner(owner) {}
        void onResult(BLEAdvertisedDevice dev) override;
    private:
        ArduinoRadio *_owner;
    };

    ScanCallbacks     _callbacks;
    BLEScan          *_scan        = nullptr;
    BLEAdvertising   *_advertising = nullptr;
    RadioState        _state       = RadioState::UNKNOWN;
    bool              _scanning    = false;
    bool              _advertisingActive = false;
    uint32_t          _scanStartedAt = 0;

    RadioFrameHandler      _handler;
    std::mutex             _queueLock;
    std::deque<RadioFrame> _queue;
    volatile uint32_t      _dropped = 0;

    std::mutex                               _listenerLock;
    std::map<uint32_t, RadioStateListener>   _listeners;
    uint32_t                                 _nextListenerId = 1;

    void setState(RadioState s);
    void flushScanResults();
};
