#pragma once
#include <stdint.h>
#include <functional>
#include <map>
#include <vector>
#include "beacon_extractor.h"
#include "beacon_registry.h"
#include "ble_guard.h"
#include "clock.h"
#include "config.h"
#include "radio.h"

enum class ScannerState : uint8_t {
    IDLE,
    INITIALIZING,
    SCANNING
};

struct ScanOptions {
    int minRssi = SCAN_DEFAULT_MIN_RSSI;
};

typedef std::function<void(const std::vector<DiscoveredBeacon> &)> ScanCallback;
typedef uint32_t SubscriberId;

// Set of scan callbacks. add/remove report whether the shared radio scan
// has to be started or stopped.
class ScanSubscribers {
public:
    ScanSubscribers() : _nextId(1) {}

    // Returns true when this is the first subscriber
    bool add(ScanCallback cb, SubscriberId &id);
    // Returns true when the last subscriber just left
    bool remove(SubscriberId id);

    void   clear() { _callbacks.clear(); }
    bool   empty() const { return _callbacks.empty(); }
    size_t size() const { return _callbacks.size(); }

    // Callbacks may unsubscribe while being notified
    void notify(const std::vector<DiscoveredBeacon> &beacons) const;

private:
    std::map<SubscriberId, ScanCallback> _callbacks;
    SubscriberId _nextId;
};

// Observer role. One continuous radio scan shared by every subscriber.
// Driven from the main loop: frames through onFrame(), timers through poll().
class ScanningController {
public:
    ScanningController(Radio &radio, BluetoothStateGuard &guard, Clock &clock,
                       const BeaconExtractor &extractor);

    bool start(ScanCallback cb, const ScanOptions &opts = ScanOptions(),
               SubscriberId *id = nullptr);

    // Stops the scan when the last subscriber leaves
    void removeSubscriber(SubscriberId id);

    // Idempotent
    void stop();

    // One advertisement from the radio
    void onFrame(const RadioFrame &frame);

    // Fires the pending notification once its deadline passes
    void poll();

    // Evicted snapshot, on demand
    std::vector<DiscoveredBeacon> beacons();

    ScannerState state() const { return _state; }
    bool isScanning() const { return _state == ScannerState::SCANNING; }
    bool notificationPending() const { return _notifyPending; }
    size_t subscriberCount() const { return _subscribers.size(); }

private:
    Radio                 &_radio;
    BluetoothStateGuard   &_guard;
    Clock                 &_clock;
    const BeaconExtractor &_extractor;

    ScannerState    _state = ScannerState::IDLE;
    ScanOptions     _opts;
    ScanSubscribers _subscribers;
    BeaconRegistry  _registry;

    bool     _notifyPending = false;
    uint32_t _notifyAt      = 0;

    void scheduleNotification(uint32_t now);
    void notifySubscribers(uint32_t now);
};
