#include "ble_scanner.h"
#include "distance.h"
#include "log.h"
#include "token_codec.h"

// ─── Subscriber set ──────────────────────────────────────────────────────────

bool ScanSubscribers::add(ScanCallback cb, SubscriberId &id) {
    bool first = _callbacks.empty();
    id = _nextId++;
    _callbacks[id] = cb;
    return first;
}

bool ScanSubscribers::remove(SubscriberId id) {
    if (_callbacks.erase(id) == 0) return false;
    return _callbacks.empty();
}

void ScanSubscribers::notify(const std::vector<DiscoveredBeacon> &beacons) const {
    std::vector<SubscriberId> ids;
    ids.reserve(_callbacks.size());
    for (std::map<SubscriberId, ScanCallback>::const_iterator it = _callbacks.begin();
         it != _callbacks.end(); ++it) {
        ids.push_back(it->first);
    }

    for (size_t i = 0; i < ids.size(); i++) {
        // Skip anyone removed by an earlier callback
        std::map<SubscriberId, ScanCallback>::const_iterator it = _callbacks.find(ids[i]);
        if (it == _callbacks.end()) continue;
        ScanCallback cb = it->second;
        if (cb) cb(beacons);
    }
}

// ─── Scanning controller ─────────────────────────────────────────────────────

ScanningController::ScanningController(Radio &radio, BluetoothStateGuard &guard,
                                       Clock &clock, const BeaconExtractor &extractor)
    : _radio(radio), _guard(guard), _clock(clock), _extractor(extractor) {}

bool ScanningController::start(ScanCallback cb, const ScanOptions &opts, SubscriberId *id) {
    SubscriberId sid;
    _subscribers.add(cb, sid);
    if (id) *id = sid;

    if (_state != ScannerState::IDLE) {
        LOG_D("Already scanning, subscriber %lu added", (unsigned long)sid);
        return true;
    }

    _state = ScannerState::INITIALIZING;
    if (!_guard.ensureReady()) {
        LOG_E("Cannot start scanning: BLE not ready");
        _subscribers.remove(sid);
        _state = ScannerState::IDLE;
        return false;
    }

    _opts = opts;
    _registry.clear();
    _notifyPending = false;

    // Duplicates on: distance needs repeated sightings of the same broadcaster
    bool started = _radio.startScan([this](const RadioFrame &f) { onFrame(f); }, true);
    if (!started) {
        LOG_E("Native scan failed to start");
        _subscribers.remove(sid);
        _state = ScannerState::IDLE;
        return false;
    }

    _state = ScannerState::SCANNING;
    LOG_I("Beacon scan started, minRssi %d, %u strategies", _opts.minRssi,
          (unsigned)_extractor.strategies().size());
    return true;
}

void ScanningController::removeSubscriber(SubscriberId id) {
    if (_subscribers.remove(id) && _state != ScannerState::IDLE) {
        stop();
    }
}

void ScanningController::stop() {
    if (_state != ScannerState::IDLE) {
        LOG_I("Stopping beacon scan");
        _radio.stopScan();
    }
    _notifyPending = false;
    _registry.clear();
    _subscribers.clear();
    _state = ScannerState::IDLE;
}

void ScanningController::onFrame(const RadioFrame &frame) {
    if (_state != ScannerState::SCANNING) return;

    // Cheap reject before any parsing
    if (frame.rssi < _opts.minRssi) return;

    ExtractedToken t;
    if (!_extractor.extract(frame, t)) return;

    uint32_t now = _clock.nowMs();

    DiscoveredBeacon b;
    b.token          = t.token;
    b.major          = t.major;
    b.minor          = t.minor;
    b.rssi           = frame.rssi;
    b.distanceMeters = Distance::estimate(frame.rssi);
    b.deviceId       = frame.deviceId;
    b.lastSeenAtMs   = now;

    if (_registry.upsert(b)) {
        LOG_I("New beacon %s via %s, RSSI %d", TokenCodec::toHex(t.token).c_str(),
              extractionStrategyName(t.via), frame.rssi);
    }

    scheduleNotification(now);
}

void ScanningController::poll() {
    if (!_notifyPending) return;

    uint32_t now = _clock.nowMs();
    if (!deadlineReached(now, _notifyAt)) return;

    _notifyPending = false;
    notifySubscribers(now);

    // Keep the cadence while anything is visible so departures get reported
    if (_state == ScannerState::SCANNING && !_registry.empty()) {
        scheduleNotification(now);
    }
}

std::vector<DiscoveredBeacon> ScanningController::beacons() {
    _registry.evictStale(_clock.nowMs(), SCAN_STALE_TIMEOUT_MS);
    return _registry.snapshot();
}

void ScanningController::scheduleNotification(uint32_t now) {
    // An armed timer is never pushed back, so delivery keeps a fixed cadence
    // under continuous traffic
    if (_notifyPending) return;
    _notifyPending = true;
    _notifyAt      = now + SCAN_DEBOUNCE_MS;
}

void ScanningController::notifySubscribers(uint32_t now) {
    size_t evicted = _registry.evictStale(now, SCAN_STALE_TIMEOUT_MS);
    if (evicted > 0) {
        LOG_I("Evicted %u stale beacons", (unsigned)evicted);
    }

    std::vector<DiscoveredBeacon> snap = _registry.snapshot();
    _subscribers.notify(snap);
}
