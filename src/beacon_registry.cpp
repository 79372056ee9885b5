#include "beacon_registry.h"

bool BeaconRegistry::upsert(const DiscoveredBeacon &sighting) {
    std::map<BeaconToken, DiscoveredBeacon>::iterator it = _beacons.find(sighting.token);
    if (it == _beacons.end()) {
        _beacons[sighting.token] = sighting;
        return true;
    }

    DiscoveredBeacon &b = it->second;
    b.rssi           = sighting.rssi;
    b.distanceMeters = sighting.distanceMeters;
    b.lastSeenAtMs   = sighting.lastSeenAtMs;
    // Address may rotate between frames
    b.deviceId       = sighting.deviceId;
    return false;
}

size_t BeaconRegistry::evictStale(uint32_t nowMs, uint32_t timeoutMs) {
    size_t removed = 0;
    std::map<BeaconToken, DiscoveredBeacon>::iterator it = _beacons.begin();
    while (it != _beacons.end()) {
        uint32_t age = nowMs - it->second.lastSeenAtMs;  // wraps correctly
        if (age > timeoutMs) {
            it = _beacons.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<DiscoveredBeacon> BeaconRegistry::snapshot() const {
    std::vector<DiscoveredBeacon> out;
    out.reserve(_beacons.size());
    for (std::map<BeaconToken, DiscoveredBeacon>::const_iterator it = _beacons.begin();
         it != _beacons.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

bool BeaconRegistry::find(BeaconToken token, DiscoveredBeacon &out) const {
    std::map<BeaconToken, DiscoveredBeacon>::const_iterator it = _beacons.find(token);
    if (it == _beacons.end()) return false;
    out = it->second;
    return true;
}
