#pragma once
#include <stdint.h>
#include <map>
#include <vector>
#include "beacon_types.h"

// Currently visible beacons, one entry per token.
// Answers: "who has been heard from within the staleness window?"
class BeaconRegistry {
public:
    // Insert or refresh in place. Returns true for a first sighting.
    bool upsert(const DiscoveredBeacon &sighting);

    // Drop entries not re-sighted for longer than timeoutMs
    size_t evictStale(uint32_t nowMs, uint32_t timeoutMs);

    // Copy for subscribers; the registry itself is never handed out
    std::vector<DiscoveredBeacon> snapshot() const;

    bool   find(BeaconToken token, DiscoveredBeacon &out) const;
    size_t size() const { return _beacons.size(); }
    bool   empty() const { return _beacons.empty(); }
    void   clear() { _beacons.clear(); }

private:
    std::map<BeaconToken, DiscoveredBeacon> _beacons;
};
