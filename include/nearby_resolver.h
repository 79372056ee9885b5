#pragma once
#include <stdint.h>
#include <functional>
#include <mutex>
#include <vector>
#include "beacon_types.h"
#include "clock.h"
#include "discovery_client.h"

typedef std::function<void(const std::vector<NearbyUser> &)> NearbyCallback;

// Turns scan snapshots into resolved NearbyUser lists.
// submit() is cheap and may be called from the scan path; runOnce() does the
// backend round-trip and is meant for a worker task.
class NearbyResolver {
public:
    NearbyResolver(DiscoveryClient &client, Clock &clock, NearbyCallback cb);

    void setLookupOptions(const LookupOptions &opts);

    // Latest snapshot wins; older unresolved ones are dropped
    void submit(const std::vector<DiscoveredBeacon> &beacons);
    bool hasPending();

    // Resolve the pending snapshot. Returns true when a list was delivered.
    bool runOnce();

    // Drop pending work and rate-limit state (scan restarted or stopped)
    void reset();

    RateLimitInfo   rateLimit();
    DiscoveryStatus lastStatus();

    // Found results with a recipient and context, joined with live proximity.
    // Strongest signal first.
    static std::vector<NearbyUser> merge(const std::vector<LookupResult> &results,
                                         const std::vector<DiscoveredBeacon> &beacons);

private:
    DiscoveryClient &_client;
    Clock           &_clock;
    NearbyCallback   _cb;

    std::mutex                    _lock;
    LookupOptions                 _opts;
    bool                          _pending = false;
    std::vector<DiscoveredBeacon> _latest;
    RateLimitInfo                 _rateLimit;
    DiscoveryStatus               _lastStatus = DiscoveryStatus::OK;
    bool                          _coolingDown = false;
    uint32_t                      _cooldownUntil = 0;
};
