#include "nearby_resolver.h"
#include "distance.h"
#include "log.h"
#include <algorithm>
#include <map>

static bool strongerSignal(const DiscoveredBeacon &a, const DiscoveredBeacon &b) {
    return a.rssi > b.rssi;
}

static bool closerUser(const NearbyUser &a, const NearbyUser &b) {
    return a.rssi > b.rssi;
}

NearbyResolver::NearbyResolver(DiscoveryClient &client, Clock &clock, NearbyCallback cb)
    : _client(client), _clock(clock), _cb(cb) {}

void NearbyResolver::setLookupOptions(const LookupOptions &opts) {
    std::lock_guard<std::mutex> guard(_lock);
    _opts = opts;
}

void NearbyResolver::submit(const std::vector<DiscoveredBeacon> &beacons) {
    std::lock_guard<std::mutex> guard(_lock);
    _latest  = beacons;
    _pending = true;
}

bool NearbyResolver::hasPending() {
    std::lock_guard<std::mutex> guard(_lock);
    return _pending;
}

void NearbyResolver::reset() {
    std::lock_guard<std::mutex> guard(_lock);
    _pending     = false;
    _latest.clear();
    _rateLimit   = RateLimitInfo();
    _coolingDown = false;
    _lastStatus  = DiscoveryStatus::OK;
}

RateLimitInfo NearbyResolver::rateLimit() {
    std::lock_guard<std::mutex> guard(_lock);
    return _rateLimit;
}

DiscoveryStatus NearbyResolver::lastStatus() {
    std::lock_guard<std::mutex> guard(_lock);
    return _lastStatus;
}

bool NearbyResolver::runOnce() {
    std::vector<DiscoveredBeacon> snap;
    LookupOptions opts;
    {
        std::lock_guard<std::mutex> guard(_lock);
        if (!_pending) return false;
        if (_coolingDown) {
            if (!deadlineReached(_clock.nowMs(), _cooldownUntil)) return false;
            _coolingDown = false;
        }
        snap     = _latest;
        opts     = _opts;
        _pending = false;
    }

    if (snap.empty()) {
        if (_cb) _cb(std::vector<NearbyUser>());
        return true;
    }

    // Closest first, so the batch cap drops the faintest beacons
    std::stable_sort(snap.begin(), snap.end(), strongerSignal);
    std::vector<BeaconToken> tokens;
    tokens.reserve(snap.size());
    for (size_t i = 0; i < snap.size(); i++) tokens.push_back(snap[i].token);

    LookupResponse resp;
    DiscoveryStatus st = _client.lookup(tokens, opts, resp);

    std::vector<DiscoveredBeacon> live;
    bool newer = false;
    {
        std::lock_guard<std::mutex> guard(_lock);
        _lastStatus = st;
        if (resp.rateLimit.hasRemaining || !resp.rateLimit.reset.empty()) {
            _rateLimit = resp.rateLimit;
        }
        bool exhausted = resp.rateLimit.hasRemaining && resp.rateLimit.remaining <= 0;
        if (st == DiscoveryStatus::RATE_LIMITED || exhausted) {
            _coolingDown   = true;
            _cooldownUntil = _clock.nowMs() + DISCOVERY_RATE_LIMIT_COOLDOWN_MS;
            LOG_W("Lookup rate limit reached, pausing %d ms (reset %s)",
                  DISCOVERY_RATE_LIMIT_COOLDOWN_MS,
                  resp.rateLimit.reset.empty() ? "?" : resp.rateLimit.reset.c_str());
        }
        newer = _pending;
        if (st != DiscoveryStatus::OK && !_pending) {
            // Nothing newer arrived; retry this snapshot on the next pass
            _latest  = snap;
            _pending = st == DiscoveryStatus::RATE_LIMITED;
        }
        live = _latest;
    }

    if (st != DiscoveryStatus::OK) {
        LOG_W("Lookup failed (%s), skipping this update", discoveryStatusName(st));
        return false;
    }

    // A snapshot that arrived during the request is the current view: beacons
    // it no longer holds have departed
    const std::vector<DiscoveredBeacon> &current = newer ? live : snap;

    std::vector<NearbyUser> users = merge(resp.results, current);
    if (_cb) _cb(users);
    return true;
}

std::vector<NearbyUser> NearbyResolver::merge(const std::vector<LookupResult> &results,
                                              const std::vector<DiscoveredBeacon> &beacons) {
    std::map<BeaconToken, const DiscoveredBeacon *> byToken;
    for (size_t i = 0; i < beacons.size(); i++) byToken[beacons[i].token] = &beacons[i];

    std::vector<NearbyUser> users;
    for (size_t i = 0; i < results.size(); i++) {
        const LookupResult &r = results[i];
        if (!r.found || !r.hasRecipient || !r.hasContext) continue;

        std::map<BeaconToken, const DiscoveredBeacon *>::const_iterator it = byToken.find(r.token);
        if (it == byToken.end()) continue;
        const DiscoveredBeacon &b = *it->second;

        NearbyUser u;
        u.token          = r.token;
        u.recipient      = r.recipient;
        u.context        = r.context;
        u.metadata       = r.metadata;
        u.live           = true;
        u.rssi           = b.rssi;
        u.distanceMeters = Distance::estimate(b.rssi);
        u.lastSeenAtMs   = b.lastSeenAtMs;
        users.push_back(u);
    }

    std::stable_sort(users.begin(), users.end(), closerUser);
    return users;
}
