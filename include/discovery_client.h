#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "beacon_types.h"
#include "clock.h"
#include "config.h"
#include "http_transport.h"

enum class DiscoveryStatus : uint8_t {
    OK,
    NOT_FOUND,
    INVALID_ARGUMENT,
    UNAUTHORIZED,
    REJECTED,
    RATE_LIMITED,
    TRANSPORT_ERROR,
    BAD_RESPONSE
};

const char *discoveryStatusName(DiscoveryStatus s);

struct RegisterOptions {
    uint32_t        ttlSeconds = DISCOVERY_DEFAULT_TTL_S;
    PaymentMetadata metadata;
};

struct LookupOptions {
    bool hasMinRssi = false;
    int  minRssi    = SCAN_DEFAULT_MIN_RSSI;
};

// Backend correlation calls. One request per call, no internal retries.
class DiscoveryClient {
public:
    DiscoveryClient(HttpTransport &http, Clock &clock);

    DiscoveryStatus registerBeacon(DiscoveryContext ctx, const RegisterOptions &opts,
                                   BeaconRegistration &out);

    // Only the first DISCOVERY_LOOKUP_BATCH tokens are sent
    DiscoveryStatus lookup(const std::vector<BeaconToken> &tokens,
                           const LookupOptions &opts, LookupResponse &out);

    // Best effort. Not-found counts as success.
    bool deregister(BeaconToken token);

    // Server-side enumeration for when broadcast/scan is unavailable.
    // A missing endpoint yields OK with an empty list.
    DiscoveryStatus listActive(const DiscoveryContext *ctx, std::vector<NearbyUser> &out);

private:
    HttpTransport &_http;
    Clock         &_clock;

    DiscoveryStatus statusFor(int httpStatus) const;
};
