#pragma once
#include <stdint.h>
#include "beacon_types.h"
#include "ble_guard.h"
#include "clock.h"
#include "discovery_client.h"
#include "radio.h"

enum class AdvertiserState : uint8_t {
    IDLE,
    REGISTERING,
    BROADCASTING,
    STOPPING
};

const char *advertiserStateName(AdvertiserState s);

struct AdvertiseOptions {
    RegisterOptions registration;
    bool            autoRenew = false;   // re-register shortly before TTL expiry
};

// Broadcaster role. Owns at most one live registration at a time.
class AdvertisingController {
public:
    AdvertisingController(Radio &radio, BluetoothStateGuard &guard,
                          DiscoveryClient &client, Clock &clock,
                          BroadcastCapability capability);

    // Register, encode, broadcast. Any previous registration is stopped first.
    bool start(DiscoveryContext ctx, const AdvertiseOptions &opts = AdvertiseOptions());

    // Always ends IDLE with no active token, whatever fails on the way
    void stop();

    // TTL bookkeeping; call from the main loop
    void poll();

    AdvertiserState state() const { return _state; }
    bool isAdvertising() const { return _state == AdvertiserState::BROADCASTING; }
    bool activeToken(BeaconToken &out) const;
    const BeaconRegistration &registration() const { return _reg; }
    DiscoveryContext context() const { return _ctx; }
    BroadcastCapability capability() const { return _capability; }

    // Seconds until the registration lapses, 0 when idle
    uint32_t remainingSeconds();

    // Payload for the configured primitive
    static AdvertisePayload buildPayload(BroadcastCapability capability,
                                         const BeaconRegistration &reg);

private:
    Radio               &_radio;
    BluetoothStateGuard &_guard;
    DiscoveryClient     &_client;
    Clock               &_clock;
    BroadcastCapability  _capability;

    AdvertiserState    _state     = AdvertiserState::IDLE;
    bool               _hasToken  = false;
    BeaconRegistration _reg;
    DiscoveryContext   _ctx       = DiscoveryContext::P2P_RECEIVE;
    AdvertiseOptions   _opts;

    bool broadcastWithRetry(const AdvertisePayload &payload);
    void abandon(const char *reason);
};
