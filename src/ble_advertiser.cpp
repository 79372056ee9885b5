#include "ble_advertiser.h"
#include "config.h"
#include "log.h"
#include "token_codec.h"

const char *advertiserStateName(AdvertiserState s) {
    switch (s) {
        case AdvertiserState::IDLE:         return "idle";
        case AdvertiserState::REGISTERING:  return "registering";
        case AdvertiserState::BROADCASTING: return "broadcasting";
        case AdvertiserState::STOPPING:     return "stopping";
    }
    return "idle";
}

AdvertisingController::AdvertisingController(Radio &radio, BluetoothStateGuard &guard,
                                             DiscoveryClient &client, Clock &clock,
                                             BroadcastCapability capability)
    : _radio(radio), _guard(guard), _client(client), _clock(clock),
      _capability(capability) {}

AdvertisePayload AdvertisingController::buildPayload(BroadcastCapability capability,
                                                     const BeaconRegistration &reg) {
    AdvertisePayload p;
    p.kind = capability;
    switch (capability) {
        case BroadcastCapability::SERVICE_IDENTIFIER:
            p.serviceIdentifier = TokenCodec::encodeServiceIdentifier(reg.major, reg.minor);
            p.localName         = TokenCodec::encodeDeviceName(reg.token);
            break;
        case BroadcastCapability::IBEACON:
            p.manufacturerData  = TokenCodec::encodeIBeacon(reg.major, reg.minor,
                                                            (int8_t)ADV_TX_POWER_DBM);
            break;
    }
    return p;
}

bool AdvertisingController::start(DiscoveryContext ctx, const AdvertiseOptions &opts) {
    if (_state != AdvertiserState::IDLE || _hasToken) {
        LOG_I("Replacing active registration");
        stop();
    }

    _state = AdvertiserState::REGISTERING;
    _ctx   = ctx;
    _opts  = opts;

    BeaconRegistration reg;
    DiscoveryStatus st = _client.registerBeacon(ctx, opts.registration, reg);
    if (st != DiscoveryStatus::OK) {
        LOG_E("Advertising aborted: registration %s", discoveryStatusName(st));
        _state = AdvertiserState::IDLE;
        return false;
    }
    _reg      = reg;
    _hasToken = true;

    std::string serviceId = TokenCodec::encodeServiceIdentifier(reg.major, reg.minor);
    LOG_D("Service identifier %s", serviceId.c_str());

    if (!_guard.ensureReady()) {
        abandon("BLE not ready");
        return false;
    }

    AdvertisePayload payload = buildPayload(_capability, _reg);
    if (!broadcastWithRetry(payload)) {
        abandon("native advertising failed");
        return false;
    }

    LOG_I("Advertising %s as %s (%s) for %lu s", TokenCodec::toHex(_reg.token).c_str(),
          broadcastCapabilityName(_capability), discoveryContextName(ctx),
          (unsigned long)_reg.ttlSeconds);
    return true;
}

bool AdvertisingController::broadcastWithRetry(const AdvertisePayload &payload) {
    for (uint8_t attempt = 0; attempt <= ADV_START_RETRIES; attempt++) {
        if (attempt > 0) {
            LOG_W("Advertising start failed, retry %u/%u", attempt, ADV_START_RETRIES);
            _clock.sleepMs(ADV_RETRY_BACKOFF_MS);
        }
        _state = AdvertiserState::BROADCASTING;
        if (_radio.startAdvertising(payload)) return true;
    }
    return false;
}

// Give up on a fresh registration without leaving it live on the backend
void AdvertisingController::abandon(const char *reason) {
    LOG_E("Advertising aborted: %s", reason);
    stop();
}

void AdvertisingController::stop() {
    bool wasBroadcasting = (_state == AdvertiserState::BROADCASTING);
    _state = AdvertiserState::STOPPING;

    if (wasBroadcasting && !_radio.stopAdvertising()) {
        LOG_W("Native advertising stop failed");
    }

    if (_hasToken) {
        std::string hex = TokenCodec::toHex(_reg.token);
        if (!_client.deregister(_reg.token)) {
            LOG_W("Beacon %s left to expire on the backend", hex.c_str());
        }
        LOG_I("Stopped advertising %s", hex.c_str());
    }

    _hasToken = false;
    _reg      = BeaconRegistration();
    _state    = AdvertiserState::IDLE;
}

void AdvertisingController::poll() {
    if (_state != AdvertiserState::BROADCASTING || !_hasToken) return;

    uint32_t now = _clock.nowMs();

    if (_opts.autoRenew) {
        uint32_t margin = ADV_RENEW_MARGIN_S * 1000UL;
        uint32_t ttlMs  = _reg.ttlSeconds * 1000UL;
        uint32_t renewAt = ttlMs > margin ? _reg.expiresAtMs - margin : _reg.issuedAtMs + ttlMs / 2;
        if (deadlineReached(now, renewAt)) {
            LOG_I("Renewing beacon %s", TokenCodec::toHex(_reg.token).c_str());
            DiscoveryContext ctx = _ctx;
            AdvertiseOptions opts = _opts;
            if (!start(ctx, opts)) {
                LOG_E("Renewal failed, advertising stopped");
            }
        }
        return;
    }

    if (deadlineReached(now, _reg.expiresAtMs)) {
        // The backend has already dropped it; nothing to deregister
        LOG_I("Beacon %s expired", TokenCodec::toHex(_reg.token).c_str());
        if (!_radio.stopAdvertising()) {
            LOG_W("Native advertising stop failed");
        }
        _hasToken = false;
        _reg      = BeaconRegistration();
        _state    = AdvertiserState::IDLE;
    }
}

bool AdvertisingController::activeToken(BeaconToken &out) const {
    if (!_hasToken) return false;
    out = _reg.token;
    return true;
}

uint32_t AdvertisingController::remainingSeconds() {
    if (!_hasToken) return 0;
    uint32_t now = _clock.nowMs();
    if (deadlineReached(now, _reg.expiresAtMs)) return 0;
    return (_reg.expiresAtMs - now) / 1000UL;
}
