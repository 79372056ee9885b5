#pragma once
#include <stdint.h>
#include <vector>
#include "config.h"
#include "clock.h"
#include "radio.h"

struct BluetoothStatus {
    bool       supported;
    bool       enabled;
    RadioState state;
};

// Preconditions for every broadcast or scan: permission and radio power.
// Callers fail fast on a false result.
class BluetoothStateGuard {
public:
    BluetoothStateGuard(Radio &radio, Clock &clock);

    BluetoothStatus checkState();

    // One-shot state listener raced against the timeout. True on power-on,
    // false on unsupported hardware or timeout. The listener is always
    // detached before returning.
    bool waitForReady(uint32_t timeoutMs = BLE_READY_TIMEOUT_MS);

    bool requestPermissions();

    // requestPermissions() followed by waitForReady()
    bool ensureReady(uint32_t timeoutMs = BLE_READY_TIMEOUT_MS);

    // Permission set for an explicit-permission OS at the given API level
    static std::vector<RadioPermission> requiredPermissions(int apiLevel);

private:
    Radio &_radio;
    Clock &_clock;
};
