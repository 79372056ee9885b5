#include "ble_guard.h"
#include "log.h"
#include <atomic>
#include <memory>

enum : uint8_t {
    WAIT_PENDING     = 0,
    WAIT_READY       = 1,
    WAIT_UNSUPPORTED = 2
};

BluetoothStateGuard::BluetoothStateGuard(Radio &radio, Clock &clock)
    : _radio(radio), _clock(clock) {}

BluetoothStatus BluetoothStateGuard::checkState() {
    BluetoothStatus st;
    st.state     = _radio.state();
    st.supported = st.state != RadioState::UNSUPPORTED;
    st.enabled   = st.state == RadioState::POWERED_ON;
    return st;
}

bool BluetoothStateGuard::waitForReady(uint32_t timeoutMs) {
    // Shared with the listener, which may run on the BLE host task
    std::shared_ptr<std::atomic<uint8_t> > outcome =
        std::make_shared<std::atomic<uint8_t> >(WAIT_PENDING);

    uint32_t id = _radio.addStateListener([outcome](RadioState s) {
        if (s == RadioState::POWERED_ON) {
            uint8_t expected = WAIT_PENDING;
            outcome->compare_exchange_strong(expected, WAIT_READY);
        } else if (s == RadioState::UNSUPPORTED) {
            uint8_t expected = WAIT_PENDING;
            outcome->compare_exchange_strong(expected, WAIT_UNSUPPORTED);
        }
    });

    uint32_t start = _clock.nowMs();
    while (outcome->load() == WAIT_PENDING) {
        if (_clock.nowMs() - start >= timeoutMs) break;
        _clock.sleepMs(BLE_READY_POLL_MS);
    }

    _radio.removeStateListener(id);

    uint8_t result = outcome->load();
    if (result == WAIT_READY) return true;

    if (result == WAIT_UNSUPPORTED) {
        LOG_W("BLE unsupported on this hardware");
    } else {
        LOG_W("BLE not ready after %lu ms (state %s)", (unsigned long)timeoutMs,
              radioStateName(_radio.state()));
    }
    return false;
}

bool BluetoothStateGuard::requestPermissions() {
    if (_radio.permissionModel() == PermissionModel::IMPLICIT) {
        BluetoothStatus st = checkState();
        if (!st.supported) {
            LOG_W("BLE not supported");
            return false;
        }
        if (st.enabled) return true;
        // Grant and power-on can lag behind each other; give it a moment
        return waitForReady();
    }

    std::vector<RadioPermission> perms = requiredPermissions(_radio.osApiLevel());
    if (!_radio.requestPermissions(perms)) {
        LOG_W("BLE permissions denied (%u requested)", (unsigned)perms.size());
        return false;
    }
    return true;
}

bool BluetoothStateGuard::ensureReady(uint32_t timeoutMs) {
    if (!requestPermissions()) return false;
    return waitForReady(timeoutMs);
}

std::vector<RadioPermission> BluetoothStateGuard::requiredPermissions(int apiLevel) {
    std::vector<RadioPermission> perms;
    if (apiLevel >= 31) {
        perms.push_back(RadioPermission::SCAN);
        perms.push_back(RadioPermission::ADVERTISE);
        perms.push_back(RadioPermission::CONNECT);
    }
    perms.push_back(RadioPermission::FINE_LOCATION);
    return perms;
}
