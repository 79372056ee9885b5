#pragma once
#include <stdint.h>
#include <functional>
#include <string>
#include <vector>

enum class RadioState : uint8_t {
    UNKNOWN,
    RESETTING,
    UNSUPPORTED,
    UNAUTHORIZED,
    POWERED_OFF,
    POWERED_ON
};

const char *radioStateName(RadioState s);

// How the host OS grants radio access
enum class PermissionModel : uint8_t {
    IMPLICIT,   // granted with availability, may lag behind power-on
    EXPLICIT    // runtime request, set depends on OS version
};

enum class RadioPermission : uint8_t {
    SCAN,
    ADVERTISE,
    CONNECT,
    FINE_LOCATION
};

// Broadcast primitive used for the beacon
enum class BroadcastCapability : uint8_t {
    SERVICE_IDENTIFIER,   // standard advertising, token in a 128-bit service UUID
    IBEACON               // vendor payload: UUID + major + minor
};

const char *broadcastCapabilityName(BroadcastCapability c);

// What the stack exposes, probed once at startup
struct RadioCapabilities {
    bool serviceIdentifierBroadcast = false;
    bool iBeaconBroadcast           = false;
    bool reportsServiceUuids        = false;
    bool reportsLocalName           = false;
    bool reportsManufacturerData    = false;
};

// Advertisement content for one broadcast primitive
struct AdvertisePayload {
    BroadcastCapability kind = BroadcastCapability::SERVICE_IDENTIFIER;
    std::string serviceIdentifier;   // SERVICE_IDENTIFIER
    std::string localName;           // SERVICE_IDENTIFIER, device-name fallback
    std::string manufacturerData;    // IBEACON, company id first
};

// One observed advertisement. Untrusted, may repeat, may arrive out of order.
struct RadioFrame {
    std::string              deviceId;
    int                      rssi = 0;
    std::string              localName;
    std::vector<std::string> serviceUuids;
    std::string              manufacturerData;
};

typedef std::function<void(RadioState)>        RadioStateListener;
typedef std::function<void(const RadioFrame &)> RadioFrameHandler;

// Process-wide handle to the BLE controller, shared by the advertiser,
// the scanner and the state guard.
class Radio {
public:
    virtual ~Radio() {}

    virtual RadioState        state() = 0;
    virtual RadioCapabilities capabilities() const = 0;

    // Listener is invoked with the current state right away and on every
    // change. Returns an id for removeStateListener.
    virtual uint32_t addStateListener(RadioStateListener listener) = 0;
    virtual void     removeStateListener(uint32_t id) = 0;

    virtual PermissionModel permissionModel() const = 0;
    virtual int             osApiLevel() const { return 0; }
    virtual bool requestPermissions(const std::vector<RadioPermission> &perms) = 0;

    virtual bool startAdvertising(const AdvertisePayload &payload) = 0;
    virtual bool stopAdvertising() = 0;

    virtual bool startScan(RadioFrameHandler handler, bool allowDuplicates) = 0;
    virtual void stopScan() = 0;
};
