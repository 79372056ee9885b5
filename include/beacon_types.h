#pragma once
#include <stdint.h>
#include <string>
#include <vector>

// Opaque 32-bit identifier broadcast over the air
typedef uint32_t BeaconToken;

// Why a token is being broadcast. Carried from registration to resolution.
enum class DiscoveryContext : uint8_t {
    P2P_RECEIVE      = 0,
    MERCHANT_RECEIVE = 1
};

const char *discoveryContextName(DiscoveryContext ctx);
bool parseDiscoveryContext(const std::string &s, DiscoveryContext &out);

struct PaymentMetadata {
    bool        hasAmount = false;
    double      amount    = 0.0;
    std::string description;

    bool empty() const { return !hasAmount && description.empty(); }
};

// Issued by the backend on register; valid until expiry or deregistration
struct BeaconRegistration {
    BeaconToken token       = 0;
    uint16_t    major       = 0;
    uint16_t    minor       = 0;
    uint32_t    issuedAtMs  = 0;   // local clock at registration
    uint32_t    ttlSeconds  = 0;
    uint32_t    expiresAtMs = 0;   // local deadline derived from ttlSeconds
    std::string expiresAt;         // server timestamp, informational
};

// One entry per token in the scanner registry
struct DiscoveredBeacon {
    BeaconToken token          = 0;
    uint16_t    major          = 0;
    uint16_t    minor          = 0;
    int         rssi           = 0;
    float       distanceMeters = 0.0f;
    std::string deviceId;
    uint32_t    lastSeenAtMs   = 0;
};

struct BeaconRecipient {
    std::string displayName;
    std::string bankName;
    std::string profileImageUrl;
    std::string initialsColor;
    bool        isMerchant = false;
    std::string merchantLogoUrl;
    std::string merchantName;
    std::string merchantCategory;
    std::string recipientAlias;
    std::string aliasType;
};

struct LookupResult {
    BeaconToken      token        = 0;
    bool             found        = false;
    bool             hasContext   = false;
    DiscoveryContext context      = DiscoveryContext::P2P_RECEIVE;
    bool             hasRecipient = false;
    BeaconRecipient  recipient;
    PaymentMetadata  metadata;
};

// Rate-limit hints returned with a lookup; surfaced to callers as-is
struct RateLimitInfo {
    bool        hasRemaining = false;
    int32_t     remaining    = 0;
    std::string reset;
};

struct LookupResponse {
    std::vector<LookupResult> results;
    RateLimitInfo             rateLimit;
};

// UI-ready record: backend identity merged with live proximity
struct NearbyUser {
    BeaconToken      token   = 0;
    BeaconRecipient  recipient;
    DiscoveryContext context = DiscoveryContext::P2P_RECEIVE;
    PaymentMetadata  metadata;
    bool             live    = true;   // false for server-side fallback entries
    int              rssi    = 0;
    float            distanceMeters = 0.0f;
    uint32_t         lastSeenAtMs   = 0;
};
