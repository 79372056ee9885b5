#include "token_codec.h"
#include "config.h"
#include <string.h>

static const char HEX_DIGITS[] = "0123456789ABCDEF";

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Parse exactly `len` hex digits starting at `pos`
static bool parseHexGroup(const std::string &s, size_t pos, size_t len, uint32_t &out) {
    if (pos + len > s.size()) return false;
    uint32_t v = 0;
    for (size_t i = 0; i < len; i++) {
        int d = hexValue(s[pos + i]);
        if (d < 0) return false;
        v = (v << 4) | (uint32_t)d;
    }
    out = v;
    return true;
}

static void appendHex(std::string &s, uint32_t v, int digits) {
    for (int i = digits - 1; i >= 0; i--) {
        s += HEX_DIGITS[(v >> (i * 4)) & 0x0F];
    }
}

static bool equalsIgnoreCase(const std::string &s, size_t pos, const char *lit) {
    size_t n = strlen(lit);
    if (pos + n > s.size()) return false;
    for (size_t i = 0; i < n; i++) {
        char a = s[pos + i], b = lit[i];
        if (a >= 'a' && a <= 'z') a = (char)(a - 'a' + 'A');
        if (b >= 'a' && b <= 'z') b = (char)(b - 'a' + 'A');
        if (a != b) return false;
    }
    return true;
}

namespace TokenCodec {

BeaconToken encode(uint32_t major, uint32_t minor) {
    return ((major & 0xFFFFu) << 16) | (minor & 0xFFFFu);
}

void decode(BeaconToken token, uint16_t &major, uint16_t &minor) {
    major = (uint16_t)((token >> 16) & 0xFFFFu);
    minor = (uint16_t)(token & 0xFFFFu);
}

std::string toHex(BeaconToken token) {
    std::string s;
    s.reserve(8);
    appendHex(s, token, 8);
    return s;
}

bool fromHex(const std::string &hex, BeaconToken &out) {
    if (hex.size() != 8) return false;
    uint32_t v;
    if (!parseHexGroup(hex, 0, 8, v)) return false;
    out = v;
    return true;
}

std::string encodeServiceIdentifier(uint32_t major, uint32_t minor) {
    std::string s(SERVICE_ID_PREFIX);
    appendHex(s, major & 0xFFFFu, 4);
    s += '-';
    appendHex(s, minor & 0xFFFFu, 4);
    s += SERVICE_ID_SUFFIX;
    return s;
}

bool decodeServiceIdentifier(const std::string &id, uint16_t &major,
                             uint16_t &minor, BeaconToken &token) {
    const size_t prefixLen = sizeof(SERVICE_ID_PREFIX) - 1;
    const size_t suffixLen = sizeof(SERVICE_ID_SUFFIX) - 1;
    if (id.size() != prefixLen + 4 + 1 + 4 + suffixLen) return false;

    if (!equalsIgnoreCase(id, 0, SERVICE_ID_PREFIX)) return false;
    if (id[prefixLen + 4] != '-') return false;
    if (!equalsIgnoreCase(id, prefixLen + 9, SERVICE_ID_SUFFIX)) return false;

    uint32_t hi, lo;
    if (!parseHexGroup(id, prefixLen, 4, hi)) return false;
    if (!parseHexGroup(id, prefixLen + 5, 4, lo)) return false;

    major = (uint16_t)hi;
    minor = (uint16_t)lo;
    token = encode(hi, lo);
    return true;
}

std::string encodeDeviceName(BeaconToken token) {
    return std::string(DEVICE_NAME_PREFIX) + toHex(token);
}

bool decodeDeviceName(const std::string &name, BeaconToken &token) {
    const size_t prefixLen = sizeof(DEVICE_NAME_PREFIX) - 1;
    if (name.size() != prefixLen + 8) return false;
    if (name.compare(0, prefixLen, DEVICE_NAME_PREFIX) != 0) return false;
    return fromHex(name.substr(prefixLen), token);
}

bool parseUuid(const std::string &uuid, uint8_t out[16]) {
    // 8-4-4-4-12
    static const size_t groups[] = {8, 4, 4, 4, 12};
    if (uuid.size() != 36) return false;

    size_t pos = 0, byteIdx = 0;
    for (size_t g = 0; g < 5; g++) {
        if (g > 0) {
            if (uuid[pos] != '-') return false;
            pos++;
        }
        for (size_t i = 0; i < groups[g]; i += 2) {
            uint32_t b;
            if (!parseHexGroup(uuid, pos + i, 2, b)) return false;
            out[byteIdx++] = (uint8_t)b;
        }
        pos += groups[g];
    }
    return true;
}

std::string encodeIBeacon(uint16_t major, uint16_t minor, int8_t txPower) {
    uint8_t uuid[16];
    parseUuid(BEACON_UUID, uuid);

    std::string data;
    data.reserve(25);
    data += (char)(IBEACON_COMPANY_ID & 0xFF);
    data += (char)((IBEACON_COMPANY_ID >> 8) & 0xFF);
    data += (char)IBEACON_TYPE;
    data += (char)IBEACON_LENGTH;
    data.append((const char *)uuid, 16);
    data += (char)((major >> 8) & 0xFF);
    data += (char)(major & 0xFF);
    data += (char)((minor >> 8) & 0xFF);
    data += (char)(minor & 0xFF);
    data += (char)txPower;
    return data;
}

bool decodeIBeacon(const std::string &data, uint16_t &major,
                   uint16_t &minor, BeaconToken &token) {
    const uint8_t *p = (const uint8_t *)data.data();
    size_t len = data.size();

    // Skip company id when the stack hands it through
    if (len >= 25 && p[0] == (IBEACON_COMPANY_ID & 0xFF) &&
        p[1] == ((IBEACON_COMPANY_ID >> 8) & 0xFF)) {
        p   += 2;
        len -= 2;
    }
    if (len < 23) return false;
    if (p[0] != IBEACON_TYPE || p[1] != IBEACON_LENGTH) return false;

    uint8_t uuid[16];
    parseUuid(BEACON_UUID, uuid);
    if (memcmp(p + 2, uuid, 16) != 0) return false;

    major = (uint16_t)((p[18] << 8) | p[19]);
    minor = (uint16_t)((p[20] << 8) | p[21]);
    token = encode(major, minor);
    return true;
}

} // namespace TokenCodec
