#pragma once
#include <stdint.h>
#include <string>
#include "beacon_types.h"

// Conversions between a beacon token and its over-the-air representations.
// All of them are lossless over the full 32-bit domain.
namespace TokenCodec {
    // major/minor are masked to 16 bits before combination
    BeaconToken encode(uint32_t major, uint32_t minor);
    void        decode(BeaconToken token, uint16_t &major, uint16_t &minor);

    // 8 uppercase hex characters, zero padded
    std::string toHex(BeaconToken token);
    // Exactly 8 hex digits, either case. False on anything else.
    bool        fromHex(const std::string &hex, BeaconToken &out);

    // "E2C56DB5-DFFB-MMMM-mmmm-D0F5A71096E0"
    std::string encodeServiceIdentifier(uint32_t major, uint32_t minor);
    // Rejects wrong prefix/suffix, separator or group length; never throws
    bool        decodeServiceIdentifier(const std::string &id, uint16_t &major,
                                        uint16_t &minor, BeaconToken &token);

    // Local-name fallback: "PX" + 8 hex digits
    std::string encodeDeviceName(BeaconToken token);
    bool        decodeDeviceName(const std::string &name, BeaconToken &token);

    // iBeacon manufacturer data: company id (LE), type, length, UUID,
    // major (BE), minor (BE), tx power. 25 bytes.
    std::string encodeIBeacon(uint16_t major, uint16_t minor, int8_t txPower);
    // Accepts the payload with or without the leading company id.
    // The UUID must be the fixed announcement UUID.
    bool        decodeIBeacon(const std::string &data, uint16_t &major,
                              uint16_t &minor, BeaconToken &token);

    // Parse "XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX" into 16 bytes
    bool        parseUuid(const std::string &uuid, uint8_t out[16]);
}
