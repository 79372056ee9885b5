#pragma once
#include <stdint.h>
#include <vector>
#include "beacon_types.h"
#include "radio.h"

// Ways a token can be recovered from an advertisement, in priority order
enum class ExtractionStrategy : uint8_t {
    SERVICE_IDENTIFIER,   // structured 128-bit service UUID, cross-platform
    DEVICE_NAME,          // "PX" + hex token in the local name
    IBEACON               // vendor payload with major/minor
};

const char *extractionStrategyName(ExtractionStrategy s);

struct ExtractedToken {
    BeaconToken        token;
    uint16_t           major;
    uint16_t           minor;
    ExtractionStrategy via;
};

// Strategy list is fixed at construction from the radio capability probe;
// the scan loop just walks it.
class BeaconExtractor {
public:
    explicit BeaconExtractor(const RadioCapabilities &caps);

    // First matching strategy wins. False for frames that are not ours.
    bool extract(const RadioFrame &frame, ExtractedToken &out) const;

    const std::vector<ExtractionStrategy> &strategies() const { return _strategies; }

private:
    std::vector<ExtractionStrategy> _strategies;

    static bool apply(ExtractionStrategy s, const RadioFrame &frame, ExtractedToken &out);
};
