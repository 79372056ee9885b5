#include "beacon_extractor.h"
#include "token_codec.h"

const char *extractionStrategyName(ExtractionStrategy s) {
    switch (s) {
        case ExtractionStrategy::SERVICE_IDENTIFIER: return "service-id";
        case ExtractionStrategy::DEVICE_NAME:        return "device-name";
        case ExtractionStrategy::IBEACON:            return "ibeacon";
    }
    return "";
}

BeaconExtractor::BeaconExtractor(const RadioCapabilities &caps) {
    if (caps.reportsServiceUuids)     _strategies.push_back(ExtractionStrategy::SERVICE_IDENTIFIER);
    if (caps.reportsLocalName)        _strategies.push_back(ExtractionStrategy::DEVICE_NAME);
    if (caps.reportsManufacturerData) _strategies.push_back(ExtractionStrategy::IBEACON);
}

bool BeaconExtractor::extract(const RadioFrame &frame, ExtractedToken &out) const {
    for (size_t i = 0; i < _strategies.size(); i++) {
        if (apply(_strategies[i], frame, out)) return true;
    }
    return false;
}

bool BeaconExtractor::apply(ExtractionStrategy s, const RadioFrame &frame, ExtractedToken &out) {
    switch (s) {
        case ExtractionStrategy::SERVICE_IDENTIFIER:
            for (size_t i = 0; i < frame.serviceUuids.size(); i++) {
                if (TokenCodec::decodeServiceIdentifier(frame.serviceUuids[i],
                                                        out.major, out.minor, out.token)) {
                    out.via = s;
                    return true;
                }
            }
            return false;

        case ExtractionStrategy::DEVICE_NAME:
            if (frame.localName.empty()) return false;
            if (!TokenCodec::decodeDeviceName(frame.localName, out.token)) return false;
            TokenCodec::decode(out.token, out.major, out.minor);
            out.via = s;
            return true;

        case ExtractionStrategy::IBEACON:
            if (frame.manufacturerData.empty()) return false;
            if (!TokenCodec::decodeIBeacon(frame.manufacturerData,
                                           out.major, out.minor, out.token)) return false;
            out.via = s;
            return true;
    }
    return false;
}
