#include "radio.h"

const char *radioStateName(RadioState s) {
    switch (s) {
        case RadioState::UNKNOWN:      return "unknown";
        case RadioState::RESETTING:    return "resetting";
        case RadioState::UNSUPPORTED:  return "unsupported";
        case RadioState::UNAUTHORIZED: return "unauthorized";
        case RadioState::POWERED_OFF:  return "powered-off";
        case RadioState::POWERED_ON:   return "powered-on";
    }
    return "unknown";
}

const char *broadcastCapabilityName(BroadcastCapability c) {
    switch (c) {
        case BroadcastCapability::SERVICE_IDENTIFIER: return "service-id";
        case BroadcastCapability::IBEACON:            return "ibeacon";
    }
    return "service-id";
}
