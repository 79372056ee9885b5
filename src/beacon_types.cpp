#include "beacon_types.h"

const char *discoveryContextName(DiscoveryContext ctx) {
    switch (ctx) {
        case DiscoveryContext::P2P_RECEIVE:      return "P2P_RECEIVE";
        case DiscoveryContext::MERCHANT_RECEIVE: return "MERCHANT_RECEIVE";
    }
    return "P2P_RECEIVE";
}

bool parseDiscoveryContext(const std::string &s, DiscoveryContext &out) {
    if (s == "P2P_RECEIVE") {
        out = DiscoveryContext::P2P_RECEIVE;
        return true;
    }
    if (s == "MERCHANT_RECEIVE") {
        out = DiscoveryContext::MERCHANT_RECEIVE;
        return true;
    }
    return false;
}
