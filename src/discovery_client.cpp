#include "discovery_client.h"
#include "log.h"
#include "token_codec.h"
#include <ArduinoJson.h>

#define PATH_REGISTER  "/api/v1/discovery/beacon/register"
#define PATH_LOOKUP    "/api/v1/discovery/beacon/lookup"
#define PATH_BEACON    "/api/v1/discovery/beacon/"
#define PATH_ACTIVE    "/api/v1/discovery/beacon/active"

static const size_t REQUEST_DOC_SIZE  = 1024;
static const size_t REGISTER_DOC_SIZE = 512;

// Response documents grow with the body: strings are copied out of a
// std::string input, and each member costs a slot on top of its text
static size_t responseCapacity(const std::string &body) {
    return body.size() * 3 + 1024;
}

static std::string jsonString(JsonVariantConst v) {
    const char *s = v.as<const char *>();
    return s ? std::string(s) : std::string();
}

static void parseRecipient(JsonObjectConst r, BeaconRecipient &out) {
    out.displayName      = jsonString(r["displayName"]);
    out.bankName         = jsonString(r["bankName"]);
    out.profileImageUrl  = jsonString(r["profileImageUrl"]);
    out.initialsColor    = jsonString(r["initialsColor"]);
    out.isMerchant       = r["isMerchant"] | false;
    out.merchantLogoUrl  = jsonString(r["merchantLogoUrl"]);
    out.merchantName     = jsonString(r["merchantName"]);
    out.merchantCategory = jsonString(r["merchantCategory"]);
    out.recipientAlias   = jsonString(r["recipientAlias"]);
    out.aliasType        = jsonString(r["aliasType"]);
}

static void parseMetadata(JsonObjectConst m, PaymentMetadata &out) {
    if (m.isNull()) return;
    if (!m["amount"].isNull()) {
        out.hasAmount = true;
        out.amount    = m["amount"].as<double>();
    }
    out.description = jsonString(m["description"]);
}

const char *discoveryStatusName(DiscoveryStatus s) {
    switch (s) {
        case DiscoveryStatus::OK:               return "ok";
        case DiscoveryStatus::NOT_FOUND:        return "not-found";
        case DiscoveryStatus::INVALID_ARGUMENT: return "invalid-argument";
        case DiscoveryStatus::UNAUTHORIZED:     return "unauthorized";
        case DiscoveryStatus::REJECTED:         return "rejected";
        case DiscoveryStatus::RATE_LIMITED:     return "rate-limited";
        case DiscoveryStatus::TRANSPORT_ERROR:  return "transport-error";
        case DiscoveryStatus::BAD_RESPONSE:     return "bad-response";
    }
    return "unknown";
}

DiscoveryClient::DiscoveryClient(HttpTransport &http, Clock &clock)
    : _http(http), _clock(clock) {}

DiscoveryStatus DiscoveryClient::statusFor(int httpStatus) const {
    if (httpStatus >= 200 && httpStatus < 300) return DiscoveryStatus::OK;
    if (httpStatus == 401 || httpStatus == 403) return DiscoveryStatus::UNAUTHORIZED;
    if (httpStatus == 404) return DiscoveryStatus::NOT_FOUND;
    if (httpStatus == 429) return DiscoveryStatus::RATE_LIMITED;
    if (httpStatus >= 400 && httpStatus < 500) return DiscoveryStatus::REJECTED;
    return DiscoveryStatus::TRANSPORT_ERROR;
}

// ─── register ────────────────────────────────────────────────────────────────

DiscoveryStatus DiscoveryClient::registerBeacon(DiscoveryContext ctx,
                                                const RegisterOptions &opts,
                                                BeaconRegistration &out) {
    if (opts.ttlSeconds == 0 || opts.ttlSeconds > DISCOVERY_MAX_TTL_S) {
        LOG_E("Register rejected: ttl %lu outside 1..%d s",
              (unsigned long)opts.ttlSeconds, DISCOVERY_MAX_TTL_S);
        return DiscoveryStatus::INVALID_ARGUMENT;
    }

    DynamicJsonDocument req(REQUEST_DOC_SIZE);
    req["context"]   = discoveryContextName(ctx);
    req["expiresIn"] = opts.ttlSeconds;
    if (!opts.metadata.empty()) {
        JsonObject meta = req.createNestedObject("metadata");
        if (opts.metadata.hasAmount) meta["amount"] = opts.metadata.amount;
        if (!opts.metadata.description.empty()) meta["description"] = opts.metadata.description;
    }
    std::string body;
    serializeJson(req, body);

    LOG_I("Registering beacon: context=%s ttl=%lu", discoveryContextName(ctx),
          (unsigned long)opts.ttlSeconds);

    HttpResponse resp;
    if (!_http.request("POST", PATH_REGISTER, body, resp)) {
        LOG_E("Register failed: no response");
        return DiscoveryStatus::TRANSPORT_ERROR;
    }
    DiscoveryStatus st = statusFor(resp.status);
    if (st != DiscoveryStatus::OK) {
        LOG_E("Register failed: HTTP %d (%s)", resp.status, discoveryStatusName(st));
        return st;
    }

    DynamicJsonDocument doc(REGISTER_DOC_SIZE);
    DeserializationError err = deserializeJson(doc, resp.body);
    if (err) {
        LOG_E("Register response unparseable: %s", err.c_str());
        return DiscoveryStatus::BAD_RESPONSE;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    BeaconToken token;
    if (!TokenCodec::fromHex(jsonString(root["beaconToken"]), token)) {
        LOG_E("Register response without a valid beaconToken");
        return DiscoveryStatus::BAD_RESPONSE;
    }

    BeaconRegistration reg;
    reg.token = token;
    TokenCodec::decode(token, reg.major, reg.minor);
    if (!root["major"].isNull() && !root["minor"].isNull()) {
        uint32_t major = root["major"].as<uint32_t>();
        uint32_t minor = root["minor"].as<uint32_t>();
        if (TokenCodec::encode(major, minor) != token) {
            // The token is what gets resolved; keep the broadcast consistent with it
            LOG_W("Register major/minor %lu/%lu disagree with token %s",
                  (unsigned long)major, (unsigned long)minor, TokenCodec::toHex(token).c_str());
        }
    }
    reg.ttlSeconds  = root["ttlSeconds"] | opts.ttlSeconds;
    if (reg.ttlSeconds == 0 || reg.ttlSeconds > DISCOVERY_MAX_TTL_S) reg.ttlSeconds = opts.ttlSeconds;
    reg.expiresAt   = jsonString(root["expiresAt"]);
    reg.issuedAtMs  = _clock.nowMs();
    reg.expiresAtMs = reg.issuedAtMs + reg.ttlSeconds * 1000UL;

    LOG_I("Registered beacon %s (major %u minor %u) expires %s",
          TokenCodec::toHex(token).c_str(), reg.major, reg.minor, reg.expiresAt.c_str());

    out = reg;
    return DiscoveryStatus::OK;
}

// ─── lookup ──────────────────────────────────────────────────────────────────

DiscoveryStatus DiscoveryClient::lookup(const std::vector<BeaconToken> &tokens,
                                        const LookupOptions &opts, LookupResponse &out) {
    out.results.clear();
    out.rateLimit = RateLimitInfo();
    if (tokens.empty()) return DiscoveryStatus::OK;

    size_t count = tokens.size() < (size_t)DISCOVERY_LOOKUP_BATCH
                 ? tokens.size() : (size_t)DISCOVERY_LOOKUP_BATCH;

    DynamicJsonDocument req(REQUEST_DOC_SIZE);
    JsonArray arr = req.createNestedArray("tokens");
    for (size_t i = 0; i < count; i++) {
        arr.add(TokenCodec::toHex(tokens[i]));
    }
    if (opts.hasMinRssi) {
        JsonObject filter = req.createNestedObject("rssiFilter");
        filter["minRssi"] = opts.minRssi;
    }
    std::string body;
    serializeJson(req, body);

    LOG_D("Looking up %u tokens (%u tracked)", (unsigned)count, (unsigned)tokens.size());

    HttpResponse resp;
    if (!_http.request("POST", PATH_LOOKUP, body, resp)) {
        LOG_E("Lookup failed: no response");
        return DiscoveryStatus::TRANSPORT_ERROR;
    }

    DynamicJsonDocument doc(responseCapacity(resp.body));
    DeserializationError err = deserializeJson(doc, resp.body);
    JsonObjectConst root = doc.as<JsonObjectConst>();

    // Rate-limit hints ride on both success and 429 bodies
    if (!err) {
        if (!root["rateLimitRemaining"].isNull()) {
            out.rateLimit.hasRemaining = true;
            out.rateLimit.remaining    = root["rateLimitRemaining"].as<int32_t>();
        }
        out.rateLimit.reset = jsonString(root["rateLimitReset"]);
    }

    DiscoveryStatus st = statusFor(resp.status);
    if (st != DiscoveryStatus::OK) {
        LOG_E("Lookup failed: HTTP %d (%s)", resp.status, discoveryStatusName(st));
        return st;
    }
    if (err) {
        LOG_E("Lookup response unparseable: %s", err.c_str());
        return DiscoveryStatus::BAD_RESPONSE;
    }

    JsonArrayConst results = root["results"].as<JsonArrayConst>();
    if (results.isNull()) {
        LOG_E("Lookup response without results");
        return DiscoveryStatus::BAD_RESPONSE;
    }

    size_t found = 0;
    for (JsonVariantConst item : results) {
        JsonObjectConst r = item.as<JsonObjectConst>();
        LookupResult lr;
        if (!TokenCodec::fromHex(jsonString(r["token"]), lr.token)) continue;
        lr.found = r["found"] | false;
        if (lr.found) {
            lr.hasContext = parseDiscoveryContext(jsonString(r["context"]), lr.context);
            JsonObjectConst rec = r["recipient"].as<JsonObjectConst>();
            if (!rec.isNull()) {
                lr.hasRecipient = true;
                parseRecipient(rec, lr.recipient);
            }
            parseMetadata(r["metadata"].as<JsonObjectConst>(), lr.metadata);
            found++;
        }
        out.results.push_back(lr);
    }

    if (out.rateLimit.hasRemaining) {
        LOG_D("Lookup: %u/%u found, rate limit remaining %ld", (unsigned)found,
              (unsigned)out.results.size(), (long)out.rateLimit.remaining);
    } else {
        LOG_D("Lookup: %u/%u found", (unsigned)found, (unsigned)out.results.size());
    }
    return DiscoveryStatus::OK;
}

// ─── deregister ──────────────────────────────────────────────────────────────

bool DiscoveryClient::deregister(BeaconToken token) {
    std::string hex = TokenCodec::toHex(token);
    LOG_I("Deregistering beacon %s", hex.c_str());

    HttpResponse resp;
    if (!_http.request("DELETE", std::string(PATH_BEACON) + hex, std::string(), resp)) {
        LOG_W("Deregister %s failed: no response", hex.c_str());
        return false;
    }
    DiscoveryStatus st = statusFor(resp.status);
    if (st == DiscoveryStatus::OK || st == DiscoveryStatus::NOT_FOUND) return true;

    LOG_W("Deregister %s failed: HTTP %d", hex.c_str(), resp.status);
    return false;
}

// ─── active listing ──────────────────────────────────────────────────────────

DiscoveryStatus DiscoveryClient::listActive(const DiscoveryContext *ctx,
                                            std::vector<NearbyUser> &out) {
    out.clear();

    std::string path(PATH_ACTIVE);
    if (ctx) {
        path += "?context=";
        path += discoveryContextName(*ctx);
    }

    HttpResponse resp;
    if (!_http.request("GET", path, std::string(), resp)) {
        LOG_E("Active listing failed: no response");
        return DiscoveryStatus::TRANSPORT_ERROR;
    }
    DiscoveryStatus st = statusFor(resp.status);
    if (st == DiscoveryStatus::NOT_FOUND) {
        LOG_I("Active listing not available on this backend");
        return DiscoveryStatus::OK;
    }
    if (st != DiscoveryStatus::OK) {
        LOG_E("Active listing failed: HTTP %d (%s)", resp.status, discoveryStatusName(st));
        return st;
    }

    DynamicJsonDocument doc(responseCapacity(resp.body));
    DeserializationError err = deserializeJson(doc, resp.body);
    if (err) {
        LOG_E("Active listing unparseable: %s", err.c_str());
        return DiscoveryStatus::BAD_RESPONSE;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    uint32_t now = _clock.nowMs();
    for (JsonVariantConst item : root["beacons"].as<JsonArrayConst>()) {
        JsonObjectConst b = item.as<JsonObjectConst>();
        NearbyUser u;
        if (!TokenCodec::fromHex(jsonString(b["token"]), u.token)) continue;
        JsonObjectConst rec = b["recipient"].as<JsonObjectConst>();
        if (rec.isNull()) continue;
        if (!parseDiscoveryContext(jsonString(b["context"]), u.context)) {
            if (!ctx) continue;
            u.context = *ctx;
        }
        parseRecipient(rec, u.recipient);
        parseMetadata(b["metadata"].as<JsonObjectConst>(), u.metadata);
        u.live         = false;
        u.lastSeenAtMs = now;
        out.push_back(u);
    }

    LOG_I("Active listing: %u beacons", (unsigned)out.size());
    return DiscoveryStatus::OK;
}
