#include "storage.h"
#include "config.h"

static Preferences prefs;

const char *appModeName(AppMode m) {
    switch (m) {
        case AppMode::RECEIVE:  return "RECEIVE";
        case AppMode::MERCHANT: return "MERCHANT";
        case AppMode::SEND:     return "SEND";
    }
    return "?";
}

namespace Storage {

void begin() {
    prefs.begin(NVS_NS, false);
}

// ─── Network ─────────────────────────────────────────────────────────────────

String getWifiSsid() {
    return prefs.getString(NVS_KEY_WIFI_SSID, NEARPAY_WIFI_SSID);
}

String getWifiPassword() {
    return prefs.getString(NVS_KEY_WIFI_PASS, NEARPAY_WIFI_PASSWORD);
}

void setWifiSsid(const String &ssid) {
    prefs.putString(NVS_KEY_WIFI_SSID, ssid);
}

void setWifiPassword(const String &pass) {
    prefs.putString(NVS_KEY_WIFI_PASS, pass);
}

// ─── Backend ─────────────────────────────────────────────────────────────────

String getApiUrl() {
    String url = prefs.getString(NVS_KEY_API_URL, NEARPAY_API_URL);
    while (url.endsWith("/")) url.remove(url.length() - 1);
    return url;
}

String getApiKey() {
    return prefs.getString(NVS_KEY_API_KEY, NEARPAY_API_KEY);
}

void setApiUrl(const String &url) {
    prefs.putString(NVS_KEY_API_URL, url);
}

void setApiKey(const String &key) {
    prefs.putString(NVS_KEY_API_KEY, key);
}

// ─── User context ────────────────────────────────────────────────────────────

bool hasUserContext() {
    return getUserId().length() > 0 && getBsimId().length() > 0;
}

String getUserId() {
    return prefs.getString(NVS_KEY_USER_ID, "");
}

String getBsimId() {
    return prefs.getString(NVS_KEY_BSIM_ID, "");
}

void setUserId(const String &id) {
    prefs.putString(NVS_KEY_USER_ID, id);
}

void setBsimId(const String &id) {
    prefs.putString(NVS_KEY_BSIM_ID, id);
}

void clearUserContext() {
    prefs.remove(NVS_KEY_USER_ID);
    prefs.remove(NVS_KEY_BSIM_ID);
}

// ─── Calibration ─────────────────────────────────────────────────────────────

PathLossModel getPathLoss() {
    PathLossModel m;
    m.rssiAt1m = prefs.getFloat(NVS_KEY_RSSI_1M, DISTANCE_RSSI_AT_1M);
    m.exponent = prefs.getFloat(NVS_KEY_PATH_LOSS, DISTANCE_PATH_LOSS_EXP);
    return m;
}

void setRssiAt1m(float rssi) {
    prefs.putFloat(NVS_KEY_RSSI_1M, rssi);
}

void setPathLossExponent(float n) {
    prefs.putFloat(NVS_KEY_PATH_LOSS, n);
}

// ─── Scanning / advertising ──────────────────────────────────────────────────

int getMinRssi() {
    return prefs.getInt(NVS_KEY_MIN_RSSI, SCAN_DEFAULT_MIN_RSSI);
}

void setMinRssi(int rssi) {
    prefs.putInt(NVS_KEY_MIN_RSSI, rssi);
}

BroadcastCapability getBroadcast() {
    uint8_t v = prefs.getUChar(NVS_KEY_BROADCAST, (uint8_t)BroadcastCapability::SERVICE_IDENTIFIER);
    return v == (uint8_t)BroadcastCapability::IBEACON ? BroadcastCapability::IBEACON
                                                      : BroadcastCapability::SERVICE_IDENTIFIER;
}

void setBroadcast(BroadcastCapability cap) {
    prefs.putUChar(NVS_KEY_BROADCAST, (uint8_t)cap);
}

// ─── Mode ────────────────────────────────────────────────────────────────────

AppMode getMode() {
    uint8_t v = prefs.getUChar(NVS_KEY_MODE, (uint8_t)AppMode::SEND);
    if (v > (uint8_t)AppMode::SEND) return AppMode::SEND;
    return (AppMode)v;
}

void setMode(AppMode m) {
    prefs.putUChar(NVS_KEY_MODE, (uint8_t)m);
}

} // namespace Storage
