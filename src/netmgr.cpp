#include "netmgr.h"
#include <WiFi.h>
#include "config.h"
#include "log.h"
#include "storage.h"

static const uint32_t RECONNECT_PERIOD_MS = 60000;
static uint32_t s_lastAttemptMs = 0;
static bool     s_wasConnected  = false;

namespace NetMgr {

bool connect() {
    String ssid = Storage::getWifiSsid();
    if (ssid.length() == 0) {
        LOG_W("No Wi-Fi SSID configured, discovery backend offline");
        return false;
    }

    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(true);
    WiFi.begin(ssid.c_str(), Storage::getWifiPassword().c_str());
    s_lastAttemptMs = millis();

    uint32_t start = millis();
    while (WiFi.status() != WL_CONNECTED) {
        if (millis() - start >= WIFI_CONNECT_TIMEOUT_MS) {
            LOG_W("Wi-Fi connect to '%s' timed out", ssid.c_str());
            return false;
        }
        delay(100);
    }

    s_wasConnected = true;
    LOG_I("Wi-Fi connected, IP %s", WiFi.localIP().toString().c_str());
    return true;
}

void disconnect() {
    WiFi.disconnect(true);
    s_wasConnected = false;
}

bool isConnected() {
    return WiFi.status() == WL_CONNECTED;
}

void maintain() {
    bool up = isConnected();
    if (up != s_wasConnected) {
        LOG_I("Wi-Fi %s", up ? "up" : "down");
        s_wasConnected = up;
    }
    if (up) return;

    uint32_t now = millis();
    if (now - s_lastAttemptMs < RECONNECT_PERIOD_MS) return;
    s_lastAttemptMs = now;

    String ssid = Storage::getWifiSsid();
    if (ssid.length() == 0) return;
    WiFi.begin(ssid.c_str(), Storage::getWifiPassword().c_str());
}

String localIp() {
    return WiFi.localIP().toString();
}

int rssi() {
    return WiFi.RSSI();
}

} // namespace NetMgr
