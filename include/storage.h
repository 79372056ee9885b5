#pragma once
#include <Arduino.h>
#include <Preferences.h>
#include "distance.h"
#include "radio.h"

// Operating modes persisted across reboots
enum class AppMode : uint8_t {
    RECEIVE,    // advertise for peer-to-peer payments
    MERCHANT,   // advertise as a merchant till
    SEND        // scan and resolve nearby recipients
};

const char *appModeName(AppMode m);

// Persistent storage wrappers around ESP32 NVS (Preferences)
namespace Storage {
    void begin();

    // Network
    String getWifiSsid();
    String getWifiPassword();
    void   setWifiSsid(const String &ssid);
    void   setWifiPassword(const String &pass);

    // Backend
    String getApiUrl();
    String getApiKey();
    void   setApiUrl(const String &url);
    void   setApiKey(const String &key);

    // User context used to authorize backend calls
    bool   hasUserContext();
    String getUserId();
    String getBsimId();
    void   setUserId(const String &id);
    void   setBsimId(const String &id);
    void   clearUserContext();

    // Distance calibration, falls back to the compiled-in model
    PathLossModel getPathLoss();
    void          setRssiAt1m(float rssi);
    void          setPathLossExponent(float n);

    // Scanning
    int  getMinRssi();
    void setMinRssi(int rssi);

    // Advertising primitive
    BroadcastCapability getBroadcast();
    void                setBroadcast(BroadcastCapability cap);

    AppMode getMode();
    void    setMode(AppMode m);
}
