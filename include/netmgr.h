#pragma once
#include <Arduino.h>

// Wi-Fi station link for backend calls
namespace NetMgr {
    // Blocks up to WIFI_CONNECT_TIMEOUT_MS. False leaves discovery offline.
    bool connect();
    void disconnect();
    bool isConnected();

    // Re-attempt a dropped link at most once per retry period; call every loop tick
    void maintain();

    String localIp();
    int    rssi();
}
