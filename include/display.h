#pragma once
#include <Arduino.h>
#include <U8g2lib.h>
#include <vector>
#include "beacon_types.h"
#include "config.h"
#include "storage.h"

struct DiagInfo {
    const char *version;
    uint32_t    freeHeap;
    bool        wifiUp;
    int         wifiRssi;
    const char *radioState;
    uint32_t    droppedFrames;
    int32_t     rateRemaining;   // -1 when the backend sent no hint
    const char *lastStatus;
    int         httpCode;        // last backend exchange, negative on transport error
};

namespace Display {
    void begin();
    void wake();
    void sleep();
    bool isAwake();
    void checkAutoOff();       // call every loop tick

    // Receive / merchant mode: the token currently on air
    void drawAdvertising(AppMode mode, const char *tokenHex, uint32_t remainingS,
                         const char *via);

    // Send mode: up to DISPLAY_LIST_ROWS users around the selection
    void drawNearbyList(const std::vector<NearbyUser> &users, size_t selected,
                        bool fallback);
    void drawUserDetail(const NearbyUser &user);

    // Two-line status or error
    void drawStatus(const char *title, const char *line);

    void drawDiagnostic(const DiagInfo &info);

    // Signal a redraw is needed
    void markDirty();
    bool isDirty();
}
