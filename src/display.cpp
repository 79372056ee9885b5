#include "display.h"
#include "distance.h"
#include <Wire.h>

// U8g2 constructor for SSD1306/SSD1315 128x64 I2C
static U8G2_SSD1306_128X64_NONAME_F_HW_I2C u8g2(U8G2_R0, U8X8_PIN_NONE);

static bool     s_awake        = false;
static uint32_t s_lastActivity = 0;
static bool     s_dirty        = true;

// ─── Internal helpers ────────────────────────────────────────────────────────

// Copy into buf, cutting with ".." when wider than maxChars
static const char *fit(const std::string &s, char *buf, size_t bufLen, size_t maxChars) {
    if (maxChars + 1 > bufLen) maxChars = bufLen - 1;
    if (s.size() <= maxChars) {
        snprintf(buf, bufLen, "%s", s.c_str());
    } else {
        snprintf(buf, bufLen, "%.*s..", (int)(maxChars - 2), s.c_str());
    }
    return buf;
}

static const std::string &nameOf(const NearbyUser &u) {
    if (u.recipient.isMerchant && !u.recipient.merchantName.empty()) return u.recipient.merchantName;
    return u.recipient.displayName;
}

static void formatDistance(const NearbyUser &u, char *buf, size_t len) {
    if (!u.live) {
        snprintf(buf, len, "--");
    } else if (u.distanceMeters < 10.0f) {
        snprintf(buf, len, "%.1fm", u.distanceMeters);
    } else {
        snprintf(buf, len, "%dm", (int)(u.distanceMeters + 0.5f));
    }
}

static void drawHeader(const char *title) {
    u8g2.setFont(u8g2_font_6x13_tf);
    u8g2.drawStr(2, 11, title);
    u8g2.drawHLine(0, 14, 128);
}

// ─── Public API ──────────────────────────────────────────────────────────────

namespace Display {

void begin() {
    u8g2.begin();
    u8g2.setContrast(128);
    s_awake = true;
    s_lastActivity = millis();
}

void wake() {
    u8g2.setPowerSave(0);
    s_awake = true;
    s_lastActivity = millis();
    s_dirty = true;
}

void sleep() {
    u8g2.setPowerSave(1);
    s_awake = false;
}

bool isAwake() { return s_awake; }

void checkAutoOff() {
    if (s_awake && (millis() - s_lastActivity > DISPLAY_TIMEOUT_MS)) {
        sleep();
    }
}

void markDirty() {
    s_dirty = true;
}

bool isDirty() { return s_dirty; }

void drawAdvertising(AppMode mode, const char *tokenHex, uint32_t remainingS,
                     const char *via) {
    u8g2.clearBuffer();
    drawHeader(mode == AppMode::MERCHANT ? "Merchant till" : "Ready to receive");

    u8g2.setFont(u8g2_font_10x20_tf);
    u8g2.drawStr(24, 38, tokenHex);

    char buf[24];
    u8g2.setFont(u8g2_font_5x7_tf);
    snprintf(buf, sizeof(buf), "%u:%02u left", (unsigned)(remainingS / 60),
             (unsigned)(remainingS % 60));
    u8g2.drawStr(2, 52, buf);
    snprintf(buf, sizeof(buf), "via %s", via);
    u8g2.drawStr(2, 62, buf);

    // Broadcasting pulse
    if ((millis() / 500) % 2) u8g2.drawDisc(120, 56, 3);

    u8g2.sendBuffer();
    s_dirty = false;
}

void drawNearbyList(const std::vector<NearbyUser> &users, size_t selected,
                    bool fallback) {
    u8g2.clearBuffer();

    char title[24];
    snprintf(title, sizeof(title), "%s (%u)", fallback ? "Active" : "Nearby",
             (unsigned)users.size());
    drawHeader(title);

    u8g2.setFont(u8g2_font_6x10_tf);
    if (users.empty()) {
        u8g2.drawStr(2, 36, "Looking for people...");
        u8g2.sendBuffer();
        s_dirty = false;
        return;
    }

    // Scroll so the selection stays on screen
    size_t first = 0;
    if (selected >= DISPLAY_LIST_ROWS) first = selected - DISPLAY_LIST_ROWS + 1;

    for (size_t row = 0; row < DISPLAY_LIST_ROWS && first + row < users.size(); row++) {
        const NearbyUser &u = users[first + row];
        int y = 26 + (int)row * 12;

        if (first + row == selected) {
            u8g2.drawBox(0, y - 9, 128, 11);
            u8g2.setDrawColor(0);
        }

        char name[16];
        fit(nameOf(u), name, sizeof(name), 13);
        u8g2.drawStr(u.recipient.isMerchant ? 10 : 2, y, name);
        if (u.recipient.isMerchant) u8g2.drawStr(2, y, "$");

        char dist[10];
        formatDistance(u, dist, sizeof(dist));
        u8g2.drawStr(128 - 2 - u8g2.getStrWidth(dist), y, dist);

        u8g2.setDrawColor(1);
    }

    u8g2.sendBuffer();
    s_dirty = false;
}

void drawUserDetail(const NearbyUser &user) {
    u8g2.clearBuffer();

    char buf[32];
    drawHeader(fit(nameOf(user), buf, sizeof(buf), 20));

    u8g2.setFont(u8g2_font_5x7_tf);
    if (!user.recipient.bankName.empty()) {
        u8g2.drawStr(2, 24, fit(user.recipient.bankName, buf, sizeof(buf), 25));
    }
    if (user.recipient.isMerchant && !user.recipient.merchantCategory.empty()) {
        u8g2.drawStr(2, 33, fit(user.recipient.merchantCategory, buf, sizeof(buf), 25));
    } else if (!user.recipient.recipientAlias.empty()) {
        u8g2.drawStr(2, 33, fit(user.recipient.recipientAlias, buf, sizeof(buf), 25));
    }

    if (user.metadata.hasAmount) {
        snprintf(buf, sizeof(buf), "Request: %.2f", user.metadata.amount);
        u8g2.drawStr(2, 43, buf);
    }
    if (!user.metadata.description.empty()) {
        u8g2.drawStr(2, 52, fit(user.metadata.description, buf, sizeof(buf), 25));
    }

    if (user.live) {
        char dist[10];
        formatDistance(user, dist, sizeof(dist));
        snprintf(buf, sizeof(buf), "%s  %s  %ddBm", dist,
                 Distance::label(Distance::bucket(user.distanceMeters)), user.rssi);
    } else {
        snprintf(buf, sizeof(buf), "server listing");
    }
    u8g2.drawStr(2, 62, buf);

    u8g2.sendBuffer();
    s_dirty = false;
}

void drawStatus(const char *title, const char *line) {
    u8g2.clearBuffer();
    drawHeader(title);
    u8g2.setFont(u8g2_font_6x10_tf);
    u8g2.drawStr(2, 36, line);
    u8g2.sendBuffer();
    s_dirty = false;
}

void drawDiagnostic(const DiagInfo &info) {
    u8g2.clearBuffer();
    u8g2.setFont(u8g2_font_5x7_tf);
    char buf[32];
    snprintf(buf, sizeof(buf), "FW: %s", info.version);
    u8g2.drawStr(2, 8, buf);

    snprintf(buf, sizeof(buf), "RAM: %lu B", (unsigned long)info.freeHeap);
    u8g2.drawStr(2, 17, buf);

    if (info.wifiUp) snprintf(buf, sizeof(buf), "WiFi: up %d dBm", info.wifiRssi);
    else             snprintf(buf, sizeof(buf), "WiFi: down");
    u8g2.drawStr(2, 26, buf);

    snprintf(buf, sizeof(buf), "BLE: %s drop %lu", info.radioState,
             (unsigned long)info.droppedFrames);
    u8g2.drawStr(2, 35, buf);

    if (info.rateRemaining >= 0) snprintf(buf, sizeof(buf), "Lookups left: %ld", (long)info.rateRemaining);
    else                         snprintf(buf, sizeof(buf), "Lookups left: ?");
    u8g2.drawStr(2, 44, buf);

    snprintf(buf, sizeof(buf), "Last: %s %d", info.lastStatus, info.httpCode);
    u8g2.drawStr(2, 53, buf);

    u8g2.sendBuffer();
    s_dirty = false;
}

} // namespace Display
