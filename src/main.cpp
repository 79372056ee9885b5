/*
 * NearPay: proximity payment discovery
 * Platform: TTGO T-Beam V1.1 (dev) / XIAO ESP32-S3 (production)
 *
 * Build with PlatformIO. Set PLATFORM_TBEAM or PLATFORM_XIAO_S3 in
 * platformio.ini build_flags.
 */

#include <Arduino.h>
#include <Wire.h>
#include <memory>
#include <mutex>
#include "config.h"
#include "log.h"
#include "storage.h"
#include "netmgr.h"
#include "http_client.h"
#include "arduino_clock.h"
#include "arduino_radio.h"
#include "ble_guard.h"
#include "discovery_client.h"
#include "beacon_extractor.h"
#include "ble_scanner.h"
#include "ble_advertiser.h"
#include "nearby_resolver.h"
#include "token_codec.h"
#include "display.h"
#include "buttons.h"

#if HAS_AXP192
  #include <axp20x.h>
  static AXP20X_Class axp;
#endif

// ─── Version ─────────────────────────────────────────────────────────────────
static const char *FW_VERSION = "1.0.0";

// ─── Discovery stack ─────────────────────────────────────────────────────────
static void onNearby(const std::vector<NearbyUser> &users);

static ArduinoClock         clk;
static ArduinoRadio         radio;
static ArduinoHttpTransport http(DISCOVERY_HTTP_TIMEOUT_MS);
static BluetoothStateGuard  guard(radio, clk);
static DiscoveryClient      client(http, clk);
static BeaconExtractor      extractor(radio.capabilities());
static ScanningController   scanner(radio, guard, clk, extractor);
static NearbyResolver       resolver(client, clk, onNearby);
static std::unique_ptr<AdvertisingController> advertiser;

// ─── UI model ────────────────────────────────────────────────────────────────
// Written by the resolver task, read by loop()
static std::mutex              s_uiLock;
static std::vector<NearbyUser> s_users;
static bool                    s_fallback      = false;
static bool                    s_acceptResults = false;

static AppMode  s_mode          = AppMode::SEND;
static size_t   s_selected      = 0;
static uint32_t s_detailUntil   = 0;
static uint32_t s_diagUntil     = 0;
static uint32_t s_lastDrawMs    = 0;
static String   s_statusTitle;
static String   s_statusLine;

static const uint32_t DETAIL_SHOW_MS = 5000;
static const uint32_t DIAG_SHOW_MS   = 5000;

// ─── AXP192 init (T-Beam only) ───────────────────────────────────────────────
#if HAS_AXP192
static void initAxp192() {
    if (axp.begin(Wire, AXP192_SLAVE_ADDRESS) != 0) {
        LOG_W("AXP192 not found");
        return;
    }
    axp.setPowerOutPut(AXP192_DCDC1, AXP202_ON);   // OLED rail
    axp.setPowerOutPut(AXP192_LDO2,  AXP202_OFF);  // LoRa, unused
    axp.setPowerOutPut(AXP192_LDO3,  AXP202_OFF);  // GPS, unused
    axp.setPowerOutPut(AXP192_DCDC2, AXP202_OFF);
    axp.setPowerOutPut(AXP192_EXTEN, AXP202_OFF);
    axp.setChgLEDMode(AXP20X_LED_LOW_LEVEL);
}
#endif

static void showStatus(const char *title, const char *line) {
    s_statusTitle = title;
    s_statusLine  = line;
    Display::markDirty();
}

static void clearStatus() {
    s_statusTitle = "";
    s_statusLine  = "";
}

// ─── Resolver task ───────────────────────────────────────────────────────────

static void onNearby(const std::vector<NearbyUser> &users) {
    std::lock_guard<std::mutex> lock(s_uiLock);
    if (!s_acceptResults) return;
    s_users    = users;
    s_fallback = false;
    if (s_selected >= s_users.size()) s_selected = 0;
}

// Backend round-trips stay off the loop so frame draining never stalls
static void resolverTask(void *) {
    for (;;) {
        if (!resolver.runOnce()) vTaskDelay(pdMS_TO_TICKS(50));
    }
}

// ─── Mode handling ───────────────────────────────────────────────────────────

static void stopDiscovery() {
    {
        std::lock_guard<std::mutex> lock(s_uiLock);
        s_acceptResults = false;
        s_users.clear();
        s_fallback = false;
        s_selected = 0;
    }
    scanner.stop();
    if (advertiser) advertiser->stop();
    resolver.reset();
    s_detailUntil = 0;
}

static void onScan(const std::vector<DiscoveredBeacon> &beacons) {
    resolver.submit(beacons);
}

static void enterMode(AppMode mode) {
    stopDiscovery();
    s_mode = mode;
    Storage::setMode(mode);
    clearStatus();
    LOG_I("Mode %s", appModeName(mode));

    if (!NetMgr::isConnected()) {
        showStatus(appModeName(mode), "Wi-Fi offline");
        return;
    }

    switch (mode) {
        case AppMode::RECEIVE:
        case AppMode::MERCHANT: {
            showStatus(appModeName(mode), "Registering...");
            Display::drawStatus(s_statusTitle.c_str(), s_statusLine.c_str());

            AdvertiseOptions opts;
            opts.autoRenew = true;
            DiscoveryContext ctx = mode == AppMode::MERCHANT ? DiscoveryContext::MERCHANT_RECEIVE
                                                             : DiscoveryContext::P2P_RECEIVE;
            if (advertiser->start(ctx, opts)) {
                clearStatus();
            } else {
                showStatus(appModeName(mode), "Broadcast unavailable");
            }
            break;
        }
        case AppMode::SEND: {
            {
                std::lock_guard<std::mutex> lock(s_uiLock);
                s_acceptResults = true;
            }
            ScanOptions opts;
            opts.minRssi = Storage::getMinRssi();
            if (!scanner.start(onScan, opts)) {
                showStatus(appModeName(mode), "Scan unavailable");
            }
            break;
        }
    }
    Display::markDirty();
}

static AppMode nextMode(AppMode m) {
    switch (m) {
        case AppMode::RECEIVE:  return AppMode::MERCHANT;
        case AppMode::MERCHANT: return AppMode::SEND;
        case AppMode::SEND:     return AppMode::RECEIVE;
    }
    return AppMode::SEND;
}

// Server-side enumeration when the radio path finds nobody
static void loadActiveListing() {
    std::vector<NearbyUser> users;
    DiscoveryStatus st = client.listActive(nullptr, users);
    if (st != DiscoveryStatus::OK) {
        showStatus("Active list", discoveryStatusName(st));
        return;
    }
    std::lock_guard<std::mutex> lock(s_uiLock);
    s_users    = users;
    s_fallback = true;
    s_selected = 0;
    LOG_I("Active listing: %u users", (unsigned)users.size());
}

static void recreateAdvertiser() {
    if (advertiser) advertiser->stop();
    advertiser.reset(new AdvertisingController(radio, guard, client, clk, Storage::getBroadcast()));
}

// ─── Button handler ───────────────────────────────────────────────────────────
static void handleButton(ButtonEvent ev) {
    bool wasAwake = Display::isAwake();
    Display::wake();
    if (!wasAwake) return;   // first press only wakes the screen

    LOG_D("Button %s", buttonEventName(ev));
    switch (ev) {
        case ButtonEvent::MODE_PRESS:
            enterMode(nextMode(s_mode));
            break;

        case ButtonEvent::MODE_HOLD:
            if (s_mode == AppMode::SEND) loadActiveListing();
            break;

        case ButtonEvent::SELECT_PRESS:
            if (s_mode == AppMode::SEND) {
                std::lock_guard<std::mutex> lock(s_uiLock);
                if (!s_users.empty()) {
                    // First press opens the current entry, later ones advance
                    if (s_detailUntil != 0 && millis() < s_detailUntil) {
                        s_selected = (s_selected + 1) % s_users.size();
                    }
                    s_detailUntil = millis() + DETAIL_SHOW_MS;
                }
            }
            break;

        case ButtonEvent::SELECT_HOLD:
            enterMode(s_mode);
            break;

        case ButtonEvent::DIAG_HOLD:
            s_diagUntil = millis() + DIAG_SHOW_MS;
            break;

        default:
            break;
    }
    Display::markDirty();
}

// ─── Serial provisioning ──────────────────────────────────────────────────────

static void printSettings() {
    PathLossModel pl = Storage::getPathLoss();
    Serial.printf("mode      %s\n", appModeName(s_mode));
    Serial.printf("wifi_ssid %s (%s)\n", Storage::getWifiSsid().c_str(),
                  NetMgr::isConnected() ? NetMgr::localIp().c_str() : "offline");
    Serial.printf("api_url   %s\n", Storage::getApiUrl().c_str());
    Serial.printf("api_key   %s\n", Storage::getApiKey().length() ? "(set)" : "(none)");
    Serial.printf("user_id   %s\n", Storage::getUserId().c_str());
    Serial.printf("bsim_id   %s\n", Storage::getBsimId().c_str());
    Serial.printf("rssi_1m   %.1f\n", pl.rssiAt1m);
    Serial.printf("path_loss %.2f\n", pl.exponent);
    Serial.printf("min_rssi  %d\n", Storage::getMinRssi());
    Serial.printf("broadcast %s\n", broadcastCapabilityName(Storage::getBroadcast()));

    BeaconToken token;
    if (advertiser && advertiser->activeToken(token)) {
        Serial.printf("token     %s (%lu s left)\n", TokenCodec::toHex(token).c_str(),
                      (unsigned long)advertiser->remainingSeconds());
    }
}

static bool applySetting(const String &key, const String &value) {
    if (key == "wifi_ssid") {
        Storage::setWifiSsid(value);
    } else if (key == "wifi_pass") {
        Storage::setWifiPassword(value);
    } else if (key == "api_url") {
        Storage::setApiUrl(value);
    } else if (key == "api_key") {
        Storage::setApiKey(value);
    } else if (key == "user_id") {
        Storage::setUserId(value);
    } else if (key == "bsim_id") {
        Storage::setBsimId(value);
    } else if (key == "rssi_1m" || key == "path_loss") {
        PathLossModel m = Storage::getPathLoss();
        if (key == "rssi_1m") m.rssiAt1m = value.toFloat();
        else                  m.exponent = value.toFloat();
        if (m.exponent < 2.0f || m.rssiAt1m >= 0.0f) {
            Serial.println("rejected: need rssi_1m < 0 and path_loss >= 2");
            return false;
        }
        Storage::setRssiAt1m(m.rssiAt1m);
        Storage::setPathLossExponent(m.exponent);
        Distance::configure(m);
    } else if (key == "min_rssi") {
        int rssi = value.toInt();
        if (rssi >= 0 || rssi < -127) {
            Serial.println("rejected: min_rssi must be in -127..-1");
            return false;
        }
        Storage::setMinRssi(rssi);
        LookupOptions lo;
        lo.hasMinRssi = true;
        lo.minRssi    = rssi;
        resolver.setLookupOptions(lo);
    } else if (key == "broadcast") {
        if (value == "service")      Storage::setBroadcast(BroadcastCapability::SERVICE_IDENTIFIER);
        else if (value == "ibeacon") Storage::setBroadcast(BroadcastCapability::IBEACON);
        else {
            Serial.println("rejected: broadcast is service or ibeacon");
            return false;
        }
        recreateAdvertiser();
    } else {
        Serial.printf("unknown key '%s'\n", key.c_str());
        return false;
    }
    return true;
}

static void handleCommand(String line) {
    line.trim();
    if (line.length() == 0) return;

    if (line == "show") {
        printSettings();
        return;
    }
    if (line == "clear-user") {
        Storage::clearUserContext();
        Serial.println("ok");
        return;
    }
    if (line.startsWith("set ")) {
        String rest = line.substring(4);
        rest.trim();
        int sp = rest.indexOf(' ');
        String key   = sp < 0 ? rest : rest.substring(0, sp);
        String value = sp < 0 ? String("") : rest.substring(sp + 1);
        value.trim();
        if (!applySetting(key, value)) return;
        Serial.println("ok");

        // Link and transport settings apply on the next attempt
        if (key == "wifi_ssid" || key == "wifi_pass") {
            NetMgr::disconnect();
            NetMgr::connect();
        }
        if (key == "wifi_ssid" || key == "wifi_pass" || key == "broadcast") {
            enterMode(s_mode);
        }
        return;
    }
    Serial.println("commands: show | set <key> <value> | clear-user");
}

static void pollSerial() {
    static String s_line;
    while (Serial.available()) {
        char c = (char)Serial.read();
        if (c == '\r') continue;
        if (c == '\n') {
            handleCommand(s_line);
            s_line = "";
        } else if (s_line.length() < 160) {
            s_line += c;
        }
    }
}

// ─── Display ─────────────────────────────────────────────────────────────────

static void updateDisplay() {
    uint32_t now = millis();
    Display::checkAutoOff();
    if (!Display::isAwake()) return;
    if (!Display::isDirty() && now - s_lastDrawMs < DISPLAY_REFRESH_MS) return;
    s_lastDrawMs = now;

    if (s_diagUntil != 0 && now < s_diagUntil) {
        RateLimitInfo rl = resolver.rateLimit();
        DiagInfo info;
        info.version       = FW_VERSION;
        info.freeHeap      = ESP.getFreeHeap();
        info.wifiUp        = NetMgr::isConnected();
        info.wifiRssi      = info.wifiUp ? NetMgr::rssi() : 0;
        info.radioState    = radioStateName(radio.state());
        info.droppedFrames = radio.droppedFrames();
        info.rateRemaining = rl.hasRemaining ? rl.remaining : -1;
        info.lastStatus    = discoveryStatusName(resolver.lastStatus());
        info.httpCode      = http.lastCode();
        Display::drawDiagnostic(info);
        return;
    }
    s_diagUntil = 0;

    if (s_statusTitle.length()) {
        Display::drawStatus(s_statusTitle.c_str(), s_statusLine.c_str());
        return;
    }

    if (s_mode != AppMode::SEND) {
        BeaconToken token;
        if (advertiser->activeToken(token)) {
            Display::drawAdvertising(s_mode, TokenCodec::toHex(token).c_str(),
                                     advertiser->remainingSeconds(),
                                     broadcastCapabilityName(advertiser->capability()));
        } else {
            Display::drawStatus(appModeName(s_mode), "Not broadcasting");
        }
        return;
    }

    std::vector<NearbyUser> users;
    size_t selected;
    bool fallback;
    {
        std::lock_guard<std::mutex> lock(s_uiLock);
        users    = s_users;
        selected = s_selected;
        fallback = s_fallback;
    }
    if (s_detailUntil != 0 && now < s_detailUntil && selected < users.size()) {
        Display::drawUserDetail(users[selected]);
    } else {
        s_detailUntil = 0;
        Display::drawNearbyList(users, selected, fallback);
    }
}

// ─── setup() ─────────────────────────────────────────────────────────────────
void setup() {
    Serial.begin(115200);

    Wire.begin(PIN_SDA, PIN_SCL);
#if HAS_AXP192
    initAxp192();
#endif

    Storage::begin();
    Distance::configure(Storage::getPathLoss());

    Display::begin();
    Buttons::begin();
    Display::wake();

    showStatus("NearPay", "Connecting Wi-Fi...");
    Display::drawStatus(s_statusTitle.c_str(), s_statusLine.c_str());
    NetMgr::connect();

    if (!radio.begin("NearPay")) {
        showStatus("NearPay", "Bluetooth unavailable");
    }

    recreateAdvertiser();

    LookupOptions lo;
    lo.hasMinRssi = true;
    lo.minRssi    = Storage::getMinRssi();
    resolver.setLookupOptions(lo);

    if (xTaskCreate(resolverTask, "resolver", 8192, nullptr, 1, nullptr) != pdPASS) {
        LOG_E("Resolver task not started, nearby lookups disabled");
    }

    LOG_I("NearPay %s up, %s broadcast", FW_VERSION,
          broadcastCapabilityName(Storage::getBroadcast()));
    if (radio.state() == RadioState::POWERED_ON) enterMode(Storage::getMode());
}

// ─── loop() ──────────────────────────────────────────────────────────────────
void loop() {
    ButtonEvent ev = Buttons::poll();
    if (ev != ButtonEvent::NONE) handleButton(ev);

    pollSerial();
    NetMgr::maintain();

    radio.dispatchFrames();
    scanner.poll();
    advertiser->poll();

    updateDisplay();
    delay(10);
}
