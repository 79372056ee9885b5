#pragma once
#include <stdint.h>

// ─── Platform pin assignments ──────────────────────────────────────────────

#if defined(ARDUINO)
#if defined(PLATFORM_TBEAM)
  #define PIN_SDA          21
  #define PIN_SCL          22
  #define PIN_BTN1         38
  #define PIN_BTN2         39
  #define HAS_AXP192       1

#elif defined(PLATFORM_XIAO_S3)
  #define PIN_SDA           5
  #define PIN_SCL           6
  #define PIN_BTN1          1
  #define PIN_BTN2          2
  #define HAS_AXP192        0

#else
  #error "Define PLATFORM_TBEAM or PLATFORM_XIAO_S3"
#endif
#endif

// ─── Backend defaults (override with build flags) ─────────────────────────
#ifndef NEARPAY_API_URL
  #define NEARPAY_API_URL        "https://transfer.example.com"
#endif
#ifndef NEARPAY_API_KEY
  #define NEARPAY_API_KEY        ""
#endif
#ifndef NEARPAY_WIFI_SSID
  #define NEARPAY_WIFI_SSID      ""
#endif
#ifndef NEARPAY_WIFI_PASSWORD
  #define NEARPAY_WIFI_PASSWORD  ""
#endif

#define HTTP_DEFAULT_TIMEOUT_MS      30000
#define DISCOVERY_HTTP_TIMEOUT_MS    10000   // discovery must stay snappy
#define WIFI_CONNECT_TIMEOUT_MS      15000

// ─── Discovery backend limits ─────────────────────────────────────────────
#define DISCOVERY_LOOKUP_BATCH          20
#define DISCOVERY_DEFAULT_TTL_S        300
#define DISCOVERY_MAX_TTL_S            600
#define DISCOVERY_RATE_LIMIT_COOLDOWN_MS  30000

// ─── Radio readiness ──────────────────────────────────────────────────────
#define BLE_READY_TIMEOUT_MS   10000
#define BLE_READY_POLL_MS         20

// ─── Advertising ──────────────────────────────────────────────────────────
#define ADV_START_RETRIES         3     // native start re-attempts after the first
#define ADV_RETRY_BACKOFF_MS    500
#define ADV_RENEW_MARGIN_S       15     // renew this long before TTL expiry
#define ADV_TX_POWER_DBM        (-59)   // measured power field of iBeacon frames
#define ADV_LOCAL_NAME_MAX       20

// ─── Scanning ─────────────────────────────────────────────────────────────
#define SCAN_DEFAULT_MIN_RSSI   (-80)
#define SCAN_DEBOUNCE_MS        2000
#define SCAN_STALE_TIMEOUT_MS  10000
#define SCAN_FRAME_QUEUE_MAX      64
#define SCAN_RESULT_FLUSH_MS   30000   // restart the native scan to free its result store

// ─── Distance model ───────────────────────────────────────────────────────
#define DISTANCE_RSSI_AT_1M     (-59.0f)
#define DISTANCE_PATH_LOSS_EXP    2.5f   // free space is 2.0, indoor 2.7-4.3

// ─── Beacon wire encodings ────────────────────────────────────────────────
#define BEACON_UUID             "E2C56DB5-DFFB-48D2-B060-D0F5A71096E0"
#define SERVICE_ID_PREFIX       "E2C56DB5-DFFB-"
#define SERVICE_ID_SUFFIX       "-D0F5A71096E0"
#define DEVICE_NAME_PREFIX      "PX"
#define IBEACON_COMPANY_ID      0x004C
#define IBEACON_TYPE            0x02
#define IBEACON_LENGTH          0x15

// ─── Display ────────────────────────────────────────────────────────────────
#define DISPLAY_TIMEOUT_MS   30000   // 30 seconds auto-off
#define DISPLAY_REFRESH_MS     250
#define DISPLAY_LIST_ROWS        4

// ─── Button hold thresholds (ms) ───────────────────────────────────────────
#define BTN_HOLD_SHORT_MS    2000
#define BTN_HOLD_DIAG_MS    10000
#define BTN_DEBOUNCE_MS        50

// ─── NVS keys ───────────────────────────────────────────────────────────────
#define NVS_NS               "nearpay"
#define NVS_KEY_WIFI_SSID    "wifi_ssid"
#define NVS_KEY_WIFI_PASS    "wifi_pass"
#define NVS_KEY_API_URL      "api_url"
#define NVS_KEY_API_KEY      "api_key"
#define NVS_KEY_USER_ID      "user_id"
#define NVS_KEY_BSIM_ID      "bsim_id"
#define NVS_KEY_RSSI_1M      "rssi_1m"
#define NVS_KEY_PATH_LOSS    "path_loss"
#define NVS_KEY_MIN_RSSI     "min_rssi"
#define NVS_KEY_BROADCAST    "broadcast"
#define NVS_KEY_MODE         "mode"
