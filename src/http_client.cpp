#include "http_client.h"
#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClientSecure.h>
#include "log.h"
#include "storage.h"

ArduinoHttpTransport::ArduinoHttpTransport(uint32_t timeoutMs) : _timeoutMs(timeoutMs) {}

bool ArduinoHttpTransport::request(const char *method, const std::string &path,
                                   const std::string &body, HttpResponse &out) {
    std::lock_guard<std::mutex> guard(_lock);
    if (WiFi.status() != WL_CONNECTED) {
        _lastCode = -1;
        LOG_W("%s %s: Wi-Fi not connected", method, path.c_str());
        return false;
    }

    String url = Storage::getApiUrl() + path.c_str();
    bool   tls = url.startsWith("https://");

    WiFiClientSecure secure;
    WiFiClient       plain;
    if (tls) secure.setInsecure();

    HTTPClient http;
    http.setTimeout(_timeoutMs);
    http.setConnectTimeout(_timeoutMs);
    bool begun = tls ? http.begin(secure, url) : http.begin(plain, url);
    if (!begun) {
        _lastCode = -1;
        LOG_E("Bad backend URL %s", url.c_str());
        return false;
    }

    http.addHeader("Content-Type", "application/json");
    String apiKey = Storage::getApiKey();
    if (apiKey.length()) http.addHeader("X-API-Key", apiKey);
    if (Storage::hasUserContext()) {
        http.addHeader("Authorization",
                       "Bearer " + Storage::getUserId() + ":" + Storage::getBsimId());
    }

    int code = http.sendRequest(method, (uint8_t *)body.data(), body.size());
    _lastCode = code;
    if (code < 0) {
        LOG_W("%s %s failed: %s", method, path.c_str(), HTTPClient::errorToString(code).c_str());
        http.end();
        return false;
    }

    String resp = http.getString();
    http.end();

    out.status = code;
    out.body.assign(resp.c_str(), resp.length());
    LOG_D("%s %s -> %d (%u bytes)", method, path.c_str(), code, (unsigned)out.body.size());
    return true;
}
