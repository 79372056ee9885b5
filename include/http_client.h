#pragma once
#include <Arduino.h>
#include <atomic>
#include <mutex>
#include "http_transport.h"

// Backend transport over the Arduino HTTPClient. Base URL, API key and the
// bearer user context are read from Storage on every request so serial
// provisioning takes effect without a reboot. Requests are serialized, the
// resolver task and the main loop share one transport.
class ArduinoHttpTransport : public HttpTransport {
public:
    explicit ArduinoHttpTransport(uint32_t timeoutMs);

    bool request(const char *method, const std::string &path,
                 const std::string &body, HttpResponse &out) override;

    // Status of the last exchange, negative for HTTPClient transport errors
    int lastCode() const { return _lastCode; }

private:
    uint32_t _timeoutMs;
    std::atomic<int> _lastCode{0};
    std::mutex _lock;
};
