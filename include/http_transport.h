#pragma once
#include <string>

struct HttpResponse {
    int         status = 0;
    std::string body;
};

// Authenticated request/response exchange with the backend. The
// implementation owns base URL, credentials and timeouts.
class HttpTransport {
public:
    virtual ~HttpTransport() {}

    // False when no response was received (connect failure, timeout).
    // Any HTTP status, including errors, is a received response.
    virtual bool request(const char *method, const std::string &path,
                         const std::string &body, HttpResponse &out) = 0;
};
