#pragma once

#include <string>
#include <unordered_map>

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
    long status = 0;
    std::string body;
    bool transport_error = false;   // no HTTP answer at all (timeout, reset, DNS)
    std::string error_message;
};

// Raw GET for image payloads. Implementations must be safe to call from
// several threads at once; each call uses its own connection.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const std::string& url, const HeaderMap& headers) = 0;
};

class CprTransport : public HttpTransport {
public:
    CprTransport(std::string userAgent, int timeoutMs);

    HttpResponse get(const std::string& url, const HeaderMap& headers) override;

private:
    std::string userAgent_;
    int timeoutMs_;
};

extern const char* const kDefaultUserAgent;
