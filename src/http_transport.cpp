#include "http_transport.hpp"

#include <cpr/cpr.h>

#include <utility>

const char* const kDefaultUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0 Safari/537.36";

CprTransport::CprTransport(std::string userAgent, int timeoutMs)
    : userAgent_(userAgent.empty() ? std::string(kDefaultUserAgent) : std::move(userAgent)),
      timeoutMs_(timeoutMs) {}

HttpResponse CprTransport::get(const std::string& url, const HeaderMap& headers) {
    cpr::Header hdr{{"User-Agent", userAgent_}};
    for (auto& kv : headers) hdr[kv.first] = kv.second;

    cpr::Response r = cpr::Get(cpr::Url{url}, hdr, cpr::Timeout{timeoutMs_}, cpr::Redirect{true});

    HttpResponse out;
    out.status = r.status_code;
    if (r.error) {
        out.transport_error = true;
        out.error_message = r.error.message;
        return out;
    }
    out.body = std::move(r.text);
    return out;
}
