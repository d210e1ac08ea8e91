#include "fetcher.hpp"

#include <cpr/cpr.h>

#include <cstdint>

namespace {

cpr::Header to_cpr_header(const HeaderMap& headers) {
    cpr::Header hdr;
    for (const auto& kv : headers) hdr[kv.first] = kv.second;
    return hdr;
}

cpr::Timeout to_cpr_timeout(double seconds) {
    return cpr::Timeout{static_cast<std::int32_t>(seconds * 1000.0)};
}

HttpResponse to_response(const cpr::Response& r) {
    if (r.error) {
        switch (r.error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                throw TransportError(TransportError::Kind::Timeout, r.error.message);
            case cpr::ErrorCode::COULDNT_CONNECT:
            case cpr::ErrorCode::COULDNT_RESOLVE_HOST:
            case cpr::ErrorCode::COULDNT_RESOLVE_PROXY:
                throw TransportError(TransportError::Kind::Connection, r.error.message);
            default:
                throw TransportError(TransportError::Kind::Other, r.error.message);
        }
    }

    HttpResponse out;
    out.status_code = r.status_code;
    out.body = r.text;
    out.final_url = r.url.str();
    // cpr::Header compares keys case-insensitively
    auto it = r.header.find("content-type");
    if (it != r.header.end()) out.content_type = it->second;
    return out;
}

} // namespace

HttpResponse CprFetcher::get(const std::string& url,
                             const HeaderMap& headers,
                             double timeoutSeconds,
                             bool followRedirects) {
    cpr::Response r = cpr::Get(cpr::Url{url},
                               to_cpr_header(headers),
                               to_cpr_timeout(timeoutSeconds),
                               cpr::Redirect{followRedirects});
    return to_response(r);
}

HttpResponse CprFetcher::head(const std::string& url,
                              const HeaderMap& headers,
                              double timeoutSeconds,
                              bool followRedirects) {
    cpr::Response r = cpr::Head(cpr::Url{url},
                                to_cpr_header(headers),
                                to_cpr_timeout(timeoutSeconds),
                                cpr::Redirect{followRedirects});
    return to_response(r);
}
