#pragma once

#include <map>
#include <stdexcept>
#include <string>

using HeaderMap = std::map<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;
    std::string content_type;
    std::string body;
    std::string final_url; // after redirects; empty when unknown
};

class TransportError : public std::runtime_error {
public:
    enum class Kind { Timeout, Connection, Other };

    TransportError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Blocking HTTP primitive used by the crawl engine and the robots cache.
// Transport failures throw TransportError; any HTTP status is a response.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual HttpResponse get(const std::string& url,
                             const HeaderMap& headers,
                             double timeoutSeconds,
                             bool followRedirects = true) = 0;

    virtual HttpResponse head(const std::string& url,
                              const HeaderMap& headers,
                              double timeoutSeconds,
                              bool followRedirects = true) = 0;
};

class CprFetcher : public Fetcher {
public:
    HttpResponse get(const std::string& url,
                     const HeaderMap& headers,
                     double timeoutSeconds,
                     bool followRedirects = true) override;

    HttpResponse head(const std::string& url,
                      const HeaderMap& headers,
                      double timeoutSeconds,
                      bool followRedirects = true) override;
};
