#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

// Longer URLs are rejected before any regex sees them; std::regex recursion
// grows with input length.
constexpr size_t kMaxUrlLength = 8192;

class InvalidUrl : public std::runtime_error {
public:
    explicit InvalidUrl(const std::string& url)
        : std::runtime_error("Invalid URL: " + (url.size() > 200 ? url.substr(0, 200) + "..." : url)) {}
};

struct UrlParts {
    std::string scheme;
    std::string netloc;   // host[:port], lower-cased
    std::string path;
    std::string query;    // without the leading '?'
    std::string fragment; // without the leading '#'
};

// Splits an absolute http(s) URL. Returns nullopt for relative references,
// unsupported schemes, malformed authorities and URLs over kMaxUrlLength.
std::optional<UrlParts> parse_url(const std::string& url);

// RFC 3986 reference resolution. Throws InvalidUrl when the result is not a
// well-formed http(s) URL or either input exceeds kMaxUrlLength.
std::string resolve_url(const std::string& base, const std::string& ref);

// Canonical form used as the visited/frontier key: absolute, lower-case
// scheme and host, dot segments removed, empty path as "/", no query and no
// fragment. canonicalize_url(canonicalize_url(u)) == canonicalize_url(u).
std::string canonicalize_url(const std::string& url);
std::string canonicalize_url(const std::string& ref, const std::string& base);

// Network location of an absolute URL ("" when it cannot be parsed).
std::string url_domain(const std::string& url);

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
