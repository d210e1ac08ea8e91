#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

// -------------------- small utils --------------------
std::string to_lower(const std::string& s) {
    std::string r = s;
    for (auto& ch : r) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return r;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n\f\v");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(a, b - a + 1);
}

static bool has_control_chars(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return u < 0x20 || u == 0x7f;
    });
}

static std::string escape_spaces(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) {
        if (c == ' ') r += "%20";
        else r += c;
    }
    return r;
}

// host[:port] with optional userinfo; host lower-cased, default port dropped
static std::optional<std::string> normalize_authority(const std::string& scheme, const std::string& authority) {
    static const std::regex host_re(R"(^(\[[0-9A-Fa-f:.]+\]|[A-Za-z0-9._~%!$&'()*+,;=-]+)(?::([0-9]*))?$)");

    std::string userinfo;
    std::string hostport = authority;
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        userinfo = authority.substr(0, at + 1);
        hostport = authority.substr(at + 1);
    }

    std::smatch m;
    if (!std::regex_match(hostport, m, host_re)) return std::nullopt;

    std::string host = to_lower(m[1].str());
    std::string port = m[2].matched ? m[2].str() : "";
    if (!port.empty()) {
        if (port.size() > 5 || std::stoi(port) > 65535) return std::nullopt;
        if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443")) port.clear();
    }
    return userinfo + host + (port.empty() ? "" : ":" + port);
}

// RFC 3986, section 5.2.4
static std::string remove_dot_segments(const std::string& path) {
    std::string in = path;
    std::string out;
    while (!in.empty()) {
        if (in.rfind("../", 0) == 0) {
            in.erase(0, 3);
        } else if (in.rfind("./", 0) == 0) {
            in.erase(0, 2);
        } else if (in.rfind("/./", 0) == 0) {
            in.replace(0, 3, "/");
        } else if (in == "/.") {
            in = "/";
        } else if (in.rfind("/../", 0) == 0 || in == "/..") {
            in = in.size() == 3 ? "/" : in.substr(3);
            auto slash = out.rfind('/');
            out.erase(slash == std::string::npos ? 0 : slash);
        } else if (in == "." || in == "..") {
            in.clear();
        } else {
            size_t next = in.find('/', in[0] == '/' ? 1 : 0);
            out += in.substr(0, next);
            in = next == std::string::npos ? std::string() : in.substr(next);
        }
    }
    return out;
}

static std::string compose(const UrlParts& p, bool with_query) {
    std::string u = p.scheme + "://" + p.netloc + p.path;
    if (with_query && !p.query.empty()) u += "?" + p.query;
    return u;
}

// -------------------- parsing --------------------
std::optional<UrlParts> parse_url(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*):\/\/([^\/?#]*)([^?#]*)(?:\?([^#]*))?(?:#(.*))?$)");
    if (url.size() > kMaxUrlLength || has_control_chars(url)) return std::nullopt;

    std::smatch m;
    if (!std::regex_match(url, m, re)) return std::nullopt;

    UrlParts p;
    p.scheme = to_lower(m[1].str());
    if (p.scheme != "http" && p.scheme != "https") return std::nullopt;

    auto netloc = normalize_authority(p.scheme, m[2].str());
    if (!netloc) return std::nullopt;
    p.netloc = *netloc;
    p.path = escape_spaces(m[3].str());
    p.query = m[4].matched ? m[4].str() : "";
    p.fragment = m[5].matched ? m[5].str() : "";
    return p;
}

std::string url_domain(const std::string& url) {
    auto p = parse_url(url);
    return p ? p->netloc : std::string();
}

// -------------------- resolution --------------------
std::string resolve_url(const std::string& base, const std::string& ref) {
    static const std::regex scheme_re(R"(^[a-zA-Z][a-zA-Z0-9+.-]*:)");

    std::string link = trim(ref);
    if (link.size() > kMaxUrlLength) throw InvalidUrl(link);
    if (std::regex_search(link, scheme_re)) {
        auto p = parse_url(link);
        if (!p) throw InvalidUrl(link);
        p->path = remove_dot_segments(p->path);
        return compose(*p, true);
    }

    auto b = parse_url(base);
    if (!b) throw InvalidUrl(base);

    // protocol-relative
    if (link.size() > 1 && link[0] == '/' && link[1] == '/') {
        return resolve_url(base, b->scheme + ":" + link);
    }

    std::string path = link;
    std::string query;
    bool has_query = false;
    auto hash = path.find('#');
    if (hash != std::string::npos) path.erase(hash);
    auto qm = path.find('?');
    if (qm != std::string::npos) {
        query = path.substr(qm + 1);
        path.erase(qm);
        has_query = true;
    }

    UrlParts t;
    t.scheme = b->scheme;
    t.netloc = b->netloc;
    if (path.empty()) {
        t.path = b->path;
        t.query = has_query ? query : b->query;
    } else {
        if (path[0] == '/') {
            t.path = remove_dot_segments(escape_spaces(path));
        } else {
            auto slash = b->path.rfind('/');
            std::string dir = slash == std::string::npos ? "/" : b->path.substr(0, slash + 1);
            t.path = remove_dot_segments(dir + escape_spaces(path));
        }
        t.query = query;
    }
    if (has_control_chars(t.path) || has_control_chars(t.query)) throw InvalidUrl(link);
    std::string resolved = compose(t, true);
    if (resolved.size() > kMaxUrlLength) throw InvalidUrl(resolved);
    return resolved;
}

// -------------------- canonical form --------------------
std::string canonicalize_url(const std::string& url) {
    auto p = parse_url(trim(url));
    if (!p) throw InvalidUrl(url);
    p->path = remove_dot_segments(p->path);
    if (p->path.empty()) p->path = "/";
    return compose(*p, false);
}

std::string canonicalize_url(const std::string& ref, const std::string& base) {
    return canonicalize_url(resolve_url(base, ref));
}
