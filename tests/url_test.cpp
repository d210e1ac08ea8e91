#include "url.hpp"

#include <gtest/gtest.h>

TEST(UrlTest, ParsesAbsoluteUrl) {
    auto p = parse_url("HTTPS://Example.COM:8443/a/b?x=1#frag");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->scheme, "https");
    EXPECT_EQ(p->netloc, "example.com:8443");
    EXPECT_EQ(p->path, "/a/b");
    EXPECT_EQ(p->query, "x=1");
    EXPECT_EQ(p->fragment, "frag");
}

TEST(UrlTest, RejectsRelativeAndForeignSchemes) {
    EXPECT_FALSE(parse_url("/about").has_value());
    EXPECT_FALSE(parse_url("ftp://example.com/file").has_value());
    EXPECT_FALSE(parse_url("http://").has_value());
    EXPECT_FALSE(parse_url("http://exa mple.com/").has_value());
    EXPECT_FALSE(parse_url("http://example.com:99999/").has_value());
}

TEST(UrlTest, ResolvesRelativeReferences) {
    const std::string base = "https://example.com/docs/guide/intro.html?lang=en";
    EXPECT_EQ(resolve_url(base, "setup.html"), "https://example.com/docs/guide/setup.html");
    EXPECT_EQ(resolve_url(base, "../api/"), "https://example.com/docs/api/");
    EXPECT_EQ(resolve_url(base, "/about"), "https://example.com/about");
    EXPECT_EQ(resolve_url(base, "//cdn.example.org/x.js"), "https://cdn.example.org/x.js");
    EXPECT_EQ(resolve_url(base, "?lang=de"), "https://example.com/docs/guide/intro.html?lang=de");
    EXPECT_EQ(resolve_url(base, "#top"), "https://example.com/docs/guide/intro.html?lang=en");
    EXPECT_EQ(resolve_url(base, "http://other.org/a/./b/../c"), "http://other.org/a/c");
}

TEST(UrlTest, ResolveThrowsOnUnusableReferences) {
    const std::string base = "https://example.com/";
    EXPECT_THROW(resolve_url(base, "mailto:someone@example.com"), InvalidUrl);
    EXPECT_THROW(resolve_url(base, "javascript:void(0)"), InvalidUrl);
    EXPECT_THROW(resolve_url("not a url", "page.html"), InvalidUrl);
}

TEST(UrlTest, CanonicalFormDropsQueryAndFragment) {
    EXPECT_EQ(canonicalize_url("https://example.com/a?b=1#c"), "https://example.com/a");
    EXPECT_EQ(canonicalize_url("https://example.com"), "https://example.com/");
    EXPECT_EQ(canonicalize_url("HTTP://EXAMPLE.com:80/x"), "http://example.com/x");
    EXPECT_EQ(canonicalize_url("  https://example.com/x  "), "https://example.com/x");
}

TEST(UrlTest, EquivalentReferencesShareOneKey) {
    const std::string base = "https://example.com/blog/post";
    const std::string expected = "https://example.com/blog/archive";
    EXPECT_EQ(canonicalize_url("archive", base), expected);
    EXPECT_EQ(canonicalize_url("./archive?page=2", base), expected);
    EXPECT_EQ(canonicalize_url("/blog/x/../archive#recent", base), expected);
    EXPECT_EQ(canonicalize_url("https://EXAMPLE.COM:443/blog/archive", base), expected);
}

TEST(UrlTest, CanonicalizeIsIdempotent) {
    const char* urls[] = {
        "https://example.com",
        "https://Example.com/a/../b/./c/?q=1#f",
        "http://example.com:8080/x%20y",
        "https://example.com/with space/",
        "https://user@example.com/p",
        "http://[::1]:8000/index.html",
    };
    for (const char* u : urls) {
        std::string once = canonicalize_url(u);
        EXPECT_EQ(canonicalize_url(once), once) << u;
    }
}

TEST(UrlTest, CanonicalizeRejectsMalformedInput) {
    EXPECT_THROW(canonicalize_url(""), InvalidUrl);
    EXPECT_THROW(canonicalize_url("example.com/page"), InvalidUrl);
    EXPECT_THROW(canonicalize_url("https://exa\nmple.com/"), InvalidUrl);
}

TEST(UrlTest, OverlongUrlIsRejectedNotParsed) {
    const std::string huge = "https://example.com/" + std::string(100000, 'a');
    EXPECT_FALSE(parse_url(huge).has_value());
    EXPECT_THROW(canonicalize_url(huge), InvalidUrl);
    EXPECT_THROW(resolve_url("https://example.com/", std::string(100000, 'a')), InvalidUrl);
    EXPECT_THROW(resolve_url("https://example.com/", huge), InvalidUrl);
    EXPECT_THROW(canonicalize_url("/" + std::string(100000, 'a'), "https://example.com/"), InvalidUrl);
}

TEST(UrlTest, LongUrlBelowCeilingIsAccepted) {
    const std::string path = "/" + std::string(4000, 'b');
    EXPECT_EQ(canonicalize_url("https://example.com" + path + "?q=1"), "https://example.com" + path);
}

TEST(UrlTest, InvalidUrlMessageIsBounded) {
    InvalidUrl e(std::string(100000, 'x'));
    EXPECT_LT(std::string(e.what()).size(), 300u);
}

TEST(UrlTest, DomainIsNetloc) {
    EXPECT_EQ(url_domain("https://Sub.Example.com:8080/x"), "sub.example.com:8080");
    EXPECT_EQ(url_domain("garbage"), "");
}
