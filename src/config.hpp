#pragma once

#include "fetcher.hpp"

#include <cstddef>
#include <string>
#include <vector>

static const std::string kDefaultUserAgent = "Mozilla/5.0 (compatible; WebScraper/1.0; +http://example.com/bot)";

struct CrawlerConfig {
    std::string start_url;

    // scope
    bool allow_external = false;
    int external_links_depth = 0; // external hop budget
    int max_depth = 3;

    // politeness
    double delay = 1.0;                    // seconds between requests to one domain
    double rate_limit_backoff_factor = 3.0; // multiplier of delay after HTTP 429
    bool respect_robots = true;
    std::string robots_token = "*";

    // glob patterns, compiled by PatternFilter
    std::vector<std::string> exclude_patterns;
    std::vector<std::string> include_patterns;

    HeaderMap headers{{"User-Agent", kDefaultUserAgent}};

    double fetch_timeout = 15.0;
    double robots_timeout = 5.0;
    double probe_timeout = 10.0;

    // 0 = unbounded
    std::size_t max_pages = 0;
};
