#pragma once

#include "config.hpp"
#include "fetcher.hpp"

#include <spdlog/logger.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Compiled robots.txt. Rules of the group matching the user-agent token
// apply; the longest matching pattern wins and Allow wins ties.
class RobotsRules {
public:
    static RobotsRules parse(const std::string& body);

    bool allows(const std::string& url, const std::string& token) const;
    std::optional<double> crawl_delay(const std::string& token) const;

private:
    struct Rule {
        std::string pattern;
        bool allow;
    };
    struct Group {
        std::vector<std::string> agents; // lower-cased
        std::vector<Rule> rules;
        std::optional<double> delay;
    };

    const Group* group_for(const std::string& token) const;
    static bool pattern_matches(const std::string& path, const std::string& pattern);

    std::vector<Group> groups_;
};

// Per-session robots.txt cache. A null policy means "allow all" and is cached
// like any other result, so each domain is fetched at most once.
class RobotsCache {
public:
    RobotsCache(Fetcher& fetcher, const CrawlerConfig& config, std::shared_ptr<spdlog::logger> logger);

    std::shared_ptr<const RobotsRules> policy_for(const std::string& domain);

    bool can_fetch(const std::string& url);
    bool can_fetch(const std::string& url, const std::string& token);

    // Only consults the cache; never triggers a fetch.
    std::optional<double> crawl_delay(const std::string& domain) const;
    std::map<std::string, double> crawl_delays() const;

private:
    Fetcher& fetcher_;
    bool enabled_;
    std::string scheme_;
    std::string token_;
    HeaderMap headers_;
    double timeout_;
    std::shared_ptr<spdlog::logger> logger_;

    std::unordered_map<std::string, std::shared_ptr<const RobotsRules>> policies_;
    std::map<std::string, double> delays_;
    mutable std::mutex mtx_;
};
