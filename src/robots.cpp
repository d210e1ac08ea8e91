#include "robots.hpp"
#include "url.hpp"

#include <algorithm>
#include <sstream>

// -------------------- parsing --------------------
RobotsRules RobotsRules::parse(const std::string& body) {
    RobotsRules rules;
    std::istringstream iss(body);
    std::string line;
    bool in_agents = false; // consecutive User-agent lines share one group

    while (std::getline(iss, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (key == "user-agent") {
            if (!in_agents) rules.groups_.emplace_back();
            in_agents = true;
            if (!value.empty()) rules.groups_.back().agents.push_back(to_lower(value));
            continue;
        }
        if (rules.groups_.empty()) continue;
        in_agents = false;

        Group& group = rules.groups_.back();
        if (key == "allow" || key == "disallow") {
            // an empty Disallow allows everything
            if (!value.empty()) group.rules.push_back(Rule{value, key == "allow"});
        } else if (key == "crawl-delay") {
            try {
                double delay = std::stod(value);
                if (delay >= 0) group.delay = delay;
            } catch (const std::exception&) {
                // malformed delay is ignored
            }
        }
    }
    return rules;
}

// -------------------- evaluation --------------------
const RobotsRules::Group* RobotsRules::group_for(const std::string& token) const {
    std::string product = to_lower(token.substr(0, token.find('/')));
    const Group* fallback = nullptr;
    for (const auto& g : groups_) {
        for (const auto& agent : g.agents) {
            if (agent == "*") {
                if (!fallback) fallback = &g;
            } else if (product.find(agent) != std::string::npos) {
                return &g;
            }
        }
    }
    return fallback;
}

bool RobotsRules::pattern_matches(const std::string& path, const std::string& pattern) {
    std::string pat = pattern;
    bool anchored = !pat.empty() && pat.back() == '$';
    if (anchored) pat.pop_back();
    else pat += '*';

    size_t p = 0, s = 0, star = std::string::npos, mark = 0;
    while (s < path.size()) {
        if (p < pat.size() && pat[p] != '*' && pat[p] == path[s]) {
            ++p;
            ++s;
        } else if (p < pat.size() && pat[p] == '*') {
            star = p++;
            mark = s;
        } else if (star != std::string::npos) {
            p = star + 1;
            s = ++mark;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

bool RobotsRules::allows(const std::string& url, const std::string& token) const {
    const Group* group = group_for(token);
    if (!group) return true;

    std::string path = url;
    if (auto parts = parse_url(url)) {
        path = parts->path.empty() ? "/" : parts->path;
        if (!parts->query.empty()) path += "?" + parts->query;
    }

    size_t disLen = 0;
    size_t allowLen = 0;
    bool disallowed = false;
    for (const auto& r : group->rules) {
        if (!pattern_matches(path, r.pattern)) continue;
        if (r.allow) {
            allowLen = std::max(allowLen, r.pattern.size());
        } else {
            disallowed = true;
            disLen = std::max(disLen, r.pattern.size());
        }
    }
    return !disallowed || allowLen >= disLen;
}

std::optional<double> RobotsRules::crawl_delay(const std::string& token) const {
    const Group* group = group_for(token);
    if (!group) return std::nullopt;
    return group->delay;
}

// -------------------- cache --------------------
RobotsCache::RobotsCache(Fetcher& fetcher, const CrawlerConfig& config, std::shared_ptr<spdlog::logger> logger)
    : fetcher_(fetcher),
      enabled_(config.respect_robots),
      token_(config.robots_token),
      headers_(config.headers),
      timeout_(config.robots_timeout),
      logger_(std::move(logger)) {
    auto parts = parse_url(config.start_url);
    scheme_ = parts ? parts->scheme : "https";
}

std::shared_ptr<const RobotsRules> RobotsCache::policy_for(const std::string& domain) {
    if (!enabled_) return nullptr;

    std::lock_guard<std::mutex> lk(mtx_);
    auto it = policies_.find(domain);
    if (it != policies_.end()) return it->second;

    const std::string robots_url = scheme_ + "://" + domain + "/robots.txt";
    std::shared_ptr<const RobotsRules> policy;
    try {
        HttpResponse r = fetcher_.get(robots_url, headers_, timeout_, true);
        if (r.status_code == 200) {
            auto rules = std::make_shared<RobotsRules>(RobotsRules::parse(r.body));
            if (auto delay = rules->crawl_delay(token_)) {
                delays_[domain] = *delay;
                logger_->info("Found crawl-delay of {}s for {}", *delay, domain);
            }
            logger_->info("Loaded robots.txt for {}", domain);
            policy = std::move(rules);
        } else {
            logger_->debug("No robots.txt found for {} (HTTP {})", domain, r.status_code);
        }
    } catch (const std::exception& e) {
        logger_->debug("Error loading robots.txt for {}: {}", domain, e.what());
    }

    policies_[domain] = policy;
    return policy;
}

bool RobotsCache::can_fetch(const std::string& url) {
    return can_fetch(url, token_);
}

bool RobotsCache::can_fetch(const std::string& url, const std::string& token) {
    if (!enabled_) return true;

    auto policy = policy_for(url_domain(url));
    if (!policy) return true;

    bool allowed = policy->allows(url, token);
    if (!allowed) logger_->debug("Robots.txt disallows: {}", url);
    return allowed;
}

std::optional<double> RobotsCache::crawl_delay(const std::string& domain) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = delays_.find(domain);
    if (it == delays_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, double> RobotsCache::crawl_delays() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return delays_;
}
