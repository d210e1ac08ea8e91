#include "crawler.hpp"
#include "url.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

CrawlerConfig with_canonical_seed(CrawlerConfig config) {
    config.start_url = canonicalize_url(config.start_url);
    return config;
}

} // namespace

const char* crawl_state_name(CrawlState s) {
    switch (s) {
        case CrawlState::Idle: return "idle";
        case CrawlState::Running: return "running";
        case CrawlState::Completed: return "completed";
        case CrawlState::Aborted: return "aborted";
        case CrawlState::Cancelled: return "cancelled";
    }
    return "unknown";
}

// -------------------- session --------------------
CrawlSession::CrawlSession(const CrawlerConfig& config,
                           Fetcher& fetcher,
                           std::shared_ptr<spdlog::logger> log,
                           RateLimiter::Sleeper sleeper)
    : logger(std::move(log)),
      robots(fetcher, config, logger),
      patterns(config.exclude_patterns, config.include_patterns, logger),
      scope(url_domain(config.start_url), config.allow_external, config.external_links_depth, logger),
      admission(robots, patterns, scope, logger),
      rate_limiter(config.delay, &robots, logger, std::move(sleeper)) {}

// -------------------- ctor --------------------
Crawler::Crawler(CrawlerConfig config,
                 Fetcher& fetcher,
                 PageExtractor& extractor,
                 std::shared_ptr<spdlog::logger> logger,
                 RateLimiter::Sleeper sleeper)
    : config_(with_canonical_seed(std::move(config))),
      fetcher_(fetcher),
      extractor_(extractor),
      logger_(std::move(logger)),
      session_(config_, fetcher_, logger_, std::move(sleeper)) {}

// -------------------- small utils --------------------
bool Crawler::is_html(const std::string& contentType) {
    std::string ct = to_lower(contentType);
    return ct.find("text/html") != std::string::npos || ct.find("application/xhtml+xml") != std::string::npos;
}

std::string Crawler::now_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void Crawler::count_rejection(Admission a) {
    switch (a) {
        case Admission::RobotsDisallowed: ++stats_.rejected_robots; break;
        case Admission::PatternRejected: ++stats_.rejected_pattern; break;
        case Admission::ScopeRejected: ++stats_.rejected_scope; break;
        case Admission::Admitted: break;
    }
}

// -------------------- seed --------------------
// HEAD first; servers that reject or mishandle HEAD get a one-byte GET.
void Crawler::probe_seed() {
    const std::string& url = config_.start_url;
    logger_->info("Testing accessibility of start URL: {}", url);
    long status = 0;
    try {
        status = fetcher_.head(url, config_.headers, config_.probe_timeout, true).status_code;
    } catch (const TransportError& e) {
        logger_->debug("HEAD failed for {}: {}", url, e.what());
    }

    if (status == 0 || status >= 400) {
        HeaderMap headers = config_.headers;
        headers["Range"] = "bytes=0-0";
        try {
            status = fetcher_.get(url, headers, config_.probe_timeout, true).status_code;
        } catch (const TransportError& e) {
            logger_->warn("Could not test start URL accessibility: {}", e.what());
            return;
        }
    }
    logger_->info("Start URL returned status: {}", status);
}

// -------------------- page --------------------
bool Crawler::process(const FrontierEntry& entry) {
    const std::string& url = entry.url;
    const std::string domain = url_domain(url);

    logger_->info("Scraping: {}", url);
    HttpResponse r;
    try {
        r = fetcher_.get(url, config_.headers, config_.fetch_timeout, true);
    } catch (const TransportError& e) {
        ++stats_.fetch_failures;
        switch (e.kind()) {
            case TransportError::Kind::Timeout:
                logger_->warn("Timeout scraping {}", url);
                break;
            case TransportError::Kind::Connection:
                logger_->warn("Connection error for {}", url);
                break;
            case TransportError::Kind::Other:
                logger_->error("Error scraping {}: {}", url, e.what());
                break;
        }
        return false;
    }

    if (r.status_code == 429) {
        ++stats_.rate_limited;
        logger_->warn("Rate limited on {}, waiting extra time...", url);
        session_.rate_limiter.backoff(domain, config_.delay * config_.rate_limit_backoff_factor);
        return false;
    }
    if (r.status_code >= 400) {
        ++stats_.fetch_failures;
        logger_->error("Error scraping {}: HTTP {}", url, r.status_code);
        return false;
    }
    if (!is_html(r.content_type)) {
        ++stats_.non_html;
        logger_->debug("Skipping non-HTML content: {} ({})", url, r.content_type);
        return false;
    }

    CrawlResult result;
    result.url = url;
    result.domain = domain;
    result.fields = extractor_.extract_fields(r.body, url);
    result.status_code = r.status_code;
    result.timestamp = now_timestamp();
    result.depth = entry.depth;

    // a page counts only once its links are queued
    if (entry.depth < config_.max_depth) {
        enqueue_links(entry, r.final_url.empty() ? url : r.final_url, r.body);
    }
    results_.push_back(std::move(result));
    ++stats_.pages_fetched;
    return true;
}

void Crawler::enqueue_links(const FrontierEntry& entry, const std::string& baseUrl, const std::string& html) {
    std::unordered_set<std::string> seen;
    size_t added = 0;
    for (const auto& link : extractor_.extract_links(html, baseUrl)) {
        std::string canonical;
        try {
            canonical = canonicalize_url(link);
        } catch (const InvalidUrl& e) {
            logger_->debug("{}", e.what());
            continue;
        }
        if (canonical == entry.url) continue;
        if (!seen.insert(canonical).second) continue;
        if (visited_.count(canonical)) continue;

        Admission a = session_.admission.prefilter(canonical);
        if (a != Admission::Admitted) {
            count_rejection(a);
            continue;
        }
        queue_.push_back(FrontierEntry{canonical, entry.depth + 1});
        ++added;
    }
    stats_.links_enqueued += added;
    logger_->debug("Found {} valid links on {}", added, entry.url);
}

// -------------------- orchestration --------------------
CrawlState Crawler::run(const std::atomic<bool>* cancel) {
    if (state_ != CrawlState::Idle) return state_;
    state_ = CrawlState::Running;

    if (!session_.robots.can_fetch(config_.start_url)) {
        logger_->warn("Robots.txt disallows crawling start URL: {}", config_.start_url);
        if (config_.respect_robots) {
            logger_->error("Cannot proceed due to robots.txt restrictions. Use --no-robots to override (not recommended).");
            state_ = CrawlState::Aborted;
            return state_;
        }
    }
    probe_seed();

    queue_.push_back(FrontierEntry{config_.start_url, 0});
    logger_->info("Starting crawl from: {}", config_.start_url);
    logger_->info("Robots.txt compliance: {}", config_.respect_robots ? "Enabled" : "Disabled");

    while (!queue_.empty()) {
        if (cancel && cancel->load()) {
            logger_->warn("Crawl interrupted with {} entries left in queue", queue_.size());
            state_ = CrawlState::Cancelled;
            return state_;
        }
        if (config_.max_pages > 0 && results_.size() >= config_.max_pages) {
            logger_->info("Page limit of {} reached", config_.max_pages);
            break;
        }

        FrontierEntry entry = std::move(queue_.front());
        queue_.pop_front();

        if (visited_.count(entry.url)) {
            ++stats_.skipped_visited;
            continue;
        }
        if (entry.depth > config_.max_depth) {
            ++stats_.skipped_depth;
            logger_->debug("Max depth reached for: {}", entry.url);
            continue;
        }
        Admission a = session_.admission.evaluate(entry.url);
        if (a != Admission::Admitted) {
            count_rejection(a);
            continue;
        }

        visited_.insert(entry.url);
        visitOrder_.push_back(entry.url);
        session_.rate_limiter.wait_if_needed(url_domain(entry.url));

        bool scraped = false;
        try {
            scraped = process(entry);
        } catch (const std::exception& e) {
            ++stats_.fetch_failures;
            logger_->error("Unexpected error scraping {}: {}", entry.url, e.what());
        }

        if (scraped && results_.size() % 10 == 0) {
            logger_->info("Progress: {} pages scraped, {} in queue", results_.size(), queue_.size());
        }
    }

    state_ = CrawlState::Completed;
    logger_->info("Crawling complete. Scraped {} pages from {} URLs", results_.size(), visited_.size());
    return state_;
}
