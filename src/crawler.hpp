#pragma once

#include "admission.hpp"
#include "config.hpp"
#include "crawl_result.hpp"
#include "fetcher.hpp"
#include "html_extractor.hpp"
#include "pattern_filter.hpp"
#include "rate_limiter.hpp"
#include "robots.hpp"
#include "scope_guard.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

enum class CrawlState { Idle, Running, Completed, Aborted, Cancelled };

const char* crawl_state_name(CrawlState s);

struct FrontierEntry {
    std::string url; // canonical
    int depth;
};

struct CrawlStats {
    size_t pages_fetched = 0;
    size_t fetch_failures = 0;
    size_t rate_limited = 0;
    size_t non_html = 0;
    size_t links_enqueued = 0;
    size_t skipped_visited = 0;
    size_t skipped_depth = 0;
    size_t rejected_robots = 0;
    size_t rejected_pattern = 0;
    size_t rejected_scope = 0;
};

// Policy state of one crawl. Nothing here is shared between sessions.
struct CrawlSession {
    CrawlSession(const CrawlerConfig& config,
                 Fetcher& fetcher,
                 std::shared_ptr<spdlog::logger> log,
                 RateLimiter::Sleeper sleeper = {});

    std::shared_ptr<spdlog::logger> logger;
    RobotsCache robots;
    PatternFilter patterns;
    ScopeGuard scope;
    AdmissionPipeline admission;
    RateLimiter rate_limiter;
};

// Breadth-first crawl from a seed URL. One fetch in flight at a time;
// results are kept in fetch-completion order.
class Crawler {
public:
    // Throws InvalidUrl for a malformed seed and std::invalid_argument for a
    // pattern that does not compile.
    Crawler(CrawlerConfig config,
            Fetcher& fetcher,
            PageExtractor& extractor,
            std::shared_ptr<spdlog::logger> logger = spdlog::default_logger(),
            RateLimiter::Sleeper sleeper = {});

    Crawler(const Crawler&) = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Runs until the frontier drains, the page ceiling is hit, or *cancel
    // becomes true (checked between pages). Results stay readable afterwards.
    CrawlState run(const std::atomic<bool>* cancel = nullptr);

    CrawlState state() const { return state_; }
    const CrawlerConfig& config() const { return config_; }
    const std::string& start_url() const { return config_.start_url; }
    const std::vector<CrawlResult>& results() const { return results_; }
    const std::unordered_set<std::string>& visited() const { return visited_; }
    const std::vector<std::string>& visit_order() const { return visitOrder_; }
    const CrawlStats& stats() const { return stats_; }
    size_t frontier_size() const { return queue_.size(); }

    CrawlSession& session() { return session_; }
    const CrawlSession& session() const { return session_; }

private:
    void probe_seed();
    void count_rejection(Admission a);
    bool process(const FrontierEntry& entry);
    void enqueue_links(const FrontierEntry& entry, const std::string& baseUrl, const std::string& html);

    static bool is_html(const std::string& contentType);
    static std::string now_timestamp();

    CrawlerConfig config_;
    Fetcher& fetcher_;
    PageExtractor& extractor_;
    std::shared_ptr<spdlog::logger> logger_;
    CrawlSession session_;

    CrawlState state_ = CrawlState::Idle;
    std::deque<FrontierEntry> queue_;
    std::unordered_set<std::string> visited_;
    std::vector<std::string> visitOrder_;
    std::vector<CrawlResult> results_;
    CrawlStats stats_;
};
