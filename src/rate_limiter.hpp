#pragma once

#include "robots.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Per-domain request spacing, measured between request starts. Each domain
// has its own lock, so waits on one domain never block another.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using Sleeper = std::function<void(std::chrono::duration<double>)>;

    RateLimiter(double defaultDelay,
                const RobotsCache* robots,
                std::shared_ptr<spdlog::logger> logger,
                Sleeper sleeper = {});

    // max(default delay, robots crawl-delay for the domain if cached)
    double effective_delay(const std::string& domain) const;

    // Sleeps until the domain's effective delay has passed since the last
    // request start, then records "now" as the new request start.
    void wait_if_needed(const std::string& domain);

    void backoff(const std::string& domain, double seconds);

    std::optional<Clock::time_point> last_fetch(const std::string& domain) const;

private:
    struct DomainState {
        std::mutex mtx;
        std::optional<Clock::time_point> last;
    };

    DomainState& state_for(const std::string& domain) const;

    double defaultDelay_;
    const RobotsCache* robots_;
    std::shared_ptr<spdlog::logger> logger_;
    Sleeper sleeper_;

    mutable std::unordered_map<std::string, std::unique_ptr<DomainState>> states_;
    mutable std::mutex states_mtx_;
};
