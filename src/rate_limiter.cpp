#include "rate_limiter.hpp"

#include <algorithm>
#include <thread>

RateLimiter::RateLimiter(double defaultDelay,
                         const RobotsCache* robots,
                         std::shared_ptr<spdlog::logger> logger,
                         Sleeper sleeper)
    : defaultDelay_(std::max(0.0, defaultDelay)),
      robots_(robots),
      logger_(std::move(logger)),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::duration<double> d) { std::this_thread::sleep_for(d); };
    }
}

RateLimiter::DomainState& RateLimiter::state_for(const std::string& domain) const {
    std::lock_guard<std::mutex> lk(states_mtx_);
    auto& slot = states_[domain];
    if (!slot) slot = std::make_unique<DomainState>();
    return *slot;
}

double RateLimiter::effective_delay(const std::string& domain) const {
    double delay = defaultDelay_;
    if (robots_) {
        if (auto declared = robots_->crawl_delay(domain)) delay = std::max(delay, *declared);
    }
    return delay;
}

void RateLimiter::wait_if_needed(const std::string& domain) {
    const double delay = effective_delay(domain);
    DomainState& state = state_for(domain);

    std::lock_guard<std::mutex> lk(state.mtx);
    if (state.last) {
        std::chrono::duration<double> elapsed = Clock::now() - *state.last;
        if (elapsed.count() < delay) {
            std::chrono::duration<double> remaining(delay - elapsed.count());
            logger_->debug("Rate limiting: sleeping {:.2f}s for {}", remaining.count(), domain);
            sleeper_(remaining);
        }
    }
    state.last = Clock::now();
}

void RateLimiter::backoff(const std::string& domain, double seconds) {
    if (seconds <= 0) return;
    DomainState& state = state_for(domain);
    std::lock_guard<std::mutex> lk(state.mtx);
    logger_->debug("Backing off {:.2f}s for {}", seconds, domain);
    sleeper_(std::chrono::duration<double>(seconds));
}

std::optional<RateLimiter::Clock::time_point> RateLimiter::last_fetch(const std::string& domain) const {
    DomainState& state = state_for(domain);
    std::lock_guard<std::mutex> lk(state.mtx);
    return state.last;
}
