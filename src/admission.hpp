#pragma once

#include "pattern_filter.hpp"
#include "robots.hpp"
#include "scope_guard.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <string>

enum class Admission {
    Admitted,
    RobotsDisallowed,
    PatternRejected,
    ScopeRejected,
};

const char* admission_name(Admission a);

// robots -> patterns -> scope. Each stage short-circuits, so hop budget is
// only spent on URLs that passed robots and the pattern filter.
class AdmissionPipeline {
public:
    AdmissionPipeline(RobotsCache& robots,
                      PatternFilter& patterns,
                      ScopeGuard& scope,
                      std::shared_ptr<spdlog::logger> logger);

    Admission evaluate(const std::string& url);
    bool admit(const std::string& url) { return evaluate(url) == Admission::Admitted; }

    // robots and patterns only; leaves the hop budget untouched
    Admission prefilter(const std::string& url);

private:
    RobotsCache& robots_;
    PatternFilter& patterns_;
    ScopeGuard& scope_;
    std::shared_ptr<spdlog::logger> logger_;
};
