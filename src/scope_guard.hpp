#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <mutex>
#include <set>
#include <string>

// Same-domain plus a budget of distinct external domains. The budget is
// spent once per new external domain and never given back.
class ScopeGuard {
public:
    ScopeGuard(std::string startDomain,
               bool allowExternal,
               int externalHopBudget,
               std::shared_ptr<spdlog::logger> logger);

    bool is_in_scope(const std::string& url);

    const std::string& start_domain() const { return startDomain_; }
    int hops_used() const;
    int hop_budget() const { return hopBudget_; }
    std::set<std::string> admitted_domains() const;

private:
    std::string startDomain_;
    bool allowExternal_;
    int hopBudget_;
    int hopsUsed_ = 0;
    std::set<std::string> admitted_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mtx_;
};
