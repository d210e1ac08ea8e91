#include "scope_guard.hpp"
#include "url.hpp"

ScopeGuard::ScopeGuard(std::string startDomain,
                       bool allowExternal,
                       int externalHopBudget,
                       std::shared_ptr<spdlog::logger> logger)
    : startDomain_(std::move(startDomain)),
      allowExternal_(allowExternal),
      hopBudget_(externalHopBudget < 0 ? 0 : externalHopBudget),
      logger_(std::move(logger)) {}

bool ScopeGuard::is_in_scope(const std::string& url) {
    const std::string domain = url_domain(url);
    if (domain.empty()) return false;
    if (domain == startDomain_) return true;

    std::lock_guard<std::mutex> lk(mtx_);
    if (admitted_.count(domain)) return true;
    if (!allowExternal_) return false;

    if (hopsUsed_ < hopBudget_) {
        ++hopsUsed_;
        admitted_.insert(domain);
        logger_->info("Following to external domain: {} ({}/{})", domain, hopsUsed_, hopBudget_);
        return true;
    }
    logger_->debug("Max external hops reached, skipping: {}", domain);
    return false;
}

int ScopeGuard::hops_used() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return hopsUsed_;
}

std::set<std::string> ScopeGuard::admitted_domains() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return admitted_;
}
