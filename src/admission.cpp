#include "admission.hpp"

const char* admission_name(Admission a) {
    switch (a) {
        case Admission::Admitted: return "admitted";
        case Admission::RobotsDisallowed: return "robots-disallowed";
        case Admission::PatternRejected: return "pattern-rejected";
        case Admission::ScopeRejected: return "scope-rejected";
    }
    return "unknown";
}

AdmissionPipeline::AdmissionPipeline(RobotsCache& robots,
                                     PatternFilter& patterns,
                                     ScopeGuard& scope,
                                     std::shared_ptr<spdlog::logger> logger)
    : robots_(robots), patterns_(patterns), scope_(scope), logger_(std::move(logger)) {}

Admission AdmissionPipeline::prefilter(const std::string& url) {
    if (!robots_.can_fetch(url)) return Admission::RobotsDisallowed;
    if (!patterns_.is_allowed(url)) return Admission::PatternRejected;
    return Admission::Admitted;
}

Admission AdmissionPipeline::evaluate(const std::string& url) {
    Admission a = prefilter(url);
    if (a == Admission::Admitted && !scope_.is_in_scope(url)) a = Admission::ScopeRejected;
    if (a != Admission::Admitted) logger_->debug("Skipping {} ({})", url, admission_name(a));
    return a;
}
