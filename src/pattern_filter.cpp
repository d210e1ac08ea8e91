#include "pattern_filter.hpp"
#include "url.hpp"

#include <stdexcept>

PatternFilter::PatternFilter(const std::vector<std::string>& exclude,
                             const std::vector<std::string>& include,
                             std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
    for (const auto& p : exclude) exclude_.push_back(compile(p));
    for (const auto& p : include) include_.push_back(compile(p));
}

std::string PatternFilter::glob_to_regex(const std::string& glob) {
    static const std::string special = R"(\^$.|+()[]{}*?)";
    std::string out;
    size_t i = 0;
    while (i < glob.size()) {
        char c = glob[i++];
        if (c == '*') {
            out += ".*";
        } else if (c == '?') {
            out += '.';
        } else if (c == '[') {
            // character class; an unterminated '[' is a literal
            size_t j = i;
            if (j < glob.size() && glob[j] == '!') ++j;
            if (j < glob.size() && glob[j] == ']') ++j;
            while (j < glob.size() && glob[j] != ']') ++j;
            if (j >= glob.size()) {
                out += "\\[";
                continue;
            }
            std::string cls = glob.substr(i, j - i);
            i = j + 1;
            std::string body;
            for (size_t k = 0; k < cls.size(); ++k) {
                if (k == 0 && cls[k] == '!') body += '^';
                else if (cls[k] == '\\' || cls[k] == '^' || (cls[k] == ']' && k > 0)) body += std::string("\\") + cls[k];
                else body += cls[k];
            }
            out += "[" + body + "]";
        } else if (special.find(c) != std::string::npos) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out;
}

PatternFilter::Pattern PatternFilter::compile(const std::string& pattern) {
    bool raw = !pattern.empty() && (pattern.front() == '^' || pattern.back() == '$');
    std::string expr = raw ? pattern : glob_to_regex(pattern);
    try {
        return Pattern{pattern, std::regex(expr, std::regex::ECMAScript | std::regex::icase), !raw};
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid URL pattern '" + pattern + "': " + e.what());
    }
}

bool PatternFilter::matches(const Pattern& p, const std::string& url) {
    return p.whole ? std::regex_match(url, p.re) : std::regex_search(url, p.re);
}

bool PatternFilter::is_allowed(const std::string& url) const {
    if (url.size() > kMaxUrlLength) {
        logger_->debug("URL too long for pattern matching ({} bytes)", url.size());
        return false;
    }
    for (const auto& p : exclude_) {
        if (matches(p, url)) {
            logger_->debug("URL excluded by pattern '{}': {}", p.source, url);
            return false;
        }
    }
    if (include_.empty()) return true;
    for (const auto& p : include_) {
        if (matches(p, url)) return true;
    }
    logger_->debug("URL matches no include pattern: {}", url);
    return false;
}
