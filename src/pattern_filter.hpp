#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <regex>
#include <string>
#include <vector>

// Exclude-then-include URL filter over user-supplied glob patterns
// ('*' any run, '?' one character, '[...]' / '[!...]' classes), matched
// case-insensitively against the whole URL. A pattern that starts with '^'
// or ends with '$' is taken as a regular expression and searched as-is.
class PatternFilter {
public:
    // Throws std::invalid_argument for a pattern that does not compile.
    PatternFilter(const std::vector<std::string>& exclude,
                  const std::vector<std::string>& include,
                  std::shared_ptr<spdlog::logger> logger);

    // URLs longer than kMaxUrlLength are never allowed.
    bool is_allowed(const std::string& url) const;

    static std::string glob_to_regex(const std::string& glob);

private:
    struct Pattern {
        std::string source;
        std::regex re;
        bool whole; // regex_match instead of regex_search
    };

    static Pattern compile(const std::string& pattern);
    static bool matches(const Pattern& p, const std::string& url);

    std::vector<Pattern> exclude_;
    std::vector<Pattern> include_;
    std::shared_ptr<spdlog::logger> logger_;
};
