#pragma once

#include "crawl_result.hpp"

#include <spdlog/logger.h>

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

enum class OutputFormat { Json, Csv, Print };

// Throws std::invalid_argument for anything but json, csv or print.
OutputFormat parse_output_format(const std::string& name);

struct CrawlSummary {
    size_t urls_visited = 0;
    bool robots_enabled = true;
    std::map<std::string, double> crawl_delays;
};

// Serializes a finished (or interrupted) crawl. File writers throw
// std::runtime_error when the output cannot be written.
class ResultWriter {
public:
    ResultWriter(const std::vector<CrawlResult>& results, std::shared_ptr<spdlog::logger> logger);

    void save(const std::string& path, OutputFormat format) const;

    void write_json(const std::string& path) const;
    void write_csv(const std::string& path) const;
    void write_text(const std::string& path) const;

    void print_json(std::ostream& out) const;
    void print_text(std::ostream& out) const;

    void print_summary(std::ostream& out, const CrawlSummary& summary) const;

    static std::string csv_escape(const std::string& field);

private:
    void write_text_records(std::ostream& out, bool fileLayout) const;

    const std::vector<CrawlResult>& results_;
    std::shared_ptr<spdlog::logger> logger_;
};
