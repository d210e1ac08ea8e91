#include "result_writer.hpp"

#include <fstream>
#include <set>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace {

std::string str_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

size_t array_size(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_array()) ? it->size() : 0;
}

json headings(const json& fields, const char* level) {
    auto it = fields.find("headings");
    if (it == fields.end() || !it->is_object()) return json::array();
    auto lv = it->find(level);
    return (lv != it->end() && lv->is_array()) ? *lv : json::array();
}

long long text_length(const json& fields) {
    auto it = fields.find("text_length");
    return (it != fields.end() && it->is_number()) ? it->get<long long>() : 0;
}

std::ofstream open_output(const std::string& path) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) throw std::runtime_error("Cannot open output file: " + path);
    return ofs;
}

void finish_output(std::ofstream& ofs, const std::string& path) {
    ofs.flush();
    if (!ofs) throw std::runtime_error("Failed writing output file: " + path);
}

json results_to_json(const std::vector<CrawlResult>& results) {
    json j = json::array();
    for (const auto& r : results) j.push_back(r);
    return j;
}

} // namespace

OutputFormat parse_output_format(const std::string& name) {
    if (name == "json") return OutputFormat::Json;
    if (name == "csv") return OutputFormat::Csv;
    if (name == "print") return OutputFormat::Print;
    throw std::invalid_argument("Unknown output format: " + name + " (expected json, csv or print)");
}

ResultWriter::ResultWriter(const std::vector<CrawlResult>& results, std::shared_ptr<spdlog::logger> logger)
    : results_(results), logger_(std::move(logger)) {}

void ResultWriter::save(const std::string& path, OutputFormat format) const {
    if (results_.empty()) {
        logger_->warn("No data to save");
        return;
    }
    logger_->info("Attempting to save {} items to {}", results_.size(), path);
    switch (format) {
        case OutputFormat::Json: write_json(path); break;
        case OutputFormat::Csv: write_csv(path); break;
        case OutputFormat::Print: write_text(path); break;
    }
}

// -------------------- json --------------------
void ResultWriter::write_json(const std::string& path) const {
    std::ofstream ofs = open_output(path);
    print_json(ofs);
    finish_output(ofs, path);
    logger_->info("Successfully saved JSON data to {}", path);
}

void ResultWriter::print_json(std::ostream& out) const {
    out << results_to_json(results_).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

// -------------------- csv --------------------
std::string ResultWriter::csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

void ResultWriter::write_csv(const std::string& path) const {
    static const char* const kColumns[] = {
        "url", "domain", "title", "meta_description", "meta_keywords", "text_length", "status_code",
        "timestamp", "num_links", "num_images", "h1_count", "h2_count", "h3_count", "h1_text",
    };

    std::ofstream ofs = open_output(path);
    bool first = true;
    for (const char* col : kColumns) {
        ofs << (first ? "" : ",") << col;
        first = false;
    }
    ofs << "\r\n";

    for (const auto& r : results_) {
        const json& f = r.fields;
        json h1 = headings(f, "h1");
        std::string h1_text;
        for (size_t i = 0; i < h1.size() && i < 3; ++i) {
            if (i) h1_text += " | ";
            h1_text += h1[i].is_string() ? h1[i].get<std::string>() : h1[i].dump();
        }

        ofs << csv_escape(r.url) << ','
            << csv_escape(r.domain) << ','
            << csv_escape(str_field(f, "title")) << ','
            << csv_escape(str_field(f, "meta_description")) << ','
            << csv_escape(str_field(f, "meta_keywords")) << ','
            << text_length(f) << ','
            << r.status_code << ','
            << csv_escape(r.timestamp) << ','
            << array_size(f, "links") << ','
            << array_size(f, "images") << ','
            << h1.size() << ','
            << headings(f, "h2").size() << ','
            << headings(f, "h3").size() << ','
            << csv_escape(h1_text) << "\r\n";
    }
    finish_output(ofs, path);
    logger_->info("Successfully saved CSV data to {}", path);
}

// -------------------- plain text --------------------
void ResultWriter::write_text_records(std::ostream& out, bool fileLayout) const {
    const std::string rule(50, '-');
    for (const auto& r : results_) {
        if (!fileLayout) out << "\n";
        out << "URL: " << r.url << "\n"
            << "Title: " << str_field(r.fields, "title") << "\n"
            << "Description: " << str_field(r.fields, "meta_description") << "\n"
            << "Text length: " << text_length(r.fields) << "\n"
            << "Links found: " << array_size(r.fields, "links") << "\n"
            << "Status: " << r.status_code << "\n"
            << rule << (fileLayout ? "\n\n" : "\n");
    }
}

void ResultWriter::write_text(const std::string& path) const {
    std::ofstream ofs = open_output(path);
    write_text_records(ofs, true);
    finish_output(ofs, path);
    logger_->info("Successfully saved text data to {}", path);
}

void ResultWriter::print_text(std::ostream& out) const {
    write_text_records(out, false);
}

// -------------------- summary --------------------
void ResultWriter::print_summary(std::ostream& out, const CrawlSummary& summary) const {
    if (results_.empty()) return;

    std::set<std::string> domains;
    size_t total_links = 0;
    size_t total_images = 0;
    for (const auto& r : results_) {
        domains.insert(r.domain);
        total_links += array_size(r.fields, "links");
        total_images += array_size(r.fields, "images");
    }

    const std::string banner(50, '=');
    out << "\n" << banner << "\n"
        << "CRAWL SUMMARY\n"
        << banner << "\n"
        << "Pages scraped: " << results_.size() << "\n"
        << "URLs visited: " << summary.urls_visited << "\n"
        << "Domains: ";
    bool first = true;
    for (const auto& d : domains) {
        out << (first ? "" : ", ") << d;
        first = false;
    }
    out << "\n"
        << "Total links found: " << total_links << "\n"
        << "Total images found: " << total_images << "\n"
        << "Robots.txt compliance: " << (summary.robots_enabled ? "Enabled" : "Disabled") << "\n";

    if (!summary.crawl_delays.empty()) {
        out << "Custom crawl delays: ";
        first = true;
        for (const auto& kv : summary.crawl_delays) {
            out << (first ? "" : ", ") << kv.first << "=" << kv.second << "s";
            first = false;
        }
        out << "\n";
    }
}
