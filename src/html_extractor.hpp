#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

// Extraction collaborator consumed by the crawl engine.
class PageExtractor {
public:
    virtual ~PageExtractor() = default;

    // Opaque record embedded verbatim in the CrawlResult; key order is kept.
    virtual nlohmann::ordered_json extract_fields(const std::string& html, const std::string& url) = 0;

    // Absolute <a href> targets in document order.
    virtual std::vector<std::string> extract_links(const std::string& html, const std::string& baseUrl) = 0;
};

// libxml2-backed extractor. Fields: title, meta_description, meta_keywords,
// headings {h1,h2,h3} (first 5 each), links (first 50 anchors, same domain
// only), images (first 20, {src, alt}), text_length (in code points).
class HtmlExtractor : public PageExtractor {
public:
    static constexpr size_t kMaxHeadings = 5;
    static constexpr size_t kMaxLinks = 50;
    static constexpr size_t kMaxImages = 20;

    nlohmann::ordered_json extract_fields(const std::string& html, const std::string& url) override;
    std::vector<std::string> extract_links(const std::string& html, const std::string& baseUrl) override;
};
