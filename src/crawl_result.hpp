#pragma once

#include <nlohmann/json.hpp>

#include <string>

struct CrawlResult {
    std::string url;
    std::string domain;
    nlohmann::ordered_json fields; // owned by the extractor, embedded verbatim
    long status_code = 0;
    std::string timestamp;
    int depth = 0;
};

// Serialized as url, domain, the extracted fields in extractor order, then
// status_code and timestamp.
inline void to_json(nlohmann::ordered_json& j, const CrawlResult& r) {
    j = nlohmann::ordered_json::object();
    j["url"] = r.url;
    j["domain"] = r.domain;
    if (r.fields.is_object()) {
        for (const auto& item : r.fields.items()) j[item.key()] = item.value();
    }
    j["status_code"] = r.status_code;
    j["timestamp"] = r.timestamp;
}
