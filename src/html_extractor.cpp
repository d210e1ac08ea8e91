#include "html_extractor.hpp"
#include "url.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <memory>

using json = nlohmann::ordered_json;

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

XmlDocPtr parse_html(const std::string& html) {
    if (html.empty()) return nullptr;
    return XmlDocPtr(htmlReadMemory(html.c_str(),
                                    static_cast<int>(html.size()),
                                    nullptr,
                                    "UTF-8",
                                    HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
}

std::string node_name(xmlNodePtr node) {
    return node->name ? to_lower(reinterpret_cast<const char*>(node->name)) : std::string();
}

std::string get_attribute(xmlNodePtr node, const char* attr) {
    xmlChar* value = xmlGetProp(node, BAD_CAST attr);
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return result;
}

bool has_attribute(xmlNodePtr node, const char* attr) {
    return xmlHasProp(node, BAD_CAST attr) != nullptr;
}

std::string node_text(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string result(reinterpret_cast<char*>(content));
    xmlFree(content);
    return result;
}

// Everything the extractor needs, collected in one document walk.
struct PageScan {
    bool has_title = false;
    std::string title;
    bool has_description = false;
    std::string description;
    bool has_keywords = false;
    std::string keywords;
    std::vector<std::string> h1, h2, h3;
    std::vector<std::string> hrefs;
    std::vector<std::pair<std::string, std::string>> images; // src, alt
};

void scan(xmlNodePtr node, PageScan& page) {
    for (xmlNodePtr cur = node; cur; cur = cur->next) {
        if (cur->type == XML_ELEMENT_NODE) {
            std::string name = node_name(cur);
            if (name == "title" && !page.has_title) {
                page.has_title = true;
                page.title = trim(node_text(cur));
            } else if (name == "meta") {
                std::string meta = to_lower(get_attribute(cur, "name"));
                if (meta == "description" && !page.has_description) {
                    page.has_description = true;
                    page.description = trim(get_attribute(cur, "content"));
                } else if (meta == "keywords" && !page.has_keywords) {
                    page.has_keywords = true;
                    page.keywords = trim(get_attribute(cur, "content"));
                }
            } else if (name == "h1") {
                page.h1.push_back(trim(node_text(cur)));
            } else if (name == "h2") {
                page.h2.push_back(trim(node_text(cur)));
            } else if (name == "h3") {
                page.h3.push_back(trim(node_text(cur)));
            } else if (name == "a" && has_attribute(cur, "href")) {
                page.hrefs.push_back(get_attribute(cur, "href"));
            } else if (name == "img" && has_attribute(cur, "src")) {
                page.images.emplace_back(get_attribute(cur, "src"), trim(get_attribute(cur, "alt")));
            }
        }
        if (cur->children) scan(cur->children, page);
    }
}

// UTF-8 code points; libxml2 hands back UTF-8 whatever the page encoding
size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

json first_headings(const std::vector<std::string>& all) {
    json out = json::array();
    for (size_t i = 0; i < all.size() && i < HtmlExtractor::kMaxHeadings; ++i) {
        if (!all[i].empty()) out.push_back(all[i]);
    }
    return out;
}

} // namespace

json HtmlExtractor::extract_fields(const std::string& html, const std::string& url) {
    json data = {
        {"title", ""},
        {"meta_description", ""},
        {"meta_keywords", ""},
        {"headings", {{"h1", json::array()}, {"h2", json::array()}, {"h3", json::array()}}},
        {"links", json::array()},
        {"images", json::array()},
        {"text_length", 0},
    };

    XmlDocPtr doc = parse_html(html);
    xmlNodePtr root = doc ? xmlDocGetRootElement(doc.get()) : nullptr;
    if (!root) return data;

    PageScan page;
    scan(root, page);

    data["title"] = page.title;
    data["meta_description"] = page.description;
    data["meta_keywords"] = page.keywords;
    data["headings"]["h1"] = first_headings(page.h1);
    data["headings"]["h2"] = first_headings(page.h2);
    data["headings"]["h3"] = first_headings(page.h3);
    data["text_length"] = utf8_length(trim(node_text(root)));

    const std::string domain = url_domain(url);
    for (size_t i = 0; i < page.hrefs.size() && i < kMaxLinks; ++i) {
        try {
            std::string absolute = resolve_url(url, page.hrefs[i]);
            if (url_domain(absolute) == domain) data["links"].push_back(absolute);
        } catch (const InvalidUrl&) {
            // mailto:, javascript: and broken references are not page links
        }
    }

    for (size_t i = 0; i < page.images.size() && i < kMaxImages; ++i) {
        std::string src = page.images[i].first;
        try {
            src = resolve_url(url, src);
        } catch (const InvalidUrl&) {
            // data: URIs and the like are kept verbatim
        }
        data["images"].push_back({{"src", src}, {"alt", page.images[i].second}});
    }
    return data;
}

std::vector<std::string> HtmlExtractor::extract_links(const std::string& html, const std::string& baseUrl) {
    std::vector<std::string> links;
    XmlDocPtr doc = parse_html(html);
    xmlNodePtr root = doc ? xmlDocGetRootElement(doc.get()) : nullptr;
    if (!root) return links;

    PageScan page;
    scan(root, page);
    for (const auto& href : page.hrefs) {
        try {
            links.push_back(resolve_url(baseUrl, href));
        } catch (const InvalidUrl&) {
            continue;
        }
    }
    return links;
}
