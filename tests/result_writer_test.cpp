#include "logging.hpp"
#include "result_writer.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

CrawlResult make_result(const std::string& url, const std::string& domain, const std::string& title) {
    CrawlResult r;
    r.url = url;
    r.domain = domain;
    r.status_code = 200;
    r.timestamp = "2024-05-01 12:00:00";
    r.fields = {
        {"title", title},
        {"meta_description", "desc"},
        {"meta_keywords", ""},
        {"headings", {{"h1", {"One", "Two", "Three", "Four"}}, {"h2", nlohmann::ordered_json::array()}, {"h3", {"x"}}}},
        {"links", {"https://example.com/a", "https://example.com/b"}},
        {"images", {{{"src", "https://example.com/i.png"}, {"alt", ""}}}},
        {"text_length", 42},
    };
    return r;
}

std::string slurp(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace

class ResultWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("webscout-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                                           "-" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir);
        results.push_back(make_result("https://example.com/", "example.com", "Home, \"sweet\" home"));
        results.push_back(make_result("https://b.org/", "b.org", "B"));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::vector<CrawlResult> results;
};

TEST_F(ResultWriterTest, JsonHasFieldsAndEnvelope) {
    ResultWriter writer(results, null_logger());
    writer.save((dir / "out.json").string(), OutputFormat::Json);

    auto j = nlohmann::json::parse(slurp(dir / "out.json"));
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["url"], "https://example.com/");
    EXPECT_EQ(j[0]["domain"], "example.com");
    EXPECT_EQ(j[0]["status_code"], 200);
    EXPECT_EQ(j[0]["timestamp"], "2024-05-01 12:00:00");
    EXPECT_EQ(j[0]["title"], "Home, \"sweet\" home");
    EXPECT_EQ(j[1]["links"].size(), 2u);
}

TEST_F(ResultWriterTest, JsonKeysFollowRecordOrder) {
    ResultWriter writer(results, null_logger());
    writer.save((dir / "out.json").string(), OutputFormat::Json);

    auto j = nlohmann::ordered_json::parse(slurp(dir / "out.json"));
    std::vector<std::string> keys;
    for (const auto& item : j[0].items()) keys.push_back(item.key());
    std::vector<std::string> expected = {"url", "domain", "title", "meta_description", "meta_keywords", "headings",
                                         "links", "images", "text_length", "status_code", "timestamp"};
    EXPECT_EQ(keys, expected);
}

TEST_F(ResultWriterTest, CsvFlattensAndQuotes) {
    ResultWriter writer(results, null_logger());
    writer.save((dir / "out.csv").string(), OutputFormat::Csv);

    std::string csv = slurp(dir / "out.csv");
    std::istringstream lines(csv);
    std::string header, first;
    std::getline(lines, header);
    std::getline(lines, first);

    EXPECT_EQ(header,
              "url,domain,title,meta_description,meta_keywords,text_length,status_code,timestamp,"
              "num_links,num_images,h1_count,h2_count,h3_count,h1_text\r");
    EXPECT_EQ(first,
              "https://example.com/,example.com,\"Home, \"\"sweet\"\" home\",desc,,42,200,2024-05-01 12:00:00,"
              "2,1,4,0,1,One | Two | Three\r");
}

TEST_F(ResultWriterTest, TextLayout) {
    ResultWriter writer(results, null_logger());
    writer.save((dir / "out.txt").string(), OutputFormat::Print);

    std::string text = slurp(dir / "out.txt");
    EXPECT_EQ(text.rfind("URL: https://example.com/\nTitle: Home, \"sweet\" home\nDescription: desc\n"
                         "Text length: 42\nLinks found: 2\nStatus: 200\n", 0),
              0u);
    EXPECT_NE(text.find(std::string(50, '-') + "\n\nURL: https://b.org/"), std::string::npos);
}

TEST_F(ResultWriterTest, EmptyResultsWriteNothing) {
    std::vector<CrawlResult> none;
    ResultWriter writer(none, null_logger());
    writer.save((dir / "empty.json").string(), OutputFormat::Json);
    EXPECT_FALSE(fs::exists(dir / "empty.json"));
}

TEST_F(ResultWriterTest, UnwritablePathThrows) {
    ResultWriter writer(results, null_logger());
    EXPECT_THROW(writer.save((dir / "missing" / "out.json").string(), OutputFormat::Json), std::runtime_error);
}

TEST_F(ResultWriterTest, SummaryListsDomainsAndDelays) {
    ResultWriter writer(results, null_logger());
    CrawlSummary summary;
    summary.urls_visited = 3;
    summary.robots_enabled = true;
    summary.crawl_delays = {{"b.org", 5.0}};

    std::ostringstream out;
    writer.print_summary(out, summary);
    std::string s = out.str();
    EXPECT_NE(s.find("CRAWL SUMMARY"), std::string::npos);
    EXPECT_NE(s.find("Pages scraped: 2\n"), std::string::npos);
    EXPECT_NE(s.find("URLs visited: 3\n"), std::string::npos);
    EXPECT_NE(s.find("Domains: b.org, example.com\n"), std::string::npos);
    EXPECT_NE(s.find("Total links found: 4\n"), std::string::npos);
    EXPECT_NE(s.find("Total images found: 2\n"), std::string::npos);
    EXPECT_NE(s.find("Robots.txt compliance: Enabled\n"), std::string::npos);
    EXPECT_NE(s.find("Custom crawl delays: b.org=5s\n"), std::string::npos);
}

TEST(OutputFormatTest, ParsesKnownNames) {
    EXPECT_EQ(parse_output_format("json"), OutputFormat::Json);
    EXPECT_EQ(parse_output_format("csv"), OutputFormat::Csv);
    EXPECT_EQ(parse_output_format("print"), OutputFormat::Print);
    EXPECT_THROW(parse_output_format("xml"), std::invalid_argument);
}

TEST(CsvEscapeTest, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(ResultWriter::csv_escape("plain"), "plain");
    EXPECT_EQ(ResultWriter::csv_escape("a,b"), "\"a,b\"");
    EXPECT_EQ(ResultWriter::csv_escape("line\nbreak"), "\"line\nbreak\"");
}
