#include "crawler.hpp"
#include "logging.hpp"
#include "result_writer.hpp"

#include <atomic>
#include <csignal>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) {
    g_interrupted.store(true);
}

struct CliOptions {
    CrawlerConfig config;
    std::string output = "output.json";
    OutputFormat format = OutputFormat::Json;
    bool verbose = false;
    bool help = false;
};

const char* kUsage =
    "usage: webscout --url URL [options]\n"
    "\n"
    "Polite breadth-first web crawler\n"
    "\n"
    "  --url URL                    Starting URL to scrape (required)\n"
    "  --allow-exit                 Allow following links to external domains\n"
    "  --external-links-depth N     Maximum number of external domains to follow (requires --allow-exit)\n"
    "  --depth N                    Maximum crawl depth (default: 3)\n"
    "  --delay S                    Minimum delay between requests in seconds (default: 1.0)\n"
    "  --no-robots                  Disable robots.txt compliance (not recommended)\n"
    "  --bot-name TOKEN             User-agent name for robots.txt compliance (default: *)\n"
    "  -o, --output FILE            Output file path (default: output.json)\n"
    "  --format json|csv|print      Output format (default: json)\n"
    "  --exclude P [P ...]          URL patterns to exclude (supports wildcards)\n"
    "  --include P [P ...]          Only include URLs matching these patterns\n"
    "  --max-pages N                Stop after N pages (default: 0, unlimited)\n"
    "  --timeout S                  Page fetch timeout in seconds (default: 15)\n"
    "  --robots-timeout S           robots.txt fetch timeout in seconds (default: 5)\n"
    "  --user-agent UA              Custom User-Agent string\n"
    "  -v, --verbose                Enable verbose logging\n"
    "  -h, --help                   Show this help and exit\n";

std::string take_value(int argc, char** argv, int& i) {
    std::string flag = argv[i];
    if (i + 1 >= argc) throw std::invalid_argument("argument " + flag + ": expected one argument");
    return argv[++i];
}

int to_int(const std::string& flag, const std::string& v) {
    const std::string msg = "argument " + flag + ": invalid int value: '" + v + "'";
    size_t pos = 0;
    int n = 0;
    try {
        n = std::stoi(v, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(msg);
    }
    if (pos != v.size()) throw std::invalid_argument(msg);
    return n;
}

double to_double(const std::string& flag, const std::string& v) {
    const std::string msg = "argument " + flag + ": invalid float value: '" + v + "'";
    size_t pos = 0;
    double d = 0;
    try {
        d = std::stod(v, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(msg);
    }
    if (pos != v.size()) throw std::invalid_argument(msg);
    return d;
}

// nargs='*': everything up to the next option
std::vector<std::string> take_list(int argc, char** argv, int& i) {
    std::vector<std::string> values;
    while (i + 1 < argc && std::string(argv[i + 1]).rfind("-", 0) != 0) values.push_back(argv[++i]);
    return values;
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;
    CrawlerConfig& cfg = opts.config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        } else if (arg == "--url") {
            cfg.start_url = take_value(argc, argv, i);
        } else if (arg == "--allow-exit") {
            cfg.allow_external = true;
        } else if (arg == "--external-links-depth") {
            cfg.external_links_depth = to_int(arg, take_value(argc, argv, i));
        } else if (arg == "--depth") {
            cfg.max_depth = to_int(arg, take_value(argc, argv, i));
        } else if (arg == "--delay") {
            cfg.delay = to_double(arg, take_value(argc, argv, i));
        } else if (arg == "--no-robots") {
            cfg.respect_robots = false;
        } else if (arg == "--bot-name") {
            cfg.robots_token = take_value(argc, argv, i);
        } else if (arg == "-o" || arg == "--output") {
            opts.output = take_value(argc, argv, i);
        } else if (arg == "--format") {
            opts.format = parse_output_format(take_value(argc, argv, i));
        } else if (arg == "--exclude") {
            auto v = take_list(argc, argv, i);
            cfg.exclude_patterns.insert(cfg.exclude_patterns.end(), v.begin(), v.end());
        } else if (arg == "--include") {
            auto v = take_list(argc, argv, i);
            cfg.include_patterns.insert(cfg.include_patterns.end(), v.begin(), v.end());
        } else if (arg == "--max-pages") {
            int n = to_int(arg, take_value(argc, argv, i));
            cfg.max_pages = n <= 0 ? 0 : static_cast<size_t>(n);
        } else if (arg == "--timeout") {
            cfg.fetch_timeout = to_double(arg, take_value(argc, argv, i));
        } else if (arg == "--robots-timeout") {
            cfg.robots_timeout = to_double(arg, take_value(argc, argv, i));
        } else if (arg == "--user-agent") {
            cfg.headers["User-Agent"] = take_value(argc, argv, i);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw std::invalid_argument("unrecognized arguments: " + arg);
        }
    }

    if (cfg.start_url.empty()) throw std::invalid_argument("the following arguments are required: --url");
    if (cfg.external_links_depth > 0 && !cfg.allow_external) {
        throw std::invalid_argument("--external-links-depth requires --allow-exit to be set");
    }
    if (opts.format == OutputFormat::Print) opts.output.clear();
    return opts;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << kUsage << "webscout: error: " << ex.what() << std::endl;
        return 2;
    }
    if (opts.help) {
        std::cout << kUsage;
        return 0;
    }

    auto logger = setup_logging(opts.verbose);
    std::signal(SIGINT, on_sigint);

    try {
        CprFetcher fetcher;
        HtmlExtractor extractor;
        Crawler crawler(opts.config, fetcher, extractor, logger);

        CrawlState state = crawler.run(&g_interrupted);

        ResultWriter writer(crawler.results(), logger);
        CrawlSummary summary;
        summary.urls_visited = crawler.visited().size();
        summary.robots_enabled = opts.config.respect_robots;
        summary.crawl_delays = crawler.session().robots.crawl_delays();

        if (state == CrawlState::Cancelled) {
            std::cout << "\nCrawling interrupted by user" << std::endl;
            if (!crawler.results().empty()) {
                std::cout << "Partial results: " << crawler.results().size() << " pages scraped" << std::endl;
                std::string path = opts.output.empty()
                    ? "partial-" + std::to_string(std::time(nullptr)) + ".json"
                    : opts.output;
                OutputFormat format = opts.format == OutputFormat::Print ? OutputFormat::Json : opts.format;
                writer.save(path, format);
                writer.print_summary(std::cout, summary);
                std::cout << "Saved partial results to " << path << std::endl;
            }
            return 130;
        }

        if (opts.verbose || opts.format == OutputFormat::Print) writer.print_summary(std::cout, summary);

        if (!crawler.results().empty()) {
            if (opts.format == OutputFormat::Print) writer.print_text(std::cout);
            else writer.save(opts.output, opts.format);
        } else {
            std::cout << "No data was scraped. Check your URL and settings." << std::endl;
            std::cout << "Visited URLs: " << crawler.visited().size() << std::endl;
            std::cout << "Start URL accessible: "
                      << (opts.config.respect_robots
                              ? (crawler.session().robots.can_fetch(crawler.start_url()) ? "True" : "False")
                              : "Not checked")
                      << std::endl;
            const auto& order = crawler.visit_order();
            if (!order.empty()) {
                std::cout << "First few visited URLs:";
                for (size_t i = 0; i < order.size() && i < 5; ++i) std::cout << " " << order[i];
                std::cout << std::endl;
            }
        }
        return state == CrawlState::Aborted ? 1 : 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
