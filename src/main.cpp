#include "config.hpp"
#include "frame_source.hpp"
#include "http.hpp"
#include "report.hpp"
#include "search.hpp"
#include "types.hpp"
#include "similarity/matrix_provider.hpp"
#include "similarity/pair_similarity.hpp"
#include "similarity/similarity_cache.hpp"
#include "similarity/similarity_client.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <stdexcept>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: eventseq -e TEXT -e TEXT [...] [options]\n"
              << "\n"
              << "Find keyframe sequences that show the given events in order.\n"
              << "\n"
              << "Options:\n"
              << "  -e, --event TEXT             Add an event (repeat, in temporal order; at least 2)\n"
              << "  --top-k N                    Candidates from the initial retrieval\n"
              << "  --window N                   Frame-number radius around each pivot\n"
              << "  --max-gap N                  Frame gap at which the temporal score bottoms out\n"
              << "  --similarity-threshold X     Minimum similarity for a pivot or event match\n"
              << "  --score-threshold X          Minimum final score to report a sequence\n"
              << "  --min-completeness X         Fraction of events a sequence must match\n"
              << "  --temporal-weight X          Weight of the temporal score\n"
              << "  --completeness-weight X      Weight of the completeness score\n"
              << "  --base-url URL               Retrieval service base URL\n"
              << "  --analyze                    Run a traced analysis over the first 10 candidates\n"
              << "  --json                       Print results as JSON\n"
              << "  -h, --help                   Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  EVENTSEQ_BASE_URL            Retrieval service base URL (default: http://localhost:8000)\n"
              << "  EVENTSEQ_TIMEOUT             Request timeout in seconds (default: 30)\n";
}

// Numeric flag value; throws std::invalid_argument naming the flag.
static double parse_number(const char* flag, const std::string& value) {
    std::string msg = std::string(flag) + " expects a number, got '" + value + "'";
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(msg);
    }
    if (used != value.size()) throw std::invalid_argument(msg);
    return v;
}

static int64_t parse_integer(const char* flag, const std::string& value) {
    std::string msg = std::string(flag) + " expects an integer, got '" + value + "'";
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(msg);
    }
    if (used != value.size()) throw std::invalid_argument(msg);
    return static_cast<int64_t>(v);
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::vector<std::string> descriptions;
    std::string base_url;
    bool analyze = false;
    bool json_output = false;

    auto config = eventseq::Config::load();
    auto& algo = config.algorithm;

    for (int i = 1; i < argc; i++) {
        bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-e") == 0 || std::strcmp(argv[i], "--event") == 0) && has_value) {
            descriptions.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--top-k") == 0 && has_value) {
            algo.top_k = eventseq::checked_count("--top-k", parse_integer(argv[i], argv[i + 1]));
            ++i;
        } else if (std::strcmp(argv[i], "--window") == 0 && has_value) {
            algo.search_window = parse_integer(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "--max-gap") == 0 && has_value) {
            algo.max_temporal_gap = parse_number(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "--similarity-threshold") == 0 && has_value) {
            algo.similarity_threshold = parse_number(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "--score-threshold") == 0 && has_value) {
            algo.score_threshold = parse_number(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "--min-completeness") == 0 && has_value) {
            algo.min_sequence_completeness = parse_number(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "--temporal-weight") == 0 && has_value) {
            algo.temporal_weight = parse_number(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "--completeness-weight") == 0 && has_value) {
            algo.completeness_weight = parse_number(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "--base-url") == 0 && has_value) {
            base_url = argv[++i];
        } else if (std::strcmp(argv[i], "--analyze") == 0) {
            analyze = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (!base_url.empty()) {
        config.service.base_url = base_url;
    }

    auto events = eventseq::make_events(descriptions);
    if (events.size() < 2) {
        std::cerr << "Error: at least 2 non-empty events are required.\n";
        print_usage();
        return 1;
    }

    // Initialize
    eventseq::http_init();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    eventseq::http_set_abort_flag(&g_shutdown);

    eventseq::CurlHttpClient http_client;
    long timeout = static_cast<long>(config.service.timeout_seconds);
    eventseq::HttpFrameSource frames(config.service.base_url, http_client, timeout);
    eventseq::HttpSimilarityClient similarity(config.service.base_url, http_client, timeout);
    eventseq::SimilarityCache cache;
    eventseq::PairSimilarity pairs(similarity, cache);
    auto matrix = eventseq::create_matrix_provider(config.service, similarity, cache, pairs);

    int rc = 0;
    try {
        eventseq::SearchSession session(algo, frames, pairs, *matrix, cache);
        if (analyze) {
            auto report = session.analyze(events);
            if (json_output) {
                std::cout << eventseq::to_json(report).dump(2) << '\n';
            } else {
                eventseq::render_analysis(std::cout, report);
            }
        } else {
            auto results = session.search(events);
            if (json_output) {
                std::cout << eventseq::results_to_json(events, results).dump(2) << '\n';
            } else {
                eventseq::render_results(std::cout, events, results);
            }
        }
    } catch (const eventseq::SearchError& e) {
        std::cerr << "Search failed: " << e.what() << "\n";
        rc = 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        rc = 1;
    }

    eventseq::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
