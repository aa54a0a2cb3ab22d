/**
 * @file main.cpp
 * @brief search_analyticsd entry point.
 *
 * Wires the analytics subsystem the way a search server would:
 *   Config → Logger → Analytics (uid, sink, aggregator) → request handlers
 *
 * Without --demo the daemon only keeps the aggregator alive and flushes on
 * schedule; with --demo it plays synthetic search traffic from several
 * producer threads first.
 */

#include "analytics/analytics.hpp"
#include "analytics/envelope.hpp"
#include "analytics/multi_search_aggregator.hpp"
#include "analytics/query.hpp"
#include "analytics/search_aggregator.hpp"
#include "analytics/similar_aggregator.hpp"
#include "analytics/snapshot.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

using namespace search_analytics;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         search_analyticsd                 ║
  ║   Usage Analytics for the Search Server   ║
  ╚═══════════════════════════════════════════╝
)" << "  version " << kAppVersion << '\n' << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    uint32_t flush_interval_s = 0;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--flush-interval" && i + 1 < argc) {
            args.flush_interval_s = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: search_analyticsd [OPTIONS]\n"
                      << "  --config <path>            Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>           Log output directory\n"
                      << "  --flush-interval <secs>    Override analytics.flush_interval_s\n"
                      << "  --demo                     Publish synthetic traffic, wait for one flush, exit\n"
                      << "  --help, -h                 Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

/**
 * @brief Instance statistics read from the database directory.
 *
 * Each sub-directory of the database counts as one index.
 */
class DirectoryStatsSource : public IStatsSource {
public:
    explicit DirectoryStatsSource(std::filesystem::path db_path) : db_path_(std::move(db_path)) {}

    Result<InstanceStats> collect() override {
        std::error_code ec;
        if (!std::filesystem::is_directory(db_path_, ec)) {
            return Error{"Database directory missing: " + db_path_.string()};
        }

        InstanceStats stats;
        for (auto it = std::filesystem::recursive_directory_iterator(db_path_, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                stats.database_size += it->file_size(ec);
            } else if (it->is_directory(ec) && it.depth() == 0) {
                stats.documents_per_index.push_back(0);
            }
        }
        return stats;
    }

private:
    std::filesystem::path db_path_;
};

/**
 * @brief Play random search traffic from a few request threads.
 */
void run_demo(Analytics& analytics, Logger& logger) {
    constexpr int kProducers = 4;
    constexpr int kRequestsPerProducer = 50;
    std::atomic<int> accepted{0};

    std::vector<std::jthread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            std::mt19937 rng(static_cast<uint32_t>(p) + 1);
            std::uniform_int_distribution<uint64_t> latency(1, 250);
            // Odd producers act as SDKs and label themselves; even ones only send a User-Agent.
            std::map<std::string, std::string> headers{{kUserAgentHeader, "curl/8.5.0"}};
            if (p % 2 == 1) {
                headers[kAnalyticsHeader] = "demo-sdk-" + std::to_string(p) + "; demo-plugin";
            }
            auto header = [&headers](const char* name) -> std::optional<std::string_view> {
                auto it = headers.find(name);
                if (it == headers.end()) return std::nullopt;
                return it->second;
            };
            const auto client =
                select_client_header(header(kAnalyticsHeader), header(kUserAgentHeader));

            for (int i = 0; i < kRequestsPerProducer; ++i) {
                SearchQuery query;
                query.q = "hello world";
                if (i % 3 == 0) query.filter = nlohmann::json("genre = horror AND year > 1990");
                if (i % 5 == 0) query.page = 2;

                auto search = SearchPostAggregator::from_query(query);
                if (i % 7 != 0) search.succeed(SearchResult{.processing_time_ms = latency(rng)});
                if (analytics.publish(std::move(search), client)) ++accepted;

                if (i % 10 == 0) {
                    FederatedSearch multi{
                        .queries = {{.index_uid = "movies"}, {.index_uid = "books"}},
                        .federation = i % 20 == 0,
                    };
                    auto aggregate = MultiSearchAggregator::from_federated_search(multi);
                    aggregate.succeed();
                    if (analytics.publish(std::move(aggregate), client)) ++accepted;
                }

                if (i % 4 == 0) {
                    SimilarQuery similar{.id = std::to_string(i), .embedder = "default"};
                    auto aggregate = SimilarGetAggregator::from_query(similar);
                    aggregate.succeed(SimilarResult{.processing_time_ms = latency(rng)});
                    if (analytics.publish(std::move(aggregate), client)) ++accepted;
                }

                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
        });
    }
    producers.clear();

    logger.info("Demo published " + std::to_string(accepted.load()) + " events, "
                + std::to_string(analytics.dropped_events()) + " dropped");

    auto flushes = analytics.aggregator().flush_count();
    while (!g_shutdown_requested && analytics.aggregator().flush_count() == flushes) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    if (!args.log_dir.empty()) config.log.log_dir = args.log_dir;
    if (args.flush_interval_s != 0) config.analytics.flush_interval_s = args.flush_interval_s;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.log.log_dir.empty()) {
        try {
            log_sink = std::make_unique<JsonFileSink>(config.log.log_dir, "search_analytics",
                                                      config.log.max_file_size_mb,
                                                      config.log.rotate_count);
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "Cannot log to " << config.log.log_dir << ": " << e.what() << std::endl;
        }
    }
    if (!log_sink) {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.log.level));
    logger.info("search_analyticsd starting (version " + std::string{kAppVersion} + ")");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Analytics ─────────────────
    DirectoryStatsSource stats(config.server.db_path);
    std::unique_ptr<Analytics> analytics;
    if (auto created = Analytics::create(config, stats, logger)) {
        analytics = std::move(*created);
    } else {
        logger.warn(created.error().message);
    }

    if (args.demo_mode) {
        if (analytics) {
            run_demo(*analytics, logger);
        }
        logger.info("Demo complete");
        logger.flush();
        return 0;
    }

    logger.info("Running. Press Ctrl+C to stop.");
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logger.info("search_analyticsd stopped.");
    logger.flush();
    return 0;
}
