#include "config/config_loader.hpp"
#include "filler/filler_bot.hpp"
#include "logging/logging.hpp"
#include "paper/paper_venue.hpp"
#include "persistence/metrics_collector.hpp"
#include "time/clock.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <print>
#include <thread>

void print_books(PaperVenue& venue) {
    ResidentOrderBook book;
    for (const auto& user : venue.accounts().users()) {
        for (const auto& order : user.orders) {
            book.insert(order, user.user_account);
        }
    }
    for (const auto& market : venue.market_data().markets()) {
        book.print_order_book(market.market_index);
    }
}

void print_summary(const MetricsSnapshot& m, const PaperLedger& ledger) {
    std::println("Cycles run:            {}", m.cycles);
    std::println("Cycles skipped (busy): {}", m.cycles_busy);
    std::println("Snapshot lock timeouts:{:>2}", m.gate_timeouts);
    std::println("Fillable seen:         {}", m.fillable_seen);
    std::println("Transactions sent:     {} ({} failed)", m.submissions, m.failed_submissions);
    std::println("Ledger transactions:   {}", ledger.transaction_count());
    std::println("Orders filled:         {}", m.filled_orders);
    for (const auto& [outcome, count] : m.outcomes) {
        std::println("  {:<22} {}", outcome, count);
    }
}

void run_from_config(const AppConfig& config) {
    init_logging(config.logging);

    SystemClock clock;
    PaperVenue venue(config.paper, clock);
    MetricsCollector metrics(config.output_dir);

    {
        FillerBot bot(config.filler, venue.collaborators(), clock, &metrics);
        bot.init();

        std::cout << "Initial order book:\n";
        print_books(venue);

        std::cout << "\nRunning filler '" << bot.name() << "'"
                  << (bot.dry_run() ? " (dry run)" : "") << " for "
                  << config.paper.run_duration.count() << "ms...\n";
        bot.start_interval_loop(config.filler.interval);
        std::this_thread::sleep_for(config.paper.run_duration);
        bot.stop_interval_loop();
    }

    std::cout << "\nFinal order book:\n";
    print_books(venue);

    std::cout << "\n";
    print_summary(metrics.snapshot(), venue.ledger());

    metrics.finalize();
    std::cout << "\nMetrics written to " << config.output_dir.string() << "/\n";
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config <path>  Load filler configuration from JSON file\n";
    std::cout << "  --output <path>  Override output directory (default: from config)\n";
    std::cout << "  --dry-run        Select and pack fills without submitting them\n";
    std::cout << "  --help           Show this help message\n";
    std::cout << "\nIf no config file is specified, tries config.json then "
                 "config_template.json.\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string output_path;
    bool dry_run = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires a path argument\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--output") == 0 ||
                   std::strcmp(argv[i], "-o") == 0) {
            if (i + 1 < argc) {
                output_path = argv[++i];
            } else {
                std::cerr << "Error: --output requires a path argument\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (std::strcmp(argv[i], "--help") == 0 ||
                   std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        AppConfig config;
        if (!config_path.empty()) {
            std::cout << "Loading config from: " << config_path << "\n";
            config = load_config(config_path);
        } else if (std::filesystem::exists("config.json")) {
            std::cout << "Loading config from: config.json\n";
            config = load_config("config.json");
        } else if (std::filesystem::exists("config_template.json")) {
            std::cout << "Loading config from: config_template.json\n";
            config = load_config("config_template.json");
        } else {
            std::cerr << "Error: No config file found.\n";
            std::cerr << "Please provide config.json, config_template.json, or use "
                         "--config <path>\n";
            return 1;
        }

        if (!output_path.empty()) {
            config.output_dir = output_path;
        }
        if (dry_run) {
            config.filler.dry_run = true;
        }
        std::cout << "Output directory: " << config.output_dir.string() << "\n\n";

        run_from_config(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
