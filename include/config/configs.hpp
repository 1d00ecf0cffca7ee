#pragma once

#include "exchange/types.hpp"
#include "utils/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * Fill engine tuning.
 *
 * - snapshot_timeout: bounded wait on the order-book snapshot lock; when unset
 *   it is ten times the cycle interval
 * - cycle_timeout: ceiling on the submission phase of one cycle
 * - fill_backoff: minimum time between attempts on the same order; 0 disables
 *   throttling
 * - max_tx_size: packer budget in bytes, kept below the 1232-byte ledger limit
 * - success_log_min_length: result lines longer than this count as fills
 */
struct FillerConfig {
    std::string name{"filler"};
    bool dry_run{false};
    std::chrono::milliseconds interval{1000};
    std::optional<std::chrono::milliseconds> snapshot_timeout;
    std::chrono::milliseconds cycle_timeout{15000};
    std::chrono::milliseconds fill_backoff{0};
    std::size_t max_tx_size{1000};
    std::uint32_t compute_units{4'000'000};
    std::uint32_t compute_unit_fee{0};
    std::uint32_t outcome_fetch_attempts{10};
    std::chrono::milliseconds outcome_fetch_delay{1000};
    std::size_t success_log_min_length{50};

    [[nodiscard]] std::chrono::milliseconds effective_snapshot_timeout() const {
        return snapshot_timeout.value_or(interval * 10);
    }
};

/**
 * spdlog setup. An empty `file` logs to stdout only.
 */
struct LoggingConfig {
    std::string level{"info"};
    std::filesystem::path file;
    std::size_t max_file_size{10 * 1024 * 1024};
    std::size_t max_files{3};
};

struct PaperMarketConfig {
    MarketIndex market_index;
    Price reserve_price;
    Price half_spread;
    Price oracle_price;
};

struct PaperUserConfig {
    PublicKey authority;
    PublicKey user_account;
    PublicKey user_stats;
    std::optional<ReferrerInfo> referrer;
    std::vector<Order> orders;
};

/**
 * In-process ledger. `unconfirmed_fetches` is how many outcome fetches miss
 * before a submitted transaction becomes visible.
 */
struct PaperLedgerConfig {
    PublicKey fee_payer{"FiLLeR1111111111111111111111111111111111111"};
    PublicKey program_id{"dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH"};
    std::string endpoint{"paper://local"};
    std::uint32_t unconfirmed_fetches{0};
};

/**
 * Complete paper venue: markets, users with resting orders, and the ledger the
 * filler submits to.
 */
struct PaperConfig {
    std::chrono::milliseconds run_duration{10000};
    std::chrono::milliseconds slot_duration{400};
    std::uint8_t max_auction_duration{10};
    std::uint64_t oracle_staleness_slots{120};
    PaperLedgerConfig ledger;
    std::vector<PaperMarketConfig> markets;
    std::vector<PaperUserConfig> users;
};

struct AppConfig {
    FillerConfig filler;
    LoggingConfig logging;
    std::filesystem::path output_dir{"./output"};
    PaperConfig paper;
};
