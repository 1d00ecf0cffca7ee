#pragma once

#include "config/configs.hpp"
#include "filler/tx_size.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace detail {

inline std::chrono::milliseconds millis_at(const nlohmann::json& j, const char* key) {
    return std::chrono::milliseconds{j.at(key).get<std::int64_t>()};
}

} // namespace detail

// Throws std::invalid_argument on settings the engine cannot run with.
inline void validate(const FillerConfig& c) {
    if (c.interval.count() <= 0) {
        throw std::invalid_argument("filler.interval_ms must be positive");
    }
    if (c.max_tx_size == 0) {
        throw std::invalid_argument("filler.max_tx_size must be positive");
    }
    if (c.max_tx_size > PACKET_DATA_SIZE) {
        throw std::invalid_argument("filler.max_tx_size exceeds the " +
                                    std::to_string(PACKET_DATA_SIZE) + " byte packet limit");
    }
    if (c.outcome_fetch_attempts == 0) {
        throw std::invalid_argument("filler.outcome_fetch_attempts must be positive");
    }
    if (c.fill_backoff.count() < 0 || c.cycle_timeout.count() <= 0 ||
        c.outcome_fetch_delay.count() < 0 ||
        (c.snapshot_timeout && c.snapshot_timeout->count() < 0)) {
        throw std::invalid_argument("filler timeouts must not be negative");
    }
}

inline void from_json(const nlohmann::json& j, FillerConfig& c) {
    if (j.contains("name")) c.name = j.at("name").get<std::string>();
    if (j.contains("dry_run")) c.dry_run = j.at("dry_run").get<bool>();
    if (j.contains("interval_ms")) c.interval = detail::millis_at(j, "interval_ms");
    if (j.contains("snapshot_timeout_ms")) {
        c.snapshot_timeout = detail::millis_at(j, "snapshot_timeout_ms");
    }
    if (j.contains("cycle_timeout_ms")) c.cycle_timeout = detail::millis_at(j, "cycle_timeout_ms");
    if (j.contains("fill_backoff_ms")) c.fill_backoff = detail::millis_at(j, "fill_backoff_ms");
    if (j.contains("max_tx_size")) c.max_tx_size = j.at("max_tx_size").get<std::size_t>();
    if (j.contains("compute_units")) {
        c.compute_units = j.at("compute_units").get<std::uint32_t>();
    }
    if (j.contains("compute_unit_fee")) {
        c.compute_unit_fee = j.at("compute_unit_fee").get<std::uint32_t>();
    }
    if (j.contains("outcome_fetch_attempts")) {
        c.outcome_fetch_attempts = j.at("outcome_fetch_attempts").get<std::uint32_t>();
    }
    if (j.contains("outcome_fetch_delay_ms")) {
        c.outcome_fetch_delay = detail::millis_at(j, "outcome_fetch_delay_ms");
    }
    if (j.contains("success_log_min_length")) {
        c.success_log_min_length = j.at("success_log_min_length").get<std::size_t>();
    }
}

inline void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("level")) c.level = j.at("level").get<std::string>();
    if (j.contains("file")) c.file = j.at("file").get<std::string>();
    if (j.contains("max_file_size")) c.max_file_size = j.at("max_file_size").get<std::size_t>();
    if (j.contains("max_files")) c.max_files = j.at("max_files").get<std::size_t>();
}

inline void from_json(const nlohmann::json& j, Order& o) {
    o.order_id = OrderID{j.at("order_id").get<std::uint32_t>()};
    o.market_index = MarketIndex{j.at("market_index").get<std::uint64_t>()};
    std::string direction = j.at("direction").get<std::string>();
    if (direction == "LONG") {
        o.direction = PositionDirection::LONG;
    } else if (direction == "SHORT") {
        o.direction = PositionDirection::SHORT;
    } else {
        throw std::runtime_error("Unknown order direction: " + direction);
    }
    o.type = j.value("type", std::string{"LIMIT"}) == "MARKET" ? OrderType::MARKET
                                                               : OrderType::LIMIT;
    o.price = Price{j.value("price", std::int64_t{0})};
    o.base_asset_amount = Quantity{j.at("base_asset_amount").get<std::uint64_t>()};
    o.base_asset_amount_filled =
        Quantity{j.value("base_asset_amount_filled", std::uint64_t{0})};
    o.slot = Slot{j.value("slot", std::uint64_t{0})};
    o.auction_duration = j.value("auction_duration", std::uint8_t{0});
}

inline void from_json(const nlohmann::json& j, PaperMarketConfig& c) {
    c.market_index = MarketIndex{j.at("market_index").get<std::uint64_t>()};
    c.reserve_price = Price{j.at("reserve_price").get<std::int64_t>()};
    c.half_spread = Price{j.at("half_spread").get<std::int64_t>()};
    c.oracle_price = Price{j.value("oracle_price", c.reserve_price.value())};
}

inline void from_json(const nlohmann::json& j, PaperUserConfig& c) {
    c.authority = j.at("authority").get<std::string>();
    c.user_account = j.at("user_account").get<std::string>();
    c.user_stats = j.at("user_stats").get<std::string>();
    if (j.contains("referrer")) {
        const auto& referrer = j.at("referrer");
        c.referrer = ReferrerInfo{.referrer = referrer.at("referrer").get<std::string>(),
                                  .referrer_stats =
                                      referrer.at("referrer_stats").get<std::string>()};
    }
    if (j.contains("orders")) {
        for (const auto& order : j.at("orders")) {
            c.orders.push_back(order.get<Order>());
        }
    }
}

inline void from_json(const nlohmann::json& j, PaperLedgerConfig& c) {
    if (j.contains("fee_payer")) c.fee_payer = j.at("fee_payer").get<std::string>();
    if (j.contains("program_id")) c.program_id = j.at("program_id").get<std::string>();
    if (j.contains("endpoint")) c.endpoint = j.at("endpoint").get<std::string>();
    if (j.contains("unconfirmed_fetches")) {
        c.unconfirmed_fetches = j.at("unconfirmed_fetches").get<std::uint32_t>();
    }
}

inline void from_json(const nlohmann::json& j, PaperConfig& c) {
    if (j.contains("run_duration_ms")) c.run_duration = detail::millis_at(j, "run_duration_ms");
    if (j.contains("slot_duration_ms")) {
        c.slot_duration = detail::millis_at(j, "slot_duration_ms");
    }
    if (j.contains("max_auction_duration")) {
        c.max_auction_duration = j.at("max_auction_duration").get<std::uint8_t>();
    }
    if (j.contains("oracle_staleness_slots")) {
        c.oracle_staleness_slots = j.at("oracle_staleness_slots").get<std::uint64_t>();
    }
    if (j.contains("ledger")) c.ledger = j.at("ledger").get<PaperLedgerConfig>();
    if (j.contains("markets")) {
        for (const auto& market : j.at("markets")) {
            c.markets.push_back(market.get<PaperMarketConfig>());
        }
    }
    if (j.contains("users")) {
        for (const auto& user : j.at("users")) {
            c.users.push_back(user.get<PaperUserConfig>());
        }
    }
}

inline void from_json(const nlohmann::json& j, AppConfig& c) {
    if (j.contains("filler")) c.filler = j.at("filler").get<FillerConfig>();
    if (j.contains("logging")) c.logging = j.at("logging").get<LoggingConfig>();
    if (j.contains("output_dir")) c.output_dir = j.at("output_dir").get<std::string>();
    if (j.contains("paper")) c.paper = j.at("paper").get<PaperConfig>();
}

inline AppConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }

    AppConfig config = j.get<AppConfig>();
    validate(config.filler);
    return config;
}
