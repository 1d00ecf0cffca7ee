#pragma once

#include "config/configs.hpp"
#include "exchange/collaborators.hpp"
#include "time/clock.hpp"

#include <chrono>
#include <mutex>
#include <unordered_map>
#include <vector>

/**
 * Market data for the paper venue.
 *
 * The vAMM quotes reserve_price -/+ half_spread. The slot advances once per
 * slot_duration of clock time. An oracle price is stamped with the slot it
 * was published in and stays valid for oracle_staleness_slots.
 */
class PaperMarketData : public MarketData {
public:
    PaperMarketData(const PaperConfig& config, Clock& clock);

    [[nodiscard]] std::vector<MarketAccount> markets() const override;
    [[nodiscard]] OraclePriceData oracle_price(MarketIndex market) const override;
    [[nodiscard]] bool is_oracle_valid(const MarketAccount& market,
                                       const OraclePriceData& oracle,
                                       Slot slot) const override;
    [[nodiscard]] Price best_bid(const MarketAccount& market,
                                 const OraclePriceData& oracle) const override;
    [[nodiscard]] Price best_ask(const MarketAccount& market,
                                 const OraclePriceData& oracle) const override;
    [[nodiscard]] bool is_fillable_by_vamm(const Order& order, const MarketAccount& market,
                                           const OraclePriceData& oracle,
                                           Slot slot) const override;
    [[nodiscard]] Slot current_slot() const override;

    [[nodiscard]] MarketAccount market(MarketIndex index) const;

    // Stamps the new price with the current slot.
    void publish_oracle_price(MarketIndex market, Price price);
    void set_reserve_price(MarketIndex market, Price price);

private:
    struct OracleState {
        Price price;
        Slot slot;
    };

    Clock& clock_;
    std::chrono::milliseconds slot_duration_;
    std::uint8_t max_auction_duration_;
    std::uint64_t oracle_staleness_slots_;

    mutable std::mutex mutex_;
    std::vector<MarketAccount> markets_;
    std::unordered_map<MarketIndex, OracleState, strong_hash<MarketIndex>> oracles_;
};
