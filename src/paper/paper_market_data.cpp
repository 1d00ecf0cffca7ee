#include "paper/paper_market_data.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

PaperMarketData::PaperMarketData(const PaperConfig& config, Clock& clock)
    : clock_(clock), slot_duration_(config.slot_duration),
      max_auction_duration_(config.max_auction_duration),
      oracle_staleness_slots_(config.oracle_staleness_slots) {
    if (slot_duration_.count() <= 0) {
        throw std::invalid_argument("paper.slot_duration_ms must be positive");
    }

    Slot now = current_slot();
    for (const auto& m : config.markets) {
        markets_.push_back(MarketAccount{.market_index = m.market_index,
                                         .reserve_price = m.reserve_price,
                                         .half_spread = m.half_spread});
        oracles_[m.market_index] = OracleState{.price = m.oracle_price, .slot = now};
    }
}

std::vector<MarketAccount> PaperMarketData::markets() const {
    std::lock_guard lock(mutex_);
    return markets_;
}

MarketAccount PaperMarketData::market(MarketIndex index) const {
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find_if(
        markets_, [&](const MarketAccount& m) { return m.market_index == index; });
    if (it == markets_.end()) {
        throw std::out_of_range("unknown market " + std::to_string(index.value()));
    }
    return *it;
}

OraclePriceData PaperMarketData::oracle_price(MarketIndex market) const {
    std::lock_guard lock(mutex_);
    auto it = oracles_.find(market);
    if (it == oracles_.end()) {
        return OraclePriceData{.price = Price{0},
                               .slot = Slot{0},
                               .confidence = 0,
                               .has_sufficient_number_of_data_points = false};
    }
    return OraclePriceData{.price = it->second.price,
                           .slot = it->second.slot,
                           .confidence = 0,
                           .has_sufficient_number_of_data_points = true};
}

bool PaperMarketData::is_oracle_valid([[maybe_unused]] const MarketAccount& market,
                                      const OraclePriceData& oracle, Slot slot) const {
    if (!oracle.has_sufficient_number_of_data_points || oracle.price <= 0) {
        return false;
    }
    if (slot < oracle.slot) {
        return true;
    }
    return (slot - oracle.slot).value() <= oracle_staleness_slots_;
}

Price PaperMarketData::best_bid(const MarketAccount& market,
                                [[maybe_unused]] const OraclePriceData& oracle) const {
    return market.reserve_price - market.half_spread;
}

Price PaperMarketData::best_ask(const MarketAccount& market,
                                [[maybe_unused]] const OraclePriceData& oracle) const {
    return market.reserve_price + market.half_spread;
}

bool PaperMarketData::is_fillable_by_vamm(const Order& order, const MarketAccount& market,
                                          const OraclePriceData& oracle, Slot slot) const {
    std::uint64_t auction =
        std::min<std::uint64_t>(order.auction_duration, max_auction_duration_);
    std::uint64_t elapsed = slot > order.slot ? (slot - order.slot).value() : 0;
    if (elapsed < auction) {
        return false;
    }

    if (order.price.is_zero()) {
        return true;
    }

    if (order.direction == PositionDirection::LONG) {
        return order.price >= best_ask(market, oracle);
    }
    return order.price <= best_bid(market, oracle);
}

Slot PaperMarketData::current_slot() const {
    return Slot{clock_.now().value() / static_cast<std::uint64_t>(slot_duration_.count())};
}

void PaperMarketData::publish_oracle_price(MarketIndex market, Price price) {
    Slot now = current_slot();
    std::lock_guard lock(mutex_);
    oracles_[market] = OracleState{.price = price, .slot = now};
}

void PaperMarketData::set_reserve_price(MarketIndex market, Price price) {
    std::lock_guard lock(mutex_);
    for (auto& m : markets_) {
        if (m.market_index == market) {
            m.reserve_price = price;
            return;
        }
    }
    throw std::out_of_range("unknown market " + std::to_string(market.value()));
}
