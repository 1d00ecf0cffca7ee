#include "filler/candidate_selector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

std::vector<FillCandidate>
CandidateSelector::find_fillable_nodes_for_market(const MarketAccount& market,
                                                  OrderBook& book, SnapshotGate& gate) {
    OraclePriceData oracle = market_data_.oracle_price(market.market_index);
    Slot slot = market_data_.current_slot();
    bool oracle_is_valid = market_data_.is_oracle_valid(market, oracle, slot);

    Price vamm_ask = market_data_.best_ask(market, oracle);
    Price vamm_bid = market_data_.best_bid(market, oracle);

    return gate.run_exclusive([&] {
        return book.find_nodes_to_fill(
            market.market_index, vamm_bid, vamm_ask, market_data_.current_slot(),
            oracle_is_valid ? std::optional<OraclePriceData>{oracle} : std::nullopt);
    });
}

std::vector<FillCandidate> CandidateSelector::collect(OrderBook& book, SnapshotGate& gate) {
    std::vector<FillCandidate> nodes;
    for (const auto& market : market_data_.markets()) {
        auto market_nodes = find_fillable_nodes_for_market(market, book, gate);
        nodes.insert(nodes.end(), std::make_move_iterator(market_nodes.begin()),
                     std::make_move_iterator(market_nodes.end()));
    }
    return nodes;
}

bool CandidateSelector::is_fillable(const FillCandidate& candidate) {
    if (!candidate.node || candidate.node->is_vamm_node()) {
        return false;
    }

    if (candidate.node->have_filled) {
        return false;
    }

    std::string signature = candidate_signature(candidate);
    if (throttle_.is_throttled(signature, clock_.now(), backoff_)) {
        spdlog::debug("{} skipping throttled node {}", name_, signature);
        return false;
    }

    if (!candidate.maker_node) {
        MarketIndex market_index = candidate.market_index();
        auto markets = market_data_.markets();
        auto market = std::ranges::find_if(markets, [&](const MarketAccount& m) {
            return m.market_index == market_index;
        });
        if (market == markets.end()) {
            spdlog::warn("{} node {} references unknown market {}", name_, signature,
                         market_index.value());
            return false;
        }

        OraclePriceData oracle = market_data_.oracle_price(market_index);
        if (!market_data_.is_fillable_by_vamm(candidate.node->order, *market, oracle,
                                              market_data_.current_slot())) {
            return false;
        }
    }

    return true;
}

std::vector<FillCandidate> CandidateSelector::select(OrderBook& book, SnapshotGate& gate) {
    std::vector<FillCandidate> fillable = collect(book, gate);
    std::vector<FillCandidate> filtered;
    filtered.reserve(fillable.size());
    std::ranges::copy_if(fillable, std::back_inserter(filtered),
                         [this](const FillCandidate& c) { return is_fillable(c); });

    spdlog::debug("{} {} crossing nodes, {} fillable", name_, fillable.size(),
                  filtered.size());
    return filtered;
}
