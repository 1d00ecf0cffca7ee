#pragma once

#include "exchange/collaborators.hpp"
#include "filler/concurrency_gate.hpp"
#include "filler/throttle_registry.hpp"
#include "time/clock.hpp"

#include <chrono>
#include <string>
#include <vector>

/**
 * Builds the fillable set for one cycle: asks the order book for crossing nodes
 * in every market, then drops what we must not or cannot fill right now.
 */
class CandidateSelector {
public:
    CandidateSelector(MarketData& market_data, ThrottleRegistry& throttle, Clock& clock,
                      std::chrono::milliseconds backoff, std::string name)
        : market_data_(market_data), throttle_(throttle), clock_(clock),
          backoff_(backoff), name_(std::move(name)) {}

    // Raw crossing nodes across all markets, in market order. Each book query
    // runs under the snapshot gate.
    [[nodiscard]] std::vector<FillCandidate> collect(OrderBook& book, SnapshotGate& gate);

    [[nodiscard]] std::vector<FillCandidate>
    find_fillable_nodes_for_market(const MarketAccount& market, OrderBook& book,
                                   SnapshotGate& gate);

    // Filter applied in order: vAMM node, already filled, throttled, and for
    // maker-less nodes whether the vAMM can take the fill now.
    [[nodiscard]] bool is_fillable(const FillCandidate& candidate);

    [[nodiscard]] std::vector<FillCandidate> select(OrderBook& book, SnapshotGate& gate);

private:
    MarketData& market_data_;
    ThrottleRegistry& throttle_;
    Clock& clock_;
    std::chrono::milliseconds backoff_;
    std::string name_;
};
