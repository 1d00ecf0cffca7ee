#pragma once

#include "exchange/collaborators.hpp"
#include "exchange/types.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <ranges>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * In-memory snapshot of every open user order, kept as per-market price
 * levels: bids best-first (descending), asks best-first (ascending), FIFO
 * within a level. Orders without a limit price do not rest on a level; they
 * wait in a separate per-market queue and can only go against the vAMM.
 *
 * find_nodes_to_fill() reports two kinds of crossing:
 * - a bid and an ask of different users whose limits cross; the newer order is
 *   the taker, the resting one the maker
 * - an order whose limit crosses the vAMM quote, or a market order while the
 *   oracle is valid; no maker
 *
 * A node appears in at most one candidate per call.
 */
class ResidentOrderBook : public OrderBook {
public:
    ResidentOrderBook() = default;

    // Adds an order. Fully filled orders are kept but flagged have_filled.
    void insert(const Order& order, const PublicKey& user_account);

    [[nodiscard]] std::vector<FillCandidate>
    find_nodes_to_fill(MarketIndex market, Price vamm_bid, Price vamm_ask, Slot slot,
                       const std::optional<OraclePriceData>& oracle) override;

    bool remove(const Order& order, const PublicKey& user_account,
                const std::function<void()>& on_removed) override;

    [[nodiscard]] std::size_t size() const override { return registry_.size(); }

    [[nodiscard]] std::shared_ptr<OrderNode> find(const PublicKey& user_account,
                                                  OrderID order_id) const;

    template <PositionDirection Side>
    [[nodiscard]] std::vector<std::pair<Price, Quantity>> get_snapshot(MarketIndex market) const {
        auto it = markets_.find(market);
        if (it == markets_.end()) {
            return {};
        }
        if constexpr (Side == PositionDirection::LONG) {
            return make_snapshot(it->second.bids);
        } else {
            return make_snapshot(it->second.asks);
        }
    }

    void print_order_book(MarketIndex market, std::size_t depth = 10) const {
        auto bids = get_snapshot<PositionDirection::LONG>(market);
        auto asks = get_snapshot<PositionDirection::SHORT>(market);

        std::cout << "=========== ORDER BOOK (market " << market << ") ===========\n";
        std::cout << "   BID (Qty @ Price) |   ASK (Qty @ Price)\n";
        std::cout << "---------------------+---------------------\n";

        auto bid_it = bids.begin();
        auto ask_it = asks.begin();

        for (std::size_t i = 0; i < depth && (bid_it != bids.end() || ask_it != asks.end());
             ++i) {
            std::string bid_str = (bid_it != bids.end())
                                      ? (std::to_string(bid_it->second.value()) + " @ " +
                                         std::to_string(bid_it->first.value()))
                                      : "";
            std::string ask_str = (ask_it != asks.end())
                                      ? (std::to_string(ask_it->second.value()) + " @ " +
                                         std::to_string(ask_it->first.value()))
                                      : "";

            std::cout << std::setw(20) << bid_str << " | " << ask_str << "\n";

            if (bid_it != bids.end()) ++bid_it;
            if (ask_it != asks.end()) ++ask_it;
        }

        std::cout << std::flush;
    }

private:
    struct RestingNode {
        std::shared_ptr<OrderNode> node;
        std::uint64_t sequence;   // insertion order, breaks slot ties
    };

    using Level = std::deque<RestingNode>;

    struct MarketBook {
        std::map<Price, Level, std::greater<>> bids;
        std::map<Price, Level> asks;
        Level market_orders;
    };

    struct Location {
        MarketIndex market;
        PositionDirection direction;
        Price price;
        bool is_market_order;
    };

    std::unordered_map<MarketIndex, MarketBook, strong_hash<MarketIndex>> markets_;
    std::unordered_map<std::string, Location> registry_;
    std::uint64_t sequence_{0};

    static std::string key_(const PublicKey& user_account, OrderID order_id) {
        return user_account + "-" + std::to_string(order_id.value());
    }

    template <typename Book> static bool remove_from_level_(Book& book, Price price,
                                                            const std::string& key);
    static bool remove_from_queue_(Level& level, const std::string& key);

    static std::vector<std::pair<Price, Quantity>> make_snapshot(const auto& book) {
        std::vector<std::pair<Price, Quantity>> snapshot;
        snapshot.reserve(book.size());

        for (const auto& [price, level] : book) {
            auto open = level | std::views::transform([](const RestingNode& r) {
                            const Order& o = r.node->order;
                            return o.base_asset_amount_filled < o.base_asset_amount
                                       ? o.base_asset_amount - o.base_asset_amount_filled
                                       : Quantity{0};
                        });

            Quantity total = std::ranges::fold_left(open, Quantity{0},
                                                    [](Quantity acc, Quantity q) {
                                                        return acc + q;
                                                    });

            if (!total.is_zero()) {
                snapshot.emplace_back(price, total);
            }
        }

        return snapshot;
    }
};

/**
 * Rebuilds a ResidentOrderBook from the open orders of every user in the
 * directory. Orders on markets not in `markets` are skipped.
 */
class ResidentOrderBookBuilder : public OrderBookBuilder {
public:
    [[nodiscard]] std::unique_ptr<OrderBook> build(const std::vector<MarketAccount>& markets,
                                                   AccountDirectory& accounts) override;
};
