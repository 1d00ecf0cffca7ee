#include "exchange/resident_order_book.hpp"

#include <algorithm>

namespace {

// Newer order takes; slot first, then arrival in the snapshot.
bool is_newer(const OrderNode& a, std::uint64_t a_seq, const OrderNode& b,
              std::uint64_t b_seq) {
    if (a.order.slot != b.order.slot) {
        return a.order.slot > b.order.slot;
    }
    return a_seq > b_seq;
}

} // namespace

void ResidentOrderBook::insert(const Order& order, const PublicKey& user_account) {
    auto node = std::make_shared<OrderNode>(OrderNode{
        .order = order,
        .user_account = user_account,
        .have_filled = !order.base_asset_amount_filled.is_zero() &&
                       order.base_asset_amount_filled >= order.base_asset_amount});

    std::string key = key_(user_account, order.order_id);
    if (registry_.contains(key)) {
        return;
    }

    MarketBook& book = markets_[order.market_index];
    RestingNode resting{.node = std::move(node), .sequence = sequence_++};
    bool is_market_order = order.price.is_zero();

    if (is_market_order) {
        book.market_orders.push_back(std::move(resting));
    } else if (order.direction == PositionDirection::LONG) {
        book.bids[order.price].push_back(std::move(resting));
    } else {
        book.asks[order.price].push_back(std::move(resting));
    }

    registry_.emplace(std::move(key), Location{.market = order.market_index,
                                               .direction = order.direction,
                                               .price = order.price,
                                               .is_market_order = is_market_order});
}

std::shared_ptr<OrderNode> ResidentOrderBook::find(const PublicKey& user_account,
                                                   OrderID order_id) const {
    std::string key = key_(user_account, order_id);
    auto it = registry_.find(key);
    if (it == registry_.end()) {
        return nullptr;
    }

    const Location& loc = it->second;
    const MarketBook& book = markets_.at(loc.market);
    const Level* level = nullptr;
    if (loc.is_market_order) {
        level = &book.market_orders;
    } else if (loc.direction == PositionDirection::LONG) {
        auto level_it = book.bids.find(loc.price);
        level = level_it == book.bids.end() ? nullptr : &level_it->second;
    } else {
        auto level_it = book.asks.find(loc.price);
        level = level_it == book.asks.end() ? nullptr : &level_it->second;
    }

    if (level == nullptr) {
        return nullptr;
    }
    for (const auto& resting : *level) {
        if (resting.node->order.order_id == order_id &&
            resting.node->user_account == user_account) {
            return resting.node;
        }
    }
    return nullptr;
}

std::vector<FillCandidate>
ResidentOrderBook::find_nodes_to_fill(MarketIndex market, Price vamm_bid, Price vamm_ask,
                                      [[maybe_unused]] Slot slot,
                                      const std::optional<OraclePriceData>& oracle) {
    std::vector<FillCandidate> candidates;
    auto book_it = markets_.find(market);
    if (book_it == markets_.end()) {
        return candidates;
    }
    MarketBook& book = book_it->second;

    std::unordered_set<const OrderNode*> used;

    // limit vs limit: walk bids best-first and pair each with the best
    // crossing ask of another user
    for (auto& [bid_price, bid_level] : book.bids) {
        for (auto& bid : bid_level) {
            if (used.contains(bid.node.get()) || bid.node->have_filled) {
                continue;
            }

            for (auto& [ask_price, ask_level] : book.asks) {
                if (ask_price > bid_price) {
                    break;
                }

                auto ask = std::ranges::find_if(ask_level, [&](const RestingNode& r) {
                    return !used.contains(r.node.get()) && !r.node->have_filled &&
                           r.node->user_account != bid.node->user_account;
                });
                if (ask == ask_level.end()) {
                    continue;
                }

                bool bid_takes = is_newer(*bid.node, bid.sequence, *ask->node, ask->sequence);
                candidates.push_back(
                    FillCandidate{.node = bid_takes ? bid.node : ask->node,
                                  .maker_node = bid_takes ? ask->node : bid.node});
                used.insert(bid.node.get());
                used.insert(ask->node.get());
                break;
            }
        }
    }

    // against the vAMM
    for (auto& [bid_price, bid_level] : book.bids) {
        if (bid_price < vamm_ask) {
            break;
        }
        for (auto& bid : bid_level) {
            if (used.insert(bid.node.get()).second) {
                candidates.push_back(FillCandidate{.node = bid.node, .maker_node = nullptr});
            }
        }
    }

    for (auto& [ask_price, ask_level] : book.asks) {
        if (ask_price > vamm_bid) {
            break;
        }
        for (auto& ask : ask_level) {
            if (used.insert(ask.node.get()).second) {
                candidates.push_back(FillCandidate{.node = ask.node, .maker_node = nullptr});
            }
        }
    }

    // market orders need a trustworthy oracle to be priced
    if (oracle) {
        for (auto& resting : book.market_orders) {
            if (used.insert(resting.node.get()).second) {
                candidates.push_back(
                    FillCandidate{.node = resting.node, .maker_node = nullptr});
            }
        }
    }

    return candidates;
}

bool ResidentOrderBook::remove(const Order& order, const PublicKey& user_account,
                               const std::function<void()>& on_removed) {
    std::string key = key_(user_account, order.order_id);
    auto it = registry_.find(key);
    if (it == registry_.end()) {
        return false;
    }

    const Location loc = it->second;
    auto book_it = markets_.find(loc.market);
    if (book_it == markets_.end()) {
        return false;
    }
    MarketBook& book = book_it->second;

    bool removed = false;
    if (loc.is_market_order) {
        removed = remove_from_queue_(book.market_orders, key);
    } else if (loc.direction == PositionDirection::LONG) {
        removed = remove_from_level_(book.bids, loc.price, key);
    } else {
        removed = remove_from_level_(book.asks, loc.price, key);
    }

    if (!removed) {
        return false;
    }

    registry_.erase(it);
    if (on_removed) {
        on_removed();
    }
    return true;
}

bool ResidentOrderBook::remove_from_queue_(Level& level, const std::string& key) {
    for (auto it = level.begin(); it != level.end(); ++it) {
        const OrderNode& node = *it->node;
        if (node.user_account && key_(*node.user_account, node.order.order_id) == key) {
            level.erase(it);
            return true;
        }
    }
    return false;
}

template <typename Book>
bool ResidentOrderBook::remove_from_level_(Book& book, Price price, const std::string& key) {
    auto it = book.find(price);
    if (it == book.end()) {
        return false;
    }

    if (!remove_from_queue_(it->second, key)) {
        return false;
    }

    if (it->second.empty()) {
        book.erase(it);
    }
    return true;
}

std::unique_ptr<OrderBook>
ResidentOrderBookBuilder::build(const std::vector<MarketAccount>& markets,
                                AccountDirectory& accounts) {
    auto book = std::make_unique<ResidentOrderBook>();

    for (const auto& user : accounts.users()) {
        for (const auto& order : user.orders) {
            bool known = std::ranges::any_of(markets, [&](const MarketAccount& m) {
                return m.market_index == order.market_index;
            });
            if (known) {
                book->insert(order, user.user_account);
            }
        }
    }

    return book;
}
