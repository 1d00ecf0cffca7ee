#pragma once

#include "exchange/collaborators.hpp"
#include "filler/throttle_registry.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace testing {

/**
 * State shared by every StubOrderBook a StubOrderBookBuilder hands out, so a
 * test can observe removals across snapshot rebuilds and park a removal while
 * it holds the snapshot lock.
 */
struct StubBookState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> removed;                         // candidate signatures
    std::vector<std::optional<OraclePriceData>> oracles_seen;  // one per query
    bool hold_removals{false};
    bool removing{false};
};

/**
 * Order book that returns a fixed list of candidates for their market.
 */
class StubOrderBook : public OrderBook {
public:
    StubOrderBook(std::vector<FillCandidate> candidates, std::shared_ptr<StubBookState> state)
        : candidates_(std::move(candidates)), state_(std::move(state)) {}

    std::vector<FillCandidate>
    find_nodes_to_fill(MarketIndex market, Price, Price, Slot,
                       const std::optional<OraclePriceData>& oracle) override {
        {
            std::lock_guard lock(state_->mutex);
            state_->oracles_seen.push_back(oracle);
        }
        std::vector<FillCandidate> out;
        std::ranges::copy_if(candidates_, std::back_inserter(out),
                             [&](const FillCandidate& c) { return c.market_index() == market; });
        return out;
    }

    bool remove(const Order& order, const PublicKey& user_account,
                const std::function<void()>& on_removed) override {
        {
            std::unique_lock lock(state_->mutex);
            state_->removing = true;
            state_->cv.notify_all();
            state_->cv.wait(lock, [this] { return !state_->hold_removals; });
            state_->removing = false;
        }

        auto it = std::ranges::find_if(candidates_, [&](const FillCandidate& c) {
            return c.node && c.node->user_account == user_account &&
                   c.node->order.order_id == order.order_id;
        });
        if (it == candidates_.end()) {
            return false;
        }

        {
            std::lock_guard lock(state_->mutex);
            state_->removed.push_back(candidate_signature(*it));
        }
        candidates_.erase(it);
        if (on_removed) {
            on_removed();
        }
        return true;
    }

    std::size_t size() const override { return candidates_.size(); }

private:
    std::vector<FillCandidate> candidates_;
    std::shared_ptr<StubBookState> state_;
};

class StubOrderBookBuilder : public OrderBookBuilder {
public:
    std::unique_ptr<OrderBook> build(const std::vector<MarketAccount>&,
                                     AccountDirectory&) override {
        ++builds;
        std::lock_guard lock(candidates_mutex_);
        return std::make_unique<StubOrderBook>(candidates_, state_);
    }

    void set_candidates(std::vector<FillCandidate> candidates) {
        std::lock_guard lock(candidates_mutex_);
        candidates_ = std::move(candidates);
    }

    void hold_removals() {
        std::lock_guard lock(state_->mutex);
        state_->hold_removals = true;
    }

    void release_removals() {
        {
            std::lock_guard lock(state_->mutex);
            state_->hold_removals = false;
        }
        state_->cv.notify_all();
    }

    bool wait_until_removing(std::chrono::milliseconds timeout) {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->removing; });
    }

    std::vector<std::string> removed() const {
        std::lock_guard lock(state_->mutex);
        return state_->removed;
    }

    std::vector<std::optional<OraclePriceData>> oracles_seen() const {
        std::lock_guard lock(state_->mutex);
        return state_->oracles_seen;
    }

    std::atomic<int> builds{0};

private:
    std::mutex candidates_mutex_;
    std::vector<FillCandidate> candidates_;
    std::shared_ptr<StubBookState> state_ = std::make_shared<StubBookState>();
};

/**
 * Market data with directly settable answers.
 */
class StubMarketData : public MarketData {
public:
    std::vector<MarketAccount> market_list{
        MarketAccount{.market_index = MarketIndex{0},
                      .reserve_price = Price{100},
                      .half_spread = Price{1}}};
    std::atomic<bool> oracle_valid{true};
    std::atomic<bool> fillable_by_vamm{true};
    Slot slot{100};

    std::vector<MarketAccount> markets() const override { return market_list; }

    OraclePriceData oracle_price(MarketIndex) const override {
        return OraclePriceData{.price = Price{100}, .slot = slot};
    }

    bool is_oracle_valid(const MarketAccount&, const OraclePriceData&, Slot) const override {
        return oracle_valid;
    }

    Price best_bid(const MarketAccount& m, const OraclePriceData&) const override {
        return m.reserve_price - m.half_spread;
    }

    Price best_ask(const MarketAccount& m, const OraclePriceData&) const override {
        return m.reserve_price + m.half_spread;
    }

    bool is_fillable_by_vamm(const Order&, const MarketAccount&, const OraclePriceData&,
                             Slot) const override {
        return fillable_by_vamm;
    }

    Slot current_slot() const override { return slot; }
};

} // namespace testing
