#pragma once

#include "exchange/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Snapshot of all resting orders, rebuilt every fill cycle.
 *
 * Not thread-safe: the filler serializes every call through its snapshot gate.
 */
class OrderBook {
public:
    virtual ~OrderBook() = default;

    [[nodiscard]] virtual std::vector<FillCandidate>
    find_nodes_to_fill(MarketIndex market, Price vamm_bid, Price vamm_ask, Slot slot,
                       const std::optional<OraclePriceData>& oracle) = 0;

    // Invokes on_removed only if the order was present.
    virtual bool remove(const Order& order, const PublicKey& user_account,
                        const std::function<void()>& on_removed) = 0;

    [[nodiscard]] virtual std::size_t size() const = 0;
};

class AccountDirectory;

class OrderBookBuilder {
public:
    virtual ~OrderBookBuilder() = default;

    [[nodiscard]] virtual std::unique_ptr<OrderBook>
    build(const std::vector<MarketAccount>& markets, AccountDirectory& accounts) = 0;
};

/**
 * Prices, oracle state and the venue's clock.
 */
class MarketData {
public:
    virtual ~MarketData() = default;

    [[nodiscard]] virtual std::vector<MarketAccount> markets() const = 0;
    [[nodiscard]] virtual OraclePriceData oracle_price(MarketIndex market) const = 0;
    [[nodiscard]] virtual bool is_oracle_valid(const MarketAccount& market,
                                               const OraclePriceData& oracle,
                                               Slot slot) const = 0;
    [[nodiscard]] virtual Price best_bid(const MarketAccount& market,
                                         const OraclePriceData& oracle) const = 0;
    [[nodiscard]] virtual Price best_ask(const MarketAccount& market,
                                         const OraclePriceData& oracle) const = 0;
    [[nodiscard]] virtual bool is_fillable_by_vamm(const Order& order,
                                                   const MarketAccount& market,
                                                   const OraclePriceData& oracle,
                                                   Slot slot) const = 0;
    [[nodiscard]] virtual Slot current_slot() const = 0;
};

/**
 * User accounts and user stats, keyed by account and by authority respectively.
 * must_get_* throw when the account cannot be resolved.
 */
class AccountDirectory {
public:
    virtual ~AccountDirectory() = default;

    virtual void fetch_all() = 0;
    [[nodiscard]] virtual UserAccount must_get_user(const PublicKey& user_account) = 0;
    [[nodiscard]] virtual UserStats must_get_user_stats(const PublicKey& authority) = 0;
    virtual void update_with_order(const OrderRecord& record) = 0;
    virtual void ensure_authority(const PublicKey& authority) = 0;
    [[nodiscard]] virtual std::vector<UserAccount> users() const = 0;
};

/**
 * Builds fill instructions and talks to the ledger.
 *
 * submit() throws TransportError (or StaleOrderError) when the ledger rejects
 * the transaction. fetch_outcome() returns nullopt while the transaction is not
 * yet confirmed.
 */
class ExecutionClient {
public:
    virtual ~ExecutionClient() = default;

    [[nodiscard]] virtual PublicKey fee_payer() const = 0;
    [[nodiscard]] virtual std::string endpoint() const = 0;

    [[nodiscard]] virtual Instruction build_fill_instruction(const FillCandidate& candidate,
                                                             const FillMetadata& metadata) = 0;

    virtual std::string submit(const Transaction& transaction) = 0;

    [[nodiscard]] virtual std::optional<OutcomeRecord>
    fetch_outcome(const std::string& signature) = 0;
};
