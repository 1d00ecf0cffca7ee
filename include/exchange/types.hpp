#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "utils/types.hpp"

// Base58 account address
using PublicKey = std::string;

enum class PositionDirection : std::uint8_t { LONG = 0, SHORT };

enum class OrderType : std::uint8_t { MARKET = 0, LIMIT, TRIGGER_MARKET, TRIGGER_LIMIT };

struct Order {
    OrderID order_id;
    MarketIndex market_index;
    PositionDirection direction{PositionDirection::LONG};
    OrderType type{OrderType::LIMIT};
    Price price;                       // 0 = no limit
    Quantity base_asset_amount;
    Quantity base_asset_amount_filled;
    Slot slot;                         // slot the order was placed in
    std::uint8_t auction_duration{0};  // slots
};

/**
 * One resting order inside an order-book snapshot. Nodes without a user account
 * represent the vAMM side of a market and can never be filled by us.
 */
struct OrderNode {
    Order order;
    std::optional<PublicKey> user_account;
    bool have_filled{false};

    [[nodiscard]] bool is_vamm_node() const { return !user_account.has_value(); }
};

/**
 * A taker node judged matchable by the order book, optionally paired with a
 * maker. Without a maker the fill goes against the vAMM.
 */
struct FillCandidate {
    std::shared_ptr<OrderNode> node;
    std::shared_ptr<OrderNode> maker_node;

    [[nodiscard]] MarketIndex market_index() const { return node->order.market_index; }
    [[nodiscard]] OrderID order_id() const { return node->order.order_id; }
};

struct OraclePriceData {
    Price price;
    Slot slot;
    std::uint64_t confidence{0};
    bool has_sufficient_number_of_data_points{true};
};

struct MarketAccount {
    MarketIndex market_index;
    Price reserve_price;
    Price half_spread;
};

struct UserAccount {
    PublicKey user_account;
    PublicKey authority;
    std::vector<Order> orders;
};

struct ReferrerInfo {
    PublicKey referrer;
    PublicKey referrer_stats;
};

struct UserStats {
    PublicKey authority;
    PublicKey user_stats;
    std::optional<ReferrerInfo> referrer;
};

struct MakerInfo {
    PublicKey maker;
    PublicKey maker_stats;
    Order order;
};

// Everything besides the candidate itself needed to build a fill instruction
struct FillMetadata {
    std::optional<MakerInfo> maker_info;
    UserAccount taker;
    PublicKey taker_stats;
    std::optional<ReferrerInfo> referrer_info;
};

// Order placement as reported by the venue's event stream
struct OrderRecord {
    Timestamp ts;
    PublicKey user_account;
    PublicKey authority;
    Order order;
};

struct AccountMeta {
    PublicKey pubkey;
    bool is_signer{false};
    bool is_writable{false};
};

struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> keys;
    std::vector<std::uint8_t> data;
};

struct Transaction {
    PublicKey fee_payer;
    std::vector<Instruction> instructions;
};

/**
 * Confirmed transaction as returned by the ledger. A log line can be missing,
 * which the ledger reports as null.
 */
struct OutcomeRecord {
    std::string signature;
    Slot slot;
    std::vector<std::optional<std::string>> log_messages;
};

[[nodiscard]] constexpr const char* direction_to_string(PositionDirection direction) {
    switch (direction) {
        case PositionDirection::LONG: return "LONG";
        case PositionDirection::SHORT: return "SHORT";
    }
    return "UNKNOWN";
}
