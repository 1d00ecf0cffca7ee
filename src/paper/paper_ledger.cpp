#include "paper/paper_ledger.hpp"
#include "filler/batch_packer.hpp"
#include "filler/errors.hpp"
#include "filler/outcome_reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>

namespace {

constexpr std::size_t FILL_DATA_SIZE = 16;          // discriminator + taker order id
constexpr std::size_t FILL_WITH_MAKER_DATA_SIZE = 24;
constexpr std::size_t FILL_BASE_KEYS = 4;

void append_u64_le(std::vector<std::uint8_t>& out, std::uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
    }
}

std::uint64_t read_u64_le(const std::vector<std::uint8_t>& data, std::size_t offset) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>(data[offset + i]) << (8 * i);
    }
    return value;
}

Quantity open_amount(const Order& order) {
    return order.base_asset_amount_filled < order.base_asset_amount
               ? order.base_asset_amount - order.base_asset_amount_filled
               : Quantity{0};
}

} // namespace

PaperLedger::PaperLedger(PaperLedgerConfig config, PaperAccountDirectory& accounts,
                         PaperMarketData& market_data, Clock& clock)
    : config_(std::move(config)), accounts_(accounts), market_data_(market_data),
      clock_(clock) {}

Instruction PaperLedger::build_fill_instruction(const FillCandidate& candidate,
                                                const FillMetadata& metadata) {
    Instruction ix{.program_id = config_.program_id, .keys = {}, .data = {}};

    ix.keys.push_back(AccountMeta{.pubkey = PAPER_STATE_ACCOUNT});
    ix.keys.push_back(
        AccountMeta{.pubkey = config_.fee_payer, .is_signer = true, .is_writable = true});
    ix.keys.push_back(AccountMeta{.pubkey = metadata.taker.user_account, .is_writable = true});
    ix.keys.push_back(AccountMeta{.pubkey = metadata.taker_stats, .is_writable = true});
    if (metadata.maker_info) {
        ix.keys.push_back(AccountMeta{.pubkey = metadata.maker_info->maker, .is_writable = true});
        ix.keys.push_back(
            AccountMeta{.pubkey = metadata.maker_info->maker_stats, .is_writable = true});
    }
    if (metadata.referrer_info) {
        ix.keys.push_back(
            AccountMeta{.pubkey = metadata.referrer_info->referrer, .is_writable = true});
        ix.keys.push_back(
            AccountMeta{.pubkey = metadata.referrer_info->referrer_stats, .is_writable = true});
    }

    ix.data.assign(FILL_ORDER_DISCRIMINATOR.begin(), FILL_ORDER_DISCRIMINATOR.end());
    append_u64_le(ix.data, candidate.order_id().value());
    if (metadata.maker_info) {
        append_u64_le(ix.data, metadata.maker_info->order.order_id.value());
    }
    return ix;
}

DecodedFill PaperLedger::decode_fill(const Instruction& ix) const {
    if (ix.program_id != config_.program_id) {
        throw TransportError("unknown program " + ix.program_id);
    }
    if ((ix.data.size() != FILL_DATA_SIZE && ix.data.size() != FILL_WITH_MAKER_DATA_SIZE) ||
        !std::equal(FILL_ORDER_DISCRIMINATOR.begin(), FILL_ORDER_DISCRIMINATOR.end(),
                    ix.data.begin())) {
        throw TransportError("invalid instruction data");
    }

    bool has_maker = ix.data.size() == FILL_WITH_MAKER_DATA_SIZE;
    if (ix.keys.size() < FILL_BASE_KEYS + (has_maker ? 2 : 0)) {
        throw TransportError("not enough account keys");
    }

    DecodedFill fill{.taker = ix.keys[2].pubkey,
                     .taker_order_id = OrderID{static_cast<std::uint32_t>(read_u64_le(ix.data, 8))},
                     .maker = std::nullopt,
                     .maker_order_id = std::nullopt};
    if (has_maker) {
        fill.maker = ix.keys[4].pubkey;
        fill.maker_order_id = OrderID{static_cast<std::uint32_t>(read_u64_le(ix.data, 16))};
    }
    return fill;
}

std::string PaperLedger::submit(const Transaction& transaction) {
    std::lock_guard lock(mutex_);

    std::vector<std::pair<std::size_t, DecodedFill>> fills;
    bool has_compute_budget = false;
    for (std::size_t i = 0; i < transaction.instructions.size(); ++i) {
        const Instruction& ix = transaction.instructions[i];
        if (ix.program_id == COMPUTE_BUDGET_PROGRAM_ID) {
            has_compute_budget = true;
            continue;
        }
        fills.emplace_back(i, decode_fill(ix));
    }

    if (fills.empty()) {
        throw TransportError("transaction has no fill instructions");
    }

    if (fills.size() == 1) {
        const auto& [ix_index, fill] = fills.front();
        auto order = accounts_.find_order(fill.taker, fill.taker_order_id);
        if (!order || open_amount(*order).is_zero()) {
            throw StaleOrderError(
                std::format("Transaction simulation failed: Error processing Instruction {}: "
                            "custom program error: {:#x}",
                            ix_index, ORDER_DOES_NOT_EXIST_CODE),
                ORDER_DOES_NOT_EXIST_CODE, stale_preflight_logs_());
        }
    }

    std::string signature = std::format("paper{:010}{:06}", clock_.now().value(), ++tx_counter_);

    OutcomeRecord record{.signature = signature,
                         .slot = market_data_.current_slot(),
                         .log_messages = {}};
    if (has_compute_budget) {
        record.log_messages.emplace_back(
            std::format("Program {} invoke [1]", COMPUTE_BUDGET_PROGRAM_ID));
        record.log_messages.emplace_back(
            std::format("Program {} success", COMPUTE_BUDGET_PROGRAM_ID));
    }
    for (const auto& [ix_index, fill] : fills) {
        record.log_messages.emplace_back(std::format("Program {} invoke [1]", config_.program_id));
        record.log_messages.emplace_back(FILL_ORDER_LOG_MARKER);
        record.log_messages.emplace_back(execute_fill_(fill));
        record.log_messages.emplace_back(std::format("Program {} success", config_.program_id));
    }

    spdlog::debug("paper ledger accepted {} with {} fills", signature, fills.size());
    outcomes_.emplace(signature, StoredOutcome{.record = std::move(record), .fetches = 0});
    return signature;
}

std::optional<OutcomeRecord> PaperLedger::fetch_outcome(const std::string& signature) {
    std::lock_guard lock(mutex_);
    auto it = outcomes_.find(signature);
    if (it == outcomes_.end()) {
        return std::nullopt;
    }
    if (it->second.fetches < config_.unconfirmed_fetches) {
        ++it->second.fetches;
        return std::nullopt;
    }
    OutcomeRecord record = std::move(it->second.record);
    outcomes_.erase(it);
    return record;
}

std::size_t PaperLedger::transaction_count() const {
    std::lock_guard lock(mutex_);
    return tx_counter_;
}

std::size_t PaperLedger::pending_outcomes() const {
    std::lock_guard lock(mutex_);
    return outcomes_.size();
}

std::string PaperLedger::execute_fill_(const DecodedFill& fill) {
    auto taker = accounts_.find_order(fill.taker, fill.taker_order_id);
    if (!taker || open_amount(*taker).is_zero()) {
        return std::string("Program log: ") + STALE_ORDER_LOG;
    }

    Quantity taker_open = open_amount(*taker);

    if (fill.maker && fill.maker_order_id) {
        auto maker = accounts_.find_order(*fill.maker, *fill.maker_order_id);
        if (maker && !open_amount(*maker).is_zero()) {
            Quantity amount = std::min(taker_open, open_amount(*maker));
            Price price = maker->price;
            static_cast<void>(accounts_.apply_fill(fill.taker, fill.taker_order_id, amount));
            static_cast<void>(accounts_.apply_fill(*fill.maker, *fill.maker_order_id, amount));
            return std::format("Program data: fill market={} taker={}-{} maker={}-{} base={} "
                               "price={}",
                               taker->market_index.value(), fill.taker,
                               fill.taker_order_id.value(), *fill.maker,
                               fill.maker_order_id->value(), amount.value(), price.value());
        }
        // maker gone: the fill falls through to the vAMM
    }

    auto markets = market_data_.markets();
    auto market = std::ranges::find_if(markets, [&](const MarketAccount& m) {
        return m.market_index == taker->market_index;
    });
    if (market == markets.end()) {
        return std::string("Program log: ") + AMM_CANNOT_FULFILL_LOG;
    }

    OraclePriceData oracle = market_data_.oracle_price(market->market_index);
    if (!market_data_.is_fillable_by_vamm(*taker, *market, oracle,
                                          market_data_.current_slot())) {
        return std::string("Program log: ") + AMM_CANNOT_FULFILL_LOG;
    }

    Price price = taker->direction == PositionDirection::LONG
                      ? market_data_.best_ask(*market, oracle)
                      : market_data_.best_bid(*market, oracle);
    Quantity amount = accounts_.apply_fill(fill.taker, fill.taker_order_id, taker_open);
    return std::format("Program data: fill market={} taker={}-{} maker=vamm base={} price={}",
                       taker->market_index.value(), fill.taker, fill.taker_order_id.value(),
                       amount.value(), price.value());
}

std::vector<std::string> PaperLedger::stale_preflight_logs_() const {
    return {std::format("Program {} invoke [1]", config_.program_id),
            FILL_ORDER_LOG_MARKER,
            std::string("Program log: ") + STALE_ORDER_LOG,
            std::format("Program {} failed: custom program error: {:#x}", config_.program_id,
                        ORDER_DOES_NOT_EXIST_CODE)};
}
