#pragma once

#include "config/configs.hpp"
#include "exchange/collaborators.hpp"
#include "paper/paper_account_directory.hpp"
#include "paper/paper_market_data.hpp"
#include "time/clock.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

inline constexpr const char* PAPER_STATE_ACCOUNT = "5zpq7DvB6UdFFvpmBPspGPNfUGoBRRCE2HHg5u3gxcsN";

// Custom program error raised when a fill references a closed order.
inline constexpr std::uint32_t ORDER_DOES_NOT_EXIST_CODE = 6043;

// Leading 8 bytes of every fill instruction's data.
inline constexpr std::array<std::uint8_t, 8> FILL_ORDER_DISCRIMINATOR = {
    0xe8, 0x7a, 0x73, 0x19, 0xc7, 0x8f, 0x88, 0xa2};

/**
 * Decoded fill instruction. Keys are laid out as: state, filler (signer),
 * taker, taker stats, then maker and maker stats when there is a maker, then
 * referrer and referrer stats when the taker has one.
 */
struct DecodedFill {
    PublicKey taker;
    OrderID taker_order_id;
    std::optional<PublicKey> maker;
    std::optional<OrderID> maker_order_id;
};

/**
 * In-process ledger the paper venue settles against.
 *
 * Every fill instruction of a submitted transaction is executed in order and
 * leaves the same log trail a confirmed transaction would: the FillOrder
 * marker followed by either an event-data line (filled), "Order does not
 * exist" or "Amm cant fulfill order". A transaction holding a single fill for
 * a closed order fails preflight with StaleOrderError instead.
 */
class PaperLedger : public ExecutionClient {
public:
    PaperLedger(PaperLedgerConfig config, PaperAccountDirectory& accounts,
                PaperMarketData& market_data, Clock& clock);

    [[nodiscard]] PublicKey fee_payer() const override { return config_.fee_payer; }
    [[nodiscard]] std::string endpoint() const override { return config_.endpoint; }

    [[nodiscard]] Instruction build_fill_instruction(const FillCandidate& candidate,
                                                     const FillMetadata& metadata) override;

    std::string submit(const Transaction& transaction) override;

    // A record is handed out once, after `unconfirmed_fetches` misses, and
    // then forgotten.
    [[nodiscard]] std::optional<OutcomeRecord>
    fetch_outcome(const std::string& signature) override;

    [[nodiscard]] DecodedFill decode_fill(const Instruction& ix) const;

    [[nodiscard]] std::size_t transaction_count() const;
    [[nodiscard]] std::size_t pending_outcomes() const;

private:
    struct StoredOutcome {
        OutcomeRecord record;
        std::uint32_t fetches{0};
    };

    PaperLedgerConfig config_;
    PaperAccountDirectory& accounts_;
    PaperMarketData& market_data_;
    Clock& clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoredOutcome> outcomes_;
    std::uint64_t tx_counter_{0};

    // Executes one fill; returns the log line that follows the marker.
    std::string execute_fill_(const DecodedFill& fill);

    [[nodiscard]] std::vector<std::string> stale_preflight_logs_() const;
};
