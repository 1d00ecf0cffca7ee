#pragma once

#include "config/configs.hpp"
#include "exchange/resident_order_book.hpp"
#include "filler/events.hpp"
#include "filler/filler_bot.hpp"
#include "paper/paper_account_directory.hpp"
#include "paper/paper_ledger.hpp"
#include "paper/paper_market_data.hpp"
#include "time/clock.hpp"

/**
 * Every collaborator of the fill engine backed by in-process state, wired
 * from one PaperConfig.
 */
class PaperVenue {
public:
    PaperVenue(const PaperConfig& config, Clock& clock)
        : clock_(clock), market_data_(config, clock), accounts_(config.users),
          ledger_(config.ledger, accounts_, market_data_, clock) {}

    PaperVenue(const PaperVenue&) = delete;
    PaperVenue& operator=(const PaperVenue&) = delete;

    [[nodiscard]] FillerCollaborators collaborators() {
        return FillerCollaborators{.market_data = market_data_,
                                   .accounts = accounts_,
                                   .order_book_builder = builder_,
                                   .execution = ledger_};
    }

    // Order placement as the venue would announce it. The order only reaches
    // the directory once the event is delivered to the filler.
    [[nodiscard]] OrderCreated place_order(const PublicKey& user_account,
                                           const PublicKey& authority, Order order) const {
        return OrderCreated{.record = OrderRecord{.ts = clock_.now(),
                                                 .user_account = user_account,
                                                 .authority = authority,
                                                 .order = order}};
    }

    PaperMarketData& market_data() { return market_data_; }
    PaperAccountDirectory& accounts() { return accounts_; }
    PaperLedger& ledger() { return ledger_; }

private:
    Clock& clock_;
    PaperMarketData market_data_;
    PaperAccountDirectory accounts_;
    ResidentOrderBookBuilder builder_;
    PaperLedger ledger_;
};
