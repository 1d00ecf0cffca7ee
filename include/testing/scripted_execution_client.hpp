#pragma once

#include "exchange/collaborators.hpp"
#include "filler/batch_packer.hpp"
#include "filler/outcome_reconciler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace testing {

// Result line long enough to count as a successful fill record.
inline const std::string FILL_EVENT_LINE =
    "Program data: fill event 4KxGv1cZ9p2yRqLm8sT3nWbHdJ6eAfUo7iPkXrYzQ5Vw";

/**
 * Execution client whose behaviour a test scripts step by step.
 *
 * Each submit() is recorded and, when `submit_handler` is set, delegated to it
 * (it may throw TransportError). Submissions can be held on a gate to simulate
 * a slow ledger. fetch_outcome() delegates to `fetch_handler` or, by default,
 * reports every fill of the transaction as successful.
 */
class ScriptedExecutionClient : public ExecutionClient {
public:
    using SubmitHandler = std::function<std::string(const Transaction&)>;
    using FetchHandler = std::function<std::optional<OutcomeRecord>(const std::string&)>;

    SubmitHandler submit_handler;
    FetchHandler fetch_handler;

    // Bytes of instruction data per fill; tunes instruction size for packing.
    std::size_t fill_data_size{16};

    PublicKey fee_payer() const override { return "FeePayer1111111111111111111111111111111111"; }
    std::string endpoint() const override { return "scripted://ledger"; }

    Instruction build_fill_instruction(const FillCandidate& candidate,
                                       const FillMetadata& metadata) override {
        Instruction ix{.program_id = "FillProgram11111111111111111111111111111111",
                       .keys = {},
                       .data = std::vector<std::uint8_t>(fill_data_size, 0)};
        ix.keys.push_back(AccountMeta{.pubkey = metadata.taker.user_account,
                                      .is_writable = true});
        ix.keys.push_back(AccountMeta{.pubkey = metadata.taker_stats, .is_writable = true});
        if (metadata.maker_info) {
            ix.keys.push_back(AccountMeta{.pubkey = metadata.maker_info->maker,
                                          .is_writable = true});
            ix.keys.push_back(AccountMeta{.pubkey = metadata.maker_info->maker_stats,
                                          .is_writable = true});
        }
        if (!ix.data.empty()) {
            ix.data[0] = static_cast<std::uint8_t>(candidate.order_id().value() & 0xff);
        }
        return ix;
    }

    std::string submit(const Transaction& transaction) override {
        {
            std::unique_lock lock(mutex_);
            submitted_.push_back(transaction);
            submitting_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !hold_; });
            submitting_ = false;
        }

        if (submit_handler) {
            return submit_handler(transaction);
        }
        return "sig-" + std::to_string(++signature_counter_);
    }

    std::optional<OutcomeRecord> fetch_outcome(const std::string& signature) override {
        ++fetches;
        if (fetch_handler) {
            return fetch_handler(signature);
        }

        std::lock_guard lock(mutex_);
        OutcomeRecord record{.signature = signature, .slot = Slot{1}, .log_messages = {}};
        if (submitted_.empty()) {
            return record;
        }
        for (const auto& ix : submitted_.back().instructions) {
            if (ix.program_id == COMPUTE_BUDGET_PROGRAM_ID) {
                continue;
            }
            record.log_messages.emplace_back(FILL_ORDER_LOG_MARKER);
            record.log_messages.emplace_back(FILL_EVENT_LINE);
        }
        return record;
    }

    void hold_submissions() {
        std::lock_guard lock(mutex_);
        hold_ = true;
    }

    void release_submissions() {
        {
            std::lock_guard lock(mutex_);
            hold_ = false;
        }
        cv_.notify_all();
    }

    bool wait_until_submitting(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return submitting_; });
    }

    std::vector<Transaction> submitted() const {
        std::lock_guard lock(mutex_);
        return submitted_;
    }

    std::atomic<int> fetches{0};

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Transaction> submitted_;
    bool hold_{false};
    bool submitting_{false};
    std::atomic<int> signature_counter_{0};
};

} // namespace testing
