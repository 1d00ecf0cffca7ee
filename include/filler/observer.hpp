#pragma once

#include "filler/fill_outcome.hpp"
#include "utils/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

struct SubmissionReport {
    Timestamp timestamp;
    std::string signature;       // empty when the submission failed
    std::size_t candidates{0};
    std::size_t unique_accounts{0};
    std::size_t estimated_size{0};
    std::chrono::milliseconds duration{0};
    bool success{false};
};

struct OutcomeReport {
    Timestamp timestamp;
    std::string transaction;
    std::size_t index{0};        // position in the packed batch
    std::string candidate;       // candidate signature
    MarketIndex market;
    FillOutcome outcome{FillOutcome::UNPARSED};
};

/**
 * Receives fill-engine metrics. Every hook defaults to a no-op, so an observer
 * only overrides what it records, and the engine never depends on one being
 * present.
 */
class FillerObserver {
public:
    virtual ~FillerObserver() = default;

    virtual void on_cycle_start([[maybe_unused]] const std::string& bot) {}
    virtual void on_cycle_end([[maybe_unused]] const std::string& bot,
                              [[maybe_unused]] std::chrono::milliseconds duration) {}
    virtual void on_gate_busy([[maybe_unused]] const std::string& bot) {}
    virtual void on_gate_timeout([[maybe_unused]] const std::string& bot) {}
    virtual void on_snapshot_rebuilt([[maybe_unused]] const std::string& bot,
                                     [[maybe_unused]] std::size_t orders) {}
    virtual void on_fillable_orders_seen([[maybe_unused]] std::size_t count) {}

    virtual void on_rpc_request([[maybe_unused]] const std::string& method,
                                [[maybe_unused]] const std::string& bot) {}
    virtual void on_rpc_duration([[maybe_unused]] const std::string& endpoint,
                                 [[maybe_unused]] const std::string& method,
                                 [[maybe_unused]] std::chrono::milliseconds duration,
                                 [[maybe_unused]] const std::string& bot) {}

    virtual void on_submission([[maybe_unused]] const SubmissionReport& report) {}
    virtual void on_outcome([[maybe_unused]] const OutcomeReport& report) {}
    virtual void on_filled_orders([[maybe_unused]] const std::string& fee_payer,
                                  [[maybe_unused]] const std::string& bot,
                                  [[maybe_unused]] std::size_t count) {}
    virtual void on_error_code([[maybe_unused]] std::int64_t code,
                               [[maybe_unused]] const std::string& fee_payer,
                               [[maybe_unused]] const std::string& bot) {}
};
