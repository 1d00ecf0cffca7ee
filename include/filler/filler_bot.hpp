#pragma once

#include "config/configs.hpp"
#include "exchange/collaborators.hpp"
#include "filler/batch_packer.hpp"
#include "filler/candidate_selector.hpp"
#include "filler/concurrency_gate.hpp"
#include "filler/events.hpp"
#include "filler/observer.hpp"
#include "filler/outcome_reconciler.hpp"
#include "filler/throttle_registry.hpp"
#include "time/clock.hpp"
#include "time/interval_loop.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct FillerCollaborators {
    MarketData& market_data;
    AccountDirectory& accounts;
    OrderBookBuilder& order_book_builder;
    ExecutionClient& execution;
};

enum class CycleStatus : std::uint8_t {
    COMPLETED = 0,
    GATE_BUSY,           // another cycle holds the cycle gate
    GATE_TIMEOUT,        // snapshot lock not acquired in time
    SUBMISSION_TIMEOUT   // submission phase still running after cycle_timeout
};

[[nodiscard]] constexpr const char* cycle_status_to_string(CycleStatus status) {
    switch (status) {
        case CycleStatus::COMPLETED: return "COMPLETED";
        case CycleStatus::GATE_BUSY: return "GATE_BUSY";
        case CycleStatus::GATE_TIMEOUT: return "GATE_TIMEOUT";
        case CycleStatus::SUBMISSION_TIMEOUT: return "SUBMISSION_TIMEOUT";
    }
    return "UNKNOWN";
}

// Result of the bulk submission phase of one cycle.
struct BulkFillResult {
    std::string signature;          // empty when nothing was sent
    std::size_t packed{0};
    std::size_t estimated_size{0};
    ReconciliationReport reconciliation;
};

struct CycleReport {
    CycleStatus status{CycleStatus::COMPLETED};
    std::size_t fillable{0};
    std::size_t packed{0};
    std::size_t succeeded{0};
    std::string signature;
    std::chrono::milliseconds duration{0};
};

/**
 * Periodic filler: each cycle rebuilds the order-book snapshot, selects the
 * fillable candidates, packs as many as fit into one transaction, submits it
 * and feeds the per-instruction outcomes back into throttling and the snapshot.
 *
 * Cycles never overlap. A timer tick or trigger() that arrives while a cycle is
 * running is dropped (GATE_BUSY). A submission phase that outlives
 * cycle_timeout is not cancelled; the cycle returns and the work finishes in
 * the background, and the destructor waits for it.
 */
class FillerBot {
public:
    FillerBot(FillerConfig config, FillerCollaborators collaborators, Clock& clock,
              FillerObserver* observer = nullptr);
    ~FillerBot();

    FillerBot(const FillerBot&) = delete;
    FillerBot& operator=(const FillerBot&) = delete;

    // Loads every user account and user stats record.
    void init();
    void reset();

    void start_interval_loop(std::chrono::milliseconds interval);
    void stop_interval_loop();

    CycleReport try_fill();

    void trigger(const FillerEvent& event);

    // Fills one candidate in its own transaction. Returns the signature, or
    // nullopt on dry run and on failure.
    std::optional<std::string> try_fill_candidate(const FillCandidate& candidate);

    // The live snapshot. Cycles and stale-order removals keep editing it under
    // the snapshot gate, so read it only while no cycle or fill is running.
    [[nodiscard]] std::shared_ptr<const OrderBook> view_order_book() const;

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }
    [[nodiscard]] bool dry_run() const noexcept { return config_.dry_run; }
    [[nodiscard]] const FillerConfig& config() const noexcept { return config_; }

    [[nodiscard]] ThrottleRegistry& throttle() noexcept { return throttle_; }
    [[nodiscard]] std::size_t in_flight() const;

private:
    FillerConfig config_;
    FillerCollaborators venue_;
    Clock& clock_;
    FillerObserver null_observer_;
    FillerObserver& observer_;

    CycleGate cycle_gate_;
    SnapshotGate snapshot_gate_;
    ThrottleRegistry throttle_;
    CandidateSelector selector_;
    BatchPacker packer_;
    OutcomeReconciler reconciler_;

    mutable std::mutex book_mutex_;
    std::shared_ptr<OrderBook> order_book_;

    mutable std::mutex in_flight_mutex_;
    std::vector<std::future<BulkFillResult>> in_flight_;

    IntervalLoop loop_;

    CycleReport run_cycle_(Timestamp start);
    void rebuild_snapshot_();
    [[nodiscard]] std::shared_ptr<OrderBook> current_book_() const;

    BulkFillResult try_bulk_fill_(std::vector<FillCandidate> candidates);
    Instruction build_instruction_(const FillCandidate& candidate);
    void remove_from_snapshot_(const FillCandidate& candidate);
    void clear_filled_(const FillCandidate& candidate);

    void reap_in_flight_();
    void drain_in_flight_();

    void dispatch_event_(const FillerEvent& event);
    void handle_(const OrderCreated& event);
    void handle_(const AccountCreated& event);
};
