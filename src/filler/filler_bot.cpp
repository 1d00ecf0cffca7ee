#include "filler/filler_bot.hpp"
#include "filler/errors.hpp"
#include "filler/fill_metadata.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

FillerBot::FillerBot(FillerConfig config, FillerCollaborators collaborators, Clock& clock,
                     FillerObserver* observer)
    : config_(std::move(config)), venue_(collaborators), clock_(clock),
      observer_(observer != nullptr ? *observer : null_observer_),
      snapshot_gate_(config_.effective_snapshot_timeout()), throttle_(clock),
      selector_(venue_.market_data, throttle_, clock, config_.fill_backoff, config_.name),
      packer_(config_.max_tx_size, config_.compute_units, config_.compute_unit_fee),
      reconciler_(
          throttle_, [this](const FillCandidate& c) { remove_from_snapshot_(c); }, clock,
          observer_, config_.name, config_.success_log_min_length),
      loop_(config_.name) {}

FillerBot::~FillerBot() {
    loop_.stop();
    drain_in_flight_();
}

void FillerBot::init() {
    spdlog::warn("{} initing", name());
    venue_.accounts.fetch_all();
    spdlog::warn("{} init done", name());
}

void FillerBot::reset() {
    loop_.stop();
    drain_in_flight_();
    throttle_.clear();
    std::lock_guard lock(book_mutex_);
    order_book_.reset();
}

void FillerBot::start_interval_loop(std::chrono::milliseconds interval) {
    loop_.start(interval, [this] { static_cast<void>(try_fill()); });
    spdlog::info("{} Bot started!", name());
}

void FillerBot::stop_interval_loop() { loop_.stop(); }

std::shared_ptr<const OrderBook> FillerBot::view_order_book() const { return current_book_(); }

std::shared_ptr<OrderBook> FillerBot::current_book_() const {
    std::lock_guard lock(book_mutex_);
    return order_book_;
}

std::size_t FillerBot::in_flight() const {
    std::lock_guard lock(in_flight_mutex_);
    return in_flight_.size();
}

// ============================================================================
// Cycle
// ============================================================================

CycleReport FillerBot::try_fill() {
    Timestamp start = clock_.now();
    try {
        CycleReport report = cycle_gate_.run_exclusive([&] {
            reap_in_flight_();
            return run_cycle_(start);
        });

        report.duration = elapsed_since(clock_, start);
        observer_.on_rpc_duration(venue_.execution.endpoint(), "tryFill", report.duration,
                                  name());
        observer_.on_cycle_end(name(), report.duration);
        spdlog::info("tryFill done, took {}ms", report.duration.count());
        return report;
    } catch (const GateBusyError&) {
        observer_.on_gate_busy(name());
        spdlog::debug("{} previous cycle still running, skipping", name());
        return CycleReport{.status = CycleStatus::GATE_BUSY};
    } catch (const GateTimeoutError&) {
        observer_.on_gate_timeout(name());
        spdlog::error("{} order book lock timeout after {}ms", name(),
                      snapshot_gate_.timeout().count());
        return CycleReport{.status = CycleStatus::GATE_TIMEOUT,
                           .duration = elapsed_since(clock_, start)};
    }
}

CycleReport FillerBot::run_cycle_(Timestamp start) {
    observer_.on_cycle_start(name());

    rebuild_snapshot_();
    std::shared_ptr<OrderBook> book = current_book_();

    std::vector<FillCandidate> fillable = selector_.select(*book, snapshot_gate_);
    observer_.on_fillable_orders_seen(fillable.size());

    CycleReport report{.fillable = fillable.size()};

    auto submission = std::async(std::launch::async,
                                 [this, candidates = std::move(fillable)]() mutable {
                                     return try_bulk_fill_(std::move(candidates));
                                 });

    if (submission.wait_for(config_.cycle_timeout) == std::future_status::timeout) {
        spdlog::error("Timeout tryFill, took {}ms", elapsed_since(clock_, start).count());
        std::lock_guard lock(in_flight_mutex_);
        in_flight_.push_back(std::move(submission));
        report.status = CycleStatus::SUBMISSION_TIMEOUT;
        return report;
    }

    BulkFillResult result = submission.get();
    report.packed = result.packed;
    report.succeeded = result.reconciliation.success_count;
    report.signature = std::move(result.signature);
    return report;
}

void FillerBot::rebuild_snapshot_() {
    std::size_t orders = snapshot_gate_.run_exclusive([&] {
        std::shared_ptr<OrderBook> book =
            venue_.order_book_builder.build(venue_.market_data.markets(), venue_.accounts);
        if (!book) {
            throw std::runtime_error(name() + " order book builder returned no snapshot");
        }
        std::size_t size = book->size();
        std::lock_guard lock(book_mutex_);
        order_book_ = std::move(book);
        return size;
    });
    observer_.on_snapshot_rebuilt(name(), orders);
}

// ============================================================================
// Bulk submission
// ============================================================================

Instruction FillerBot::build_instruction_(const FillCandidate& candidate) {
    FillMetadata metadata = resolve_fill_metadata(venue_.accounts, candidate);
    return venue_.execution.build_fill_instruction(candidate, metadata);
}

BulkFillResult FillerBot::try_bulk_fill_(std::vector<FillCandidate> candidates) {
    const PublicKey fee_payer = venue_.execution.fee_payer();
    const std::string endpoint = venue_.execution.endpoint();

    Timestamp packer_start = clock_.now();
    PackedBatch batch = packer_.pack(
        fee_payer, candidates, [this](const FillCandidate& c) { return build_instruction_(c); });

    for (const auto& candidate : batch.candidates) {
        spdlog::info("including tx {}", candidate_signature(candidate));
    }
    spdlog::info("txPacker took {}ms", elapsed_since(clock_, packer_start).count());

    BulkFillResult result{.packed = batch.candidates.size(),
                          .estimated_size = batch.estimated_size};
    if (batch.empty()) {
        spdlog::info("no ix");
        return result;
    }

    spdlog::info("sending tx, {} unique accounts, total ix: {}, calcd tx size: {}, took {}ms",
                 batch.unique_accounts.size(), batch.candidates.size(), batch.estimated_size,
                 elapsed_since(clock_, packer_start).count());

    if (config_.dry_run) {
        spdlog::info("{} dry run, not sending packed tx", name());
        return result;
    }

    Timestamp tx_start = clock_.now();
    observer_.on_rpc_request("send", name());
    try {
        result.signature = venue_.execution.submit(batch.transaction);
    } catch (const TransportError& e) {
        auto duration = elapsed_since(clock_, tx_start);
        spdlog::error("failed to send packed tx: {}", e.what());
        for (const auto& line : e.logs()) {
            spdlog::error("{}", line);
        }
        observer_.on_rpc_duration(endpoint, "send", duration, name());
        observer_.on_error_code(error_code_of(e), fee_payer, name());
        observer_.on_submission(SubmissionReport{.timestamp = tx_start,
                                                 .signature = "",
                                                 .candidates = batch.candidates.size(),
                                                 .unique_accounts = batch.unique_accounts.size(),
                                                 .estimated_size = batch.estimated_size,
                                                 .duration = duration,
                                                 .success = false});
        result.reconciliation =
            reconciler_.reconcile_failure(batch.candidates, e.logs(), indicates_stale_order(e));
        return result;
    }

    auto duration = elapsed_since(clock_, tx_start);
    spdlog::info("sent tx: {}, took: {}ms", result.signature, duration.count());
    observer_.on_rpc_duration(endpoint, "send", duration, name());
    observer_.on_submission(SubmissionReport{.timestamp = tx_start,
                                             .signature = result.signature,
                                             .candidates = batch.candidates.size(),
                                             .unique_accounts = batch.unique_accounts.size(),
                                             .estimated_size = batch.estimated_size,
                                             .duration = duration,
                                             .success = true});

    Timestamp parse_start = clock_.now();
    auto record = reconciler_.await_outcome(venue_.execution, result.signature,
                                            config_.outcome_fetch_attempts,
                                            config_.outcome_fetch_delay);
    if (record) {
        result.reconciliation = reconciler_.reconcile(batch.candidates, *record);
    } else {
        result.reconciliation.outcomes.resize(batch.candidates.size());
    }

    auto parse_duration = elapsed_since(clock_, parse_start);
    spdlog::info("parse logs took {}ms", parse_duration.count());
    observer_.on_rpc_duration(endpoint, "processLogs", parse_duration, name());
    observer_.on_filled_orders(fee_payer, name(), result.reconciliation.success_count);

    return result;
}

void FillerBot::remove_from_snapshot_(const FillCandidate& candidate) {
    if (!candidate.node || !candidate.node->user_account) {
        return;
    }

    try {
        snapshot_gate_.run_exclusive([&] {
            std::shared_ptr<OrderBook> book = current_book_();
            if (!book) {
                return;
            }
            static_cast<void>(
                book->remove(candidate.node->order, *candidate.node->user_account, [&] {
                    spdlog::error(
                        "Order {} not found when trying to fill. Removing from order list",
                        candidate.order_id().value());
                }));
        });
    } catch (const GateTimeoutError&) {
        observer_.on_gate_timeout(name());
        spdlog::error("{} order book lock timeout, {} not removed", name(),
                      candidate_signature(candidate));
    }
}

void FillerBot::clear_filled_(const FillCandidate& candidate) {
    try {
        snapshot_gate_.run_exclusive([&] { candidate.node->have_filled = false; });
    } catch (const GateTimeoutError&) {
        observer_.on_gate_timeout(name());
        spdlog::error("{} order book lock timeout, {} still marked filled", name(),
                      candidate_signature(candidate));
    }
}

// ============================================================================
// Single-candidate fallback
// ============================================================================

std::optional<std::string> FillerBot::try_fill_candidate(const FillCandidate& candidate) {
    if (!candidate.node || !candidate.node->user_account) {
        spdlog::error("{} nodeToFill is null", name());
        return std::nullopt;
    }

    const PublicKey& user_account = *candidate.node->user_account;
    std::uint32_t order_id = candidate.order_id().value();
    std::uint64_t market = candidate.market_index().value();

    spdlog::info("{} trying to fill (account: {}) order {} on mktIdx: {}", name(), user_account,
                 order_id, market);

    FillMetadata metadata = resolve_fill_metadata(venue_.accounts, candidate);

    if (config_.dry_run) {
        spdlog::info("{} dry run, not filling", name());
        return std::nullopt;
    }

    const PublicKey fee_payer = venue_.execution.fee_payer();
    Timestamp req_start = clock_.now();
    auto report_duration = [&] {
        observer_.on_rpc_duration(venue_.execution.endpoint(), "fillOrder",
                                  elapsed_since(clock_, req_start), name());
    };

    std::optional<std::string> signature;
    observer_.on_rpc_request("fillOrder", name());
    try {
        Transaction tx{.fee_payer = fee_payer,
                       .instructions = {venue_.execution.build_fill_instruction(candidate,
                                                                               metadata)}};
        signature = venue_.execution.submit(tx);
        observer_.on_filled_orders(fee_payer, name(), 1);
        spdlog::info("{} Filled user (account: {}) order: {}, Tx: {}", name(), user_account,
                     order_id, *signature);
    } catch (const TransportError& e) {
        clear_filled_(candidate);
        throttle_.record_attempt(candidate_signature(candidate));

        std::int64_t code = error_code_of(e);
        observer_.on_error_code(code, fee_payer, name());

        if (indicates_stale_order(e)) {
            remove_from_snapshot_(candidate);
        }
        spdlog::error("{} Error ({}) filling user (account: {}) order: {}, mktIdx: {}: {}",
                      name(), code, user_account, order_id, market, e.what());
    } catch (...) {
        report_duration();
        throw;
    }

    report_duration();
    return signature;
}

// ============================================================================
// Events
// ============================================================================

void FillerBot::trigger(const FillerEvent& event) { dispatch_event_(event); }

void FillerBot::dispatch_event_(const FillerEvent& event) {
    std::visit([this](const auto& e) { handle_(e); }, event);
}

void FillerBot::handle_(const OrderCreated& event) {
    venue_.accounts.update_with_order(event.record);
    static_cast<void>(try_fill());
}

void FillerBot::handle_(const AccountCreated& event) {
    venue_.accounts.ensure_authority(event.authority);
}

// ============================================================================
// Abandoned submissions
// ============================================================================

void FillerBot::reap_in_flight_() {
    std::vector<std::future<BulkFillResult>> finished;
    {
        std::lock_guard lock(in_flight_mutex_);
        auto it = in_flight_.begin();
        while (it != in_flight_.end()) {
            if (it->wait_for(std::chrono::milliseconds{0}) == std::future_status::ready) {
                finished.push_back(std::move(*it));
                it = in_flight_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& future : finished) {
        try {
            BulkFillResult result = future.get();
            spdlog::info("{} late submission {} finished, {} filled", name(),
                         result.signature.empty() ? "<none>" : result.signature,
                         result.reconciliation.success_count);
        } catch (const std::exception& e) {
            observer_.on_error_code(-1, venue_.execution.fee_payer(), name());
            spdlog::error("{} late submission failed: {}", name(), e.what());
        }
    }
}

void FillerBot::drain_in_flight_() {
    std::vector<std::future<BulkFillResult>> pending;
    {
        std::lock_guard lock(in_flight_mutex_);
        pending.swap(in_flight_);
    }

    for (auto& future : pending) {
        try {
            static_cast<void>(future.get());
        } catch (const std::exception& e) {
            observer_.on_error_code(-1, venue_.execution.fee_payer(), name());
            spdlog::error("{} submission failed during shutdown: {}", name(), e.what());
        }
    }
}
