#pragma once

#include "exchange/collaborators.hpp"
#include "filler/fill_outcome.hpp"
#include "filler/observer.hpp"
#include "filler/throttle_registry.hpp"
#include "time/clock.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr const char* FILL_ORDER_LOG_MARKER = "Program log: Instruction: FillOrder";

/**
 * Verdict for one fill instruction, read from the line that follows its
 * FillOrder marker. `index` is the instruction's position among the fill
 * instructions of the transaction (the compute-budget preamble is not counted).
 */
struct LogVerdict {
    std::size_t index{0};
    FillOutcome outcome{FillOutcome::UNPARSED};
    std::string line;
};

[[nodiscard]] FillOutcome classify_fill_log(std::string_view line,
                                            std::size_t success_min_length);

[[nodiscard]] std::vector<LogVerdict>
walk_fill_logs(const std::vector<std::optional<std::string>>& logs,
               std::size_t success_min_length);

struct ReconciliationReport {
    std::vector<std::optional<FillOutcome>> outcomes;  // per packed candidate
    std::size_t success_count{0};
    std::size_t stale_count{0};
    std::size_t rejected_count{0};
    std::size_t unparsed_count{0};
};

// Removes a candidate's order from the current snapshot.
using StaleOrderCallback = std::function<void(const FillCandidate&)>;

/**
 * Feeds the per-instruction results of a confirmed (or failed) batch back into
 * the throttle registry and the order book.
 */
class OutcomeReconciler {
public:
    OutcomeReconciler(ThrottleRegistry& throttle, StaleOrderCallback on_stale, Clock& clock,
                      FillerObserver& observer, std::string name,
                      std::size_t success_min_length = 50)
        : throttle_(throttle), on_stale_(std::move(on_stale)), clock_(clock),
          observer_(observer), name_(std::move(name)),
          success_min_length_(success_min_length) {}

    /**
     * Polls fetch_outcome() up to `attempts` times, sleeping `delay` between
     * attempts. Returns nullopt when the transaction never shows up; that is
     * reported, not thrown.
     */
    [[nodiscard]] std::optional<OutcomeRecord>
    await_outcome(ExecutionClient& client, const std::string& signature,
                  std::uint32_t attempts, std::chrono::milliseconds delay);

    ReconciliationReport reconcile(const std::vector<FillCandidate>& sent,
                                   const OutcomeRecord& record);

    // Failed submission: throttle every packed candidate and drop the ones the
    // diagnostic lines (or a single-candidate stale error) point at.
    ReconciliationReport reconcile_failure(const std::vector<FillCandidate>& sent,
                                           const std::vector<std::string>& diagnostics,
                                           bool stale_error);

private:
    ThrottleRegistry& throttle_;
    StaleOrderCallback on_stale_;
    Clock& clock_;
    FillerObserver& observer_;
    std::string name_;
    std::size_t success_min_length_;

    void apply_(const std::vector<FillCandidate>& sent, const std::vector<LogVerdict>& verdicts,
                const std::string& transaction, ReconciliationReport& report);
};
