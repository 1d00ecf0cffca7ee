#include "filler/outcome_reconciler.hpp"
#include "filler/errors.hpp"

#include <spdlog/spdlog.h>

FillOutcome classify_fill_log(std::string_view line, std::size_t success_min_length) {
    if (line.find(STALE_ORDER_LOG) != std::string_view::npos) {
        return FillOutcome::STALE_ORDER;
    }
    if (line.find(AMM_CANNOT_FULFILL_LOG) != std::string_view::npos) {
        return FillOutcome::COUNTERPARTY_REJECTED;
    }
    // fill event data is long and opaque; anything short we do not recognise
    if (line.size() > success_min_length) {
        return FillOutcome::SUCCEEDED;
    }
    return FillOutcome::UNPARSED;
}

std::vector<LogVerdict> walk_fill_logs(const std::vector<std::optional<std::string>>& logs,
                                       std::size_t success_min_length) {
    std::vector<LogVerdict> verdicts;
    bool next_is_fill_record = false;
    std::size_t markers_seen = 0;

    for (const auto& log : logs) {
        if (!log) {
            continue;
        }

        if (next_is_fill_record) {
            verdicts.push_back(LogVerdict{.index = markers_seen - 1,
                                          .outcome = classify_fill_log(*log, success_min_length),
                                          .line = *log});
            next_is_fill_record = false;
        } else if (*log == FILL_ORDER_LOG_MARKER) {
            next_is_fill_record = true;
            ++markers_seen;
        }
    }

    return verdicts;
}

std::optional<OutcomeRecord> OutcomeReconciler::await_outcome(ExecutionClient& client,
                                                              const std::string& signature,
                                                              std::uint32_t attempts,
                                                              std::chrono::milliseconds delay) {
    for (std::uint32_t attempt = 0; attempt < attempts; ++attempt) {
        spdlog::info("waiting for {} to be confirmed", signature);
        observer_.on_rpc_request("getTransaction", name_);
        try {
            auto record = client.fetch_outcome(signature);
            if (record) {
                return record;
            }
        } catch (const TransportError& e) {
            spdlog::warn("{} fetching tx {} failed (attempt {}): {}", name_, signature,
                         attempt + 1, e.what());
        }

        if (attempt + 1 < attempts) {
            clock_.sleep_for(delay);
        }
    }

    spdlog::error("tx {} not found", signature);
    return std::nullopt;
}

ReconciliationReport OutcomeReconciler::reconcile(const std::vector<FillCandidate>& sent,
                                                  const OutcomeRecord& record) {
    ReconciliationReport report;
    report.outcomes.resize(sent.size());

    for (const auto& log : record.log_messages) {
        if (!log) {
            spdlog::error("null log message on tx: {}", record.signature);
        }
    }

    apply_(sent, walk_fill_logs(record.log_messages, success_min_length_), record.signature,
           report);
    return report;
}

ReconciliationReport
OutcomeReconciler::reconcile_failure(const std::vector<FillCandidate>& sent,
                                     const std::vector<std::string>& diagnostics,
                                     bool stale_error) {
    ReconciliationReport report;
    report.outcomes.resize(sent.size());

    for (const auto& candidate : sent) {
        throttle_.record_attempt(candidate_signature(candidate));
    }

    std::vector<std::optional<std::string>> lines(diagnostics.begin(), diagnostics.end());
    for (const auto& verdict : walk_fill_logs(lines, success_min_length_)) {
        if (verdict.outcome != FillOutcome::STALE_ORDER || verdict.index >= sent.size()) {
            continue;
        }
        const FillCandidate& candidate = sent[verdict.index];
        spdlog::error("{} simulation: {}, ix: {}", name_, verdict.line, verdict.index);
        report.outcomes[verdict.index] = FillOutcome::STALE_ORDER;
        ++report.stale_count;
        on_stale_(candidate);
    }

    if (stale_error && sent.size() == 1 && report.stale_count == 0) {
        report.outcomes[0] = FillOutcome::STALE_ORDER;
        ++report.stale_count;
        on_stale_(sent.front());
    }

    for (std::size_t i = 0; i < sent.size(); ++i) {
        if (report.outcomes[i] == FillOutcome::STALE_ORDER) {
            observer_.on_outcome(OutcomeReport{.timestamp = clock_.now(),
                                               .transaction = "",
                                               .index = i,
                                               .candidate = candidate_signature(sent[i]),
                                               .market = sent[i].market_index(),
                                               .outcome = FillOutcome::STALE_ORDER});
        }
    }

    return report;
}

void OutcomeReconciler::apply_(const std::vector<FillCandidate>& sent,
                               const std::vector<LogVerdict>& verdicts,
                               const std::string& transaction,
                               ReconciliationReport& report) {
    for (const auto& verdict : verdicts) {
        if (verdict.index >= sent.size()) {
            spdlog::warn("{} fill record ix {} has no packed candidate ({} sent): {}", name_,
                         verdict.index, sent.size(), verdict.line);
            ++report.unparsed_count;
            continue;
        }

        const FillCandidate& candidate = sent[verdict.index];
        std::string signature = candidate_signature(candidate);

        switch (verdict.outcome) {
            case FillOutcome::STALE_ORDER:
                spdlog::error(" {}, ix: {}", verdict.line, verdict.index);
                spdlog::error("   assoc order: {}, {}",
                              candidate.node->user_account.value_or(signature),
                              candidate.order_id().value());
                ++report.stale_count;
                on_stale_(candidate);
                break;
            case FillOutcome::COUNTERPARTY_REJECTED:
                spdlog::error(" {}, ix: {}", verdict.line, verdict.index);
                spdlog::error("  assoc order: {}, {}",
                              candidate.node->user_account.value_or(signature),
                              candidate.order_id().value());
                ++report.rejected_count;
                throttle_.record_attempt(signature);
                break;
            case FillOutcome::SUCCEEDED:
                ++report.success_count;
                break;
            case FillOutcome::UNPARSED:
                spdlog::info(" how parse log?: {}", verdict.line);
                ++report.unparsed_count;
                break;
        }

        report.outcomes[verdict.index] = verdict.outcome;
        observer_.on_outcome(OutcomeReport{.timestamp = clock_.now(),
                                           .transaction = transaction,
                                           .index = verdict.index,
                                           .candidate = signature,
                                           .market = candidate.market_index(),
                                           .outcome = verdict.outcome});
    }
}
