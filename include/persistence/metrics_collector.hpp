#pragma once

#include "filler/observer.hpp"
#include "persistence/csv_writer.hpp"
#include "persistence/records.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <stdexcept>

/**
 * FillerObserver that keeps run counters and, when given an output directory,
 * journals every submission and per-instruction outcome to CSV.
 *
 * Hooks arrive from the cycle thread and from background submissions, so
 * everything is guarded by one mutex.
 */
class MetricsCollector : public FillerObserver {
public:
    MetricsCollector() = default;

    explicit MetricsCollector(const std::filesystem::path& output_dir)
        : csv_writer_(std::in_place, output_dir), output_dir_(output_dir) {}

    void on_cycle_start(const std::string&) override {
        std::lock_guard lock(mutex_);
        ++metrics_.cycles;
    }

    void on_gate_busy(const std::string&) override {
        std::lock_guard lock(mutex_);
        ++metrics_.cycles_busy;
    }

    void on_gate_timeout(const std::string&) override {
        std::lock_guard lock(mutex_);
        ++metrics_.gate_timeouts;
    }

    void on_snapshot_rebuilt(const std::string&, std::size_t orders) override {
        std::lock_guard lock(mutex_);
        ++metrics_.snapshots_rebuilt;
        metrics_.last_snapshot_orders = orders;
    }

    void on_fillable_orders_seen(std::size_t count) override {
        std::lock_guard lock(mutex_);
        metrics_.fillable_seen += count;
    }

    void on_rpc_request(const std::string& method, const std::string&) override {
        std::lock_guard lock(mutex_);
        ++metrics_.rpc_requests[method];
    }

    void on_rpc_duration(const std::string&, const std::string& method,
                         std::chrono::milliseconds duration, const std::string&) override {
        std::lock_guard lock(mutex_);
        metrics_.rpc_duration_ms[method] += static_cast<std::uint64_t>(duration.count());
    }

    void on_submission(const SubmissionReport& report) override {
        std::lock_guard lock(mutex_);
        ++metrics_.submissions;
        if (!report.success) {
            ++metrics_.failed_submissions;
        }
        if (csv_writer_) {
            csv_writer_->write_submission(report);
        }
    }

    void on_outcome(const OutcomeReport& report) override {
        std::lock_guard lock(mutex_);
        ++metrics_.outcomes[fill_outcome_to_string(report.outcome)];
        if (csv_writer_) {
            csv_writer_->write_outcome(report);
        }
    }

    void on_filled_orders(const std::string&, const std::string&, std::size_t count) override {
        std::lock_guard lock(mutex_);
        metrics_.filled_orders += count;
    }

    void on_error_code(std::int64_t code, const std::string&, const std::string&) override {
        std::lock_guard lock(mutex_);
        ++metrics_.error_codes[code];
    }

    [[nodiscard]] MetricsSnapshot snapshot() const {
        std::lock_guard lock(mutex_);
        return metrics_;
    }

    // Flushes the journal and writes metrics.json. No-op without an output dir.
    void finalize() {
        std::lock_guard lock(mutex_);
        if (!csv_writer_) {
            return;
        }
        csv_writer_->flush();

        std::ofstream file(output_dir_ / "metrics.json");
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open metrics.json for writing");
        }
        file << to_json(metrics_).dump(2);
    }

private:
    mutable std::mutex mutex_;
    MetricsSnapshot metrics_;
    std::optional<CSVWriter> csv_writer_;
    std::filesystem::path output_dir_;
};
