#pragma once

#include "filler/observer.hpp"
#include "persistence/records.hpp"

#include <filesystem>
#include <fstream>
#include <print>
#include <stdexcept>

class CSVWriter {
public:
    explicit CSVWriter(const std::filesystem::path& output_dir) {
        std::filesystem::create_directories(output_dir);
        submissions_file_.open(output_dir / "submissions.csv");
        outcomes_file_.open(output_dir / "outcomes.csv");
        if (!submissions_file_.is_open() || !outcomes_file_.is_open()) {
            throw std::runtime_error("Failed to open output files in: " + output_dir.string());
        }
        write_headers();
    }

    ~CSVWriter() { flush(); }

    CSVWriter(const CSVWriter&) = delete;
    CSVWriter& operator=(const CSVWriter&) = delete;
    CSVWriter(CSVWriter&&) = default;
    CSVWriter& operator=(CSVWriter&&) = default;

    void write_submission(const SubmissionReport& s) {
        std::println(submissions_file_, "{},{},{},{},{},{},{}", s.timestamp.value(),
                     s.signature, submission_status_to_string(s.success), s.candidates,
                     s.unique_accounts, s.estimated_size, s.duration.count());
    }

    void write_outcome(const OutcomeReport& o) {
        std::println(outcomes_file_, "{},{},{},{},{},{}", o.timestamp.value(), o.transaction,
                     o.index, o.candidate, o.market.value(), fill_outcome_to_string(o.outcome));
    }

    void flush() {
        submissions_file_.flush();
        outcomes_file_.flush();
    }

private:
    std::ofstream submissions_file_;
    std::ofstream outcomes_file_;

    void write_headers() {
        std::println(submissions_file_,
                     "timestamp,signature,status,candidates,unique_accounts,estimated_size,"
                     "duration_ms");

        std::println(outcomes_file_, "timestamp,transaction,ix,candidate,market_index,outcome");
    }
};
