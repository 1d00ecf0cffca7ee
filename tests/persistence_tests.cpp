#include <gtest/gtest.h>

#include "persistence/csv_writer.hpp"
#include "persistence/metrics_collector.hpp"
#include "persistence/records.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// =============================================================================
// Test Helpers
// =============================================================================

inline SubmissionReport make_submission(bool success = true,
                                        std::string signature = "sig-1") {
    return SubmissionReport{.timestamp = Timestamp{1000},
                            .signature = std::move(signature),
                            .candidates = 3,
                            .unique_accounts = 9,
                            .estimated_size = 640,
                            .duration = std::chrono::milliseconds{12},
                            .success = success};
}

inline OutcomeReport make_outcome(FillOutcome outcome = FillOutcome::SUCCEEDED,
                                  std::size_t index = 0) {
    return OutcomeReport{.timestamp = Timestamp{1005},
                         .transaction = "sig-1",
                         .index = index,
                         .candidate = "user-7",
                         .market = MarketIndex{2},
                         .outcome = outcome};
}

// =============================================================================
// Test Fixture with Temporary Directory
// =============================================================================

class PersistenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
                    ("filler_persistence_test_" + std::to_string(test_counter_++));
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
    static inline int test_counter_ = 0;

    std::string read_file(const fs::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream file(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }
};

// =============================================================================
// Records Tests
// =============================================================================

TEST(RecordsTest, SubmissionStatusToString) {
    EXPECT_STREQ(submission_status_to_string(true), "SENT");
    EXPECT_STREQ(submission_status_to_string(false), "FAILED");
}

TEST(RecordsTest, FillOutcomeToString) {
    EXPECT_STREQ(fill_outcome_to_string(FillOutcome::SUCCEEDED), "SUCCEEDED");
    EXPECT_STREQ(fill_outcome_to_string(FillOutcome::STALE_ORDER), "STALE_ORDER");
    EXPECT_STREQ(fill_outcome_to_string(FillOutcome::COUNTERPARTY_REJECTED),
                 "COUNTERPARTY_REJECTED");
    EXPECT_STREQ(fill_outcome_to_string(FillOutcome::UNPARSED), "UNPARSED");
}

TEST(RecordsTest, MetricsSnapshotToJson) {
    MetricsSnapshot m;
    m.cycles = 4;
    m.filled_orders = 2;
    m.rpc_requests["send"] = 3;
    m.error_codes[6043] = 1;
    m.error_codes[-1] = 2;
    m.outcomes["SUCCEEDED"] = 2;

    nlohmann::json j = to_json(m);

    EXPECT_EQ(j.at("cycles").get<std::uint64_t>(), 4u);
    EXPECT_EQ(j.at("filled_orders").get<std::uint64_t>(), 2u);
    EXPECT_EQ(j.at("rpc_requests").at("send").get<std::uint64_t>(), 3u);
    EXPECT_EQ(j.at("error_codes").at("6043").get<std::uint64_t>(), 1u);
    EXPECT_EQ(j.at("error_codes").at("-1").get<std::uint64_t>(), 2u);
    EXPECT_EQ(j.at("outcomes").at("SUCCEEDED").get<std::uint64_t>(), 2u);
}

// =============================================================================
// CSVWriter Tests
// =============================================================================

TEST_F(PersistenceTest, CSVWriterCreatesFiles) {
    { CSVWriter writer(test_dir_); }

    EXPECT_TRUE(fs::exists(test_dir_ / "submissions.csv"));
    EXPECT_TRUE(fs::exists(test_dir_ / "outcomes.csv"));
}

TEST_F(PersistenceTest, CSVWriterCreatesMissingDirectory) {
    fs::path nested = test_dir_ / "a" / "b";
    { CSVWriter writer(nested); }

    EXPECT_TRUE(fs::exists(nested / "submissions.csv"));
}

TEST_F(PersistenceTest, CSVWriterWritesHeaders) {
    { CSVWriter writer(test_dir_); }

    auto submissions = read_lines(test_dir_ / "submissions.csv");
    ASSERT_EQ(submissions.size(), 1u);
    EXPECT_EQ(submissions[0],
              "timestamp,signature,status,candidates,unique_accounts,estimated_size,duration_ms");

    auto outcomes = read_lines(test_dir_ / "outcomes.csv");
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0], "timestamp,transaction,ix,candidate,market_index,outcome");
}

TEST_F(PersistenceTest, CSVWriterWritesSubmission) {
    {
        CSVWriter writer(test_dir_);
        writer.write_submission(make_submission());
        writer.write_submission(make_submission(false, ""));
    }

    auto lines = read_lines(test_dir_ / "submissions.csv");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "1000,sig-1,SENT,3,9,640,12");
    EXPECT_EQ(lines[2], "1000,,FAILED,3,9,640,12");
}

TEST_F(PersistenceTest, CSVWriterWritesOutcome) {
    {
        CSVWriter writer(test_dir_);
        writer.write_outcome(make_outcome(FillOutcome::STALE_ORDER, 1));
    }

    auto lines = read_lines(test_dir_ / "outcomes.csv");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "1005,sig-1,1,user-7,2,STALE_ORDER");
}

// =============================================================================
// MetricsCollector Tests
// =============================================================================

TEST(MetricsCollectorTest, CountsCycleHooks) {
    MetricsCollector metrics;
    metrics.on_cycle_start("filler");
    metrics.on_cycle_start("filler");
    metrics.on_gate_busy("filler");
    metrics.on_gate_timeout("filler");
    metrics.on_snapshot_rebuilt("filler", 12);
    metrics.on_snapshot_rebuilt("filler", 8);
    metrics.on_fillable_orders_seen(3);
    metrics.on_fillable_orders_seen(2);

    MetricsSnapshot m = metrics.snapshot();
    EXPECT_EQ(m.cycles, 2u);
    EXPECT_EQ(m.cycles_busy, 1u);
    EXPECT_EQ(m.gate_timeouts, 1u);
    EXPECT_EQ(m.snapshots_rebuilt, 2u);
    EXPECT_EQ(m.last_snapshot_orders, 8u);
    EXPECT_EQ(m.fillable_seen, 5u);
}

TEST(MetricsCollectorTest, CountsRpcAndErrors) {
    MetricsCollector metrics;
    metrics.on_rpc_request("send", "filler");
    metrics.on_rpc_request("send", "filler");
    metrics.on_rpc_request("getTransaction", "filler");
    metrics.on_rpc_duration("paper://local", "send", std::chrono::milliseconds{5}, "filler");
    metrics.on_rpc_duration("paper://local", "send", std::chrono::milliseconds{7}, "filler");
    metrics.on_error_code(6043, "payer", "filler");
    metrics.on_error_code(-1, "payer", "filler");
    metrics.on_error_code(6043, "payer", "filler");

    MetricsSnapshot m = metrics.snapshot();
    EXPECT_EQ(m.rpc_requests["send"], 2u);
    EXPECT_EQ(m.rpc_requests["getTransaction"], 1u);
    EXPECT_EQ(m.rpc_duration_ms["send"], 12u);
    EXPECT_EQ(m.error_codes[6043], 2u);
    EXPECT_EQ(m.error_codes[-1], 1u);
}

TEST(MetricsCollectorTest, CountsSubmissionsAndOutcomes) {
    MetricsCollector metrics;
    metrics.on_submission(make_submission(true));
    metrics.on_submission(make_submission(false, ""));
    metrics.on_outcome(make_outcome(FillOutcome::SUCCEEDED, 0));
    metrics.on_outcome(make_outcome(FillOutcome::COUNTERPARTY_REJECTED, 1));
    metrics.on_outcome(make_outcome(FillOutcome::SUCCEEDED, 2));
    metrics.on_filled_orders("payer", "filler", 2);

    MetricsSnapshot m = metrics.snapshot();
    EXPECT_EQ(m.submissions, 2u);
    EXPECT_EQ(m.failed_submissions, 1u);
    EXPECT_EQ(m.outcomes["SUCCEEDED"], 2u);
    EXPECT_EQ(m.outcomes["COUNTERPARTY_REJECTED"], 1u);
    EXPECT_EQ(m.filled_orders, 2u);
}

TEST(MetricsCollectorTest, FinalizeWithoutOutputIsNoOp) {
    MetricsCollector metrics;
    metrics.on_cycle_start("filler");
    EXPECT_NO_THROW(metrics.finalize());
}

TEST_F(PersistenceTest, MetricsCollectorJournalsAndWritesSummary) {
    {
        MetricsCollector metrics(test_dir_);
        metrics.on_cycle_start("filler");
        metrics.on_submission(make_submission());
        metrics.on_outcome(make_outcome());
        metrics.on_filled_orders("payer", "filler", 1);
        metrics.finalize();
    }

    EXPECT_EQ(read_lines(test_dir_ / "submissions.csv").size(), 2u);
    EXPECT_EQ(read_lines(test_dir_ / "outcomes.csv").size(), 2u);

    ASSERT_TRUE(fs::exists(test_dir_ / "metrics.json"));
    nlohmann::json j = nlohmann::json::parse(read_file(test_dir_ / "metrics.json"));
    EXPECT_EQ(j.at("cycles").get<std::uint64_t>(), 1u);
    EXPECT_EQ(j.at("submissions").get<std::uint64_t>(), 1u);
    EXPECT_EQ(j.at("filled_orders").get<std::uint64_t>(), 1u);
    EXPECT_EQ(j.at("outcomes").at("SUCCEEDED").get<std::uint64_t>(), 1u);
}
