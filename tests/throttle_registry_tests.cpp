#include <gtest/gtest.h>

#include "filler/throttle_registry.hpp"
#include "time/clock.hpp"

using namespace std::chrono_literals;

class ThrottleRegistryTest : public ::testing::Test {
protected:
    ManualClock clock{Timestamp{1'000'000}};
    ThrottleRegistry registry{clock};
};

// =============================================================================
// Candidate signatures
// =============================================================================

TEST(CandidateSignatureTest, UserAndOrderId) {
    FillCandidate candidate{
        .node = std::make_shared<OrderNode>(
            OrderNode{.order = Order{.order_id = OrderID{42}}, .user_account = "Alice"}),
        .maker_node = nullptr};

    EXPECT_EQ(candidate_signature(candidate), "Alice-42");
}

TEST(CandidateSignatureTest, VammNodeIsUnknown) {
    FillCandidate candidate{.node = std::make_shared<OrderNode>(OrderNode{}),
                            .maker_node = nullptr};

    EXPECT_EQ(candidate_signature(candidate), UNKNOWN_CANDIDATE_SIGNATURE);
}

TEST(CandidateSignatureTest, NullNodeIsUnknown) {
    EXPECT_EQ(candidate_signature(FillCandidate{}), UNKNOWN_CANDIDATE_SIGNATURE);
}

// =============================================================================
// Backoff window
// =============================================================================

TEST_F(ThrottleRegistryTest, UnknownSignatureNotThrottled) {
    EXPECT_FALSE(registry.is_throttled("Alice-1", clock.now(), 10s));
}

TEST_F(ThrottleRegistryTest, RecordedAttemptThrottlesWithinBackoff) {
    registry.record_attempt("Alice-1");
    clock.advance(9999ms);

    EXPECT_TRUE(registry.is_throttled("Alice-1", clock.now(), 10s));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ThrottleRegistryTest, ExpiredEntryIsEvictedOnLookup) {
    registry.record_attempt("Alice-1");
    clock.advance(10s);

    EXPECT_FALSE(registry.is_throttled("Alice-1", clock.now(), 10s));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.last_attempt("Alice-1").has_value());
}

TEST_F(ThrottleRegistryTest, ZeroBackoffNeverThrottles) {
    registry.record_attempt("Alice-1");

    EXPECT_FALSE(registry.is_throttled("Alice-1", clock.now(), 0ms));
}

TEST_F(ThrottleRegistryTest, RecordUsesClockTime) {
    registry.record_attempt("Alice-1");

    ASSERT_TRUE(registry.last_attempt("Alice-1").has_value());
    EXPECT_EQ(*registry.last_attempt("Alice-1"), Timestamp{1'000'000});
}

TEST_F(ThrottleRegistryTest, ReRecordingRestartsWindow) {
    registry.record_attempt("Alice-1");
    clock.advance(8s);
    registry.record_attempt("Alice-1");
    clock.advance(8s);

    EXPECT_TRUE(registry.is_throttled("Alice-1", clock.now(), 10s));
}

TEST_F(ThrottleRegistryTest, FutureAttemptCountsAsJustNow) {
    registry.record_attempt("Alice-1");

    EXPECT_TRUE(registry.is_throttled("Alice-1", Timestamp{999'000}, 10s));
}

TEST_F(ThrottleRegistryTest, SignaturesAreIndependent) {
    registry.record_attempt("Alice-1");

    EXPECT_TRUE(registry.is_throttled("Alice-1", clock.now(), 10s));
    EXPECT_FALSE(registry.is_throttled("Alice-2", clock.now(), 10s));
    EXPECT_FALSE(registry.is_throttled("Bob-1", clock.now(), 10s));
}

// =============================================================================
// Unknown signature
// =============================================================================

TEST_F(ThrottleRegistryTest, UnknownCandidateNeverRecorded) {
    registry.record_attempt(UNKNOWN_CANDIDATE_SIGNATURE);

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.is_throttled(UNKNOWN_CANDIDATE_SIGNATURE, clock.now(), 10s));
}

TEST_F(ThrottleRegistryTest, ClearDropsEverything) {
    registry.record_attempt("Alice-1");
    registry.record_attempt("Bob-3");
    registry.clear();

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.is_throttled("Alice-1", clock.now(), 10s));
}
