#include <gtest/gtest.h>

#include "time/clock.hpp"
#include "time/interval_loop.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Polls `done` for up to `timeout`; IntervalLoop runs on its own thread.
template <typename Pred> bool eventually(Pred done, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return done();
}

} // namespace

// =============================================================================
// ManualClock
// =============================================================================

TEST(ManualClockTest, StartsAtGivenTime) {
    ManualClock clock{Timestamp{500}};
    EXPECT_EQ(clock.now(), Timestamp{500});
}

TEST(ManualClockTest, AdvanceAndSet) {
    ManualClock clock;
    clock.advance(250ms);
    EXPECT_EQ(clock.now(), Timestamp{250});

    clock.set(Timestamp{10'000});
    EXPECT_EQ(clock.now(), Timestamp{10'000});
}

TEST(ManualClockTest, SleepAdvancesInsteadOfBlocking) {
    ManualClock clock{Timestamp{100}};
    auto before = std::chrono::steady_clock::now();

    clock.sleep_for(60s);

    EXPECT_EQ(clock.now(), Timestamp{60'100});
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
}

TEST(ElapsedSinceTest, MeasuresClockTime) {
    ManualClock clock{Timestamp{1000}};
    Timestamp start = clock.now();
    clock.advance(42ms);

    EXPECT_EQ(elapsed_since(clock, start), 42ms);
}

TEST(ElapsedSinceTest, StartInFutureIsZero) {
    ManualClock clock{Timestamp{1000}};

    EXPECT_EQ(elapsed_since(clock, Timestamp{2000}), 0ms);
}

TEST(SystemClockTest, ReturnsWallClockMillis) {
    SystemClock clock;
    Timestamp a = clock.now();
    clock.sleep_for(5ms);
    Timestamp b = clock.now();

    // after 2020-01-01
    EXPECT_GT(a.value(), 1'577'836'800'000ULL);
    EXPECT_GE(b, a);
}

// =============================================================================
// IntervalLoop
// =============================================================================

TEST(IntervalLoopTest, TicksRepeatedly) {
    IntervalLoop loop("test");
    std::atomic<int> calls{0};

    loop.start(5ms, [&] { ++calls; });

    EXPECT_TRUE(loop.running());
    EXPECT_TRUE(eventually([&] { return calls.load() >= 3; }));
    loop.stop();
    EXPECT_FALSE(loop.running());
    EXPECT_GE(loop.ticks(), 3u);
}

TEST(IntervalLoopTest, FirstTickWaitsOneInterval) {
    IntervalLoop loop("test");
    std::atomic<int> calls{0};

    loop.start(10s, [&] { ++calls; });
    std::this_thread::sleep_for(20ms);
    loop.stop();

    EXPECT_EQ(calls.load(), 0);
}

TEST(IntervalLoopTest, StopIsPromptAndIdempotent) {
    IntervalLoop loop("test");
    loop.start(10s, [] {});

    auto before = std::chrono::steady_clock::now();
    loop.stop();
    loop.stop();

    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
    EXPECT_FALSE(loop.running());
}

TEST(IntervalLoopTest, CallbackExceptionDoesNotStopLoop) {
    IntervalLoop loop("test");
    std::atomic<int> calls{0};

    loop.start(5ms, [&] {
        ++calls;
        throw std::runtime_error("tick failed");
    });

    EXPECT_TRUE(eventually([&] { return calls.load() >= 2; }));
    loop.stop();
}

TEST(IntervalLoopTest, NonPositiveIntervalRejected) {
    IntervalLoop loop("test");

    EXPECT_THROW(loop.start(0ms, [] {}), std::invalid_argument);
    EXPECT_FALSE(loop.running());
}

TEST(IntervalLoopTest, DoubleStartRejected) {
    IntervalLoop loop("test");
    loop.start(10s, [] {});

    EXPECT_THROW(loop.start(10s, [] {}), std::logic_error);
    loop.stop();
}

TEST(IntervalLoopTest, CanRestartAfterStop) {
    IntervalLoop loop("test");
    std::atomic<int> calls{0};

    loop.start(10s, [] {});
    loop.stop();
    loop.start(5ms, [&] { ++calls; });

    EXPECT_TRUE(eventually([&] { return calls.load() >= 1; }));
    loop.stop();
}
