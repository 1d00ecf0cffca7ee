#pragma once

#include "utils/types.hpp"

#include <atomic>
#include <chrono>

/**
 * Source of wall-clock milliseconds for throttle windows and request timings.
 * sleep_for() is routed through the clock so that retry loops can be driven
 * without real waiting.
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] Timestamp now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
};

/**
 * Clock that only moves when told to. sleep_for() advances time instead of
 * blocking the caller.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp{0}) : current_ms_(start.value()) {}

    ManualClock(const ManualClock&) = delete;
    void operator=(const ManualClock&) = delete;

    [[nodiscard]] Timestamp now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;

    void advance(std::chrono::milliseconds duration) noexcept;
    void set(Timestamp ts) noexcept;

private:
    std::atomic<std::uint64_t> current_ms_;
};

[[nodiscard]] inline std::chrono::milliseconds elapsed_since(const Clock& clock,
                                                             Timestamp start) {
    Timestamp now = clock.now();
    if (now < start) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{(now - start).value()};
}
