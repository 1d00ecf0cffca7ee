#include "time/clock.hpp"

#include <thread>

Timestamp SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count())};
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

Timestamp ManualClock::now() const {
    return Timestamp{current_ms_.load()};
}

void ManualClock::sleep_for(std::chrono::milliseconds duration) {
    advance(duration);
}

void ManualClock::advance(std::chrono::milliseconds duration) noexcept {
    current_ms_ += static_cast<std::uint64_t>(duration.count());
}

void ManualClock::set(Timestamp ts) noexcept {
    current_ms_ = ts.value();
}
