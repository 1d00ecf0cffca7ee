#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/**
 * Fixed-interval timer running a callback on a dedicated thread.
 *
 * The first tick fires one interval after start(). A tick that is still running
 * when the next one is due is not doubled up; the loop simply waits for it.
 * Exceptions escaping the callback are logged and the loop keeps going.
 */
class IntervalLoop {
public:
    using Callback = std::function<void()>;

    explicit IntervalLoop(std::string name) : name_(std::move(name)) {}
    ~IntervalLoop() { stop(); }

    IntervalLoop(const IntervalLoop&) = delete;
    IntervalLoop& operator=(const IntervalLoop&) = delete;

    void start(std::chrono::milliseconds interval, Callback callback);
    void stop();

    [[nodiscard]] bool running() const;
    [[nodiscard]] std::uint64_t ticks() const;

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::thread worker_;
    bool stop_requested_{false};
    bool running_{false};
    std::uint64_t ticks_{0};

    void run_(std::chrono::milliseconds interval, Callback callback);
};
