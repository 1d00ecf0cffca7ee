#pragma once

#include "filler/errors.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <utility>

/**
 * At most one fill cycle in flight. A caller that finds the gate held gets
 * GateBusyError straight away; nothing is queued.
 */
class CycleGate {
public:
    CycleGate() = default;
    CycleGate(const CycleGate&) = delete;
    CycleGate& operator=(const CycleGate&) = delete;

    template <typename Fn> decltype(auto) run_exclusive(Fn&& fn) {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            throw GateBusyError{};
        }
        Release release{running_};
        return std::forward<Fn>(fn)();
    }

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

private:
    struct Release {
        std::atomic<bool>& flag;
        ~Release() { flag.store(false); }
    };

    std::atomic<bool> running_{false};
};

/**
 * Mutual exclusion around rebuilding, querying and editing the order-book
 * snapshot. Waits at most `timeout` for the lock, then throws GateTimeoutError.
 */
class SnapshotGate {
public:
    explicit SnapshotGate(std::chrono::milliseconds timeout) : timeout_(timeout) {}
    SnapshotGate(const SnapshotGate&) = delete;
    SnapshotGate& operator=(const SnapshotGate&) = delete;

    template <typename Fn> decltype(auto) run_exclusive(Fn&& fn) {
        std::unique_lock lock(mutex_, std::defer_lock);
        if (!lock.try_lock_for(timeout_)) {
            throw GateTimeoutError{};
        }
        return std::forward<Fn>(fn)();
    }

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::timed_mutex mutex_;
    std::chrono::milliseconds timeout_;
};
