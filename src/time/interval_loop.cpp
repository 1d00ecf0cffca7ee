#include "time/interval_loop.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

void IntervalLoop::start(std::chrono::milliseconds interval, Callback callback) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("IntervalLoop interval must be positive");
    }

    std::lock_guard lock(mutex_);
    if (running_) {
        throw std::logic_error("IntervalLoop '" + name_ + "' is already running");
    }
    stop_requested_ = false;
    running_ = true;
    worker_ = std::thread(&IntervalLoop::run_, this, interval, std::move(callback));
}

void IntervalLoop::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    wakeup_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    std::lock_guard lock(mutex_);
    running_ = false;
}

bool IntervalLoop::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

std::uint64_t IntervalLoop::ticks() const {
    std::lock_guard lock(mutex_);
    return ticks_;
}

void IntervalLoop::run_(std::chrono::milliseconds interval, Callback callback) {
    auto next_tick = std::chrono::steady_clock::now() + interval;

    while (true) {
        {
            std::unique_lock lock(mutex_);
            wakeup_.wait_until(lock, next_tick, [this] { return stop_requested_; });
            if (stop_requested_) {
                return;
            }
            ++ticks_;
        }

        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("{} interval tick failed: {}", name_, e.what());
        }

        next_tick += interval;
        auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            next_tick = now;
        }
    }
}
