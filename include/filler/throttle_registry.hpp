#pragma once

#include "exchange/types.hpp"
#include "time/clock.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

inline constexpr const char* UNKNOWN_CANDIDATE_SIGNATURE = "~";

// "<user account>-<order id>", or "~" for a node without a user account.
[[nodiscard]] std::string candidate_signature(const FillCandidate& candidate);

/**
 * Last fill attempt per candidate signature.
 *
 * An entry suppresses new attempts for `backoff` after it was recorded and is
 * evicted by the first lookup that finds it expired. The "~" signature is
 * never recorded. Safe to call from several threads.
 */
class ThrottleRegistry {
public:
    explicit ThrottleRegistry(Clock& clock) : clock_(clock) {}

    ThrottleRegistry(const ThrottleRegistry&) = delete;
    ThrottleRegistry& operator=(const ThrottleRegistry&) = delete;

    void record_attempt(const std::string& signature);

    [[nodiscard]] bool is_throttled(const std::string& signature, Timestamp now,
                                    std::chrono::milliseconds backoff);

    [[nodiscard]] std::optional<Timestamp> last_attempt(const std::string& signature) const;
    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    Clock& clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Timestamp> last_attempts_;
};
