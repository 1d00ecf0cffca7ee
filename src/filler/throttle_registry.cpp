#include "filler/throttle_registry.hpp"

std::string candidate_signature(const FillCandidate& candidate) {
    if (!candidate.node || !candidate.node->user_account) {
        return UNKNOWN_CANDIDATE_SIGNATURE;
    }
    return *candidate.node->user_account + "-" +
           std::to_string(candidate.node->order.order_id.value());
}

void ThrottleRegistry::record_attempt(const std::string& signature) {
    if (signature == UNKNOWN_CANDIDATE_SIGNATURE) {
        return;
    }
    std::lock_guard lock(mutex_);
    last_attempts_[signature] = clock_.now();
}

bool ThrottleRegistry::is_throttled(const std::string& signature, Timestamp now,
                                    std::chrono::milliseconds backoff) {
    if (signature == UNKNOWN_CANDIDATE_SIGNATURE) {
        return false;
    }

    std::lock_guard lock(mutex_);
    auto it = last_attempts_.find(signature);
    if (it == last_attempts_.end()) {
        return false;
    }

    // an attempt recorded "in the future" (clock skew) counts as just now
    std::uint64_t since = now > it->second ? (now - it->second).value() : 0;
    if (since < static_cast<std::uint64_t>(backoff.count())) {
        return true;
    }

    last_attempts_.erase(it);
    return false;
}

std::optional<Timestamp> ThrottleRegistry::last_attempt(const std::string& signature) const {
    std::lock_guard lock(mutex_);
    auto it = last_attempts_.find(signature);
    if (it == last_attempts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ThrottleRegistry::size() const {
    std::lock_guard lock(mutex_);
    return last_attempts_.size();
}

void ThrottleRegistry::clear() {
    std::lock_guard lock(mutex_);
    last_attempts_.clear();
}
