#pragma once

#include <cstdint>

enum class FillOutcome : std::uint8_t {
    SUCCEEDED = 0,
    STALE_ORDER,
    COUNTERPARTY_REJECTED,
    UNPARSED
};

[[nodiscard]] constexpr const char* fill_outcome_to_string(FillOutcome outcome) {
    switch (outcome) {
        case FillOutcome::SUCCEEDED: return "SUCCEEDED";
        case FillOutcome::STALE_ORDER: return "STALE_ORDER";
        case FillOutcome::COUNTERPARTY_REJECTED: return "COUNTERPARTY_REJECTED";
        case FillOutcome::UNPARSED: return "UNPARSED";
    }
    return "UNKNOWN";
}
