#pragma once

#include "exchange/types.hpp"
#include "utils/types.hpp"

#include <type_traits>
#include <variant>

// A user placed an order; the directory must learn it before the next cycle.
struct OrderCreated {
    OrderRecord record;
};

// A new user registered on the venue.
struct AccountCreated {
    Timestamp ts;
    PublicKey authority;
};

using FillerEvent = std::variant<OrderCreated, AccountCreated>;

inline Timestamp get_timestamp(const FillerEvent& event) {
    return std::visit(
        [](const auto& e) {
            if constexpr (std::is_same_v<std::decay_t<decltype(e)>, OrderCreated>) {
                return e.record.ts;
            } else {
                return e.ts;
            }
        },
        event);
}
