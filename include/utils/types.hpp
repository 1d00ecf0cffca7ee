#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <type_traits>

/**
    Strong type over a trivial value. Keeps slots, order ids, prices and
    wall-clock milliseconds from being mixed up at call sites.

    struct Slot : StrongType<std::uint64_t, Slot> {
        using StrongType::StrongType;
    };
*/
template <typename Base, typename Tag> struct StrongType {
    static_assert(std::is_trivial_v<Base>, "The value type must be trivial");
    static_assert(std::is_trivially_copyable_v<Base>);
    using value_type = Base;
    using tag_type = Tag;

public:
    explicit constexpr StrongType(Base value) noexcept : data_m(value) {}

    [[nodiscard]] constexpr auto value() const noexcept { return data_m; }
    explicit constexpr operator Base() const noexcept { return data_m; }

    friend std::ostream& operator<<(std::ostream& os, const StrongType& st) {
        return os << st.data_m;
    }

    constexpr StrongType() noexcept : data_m{} {}

    constexpr auto operator<=>(const StrongType&) const noexcept = default;
    constexpr auto operator<=>(Base other) const noexcept { return data_m <=> other; }
    constexpr bool operator==(Base other) const noexcept { return data_m == other; }
    constexpr bool operator==(const StrongType& other) const noexcept {
        return other.data_m == data_m;
    }

    constexpr Tag operator+(const Tag& other) const noexcept {
        return Tag{static_cast<Base>(data_m + other.data_m)};
    }

    constexpr Tag operator-(const Tag& other) const noexcept {
        return Tag{static_cast<Base>(data_m - other.data_m)};
    }

    constexpr Tag& operator+=(const Tag& other) noexcept {
        data_m += other.data_m;
        return static_cast<Tag&>(*this);
    }

    constexpr Tag& operator+=(Base value) noexcept {
        data_m += value;
        return static_cast<Tag&>(*this);
    }

    constexpr Tag& operator++() noexcept {
        ++data_m;
        return static_cast<Tag&>(*this);
    }

    constexpr Tag operator++(int) noexcept {
        Tag temp = static_cast<Tag&>(*this);
        ++data_m;
        return temp;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept { return data_m == 0; };

protected:
    Base data_m;
};

template <typename T>
concept IsStrongType = requires {
    typename T::value_type;
    typename T::tag_type;
} && std::derived_from<T, StrongType<typename T::value_type, typename T::tag_type>>;

template <typename Tag>
    requires IsStrongType<Tag> && std::formattable<typename Tag::value_type, char>
struct std::formatter<Tag> : std::formatter<typename Tag::value_type> {
    template <typename FormatContext>
    auto format(const Tag& st, FormatContext& ctx) const {
        return std::formatter<typename Tag::value_type>::format(st.value(), ctx);
    }
};

template <typename Strong> struct strong_hash {
    std::size_t operator()(const Strong& v) const noexcept {
        return std::hash<typename Strong::value_type>{}(v.value());
    }
};

// Wall-clock milliseconds
struct Timestamp : StrongType<std::uint64_t, Timestamp> {
    using StrongType::StrongType;
};

// Ledger slot, the venue's logical clock
struct Slot : StrongType<std::uint64_t, Slot> {
    using StrongType::StrongType;
};

// Quote-precision price; zero on an order means "no limit"
struct Price : StrongType<std::int64_t, Price> {
    using StrongType::StrongType;
};

struct Quantity : StrongType<std::uint64_t, Quantity> {
    using StrongType::StrongType;
};

struct OrderID : StrongType<std::uint32_t, OrderID> {
    using StrongType::StrongType;
};

struct MarketIndex : StrongType<std::uint64_t, MarketIndex> {
    using StrongType::StrongType;
};
