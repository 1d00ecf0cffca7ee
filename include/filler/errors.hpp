#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Submission or fetch failed at the transport/protocol layer. Carries the
 * program error code and name when the ledger reported one, and the raw
 * diagnostic log lines of the failed simulation.
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message,
                            std::optional<std::uint32_t> code = std::nullopt,
                            std::string error_name = {},
                            std::vector<std::string> logs = {})
        : std::runtime_error(message), code_(code), error_name_(std::move(error_name)),
          logs_(std::move(logs)) {}

    [[nodiscard]] std::optional<std::uint32_t> code() const noexcept { return code_; }
    [[nodiscard]] const std::string& error_name() const noexcept { return error_name_; }
    [[nodiscard]] const std::vector<std::string>& logs() const noexcept { return logs_; }

private:
    std::optional<std::uint32_t> code_;
    std::string error_name_;
    std::vector<std::string> logs_;
};

// The referenced order no longer exists on the ledger.
class StaleOrderError : public TransportError {
public:
    explicit StaleOrderError(const std::string& message,
                             std::optional<std::uint32_t> code = std::nullopt,
                             std::vector<std::string> logs = {})
        : TransportError(message, code, "OrderDoesNotExist", std::move(logs)) {}
};

class GateBusyError : public std::runtime_error {
public:
    GateBusyError() : std::runtime_error("fill cycle already running") {}
};

class GateTimeoutError : public std::runtime_error {
public:
    GateTimeoutError() : std::runtime_error("order book snapshot lock timeout") {}
};

class AccountNotFoundError : public std::runtime_error {
public:
    explicit AccountNotFoundError(const std::string& key)
        : std::runtime_error("account not found: " + key) {}
};

inline constexpr const char* STALE_ORDER_LOG = "Order does not exist";
inline constexpr const char* AMM_CANNOT_FULFILL_LOG = "Amm cant fulfill order";

[[nodiscard]] inline bool indicates_stale_order(const TransportError& error) {
    if (dynamic_cast<const StaleOrderError*>(&error) != nullptr ||
        error.error_name() == "OrderDoesNotExist") {
        return true;
    }
    return std::ranges::any_of(error.logs(), [](const std::string& line) {
        return line.find(STALE_ORDER_LOG) != std::string::npos;
    });
}

// -1 when the ledger did not report a program error code
[[nodiscard]] inline std::int64_t error_code_of(const TransportError& error) {
    return error.code() ? static_cast<std::int64_t>(*error.code()) : -1;
}
