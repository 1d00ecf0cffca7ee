#pragma once

#include "filler/fill_outcome.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

/**
 * Counters accumulated by MetricsCollector over one run.
 */
struct MetricsSnapshot {
    std::uint64_t cycles{0};
    std::uint64_t cycles_busy{0};
    std::uint64_t gate_timeouts{0};
    std::uint64_t snapshots_rebuilt{0};
    std::uint64_t last_snapshot_orders{0};
    std::uint64_t fillable_seen{0};
    std::uint64_t submissions{0};
    std::uint64_t failed_submissions{0};
    std::uint64_t filled_orders{0};
    std::map<std::string, std::uint64_t> rpc_requests;       // by method
    std::map<std::string, std::uint64_t> rpc_duration_ms;    // summed, by method
    std::map<std::int64_t, std::uint64_t> error_codes;       // -1 = no code
    std::map<std::string, std::uint64_t> outcomes;           // by FillOutcome name
};

inline nlohmann::json to_json(const MetricsSnapshot& m) {
    nlohmann::json error_codes = nlohmann::json::object();
    for (const auto& [code, count] : m.error_codes) {
        error_codes[std::to_string(code)] = count;
    }

    return {{"cycles", m.cycles},
            {"cycles_busy", m.cycles_busy},
            {"gate_timeouts", m.gate_timeouts},
            {"snapshots_rebuilt", m.snapshots_rebuilt},
            {"last_snapshot_orders", m.last_snapshot_orders},
            {"fillable_seen", m.fillable_seen},
            {"submissions", m.submissions},
            {"failed_submissions", m.failed_submissions},
            {"filled_orders", m.filled_orders},
            {"rpc_requests", m.rpc_requests},
            {"rpc_duration_ms", m.rpc_duration_ms},
            {"error_codes", error_codes},
            {"outcomes", m.outcomes}};
}

[[nodiscard]] constexpr const char* submission_status_to_string(bool success) {
    return success ? "SENT" : "FAILED";
}
