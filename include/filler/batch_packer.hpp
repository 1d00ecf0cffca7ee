#pragma once

#include "exchange/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <unordered_set>
#include <vector>

inline constexpr const char* COMPUTE_BUDGET_PROGRAM_ID =
    "ComputeBudget111111111111111111111111111111";

// Preamble instruction raising the transaction's compute budget.
[[nodiscard]] Instruction make_compute_budget_instruction(std::uint32_t units,
                                                          std::uint32_t additional_fee);

struct PackedBatch {
    Transaction transaction;            // preamble + accepted fill instructions
    std::vector<FillCandidate> candidates;
    std::unordered_set<PublicKey> unique_accounts;
    std::size_t estimated_size{0};
    std::size_t envelope_size{0};

    [[nodiscard]] bool empty() const { return candidates.empty(); }
};

using InstructionResolver = std::function<Instruction(const FillCandidate&)>;

/**
 * Greedily fills one transaction with fill instructions, in offer order, while
 * the estimated serialized size stays strictly below `max_tx_size`.
 *
 * The running size starts at the envelope: one signature, the message header,
 * the account table (fee payer + compute-budget program), the blockhash and the
 * compute-budget preamble. Each candidate adds its instruction size plus the
 * account-table growth for keys not seen before. Packing stops at the first
 * candidate that does not fit; later, smaller candidates are not tried.
 */
class BatchPacker {
public:
    BatchPacker(std::size_t max_tx_size, std::uint32_t compute_units,
                std::uint32_t compute_unit_fee)
        : max_tx_size_(max_tx_size), compute_units_(compute_units),
          compute_unit_fee_(compute_unit_fee) {}

    [[nodiscard]] PackedBatch pack(const PublicKey& fee_payer,
                                   std::span<const FillCandidate> candidates,
                                   const InstructionResolver& resolve) const;

    [[nodiscard]] std::size_t max_tx_size() const noexcept { return max_tx_size_; }

private:
    std::size_t max_tx_size_;
    std::uint32_t compute_units_;
    std::uint32_t compute_unit_fee_;
};
