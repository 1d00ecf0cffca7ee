#include "filler/batch_packer.hpp"
#include "filler/tx_size.hpp"

namespace {

constexpr std::uint8_t REQUEST_UNITS_TAG = 0x00;

void append_u32_le(std::vector<std::uint8_t>& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
    }
}

} // namespace

Instruction make_compute_budget_instruction(std::uint32_t units,
                                            std::uint32_t additional_fee) {
    Instruction ix{.program_id = COMPUTE_BUDGET_PROGRAM_ID, .keys = {}, .data = {}};
    ix.data.reserve(9);
    ix.data.push_back(REQUEST_UNITS_TAG);
    append_u32_le(ix.data, units);
    append_u32_le(ix.data, additional_fee);
    return ix;
}

PackedBatch BatchPacker::pack(const PublicKey& fee_payer,
                              std::span<const FillCandidate> candidates,
                              const InstructionResolver& resolve) const {
    PackedBatch batch;
    batch.transaction.fee_payer = fee_payer;

    // fee payer goes first
    batch.unique_accounts.insert(fee_payer);

    Instruction compute_budget_ix =
        make_compute_budget_instruction(compute_units_, compute_unit_fee_);
    for (const auto& key : compute_budget_ix.keys) {
        batch.unique_accounts.insert(key.pubkey);
    }
    batch.unique_accounts.insert(compute_budget_ix.program_id);

    std::size_t running_size = 0;
    running_size += compact_u16_encoded_size(1, SIGNATURE_SIZE);
    running_size += MESSAGE_HEADER_SIZE;
    running_size += compact_u16_encoded_size(batch.unique_accounts.size(), PUBKEY_SIZE);
    running_size += BLOCKHASH_SIZE;
    running_size += instruction_encoded_size(compute_budget_ix);
    batch.transaction.instructions.push_back(std::move(compute_budget_ix));
    batch.envelope_size = running_size;

    for (const auto& candidate : candidates) {
        Instruction ix = resolve(candidate);

        // keys already in the table cost nothing; a key repeated inside this
        // instruction is counted each time it appears
        std::vector<PublicKey> new_accounts;
        for (const auto& key : ix.keys) {
            if (!batch.unique_accounts.contains(key.pubkey)) {
                new_accounts.push_back(key.pubkey);
            }
        }
        if (!batch.unique_accounts.contains(ix.program_id)) {
            new_accounts.push_back(ix.program_id);
        }

        std::size_t ix_cost = instruction_encoded_size(ix);
        std::size_t accounts_cost =
            new_accounts.empty()
                ? 0
                : compact_u16_encoded_size(new_accounts.size(), PUBKEY_SIZE) - 1;

        // the ledger rejects a transaction of exactly max size
        if (running_size + ix_cost + accounts_cost >= max_tx_size_) {
            break;
        }

        running_size += ix_cost + accounts_cost;
        for (auto& key : new_accounts) {
            batch.unique_accounts.insert(std::move(key));
        }
        batch.transaction.instructions.push_back(std::move(ix));
        batch.candidates.push_back(candidate);
    }

    batch.estimated_size = running_size;
    return batch;
}
