#pragma once

#include "exchange/types.hpp"

#include <cstddef>

inline constexpr std::size_t SIGNATURE_SIZE = 64;
inline constexpr std::size_t PUBKEY_SIZE = 32;
inline constexpr std::size_t MESSAGE_HEADER_SIZE = 3;
inline constexpr std::size_t BLOCKHASH_SIZE = 32;

// Hard ledger limit on a serialized transaction; the packer budget stays below it.
inline constexpr std::size_t PACKET_DATA_SIZE = 1232;

/**
 * Bytes occupied by an array of `length` elements of `elem_size` bytes each,
 * serialized with a compact-u16 length prefix.
 *
 *  length  | prefix
 *  --------+-------
 *  0x0000  | [0x00]
 *  0x007f  | [0x7f]
 *  0x0080  | [0x80 0x01]
 *  0x3fff  | [0xff 0x7f]
 *  0x4000  | [0x80 0x80 0x01]
 *
 * An empty array is counted as a one-byte prefix plus one byte.
 */
[[nodiscard]] constexpr std::size_t compact_u16_encoded_size(std::size_t length,
                                                             std::size_t elem_size = 1) {
    if (length > 0x3fff) {
        return 3 + length * elem_size;
    }
    if (length > 0x7f) {
        return 2 + length * elem_size;
    }
    std::size_t payload = length * elem_size;
    return 1 + (payload == 0 ? 1 : payload);
}

/**
 * An instruction is serialized as:
 * - index of the program id in the account table (1 byte)
 * - indices of the affected accounts (compact-u16 array, 1 byte each)
 * - raw instruction data (compact-u16 array)
 */
[[nodiscard]] constexpr std::size_t instruction_encoded_size(std::size_t key_count,
                                                             std::size_t data_length) {
    return 1 + compact_u16_encoded_size(key_count, 1) +
           compact_u16_encoded_size(data_length, 1);
}

[[nodiscard]] inline std::size_t instruction_encoded_size(const Instruction& ix) {
    return instruction_encoded_size(ix.keys.size(), ix.data.size());
}

static_assert(compact_u16_encoded_size(0) == 2);
static_assert(compact_u16_encoded_size(127) == 128);
static_assert(compact_u16_encoded_size(128) == 130);
static_assert(compact_u16_encoded_size(16384) == 16387);
static_assert(compact_u16_encoded_size(1, SIGNATURE_SIZE) == 65);
