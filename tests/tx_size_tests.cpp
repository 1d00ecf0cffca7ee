#include <gtest/gtest.h>

#include "filler/tx_size.hpp"

// =============================================================================
// compact-u16 arrays
// =============================================================================

TEST(TxSizeTest, SingleBytePrefixBelow128) {
    EXPECT_EQ(compact_u16_encoded_size(1), 2u);
    EXPECT_EQ(compact_u16_encoded_size(10), 11u);
    EXPECT_EQ(compact_u16_encoded_size(0x7f), 128u);
}

TEST(TxSizeTest, TwoBytePrefixFrom128) {
    EXPECT_EQ(compact_u16_encoded_size(0x80), 130u);
    EXPECT_EQ(compact_u16_encoded_size(0x3fff), 2u + 0x3fff);
}

TEST(TxSizeTest, ThreeBytePrefixFrom16384) {
    EXPECT_EQ(compact_u16_encoded_size(0x4000), 3u + 0x4000);
}

TEST(TxSizeTest, EmptyArrayCountsTwoBytes) {
    EXPECT_EQ(compact_u16_encoded_size(0), 2u);
    EXPECT_EQ(compact_u16_encoded_size(0, PUBKEY_SIZE), 2u);
}

TEST(TxSizeTest, ElementSizeScalesPayload) {
    EXPECT_EQ(compact_u16_encoded_size(1, SIGNATURE_SIZE), 65u);
    EXPECT_EQ(compact_u16_encoded_size(3, PUBKEY_SIZE), 97u);
    // prefix width follows the element count, not the byte count
    EXPECT_EQ(compact_u16_encoded_size(5, PUBKEY_SIZE), 161u);
    EXPECT_EQ(compact_u16_encoded_size(200, PUBKEY_SIZE), 2u + 200 * PUBKEY_SIZE);
}

// =============================================================================
// Instructions
// =============================================================================

TEST(TxSizeTest, InstructionSize) {
    // program index + key indices + data
    EXPECT_EQ(instruction_encoded_size(2, 16), 1u + 3u + 17u);
    EXPECT_EQ(instruction_encoded_size(0, 9), 1u + 2u + 10u);
}

TEST(TxSizeTest, InstructionSizeFromInstruction) {
    Instruction ix{.program_id = "Prog",
                   .keys = {AccountMeta{.pubkey = "a"}, AccountMeta{.pubkey = "b"},
                            AccountMeta{.pubkey = "a"}},
                   .data = std::vector<std::uint8_t>(24, 0)};

    EXPECT_EQ(instruction_encoded_size(ix), instruction_encoded_size(3, 24));
}

TEST(TxSizeTest, PacketLimit) {
    EXPECT_EQ(PACKET_DATA_SIZE, 1232u);
}
