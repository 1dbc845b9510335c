// SPECTRE - Hex Utility Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/core/hex.h"

#include <array>
#include <stdexcept>
#include <vector>

namespace spectre {
namespace test {

TEST(HexTest, RoundTripLowercase) {
    std::vector<uint8_t> data = {0x00, 0x61, 0x73, 0x6d, 0xff};
    EXPECT_EQ(BytesToHex(data), "0061736dff");
    EXPECT_EQ(HexToBytes("0061736DFF"), data);
}

TEST(HexTest, AcceptsPrefix) {
    EXPECT_EQ(HexToBytes("0x0102"), (std::vector<uint8_t>{0x01, 0x02}));
    EXPECT_TRUE(IsValidHex("0xabcd"));
}

TEST(HexTest, RejectsOddLengthAndBadCharacters) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("0x"));
    EXPECT_FALSE(IsValidHex("gg"));
}

TEST(HexTest, ReverseBytes) {
    std::array<uint8_t, 4> data = {1, 2, 3, 4};
    std::array<uint8_t, 4> expected = {4, 3, 2, 1};
    EXPECT_EQ(ReverseBytes(data), expected);

    std::vector<uint8_t> reversed = ReverseBytes(data.data(), data.size());
    EXPECT_EQ(reversed, (std::vector<uint8_t>{4, 3, 2, 1}));
}

TEST(HexTest, SpacedHexForDiagnostics) {
    const uint8_t header[] = {0x3c, 0x21, 0x44, 0x4f};
    EXPECT_EQ(BytesToSpacedHex(header, sizeof(header)), "3c 21 44 4f");
}

} // namespace test
} // namespace spectre
