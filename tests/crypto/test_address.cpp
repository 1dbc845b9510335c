// SPECTRE - Solana Address Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Reference program addresses are the ones published with the Solana
// web3.js test suite.

#include <gtest/gtest.h>
#include "spectre/solana/address.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace spectre {
namespace test {

using solana::PublicKey;

namespace {

const char* BPF_LOADER = "BPFLoader1111111111111111111111111111111111";

Bytes Raw(std::initializer_list<Byte> bytes) {
    return Bytes(bytes);
}

} // namespace

// ============================================================================
// PublicKey
// ============================================================================

TEST(PublicKeyTest, Base58RoundTrip) {
    PublicKey key = PublicKey::Parse("9fhQBbumKEFuXtMBDw8AaQyAjCorLGJQiS3skWZdQyQD");
    EXPECT_EQ(key.ToBase58(), "9fhQBbumKEFuXtMBDw8AaQyAjCorLGJQiS3skWZdQyQD");
}

TEST(PublicKeyTest, NativeMint) {
    PublicKey mint = PublicKey::Parse(solana::NATIVE_MINT_ADDRESS);
    for (size_t i = 0; i < 31; ++i) {
        EXPECT_EQ(mint.GetBytes()[i], 0);
    }
    EXPECT_EQ(mint.GetBytes()[31], 1);
}

TEST(PublicKeyTest, RejectsWrongLengthAndAlphabet) {
    EXPECT_FALSE(PublicKey::FromBase58("").has_value());
    EXPECT_FALSE(PublicKey::FromBase58("1111").has_value());
    EXPECT_FALSE(PublicKey::FromBase58("0OIl0OIl0OIl0OIl0OIl0OIl0OIl0OIl").has_value());
    EXPECT_THROW(PublicKey::Parse("not-a-key"), std::invalid_argument);
}

TEST(PublicKeyTest, Ordering) {
    PublicKey a = PublicKey::Parse("11111111111111111111111111111112");
    PublicKey b = PublicKey::Parse(BPF_LOADER);
    EXPECT_TRUE(a < b);
    EXPECT_NE(a, b);
}

// ============================================================================
// Program Derived Addresses
// ============================================================================

TEST(ProgramAddressTest, CreateProgramAddressVectors) {
    PublicKey program = PublicKey::Parse(BPF_LOADER);

    auto a = solana::CreateProgramAddress({Raw({}), Raw({1})}, program);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->ToBase58(), "3gF2KMe9KiC6FNVBmfg9i267aMPvK37FewCip4eGBFcT");

    auto b = solana::CreateProgramAddress({solana::SeedFromString("\xE2\x98\x89")}, program);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->ToBase58(), "7ytmC1nT1xY4RfxCV2ZgyA7UakC93do5ZdyhdF3EtPj7");

    auto c = solana::CreateProgramAddress(
        {solana::SeedFromString("Talking"), solana::SeedFromString("Squirrels")}, program);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->ToBase58(), "HwRVBufQ4haG5XSgpspwKtNd3PC9GM9m1196uJW36vds");

    PublicKey seedKey = PublicKey::Parse("SeedPubey1111111111111111111111111111111111");
    auto d = solana::CreateProgramAddress(
        {Bytes(seedKey.GetBytes().begin(), seedKey.GetBytes().end())}, program);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->ToBase58(), "GUs5qLUfsEHkcMB9T38vjr18ypEhRuNWiePW2LoK4E3K");
}

TEST(ProgramAddressTest, FindProgramAddressSearchesBumps) {
    PublicKey program = PublicKey::Parse(BPF_LOADER);
    solana::ProgramAddress pda = solana::FindProgramAddress({Raw({})}, program);
    EXPECT_EQ(pda.address.ToBase58(), "EXWkUCz3YJU9TDVk39ogA4TwoVsUi75ZDhH6yT7acPgQ");
    EXPECT_EQ(pda.bump, 255);
}

TEST(ProgramAddressTest, SkipsOnCurveCandidates) {
    PublicKey program = PublicKey::Parse("B2at4oGQFPAbuH2wMMpBsFrTvJi71GUvR7jyxny7HaGf");
    PublicKey authority = PublicKey::Parse("SeedPubey1111111111111111111111111111111111");
    Bytes authBytes(authority.GetBytes().begin(), authority.GetBytes().end());

    solana::ProgramAddress pda =
        solana::FindProgramAddress({solana::SeedFromString("spectre_vault"), authBytes}, program);
    EXPECT_EQ(pda.address.ToBase58(), "2GSKMctzuJY1kdtTvq54SL6u1UBoJRhfBUQ416SbmBmG");
    EXPECT_EQ(pda.bump, 252);

    // Bump 255 lands on the curve and is not a valid program address
    EXPECT_FALSE(solana::CreateProgramAddress(
        {solana::SeedFromString("spectre_vault"), authBytes, Raw({255})}, program).has_value());
}

TEST(ProgramAddressTest, IsOnCurve) {
    EXPECT_TRUE(solana::IsOnCurve(
        PublicKey::Parse("B2at4oGQFPAbuH2wMMpBsFrTvJi71GUvR7jyxny7HaGf").GetBytes()));
    EXPECT_FALSE(solana::IsOnCurve(
        PublicKey::Parse("2GSKMctzuJY1kdtTvq54SL6u1UBoJRhfBUQ416SbmBmG").GetBytes()));
}

TEST(ProgramAddressTest, SeedLimits) {
    PublicKey program = PublicKey::Parse(BPF_LOADER);
    EXPECT_THROW(solana::CreateProgramAddress({Bytes(33, 0)}, program), std::invalid_argument);
    std::vector<Bytes> tooMany(solana::MAX_SEEDS + 1, Raw({1}));
    EXPECT_THROW(solana::CreateProgramAddress(tooMany, program), std::invalid_argument);
}

} // namespace test
} // namespace spectre
