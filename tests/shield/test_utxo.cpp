// SPECTRE - Shielded Note Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/crypto/hasher.h"
#include "spectre/shield/utxo.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace spectre {
namespace test {

namespace {

const char* SHIELD_PROGRAM = "9fhQBbumKEFuXtMBDw8AaQyAjCorLGJQiS3skWZdQyQD";
const char* USDC_MINT = "EPjFWdd5AufqSSqeM2qN1xzybapC2G7wEGGkZwyTDt1v";

class UtxoTest : public ::testing::Test {
protected:
    HasherPtr hasher_ = std::make_shared<NativePoseidonHasher>();
    Keypair keypair_ = Keypair::Derive("12345", hasher_);
};

class FakeLookup : public IAccountLookup {
public:
    explicit FakeLookup(std::vector<bool> answer) : answer_(std::move(answer)) {}
    std::vector<bool> AccountsExist(const std::vector<solana::PublicKey>& addresses) override {
        queried = addresses;
        return answer_;
    }
    std::vector<solana::PublicKey> queried;

private:
    std::vector<bool> answer_;
};

} // namespace

TEST_F(UtxoTest, NativeMintFieldIsDecimalLiteral) {
    EXPECT_EQ(MintAddressField(solana::NATIVE_MINT_ADDRESS).ToDecimal(),
              "11111111111111111111111111111112");
}

TEST_F(UtxoTest, SplMintFieldUsesLeading31Bytes) {
    EXPECT_EQ(MintAddressField(USDC_MINT).ToDecimal(),
              "351564470195712479312889784364378094793935933814092299191986968109710327101");
    EXPECT_THROW(MintAddressField("not-base58!"), std::invalid_argument);
}

TEST_F(UtxoTest, CommitmentNullifierGolden) {
    Utxo utxo(1500000000, FieldElement(uint64_t(999999999)), keypair_, 3);
    EXPECT_EQ(utxo.GetCommitment().ToDecimal(),
              "11960252494251578350989014241814938263250319970041787739588078387687827752202");
    EXPECT_EQ(utxo.GetSignature().ToDecimal(),
              "6848207880008260883526367471451006765603089066666888384199747765121621024231");
    EXPECT_EQ(utxo.GetNullifier().ToDecimal(),
              "11706380211033925956948778774288168281396888323945334330467176202244064063411");
}

TEST_F(UtxoTest, SplCommitmentGolden) {
    Utxo utxo(5, FieldElement(uint64_t(7)), keypair_, 0, USDC_MINT);
    EXPECT_EQ(utxo.GetCommitment().ToDecimal(),
              "19526176784307095822131743624394023080817651438601129342669469067076104770607");
}

TEST_F(UtxoTest, CommitmentIndependentOfIndex) {
    Utxo a(10, FieldElement(uint64_t(1)), keypair_, 0);
    Utxo b(10, FieldElement(uint64_t(1)), keypair_, 9);
    EXPECT_EQ(a.GetCommitment(), b.GetCommitment());
    EXPECT_NE(a.GetNullifier(), b.GetNullifier());
}

TEST_F(UtxoTest, BackendsAgree) {
    HasherPtr bignum = std::make_shared<BignumPoseidonHasher>();
    Utxo a(1500000000, FieldElement(uint64_t(999999999)), keypair_, 3);
    Utxo b(1500000000, FieldElement(uint64_t(999999999)), Keypair::Derive("12345", bignum), 3);
    EXPECT_EQ(a.GetNullifier(), b.GetNullifier());
}

TEST_F(UtxoTest, DummyNoteHasZeroAmountAndSmallBlinding) {
    for (int i = 0; i < 20; ++i) {
        Utxo dummy = Utxo::Dummy(keypair_);
        EXPECT_EQ(dummy.GetAmount(), 0u);
        EXPECT_EQ(dummy.GetIndex(), 0u);
        EXPECT_TRUE(dummy.GetBlinding().ToUint256() < Uint256(DUMMY_BLINDING_BOUND));
    }
}

TEST_F(UtxoTest, RandomBlindingsDiffer) {
    EXPECT_NE(Utxo::RandomBlinding(), Utxo::RandomBlinding());
}

TEST_F(UtxoTest, SerializeRoundTrip) {
    Utxo utxo(42, FieldElement(uint64_t(77)), keypair_, 5, USDC_MINT);
    std::string text = utxo.Serialize();
    EXPECT_EQ(text, std::string("42|77|5|") + USDC_MINT);

    Utxo back = Utxo::Deserialize(text, keypair_);
    EXPECT_EQ(back.GetCommitment(), utxo.GetCommitment());
    EXPECT_EQ(back.GetIndex(), 5u);
}

TEST_F(UtxoTest, DeserializeRejectsMalformed) {
    EXPECT_THROW(Utxo::Deserialize("1|2|3", keypair_), std::invalid_argument);
    EXPECT_THROW(Utxo::Deserialize("x|2|3|mint", keypair_), std::invalid_argument);
    EXPECT_THROW(Utxo::Deserialize("1|b|3|mint", keypair_), std::invalid_argument);
    EXPECT_THROW(Utxo::Deserialize("1|2|3|", keypair_), std::invalid_argument);
}

TEST_F(UtxoTest, NullifierAccountsGolden) {
    Utxo utxo(1500000000, FieldElement(uint64_t(999999999)), keypair_, 3);
    auto accounts = NullifierAccounts(utxo, solana::PublicKey::Parse(SHIELD_PROGRAM));
    EXPECT_EQ(accounts[0].ToBase58(), "6WTbqCrGXFKBExf5uCUvZ2FfsazuNsHpiz8dCVbJN1rY");
    EXPECT_EQ(accounts[1].ToBase58(), "FfgGmcvzGg62yfczkLr9vCTt8EXoEsx5C11x1Yz5PmVD");
}

TEST_F(UtxoTest, SpentWhenEitherNullifierAccountExists) {
    Utxo utxo(1, FieldElement(uint64_t(2)), keypair_, 0);
    auto program = solana::PublicKey::Parse(SHIELD_PROGRAM);

    FakeLookup none({false, false});
    EXPECT_FALSE(IsUtxoSpent(utxo, program, none));
    ASSERT_EQ(none.queried.size(), 2u);

    FakeLookup second({false, true});
    EXPECT_TRUE(IsUtxoSpent(utxo, program, second));

    FakeLookup broken({true});
    EXPECT_THROW(IsUtxoSpent(utxo, program, broken), std::runtime_error);
}

} // namespace test
} // namespace spectre
