// SPECTRE - Circuit Input Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/crypto/hasher.h"
#include "spectre/prover/errors.h"
#include "spectre/shield/circuit_input.h"

#include <memory>
#include <stdexcept>
#include <string>

namespace spectre {
namespace test {

namespace {

const char* RECIPIENT = "9fhQBbumKEFuXtMBDw8AaQyAjCorLGJQiS3skWZdQyQD";

} // namespace

// ============================================================================
// Operation and Public Amount
// ============================================================================

TEST(OperationTest, ParseKnownNames) {
    EXPECT_TRUE(ParseOperation("deposit") == Operation::Deposit);
    EXPECT_TRUE(ParseOperation("withdraw") == Operation::Withdraw);
    EXPECT_FALSE(ParseOperation("Deposit").has_value());
    EXPECT_FALSE(ParseOperation("").has_value());
    EXPECT_STREQ(OperationToString(Operation::Withdraw), "withdraw");
}

TEST(PublicAmountTest, DepositIsLamports) {
    EXPECT_EQ(DepositPublicAmount(1500000000).ToDecimal(), "1500000000");
}

TEST(PublicAmountTest, WithdrawWrapsModP) {
    EXPECT_EQ(WithdrawPublicAmount(1000000, 3000).ToDecimal(),
              "21888242871839275222246405745257275088548364400416034343698204186575807498617");
    EXPECT_EQ(WithdrawPublicAmount(1000000, 3000) + FieldElement(uint64_t(1000000)),
              FieldElement(uint64_t(3000)));
    EXPECT_TRUE(WithdrawPublicAmount(5, 5).IsZero());
}

TEST(PublicAmountTest, WithdrawFeeBasisPoints) {
    EXPECT_EQ(ComputeWithdrawFee(1000000, 30), 3000u);
    EXPECT_EQ(ComputeWithdrawFee(9999, 30), 29u);
    EXPECT_EQ(ComputeWithdrawFee(0, 30), 0u);
    EXPECT_EQ(ComputeWithdrawFee(UINT64_MAX, 10000), UINT64_MAX);
    EXPECT_THROW(ComputeWithdrawFee(1, 10001), std::invalid_argument);
}

// ============================================================================
// Builder
// ============================================================================

class CircuitInputBuilderTest : public ::testing::Test {
protected:
    static constexpr size_t DEPTH = 4;

    HasherPtr hasher_ = std::make_shared<NativePoseidonHasher>();
    Keypair keypair_ = Keypair::Derive("12345", hasher_);
    CircuitInputBuilder builder_{hasher_, DEPTH};

    CircuitInputParams DepositParams() {
        CircuitInputParams params;
        params.operation = Operation::Deposit;
        params.inputs = {Utxo::Dummy(keypair_), Utxo::Dummy(keypair_)};
        params.outputs = {
            Utxo(1500000000, FieldElement(uint64_t(999999999)), keypair_),
            Utxo::Dummy(keypair_)
        };
        params.root = FieldElement(uint64_t(77));
        params.inputMerklePaths = {builder_.ZeroPath(), builder_.ZeroPath()};
        params.inputMerklePathIndices = {0, 0};
        params.extData.recipient = RECIPIENT;
        params.extData.extAmount = "1500000000";
        params.extData.encryptedOutput1 = Bytes(40, 1);
        params.extData.encryptedOutput2 = Bytes(40, 2);
        params.publicAmount = DepositPublicAmount(1500000000);
        return params;
    }
};

TEST_F(CircuitInputBuilderTest, ZeroPathMatchesDepth) {
    auto path = builder_.ZeroPath();
    ASSERT_EQ(path.size(), DEPTH);
    for (const auto& e : path) EXPECT_TRUE(e.IsZero());
}

TEST_F(CircuitInputBuilderTest, BuildsSignalsFromNotes) {
    CircuitInputParams params = DepositParams();
    CircuitInput input = builder_.Build(params);

    EXPECT_EQ(input.root, FieldElement(uint64_t(77)));
    EXPECT_EQ(input.publicAmount.ToDecimal(), "1500000000");
    EXPECT_EQ(input.inputNullifier[0], params.inputs[0].GetNullifier());
    EXPECT_EQ(input.inputNullifier[1], params.inputs[1].GetNullifier());
    EXPECT_EQ(input.outputCommitment[0].ToDecimal(),
              "11960252494251578350989014241814938263250319970041787739588078387687827752202");
    EXPECT_EQ(input.outPubkey[0], keypair_.GetPublicKey());
    EXPECT_EQ(input.inPrivateKey[1], keypair_.GetPrivateKey());
    EXPECT_EQ(input.extDataHash, ComputeExtDataHash(*hasher_, params.extData));
    EXPECT_EQ(input.mintAddress.ToDecimal(), "11111111111111111111111111111112");
}

TEST_F(CircuitInputBuilderTest, ToJSONUsesDecimalStrings) {
    JSONValue json = builder_.Build(DepositParams()).ToJSON();

    EXPECT_EQ(json["root"].GetString(), "77");
    EXPECT_EQ(json["outAmount"][0].GetString(), "1500000000");
    EXPECT_EQ(json["outAmount"][1].GetString(), "0");
    ASSERT_EQ(json["inPathElements"].Size(), 2u);
    EXPECT_EQ(json["inPathElements"][0].Size(), DEPTH);
    EXPECT_EQ(json["inPathIndices"][1].GetString(), "0");

    for (const char* key : {"inputNullifier", "outputCommitment", "publicAmount",
                            "extDataHash", "inAmount", "inBlinding", "outBlinding",
                            "outPubkey", "mintAddress", "inPrivateKey"}) {
        EXPECT_TRUE(json.HasKey(key)) << key;
    }
}

TEST_F(CircuitInputBuilderTest, RejectsWrongArity) {
    CircuitInputParams params = DepositParams();
    params.inputs.pop_back();
    EXPECT_THROW(builder_.Build(params), ValidationError);

    params = DepositParams();
    params.outputs.push_back(Utxo::Dummy(keypair_));
    EXPECT_THROW(builder_.Build(params), ValidationError);

    params = DepositParams();
    params.inputMerklePathIndices.pop_back();
    EXPECT_THROW(builder_.Build(params), ValidationError);
}

TEST_F(CircuitInputBuilderTest, RejectsWrongPathLength) {
    CircuitInputParams params = DepositParams();
    params.inputMerklePaths[1].push_back(FieldElement::Zero());
    EXPECT_THROW(builder_.Build(params), ValidationError);
}

TEST_F(CircuitInputBuilderTest, BadExtDataBecomesValidationError) {
    CircuitInputParams params = DepositParams();
    params.extData.extAmount = "1.5";
    try {
        builder_.Build(params);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.GetStage(), ErrorStage::Validation);
    }
}

TEST_F(CircuitInputBuilderTest, BadNoteMintBecomesValidationError) {
    auto expectRejected = [this](CircuitInputParams params, const std::string& where) {
        try {
            builder_.Build(params);
            ADD_FAILURE() << "Expected ValidationError for " << where;
        } catch (const ValidationError& e) {
            EXPECT_EQ(e.GetStage(), ErrorStage::Validation);
            EXPECT_EQ(std::string(e.what()).rfind(where + ": Invalid Solana address", 0), 0u)
                << e.what();
        }
    };

    CircuitInputParams params = DepositParams();
    params.inputs[1] = Utxo::Dummy(keypair_, "0OIl");
    expectRejected(params, "inputs[1]");

    params = DepositParams();
    params.outputs[0] = Utxo(1500000000, FieldElement(uint64_t(999999999)), keypair_, 0, "0OIl");
    expectRejected(params, "outputs[0]");

    params = DepositParams();
    params.outputs[1] = Utxo::Dummy(keypair_, "not-a-mint");
    expectRejected(params, "outputs[1]");
}

} // namespace test
} // namespace spectre
