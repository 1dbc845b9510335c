// SPECTRE - Proof Service Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/crypto/hasher.h"
#include "spectre/prover/service.h"
#include "spectre/util/fs.h"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace spectre {
namespace test {

namespace {

const char* RECIPIENT = "9fhQBbumKEFuXtMBDw8AaQyAjCorLGJQiS3skWZdQyQD";
constexpr size_t DEPTH = 4;

class FakeBackend : public IGroth16Backend {
public:
    const char* Name() const override { return "fake"; }

    ProofOutput FullProve(const JSONValue& input, const CircuitArtifacts& artifacts) override {
        std::lock_guard<std::mutex> lock(mutex);
        inputs.push_back(input);
        artifactSource = artifacts.source;
        if (fail) throw ProvingError("constraint not satisfied");

        ProofOutput out;
        out.proof.a.x = Uint256(1);
        out.proof.a.y = Uint256(2);
        out.proof.b.x = {Uint256(3), Uint256(4)};
        out.proof.b.y = {Uint256(5), Uint256(6)};
        out.proof.c.x = Uint256(7);
        out.proof.c.y = Uint256(8);
        out.publicSignals = {input["root"].GetString(), input["publicAmount"].GetString()};
        return out;
    }

    std::mutex mutex;
    std::vector<JSONValue> inputs;
    std::string artifactSource;
    bool fail{false};
};

class NullEncryptor : public INoteEncryptor {
public:
    Bytes Encrypt(const std::string& note) override { return Bytes(note.begin(), note.end()); }
};

} // namespace

// ============================================================================
// ProveResult
// ============================================================================

TEST(ProveResultTest, MissingFieldsHasNoMessage) {
    ProveResult result = ProveResult::FromError(ValidationError(MISSING_FIELDS_ERROR));
    EXPECT_EQ(result.HttpStatus(), 400);
    EXPECT_EQ(result.ToJSON().ToJSON(), R"({"error":"Missing required fields"})");
}

TEST(ProveResultTest, ValidationFailureIsInvalidRequest) {
    ProveResult result = ProveResult::FromError(ValidationError("Invalid request: root is required"));
    EXPECT_EQ(result.HttpStatus(), 400);
    JSONValue json = result.ToJSON();
    EXPECT_EQ(json["error"].GetString(), "Invalid request");
    EXPECT_EQ(json["message"].GetString(), "Invalid request: root is required");
    EXPECT_FALSE(json.HasKey("stage"));
}

TEST(ProveResultTest, PipelineFailureNamesStage) {
    ProveResult result = ProveResult::FromError(ArtifactError("Invalid WASM file"));
    EXPECT_FALSE(result.IsSuccess());
    EXPECT_EQ(result.HttpStatus(), 500);
    JSONValue json = result.ToJSON();
    EXPECT_EQ(json["error"].GetString(), "Proof generation failed");
    EXPECT_EQ(json["message"].GetString(), "Invalid WASM file");
    EXPECT_EQ(json["stage"].GetString(), "artifacts");
}

TEST(ProveResultTest, StageNames) {
    EXPECT_STREQ(ErrorStageToString(ErrorStage::HashInit), "hash-init");
    EXPECT_STREQ(ErrorStageToString(ErrorStage::CircuitInput), "circuit-input");
    EXPECT_STREQ(ErrorStageToString(ErrorStage::Formatting), "formatting");
}

// ============================================================================
// ProveService
// ============================================================================

class ProveServiceTest : public ::testing::Test {
protected:
    util::fs::TempDirectory circuitDir_;
    std::shared_ptr<FakeBackend> backend_ = std::make_shared<FakeBackend>();
    HasherPtr hasher_ = std::make_shared<NativePoseidonHasher>();
    Keypair keypair_ = Keypair::Derive("12345", hasher_);
    NullEncryptor encryptor_;
    std::shared_ptr<ProverContext> context_;
    std::unique_ptr<ProveService> service_;

    void SetUp() override {
        const Bytes wasm = {0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00};
        const Bytes zkey = {0x7a, 0x6b, 0x65, 0x79};
        ASSERT_TRUE(util::fs::WriteFile(circuitDir_.GetPath() / "transaction2.wasm",
                                        wasm.data(), wasm.size()));
        ASSERT_TRUE(util::fs::WriteFile(circuitDir_.GetPath() / "transaction2.zkey",
                                        zkey.data(), zkey.size()));
        MakeService(circuitDir_.GetPath());
    }

    void MakeService(const util::fs::Path& circuits) {
        ProverOptions options;
        options.circuits.localDirs = {circuits};
        options.circuits.remoteBase = "";
        options.treeDepth = DEPTH;

        auto loader = std::make_shared<CircuitAssetLoader>(options.circuits, nullptr);
        context_ = std::make_shared<ProverContext>(options, HasherHandle::FromInstance(hasher_),
                                                   loader, backend_);
        service_ = std::make_unique<ProveService>(context_);
    }

    ProveRequest DepositRequest() {
        return BuildDepositRequest(1500000000, keypair_, RECIPIENT,
                                   TreeState{FieldElement(uint64_t(4242)), 0}, {}, encryptor_,
                                   solana::NATIVE_MINT_ADDRESS, DEPTH);
    }
};

TEST_F(ProveServiceTest, DepositEndToEnd) {
    ProveRequest request = DepositRequest();
    std::vector<LoadStage> stages;
    ProveResult result = service_->Prove(request.ToJSON(),
                                         [&](const LoadProgress& p) { stages.push_back(p.stage); });

    ASSERT_TRUE(result.IsSuccess()) << result.ToJSON().ToJSON();
    EXPECT_EQ(result.HttpStatus(), 200);
    ASSERT_FALSE(stages.empty());
    EXPECT_EQ(stages.back(), LoadStage::Ready);

    ASSERT_EQ(backend_->inputs.size(), 1u);
    const JSONValue& input = backend_->inputs[0];
    EXPECT_EQ(input["publicAmount"].GetString(), "1500000000");
    EXPECT_EQ(input["root"].GetString(), "4242");
    EXPECT_EQ(input["inPathElements"][0].Size(), DEPTH);
    EXPECT_EQ(backend_->artifactSource, circuitDir_.GetPath().string());

    Utxo output(1500000000, FieldElement::FromDecimal(request.outputs[0].blinding), keypair_, 0);
    EXPECT_EQ(input["outputCommitment"][0].GetString(), output.GetCommitment().ToDecimal());

    JSONValue json = result.ToJSON();
    EXPECT_EQ(json["publicSignals"][1].GetString(), "1500000000");
    EXPECT_EQ(json["proofBytes"]["proofB"].Size(), 128u);
    EXPECT_EQ(json["publicInputsBytes"].Size(), 2u);
}

TEST_F(ProveServiceTest, ArtifactsLoadedOnce) {
    ProveRequest request = DepositRequest();
    EXPECT_TRUE(service_->Prove(request).IsSuccess());
    EXPECT_TRUE(context_->GetLoader().IsLoaded());
    EXPECT_TRUE(service_->Prove(request).IsSuccess());
    EXPECT_EQ(backend_->inputs.size(), 2u);
}

TEST_F(ProveServiceTest, MissingFieldsStopsBeforeLoading) {
    ProveResult result = service_->Prove(JSONValue::Parse(R"({"inputs": []})"));
    EXPECT_EQ(result.HttpStatus(), 400);
    EXPECT_EQ(result.GetFailure().error, MISSING_FIELDS_ERROR);
    EXPECT_FALSE(context_->GetLoader().IsLoaded());
    EXPECT_TRUE(backend_->inputs.empty());
}

TEST_F(ProveServiceTest, MalformedRequestIsValidationFailure) {
    JSONValue body = DepositRequest().ToJSON();
    body["root"] = "not-a-number";
    ProveResult result = service_->Prove(body);
    EXPECT_EQ(result.HttpStatus(), 400);
    EXPECT_EQ(result.GetFailure().stage, ErrorStage::Validation);
    EXPECT_TRUE(backend_->inputs.empty());
}

TEST_F(ProveServiceTest, MissingCircuitsFailAtArtifacts) {
    util::fs::TempDirectory empty;
    MakeService(empty.GetPath());

    ProveResult result = service_->Prove(DepositRequest());
    EXPECT_EQ(result.HttpStatus(), 500);
    EXPECT_EQ(result.GetFailure().stage, ErrorStage::Artifacts);
    EXPECT_TRUE(backend_->inputs.empty());
}

TEST_F(ProveServiceTest, BadWasmFailsAtArtifacts) {
    util::fs::TempDirectory bad;
    const std::string notWasm = "<html>";
    ASSERT_TRUE(util::fs::WriteFile(bad.GetPath() / "transaction2.wasm", notWasm));
    ASSERT_TRUE(util::fs::WriteFile(bad.GetPath() / "transaction2.zkey", "zkey"));
    MakeService(bad.GetPath());

    ProveResult result = service_->Prove(DepositRequest());
    EXPECT_EQ(result.GetFailure().stage, ErrorStage::Artifacts);
    EXPECT_NE(result.GetFailure().message.find("Got header: 3c 68 74 6d"), std::string::npos);
}

TEST_F(ProveServiceTest, BackendFailureIsProvingStage) {
    backend_->fail = true;
    ProveResult result = service_->Prove(DepositRequest());
    EXPECT_EQ(result.HttpStatus(), 500);
    EXPECT_EQ(result.GetFailure().stage, ErrorStage::Proving);
    EXPECT_EQ(result.GetFailure().message, "constraint not satisfied");
    EXPECT_EQ(result.ToJSON()["stage"].GetString(), "proving");
}

TEST_F(ProveServiceTest, UndecodableExtDataIsValidationFailure) {
    ProveRequest request = DepositRequest();
    request.extData.extAmount = "12abc";
    ProveResult result = service_->Prove(request);
    EXPECT_EQ(result.GetFailure().stage, ErrorStage::Validation);
    EXPECT_TRUE(backend_->inputs.empty());
}

} // namespace test
} // namespace spectre
