// SPECTRE - Proof Generator Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/crypto/hasher.h"
#include "spectre/prover/errors.h"
#include "spectre/prover/proof_generator.h"
#include "spectre/util/fs.h"

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace spectre {
namespace test {

namespace {

/// Blocks in FullProve until released, then returns a fixed proof
class GatedBackend : public IGroth16Backend {
public:
    GatedBackend() : gate_(release_.get_future().share()) {}

    const char* Name() const override { return "gated"; }

    ProofOutput FullProve(const JSONValue& input, const CircuitArtifacts&) override {
        lastInput = input;
        gate_.wait();
        if (failWith == 1) throw ProvingError("witness generation failed");
        if (failWith == 2) throw std::runtime_error("out of memory");

        ProofOutput out;
        out.proof.a.x = Uint256(1);
        out.publicSignals = {"1", "2"};
        return out;
    }

    void Release() { release_.set_value(); }

    JSONValue lastInput;
    int failWith{0};

private:
    std::promise<void> release_;
    std::shared_future<void> gate_;
};

CircuitInput SampleInput() {
    CircuitInput input;
    input.root = FieldElement(uint64_t(99));
    input.publicAmount = FieldElement(uint64_t(5));
    return input;
}

ArtifactsPtr SampleArtifacts() {
    auto artifacts = std::make_shared<CircuitArtifacts>();
    artifacts->wasm = {0x00, 0x61, 0x73, 0x6d, 0x01};
    artifacts->zkey = {0x7a, 0x6b, 0x65, 0x79};
    return artifacts;
}

} // namespace

// ============================================================================
// ProofGenerator
// ============================================================================

class ProofGeneratorTest : public ::testing::Test {
protected:
    std::shared_ptr<GatedBackend> backend_ = std::make_shared<GatedBackend>();
    std::shared_ptr<util::ThreadPool> pool_ = std::make_shared<util::ThreadPool>(1);
    ProofGenerator generator_{backend_, pool_};

    void TearDown() override { pool_->Shutdown(); }
};

TEST_F(ProofGeneratorTest, ProducesProofOnWorker) {
    auto future = generator_.Prove(SampleInput(), SampleArtifacts());
    backend_->Release();
    ProofOutput out = future.get();

    EXPECT_EQ(out.publicSignals.size(), 2u);
    EXPECT_EQ(out.proof.a.x, Uint256(1));
    EXPECT_EQ(backend_->lastInput["root"].GetString(), "99");
    EXPECT_EQ(backend_->lastInput["publicAmount"].GetString(), "5");
    EXPECT_FALSE(generator_.IsBusy());
}

TEST_F(ProofGeneratorTest, RejectsSecondProofWhileBusy) {
    auto first = generator_.Prove(SampleInput(), SampleArtifacts());
    EXPECT_TRUE(generator_.IsBusy());
    EXPECT_THROW(generator_.Prove(SampleInput(), SampleArtifacts()), ProvingError);

    backend_->Release();
    first.get();
    EXPECT_FALSE(generator_.IsBusy());
}

TEST_F(ProofGeneratorTest, RequiresArtifacts) {
    EXPECT_THROW(generator_.Prove(SampleInput(), nullptr), ProvingError);
    EXPECT_FALSE(generator_.IsBusy());
}

TEST_F(ProofGeneratorTest, ProvingErrorsTravelThroughFuture) {
    backend_->failWith = 1;
    auto future = generator_.Prove(SampleInput(), SampleArtifacts());
    backend_->Release();
    EXPECT_THROW(future.get(), ProvingError);
    EXPECT_FALSE(generator_.IsBusy());
}

TEST_F(ProofGeneratorTest, ForeignErrorsBecomeProvingErrors) {
    backend_->failWith = 2;
    auto future = generator_.Prove(SampleInput(), SampleArtifacts());
    backend_->Release();
    try {
        future.get();
        FAIL() << "Expected ProvingError";
    } catch (const ProvingError& e) {
        EXPECT_STREQ(e.what(), "out of memory");
        EXPECT_EQ(e.GetStage(), ErrorStage::Proving);
    }
}

TEST_F(ProofGeneratorTest, StoppedPoolRejectsProof) {
    pool_->Shutdown();
    EXPECT_THROW(generator_.Prove(SampleInput(), SampleArtifacts()), ProvingError);
    EXPECT_FALSE(generator_.IsBusy());
}

// ============================================================================
// SnarkjsBackend
// ============================================================================

class SnarkjsBackendTest : public ::testing::Test {
protected:
    util::fs::TempDirectory dir_;

    /// Write an executable shell script standing in for snarkjs
    std::string WriteScript(const std::string& body) {
        auto path = dir_.GetPath() / "fake-snarkjs";
        EXPECT_TRUE(util::fs::WriteFile(path, "#!/bin/sh\n" + body));
        chmod(path.c_str(), 0700);
        return path.string();
    }
};

TEST_F(SnarkjsBackendTest, ReadsProofAndPublicSignals) {
    // Arguments: groth16 fullprove input wasm zkey proof public
    std::string script = WriteScript(
        "test -s \"$3\" || exit 9\n"
        "echo '{\"pi_a\":[\"1\",\"2\",\"1\"],\"pi_b\":[[\"3\",\"4\"],[\"5\",\"6\"],[\"1\",\"0\"]],"
        "\"pi_c\":[\"7\",\"8\",\"1\"]}' > \"$6\"\n"
        "echo '[\"11\",\"12\"]' > \"$7\"\n");

    SnarkjsOptions options;
    options.executable = script;
    options.workDir = dir_.GetPath();
    SnarkjsBackend backend(options);

    CircuitArtifacts artifacts = *SampleArtifacts();
    ProofOutput out = backend.FullProve(SampleInput().ToJSON(), artifacts);
    EXPECT_EQ(out.proof.b.y[1], Uint256(6));
    ASSERT_EQ(out.publicSignals.size(), 2u);
    EXPECT_EQ(out.publicSignals[1], "12");
}

TEST_F(SnarkjsBackendTest, NonZeroExitCarriesLog) {
    std::string script = WriteScript("echo 'Error: Scalar size does not match' >&2\nexit 3\n");

    SnarkjsOptions options;
    options.executable = script;
    options.workDir = dir_.GetPath();
    SnarkjsBackend backend(options);

    try {
        backend.FullProve(SampleInput().ToJSON(), *SampleArtifacts());
        FAIL() << "Expected ProvingError";
    } catch (const ProvingError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("status 3"), std::string::npos);
        EXPECT_NE(what.find("Scalar size does not match"), std::string::npos);
    }
}

TEST_F(SnarkjsBackendTest, ChildSeesOnlyStandardDescriptors) {
    // Opened without O_CLOEXEC, as a listening socket from older code would be
    int inherited = open((dir_.GetPath() / "held-open").c_str(), O_WRONLY | O_CREAT, 0600);
    ASSERT_GE(inherited, 0);

    std::string script = WriteScript(
        "if [ -e /proc/$$/fd/" + std::to_string(inherited) + " ]; then exit 8; fi\n"
        "echo '{\"pi_a\":[\"1\",\"2\",\"1\"],\"pi_b\":[[\"3\",\"4\"],[\"5\",\"6\"],[\"1\",\"0\"]],"
        "\"pi_c\":[\"7\",\"8\",\"1\"]}' > \"$6\"\n"
        "echo '[]' > \"$7\"\n");

    SnarkjsOptions options;
    options.executable = script;
    options.workDir = dir_.GetPath();
    SnarkjsBackend backend(options);

    EXPECT_NO_THROW(backend.FullProve(SampleInput().ToJSON(), *SampleArtifacts()));
    close(inherited);
}

TEST_F(SnarkjsBackendTest, MalformedOutputIsFormattingError) {
    std::string script = WriteScript("echo 'not json' > \"$6\"\necho '[]' > \"$7\"\n");

    SnarkjsOptions options;
    options.executable = script;
    options.workDir = dir_.GetPath();
    SnarkjsBackend backend(options);

    EXPECT_THROW(backend.FullProve(SampleInput().ToJSON(), *SampleArtifacts()), FormattingError);
}

TEST_F(SnarkjsBackendTest, MissingExecutable) {
    SnarkjsOptions options;
    options.executable = (dir_.GetPath() / "no-such-snarkjs").string();
    options.workDir = dir_.GetPath();
    SnarkjsBackend backend(options);

    EXPECT_THROW(backend.FullProve(SampleInput().ToJSON(), *SampleArtifacts()), ProvingError);
}

} // namespace test
} // namespace spectre
