// SPECTRE - Groth16 Proof Generator
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Proving takes tens of seconds of CPU. ProofGenerator runs it on a
// dedicated worker pool so threads accepting requests never block on it.

#ifndef SPECTRE_PROVER_PROOF_GENERATOR_H
#define SPECTRE_PROVER_PROOF_GENERATOR_H

#include "spectre/circuits/asset_loader.h"
#include "spectre/core/json.h"
#include "spectre/prover/proof.h"
#include "spectre/shield/circuit_input.h"
#include "spectre/util/fs.h"
#include "spectre/util/threadpool.h"

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace spectre {

/// Result of a full prove: the proof and its public signals (decimal)
struct ProofOutput {
    Proof proof;
    std::vector<std::string> publicSignals;
};

// ============================================================================
// Back-ends
// ============================================================================

/// Witness generation plus Groth16 proving
class IGroth16Backend {
public:
    virtual ~IGroth16Backend() = default;

    virtual const char* Name() const = 0;

    /**
     * @param input  Circuit signals as decimal strings
     * @throws ProvingError if proving fails; FormattingError if the
     *         prover output has the wrong shape
     */
    virtual ProofOutput FullProve(const JSONValue& input, const CircuitArtifacts& artifacts) = 0;
};

struct SnarkjsOptions {
    /// Executable looked up in PATH unless it contains a '/'
    std::string executable{"snarkjs"};
    /// Parent of the per-proof scratch directories; empty = system temp dir
    util::fs::Path workDir;
};

/**
 * Runs "snarkjs groth16 fullprove" in a child process.
 *
 * Inputs and artifacts are written into a private scratch directory that
 * is removed when the call returns, whatever the outcome.
 */
class SnarkjsBackend : public IGroth16Backend {
public:
    explicit SnarkjsBackend(SnarkjsOptions options);

    const char* Name() const override { return "snarkjs"; }
    ProofOutput FullProve(const JSONValue& input, const CircuitArtifacts& artifacts) override;

private:
    SnarkjsOptions options_;
};

// ============================================================================
// Generator
// ============================================================================

class ProofGenerator {
public:
    ProofGenerator(std::shared_ptr<IGroth16Backend> backend,
                   std::shared_ptr<util::ThreadPool> pool);

    /**
     * Queue a proof on the worker pool.
     *
     * Once started a proof cannot be aborted. The generator accepts one
     * proof at a time; the future carries ProvingError/FormattingError.
     *
     * @throws ProvingError if a previous proof is still running or the
     *         pool rejects the task
     */
    std::future<ProofOutput> Prove(const CircuitInput& input, ArtifactsPtr artifacts);

    /// True while a proof is queued or running
    bool IsBusy() const { return busy_->load(); }

    const IGroth16Backend& GetBackend() const { return *backend_; }

private:
    std::shared_ptr<IGroth16Backend> backend_;
    std::shared_ptr<util::ThreadPool> pool_;
    std::shared_ptr<std::atomic<bool>> busy_;
};

} // namespace spectre

#endif // SPECTRE_PROVER_PROOF_GENERATOR_H
