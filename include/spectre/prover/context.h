// SPECTRE - Prover Context
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Process-wide resources shared by proof requests: the hasher handle, the
// circuit cache and the proof workers. Built once by the executable and
// passed to every component that needs them.

#ifndef SPECTRE_PROVER_CONTEXT_H
#define SPECTRE_PROVER_CONTEXT_H

#include "spectre/circuits/asset_loader.h"
#include "spectre/crypto/hasher.h"
#include "spectre/prover/proof_generator.h"
#include "spectre/solana/address.h"
#include "spectre/util/config.h"
#include "spectre/util/threadpool.h"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace spectre {

// ============================================================================
// Defaults
// ============================================================================

/// Shielded pool program (nullifier accounts)
constexpr const char* DEFAULT_SHIELD_PROGRAM_ID = "9fhQBbumKEFuXtMBDw8AaQyAjCorLGJQiS3skWZdQyQD";

/// Vault program (deposit and withdrawal accounts)
constexpr const char* DEFAULT_VAULT_PROGRAM_ID = "B2at4oGQFPAbuH2wMMpBsFrTvJi71GUvR7jyxny7HaGf";

/// 0.3%
constexpr uint32_t DEFAULT_WITHDRAW_FEE_BPS = 30;

constexpr int64_t DEFAULT_WITHDRAW_EXPIRY = 86400;

constexpr long DEFAULT_FETCH_TIMEOUT = 120;

// ============================================================================
// Options
// ============================================================================

struct ProverOptions {
    AssetLoaderOptions circuits;
    long fetchTimeoutSeconds{DEFAULT_FETCH_TIMEOUT};
    HasherBackend hasherBackend{HasherBackend::Native};
    SnarkjsOptions snarkjs;
    size_t proverThreads{1};
    size_t treeDepth{MERKLE_TREE_DEPTH};
    uint32_t feeBps{DEFAULT_WITHDRAW_FEE_BPS};
    solana::PublicKey shieldProgramId;
    solana::PublicKey vaultProgramId;
    std::optional<solana::PublicKey> vaultAuthority;
    int64_t withdrawExpirySeconds{DEFAULT_WITHDRAW_EXPIRY};

    ProverOptions();

    /**
     * Read every prover setting, applying defaults for absent keys.
     * @throws util::ConfigError naming the offending key
     */
    static ProverOptions FromConfig(const util::ConfigManager& config);
};

/**
 * Configure the global logger from loglevel, logfile and printtoconsole.
 * @throws util::ConfigError on an unknown level or unwritable log file
 */
void SetupLogging(const util::ConfigManager& config);

// ============================================================================
// Context
// ============================================================================

class ProverContext {
public:
    /// Exclusive use of one idle generator; returned on destruction
    class GeneratorLease {
    public:
        GeneratorLease(ProverContext* owner, size_t slot) : owner_(owner), slot_(slot) {}
        ~GeneratorLease();

        GeneratorLease(GeneratorLease&& other) noexcept;
        GeneratorLease& operator=(GeneratorLease&&) = delete;
        GeneratorLease(const GeneratorLease&) = delete;
        GeneratorLease& operator=(const GeneratorLease&) = delete;

        ProofGenerator& operator*() const;
        ProofGenerator* operator->() const { return &**this; }

    private:
        ProverContext* owner_;
        size_t slot_;
    };

    ProverContext(ProverOptions options,
                  std::shared_ptr<HasherHandle> hasher,
                  std::shared_ptr<CircuitAssetLoader> loader,
                  std::shared_ptr<IGroth16Backend> backend);
    ~ProverContext();

    ProverContext(const ProverContext&) = delete;
    ProverContext& operator=(const ProverContext&) = delete;

    /// Context wired to the configured hasher, libcurl and snarkjs
    static std::shared_ptr<ProverContext> Create(const ProverOptions& options);

    const ProverOptions& GetOptions() const { return options_; }
    HasherHandle& GetHasher() { return *hasher_; }
    CircuitAssetLoader& GetLoader() { return *loader_; }

    /// Wait for a generator that is neither leased nor still finishing
    GeneratorLease AcquireGenerator();

    /// Drain queued proofs and stop the workers
    void Shutdown();

private:
    ProverOptions options_;
    std::shared_ptr<HasherHandle> hasher_;
    std::shared_ptr<CircuitAssetLoader> loader_;
    std::shared_ptr<util::ThreadPool> pool_;
    std::vector<std::unique_ptr<ProofGenerator>> generators_;
    std::vector<bool> leased_;
    std::mutex leaseMutex_;
    std::condition_variable leaseReturned_;

    void Release(size_t slot);
};

} // namespace spectre

#endif // SPECTRE_PROVER_CONTEXT_H
