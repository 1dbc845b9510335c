// SPECTRE - Circuit Asset Loader
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Obtains the witness generator (.wasm) and proving key (.zkey) for the
// transaction circuit. Local directories are tried first; on a miss both
// files are fetched from a remote base URL over two concurrent transfers.
// Loaded artifacts are cached for the lifetime of the loader.

#ifndef SPECTRE_CIRCUITS_ASSET_LOADER_H
#define SPECTRE_CIRCUITS_ASSET_LOADER_H

#include "spectre/core/types.h"
#include "spectre/util/fs.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spectre {

// ============================================================================
// Constants
// ============================================================================

/// Default artifact basename
constexpr const char* DEFAULT_CIRCUIT_NAME = "transaction2";

/// Remote fallback location
constexpr const char* DEFAULT_CIRCUIT_REMOTE =
    "https://raw.githubusercontent.com/Berk-A/SPECTRE/main/spectre_protocol/app/public/circuits";

/// Size estimates reported until the server sends a content length
constexpr uint64_t EXPECTED_WASM_SIZE = 3100000;
constexpr uint64_t EXPECTED_ZKEY_SIZE = 16000000;

/// Bumped when cached artifacts must no longer be trusted
constexpr int CIRCUIT_CACHE_VERSION = 1;

/// "\0asm"
constexpr std::array<Byte, 4> WASM_MAGIC = {0x00, 0x61, 0x73, 0x6d};

// ============================================================================
// Progress Reporting
// ============================================================================

enum class LoadStage {
    Idle,
    Downloading,
    Validating,
    Ready
};

const char* LoadStageToString(LoadStage stage);

struct LoadProgress {
    LoadStage stage{LoadStage::Idle};
    uint64_t bytesLoaded{0};
    uint64_t totalBytes{0};
    std::string message;
};

using ProgressCallback = std::function<void(const LoadProgress&)>;

/// Cooperative cancellation for the fetch stage
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// ============================================================================
// Artifacts
// ============================================================================

struct CircuitArtifacts {
    Bytes wasm;
    Bytes zkey;
    /// Directory or base URL the files came from
    std::string source;
};

using ArtifactsPtr = std::shared_ptr<const CircuitArtifacts>;

/**
 * Check the WASM magic number.
 * @param origin  Appended to the error text, e.g. "downloaded from <url>"
 * @throws ArtifactError "Invalid WASM file <origin>. Got header: xx xx xx xx"
 */
void ValidateWasmMagic(const Bytes& wasm, const std::string& origin);

// ============================================================================
// Remote Fetching
// ============================================================================

struct FetchResult {
    long httpStatus{0};
    Bytes body;
};

/// Downloads several URLs concurrently
class IArtifactFetcher {
public:
    /// Called with (transfer index, bytes received, total or 0 if unknown).
    /// Returning false aborts every transfer.
    using TransferProgress = std::function<bool(size_t, uint64_t, uint64_t)>;

    virtual ~IArtifactFetcher() = default;

    /**
     * Fetch every URL; results are in the order of the URLs.
     * @throws ArtifactError on a transport failure or an aborted transfer
     */
    virtual std::vector<FetchResult> FetchAll(const std::vector<std::string>& urls,
                                              const TransferProgress& progress) = 0;
};

/// libcurl multi-handle fetcher
class CurlArtifactFetcher : public IArtifactFetcher {
public:
    explicit CurlArtifactFetcher(long timeoutSeconds = 120);

    std::vector<FetchResult> FetchAll(const std::vector<std::string>& urls,
                                      const TransferProgress& progress) override;

private:
    long timeoutSeconds_;
};

// ============================================================================
// Loader
// ============================================================================

struct AssetLoaderOptions {
    /// Local candidate directories, tried in order
    std::vector<util::fs::Path> localDirs;
    /// Remote base URL; empty disables the network fallback
    std::string remoteBase{DEFAULT_CIRCUIT_REMOTE};
    std::string name{DEFAULT_CIRCUIT_NAME};
    /// Where fetched artifacts are persisted; empty disables persistence
    util::fs::Path cacheDir;
};

/// <cwd>/public/circuits and <cwd>/circuits
std::vector<util::fs::Path> DefaultCircuitDirs();

class CircuitAssetLoader {
public:
    CircuitAssetLoader(AssetLoaderOptions options, std::shared_ptr<IArtifactFetcher> fetcher);

    /**
     * Return the cached artifacts, loading them on first use.
     *
     * Concurrent callers share one in-flight load and every caller receives
     * its progress events. A failed load is not cached, so the next call
     * starts over. Cancelling a token abandons the load for that caller
     * only: if the shared download was stopped by the caller that started
     * it, the callers still waiting start a fresh load.
     *
     * @throws ArtifactError if the files are missing, unreachable, invalid
     *         or the load was cancelled
     */
    ArtifactsPtr Load(const ProgressCallback& onProgress = {},
                      const CancellationToken* cancel = nullptr);

    bool IsLoaded() const;

    /// Drop the in-memory cache
    void Reset();

    const AssetLoaderOptions& GetOptions() const { return options_; }

    util::fs::Path WasmPath(const util::fs::Path& dir) const;
    util::fs::Path ZkeyPath(const util::fs::Path& dir) const;

private:
    AssetLoaderOptions options_;
    std::shared_ptr<IArtifactFetcher> fetcher_;

    /// One load shared by every caller that arrives while it runs
    struct Attempt {
        std::shared_future<ArtifactsPtr> result;
        /// Set when the load ended because its starter cancelled
        std::atomic<bool> cancelled{false};

        std::mutex listenersMutex;
        std::map<uint64_t, ProgressCallback> listeners;
        uint64_t nextListener{0};

        uint64_t Subscribe(const ProgressCallback& cb);
        void Unsubscribe(uint64_t id);
        void Broadcast(const LoadProgress& progress);
    };

    mutable std::mutex mutex_;
    ArtifactsPtr cached_;
    std::shared_ptr<Attempt> inflight_;

    ArtifactsPtr WaitForAttempt(const std::shared_ptr<Attempt>& attempt, uint64_t listener,
                                const CancellationToken* cancel);
    ArtifactsPtr LoadUncached(const ProgressCallback& onProgress,
                              const CancellationToken* cancel);
    /// First valid local directory; rejected directories are described in skipped
    std::optional<CircuitArtifacts> TryLocal(const ProgressCallback& onProgress,
                                             std::string& skipped) const;
    CircuitArtifacts FetchRemote(const ProgressCallback& onProgress,
                                 const CancellationToken* cancel) const;
    bool CacheIsCurrent() const;
    void PersistToCache(const CircuitArtifacts& artifacts) const;
};

} // namespace spectre

#endif // SPECTRE_CIRCUITS_ASSET_LOADER_H
