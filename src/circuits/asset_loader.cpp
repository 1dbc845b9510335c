// SPECTRE - Circuit Asset Loader Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/circuits/asset_loader.h"
#include "spectre/core/hex.h"
#include "spectre/prover/errors.h"
#include "spectre/util/logging.h"

#include <algorithm>
#include <chrono>

namespace spectre {

namespace fs = util::fs;

const char* LoadStageToString(LoadStage stage) {
    switch (stage) {
        case LoadStage::Idle:        return "idle";
        case LoadStage::Downloading: return "downloading";
        case LoadStage::Validating:  return "validating";
        case LoadStage::Ready:       return "ready";
    }
    return "unknown";
}

void ValidateWasmMagic(const Bytes& wasm, const std::string& origin) {
    if (wasm.size() >= WASM_MAGIC.size() &&
        std::equal(WASM_MAGIC.begin(), WASM_MAGIC.end(), wasm.begin())) {
        return;
    }

    size_t n = std::min(wasm.size(), WASM_MAGIC.size());
    std::string header = BytesToSpacedHex(wasm.data(), n);
    LOG_ERROR(util::LogCategory::CIRCUITS) << "Invalid WASM header: " << header;
    throw ArtifactError("Invalid WASM file " + origin + ". Got header: " + header);
}

std::vector<fs::Path> DefaultCircuitDirs() {
    std::error_code ec;
    fs::Path cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd = ".";
    }
    return {cwd / "public" / "circuits", cwd / "circuits"};
}

// ============================================================================
// CircuitAssetLoader
// ============================================================================

namespace {

void Report(const ProgressCallback& cb, LoadStage stage, uint64_t loaded,
            uint64_t total, const std::string& message) {
    if (!cb) return;
    LoadProgress progress;
    progress.stage = stage;
    progress.bytesLoaded = loaded;
    progress.totalBytes = total;
    progress.message = message;
    cb(progress);
}

void ThrowIfCancelled(const CancellationToken* cancel) {
    if (cancel && cancel->IsCancelled()) {
        throw ArtifactError("Circuit loading cancelled");
    }
}

} // namespace

CircuitAssetLoader::CircuitAssetLoader(AssetLoaderOptions options,
                                       std::shared_ptr<IArtifactFetcher> fetcher)
    : options_(std::move(options)), fetcher_(std::move(fetcher)) {}

fs::Path CircuitAssetLoader::WasmPath(const fs::Path& dir) const {
    return dir / (options_.name + ".wasm");
}

fs::Path CircuitAssetLoader::ZkeyPath(const fs::Path& dir) const {
    return dir / (options_.name + ".zkey");
}

bool CircuitAssetLoader::IsLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_ != nullptr;
}

void CircuitAssetLoader::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
}

uint64_t CircuitAssetLoader::Attempt::Subscribe(const ProgressCallback& cb) {
    std::lock_guard<std::mutex> lock(listenersMutex);
    uint64_t id = nextListener++;
    if (cb) {
        listeners.emplace(id, cb);
    }
    return id;
}

void CircuitAssetLoader::Attempt::Unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(listenersMutex);
    listeners.erase(id);
}

void CircuitAssetLoader::Attempt::Broadcast(const LoadProgress& progress) {
    // Held while calling so an unsubscribed waiter is never called afterwards
    std::lock_guard<std::mutex> lock(listenersMutex);
    for (const auto& entry : listeners) {
        entry.second(progress);
    }
}

ArtifactsPtr CircuitAssetLoader::Load(const ProgressCallback& onProgress,
                                      const CancellationToken* cancel) {
    while (true) {
        std::promise<ArtifactsPtr> promise;
        std::shared_ptr<Attempt> attempt;
        uint64_t listener = 0;
        bool starter = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cached_) {
                return cached_;
            }
            if (inflight_) {
                attempt = inflight_;
            } else {
                attempt = std::make_shared<Attempt>();
                attempt->result = promise.get_future().share();
                inflight_ = attempt;
                starter = true;
            }
            listener = attempt->Subscribe(onProgress);
        }

        if (!starter) {
            LOG_DEBUG(util::LogCategory::CIRCUITS) << "Waiting for in-flight circuit load";
            try {
                return WaitForAttempt(attempt, listener, cancel);
            } catch (const ArtifactError&) {
                bool selfCancelled = cancel && cancel->IsCancelled();
                if (attempt->cancelled.load() && !selfCancelled) {
                    LOG_INFO(util::LogCategory::CIRCUITS)
                        << "Shared circuit load was cancelled by its starter, retrying";
                    continue;
                }
                throw;
            }
        }

        try {
            ArtifactsPtr loaded = LoadUncached(
                [&attempt](const LoadProgress& p) { attempt->Broadcast(p); }, cancel);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cached_ = loaded;
                inflight_.reset();
            }
            attempt->Unsubscribe(listener);
            promise.set_value(loaded);
            return loaded;
        } catch (...) {
            // Forget the attempt so the next call retries, then hand the
            // failure to everyone waiting on it
            attempt->cancelled.store(cancel && cancel->IsCancelled());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inflight_.reset();
            }
            attempt->Unsubscribe(listener);
            promise.set_exception(std::current_exception());
            throw;
        }
    }
}

ArtifactsPtr CircuitAssetLoader::WaitForAttempt(const std::shared_ptr<Attempt>& attempt,
                                                uint64_t listener,
                                                const CancellationToken* cancel) {
    while (attempt->result.wait_for(std::chrono::milliseconds(20)) !=
           std::future_status::ready) {
        if (cancel && cancel->IsCancelled()) {
            attempt->Unsubscribe(listener);
            throw ArtifactError("Circuit loading cancelled");
        }
    }
    attempt->Unsubscribe(listener);
    return attempt->result.get();
}

ArtifactsPtr CircuitAssetLoader::LoadUncached(const ProgressCallback& onProgress,
                                              const CancellationToken* cancel) {
    SPECTRE_LOG_TIMER(util::LogCategory::CIRCUITS, "circuit load");
    Report(onProgress, LoadStage::Idle, 0, 0, "Looking for circuit files");
    ThrowIfCancelled(cancel);

    std::string skipped;
    if (auto local = TryLocal(onProgress, skipped)) {
        uint64_t total = local->wasm.size() + local->zkey.size();
        Report(onProgress, LoadStage::Ready, total, total, "Circuits ready");
        return std::make_shared<const CircuitArtifacts>(std::move(*local));
    }

    if (options_.remoteBase.empty()) {
        std::string message = "Circuit files " + options_.name +
                              ".wasm/.zkey not found in any local directory";
        if (!skipped.empty()) {
            message += " (" + skipped + ")";
        }
        throw ArtifactError(message);
    }
    if (!fetcher_) {
        throw ArtifactError("Circuit files not found locally and no fetcher is configured");
    }

    CircuitArtifacts remote = FetchRemote(onProgress, cancel);
    PersistToCache(remote);

    uint64_t total = remote.wasm.size() + remote.zkey.size();
    Report(onProgress, LoadStage::Ready, total, total, "Circuits ready");
    return std::make_shared<const CircuitArtifacts>(std::move(remote));
}

std::optional<CircuitArtifacts> CircuitAssetLoader::TryLocal(
    const ProgressCallback& onProgress, std::string& skipped) const {
    std::vector<fs::Path> candidates = options_.localDirs;
    if (!options_.cacheDir.empty() && CacheIsCurrent()) {
        candidates.push_back(options_.cacheDir);
    }

    for (const auto& dir : candidates) {
        fs::Path wasmPath = WasmPath(dir);
        fs::Path zkeyPath = ZkeyPath(dir);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(wasmPath, ec) ||
            !std::filesystem::is_regular_file(zkeyPath, ec)) {
            continue;
        }

        LOG_INFO(util::LogCategory::CIRCUITS) << "Found circuits at " << dir.string();
        auto wasm = fs::ReadFileBytes(wasmPath);
        auto zkey = fs::ReadFileBytes(zkeyPath);
        if (!wasm || !zkey) {
            LOG_WARN(util::LogCategory::CIRCUITS) << "Failed to read circuits from "
                                                  << dir.string() << ", trying next location";
            continue;
        }

        Report(onProgress, LoadStage::Validating, wasm->size() + zkey->size(),
               wasm->size() + zkey->size(), "Validating circuit files");
        try {
            ValidateWasmMagic(*wasm, "loaded from " + wasmPath.string());
            if (zkey->empty()) {
                throw ArtifactError("Empty proving key at " + zkeyPath.string());
            }
        } catch (const ArtifactError& e) {
            LOG_WARN(util::LogCategory::CIRCUITS) << "Skipping " << dir.string() << ": "
                                                  << e.what();
            if (!skipped.empty()) skipped += "; ";
            skipped += e.what();
            continue;
        }

        LogInfoF(util::LogCategory::CIRCUITS,
                 "Circuits loaded from filesystem: WASM=%zuB, zkey=%zuB",
                 wasm->size(), zkey->size());

        CircuitArtifacts artifacts;
        artifacts.wasm = std::move(*wasm);
        artifacts.zkey = std::move(*zkey);
        artifacts.source = dir.string();
        return artifacts;
    }
    return std::nullopt;
}

CircuitArtifacts CircuitAssetLoader::FetchRemote(const ProgressCallback& onProgress,
                                                 const CancellationToken* cancel) const {
    const std::string wasmUrl = options_.remoteBase + "/" + options_.name + ".wasm";
    const std::string zkeyUrl = options_.remoteBase + "/" + options_.name + ".zkey";
    LOG_INFO(util::LogCategory::CIRCUITS) << "Fetching circuits from " << options_.remoteBase;

    std::array<uint64_t, 2> loaded{0, 0};
    std::array<uint64_t, 2> totals{EXPECTED_WASM_SIZE, EXPECTED_ZKEY_SIZE};
    Report(onProgress, LoadStage::Downloading, 0, totals[0] + totals[1],
           "Downloading circuit files");

    auto progress = [&](size_t index, uint64_t now, uint64_t total) {
        if (cancel && cancel->IsCancelled()) {
            return false;
        }
        if (index < loaded.size()) {
            loaded[index] = now;
            if (total > 0) {
                totals[index] = total;
            }
            Report(onProgress, LoadStage::Downloading, loaded[0] + loaded[1],
                   totals[0] + totals[1], "Downloading circuit files");
        }
        return true;
    };

    std::vector<FetchResult> results = fetcher_->FetchAll({wasmUrl, zkeyUrl}, progress);
    ThrowIfCancelled(cancel);
    if (results.size() != 2) {
        throw ArtifactError("Fetcher returned " + std::to_string(results.size()) +
                            " results for 2 circuit files");
    }

    if (results[0].httpStatus != 200 || results[1].httpStatus != 200) {
        throw ArtifactError("Failed to fetch circuit files: WASM=" +
                            std::to_string(results[0].httpStatus) +
                            ", zkey=" + std::to_string(results[1].httpStatus));
    }

    uint64_t total = results[0].body.size() + results[1].body.size();
    Report(onProgress, LoadStage::Validating, total, total, "Validating circuit files");
    ValidateWasmMagic(results[0].body, "downloaded from " + wasmUrl);
    if (results[1].body.empty()) {
        throw ArtifactError("Empty proving key downloaded from " + zkeyUrl);
    }

    LogInfoF(util::LogCategory::CIRCUITS, "Circuits loaded from CDN: WASM=%zuB, zkey=%zuB",
             results[0].body.size(), results[1].body.size());

    CircuitArtifacts artifacts;
    artifacts.wasm = std::move(results[0].body);
    artifacts.zkey = std::move(results[1].body);
    artifacts.source = options_.remoteBase;
    return artifacts;
}

bool CircuitAssetLoader::CacheIsCurrent() const {
    auto marker = fs::ReadFile(options_.cacheDir / (options_.name + ".version"));
    return marker && *marker == std::to_string(CIRCUIT_CACHE_VERSION);
}

void CircuitAssetLoader::PersistToCache(const CircuitArtifacts& artifacts) const {
    if (options_.cacheDir.empty()) {
        return;
    }

    // A cache write failure only costs a re-download next time
    if (!fs::EnsureDirectory(options_.cacheDir) ||
        !fs::AtomicWriteFile(WasmPath(options_.cacheDir), artifacts.wasm.data(),
                             artifacts.wasm.size()) ||
        !fs::AtomicWriteFile(ZkeyPath(options_.cacheDir), artifacts.zkey.data(),
                             artifacts.zkey.size()) ||
        !fs::WriteFile(options_.cacheDir / (options_.name + ".version"),
                       std::to_string(CIRCUIT_CACHE_VERSION))) {
        LOG_WARN(util::LogCategory::CIRCUITS) << "Could not persist circuits to "
                                              << options_.cacheDir.string();
        return;
    }
    LOG_INFO(util::LogCategory::CIRCUITS) << "Cached circuits in " << options_.cacheDir.string();
}

} // namespace spectre
