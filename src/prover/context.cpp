// SPECTRE - Prover Context Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/prover/context.h"
#include "spectre/util/logging.h"

#include <chrono>

#include <unistd.h>

namespace spectre {

namespace {

using util::ConfigError;
using util::ConfigManager;
namespace Keys = util::ConfigKeys;

uint64_t RequireUInt(const ConfigManager& config, const char* key, uint64_t def) {
    if (!config.HasKey(key)) {
        return def;
    }
    auto value = config.TryGetUInt(key);
    if (!value) {
        throw ConfigError(std::string("Invalid value for ") + key + ": expected a non-negative integer");
    }
    return *value;
}

solana::PublicKey RequireAddress(const ConfigManager& config, const char* key, const char* def) {
    std::string text = config.GetString(key, def);
    auto address = solana::PublicKey::FromBase58(text);
    if (!address) {
        throw ConfigError(std::string("Invalid address for ") + key + ": " + text);
    }
    return *address;
}

} // namespace

// ============================================================================
// ProverOptions
// ============================================================================

ProverOptions::ProverOptions()
    : shieldProgramId(solana::PublicKey::Parse(DEFAULT_SHIELD_PROGRAM_ID)),
      vaultProgramId(solana::PublicKey::Parse(DEFAULT_VAULT_PROGRAM_ID)) {
    circuits.localDirs = DefaultCircuitDirs();
}

ProverOptions ProverOptions::FromConfig(const ConfigManager& config) {
    ProverOptions options;

    std::vector<std::string> dirs = config.GetList(Keys::CIRCUITS_PATH);
    if (!dirs.empty()) {
        options.circuits.localDirs.clear();
        for (const auto& dir : dirs) {
            options.circuits.localDirs.emplace_back(
                ConfigManager::ExpandEnvVars(ConfigManager::ExpandTilde(dir)));
        }
    }
    options.circuits.remoteBase = config.GetString(Keys::CIRCUITS_REMOTE, DEFAULT_CIRCUIT_REMOTE);
    while (!options.circuits.remoteBase.empty() && options.circuits.remoteBase.back() == '/') {
        options.circuits.remoteBase.pop_back();
    }
    options.circuits.name = config.GetString(Keys::CIRCUITS_NAME, DEFAULT_CIRCUIT_NAME);
    if (options.circuits.name.empty() ||
        options.circuits.name.find('/') != std::string::npos) {
        throw ConfigError("Invalid circuit name: " + options.circuits.name);
    }
    options.circuits.cacheDir = config.GetPath(Keys::CIRCUITS_CACHEDIR, "");

    uint64_t timeout = RequireUInt(config, Keys::CIRCUITS_TIMEOUT, DEFAULT_FETCH_TIMEOUT);
    if (timeout == 0 || timeout > 3600) {
        throw ConfigError("circuits.timeout must be between 1 and 3600 seconds");
    }
    options.fetchTimeoutSeconds = static_cast<long>(timeout);

    std::string backend = config.GetString(Keys::HASHER_BACKEND, "native");
    auto parsedBackend = ParseHasherBackend(backend);
    if (!parsedBackend) {
        throw ConfigError("Unknown hasher backend: " + backend);
    }
    options.hasherBackend = *parsedBackend;

    options.snarkjs.executable = config.GetPath(Keys::PROVER_SNARKJS, "snarkjs");
    options.snarkjs.workDir = config.GetPath(Keys::PROVER_WORKDIR, "");

    options.proverThreads = static_cast<size_t>(RequireUInt(config, Keys::PROVER_THREADS, 1));
    if (options.proverThreads == 0 || options.proverThreads > 64) {
        throw ConfigError("prover.threads must be between 1 and 64");
    }

    options.treeDepth = static_cast<size_t>(
        RequireUInt(config, Keys::SHIELD_TREEDEPTH, MERKLE_TREE_DEPTH));
    if (options.treeDepth == 0 || options.treeDepth > 64) {
        throw ConfigError("shield.treedepth must be between 1 and 64");
    }

    uint64_t feeBps = RequireUInt(config, Keys::SHIELD_FEEBPS, DEFAULT_WITHDRAW_FEE_BPS);
    if (feeBps > 10000) {
        throw ConfigError("shield.feebps must not exceed 10000");
    }
    options.feeBps = static_cast<uint32_t>(feeBps);

    options.shieldProgramId = RequireAddress(config, Keys::SHIELD_PROGRAMID, DEFAULT_SHIELD_PROGRAM_ID);
    options.vaultProgramId = RequireAddress(config, Keys::WITHDRAW_PROGRAMID, DEFAULT_VAULT_PROGRAM_ID);
    if (!config.GetString(Keys::WITHDRAW_AUTHORITY, "").empty()) {
        options.vaultAuthority = RequireAddress(config, Keys::WITHDRAW_AUTHORITY, "");
    }

    options.withdrawExpirySeconds = static_cast<int64_t>(
        RequireUInt(config, Keys::WITHDRAW_EXPIRY, DEFAULT_WITHDRAW_EXPIRY));

    return options;
}

void SetupLogging(const ConfigManager& config) {
    auto& logger = util::Logger::Instance();

    std::string levelName = config.GetString(Keys::LOGLEVEL, "info");
    auto level = util::TryParseLogLevel(levelName);
    if (!level) {
        throw ConfigError("Unknown log level: " + levelName);
    }

    logger.ClearSinks();
    logger.SetLevel(*level);

    if (config.GetBool(Keys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = *level;
        consoleConfig.useColors = isatty(STDERR_FILENO) != 0;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetPath(Keys::LOGFILE, "");
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = *level;
        fileConfig.autoFlush = true;
        auto sink = std::make_shared<util::FileSink>(fileConfig);
        if (!sink->IsOpen()) {
            throw ConfigError("Cannot open log file: " + logFile);
        }
        logger.AddSink(sink);
    }
}

// ============================================================================
// ProverContext
// ============================================================================

ProverContext::GeneratorLease::~GeneratorLease() {
    if (owner_) {
        owner_->Release(slot_);
    }
}

ProverContext::GeneratorLease::GeneratorLease(GeneratorLease&& other) noexcept
    : owner_(other.owner_), slot_(other.slot_) {
    other.owner_ = nullptr;
}

ProofGenerator& ProverContext::GeneratorLease::operator*() const {
    return *owner_->generators_[slot_];
}

ProverContext::ProverContext(ProverOptions options,
                             std::shared_ptr<HasherHandle> hasher,
                             std::shared_ptr<CircuitAssetLoader> loader,
                             std::shared_ptr<IGroth16Backend> backend)
    : options_(std::move(options)),
      hasher_(std::move(hasher)),
      loader_(std::move(loader)) {
    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = options_.proverThreads;
    poolConfig.maxQueueSize = options_.proverThreads;
    poolConfig.name = "prover";
    pool_ = std::make_shared<util::ThreadPool>(poolConfig);

    for (size_t i = 0; i < options_.proverThreads; ++i) {
        generators_.push_back(std::make_unique<ProofGenerator>(backend, pool_));
    }
    leased_.assign(generators_.size(), false);
}

ProverContext::~ProverContext() {
    Shutdown();
}

std::shared_ptr<ProverContext> ProverContext::Create(const ProverOptions& options) {
    auto hasher = HasherHandle::ForBackend(options.hasherBackend);
    auto fetcher = std::make_shared<CurlArtifactFetcher>(options.fetchTimeoutSeconds);
    auto loader = std::make_shared<CircuitAssetLoader>(options.circuits, fetcher);
    auto backend = std::make_shared<SnarkjsBackend>(options.snarkjs);

    LOG_INFO(util::LogCategory::PROVER) << "Prover context: hasher="
                                        << (options.hasherBackend == HasherBackend::Native ? "native" : "bignum")
                                        << " workers=" << options.proverThreads
                                        << " treeDepth=" << options.treeDepth;
    return std::make_shared<ProverContext>(options, hasher, loader, backend);
}

ProverContext::GeneratorLease ProverContext::AcquireGenerator() {
    std::unique_lock<std::mutex> lock(leaseMutex_);
    while (true) {
        for (size_t i = 0; i < generators_.size(); ++i) {
            if (!leased_[i] && !generators_[i]->IsBusy()) {
                leased_[i] = true;
                return GeneratorLease(this, i);
            }
        }
        // An abandoned proof clears its busy flag without notifying
        leaseReturned_.wait_for(lock, std::chrono::milliseconds(100));
    }
}

void ProverContext::Release(size_t slot) {
    {
        std::lock_guard<std::mutex> lock(leaseMutex_);
        leased_[slot] = false;
    }
    leaseReturned_.notify_one();
}

void ProverContext::Shutdown() {
    if (pool_) {
        pool_->Shutdown();
    }
}

} // namespace spectre
