// SPECTRE Daemon - Main Entry Point
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// spectred serves Groth16 proofs for the shielded pool over HTTP.
// It loads the circuit artifacts, initializes the Poseidon hasher and
// answers POST /api/privacy/prove until it receives SIGINT or SIGTERM.

#include "spectre/prover/context.h"
#include "spectre/prover/service.h"
#include "spectre/rpc/prove_server.h"
#include "spectre/util/config.h"
#include "spectre/util/logging.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace spectre {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "SPECTRE Prover Daemon";

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};
static std::mutex g_shutdownMutex;
static std::condition_variable g_shutdownCondition;

static std::shared_ptr<ProverContext> g_context;
static std::unique_ptr<ProveServer> g_server;

// ============================================================================
// Signal Handling
// ============================================================================

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdownRequested.store(true);
        g_shutdownCondition.notify_all();
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: spectred [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  --conf=FILE                Config file (default: spectre.conf)\n";
    std::cout << "  --preload=0/1              Load circuits before serving (default: 1)\n";
    std::cout << "\nHTTP Options:\n";
    std::cout << "  --http.bind=ADDR           Bind address (default: 127.0.0.1)\n";
    std::cout << "  --http.port=PORT           Listen port (default: 8787)\n";
    std::cout << "  --http.threads=N           Connection threads (default: 4)\n";
    std::cout << "\nProver Options:\n";
    std::cout << "  --circuits.path=DIR        Local circuit directory (can repeat)\n";
    std::cout << "  --circuits.remote=URL      Remote circuit base URL\n";
    std::cout << "  --circuits.name=NAME       Circuit file stem (default: transaction2)\n";
    std::cout << "  --circuits.cachedir=DIR    Cache for downloaded circuits\n";
    std::cout << "  --circuits.timeout=SECS    Download timeout (default: 120)\n";
    std::cout << "  --hasher.backend=NAME      native or bignum (default: native)\n";
    std::cout << "  --prover.snarkjs=PATH      snarkjs executable (default: snarkjs)\n";
    std::cout << "  --prover.workdir=DIR       Scratch directory for proving\n";
    std::cout << "  --prover.threads=N         Concurrent proofs (default: 1)\n";
    std::cout << "  --shield.treedepth=N       Merkle tree depth (default: 26)\n";
    std::cout << "  --shield.feebps=N          Withdrawal fee in basis points (default: 30)\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error\n";
    std::cout << "  --logfile=FILE             Also log to FILE\n";
    std::cout << "  --printtoconsole=0/1       Print to console (default: 1)\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 SPECTRE Developers\n";
    std::cout << "MIT License\n";
}

/**
 * Merge the config file and the command line into config.
 * Command-line values override the file. A missing default config file is
 * not an error; a missing file named with --conf is.
 */
bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config) {
    util::ConfigManager cli;
    auto cliResult = cli.ParseCommandLine(argc, argv);
    if (!cliResult.success) {
        std::cerr << "Error: " << cliResult.errorMessage << "\n";
        return false;
    }
    if (!cliResult.positional.empty()) {
        std::cerr << "Error: unexpected argument '" << cliResult.positional.front() << "'\n";
        return false;
    }

    bool explicitConf = cli.HasKey(util::ConfigKeys::CONF);
    std::string confPath = cli.GetPath(util::ConfigKeys::CONF, util::DEFAULT_CONFIG_FILENAME);
    std::error_code ec;
    if (std::filesystem::exists(confPath, ec)) {
        auto fileResult = config.ParseFile(confPath);
        if (!fileResult.success) {
            std::cerr << "Error in " << fileResult.errorFile << ":" << fileResult.errorLine
                      << ": " << fileResult.errorMessage << "\n";
            return false;
        }
        for (const auto& warning : fileResult.warnings) {
            std::cerr << "Warning: " << warning << "\n";
        }
    } else if (explicitConf) {
        std::cerr << "Error: config file not found: " << confPath << "\n";
        return false;
    }

    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Startup and Shutdown
// ============================================================================

void WaitForShutdown() {
    std::unique_lock<std::mutex> lock(g_shutdownMutex);
    while (!g_shutdownRequested.load()) {
        g_shutdownCondition.wait_for(lock, std::chrono::seconds(1));
    }
}

void Shutdown() {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down...";

    // Stop accepting requests before the prover workers go away
    if (g_server) {
        g_server->Stop();
        g_server.reset();
    }
    if (g_context) {
        g_context->Shutdown();
        g_context.reset();
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
    util::Logger::Instance().Shutdown();
}

int AppMain(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            PrintHelp();
            return 0;
        }
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            PrintVersion();
            return 0;
        }
    }

    util::ConfigManager config;
    util::AllowStandardKeys(config);
    config.AllowKey("preload");
    if (!LoadConfiguration(argc, argv, config)) {
        return 1;
    }

    SetupLogging(config);
    for (const auto& message : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << message;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting...";

    ProverOptions options = ProverOptions::FromConfig(config);
    ProveServerConfig serverConfig = ProveServerConfig::FromConfig(config);

    SetupSignalHandlers();

    g_context = ProverContext::Create(options);
    auto service = std::make_shared<ProveService>(g_context);

    if (config.GetBool("preload", true)) {
        // A failed preload is retried by the first request
        try {
            g_context->GetHasher().Get();
            g_context->GetLoader().Load();
            LOG_INFO(util::LogCategory::DEFAULT) << "Circuits and hasher ready";
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::DEFAULT) << "Preload failed: " << e.what();
        }
    }

    g_server = std::make_unique<ProveServer>(serverConfig, service);
    if (!g_server->Start()) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Failed to start HTTP server";
        Shutdown();
        return 1;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Serving proofs at http://" << serverConfig.bindAddress
                                         << ":" << g_server->GetPort() << PROVE_PATH;

    WaitForShutdown();
    Shutdown();
    return 0;
}

} // namespace spectre

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return spectre::AppMain(argc, argv);
    } catch (const spectre::util::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
