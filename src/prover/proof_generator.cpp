// SPECTRE - Groth16 Proof Generator Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/prover/proof_generator.h"
#include "spectre/prover/errors.h"
#include "spectre/util/logging.h"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace spectre {

namespace fs = util::fs;

namespace {

/// Trailing part of a diagnostic file, enough to explain a failure
std::string TailOf(const std::string& text, size_t maxLen = 2000) {
    if (text.size() <= maxLen) return text;
    return "..." + text.substr(text.size() - maxLen);
}

/** Highest descriptor number this process has open, read before fork */
int HighestOpenFd() {
    int highest = STDERR_FILENO;
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc/self/fd", ec);
    if (ec) {
        long limit = sysconf(_SC_OPEN_MAX);
        return limit > 0 ? static_cast<int>(limit) - 1 : 1023;
    }
    for (const auto& entry : it) {
        int fd = 0;
        const std::string name = entry.path().filename().string();
        auto parsed = std::from_chars(name.data(), name.data() + name.size(), fd);
        if (parsed.ec == std::errc() && fd > highest) {
            highest = fd;
        }
    }
    return highest;
}

/**
 * Run a program with stdout/stderr redirected to logPath and wait for it.
 * Only the standard descriptors reach the program.
 * @return exit status, or -1 if it was killed by a signal
 * @throws ProvingError if the process cannot be started
 */
int RunProcess(const std::vector<std::string>& args, const fs::Path& cwd,
               const fs::Path& logPath) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    int logFd = open(logPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (logFd < 0) {
        throw ProvingError("Cannot create prover log: " + std::string(std::strerror(errno)));
    }

    const int highestFd = HighestOpenFd();
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(logFd);
        throw ProvingError("fork failed: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        // Child
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        if (dup2(logFd, STDOUT_FILENO) < 0 || dup2(logFd, STDERR_FILENO) < 0) {
            _exit(126);
        }
        for (int fd = STDERR_FILENO + 1; fd <= highestFd; ++fd) {
            close(fd);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(logFd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ProvingError("waitpid failed: " + std::string(std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

JSONValue ReadJSONOutput(const fs::Path& path) {
    auto text = fs::ReadFile(path);
    if (!text) {
        throw ProvingError("Prover did not produce " + path.filename().string());
    }
    auto json = JSONValue::TryParse(*text);
    if (!json) {
        throw FormattingError("Prover wrote malformed JSON to " + path.filename().string());
    }
    return *json;
}

} // namespace

// ============================================================================
// SnarkjsBackend
// ============================================================================

SnarkjsBackend::SnarkjsBackend(SnarkjsOptions options) : options_(std::move(options)) {}

ProofOutput SnarkjsBackend::FullProve(const JSONValue& input, const CircuitArtifacts& artifacts) {
    fs::TempDirectory scratch(options_.workDir, "spectre_prove_");
    if (!scratch.IsValid()) {
        throw ProvingError("Cannot create scratch directory for proving");
    }

    const fs::Path& dir = scratch.GetPath();
    const fs::Path inputPath = dir / "input.json";
    const fs::Path wasmPath = dir / "circuit.wasm";
    const fs::Path zkeyPath = dir / "circuit.zkey";
    const fs::Path proofPath = dir / "proof.json";
    const fs::Path publicPath = dir / "public.json";
    const fs::Path logPath = dir / "prover.log";

    // input.json holds private key material
    if (!fs::SecureWriteFile(inputPath, input.ToJSON()) ||
        !fs::WriteFile(wasmPath, artifacts.wasm.data(), artifacts.wasm.size()) ||
        !fs::WriteFile(zkeyPath, artifacts.zkey.data(), artifacts.zkey.size())) {
        throw ProvingError("Cannot stage prover inputs in " + dir.string());
    }

    std::vector<std::string> args = {
        options_.executable, "groth16", "fullprove",
        inputPath.string(), wasmPath.string(), zkeyPath.string(),
        proofPath.string(), publicPath.string()
    };

    int status = RunProcess(args, dir, logPath);
    if (status != 0) {
        std::string log = fs::ReadFile(logPath).value_or("");
        if (status == 127) {
            throw ProvingError("Cannot execute " + options_.executable);
        }
        throw ProvingError(options_.executable + " exited with status " +
                           std::to_string(status) + ": " + TailOf(log));
    }

    ProofOutput output;
    output.proof = ParseSnarkjsProof(ReadJSONOutput(proofPath));
    output.publicSignals = ParseSnarkjsPublicSignals(ReadJSONOutput(publicPath));
    return output;
}

// ============================================================================
// ProofGenerator
// ============================================================================

ProofGenerator::ProofGenerator(std::shared_ptr<IGroth16Backend> backend,
                               std::shared_ptr<util::ThreadPool> pool)
    : backend_(std::move(backend)),
      pool_(std::move(pool)),
      busy_(std::make_shared<std::atomic<bool>>(false)) {}

std::future<ProofOutput> ProofGenerator::Prove(const CircuitInput& input,
                                               ArtifactsPtr artifacts) {
    if (!artifacts) {
        throw ProvingError("Circuit artifacts not loaded");
    }
    if (busy_->exchange(true)) {
        throw ProvingError("Proof generation already in progress");
    }

    // Every signal leaves here as a decimal string
    JSONValue signals = input.ToJSON();

    auto backend = backend_;
    auto busy = busy_;
    auto task = [backend, busy, artifacts, signals = std::move(signals)]() -> ProofOutput {
        struct BusyReset {
            std::shared_ptr<std::atomic<bool>> flag;
            ~BusyReset() { flag->store(false); }
        } reset{busy};

        SPECTRE_LOG_TIMER(util::LogCategory::PROVER, "groth16 fullprove");
        LOG_INFO(util::LogCategory::PROVER) << "Generating proof with " << backend->Name();
        try {
            ProofOutput out = backend->FullProve(signals, *artifacts);
            LOG_INFO(util::LogCategory::PROVER) << "Proof generated ("
                                                << out.publicSignals.size() << " public signals)";
            return out;
        } catch (const ProverError& e) {
            LOG_ERROR(util::LogCategory::PROVER) << "Proof generation failed: " << e.what();
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::PROVER) << "Proof generation failed: " << e.what();
            throw ProvingError(e.what());
        }
    };

    try {
        return pool_->Submit(std::move(task));
    } catch (const util::ThreadPoolError& e) {
        busy_->store(false);
        throw ProvingError(std::string("Cannot schedule proof: ") + e.what());
    }
}

} // namespace spectre
