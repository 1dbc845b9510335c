// SPECTRE CLI - Command Line Interface
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// spectre-cli runs the shielded-pool primitives locally: Poseidon hashing,
// key and note derivation, program addresses, proof formatting, note
// import/export and full proof generation without a running daemon.

#include "spectre/circuits/asset_loader.h"
#include "spectre/core/hex.h"
#include "spectre/core/json.h"
#include "spectre/prover/context.h"
#include "spectre/prover/service.h"
#include "spectre/shield/keypair.h"
#include "spectre/shield/note.h"
#include "spectre/shield/request.h"
#include "spectre/shield/utxo.h"
#include "spectre/solana/address.h"
#include "spectre/util/config.h"
#include "spectre/util/fs.h"
#include "spectre/util/logging.h"

#include <charconv>
#include <cstring>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace spectre {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "SPECTRE CLI";

/// Thrown for malformed command arguments; printed with the usage line
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

struct CommandContext {
    const util::ConfigManager& config;
    ProverOptions options;
    std::vector<std::string> args;
};

using CommandHandler = std::function<int(CommandContext&)>;

struct Command {
    const char* usage;
    const char* description;
    size_t minArgs;
    size_t maxArgs;
    CommandHandler handler;
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp(const std::map<std::string, Command>& commands) {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: spectre-cli [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  --conf=FILE                Config file (default: spectre.conf)\n";
    std::cout << "  --hasher.backend=NAME      native or bignum (default: native)\n";
    std::cout << "  --loglevel=LEVEL           Log level (default: warn)\n";
    std::cout << "  Any spectred option is accepted in --key=value form.\n";
    std::cout << "\nCommands:\n";
    for (const auto& entry : commands) {
        std::string usage = entry.second.usage;
        std::cout << "  " << usage;
        if (usage.size() < 44) {
            std::cout << std::string(44 - usage.size(), ' ');
        } else {
            std::cout << "\n  " << std::string(44, ' ');
        }
        std::cout << entry.second.description << "\n";
    }
    std::cout << "\nPDA seeds: plain text, hex:<bytes>, key:<base58> or field:<decimal>\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 SPECTRE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Helpers
// ============================================================================

uint64_t ParseAmount(const std::string& text, const char* what) {
    uint64_t value = 0;
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
        throw UsageError(std::string("Invalid ") + what + ": " + text);
    }
    return value;
}

FieldElement ParseField(const std::string& text, const char* what) {
    auto value = FieldElement::TryFromDecimal(text);
    if (!value) {
        throw UsageError(std::string("Invalid ") + what + ": " + text);
    }
    return *value;
}

std::string ReadInput(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    auto content = util::fs::ReadFile(path);
    if (!content) {
        throw std::runtime_error("Cannot read " + path);
    }
    return *content;
}

JSONValue ReadJSON(const std::string& path) {
    auto json = JSONValue::TryParse(ReadInput(path));
    if (!json) {
        throw std::runtime_error("Invalid JSON in " + path);
    }
    return *json;
}

/// Seed prefixes: hex:, key:, field:; anything else is UTF-8 text
Bytes ParseSeed(const std::string& text) {
    if (text.compare(0, 4, "hex:") == 0) {
        std::string hex = text.substr(4);
        if (!IsValidHex(hex)) {
            throw UsageError("Invalid hex seed: " + text);
        }
        return HexToBytes(hex);
    }
    if (text.compare(0, 4, "key:") == 0) {
        auto key = solana::PublicKey::FromBase58(text.substr(4));
        if (!key) {
            throw UsageError("Invalid base58 seed: " + text);
        }
        return Bytes(key->GetBytes().begin(), key->GetBytes().end());
    }
    if (text.compare(0, 6, "field:") == 0) {
        auto be = ParseField(text.substr(6), "field seed").ToBigEndian();
        return Bytes(be.begin(), be.end());
    }
    return solana::SeedFromString(text);
}

HasherPtr LoadHasher(const CommandContext& ctx) {
    return HasherHandle::ForBackend(ctx.options.hasherBackend)->Get();
}

void PrintJSON(const JSONValue& value) {
    std::cout << value.ToJSON(true) << "\n";
}

// ============================================================================
// Commands
// ============================================================================

int CmdHash(CommandContext& ctx) {
    auto hasher = LoadHasher(ctx);
    std::vector<FieldElement> inputs;
    inputs.reserve(ctx.args.size());
    for (const auto& arg : ctx.args) {
        inputs.push_back(ParseField(arg, "field element"));
    }
    std::cout << hasher->Hash(inputs).ToDecimal() << "\n";
    return 0;
}

int CmdKeypair(CommandContext& ctx) {
    Keypair keypair = Keypair::Derive(ctx.args[0], LoadHasher(ctx));
    JSONValue::Object obj;
    obj["privateKey"] = keypair.GetPrivateKey().ToDecimal();
    obj["publicKey"] = keypair.GetPublicKey().ToDecimal();
    PrintJSON(JSONValue(std::move(obj)));
    return 0;
}

Utxo UtxoFromArgs(const CommandContext& ctx, uint64_t index, size_t mintArg) {
    Keypair keypair = Keypair::Derive(ctx.args[2], LoadHasher(ctx));
    std::string mint = ctx.args.size() > mintArg ? ctx.args[mintArg]
                                                 : std::string(solana::NATIVE_MINT_ADDRESS);
    return Utxo(ParseAmount(ctx.args[0], "amount"), ParseField(ctx.args[1], "blinding"),
                keypair, index, mint);
}

int CmdCommitment(CommandContext& ctx) {
    Utxo utxo = UtxoFromArgs(ctx, 0, 3);
    std::cout << utxo.GetCommitment().ToDecimal() << "\n";
    return 0;
}

int CmdNullifier(CommandContext& ctx) {
    Utxo utxo = UtxoFromArgs(ctx, ParseAmount(ctx.args[3], "index"), 4);
    auto accounts = NullifierAccounts(utxo, ctx.options.shieldProgramId);

    JSONValue::Object obj;
    obj["commitment"] = utxo.GetCommitment().ToDecimal();
    obj["signature"] = utxo.GetSignature().ToDecimal();
    obj["nullifier"] = utxo.GetNullifier().ToDecimal();
    obj["nullifier0Account"] = accounts[0].ToBase58();
    obj["nullifier1Account"] = accounts[1].ToBase58();
    PrintJSON(JSONValue(std::move(obj)));
    return 0;
}

int CmdMintField(CommandContext& ctx) {
    std::cout << MintAddressField(ctx.args[0]).ToDecimal() << "\n";
    return 0;
}

int CmdPda(CommandContext& ctx) {
    solana::PublicKey programId = solana::PublicKey::Parse(ctx.args[0]);
    std::vector<Bytes> seeds;
    for (size_t i = 1; i < ctx.args.size(); ++i) {
        seeds.push_back(ParseSeed(ctx.args[i]));
    }
    solana::ProgramAddress pda = solana::FindProgramAddress(seeds, programId);

    JSONValue::Object obj;
    obj["address"] = pda.address.ToBase58();
    obj["bump"] = static_cast<int>(pda.bump);
    PrintJSON(JSONValue(std::move(obj)));
    return 0;
}

int CmdFetchCircuits(CommandContext& ctx) {
    auto fetcher = std::make_shared<CurlArtifactFetcher>(ctx.options.fetchTimeoutSeconds);
    CircuitAssetLoader loader(ctx.options.circuits, fetcher);

    int lastPercent = -1;
    ArtifactsPtr artifacts = loader.Load([&lastPercent](const LoadProgress& progress) {
        if (progress.stage != LoadStage::Downloading || progress.totalBytes == 0) return;
        int percent = static_cast<int>(progress.bytesLoaded * 100 / progress.totalBytes);
        if (percent / 10 != lastPercent / 10) {
            std::cerr << "Downloading circuits: " << percent << "%\n";
            lastPercent = percent;
        }
    });

    JSONValue::Object obj;
    obj["source"] = artifacts->source;
    obj["wasmBytes"] = static_cast<uint64_t>(artifacts->wasm.size());
    obj["zkeyBytes"] = static_cast<uint64_t>(artifacts->zkey.size());
    PrintJSON(JSONValue(std::move(obj)));
    return 0;
}

int CmdFormatProof(CommandContext& ctx) {
    Proof proof = ParseSnarkjsProof(ReadJSON(ctx.args[0]));
    std::vector<std::string> signals = ParseSnarkjsPublicSignals(ReadJSON(ctx.args[1]));
    PrintJSON(ProveResponse::FromProof(proof, std::move(signals)).ToJSON());
    return 0;
}

int CmdProve(CommandContext& ctx) {
    JSONValue body = ReadJSON(ctx.args[0]);

    auto context = ProverContext::Create(ctx.options);
    ProveService service(context);
    ProveResult result = service.Prove(body);
    context->Shutdown();

    if (result.IsSuccess()) {
        PrintJSON(result.ToJSON());
        return 0;
    }
    std::cerr << result.ToJSON().ToJSON(true) << "\n";
    return result.HttpStatus() == 400 ? 2 : 1;
}

int CmdNotesExport(CommandContext& ctx) {
    NoteBook book = NoteBook::Load(ctx.args[0]);
    std::cout << book.ExportUnspent() << "\n";
    return 0;
}

int CmdNotesImport(CommandContext& ctx) {
    NoteBook book = NoteBook::Load(ctx.args[0]);
    size_t imported = book.Import(ReadInput(ctx.args[1]));
    book.Save(ctx.args[0]);

    JSONValue::Object obj;
    obj["imported"] = static_cast<uint64_t>(imported);
    obj["total"] = static_cast<uint64_t>(book.GetNotes().size());
    obj["unspentSol"] = book.UnspentBalance(TokenType::SOL);
    PrintJSON(JSONValue(std::move(obj)));
    return 0;
}

std::map<std::string, Command> BuildCommandTable() {
    std::map<std::string, Command> commands;
    commands["prove"] = {"prove <request.json|->", "Generate a proof for a prove request",
                         1, 1, CmdProve};
    commands["hash"] = {"hash <x1> [x2 ...]", "Poseidon hash of 1 to 16 field elements",
                        1, 16, CmdHash};
    commands["keypair"] = {"keypair <secret>", "Derive the shielded keypair of a secret",
                           1, 1, CmdKeypair};
    commands["commitment"] = {"commitment <amount> <blinding> <secret> [mint]",
                              "Note commitment", 3, 4, CmdCommitment};
    commands["nullifier"] = {"nullifier <amount> <blinding> <secret> <index> [mint]",
                             "Note nullifier and its nullifier accounts", 4, 5, CmdNullifier};
    commands["mintfield"] = {"mintfield <address>", "Field encoding of a mint address",
                             1, 1, CmdMintField};
    commands["fetch-circuits"] = {"fetch-circuits", "Load and validate circuit artifacts",
                                  0, 0, CmdFetchCircuits};
    commands["format-proof"] = {"format-proof <proof.json> <public.json>",
                                "Convert snarkjs output to on-chain bytes", 2, 2, CmdFormatProof};
    commands["notes-export"] = {"notes-export <notes.json>", "Export unspent notes",
                                1, 1, CmdNotesExport};
    commands["notes-import"] = {"notes-import <book.json> <incoming.json|->",
                                "Merge exported notes into a note book", 2, 2, CmdNotesImport};
    commands["pda"] = {"pda <programId> <seed>...", "Find a program derived address",
                       1, solana::MAX_SEEDS + 1, CmdPda};
    return commands;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    auto commands = BuildCommandTable();

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            PrintHelp(commands);
            return 0;
        }
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            PrintVersion();
            return 0;
        }
    }

    util::ConfigManager config;
    config.SetDefault(util::ConfigKeys::LOGLEVEL, "warn");

    auto cliResult = config.ParseCommandLine(argc, argv);
    if (!cliResult.success) {
        std::cerr << "Error: " << cliResult.errorMessage << "\n";
        return 1;
    }
    if (config.HasKey(util::ConfigKeys::CONF)) {
        auto fileResult = config.ParseFile(config.GetPath(util::ConfigKeys::CONF));
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.errorMessage << "\n";
            return 1;
        }
        // Command line wins over the file
        config.ParseCommandLine(argc, argv);
    }

    if (cliResult.positional.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'spectre-cli --help' for usage information.\n";
        return 1;
    }

    std::string name = cliResult.positional.front();
    auto it = commands.find(name);
    if (it == commands.end()) {
        std::cerr << "Error: Unknown command '" << name << "'\n";
        return 1;
    }
    const Command& command = it->second;

    SetupLogging(config);

    CommandContext ctx{config, ProverOptions::FromConfig(config),
                       std::vector<std::string>(cliResult.positional.begin() + 1,
                                                cliResult.positional.end())};
    if (ctx.args.size() < command.minArgs || ctx.args.size() > command.maxArgs) {
        std::cerr << "Usage: spectre-cli " << command.usage << "\n";
        return 1;
    }

    try {
        return command.handler(ctx);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Usage: spectre-cli " << command.usage << "\n";
        return 1;
    }
}

} // namespace cli
} // namespace spectre

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return spectre::cli::AppMain(argc, argv);
    } catch (const spectre::ProverError& e) {
        std::cerr << "Error (" << spectre::ErrorStageToString(e.GetStage()) << "): "
                  << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
