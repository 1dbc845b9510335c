// SPECTRE - Shielded Notes (UTXOs)
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/shield/utxo.h"
#include "spectre/core/random.h"

#include <charconv>
#include <stdexcept>

namespace spectre {

namespace {

uint64_t ParseUnsigned(const std::string& text, const char* what) {
    uint64_t value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    auto result = std::from_chars(first, last, value);
    if (text.empty() || result.ec != std::errc() || result.ptr != last) {
        throw std::invalid_argument(std::string("Invalid note ") + what + ": " + text);
    }
    return value;
}

std::vector<std::string> SplitFields(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // anonymous namespace

FieldElement MintAddressField(const std::string& mintAddress) {
    if (mintAddress == solana::NATIVE_MINT_ADDRESS) {
        return FieldElement::FromDecimal(mintAddress);
    }
    solana::PublicKey mint = solana::PublicKey::Parse(mintAddress);
    return FieldElement::FromBigEndian(mint.data(), 31);
}

// ============================================================================
// Utxo
// ============================================================================

Utxo::Utxo(uint64_t amount, const FieldElement& blinding, Keypair keypair,
           uint64_t index, std::string mintAddress)
    : amount_(amount)
    , blinding_(blinding)
    , keypair_(std::move(keypair))
    , index_(index)
    , mintAddress_(std::move(mintAddress)) {}

Utxo Utxo::Dummy(const Keypair& keypair, const std::string& mintAddress) {
    FieldElement blinding(GetRandInt(DUMMY_BLINDING_BOUND));
    return Utxo(0, blinding, keypair, 0, mintAddress);
}

FieldElement Utxo::RandomBlinding() {
    std::array<Byte, 31> bytes;
    GetRandBytes(bytes.data(), bytes.size());
    return FieldElement::FromBigEndian(bytes.data(), bytes.size());
}

Utxo Utxo::Deserialize(const std::string& text, const Keypair& keypair) {
    std::vector<std::string> parts = SplitFields(text, '|');
    if (parts.size() != 4) {
        throw std::invalid_argument("Serialized note must have 4 fields");
    }

    uint64_t amount = ParseUnsigned(parts[0], "amount");
    auto blinding = FieldElement::TryFromDecimal(parts[1]);
    if (!blinding) {
        throw std::invalid_argument("Invalid note blinding: " + parts[1]);
    }
    uint64_t index = ParseUnsigned(parts[2], "index");
    if (parts[3].empty()) {
        throw std::invalid_argument("Serialized note has no mint address");
    }
    return Utxo(amount, *blinding, keypair, index, parts[3]);
}

std::string Utxo::Serialize() const {
    return std::to_string(amount_) + "|" + blinding_.ToDecimal() + "|" +
           std::to_string(index_) + "|" + mintAddress_;
}

FieldElement Utxo::GetCommitment() const {
    const IPoseidonHasher& hasher = *keypair_.GetHasher();
    return hasher.Hash({FieldElement(amount_), keypair_.GetPublicKey(), blinding_, GetMintField()});
}

FieldElement Utxo::GetSignature() const {
    return keypair_.Sign(GetCommitment(), FieldElement(index_));
}

FieldElement Utxo::GetNullifier() const {
    FieldElement commitment = GetCommitment();
    FieldElement index(index_);
    FieldElement signature = keypair_.Sign(commitment, index);
    return keypair_.GetHasher()->Hash({commitment, index, signature});
}

// ============================================================================
// Spent Checks
// ============================================================================

std::array<solana::PublicKey, 2> NullifierAccounts(const Utxo& utxo,
                                                   const solana::PublicKey& programId) {
    auto nullifier = utxo.GetNullifier().ToBigEndian();
    Bytes nullifierSeed(nullifier.begin(), nullifier.end());

    auto first = solana::FindProgramAddress(
        {solana::SeedFromString(NULLIFIER0_SEED), nullifierSeed}, programId);
    auto second = solana::FindProgramAddress(
        {solana::SeedFromString(NULLIFIER1_SEED), nullifierSeed}, programId);
    return {first.address, second.address};
}

bool IsUtxoSpent(const Utxo& utxo, const solana::PublicKey& programId,
                 IAccountLookup& lookup) {
    auto accounts = NullifierAccounts(utxo, programId);
    std::vector<bool> exists = lookup.AccountsExist({accounts[0], accounts[1]});
    if (exists.size() != accounts.size()) {
        throw std::runtime_error("Account lookup returned an unexpected number of results");
    }
    return exists[0] || exists[1];
}

} // namespace spectre
