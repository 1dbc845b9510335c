// SPECTRE - Shielded Notes (UTXOs)
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// A note is (amount, blinding, owner keypair, leaf index, mint). Its
// commitment and nullifier are derived on demand, never stored:
//
//   commitment = Poseidon(amount, publicKey, blinding, mintField)
//   nullifier  = Poseidon(commitment, index, Sign(commitment, index))

#ifndef SPECTRE_SHIELD_UTXO_H
#define SPECTRE_SHIELD_UTXO_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "spectre/crypto/field.h"
#include "spectre/shield/keypair.h"
#include "spectre/solana/address.h"

namespace spectre {

/// Exclusive upper bound for random padding-note blindings
constexpr uint64_t DUMMY_BLINDING_BOUND = 1000000000;

/**
 * Field representation of a mint address.
 *
 * The native mint sentinel maps to its own text read as a decimal number.
 * Any other mint maps to the first 31 bytes of its 32-byte encoding, read
 * big-endian, which is always below the field modulus.
 *
 * @throws std::invalid_argument if the address is not valid base58 for 32 bytes
 */
FieldElement MintAddressField(const std::string& mintAddress);

// ============================================================================
// Utxo
// ============================================================================

class Utxo {
public:
    Utxo(uint64_t amount, const FieldElement& blinding, Keypair keypair,
         uint64_t index = 0,
         std::string mintAddress = solana::NATIVE_MINT_ADDRESS);

    /// Zero-value padding note with a fresh random blinding and index 0
    static Utxo Dummy(const Keypair& keypair,
                      const std::string& mintAddress = solana::NATIVE_MINT_ADDRESS);

    /// Uniformly random 248-bit blinding for real notes
    static FieldElement RandomBlinding();

    /**
     * Parse "amount|blinding|index|mintAddress" as written by Serialize().
     * @throws std::invalid_argument on malformed text
     */
    static Utxo Deserialize(const std::string& text, const Keypair& keypair);

    /// "amount|blinding|index|mintAddress"
    std::string Serialize() const;

    uint64_t GetAmount() const { return amount_; }
    const FieldElement& GetBlinding() const { return blinding_; }
    const Keypair& GetKeypair() const { return keypair_; }
    uint64_t GetIndex() const { return index_; }
    const std::string& GetMintAddress() const { return mintAddress_; }

    FieldElement GetMintField() const { return MintAddressField(mintAddress_); }

    FieldElement GetCommitment() const;

    FieldElement GetSignature() const;

    FieldElement GetNullifier() const;

private:
    uint64_t amount_;
    FieldElement blinding_;
    Keypair keypair_;
    uint64_t index_;
    std::string mintAddress_;
};

// ============================================================================
// Spent Checks
// ============================================================================

/// Seed prefixes of the two nullifier accounts (one per circuit input slot)
constexpr const char* NULLIFIER0_SEED = "nullifier0";
constexpr const char* NULLIFIER1_SEED = "nullifier1";

/// The two program-derived accounts that exist once the note is spent
std::array<solana::PublicKey, 2> NullifierAccounts(const Utxo& utxo,
                                                   const solana::PublicKey& programId);

/// Read-only view of on-chain account existence
class IAccountLookup {
public:
    virtual ~IAccountLookup() = default;

    /// One flag per address, in order: true if the account exists
    virtual std::vector<bool> AccountsExist(const std::vector<solana::PublicKey>& addresses) = 0;
};

/// True if either nullifier account of the note exists
bool IsUtxoSpent(const Utxo& utxo, const solana::PublicKey& programId,
                 IAccountLookup& lookup);

} // namespace spectre

#endif // SPECTRE_SHIELD_UTXO_H
