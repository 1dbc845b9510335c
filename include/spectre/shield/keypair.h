// SPECTRE - Note Keypair
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Spending keys for shielded notes. The public key is Poseidon(privateKey);
// "signing" a note is Poseidon(privateKey, commitment, index).

#ifndef SPECTRE_SHIELD_KEYPAIR_H
#define SPECTRE_SHIELD_KEYPAIR_H

#include <memory>
#include <string>

#include "spectre/core/types.h"
#include "spectre/crypto/field.h"
#include "spectre/crypto/hasher.h"

namespace spectre {

/// Hasher shared by every note-level component
using HasherPtr = std::shared_ptr<const IPoseidonHasher>;

// ============================================================================
// Keypair
// ============================================================================

class Keypair {
public:
    /// Keypair for a private key already reduced mod p
    Keypair(const FieldElement& privateKey, HasherPtr hasher);

    /**
     * Derive from a raw secret given as decimal or 0x-prefixed hex text.
     * privateKey = secret mod p. Throws std::invalid_argument on malformed text.
     */
    static Keypair Derive(const std::string& secret, HasherPtr hasher);

    const FieldElement& GetPrivateKey() const { return privateKey_; }
    const FieldElement& GetPublicKey() const { return publicKey_; }
    const HasherPtr& GetHasher() const { return hasher_; }

    /// Poseidon(privateKey, commitment, index)
    FieldElement Sign(const FieldElement& commitment, const FieldElement& index) const;

    bool operator==(const Keypair& other) const { return privateKey_ == other.privateKey_; }
    bool operator!=(const Keypair& other) const { return !(*this == other); }

private:
    FieldElement privateKey_;
    FieldElement publicKey_;
    HasherPtr hasher_;
};

// ============================================================================
// Wallet Signer
// ============================================================================

/// Wallet signing capability supplied by the caller
class ISigner {
public:
    virtual ~ISigner() = default;

    /// Sign an arbitrary message (ed25519, 64 bytes)
    virtual Bytes SignMessage(const Bytes& message) = 0;
};

/// Message the wallet signs to derive note keys
constexpr const char* ACCOUNT_SIGN_IN_MESSAGE = "Privacy Money account sign in";

/**
 * Derive the note keypair from a wallet: sign ACCOUNT_SIGN_IN_MESSAGE, hash
 * the first 31 signature bytes with SHA-256 and use the digest as secret.
 * Throws std::runtime_error if the signature is shorter than 31 bytes.
 */
Keypair DeriveKeypairFromSigner(ISigner& signer, HasherPtr hasher);

/// The secret DeriveKeypairFromSigner would use, as 0x-prefixed hex
std::string DeriveSecretFromSignature(const Bytes& signature);

} // namespace spectre

#endif // SPECTRE_SHIELD_KEYPAIR_H
