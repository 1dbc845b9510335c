// SPECTRE - Note Keypair
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/shield/keypair.h"
#include "spectre/core/hex.h"
#include "spectre/crypto/sha256.h"

#include <stdexcept>

namespace spectre {

Keypair::Keypair(const FieldElement& privateKey, HasherPtr hasher)
    : privateKey_(privateKey), hasher_(std::move(hasher)) {
    if (!hasher_) {
        throw std::invalid_argument("Keypair requires a hasher");
    }
    publicKey_ = hasher_->Hash({privateKey_});
}

Keypair Keypair::Derive(const std::string& secret, HasherPtr hasher) {
    return Keypair(FieldElement::FromDecimal(secret), std::move(hasher));
}

FieldElement Keypair::Sign(const FieldElement& commitment, const FieldElement& index) const {
    return hasher_->Hash({privateKey_, commitment, index});
}

std::string DeriveSecretFromSignature(const Bytes& signature) {
    constexpr size_t SEED_LEN = 31;
    if (signature.size() < SEED_LEN) {
        throw std::runtime_error("Wallet signature too short to derive note keys");
    }
    Hash256 digest = SHA256Hash(signature.data(), SEED_LEN);
    std::string secret = "0x" + BytesToHex(digest);

    // The digest is key material; wipe the local copy
    volatile Byte* p = digest.data();
    for (size_t i = 0; i < digest.size(); ++i) p[i] = 0;
    return secret;
}

Keypair DeriveKeypairFromSigner(ISigner& signer, HasherPtr hasher) {
    const std::string message = ACCOUNT_SIGN_IN_MESSAGE;
    Bytes signature = signer.SignMessage(Bytes(message.begin(), message.end()));
    return Keypair::Derive(DeriveSecretFromSignature(signature), std::move(hasher));
}

} // namespace spectre
