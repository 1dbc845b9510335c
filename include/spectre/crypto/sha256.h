// SPECTRE - SHA-256
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Incremental SHA-256 over OpenSSL EVP, used for program-derived addresses
// and signer-based key derivation.

#ifndef SPECTRE_CRYPTO_SHA256_H
#define SPECTRE_CRYPTO_SHA256_H

#include <array>
#include <cstddef>
#include <string>
#include "spectre/core/types.h"

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace spectre {

using Hash256 = std::array<Byte, 32>;

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);
    SHA256& Write(const std::string& data);

    /// Finalize the hash; the hasher must be Reset() before reuse
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

/// One-shot SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

} // namespace spectre

#endif // SPECTRE_CRYPTO_SHA256_H
