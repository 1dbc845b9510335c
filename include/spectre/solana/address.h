// SPECTRE - Solana Addresses
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// 32-byte account addresses, their base58 text form, and program-derived
// addresses (PDAs) used to locate nullifier and deposit accounts.

#ifndef SPECTRE_SOLANA_ADDRESS_H
#define SPECTRE_SOLANA_ADDRESS_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "spectre/core/types.h"

namespace spectre {
namespace solana {

// ============================================================================
// Public Key
// ============================================================================

class PublicKey {
public:
    static constexpr size_t SIZE = 32;

    PublicKey() : data_{} {}
    explicit PublicKey(const std::array<Byte, SIZE>& data) : data_(data) {}

    /// Decode base58 text; std::nullopt unless it decodes to exactly 32 bytes
    static std::optional<PublicKey> FromBase58(const std::string& str);

    /// As FromBase58, throwing std::invalid_argument on bad input
    static PublicKey Parse(const std::string& str);

    std::string ToBase58() const;

    const std::array<Byte, SIZE>& GetBytes() const { return data_; }
    const Byte* data() const { return data_.data(); }

    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return data_ != other.data_; }
    bool operator<(const PublicKey& other) const { return data_ < other.data_; }

private:
    std::array<Byte, SIZE> data_;
};

/// Wrapped-SOL mint, used as the native-asset sentinel
constexpr const char* NATIVE_MINT_ADDRESS = "11111111111111111111111111111112";

// ============================================================================
// Program Derived Addresses
// ============================================================================

/// Maximum number of seeds and bytes per seed
constexpr size_t MAX_SEEDS = 16;
constexpr size_t MAX_SEED_LEN = 32;

/// True if the bytes decompress to a point on the ed25519 curve
bool IsOnCurve(const std::array<Byte, 32>& bytes);

/// sha256(seeds || programId || "ProgramDerivedAddress"), or std::nullopt
/// when the result is a valid curve point. Throws std::invalid_argument if
/// the seed limits are exceeded.
std::optional<PublicKey> CreateProgramAddress(const std::vector<Bytes>& seeds,
                                              const PublicKey& programId);

struct ProgramAddress {
    PublicKey address;
    uint8_t bump;
};

/// Search bump seeds from 255 down to 0 and return the first off-curve
/// address. Throws std::runtime_error if no bump works.
ProgramAddress FindProgramAddress(const std::vector<Bytes>& seeds,
                                  const PublicKey& programId);

/// Seed from UTF-8 text
Bytes SeedFromString(const std::string& text);

} // namespace solana
} // namespace spectre

#endif // SPECTRE_SOLANA_ADDRESS_H
