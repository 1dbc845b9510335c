// SPECTRE - Poseidon Hash Function
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// ZK-friendly algebraic hash function over the BN254 scalar field,
// parameterized to match circomlib's Poseidon (the hash the shielded-pool
// circuit is compiled against).
// Based on: "Poseidon: A New Hash Function for Zero-Knowledge Proof Systems"
// https://eprint.iacr.org/2019/458

#ifndef SPECTRE_CRYPTO_POSEIDON_H
#define SPECTRE_CRYPTO_POSEIDON_H

#include <cstdint>
#include <vector>
#include "spectre/crypto/field.h"

namespace spectre {

// ============================================================================
// Poseidon Configuration
// ============================================================================

/// Poseidon hash configuration parameters
struct PoseidonConfig {
    /// State width (t = inputs + 1)
    size_t width;

    /// Number of full rounds (R_F)
    size_t fullRounds;

    /// Number of partial rounds (R_P)
    size_t partialRounds;

    /// Total rounds
    size_t totalRounds() const { return fullRounds + partialRounds; }
};

namespace PoseidonParams {
    /// Smallest and largest supported input counts
    constexpr size_t MIN_INPUTS = 1;
    constexpr size_t MAX_INPUTS = 16;

    /// Full rounds are the same for every width
    constexpr size_t FULL_ROUNDS = 8;

    /// Configuration for hashing `numInputs` elements.
    /// Throws std::invalid_argument outside [MIN_INPUTS, MAX_INPUTS].
    PoseidonConfig ForInputs(size_t numInputs);
}

// ============================================================================
// Round Constants and MDS Matrix
// ============================================================================

/**
 * Constants for one state width, generated by the Grain LFSR exactly as the
 * reference parameter script does (field=1, sbox=0, n=254).
 *
 * Values are kept in canonical (non-Montgomery) form so every hasher
 * back-end can load them into its own arithmetic.
 */
struct PoseidonConstants {
    PoseidonConfig config;

    /// Round constants, (R_F + R_P) * t entries, round-major
    std::vector<Uint256> roundConstants;

    /// Cauchy matrix seeds: M[i][j] = 1 / (cauchyX[i] + cauchyY[j])
    std::vector<Uint256> cauchyX;
    std::vector<Uint256> cauchyY;

    /// MDS matrix (t x t), row-major
    std::vector<std::vector<Uint256>> mds;
};

/// Generate constants for a configuration (uncached)
PoseidonConstants GeneratePoseidonConstants(const PoseidonConfig& config);

/// Constants for a state width, generated on first use and cached for the
/// life of the process. Safe to call from multiple threads.
const PoseidonConstants& GetPoseidonConstants(size_t width);

// ============================================================================
// Poseidon Hash Class
// ============================================================================

/// Poseidon permutation over the BN254 scalar field.
///
/// Hashing n inputs runs one permutation over the state [0, x1, ..., xn]
/// and returns the first state element.
class Poseidon {
public:
    /// Create a hasher for `numInputs` inputs
    explicit Poseidon(size_t numInputs);

    /// Hash exactly numInputs() elements
    FieldElement Hash(const std::vector<FieldElement>& inputs) const;

    /// Number of inputs this instance accepts
    size_t numInputs() const { return config_.width - 1; }

    /// Hash with a cached instance for inputs.size()
    static FieldElement HashMany(const std::vector<FieldElement>& inputs);

private:
    PoseidonConfig config_;

    /// Round constants in Montgomery form
    std::vector<FieldElement> roundConstants_;

    /// MDS matrix in Montgomery form
    std::vector<std::vector<FieldElement>> mdsMatrix_;

    /// Apply the Poseidon permutation to the state
    void Permute(std::vector<FieldElement>& state) const;

    /// Apply full round (S-box on all elements)
    void FullRound(std::vector<FieldElement>& state, size_t roundIdx) const;

    /// Apply partial round (S-box on first element only)
    void PartialRound(std::vector<FieldElement>& state, size_t roundIdx) const;

    /// Add round constants to state
    void AddRoundConstants(std::vector<FieldElement>& state, size_t roundIdx) const;

    /// Apply MDS matrix multiplication
    void MixColumns(std::vector<FieldElement>& state) const;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Hash field elements using Poseidon
inline FieldElement PoseidonHash(const std::vector<FieldElement>& inputs) {
    return Poseidon::HashMany(inputs);
}

} // namespace spectre

#endif // SPECTRE_CRYPTO_POSEIDON_H
