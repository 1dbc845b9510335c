// SPECTRE - Groth16 Proof Encoding
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Typed Groth16 proofs and their fixed-width encoding for the on-chain
// verifier. Curve coordinates live in the BN254 base field, which is wider
// than the scalar field, so they are kept as plain 256-bit integers.
//
// Encoding (all values 32 bytes big-endian):
//   proofA = a.x || a.y
//   proofB = b.x[1] || b.x[0] || b.y[1] || b.y[0]
//   proofC = c.x || c.y
//   public input i = signal i
//
// The G2 coordinate order is the verifier's (c1, c0) basis order, i.e. each
// coordinate pair serialized little-endian and then reversed as a whole.

#ifndef SPECTRE_PROVER_PROOF_H
#define SPECTRE_PROVER_PROOF_H

#include <array>
#include <string>
#include <vector>

#include "spectre/core/json.h"
#include "spectre/core/types.h"
#include "spectre/crypto/field.h"

namespace spectre {

/// Affine-or-projective G1 point as snarkjs prints it (x, y, z)
struct G1Point {
    Uint256 x;
    Uint256 y;
    Uint256 z{1};
};

/// G2 point; each coordinate is an Fq2 element (c0, c1)
struct G2Point {
    std::array<Uint256, 2> x;
    std::array<Uint256, 2> y;
    std::array<Uint256, 2> z{Uint256(1), Uint256(0)};
};

struct Proof {
    G1Point a;
    G2Point b;
    G1Point c;

    /// { pi_a: [3], pi_b: [3][2], pi_c: [3] }
    JSONValue ToJSON() const;
};

/// Byte encoding consumed by the verifier
struct FormattedProof {
    std::array<Byte, 64> proofA;
    std::array<Byte, 128> proofB;
    std::array<Byte, 64> proofC;
};

using PublicInputBytes = std::array<Byte, 32>;

/**
 * Parse a snarkjs proof object.
 * @throws FormattingError if pi_a/pi_b/pi_c are missing or have the wrong
 *         shape, or a coordinate is not a decimal below 2^256
 */
Proof ParseSnarkjsProof(const JSONValue& json);

/**
 * Parse a snarkjs public signals array (decimal strings).
 * @throws FormattingError on a non-array or a non-decimal entry
 */
std::vector<std::string> ParseSnarkjsPublicSignals(const JSONValue& json);

/// Pure function of the proof
FormattedProof FormatProof(const Proof& proof);

/**
 * Encode each public signal as 32 bytes big-endian.
 * @throws FormattingError if a signal is not a decimal below 2^256
 */
std::vector<PublicInputBytes> FormatPublicSignals(const std::vector<std::string>& signals);

/// JSON array of byte values, as the submission layer consumes them
template<size_t N>
JSONValue BytesToJSONArray(const std::array<Byte, N>& bytes) {
    JSONValue::Array arr;
    arr.reserve(N);
    for (Byte b : bytes) {
        arr.emplace_back(static_cast<int>(b));
    }
    return JSONValue(std::move(arr));
}

} // namespace spectre

#endif // SPECTRE_PROVER_PROOF_H
