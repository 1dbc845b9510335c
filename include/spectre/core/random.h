// SPECTRE - Secure Random Number Generation Header
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Cryptographically secure randomness from OS entropy sources. Used for
// note blinding factors and scratch directory names.

#ifndef SPECTRE_CORE_RANDOM_H
#define SPECTRE_CORE_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace spectre {

/// Fill buffer with cryptographically secure random bytes
/// @throws std::runtime_error if the OS entropy source fails
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random integer in range [0, max)
/// Uses rejection sampling to avoid modulo bias
uint64_t GetRandInt(uint64_t max);

namespace detail {

/// Get entropy from OS; returns false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace spectre

#endif // SPECTRE_CORE_RANDOM_H
