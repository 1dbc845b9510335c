// SPECTRE - Core Types Header
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Fundamental types shared by the shield prover.

#ifndef SPECTRE_CORE_TYPES_H
#define SPECTRE_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace spectre {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using Bytes = std::vector<Byte>;

/// Amount in lamports (smallest native-asset unit)
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// 1 SOL = 10^9 lamports
constexpr Amount LAMPORTS_PER_SOL = 1000000000LL;

/// Check if amount is a valid non-negative note value
inline bool AmountRange(Amount value) {
    return value >= 0;
}

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/// Get current time in milliseconds
inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace spectre

#endif // SPECTRE_CORE_TYPES_H
