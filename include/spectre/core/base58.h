// SPECTRE - Base58 Encoding
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Bitcoin-alphabet base58, the textual form of Solana account addresses.

#ifndef SPECTRE_CORE_BASE58_H
#define SPECTRE_CORE_BASE58_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spectre {

/// Encode bytes as base58 (leading zero bytes become '1')
std::string EncodeBase58(const std::vector<uint8_t>& data);

/// Decode base58 text; std::nullopt on any character outside the alphabet
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

} // namespace spectre

#endif // SPECTRE_CORE_BASE58_H
