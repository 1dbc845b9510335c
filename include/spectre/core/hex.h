// SPECTRE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#ifndef SPECTRE_CORE_HEX_H
#define SPECTRE_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace spectre {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (an optional 0x prefix is accepted)
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

/// Copy of the buffer in reverse byte order
std::vector<uint8_t> ReverseBytes(const uint8_t* data, size_t len);

template<size_t N>
std::array<uint8_t, N> ReverseBytes(const std::array<uint8_t, N>& data) {
    std::array<uint8_t, N> result;
    for (size_t i = 0; i < N; ++i) {
        result[i] = data[N - 1 - i];
    }
    return result;
}

/// Space-separated hex rendering used in diagnostics ("00 61 73 6d")
std::string BytesToSpacedHex(const uint8_t* data, size_t len);

} // namespace spectre

#endif // SPECTRE_CORE_HEX_H
