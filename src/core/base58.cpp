// SPECTRE - Base58 Encoding Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/core/base58.h"

namespace spectre {

namespace {

const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const int8_t BASE58_MAP[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1, 0, 1, 2, 3, 4, 5, 6,  7, 8,-1,-1,-1,-1,-1,-1,
    -1, 9,10,11,12,13,14,15, 16,-1,17,18,19,20,21,-1,
    22,23,24,25,26,27,28,29, 30,31,32,-1,-1,-1,-1,-1,
    -1,33,34,35,36,37,38,39, 40,41,42,43,-1,44,45,46,
    47,48,49,50,51,52,53,54, 55,56,57,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
};

} // namespace

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    size_t zeroes = 0;
    while (zeroes < data.size() && data[zeroes] == 0) {
        ++zeroes;
    }

    // log(256) / log(58), rounded up
    std::vector<uint8_t> b58((data.size() - zeroes) * 138 / 100 + 1);
    size_t length = 0;

    for (size_t i = zeroes; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }

    std::string str;
    str.reserve(zeroes + static_cast<size_t>(b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) {
        str += BASE58_ALPHABET[*it++];
    }
    return str;
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }

    // log(58) / log(256), rounded up
    std::vector<uint8_t> b256((str.size() - zeroes) * 733 / 1000 + 1);
    size_t length = 0;

    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = BASE58_MAP[static_cast<uint8_t>(str[i])];
        if (carry < 0) {
            return std::nullopt;
        }
        size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
    while (it != b256.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result;
    result.reserve(zeroes + static_cast<size_t>(b256.end() - it));
    result.assign(zeroes, 0x00);
    while (it != b256.end()) {
        result.push_back(*it++);
    }
    return result;
}

} // namespace spectre
