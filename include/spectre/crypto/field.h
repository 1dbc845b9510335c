// SPECTRE - Finite Field Arithmetic
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Arithmetic over the BN254 scalar field, the native domain of the Poseidon
// hash and the shielded-pool circuit. Every conversion between bytes, decimal
// text and field elements goes through this module.

#ifndef SPECTRE_CRYPTO_FIELD_H
#define SPECTRE_CRYPTO_FIELD_H

#include <cstdint>
#include <array>
#include <optional>
#include <string>
#include "spectre/core/types.h"

namespace spectre {

// ============================================================================
// 256-bit Unsigned Integer (for field arithmetic)
// ============================================================================

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    /// Default constructor - zero
    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    /// Construct from limbs (little-endian)
    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    /// Construct from single value
    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Construct from byte array (little-endian, at most 32 bytes used)
    explicit Uint256(const Byte* data, size_t len);

    /// Construct from big-endian bytes; len must not exceed 32
    static Uint256 FromBigEndian(const Byte* data, size_t len);

    /// Construct from hex string (optional 0x prefix)
    static Uint256 FromHex(const std::string& hex);

    /// Parse unsigned decimal text. Throws std::invalid_argument on
    /// non-digit input and std::out_of_range if the value needs more than 256 bits.
    static Uint256 FromDecimal(const std::string& dec);

    /// Convert to hex string (64 chars, no prefix)
    std::string ToHex() const;

    /// Convert to decimal string without leading zeros
    std::string ToDecimal() const;

    /// Convert to byte array (little-endian, 32 bytes)
    std::array<Byte, 32> ToBytes() const;

    /// Convert to byte array (big-endian, 32 bytes)
    std::array<Byte, 32> ToBigEndian() const;

    /// Check if zero
    bool IsZero() const;

    /// Comparison operators
    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const;
    bool operator>(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;

    /// Shifts
    Uint256 operator<<(int shift) const;
    Uint256 operator>>(int shift) const;

    /// Arithmetic operations (modular arithmetic done in FieldElement)
    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);

    /// Divide by a small divisor, returning the quotient
    static Uint256 DivModSmall(const Uint256& a, uint32_t divisor, uint32_t& remainder);
};

// ============================================================================
// Field Element over BN254 scalar field
// ============================================================================

/// Element of the BN254 scalar field
/// p = 21888242871839275222246405745257275088548364400416034343698204186575808495617
/// This is a 254-bit prime
class FieldElement {
public:
    /// The BN254 scalar field modulus
    static const Uint256 MODULUS;

    /// MODULUS as decimal text
    static const char* const FIELD_SIZE_DECIMAL;

    /// R = 2^256 mod p (for Montgomery form)
    static const Uint256 R;

    /// R^2 mod p (for Montgomery conversion)
    static const Uint256 R2;

    /// -p^(-1) mod 2^64 (for Montgomery reduction)
    static const uint64_t INV;

    /// Internal value (in Montgomery form for efficient multiplication)
    Uint256 value;

    /// Default constructor - zero
    FieldElement();

    /// Construct from Uint256, reducing mod p
    explicit FieldElement(const Uint256& val);

    /// Construct from uint64_t
    explicit FieldElement(uint64_t val);

    /// Zero element
    static FieldElement Zero();

    /// One element
    static FieldElement One();

    /// Signed integer; negative values wrap to p - |val|
    static FieldElement FromInt64(int64_t val);

    /**
     * Parse decimal text (optionally '-' prefixed) or 0x-prefixed hex of any
     * length and reduce it mod p. Throws std::invalid_argument on malformed text.
     */
    static FieldElement FromDecimal(const std::string& text);

    /// As FromDecimal, but std::nullopt on malformed text
    static std::optional<FieldElement> TryFromDecimal(const std::string& text);

    /// Big-endian bytes of any length, reduced mod p
    static FieldElement FromBigEndian(const Byte* data, size_t len);

    /// Construct from little-endian bytes (at most 32), reduced mod p
    static FieldElement FromBytes(const Byte* data, size_t len);

    /// Construct from hex string
    static FieldElement FromHex(const std::string& hex);

    /// Convert from Montgomery form to standard representation
    Uint256 ToUint256() const;

    /// Canonical value as 32 little-endian bytes
    std::array<Byte, 32> ToBytes() const;
    std::array<Byte, 32> ToLittleEndian() const { return ToBytes(); }

    /// Canonical value as 32 big-endian bytes
    std::array<Byte, 32> ToBigEndian() const;

    /// Canonical value as decimal text
    std::string ToDecimal() const;

    /// Check if zero
    bool IsZero() const;

    /// Comparison
    bool operator==(const FieldElement& other) const;
    bool operator!=(const FieldElement& other) const;

    /// Field arithmetic
    FieldElement operator+(const FieldElement& other) const;
    FieldElement operator-(const FieldElement& other) const;
    FieldElement operator*(const FieldElement& other) const;
    FieldElement operator-() const;  // Negation

    FieldElement& operator+=(const FieldElement& other);
    FieldElement& operator-=(const FieldElement& other);
    FieldElement& operator*=(const FieldElement& other);

    /// Square (more efficient than multiply)
    FieldElement Square() const;

    /// Power (exponentiation)
    FieldElement Pow(const Uint256& exp) const;

    /// Inverse (returns 0 if this is 0)
    FieldElement Inverse() const;

    /// S-box for Poseidon: x^5
    FieldElement PoseidonSbox() const;

private:
    /// Montgomery multiplication
    static Uint256 MontMul(const Uint256& a, const Uint256& b);

    /// Montgomery reduction
    static Uint256 MontReduce(const Uint256& lo, const Uint256& hi);

    /// Modular addition
    static Uint256 ModAdd(const Uint256& a, const Uint256& b);

    /// Modular subtraction
    static Uint256 ModSub(const Uint256& a, const Uint256& b);
};

} // namespace spectre

#endif // SPECTRE_CRYPTO_FIELD_H
