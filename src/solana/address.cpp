// SPECTRE - Solana Addresses
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/solana/address.h"
#include "spectre/core/base58.h"
#include "spectre/crypto/sha256.h"

#include <openssl/bn.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace spectre {
namespace solana {

// ============================================================================
// Public Key
// ============================================================================

std::optional<PublicKey> PublicKey::FromBase58(const std::string& str) {
    auto decoded = DecodeBase58(str);
    if (!decoded || decoded->size() != SIZE) {
        return std::nullopt;
    }
    std::array<Byte, SIZE> bytes;
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return PublicKey(bytes);
}

PublicKey PublicKey::Parse(const std::string& str) {
    auto key = FromBase58(str);
    if (!key) {
        throw std::invalid_argument("Invalid Solana address: " + str);
    }
    return *key;
}

std::string PublicKey::ToBase58() const {
    return EncodeBase58(std::vector<uint8_t>(data_.begin(), data_.end()));
}

// ============================================================================
// Curve Check
// ============================================================================

namespace {

// q = 2^255 - 19
const char* ED25519_Q_HEX =
    "7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffed";
// d = -121665 / 121666 mod q
const char* ED25519_D_DEC =
    "37095705934669439343138083508754565189542113879843219016388785533085940283555";

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

BnPtr NewBn() {
    BnPtr bn(BN_new());
    if (!bn) throw std::runtime_error("BN_new failed");
    return bn;
}

void CheckBn(int ok) {
    if (ok != 1) throw std::runtime_error("BIGNUM operation failed");
}

} // anonymous namespace

bool IsOnCurve(const std::array<Byte, 32>& bytes) {
    std::unique_ptr<BN_CTX, BnCtxDeleter> ctx(BN_CTX_new());
    if (!ctx) throw std::runtime_error("BN_CTX_new failed");

    BIGNUM* raw = nullptr;
    if (BN_hex2bn(&raw, ED25519_Q_HEX) == 0) throw std::runtime_error("BN_hex2bn failed");
    BnPtr q(raw);
    raw = nullptr;
    if (BN_dec2bn(&raw, ED25519_D_DEC) == 0) throw std::runtime_error("BN_dec2bn failed");
    BnPtr d(raw);

    // y is little-endian with the x sign bit in the top bit
    std::array<Byte, 32> le = bytes;
    le[31] &= 0x7f;
    BnPtr y(BN_lebin2bn(le.data(), static_cast<int>(le.size()), nullptr));
    if (!y) throw std::runtime_error("BN_lebin2bn failed");
    CheckBn(BN_nnmod(y.get(), y.get(), q.get(), ctx.get()));

    // u = y^2 - 1, v = d*y^2 + 1
    BnPtr y2 = NewBn();
    CheckBn(BN_mod_sqr(y2.get(), y.get(), q.get(), ctx.get()));
    BnPtr u = NewBn();
    CheckBn(BN_mod_sub(u.get(), y2.get(), BN_value_one(), q.get(), ctx.get()));
    BnPtr v = NewBn();
    CheckBn(BN_mod_mul(v.get(), d.get(), y2.get(), q.get(), ctx.get()));
    CheckBn(BN_mod_add(v.get(), v.get(), BN_value_one(), q.get(), ctx.get()));

    if (BN_is_zero(u.get())) {
        return true;
    }

    // x^2 = u / v must be a quadratic residue: (u/v)^((q-1)/2) == 1
    BnPtr vinv(BN_mod_inverse(nullptr, v.get(), q.get(), ctx.get()));
    if (!vinv) {
        return false;
    }
    BnPtr x2 = NewBn();
    CheckBn(BN_mod_mul(x2.get(), u.get(), vinv.get(), q.get(), ctx.get()));

    BnPtr exp = NewBn();
    CheckBn(BN_sub(exp.get(), q.get(), BN_value_one()));
    CheckBn(BN_rshift1(exp.get(), exp.get()));

    BnPtr legendre = NewBn();
    CheckBn(BN_mod_exp(legendre.get(), x2.get(), exp.get(), q.get(), ctx.get()));
    return BN_is_one(legendre.get()) == 1;
}

// ============================================================================
// Program Derived Addresses
// ============================================================================

Bytes SeedFromString(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::optional<PublicKey> CreateProgramAddress(const std::vector<Bytes>& seeds,
                                              const PublicKey& programId) {
    if (seeds.size() > MAX_SEEDS) {
        throw std::invalid_argument("Too many PDA seeds");
    }

    SHA256 hasher;
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LEN) {
            throw std::invalid_argument("PDA seed longer than 32 bytes");
        }
        hasher.Write(seed.data(), seed.size());
    }
    hasher.Write(programId.data(), PublicKey::SIZE);
    hasher.Write("ProgramDerivedAddress");

    Hash256 hash = hasher.Finalize();
    if (IsOnCurve(hash)) {
        return std::nullopt;
    }
    return PublicKey(hash);
}

ProgramAddress FindProgramAddress(const std::vector<Bytes>& seeds,
                                  const PublicKey& programId) {
    std::vector<Bytes> withBump = seeds;
    withBump.push_back(Bytes{0});

    for (int bump = 255; bump >= 0; --bump) {
        withBump.back()[0] = static_cast<Byte>(bump);
        auto address = CreateProgramAddress(withBump, programId);
        if (address) {
            return ProgramAddress{*address, static_cast<uint8_t>(bump)};
        }
    }
    throw std::runtime_error("Unable to find a viable program address bump seed");
}

} // namespace solana
} // namespace spectre
