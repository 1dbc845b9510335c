// SPECTRE - Poseidon Hasher Back-ends
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// One hashing capability with two interchangeable implementations that must
// agree bit-for-bit: the Montgomery-limb native hasher and an independent
// OpenSSL BIGNUM reference hasher.
//
// Inputs are NOT range-checked: callers reduce values mod p before hashing,
// matching the circuit, which does not range-check these wires either.

#ifndef SPECTRE_CRYPTO_HASHER_H
#define SPECTRE_CRYPTO_HASHER_H

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "spectre/crypto/field.h"

namespace spectre {

// ============================================================================
// Hasher Interface
// ============================================================================

class IPoseidonHasher {
public:
    virtual ~IPoseidonHasher() = default;

    /// Back-end name for logs and diagnostics
    virtual const char* Name() const = 0;

    /// Poseidon over 1..16 field elements
    virtual FieldElement Hash(const std::vector<FieldElement>& inputs) const = 0;

    /// Decimal (or 0x hex) text in, decimal text out
    std::string HashStrings(const std::vector<std::string>& inputs) const;
};

/// Montgomery 4x64-limb implementation
class NativePoseidonHasher : public IPoseidonHasher {
public:
    const char* Name() const override { return "native"; }
    FieldElement Hash(const std::vector<FieldElement>& inputs) const override;
};

/// OpenSSL BIGNUM implementation. Shares only the Grain-generated round
/// constants and Cauchy seeds with the native hasher; all field arithmetic,
/// including the MDS inversion, is done by OpenSSL.
class BignumPoseidonHasher : public IPoseidonHasher {
public:
    BignumPoseidonHasher();
    ~BignumPoseidonHasher() override;

    const char* Name() const override { return "bignum"; }
    FieldElement Hash(const std::vector<FieldElement>& inputs) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Back-end Selection
// ============================================================================

enum class HasherBackend {
    Native,
    Bignum
};

/// "native" or "bignum"
std::optional<HasherBackend> ParseHasherBackend(const std::string& name);

std::unique_ptr<IPoseidonHasher> CreateHasher(HasherBackend backend);

/**
 * Check a hasher against known circomlib outputs and precompute the widths
 * used by the shielded pool (1, 3, 4 and 5 inputs).
 * Throws std::runtime_error on mismatch.
 */
void SelfTestHasher(const IPoseidonHasher& hasher);

// ============================================================================
// Shared Hasher Handle
// ============================================================================

/**
 * Process-wide hasher owned by the top-level context and injected into
 * every component that hashes.
 *
 * Initialization runs at most once at a time: concurrent callers wait for
 * the same in-flight attempt. A failed attempt is forgotten so the next
 * call retries.
 */
class HasherHandle {
public:
    using HasherPtr = std::shared_ptr<const IPoseidonHasher>;
    using Factory = std::function<std::unique_ptr<IPoseidonHasher>()>;

    explicit HasherHandle(Factory factory);

    /// Handle for a built-in back-end
    static std::shared_ptr<HasherHandle> ForBackend(HasherBackend backend);

    /// Handle around an already constructed hasher (no self-test)
    static std::shared_ptr<HasherHandle> FromInstance(HasherPtr hasher);

    /// Start initialization if nothing is ready or in flight
    std::shared_future<HasherPtr> InitAsync();

    /// Wait for initialization. Throws HashInitError if it failed.
    HasherPtr Get();

    /// True once a hasher is available without waiting
    bool IsReady() const;

private:
    Factory factory_;
    mutable std::mutex mutex_;
    HasherPtr ready_;
    std::shared_future<HasherPtr> inflight_;
    uint64_t generation_{0};

    std::shared_future<HasherPtr> StartLocked();
};

} // namespace spectre

#endif // SPECTRE_CRYPTO_HASHER_H
