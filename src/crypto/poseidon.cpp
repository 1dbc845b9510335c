// SPECTRE - Poseidon Hash Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// ZK-friendly algebraic hash function over the BN254 scalar field

#include "spectre/crypto/poseidon.h"

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace spectre {

// ============================================================================
// Standard Configurations
// ============================================================================

namespace PoseidonParams {

namespace {
// Partial rounds for t = 2 .. 17
constexpr size_t PARTIAL_ROUNDS[] = {
    56, 57, 56, 60, 60, 63, 64, 63, 60, 66, 60, 65, 70, 60, 64, 68
};
} // namespace

PoseidonConfig ForInputs(size_t numInputs) {
    if (numInputs < MIN_INPUTS || numInputs > MAX_INPUTS) {
        throw std::invalid_argument("Poseidon: unsupported input count " +
                                    std::to_string(numInputs));
    }
    return PoseidonConfig{numInputs + 1, FULL_ROUNDS, PARTIAL_ROUNDS[numInputs - 1]};
}

} // namespace PoseidonParams

// ============================================================================
// Round Constants Generation
// ============================================================================

namespace {

/// Grain LFSR in self-shrinking mode, as used by the Poseidon parameter
/// generation script.
class GrainLfsr {
public:
    GrainLfsr(size_t width, size_t fullRounds, size_t partialRounds) {
        size_t pos = 0;
        auto push = [&](uint64_t value, int nbits) {
            for (int i = nbits - 1; i >= 0; --i) {
                bits_[pos++] = static_cast<uint8_t>((value >> i) & 1);
            }
        };
        push(1, 2);     // prime field
        push(0, 4);     // x^alpha S-box
        push(254, 12);  // field size in bits
        push(width, 12);
        push(fullRounds, 10);
        push(partialRounds, 10);
        while (pos < bits_.size()) {
            bits_[pos++] = 1;
        }

        for (int i = 0; i < 160; ++i) {
            Step();
        }
    }

    /// Next n filtered bits as an integer (MSB first)
    Uint256 RandomBits(size_t n) {
        Uint256 v;
        for (size_t i = 0; i < n; ++i) {
            v = v << 1;
            v.limbs[0] |= NextBit();
        }
        return v;
    }

private:
    std::array<uint8_t, 80> bits_{};
    size_t head_{0};

    uint8_t At(size_t i) const { return bits_[(head_ + i) % bits_.size()]; }

    uint8_t Step() {
        uint8_t nb = At(62) ^ At(51) ^ At(38) ^ At(23) ^ At(13) ^ At(0);
        bits_[head_] = nb;
        head_ = (head_ + 1) % bits_.size();
        return nb;
    }

    uint8_t NextBit() {
        while (true) {
            uint8_t b1 = Step();
            uint8_t b2 = Step();
            if (b1 == 1) return b2;
        }
    }
};

/// 2^254 < 2p, so one conditional subtraction reduces a 254-bit draw
Uint256 ReduceOnce(const Uint256& v) {
    if (v < FieldElement::MODULUS) return v;
    bool borrow;
    return Uint256::Sub(v, FieldElement::MODULUS, borrow);
}

bool AllDistinct(const std::vector<Uint256>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        for (size_t j = i + 1; j < values.size(); ++j) {
            if (values[i] == values[j]) return false;
        }
    }
    return true;
}

} // anonymous namespace

PoseidonConstants GeneratePoseidonConstants(const PoseidonConfig& config) {
    PoseidonConstants out;
    out.config = config;

    const size_t t = config.width;
    GrainLfsr grain(t, config.fullRounds, config.partialRounds);

    // Round constants: rejection-sample until below p
    const size_t needed = config.totalRounds() * t;
    out.roundConstants.reserve(needed);
    while (out.roundConstants.size() < needed) {
        Uint256 v = grain.RandomBits(254);
        while (v >= FieldElement::MODULUS) {
            v = grain.RandomBits(254);
        }
        out.roundConstants.push_back(v);
    }

    // Cauchy MDS matrix from 2t distinct draws
    std::vector<Uint256> seeds(2 * t);
    do {
        for (auto& s : seeds) {
            s = ReduceOnce(grain.RandomBits(254));
        }
    } while (!AllDistinct(seeds));

    out.cauchyX.assign(seeds.begin(), seeds.begin() + static_cast<std::ptrdiff_t>(t));
    out.cauchyY.assign(seeds.begin() + static_cast<std::ptrdiff_t>(t), seeds.end());

    out.mds.assign(t, std::vector<Uint256>(t));
    for (size_t i = 0; i < t; ++i) {
        for (size_t j = 0; j < t; ++j) {
            FieldElement sum = FieldElement(out.cauchyX[i]) + FieldElement(out.cauchyY[j]);
            out.mds[i][j] = sum.Inverse().ToUint256();
        }
    }

    return out;
}

const PoseidonConstants& GetPoseidonConstants(size_t width) {
    static std::mutex mutex;
    static std::map<size_t, std::unique_ptr<PoseidonConstants>> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(width);
    if (it == cache.end()) {
        if (width < 2) {
            throw std::invalid_argument("Poseidon: state width must be at least 2");
        }
        auto config = PoseidonParams::ForInputs(width - 1);
        auto constants = std::make_unique<PoseidonConstants>(GeneratePoseidonConstants(config));
        it = cache.emplace(width, std::move(constants)).first;
    }
    return *it->second;
}

// ============================================================================
// Poseidon Implementation
// ============================================================================

Poseidon::Poseidon(size_t numInputs)
    : config_(PoseidonParams::ForInputs(numInputs)) {
    const PoseidonConstants& constants = GetPoseidonConstants(config_.width);

    roundConstants_.reserve(constants.roundConstants.size());
    for (const auto& c : constants.roundConstants) {
        roundConstants_.emplace_back(c);
    }

    mdsMatrix_.resize(config_.width);
    for (size_t i = 0; i < config_.width; ++i) {
        mdsMatrix_[i].reserve(config_.width);
        for (const auto& m : constants.mds[i]) {
            mdsMatrix_[i].emplace_back(m);
        }
    }
}

void Poseidon::AddRoundConstants(std::vector<FieldElement>& state, size_t roundIdx) const {
    const size_t base = roundIdx * config_.width;
    for (size_t i = 0; i < config_.width; ++i) {
        state[i] += roundConstants_[base + i];
    }
}

void Poseidon::MixColumns(std::vector<FieldElement>& state) const {
    std::vector<FieldElement> newState(config_.width, FieldElement::Zero());

    for (size_t i = 0; i < config_.width; ++i) {
        for (size_t j = 0; j < config_.width; ++j) {
            newState[i] += mdsMatrix_[i][j] * state[j];
        }
    }

    state = std::move(newState);
}

void Poseidon::FullRound(std::vector<FieldElement>& state, size_t roundIdx) const {
    AddRoundConstants(state, roundIdx);

    // S-box on every element
    for (size_t i = 0; i < config_.width; ++i) {
        state[i] = state[i].PoseidonSbox();
    }

    MixColumns(state);
}

void Poseidon::PartialRound(std::vector<FieldElement>& state, size_t roundIdx) const {
    AddRoundConstants(state, roundIdx);

    // S-box on the first element only
    state[0] = state[0].PoseidonSbox();

    MixColumns(state);
}

void Poseidon::Permute(std::vector<FieldElement>& state) const {
    size_t roundIdx = 0;
    size_t halfFullRounds = config_.fullRounds / 2;

    for (size_t i = 0; i < halfFullRounds; ++i) {
        FullRound(state, roundIdx++);
    }

    for (size_t i = 0; i < config_.partialRounds; ++i) {
        PartialRound(state, roundIdx++);
    }

    for (size_t i = 0; i < halfFullRounds; ++i) {
        FullRound(state, roundIdx++);
    }
}

FieldElement Poseidon::Hash(const std::vector<FieldElement>& inputs) const {
    if (inputs.size() != numInputs()) {
        throw std::invalid_argument("Poseidon: expected " + std::to_string(numInputs()) +
                                    " inputs, got " + std::to_string(inputs.size()));
    }

    std::vector<FieldElement> state;
    state.reserve(config_.width);
    state.push_back(FieldElement::Zero());
    state.insert(state.end(), inputs.begin(), inputs.end());

    Permute(state);
    return state[0];
}

FieldElement Poseidon::HashMany(const std::vector<FieldElement>& inputs) {
    static std::mutex mutex;
    static std::map<size_t, std::unique_ptr<Poseidon>> instances;

    const Poseidon* hasher = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = instances.find(inputs.size());
        if (it == instances.end()) {
            it = instances.emplace(inputs.size(), std::make_unique<Poseidon>(inputs.size())).first;
        }
        hasher = it->second.get();
    }
    return hasher->Hash(inputs);
}

} // namespace spectre
