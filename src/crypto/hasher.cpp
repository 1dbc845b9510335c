// SPECTRE - Poseidon Hasher Back-ends
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/crypto/hasher.h"
#include "spectre/crypto/poseidon.h"
#include "spectre/prover/errors.h"
#include "spectre/util/logging.h"

#include <openssl/bn.h>

#include <array>
#include <map>
#include <stdexcept>

namespace spectre {

// ============================================================================
// IPoseidonHasher
// ============================================================================

std::string IPoseidonHasher::HashStrings(const std::vector<std::string>& inputs) const {
    std::vector<FieldElement> elements;
    elements.reserve(inputs.size());
    for (const auto& in : inputs) {
        elements.push_back(FieldElement::FromDecimal(in));
    }
    return Hash(elements).ToDecimal();
}

// ============================================================================
// Native Back-end
// ============================================================================

FieldElement NativePoseidonHasher::Hash(const std::vector<FieldElement>& inputs) const {
    return Poseidon::HashMany(inputs);
}

// ============================================================================
// BIGNUM Back-end
// ============================================================================

namespace {

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

void CheckBn(int ok, const char* what) {
    if (ok != 1) {
        throw std::runtime_error(std::string("BIGNUM ") + what + " failed");
    }
}

BnPtr NewBn() {
    BnPtr bn(BN_new());
    if (!bn) throw std::runtime_error("BN_new failed");
    return bn;
}

BnPtr BnFromUint256(const Uint256& v) {
    auto be = v.ToBigEndian();
    BnPtr bn(BN_bin2bn(be.data(), static_cast<int>(be.size()), nullptr));
    if (!bn) throw std::runtime_error("BN_bin2bn failed");
    return bn;
}

FieldElement BnToField(const BIGNUM* bn) {
    std::array<Byte, 32> be{};
    if (BN_bn2binpad(bn, be.data(), static_cast<int>(be.size())) != 32) {
        throw std::runtime_error("BN_bn2binpad failed");
    }
    return FieldElement::FromBigEndian(be.data(), be.size());
}

struct BnWidthConstants {
    size_t width{0};
    size_t fullRounds{0};
    size_t partialRounds{0};
    std::vector<BnPtr> roundConstants;
    std::vector<std::vector<BnPtr>> mds;
};

} // anonymous namespace

struct BignumPoseidonHasher::Impl {
    BnPtr modulus;
    mutable std::mutex mutex;
    mutable std::map<size_t, std::unique_ptr<BnWidthConstants>> widths;

    Impl() : modulus(BnFromUint256(FieldElement::MODULUS)) {}

    const BnWidthConstants& ForWidth(size_t width, BN_CTX* ctx) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = widths.find(width);
        if (it != widths.end()) {
            return *it->second;
        }

        const PoseidonConstants& src = GetPoseidonConstants(width);
        auto out = std::make_unique<BnWidthConstants>();
        out->width = width;
        out->fullRounds = src.config.fullRounds;
        out->partialRounds = src.config.partialRounds;

        for (const auto& c : src.roundConstants) {
            out->roundConstants.push_back(BnFromUint256(c));
        }

        // M[i][j] = (x_i + y_j)^-1 mod p
        out->mds.resize(width);
        for (size_t i = 0; i < width; ++i) {
            BnPtr x = BnFromUint256(src.cauchyX[i]);
            for (size_t j = 0; j < width; ++j) {
                BnPtr y = BnFromUint256(src.cauchyY[j]);
                BnPtr sum = NewBn();
                CheckBn(BN_mod_add(sum.get(), x.get(), y.get(), modulus.get(), ctx), "mod_add");
                BnPtr inv(BN_mod_inverse(nullptr, sum.get(), modulus.get(), ctx));
                if (!inv) throw std::runtime_error("BN_mod_inverse failed");
                out->mds[i].push_back(std::move(inv));
            }
        }

        it = widths.emplace(width, std::move(out)).first;
        return *it->second;
    }
};

BignumPoseidonHasher::BignumPoseidonHasher() : impl_(std::make_unique<Impl>()) {}

BignumPoseidonHasher::~BignumPoseidonHasher() = default;

FieldElement BignumPoseidonHasher::Hash(const std::vector<FieldElement>& inputs) const {
    auto config = PoseidonParams::ForInputs(inputs.size());
    const size_t t = config.width;

    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) throw std::runtime_error("BN_CTX_new failed");

    const BnWidthConstants& k = impl_->ForWidth(t, ctx.get());
    const BIGNUM* p = impl_->modulus.get();

    std::vector<BnPtr> state;
    state.reserve(t);
    state.push_back(NewBn());
    BN_zero(state[0].get());
    for (const auto& in : inputs) {
        state.push_back(BnFromUint256(in.ToUint256()));
    }

    BnPtr tmp = NewBn();
    auto sbox = [&](BIGNUM* x) {
        CheckBn(BN_mod_sqr(tmp.get(), x, p, ctx.get()), "mod_sqr");          // x^2
        CheckBn(BN_mod_sqr(tmp.get(), tmp.get(), p, ctx.get()), "mod_sqr");  // x^4
        CheckBn(BN_mod_mul(x, tmp.get(), x, p, ctx.get()), "mod_mul");       // x^5
    };

    const size_t half = k.fullRounds / 2;
    const size_t rounds = k.fullRounds + k.partialRounds;
    std::vector<BnPtr> next;
    for (size_t i = 0; i < t; ++i) {
        next.push_back(NewBn());
    }

    for (size_t r = 0; r < rounds; ++r) {
        for (size_t i = 0; i < t; ++i) {
            CheckBn(BN_mod_add(state[i].get(), state[i].get(),
                               k.roundConstants[r * t + i].get(), p, ctx.get()), "mod_add");
        }

        if (r < half || r >= half + k.partialRounds) {
            for (size_t i = 0; i < t; ++i) {
                sbox(state[i].get());
            }
        } else {
            sbox(state[0].get());
        }

        for (size_t i = 0; i < t; ++i) {
            BN_zero(next[i].get());
            for (size_t j = 0; j < t; ++j) {
                CheckBn(BN_mod_mul(tmp.get(), k.mds[i][j].get(), state[j].get(), p, ctx.get()),
                        "mod_mul");
                CheckBn(BN_mod_add(next[i].get(), next[i].get(), tmp.get(), p, ctx.get()),
                        "mod_add");
            }
        }
        std::swap(state, next);
    }

    return BnToField(state[0].get());
}

// ============================================================================
// Back-end Selection
// ============================================================================

std::optional<HasherBackend> ParseHasherBackend(const std::string& name) {
    if (name == "native") return HasherBackend::Native;
    if (name == "bignum") return HasherBackend::Bignum;
    return std::nullopt;
}

std::unique_ptr<IPoseidonHasher> CreateHasher(HasherBackend backend) {
    switch (backend) {
        case HasherBackend::Native:
            return std::make_unique<NativePoseidonHasher>();
        case HasherBackend::Bignum:
            return std::make_unique<BignumPoseidonHasher>();
    }
    throw std::invalid_argument("Unknown hasher back-end");
}

void SelfTestHasher(const IPoseidonHasher& hasher) {
    struct KnownVector {
        std::vector<uint64_t> inputs;
        const char* output;
    };
    static const KnownVector KNOWN[] = {
        {{1}, "18586133768512220936620570745912940619677854269274689475585506675881198879027"},
        {{1, 2}, "7853200120776062878684798364095072458815029376092732009249414926327459813530"},
        {{1, 2, 3}, "6542985608222806190361240322586112750744169038454362455181422643027100751666"},
        {{1, 2, 3, 4}, "18821383157269793795438455681495246036402687001665670618754263018637548127333"},
        {{1, 2, 3, 4, 5}, "6183221330272524995739186171720101788151706631170188140075976616310159254464"},
    };

    for (const auto& kv : KNOWN) {
        std::vector<FieldElement> in;
        for (uint64_t v : kv.inputs) {
            in.emplace_back(v);
        }
        std::string got = hasher.Hash(in).ToDecimal();
        if (got != kv.output) {
            throw std::runtime_error(std::string("Poseidon self-test failed for back-end '") +
                                     hasher.Name() + "' with " +
                                     std::to_string(kv.inputs.size()) + " inputs");
        }
    }
}

// ============================================================================
// HasherHandle
// ============================================================================

HasherHandle::HasherHandle(Factory factory) : factory_(std::move(factory)) {}

std::shared_ptr<HasherHandle> HasherHandle::ForBackend(HasherBackend backend) {
    return std::make_shared<HasherHandle>([backend]() { return CreateHasher(backend); });
}

std::shared_ptr<HasherHandle> HasherHandle::FromInstance(HasherPtr hasher) {
    auto handle = std::make_shared<HasherHandle>(nullptr);
    handle->ready_ = std::move(hasher);
    return handle;
}

std::shared_future<HasherHandle::HasherPtr> HasherHandle::StartLocked() {
    if (ready_) {
        std::promise<HasherPtr> done;
        done.set_value(ready_);
        return done.get_future().share();
    }
    if (!inflight_.valid()) {
        ++generation_;
        Factory factory = factory_;
        // inflight_ joins the task on destruction, so it never outlives this handle
        inflight_ = std::async(std::launch::async, [this, factory]() -> HasherPtr {
            if (!factory) {
                throw std::runtime_error("no hasher factory configured");
            }
            util::ScopedLogTimer timer(util::LogCategory::HASHER, "hasher initialization");
            std::unique_ptr<IPoseidonHasher> hasher = factory();
            if (!hasher) {
                throw std::runtime_error("hasher factory returned null");
            }
            SelfTestHasher(*hasher);
            LOG_INFO(util::LogCategory::HASHER) << "Poseidon hasher ready (" << hasher->Name() << ")";
            HasherPtr result(std::move(hasher));
            std::lock_guard<std::mutex> lock(mutex_);
            if (!ready_) {
                ready_ = result;
            }
            return ready_;
        }).share();
    }
    return inflight_;
}

std::shared_future<HasherHandle::HasherPtr> HasherHandle::InitAsync() {
    std::lock_guard<std::mutex> lock(mutex_);
    return StartLocked();
}

HasherHandle::HasherPtr HasherHandle::Get() {
    std::shared_future<HasherPtr> pending;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ready_) {
            return ready_;
        }
        pending = StartLocked();
        generation = generation_;
    }

    try {
        HasherPtr hasher = pending.get();
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ready_) {
            ready_ = hasher;
            inflight_ = std::shared_future<HasherPtr>();
        }
        return ready_;
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation_ == generation) {
                inflight_ = std::shared_future<HasherPtr>();
            }
        }
        LOG_ERROR(util::LogCategory::HASHER) << "Hasher initialization failed: " << e.what();
        throw HashInitError(std::string("Hasher initialization failed: ") + e.what());
    }
}

bool HasherHandle::IsReady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_ != nullptr;
}

} // namespace spectre
