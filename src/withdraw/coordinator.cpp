// SPECTRE - Withdrawal Coordinator Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/withdraw/coordinator.h"
#include "spectre/crypto/sha256.h"
#include "spectre/prover/errors.h"
#include "spectre/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace spectre {

using solana::PublicKey;

// ============================================================================
// Vault Accounts
// ============================================================================

namespace {

Bytes KeySeed(const PublicKey& key) {
    return Bytes(key.GetBytes().begin(), key.GetBytes().end());
}

} // namespace

solana::ProgramAddress DeriveVaultAddress(const PublicKey& authority, const PublicKey& programId) {
    return solana::FindProgramAddress({solana::SeedFromString(VAULT_SEED), KeySeed(authority)},
                                      programId);
}

solana::ProgramAddress DeriveUserDepositAddress(const PublicKey& vault,
                                                const FieldElement& commitment,
                                                const PublicKey& programId) {
    auto be = commitment.ToBigEndian();
    return solana::FindProgramAddress(
        {solana::SeedFromString(DEPOSIT_SEED), KeySeed(vault), Bytes(be.begin(), be.end())},
        programId);
}

solana::ProgramAddress DeriveWithdrawalRequestAddress(const PublicKey& vault,
                                                      const PublicKey& requester,
                                                      const PublicKey& userDeposit,
                                                      const PublicKey& programId) {
    return solana::FindProgramAddress({solana::SeedFromString(WITHDRAWAL_SEED), KeySeed(vault),
                                       KeySeed(requester), KeySeed(userDeposit)},
                                      programId);
}

// ============================================================================
// Status Names
// ============================================================================

const char* WithdrawalStatusToString(WithdrawalStatus status) {
    switch (status) {
        case WithdrawalStatus::Pending:   return "pending";
        case WithdrawalStatus::Approved:  return "approved";
        case WithdrawalStatus::Rejected:  return "rejected";
        case WithdrawalStatus::Completed: return "completed";
        case WithdrawalStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<WithdrawalStatus> ParseWithdrawalStatus(const std::string& name) {
    for (auto status : {WithdrawalStatus::Pending, WithdrawalStatus::Approved,
                        WithdrawalStatus::Rejected, WithdrawalStatus::Completed,
                        WithdrawalStatus::Cancelled}) {
        if (name == WithdrawalStatusToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

const char* WithdrawalStateToString(WithdrawalState state) {
    switch (state) {
        case WithdrawalState::Requested: return "requested";
        case WithdrawalState::Pending:   return "pending";
        case WithdrawalState::Completed: return "completed";
        case WithdrawalState::Expired:   return "expired";
    }
    return "unknown";
}

// ============================================================================
// Account Codec
// ============================================================================

namespace {

class AccountReader {
public:
    explicit AccountReader(const Bytes& data) : data_(data) {}

    const Byte* Take(size_t n) {
        if (pos_ + n > data_.size()) {
            throw std::invalid_argument("WithdrawalRequest account truncated");
        }
        const Byte* p = data_.data() + pos_;
        pos_ += n;
        return p;
    }

    PublicKey Key() {
        std::array<Byte, 32> bytes;
        const Byte* p = Take(32);
        std::copy(p, p + 32, bytes.begin());
        return PublicKey(bytes);
    }

    uint64_t U64() {
        const Byte* p = Take(8);
        uint64_t v = 0;
        for (int i = 7; i >= 0; --i) {
            v = (v << 8) | p[i];
        }
        return v;
    }

    uint8_t U8() { return *Take(1); }

private:
    const Bytes& data_;
    size_t pos_{0};
};

void PutKey(Bytes& out, const PublicKey& key) {
    out.insert(out.end(), key.GetBytes().begin(), key.GetBytes().end());
}

void PutU64(Bytes& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<Byte>(v >> (8 * i)));
    }
}

} // namespace

std::array<Byte, 8> WithdrawalRequestDiscriminator() {
    static const std::string preimage = "account:WithdrawalRequest";
    Hash256 digest = SHA256Hash(reinterpret_cast<const Byte*>(preimage.data()), preimage.size());
    std::array<Byte, 8> disc;
    std::copy(digest.begin(), digest.begin() + 8, disc.begin());
    return disc;
}

PendingWithdrawal DecodeWithdrawalRequest(const PublicKey& pda, const Bytes& data) {
    AccountReader reader(data);

    auto disc = WithdrawalRequestDiscriminator();
    const Byte* head = reader.Take(disc.size());
    if (!std::equal(disc.begin(), disc.end(), head)) {
        throw std::invalid_argument("Account is not a WithdrawalRequest");
    }

    PendingWithdrawal w;
    w.pda = pda;
    w.requester = reader.Key();
    w.userDeposit = reader.Key();
    w.vault = reader.Key();
    w.amount = reader.U64();
    w.recipient = reader.Key();

    uint8_t status = reader.U8();
    if (status > static_cast<uint8_t>(WithdrawalStatus::Cancelled)) {
        throw std::invalid_argument("Unknown withdrawal status " + std::to_string(status));
    }
    w.status = static_cast<WithdrawalStatus>(status);
    w.riskScore = reader.U8();
    w.requestedAt = static_cast<Timestamp>(reader.U64());
    w.updatedAt = static_cast<Timestamp>(reader.U64());
    reader.U64();  // compliance_verified_slot
    reader.U8();   // bump
    return w;
}

Bytes EncodeWithdrawalRequest(const PendingWithdrawal& w) {
    Bytes out;
    out.reserve(WITHDRAWAL_REQUEST_ACCOUNT_SIZE);
    auto disc = WithdrawalRequestDiscriminator();
    out.insert(out.end(), disc.begin(), disc.end());
    PutKey(out, w.requester);
    PutKey(out, w.userDeposit);
    PutKey(out, w.vault);
    PutU64(out, w.amount);
    PutKey(out, w.recipient);
    out.push_back(static_cast<Byte>(w.status));
    out.push_back(w.riskScore);
    PutU64(out, static_cast<uint64_t>(w.requestedAt));
    PutU64(out, static_cast<uint64_t>(w.updatedAt));
    PutU64(out, 0);
    out.push_back(0);
    return out;
}

// ============================================================================
// WithdrawalCoordinator
// ============================================================================

WithdrawalCoordinator::WithdrawalCoordinator(std::shared_ptr<IWithdrawalChain> chain,
                                             const PublicKey& programId,
                                             const PublicKey& vault,
                                             int64_t expirySeconds)
    : chain_(std::move(chain)),
      programId_(programId),
      vault_(vault),
      expirySeconds_(expirySeconds) {}

void WithdrawalCoordinator::TrackRequested(const PendingWithdrawal& withdrawal, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(withdrawal.pda);
    if (it != tracked_.end()) {
        return;
    }
    TrackedWithdrawal entry;
    entry.withdrawal = withdrawal;
    entry.state = WithdrawalState::Requested;
    entry.trackedSince = now;
    tracked_.emplace(withdrawal.pda, std::move(entry));
    LOG_INFO(util::LogCategory::WITHDRAW) << "Tracking withdrawal " << withdrawal.pda.ToBase58();
}

std::vector<PendingWithdrawal> WithdrawalCoordinator::FetchPending(Timestamp now) {
    std::vector<PendingWithdrawal> observed;
    try {
        observed = chain_->FetchPendingWithdrawals();
    } catch (const ProverError&) {
        throw;
    } catch (const std::exception& e) {
        throw SubmissionError(std::string("Failed to fetch pending withdrawals: ") + e.what());
    }

    std::vector<PendingWithdrawal> waiting;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& w : observed) {
        if (w.vault != vault_) {
            continue;
        }

        auto done = finished_.find(w.pda);
        if (done != finished_.end()) {
            if (w.status == WithdrawalStatus::Completed) {
                done->second.state = WithdrawalState::Completed;
            }
            continue;
        }

        bool waitingOnChain = w.status == WithdrawalStatus::Pending ||
                              w.status == WithdrawalStatus::Approved;
        auto it = tracked_.find(w.pda);
        if (!waitingOnChain) {
            if (it != tracked_.end()) {
                tracked_.erase(it);
            }
            FinishLocked(w.pda,
                         w.status == WithdrawalStatus::Completed ? WithdrawalState::Completed
                                                                 : WithdrawalState::Expired,
                         now);
            continue;
        }

        if (it == tracked_.end()) {
            if (w.requestedAt > 0 && now - w.requestedAt > expirySeconds_) {
                continue;
            }
            TrackedWithdrawal entry;
            entry.trackedSince = now;
            it = tracked_.emplace(w.pda, std::move(entry)).first;
        }
        it->second.withdrawal = w;
        it->second.state = WithdrawalState::Pending;
        waiting.push_back(w);
    }

    LOG_DEBUG(util::LogCategory::WITHDRAW) << "Fetched " << observed.size()
                                           << " withdrawal requests, " << waiting.size()
                                           << " waiting";
    return waiting;
}

std::string WithdrawalCoordinator::Complete(const PublicKey& pda, Timestamp now) {
    PendingWithdrawal withdrawal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tracked_.find(pda);
        if (it == tracked_.end()) {
            auto done = finished_.find(pda);
            if (done == finished_.end()) {
                throw SubmissionError("Unknown withdrawal request " + pda.ToBase58());
            }
            if (done->second.state == WithdrawalState::Completed) {
                throw SubmissionError("Withdrawal " + pda.ToBase58() + " is already completed");
            }
            throw SubmissionError("Withdrawal " + pda.ToBase58() + " has expired");
        }
        withdrawal = it->second.withdrawal;
    }

    std::string signature;
    try {
        signature = chain_->CompleteWithdrawal(withdrawal);
    } catch (const ProverError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::WITHDRAW) << "Completing " << pda.ToBase58()
                                               << " failed: " << e.what();
        throw SubmissionError(std::string("Claim failed: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tracked_.erase(pda);
        FinishLocked(pda, WithdrawalState::Completed, now);
    }
    LOG_INFO(util::LogCategory::WITHDRAW) << "Withdrawal " << pda.ToBase58()
                                          << " completed: " << signature;
    return signature;
}

std::vector<NoteMatch> WithdrawalCoordinator::MatchNotes(const std::vector<StoredNote>& notes) const {
    // Derive each note's deposit account once
    std::vector<std::pair<PublicKey, const StoredNote*>> deposits;
    deposits.reserve(notes.size());
    for (const auto& note : notes) {
        auto commitment = FieldElement::TryFromDecimal(note.commitment);
        if (!commitment) {
            LOG_WARN(util::LogCategory::WITHDRAW) << "Skipping note " << note.id
                                                  << " with malformed commitment";
            continue;
        }
        deposits.emplace_back(DeriveUserDepositAddress(vault_, *commitment, programId_).address,
                              &note);
    }

    std::vector<NoteMatch> matches;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : tracked_) {
        const TrackedWithdrawal& entry = item.second;
        for (const auto& deposit : deposits) {
            if (deposit.first == entry.withdrawal.userDeposit) {
                matches.push_back(NoteMatch{entry.withdrawal, *deposit.second});
                break;
            }
        }
    }
    return matches;
}

std::vector<PublicKey> WithdrawalCoordinator::ExpireStale(Timestamp now) {
    std::vector<PublicKey> expired;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tracked_.begin(); it != tracked_.end();) {
        const TrackedWithdrawal& entry = it->second;
        Timestamp since = entry.withdrawal.requestedAt > 0 ? entry.withdrawal.requestedAt
                                                           : entry.trackedSince;
        if (now - since <= expirySeconds_) {
            ++it;
            continue;
        }
        LOG_INFO(util::LogCategory::WITHDRAW) << "Withdrawal " << it->first.ToBase58()
                                              << " expired";
        expired.push_back(it->first);
        FinishLocked(it->first, WithdrawalState::Expired, now);
        it = tracked_.erase(it);
    }

    for (auto it = finished_.begin(); it != finished_.end();) {
        if (now - it->second.finishedAt > expirySeconds_) {
            it = finished_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

void WithdrawalCoordinator::FinishLocked(const PublicKey& pda, WithdrawalState state,
                                         Timestamp now) {
    finished_[pda] = Finished{state, now};
}

std::optional<WithdrawalState> WithdrawalCoordinator::GetState(const PublicKey& pda) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(pda);
    if (it != tracked_.end()) {
        return it->second.state;
    }
    auto done = finished_.find(pda);
    if (done != finished_.end()) {
        return done->second.state;
    }
    return std::nullopt;
}

std::vector<TrackedWithdrawal> WithdrawalCoordinator::GetTracked() const {
    std::vector<TrackedWithdrawal> result;
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(tracked_.size());
    for (const auto& item : tracked_) {
        result.push_back(item.second);
    }
    return result;
}

size_t WithdrawalCoordinator::GetFinishedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_.size();
}

} // namespace spectre
