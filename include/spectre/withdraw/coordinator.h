// SPECTRE - Withdrawal Coordinator
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Tracks vault withdrawal requests observed on chain, matches them to
// locally stored notes and completes them.
//
// Local lifecycle per request:
//   Requested -> Pending (observed on chain) -> Completed | Expired

#ifndef SPECTRE_WITHDRAW_COORDINATOR_H
#define SPECTRE_WITHDRAW_COORDINATOR_H

#include "spectre/core/types.h"
#include "spectre/crypto/field.h"
#include "spectre/shield/note.h"
#include "spectre/solana/address.h"

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spectre {

// ============================================================================
// Vault Accounts
// ============================================================================

constexpr const char* VAULT_SEED = "spectre_vault";
constexpr const char* DEPOSIT_SEED = "user_deposit";
constexpr const char* WITHDRAWAL_SEED = "withdrawal";

/// ["spectre_vault", authority]
solana::ProgramAddress DeriveVaultAddress(const solana::PublicKey& authority,
                                          const solana::PublicKey& programId);

/// ["user_deposit", vault, commitment as 32 bytes big-endian]
solana::ProgramAddress DeriveUserDepositAddress(const solana::PublicKey& vault,
                                                const FieldElement& commitment,
                                                const solana::PublicKey& programId);

/// ["withdrawal", vault, requester, userDeposit]
solana::ProgramAddress DeriveWithdrawalRequestAddress(const solana::PublicKey& vault,
                                                      const solana::PublicKey& requester,
                                                      const solana::PublicKey& userDeposit,
                                                      const solana::PublicKey& programId);

// ============================================================================
// Withdrawal Records
// ============================================================================

/// Status stored in the on-chain request (declaration order is the
/// on-chain discriminant)
enum class WithdrawalStatus : uint8_t {
    Pending = 0,
    Approved = 1,
    Rejected = 2,
    Completed = 3,
    Cancelled = 4
};

const char* WithdrawalStatusToString(WithdrawalStatus status);
std::optional<WithdrawalStatus> ParseWithdrawalStatus(const std::string& name);

/// Locally tracked lifecycle
enum class WithdrawalState {
    Requested,
    Pending,
    Completed,
    Expired
};

const char* WithdrawalStateToString(WithdrawalState state);

struct PendingWithdrawal {
    solana::PublicKey pda;
    solana::PublicKey userDeposit;
    solana::PublicKey requester;
    solana::PublicKey recipient;
    solana::PublicKey vault;
    uint64_t amount{0};
    Timestamp requestedAt{0};
    Timestamp updatedAt{0};
    uint8_t riskScore{0};
    WithdrawalStatus status{WithdrawalStatus::Pending};

    /// Only approved requests can be completed
    bool CanComplete() const { return status == WithdrawalStatus::Approved; }
};

/// 8-byte account discriminator: sha256("account:WithdrawalRequest")[0..8]
std::array<Byte, 8> WithdrawalRequestDiscriminator();

/// Discriminator plus the serialized fields
constexpr size_t WITHDRAWAL_REQUEST_ACCOUNT_SIZE = 8 + 32 * 3 + 8 + 32 + 1 + 1 + 8 + 8 + 8 + 1;

/**
 * Decode a WithdrawalRequest account.
 * @throws std::invalid_argument on a short buffer, wrong discriminator
 *         or unknown status
 */
PendingWithdrawal DecodeWithdrawalRequest(const solana::PublicKey& pda, const Bytes& data);

/// Inverse of DecodeWithdrawalRequest
Bytes EncodeWithdrawalRequest(const PendingWithdrawal& withdrawal);

// ============================================================================
// Chain Access
// ============================================================================

class IWithdrawalChain {
public:
    virtual ~IWithdrawalChain() = default;

    /// Every withdrawal request of the vault that is not yet finished
    virtual std::vector<PendingWithdrawal> FetchPendingWithdrawals() = 0;

    /// Submit the completion transaction and return its signature
    virtual std::string CompleteWithdrawal(const PendingWithdrawal& withdrawal) = 0;
};

// ============================================================================
// Coordinator
// ============================================================================

struct TrackedWithdrawal {
    PendingWithdrawal withdrawal;
    WithdrawalState state{WithdrawalState::Requested};
    /// When this process first learned about the request
    Timestamp trackedSince{0};
};

struct NoteMatch {
    PendingWithdrawal withdrawal;
    StoredNote note;
};

class WithdrawalCoordinator {
public:
    /**
     * @param vault            Vault account (see DeriveVaultAddress)
     * @param expirySeconds    Age after which an unfinished request expires
     */
    WithdrawalCoordinator(std::shared_ptr<IWithdrawalChain> chain,
                          const solana::PublicKey& programId,
                          const solana::PublicKey& vault,
                          int64_t expirySeconds);

    /// Record a request this process just submitted
    void TrackRequested(const PendingWithdrawal& withdrawal, Timestamp now);

    /**
     * Refresh from chain. Requests still waiting (pending or approved)
     * are returned and tracked as Pending; requests the chain reports as
     * completed become Completed, rejected or cancelled ones Expired.
     * Finished requests are never reopened by a later chain view, and an
     * untracked request already past the expiry is not picked up.
     * @throws SubmissionError if the chain query fails
     */
    std::vector<PendingWithdrawal> FetchPending(Timestamp now = GetTime());

    /**
     * Complete a tracked withdrawal and return the transaction signature.
     * @throws SubmissionError if the request is unknown, already finished
     *         or the chain rejects the transaction
     */
    std::string Complete(const solana::PublicKey& pda, Timestamp now = GetTime());

    /**
     * Pair each unfinished withdrawal with the stored note whose commitment
     * derives its user-deposit account. Notes with malformed commitments
     * are skipped.
     */
    std::vector<NoteMatch> MatchNotes(const std::vector<StoredNote>& notes) const;

    /**
     * Move requests older than the expiry to Expired and return their PDAs.
     * Finished requests are remembered for one more expiry period, then
     * forgotten.
     */
    std::vector<solana::PublicKey> ExpireStale(Timestamp now);

    /// State of a live or recently finished request
    std::optional<WithdrawalState> GetState(const solana::PublicKey& pda) const;

    /// Requests still in flight (Requested or Pending)
    std::vector<TrackedWithdrawal> GetTracked() const;

    size_t GetFinishedCount() const;

    const solana::PublicKey& GetVault() const { return vault_; }

private:
    std::shared_ptr<IWithdrawalChain> chain_;
    solana::PublicKey programId_;
    solana::PublicKey vault_;
    int64_t expirySeconds_;

    struct Finished {
        WithdrawalState state;
        Timestamp finishedAt;
    };

    mutable std::mutex mutex_;
    std::map<solana::PublicKey, TrackedWithdrawal> tracked_;
    std::map<solana::PublicKey, Finished> finished_;

    void FinishLocked(const solana::PublicKey& pda, WithdrawalState state, Timestamp now);
};

} // namespace spectre

#endif // SPECTRE_WITHDRAW_COORDINATOR_H
