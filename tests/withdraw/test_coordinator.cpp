// SPECTRE - Withdrawal Coordinator Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>
#include "spectre/prover/errors.h"
#include "spectre/withdraw/coordinator.h"

#include <memory>
#include <stdexcept>
#include <vector>

namespace spectre {
namespace test {

using solana::PublicKey;

namespace {

const char* VAULT_PROGRAM = "B2at4oGQFPAbuH2wMMpBsFrTvJi71GUvR7jyxny7HaGf";
const char* AUTHORITY = "SeedPubey1111111111111111111111111111111111";
const char* COMMITMENT =
    "11960252494251578350989014241814938263250319970041787739588078387687827752202";

PublicKey KeyOf(Byte fill) {
    std::array<Byte, 32> bytes;
    bytes.fill(fill);
    return PublicKey(bytes);
}

class FakeChain : public IWithdrawalChain {
public:
    std::vector<PendingWithdrawal> FetchPendingWithdrawals() override {
        if (failFetch) throw std::runtime_error("rpc timeout");
        return onChain;
    }

    std::string CompleteWithdrawal(const PendingWithdrawal& withdrawal) override {
        if (failComplete) throw std::runtime_error("custom program error: 0x1771");
        completed.push_back(withdrawal.pda);
        return "sig" + std::to_string(completed.size());
    }

    std::vector<PendingWithdrawal> onChain;
    std::vector<PublicKey> completed;
    bool failFetch{false};
    bool failComplete{false};
};

} // namespace

// ============================================================================
// Vault Accounts
// ============================================================================

TEST(VaultAddressTest, VaultAndDepositGolden) {
    PublicKey program = PublicKey::Parse(VAULT_PROGRAM);
    auto vault = DeriveVaultAddress(PublicKey::Parse(AUTHORITY), program);
    EXPECT_EQ(vault.address.ToBase58(), "2GSKMctzuJY1kdtTvq54SL6u1UBoJRhfBUQ416SbmBmG");
    EXPECT_EQ(vault.bump, 252);

    auto deposit = DeriveUserDepositAddress(vault.address, FieldElement::FromDecimal(COMMITMENT),
                                            program);
    EXPECT_EQ(deposit.address.ToBase58(), "3WUVSrzJPNWTGpQYizcmEFNNdWjLspHvbj17TMbLoJEp");
    EXPECT_EQ(deposit.bump, 255);
}

TEST(VaultAddressTest, WithdrawalAddressDependsOnRequester) {
    PublicKey program = PublicKey::Parse(VAULT_PROGRAM);
    auto a = DeriveWithdrawalRequestAddress(KeyOf(1), KeyOf(2), KeyOf(3), program);
    auto b = DeriveWithdrawalRequestAddress(KeyOf(1), KeyOf(4), KeyOf(3), program);
    EXPECT_NE(a.address, b.address);
}

// ============================================================================
// Account Codec
// ============================================================================

TEST(WithdrawalAccountTest, Discriminator) {
    auto disc = WithdrawalRequestDiscriminator();
    const std::array<Byte, 8> expected = {0xf2, 0x58, 0x93, 0xad, 0xb6, 0x3e, 0xe5, 0xc1};
    EXPECT_EQ(disc, expected);
}

TEST(WithdrawalAccountTest, EncodeDecode) {
    PendingWithdrawal w;
    w.pda = KeyOf(9);
    w.requester = KeyOf(1);
    w.userDeposit = KeyOf(2);
    w.vault = KeyOf(3);
    w.recipient = KeyOf(4);
    w.amount = 1500000000;
    w.status = WithdrawalStatus::Approved;
    w.riskScore = 12;
    w.requestedAt = 1706702400;
    w.updatedAt = 1706702460;

    Bytes data = EncodeWithdrawalRequest(w);
    ASSERT_EQ(data.size(), WITHDRAWAL_REQUEST_ACCOUNT_SIZE);
    EXPECT_EQ(WITHDRAWAL_REQUEST_ACCOUNT_SIZE, 171u);
    // amount is little-endian right after the three keys
    EXPECT_EQ(data[8 + 96], 0x00);
    EXPECT_EQ(data[8 + 96 + 1], 0x2f);

    PendingWithdrawal back = DecodeWithdrawalRequest(w.pda, data);
    EXPECT_EQ(back.pda, w.pda);
    EXPECT_EQ(back.requester, w.requester);
    EXPECT_EQ(back.userDeposit, w.userDeposit);
    EXPECT_EQ(back.vault, w.vault);
    EXPECT_EQ(back.recipient, w.recipient);
    EXPECT_EQ(back.amount, w.amount);
    EXPECT_EQ(back.status, WithdrawalStatus::Approved);
    EXPECT_EQ(back.riskScore, 12);
    EXPECT_EQ(back.requestedAt, w.requestedAt);
    EXPECT_EQ(back.updatedAt, w.updatedAt);
    EXPECT_TRUE(back.CanComplete());
}

TEST(WithdrawalAccountTest, RejectsForeignAccounts) {
    PendingWithdrawal w;
    Bytes data = EncodeWithdrawalRequest(w);

    Bytes wrongDisc = data;
    wrongDisc[0] ^= 0xff;
    EXPECT_THROW(DecodeWithdrawalRequest(w.pda, wrongDisc), std::invalid_argument);

    Bytes truncated(data.begin(), data.end() - 1);
    EXPECT_THROW(DecodeWithdrawalRequest(w.pda, truncated), std::invalid_argument);

    Bytes badStatus = data;
    badStatus[8 + 96 + 8 + 32] = 5;
    EXPECT_THROW(DecodeWithdrawalRequest(w.pda, badStatus), std::invalid_argument);
}

TEST(WithdrawalAccountTest, StatusNames) {
    EXPECT_STREQ(WithdrawalStatusToString(WithdrawalStatus::Cancelled), "cancelled");
    EXPECT_TRUE(ParseWithdrawalStatus("rejected") == WithdrawalStatus::Rejected);
    EXPECT_FALSE(ParseWithdrawalStatus("Rejected").has_value());
    EXPECT_STREQ(WithdrawalStateToString(WithdrawalState::Expired), "expired");
}

// ============================================================================
// Coordinator
// ============================================================================

class CoordinatorTest : public ::testing::Test {
protected:
    static constexpr int64_t EXPIRY = 3600;

    PublicKey program_ = PublicKey::Parse(VAULT_PROGRAM);
    PublicKey vault_ = DeriveVaultAddress(PublicKey::Parse(AUTHORITY), program_).address;
    std::shared_ptr<FakeChain> chain_ = std::make_shared<FakeChain>();
    WithdrawalCoordinator coordinator_{chain_, program_, vault_, EXPIRY};

    PendingWithdrawal Request(Byte id, WithdrawalStatus status, Timestamp requestedAt = 1000) {
        PendingWithdrawal w;
        w.pda = KeyOf(id);
        w.vault = vault_;
        w.requester = KeyOf(0x50);
        w.userDeposit = KeyOf(static_cast<Byte>(id + 0x80));
        w.amount = 1000000;
        w.status = status;
        w.requestedAt = requestedAt;
        return w;
    }
};

TEST_F(CoordinatorTest, FetchPendingTracksWaitingRequests) {
    chain_->onChain = {Request(1, WithdrawalStatus::Pending),
                       Request(2, WithdrawalStatus::Approved),
                       Request(3, WithdrawalStatus::Completed),
                       Request(4, WithdrawalStatus::Rejected)};

    auto waiting = coordinator_.FetchPending(1100);
    ASSERT_EQ(waiting.size(), 2u);
    EXPECT_TRUE(coordinator_.GetState(KeyOf(1)) == WithdrawalState::Pending);
    EXPECT_TRUE(coordinator_.GetState(KeyOf(2)) == WithdrawalState::Pending);
    EXPECT_TRUE(coordinator_.GetState(KeyOf(3)) == WithdrawalState::Completed);
    EXPECT_TRUE(coordinator_.GetState(KeyOf(4)) == WithdrawalState::Expired);
    EXPECT_EQ(coordinator_.GetTracked().size(), 2u);
    EXPECT_EQ(coordinator_.GetFinishedCount(), 2u);
}

TEST_F(CoordinatorTest, IgnoresOtherVaults) {
    PendingWithdrawal foreign = Request(1, WithdrawalStatus::Pending);
    foreign.vault = KeyOf(0x77);
    chain_->onChain = {foreign};

    EXPECT_TRUE(coordinator_.FetchPending(1100).empty());
    EXPECT_FALSE(coordinator_.GetState(KeyOf(1)).has_value());
}

TEST_F(CoordinatorTest, FetchFailureIsSubmissionError) {
    chain_->failFetch = true;
    EXPECT_THROW(coordinator_.FetchPending(1100), SubmissionError);
}

TEST_F(CoordinatorTest, RequestedBecomesPendingThenCompleted) {
    PendingWithdrawal w = Request(1, WithdrawalStatus::Pending);
    coordinator_.TrackRequested(w, 1000);
    EXPECT_TRUE(coordinator_.GetState(w.pda) == WithdrawalState::Requested);

    w.status = WithdrawalStatus::Approved;
    chain_->onChain = {w};
    coordinator_.FetchPending(1100);
    EXPECT_TRUE(coordinator_.GetState(w.pda) == WithdrawalState::Pending);

    EXPECT_EQ(coordinator_.Complete(w.pda), "sig1");
    EXPECT_TRUE(coordinator_.GetState(w.pda) == WithdrawalState::Completed);
    EXPECT_THROW(coordinator_.Complete(w.pda), SubmissionError);

    // A stale chain view cannot reopen a completed request
    chain_->onChain = {w};
    EXPECT_TRUE(coordinator_.FetchPending(1200).empty());
    EXPECT_TRUE(coordinator_.GetState(w.pda) == WithdrawalState::Completed);
}

TEST_F(CoordinatorTest, CompleteRejectsUnknownAndFailedClaims) {
    EXPECT_THROW(coordinator_.Complete(KeyOf(42)), SubmissionError);

    PendingWithdrawal w = Request(1, WithdrawalStatus::Approved);
    coordinator_.TrackRequested(w, 1000);
    chain_->failComplete = true;
    try {
        coordinator_.Complete(w.pda);
        FAIL() << "Expected SubmissionError";
    } catch (const SubmissionError& e) {
        EXPECT_EQ(e.GetStage(), ErrorStage::Submission);
        EXPECT_NE(std::string(e.what()).find("0x1771"), std::string::npos);
    }
    EXPECT_TRUE(coordinator_.GetState(w.pda) == WithdrawalState::Requested);
}

TEST_F(CoordinatorTest, ExpireStale) {
    coordinator_.TrackRequested(Request(1, WithdrawalStatus::Pending, 1000), 1000);
    coordinator_.TrackRequested(Request(2, WithdrawalStatus::Pending, 4000), 4000);
    coordinator_.TrackRequested(Request(3, WithdrawalStatus::Pending, 0), 4500);

    auto expired = coordinator_.ExpireStale(1000 + EXPIRY + 1);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], KeyOf(1));
    EXPECT_TRUE(coordinator_.GetState(KeyOf(2)) == WithdrawalState::Pending ||
                coordinator_.GetState(KeyOf(2)) == WithdrawalState::Requested);
    EXPECT_THROW(coordinator_.Complete(KeyOf(1)), SubmissionError);

    // Without an on-chain timestamp the tracking time counts
    expired = coordinator_.ExpireStale(4500 + EXPIRY + 1);
    EXPECT_EQ(expired.size(), 2u);
}

TEST_F(CoordinatorTest, FinishedRequestsArePruned) {
    PendingWithdrawal first = Request(1, WithdrawalStatus::Approved, 1000);
    coordinator_.TrackRequested(first, 1000);
    EXPECT_EQ(coordinator_.Complete(first.pda, 1100), "sig1");
    EXPECT_TRUE(coordinator_.GetTracked().empty());
    EXPECT_TRUE(coordinator_.GetState(first.pda) == WithdrawalState::Completed);

    coordinator_.TrackRequested(Request(2, WithdrawalStatus::Pending, 1000), 1000);
    auto expired = coordinator_.ExpireStale(1000 + EXPIRY + 1);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], KeyOf(2));
    EXPECT_TRUE(coordinator_.GetTracked().empty());
    EXPECT_EQ(coordinator_.GetFinishedCount(), 2u);

    // A lagging chain view does not bring either request back
    chain_->onChain = {Request(1, WithdrawalStatus::Approved, 1000),
                       Request(2, WithdrawalStatus::Pending, 1000)};
    EXPECT_TRUE(coordinator_.FetchPending(4700).empty());
    EXPECT_TRUE(coordinator_.GetTracked().empty());

    // One expiry period after finishing, both are forgotten
    EXPECT_TRUE(coordinator_.ExpireStale(1000 + 2 * EXPIRY + 2).empty());
    EXPECT_EQ(coordinator_.GetFinishedCount(), 0u);
    EXPECT_FALSE(coordinator_.GetState(KeyOf(1)).has_value());
    EXPECT_FALSE(coordinator_.GetState(KeyOf(2)).has_value());

    // and the old records are too stale to be tracked again
    EXPECT_TRUE(coordinator_.FetchPending(1000 + 2 * EXPIRY + 3).empty());
    EXPECT_TRUE(coordinator_.GetTracked().empty());
}

TEST_F(CoordinatorTest, MatchNotesByDepositAccount) {
    auto deposit = DeriveUserDepositAddress(vault_, FieldElement::FromDecimal(COMMITMENT), program_);

    PendingWithdrawal w = Request(1, WithdrawalStatus::Pending);
    w.userDeposit = deposit.address;
    coordinator_.TrackRequested(w, 1000);
    coordinator_.TrackRequested(Request(2, WithdrawalStatus::Pending), 1000);

    StoredNote match;
    match.id = "mine";
    match.commitment = COMMITMENT;
    StoredNote other;
    other.id = "other";
    other.commitment = "42";
    StoredNote broken;
    broken.id = "broken";
    broken.commitment = "not-a-number";

    auto matches = coordinator_.MatchNotes({broken, other, match});
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].note.id, "mine");
    EXPECT_EQ(matches[0].withdrawal.pda, KeyOf(1));

    coordinator_.Complete(KeyOf(1));
    EXPECT_TRUE(coordinator_.MatchNotes({match}).empty());
}

} // namespace test
} // namespace spectre
