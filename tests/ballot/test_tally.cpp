// ZKVOTE - Commit-Reveal Tally and Finalization Tests
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "ballot_test_util.h"

#include <zkvote/ballot/finalization.h>
#include <zkvote/ballot/store.h>
#include <zkvote/ballot/tally.h>

#include <numeric>

using namespace zkvote;
using namespace zkvote::ballot;
using namespace zkvote::test;

class TallyTest : public BallotEngineTest {
protected:
    void SetUp() override {
        BallotEngineTest::SetUp();
        CreateProposal(1);
        voter_ = FundedVoter(1);
        revealer_ = MakeAccount(0x99);
    }

    void Cast(uint8_t choice, const VoterSecret& secret) {
        auto result = engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, choice, secret));
        ASSERT_TRUE(result.ok()) << result.failure().ToString();
    }

    AccountId voter_;
    AccountId revealer_;
};

TEST_F(TallyTest, RevealCountsChoice) {
    VoterSecret secret = MakeSecret(1);
    Cast(2, secret);
    EndVoting();

    auto result = engine_->RevealVote(MakeReveal(revealer_, 1, 2, secret));
    ASSERT_TRUE(result.ok()) << result.failure().ToString();
    EXPECT_EQ(result->tallies, (std::vector<uint64_t>{0, 0, 1}));

    auto record = engine_->GetVoteRecord(1, DeriveNullifier(secret, 1));
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->isRevealed);
    ASSERT_TRUE(record->revealedChoice.has_value());
    EXPECT_EQ(*record->revealedChoice, 2);
}

TEST_F(TallyTest, RevealedRecordHoldsNoVoterIdentity) {
    VoterSecret secret = MakeSecret(1);
    Cast(1, secret);
    EndVoting();
    ASSERT_TRUE(engine_->RevealVote(MakeReveal(revealer_, 1, 1, secret)).ok());

    Nullifier nullifier = DeriveNullifier(secret, 1);
    std::string raw;
    ASSERT_TRUE(memory_->Get(db::ReadOptions(), MakeVoteKey(1, nullifier), &raw).ok());

    // proposal id, nullifier, commitment, timestamp, revealed flag, choice
    EXPECT_EQ(raw.size(), 8u + 32 + 32 + 8 + 1 + 2);
    std::string voterBytes(voter_.begin(), voter_.end());
    std::string revealerBytes(revealer_.begin(), revealer_.end());
    EXPECT_EQ(raw.find(voterBytes), std::string::npos);
    EXPECT_EQ(raw.find(revealerBytes), std::string::npos);

    auto record = engine_->GetVoteRecord(1, nullifier);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->revealedChoice, std::optional<uint8_t>(1));
}

TEST_F(TallyTest, RevealBeforeEndRejected) {
    VoterSecret secret = MakeSecret(1);
    Cast(0, secret);
    clock_->Set(START + PERIOD - 1);

    auto result = engine_->RevealVote(MakeReveal(revealer_, 1, 0, secret));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::VotingNotEnded);
}

TEST_F(TallyTest, RevealUnknownProposalOrVote) {
    EndVoting();
    auto missingProposal = engine_->RevealVote(MakeReveal(revealer_, 42, 0, MakeSecret(1)));
    ASSERT_FALSE(missingProposal.ok());
    EXPECT_EQ(missingProposal.error(), BallotError::NotFound);

    auto missingVote = engine_->RevealVote(MakeReveal(revealer_, 1, 0, MakeSecret(1)));
    ASSERT_FALSE(missingVote.ok());
    EXPECT_EQ(missingVote.error(), BallotError::NotFound);
}

TEST_F(TallyTest, RevealTwiceRejected) {
    VoterSecret secret = MakeSecret(1);
    Cast(1, secret);
    EndVoting();

    ASSERT_TRUE(engine_->RevealVote(MakeReveal(revealer_, 1, 1, secret)).ok());
    auto again = engine_->RevealVote(MakeReveal(revealer_, 1, 1, secret));
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error(), BallotError::AlreadyRevealed);
    EXPECT_EQ(engine_->GetResults(1)->tallies, (std::vector<uint64_t>{0, 1, 0}));
}

TEST_F(TallyTest, ChoiceOutOfRange) {
    VoterSecret secret = MakeSecret(1);
    Cast(3, secret);  // commits to an option that does not exist
    EndVoting();

    auto result = engine_->RevealVote(MakeReveal(revealer_, 1, 3, secret));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::InvalidChoice);
}

TEST_F(TallyTest, WrongOpeningRejected) {
    VoterSecret secret = MakeSecret(1);
    Cast(0, secret);
    EndVoting();

    auto wrongChoice = engine_->RevealVote(MakeReveal(revealer_, 1, 1, secret));
    ASSERT_FALSE(wrongChoice.ok());
    EXPECT_EQ(wrongChoice.error(), BallotError::CommitmentMismatch);

    auto wrongSecret = MakeReveal(revealer_, 1, 0, MakeSecret(2));
    wrongSecret.nullifier = DeriveNullifier(secret, 1);
    auto result = engine_->RevealVote(wrongSecret);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::CommitmentMismatch);

    auto record = engine_->GetVoteRecord(1, DeriveNullifier(secret, 1));
    EXPECT_FALSE(record->isRevealed);
    EXPECT_EQ(engine_->GetResults(1)->TotalRevealed(), 0u);
}

TEST_F(TallyTest, TalliesNeverExceedVoteCount) {
    const uint8_t choices[] = {0, 1, 1, 2, 1, 0};
    for (uint8_t i = 0; i < sizeof(choices); ++i) {
        Cast(choices[i], MakeSecret(static_cast<uint8_t>(10 + i)));
    }
    EndVoting();

    // Reveal all but the last two
    for (uint8_t i = 0; i + 2 < sizeof(choices); ++i) {
        ASSERT_TRUE(engine_->RevealVote(
            MakeReveal(revealer_, 1, choices[i], MakeSecret(static_cast<uint8_t>(10 + i)))).ok());
    }

    auto results = engine_->GetResults(1);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(results->tallies, (std::vector<uint64_t>{1, 2, 1}));
    EXPECT_EQ(results->TotalRevealed(), 4u);
    EXPECT_LE(results->TotalRevealed(), engine_->GetProposal(1)->voteCount);
    EXPECT_EQ(engine_->GetProposal(1)->voteCount, 6u);
}

TEST_F(TallyTest, FailedCommitLeavesRecordSealed) {
    VoterSecret secret = MakeSecret(1);
    Cast(1, secret);
    EndVoting();

    memory_->FailWrites(db::Status::IOError("disk full"));
    auto result = engine_->RevealVote(MakeReveal(revealer_, 1, 1, secret));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::StorageFailure);
    memory_->FailWrites(std::nullopt);

    EXPECT_FALSE(engine_->GetVoteRecord(1, DeriveNullifier(secret, 1))->isRevealed);
    EXPECT_EQ(engine_->GetResults(1)->TotalRevealed(), 0u);
    EXPECT_TRUE(engine_->RevealVote(MakeReveal(revealer_, 1, 1, secret)).ok());
}

// ============================================================================
// Finalization
// ============================================================================

class FinalizationTest : public TallyTest {};

TEST_F(FinalizationTest, CreatorFinalizesAfterEnd) {
    VoterSecret secret = MakeSecret(1);
    Cast(0, secret);
    EndVoting();
    ASSERT_TRUE(engine_->RevealVote(MakeReveal(revealer_, 1, 0, secret)).ok());

    auto result = engine_->FinalizeProposal(creator_, 1);
    ASSERT_TRUE(result.ok()) << result.failure().ToString();
    EXPECT_TRUE(result->proposal.isFinalized);
    EXPECT_TRUE(result->results.isFinalized);
    EXPECT_EQ(result->results.tallies, (std::vector<uint64_t>{1, 0, 0}));

    EXPECT_TRUE(engine_->GetProposal(1)->isFinalized);
    EXPECT_TRUE(engine_->GetResults(1)->isFinalized);
    EXPECT_EQ(engine_->GetPhase(1), std::optional<ProposalPhase>(ProposalPhase::Finalized));
}

TEST_F(FinalizationTest, OnlyCreator) {
    EndVoting();
    auto result = engine_->FinalizeProposal(voter_, 1);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::Unauthorized);
    EXPECT_FALSE(engine_->GetProposal(1)->isFinalized);
}

TEST_F(FinalizationTest, UnauthorizedBeforeNotEnded) {
    auto result = engine_->FinalizeProposal(voter_, 1);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::Unauthorized);

    result = engine_->FinalizeProposal(creator_, 1);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::VotingNotEnded);
}

TEST_F(FinalizationTest, UnknownProposal) {
    auto result = engine_->FinalizeProposal(creator_, 77);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::NotFound);
}

TEST_F(FinalizationTest, FinalizeOnce) {
    EndVoting();
    ASSERT_TRUE(engine_->FinalizeProposal(creator_, 1).ok());

    auto again = engine_->FinalizeProposal(creator_, 1);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error(), BallotError::ProposalFinalized);
}

TEST_F(FinalizationTest, ResultsFrozenAfterFinalize) {
    VoterSecret first = MakeSecret(1);
    VoterSecret late = MakeSecret(2);
    Cast(0, first);
    Cast(2, late);
    EndVoting();
    ASSERT_TRUE(engine_->RevealVote(MakeReveal(revealer_, 1, 0, first)).ok());
    ASSERT_TRUE(engine_->FinalizeProposal(creator_, 1).ok());
    auto frozen = engine_->GetResults(1);

    auto result = engine_->RevealVote(MakeReveal(revealer_, 1, 2, late));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::ProposalFinalized);
    EXPECT_EQ(engine_->GetResults(1), frozen);
    EXPECT_FALSE(engine_->GetVoteRecord(1, DeriveNullifier(late, 1))->isRevealed);
}

TEST_F(FinalizationTest, FailedCommitKeepsFlagsInStep) {
    EndVoting();
    memory_->FailWrites(db::Status::IOError("disk full"));
    auto result = engine_->FinalizeProposal(creator_, 1);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::StorageFailure);
    memory_->FailWrites(std::nullopt);

    EXPECT_FALSE(engine_->GetProposal(1)->isFinalized);
    EXPECT_FALSE(engine_->GetResults(1)->isFinalized);
}
