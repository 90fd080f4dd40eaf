// ZKVOTE - Eligibility Gateway Tests
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "ballot_test_util.h"

#include <zkvote/ballot/eligibility.h>

#include <thread>
#include <vector>

using namespace zkvote;
using namespace zkvote::ballot;
using namespace zkvote::test;

class EligibilityTest : public BallotEngineTest {
protected:
    void SetUp() override {
        BallotEngineTest::SetUp();
        CreateProposal(1);
        voter_ = FundedVoter(1);
    }

    AccountId voter_;
};

TEST_F(EligibilityTest, AdmitsEligibleVote) {
    auto request = MakeCast(voter_, 1, THRESHOLD, 2, MakeSecret(1));
    clock_->Advance(5);

    auto result = engine_->CastVote(request);
    ASSERT_TRUE(result.ok()) << result.failure().ToString();

    const VoteRecord& record = *result;
    EXPECT_EQ(record.proposalId, 1u);
    EXPECT_EQ(record.nullifier, request.nullifier);
    EXPECT_EQ(record.commitment, request.commitment);
    EXPECT_EQ(record.timestamp, START + 5);
    EXPECT_FALSE(record.isRevealed);
    EXPECT_FALSE(record.revealedChoice.has_value());

    auto proposal = engine_->GetProposal(1);
    ASSERT_TRUE(proposal.has_value());
    EXPECT_EQ(proposal->voteCount, 1u);

    auto stored = engine_->GetVoteRecord(1, request.nullifier);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, record);
    EXPECT_EQ(verifier_->calls.load(), 1);
}

TEST_F(EligibilityTest, UnknownProposal) {
    auto result = engine_->CastVote(MakeCast(voter_, 99, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::NotFound);
}

TEST_F(EligibilityTest, WindowIsHalfOpen) {
    clock_->Set(START - 1);
    auto early = engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(early.ok());
    EXPECT_EQ(early.error(), BallotError::VotingNotActive);

    clock_->Set(START + PERIOD - 1);
    EXPECT_TRUE(engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(2))).ok());

    clock_->Set(START + PERIOD);
    auto late = engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(3)));
    ASSERT_FALSE(late.ok());
    EXPECT_EQ(late.error(), BallotError::VotingNotActive);
}

TEST_F(EligibilityTest, RejectsMalformedProof) {
    auto request = MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(1));
    request.proof.resize(PROOF_SIZE - 1);

    auto result = engine_->CastVote(request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::InvalidProofFormat);
    EXPECT_EQ(verifier_->calls.load(), 0);
}

TEST_F(EligibilityTest, RejectsMalformedWitness) {
    auto request = MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(1));
    request.witness[3] = 5;  // header claims five public elements

    auto result = engine_->CastVote(request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::InvalidProofFormat);
}

TEST_F(EligibilityTest, PublicInputsMustMatchProposalAndRequest) {
    VoterSecret secret = MakeSecret(1);

    auto wrongThreshold = MakeCast(voter_, 1, THRESHOLD - 1, 0, secret);
    EXPECT_EQ(engine_->CastVote(wrongThreshold).error(), BallotError::PublicInputMismatch);

    auto wrongProposal = MakeCast(voter_, 1, THRESHOLD, 0, secret);
    wrongProposal.witness = EncodePublicWitness(
        MakePublicInputs(THRESHOLD, 2, wrongProposal.commitment, wrongProposal.nullifier));
    EXPECT_EQ(engine_->CastVote(wrongProposal).error(), BallotError::PublicInputMismatch);

    auto wrongCommitment = MakeCast(voter_, 1, THRESHOLD, 0, secret);
    wrongCommitment.commitment = ComputeVoteCommitment(1, secret, 1);
    EXPECT_EQ(engine_->CastVote(wrongCommitment).error(), BallotError::PublicInputMismatch);

    auto wrongNullifier = MakeCast(voter_, 1, THRESHOLD, 0, secret);
    wrongNullifier.nullifier = DeriveNullifier(MakeSecret(2), 1);
    EXPECT_EQ(engine_->CastVote(wrongNullifier).error(), BallotError::PublicInputMismatch);

    EXPECT_EQ(verifier_->calls.load(), 0);
}

TEST_F(EligibilityTest, BalanceGate) {
    AccountId poor = FundedVoter(2, THRESHOLD - 1);
    auto result = engine_->CastVote(MakeCast(poor, 1, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::InsufficientBalance);

    AccountId stranger = MakeAccount(0x77);
    result = engine_->CastVote(MakeCast(stranger, 1, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::InsufficientBalance);

    balances_->SetUnavailable(true);
    result = engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::BalanceUnavailable);
    EXPECT_EQ(GetErrorKind(result.error()), ErrorKind::External);
    EXPECT_EQ(verifier_->calls.load(), 0);
}

TEST_F(EligibilityTest, BalanceIsCheckedAgainstProposalCredential) {
    AccountId other = MakeAccount(0x66);
    balances_->SetBalance(other, MakeCredential(2), THRESHOLD * 10);

    auto result = engine_->CastVote(MakeCast(other, 1, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::InsufficientBalance);
}

TEST_F(EligibilityTest, VerifierRejection) {
    verifier_->accept = false;
    auto result = engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::VerificationFailed);
    EXPECT_EQ(engine_->GetProposal(1)->voteCount, 0u);
}

TEST_F(EligibilityTest, VerifierErrorIsVerificationFailure) {
    verifier_->fail = true;
    auto result = engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::VerificationFailed);
    EXPECT_NE(result.message().find("crashed"), std::string::npos);
}

TEST_F(EligibilityTest, DuplicateNullifierRejected) {
    VoterSecret secret = MakeSecret(1);
    ASSERT_TRUE(engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, secret)).ok());

    // Same secret, different choice: same nullifier
    AccountId other = FundedVoter(2);
    auto again = engine_->CastVote(MakeCast(other, 1, THRESHOLD, 1, secret));
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error(), BallotError::DuplicateNullifier);

    auto proposal = engine_->GetProposal(1);
    EXPECT_EQ(proposal->voteCount, 1u);
    auto record = engine_->GetVoteRecord(1, DeriveNullifier(secret, 1));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->voter, voter_);
    EXPECT_EQ(record->commitment, ComputeVoteCommitment(0, secret, 1));
}

TEST_F(EligibilityTest, SameSecretMayVoteOnAnotherProposal) {
    CreateProposal(2);
    VoterSecret secret = MakeSecret(1);
    EXPECT_TRUE(engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, secret)).ok());
    EXPECT_TRUE(engine_->CastVote(MakeCast(voter_, 2, THRESHOLD, 0, secret)).ok());
}

TEST_F(EligibilityTest, FinalizedProposalRejectsVotes) {
    EndVoting();
    ASSERT_TRUE(engine_->FinalizeProposal(creator_, 1).ok());
    clock_->Set(START);

    auto result = engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::VotingNotActive);
}

TEST_F(EligibilityTest, FailedCommitLeavesNoTrace) {
    auto request = MakeCast(voter_, 1, THRESHOLD, 0, MakeSecret(1));
    memory_->FailWrites(db::Status::IOError("disk full"));

    auto result = engine_->CastVote(request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::StorageFailure);

    memory_->FailWrites(std::nullopt);
    EXPECT_EQ(engine_->GetProposal(1)->voteCount, 0u);
    EXPECT_FALSE(engine_->GetVoteRecord(1, request.nullifier).has_value());

    // The nullifier was never consumed
    EXPECT_TRUE(engine_->CastVote(request).ok());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(EligibilityTest, ConcurrentDuplicatesAdmitExactlyOne) {
    constexpr int kThreads = 8;
    VoterSecret secret = MakeSecret(3);
    std::atomic<int> admitted{0};
    std::atomic<int> duplicates{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            auto request = MakeCast(voter_, 1, THRESHOLD, static_cast<uint8_t>(i % 3), secret);
            auto result = engine_->CastVote(request);
            if (result.ok()) {
                ++admitted;
            } else if (result.error() == BallotError::DuplicateNullifier) {
                ++duplicates;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), 1);
    EXPECT_EQ(duplicates.load(), kThreads - 1);
    EXPECT_EQ(engine_->GetProposal(1)->voteCount, 1u);
}

TEST_F(EligibilityTest, ConcurrentDistinctVotesAllCounted) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 10;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                VoterSecret secret(MakeHash(static_cast<uint8_t>(0x10 + t), static_cast<uint8_t>(i)));
                auto result = engine_->CastVote(MakeCast(voter_, 1, THRESHOLD, 0, secret));
                EXPECT_TRUE(result.ok());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(engine_->GetProposal(1)->voteCount, static_cast<uint64_t>(kThreads * kPerThread));
    auto votes = engine_->ListVotes(1);
    ASSERT_TRUE(votes.ok());
    EXPECT_EQ(votes->size(), static_cast<size_t>(kThreads * kPerThread));
}

// ============================================================================
// Static checks
// ============================================================================

TEST(EligibilityChecksTest, CheckFormatDecodesInputs) {
    VoterSecret secret = MakeSecret(4);
    auto request = MakeCast(MakeAccount(1), 12, 500, 1, secret);

    PublicInputs inputs;
    EXPECT_FALSE(EligibilityGateway::CheckFormat(request.proof, request.witness, inputs).has_value());
    EXPECT_EQ(inputs.commitment, request.commitment);
    EXPECT_EQ(inputs.nullifier, request.nullifier);
    EXPECT_EQ(DecodeU64Element(inputs.minThreshold), std::optional<uint64_t>(500));
    EXPECT_EQ(DecodeU64Element(inputs.proposalId), std::optional<uint64_t>(12));
}
