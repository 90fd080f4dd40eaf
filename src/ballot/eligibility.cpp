// ZKVOTE - Eligibility Verifier Gateway Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/eligibility.h"
#include "zkvote/util/logging.h"

#include <exception>

namespace zkvote {
namespace ballot {

namespace {

MaybeFailure CheckVotingOpen(const Proposal& proposal, Timestamp now) {
    if (proposal.isFinalized) {
        return Fail(BallotError::VotingNotActive,
                    "proposal " + std::to_string(proposal.id) + " is finalized");
    }
    if (!proposal.IsVotingActive(now)) {
        return Fail(BallotError::VotingNotActive,
                    "voting window is [" + std::to_string(proposal.startTime) + ", " +
                    std::to_string(proposal.endTime) + "), now " + std::to_string(now));
    }
    return std::nullopt;
}

} // namespace

EligibilityGateway::EligibilityGateway(BallotStore& store, const Clock& clock,
                                       Verifier& verifier, BalanceSource& balances)
    : store_(store), clock_(clock), verifier_(verifier), balances_(balances) {}

MaybeFailure EligibilityGateway::CheckFormat(const Proof& proof, const PublicWitness& witness,
                                             PublicInputs& inputs) {
    if (!IsValidProofSize(proof)) {
        return Fail(BallotError::InvalidProofFormat,
                    "proof is " + std::to_string(proof.size()) + " bytes, expected " +
                    std::to_string(PROOF_SIZE));
    }
    auto decoded = DecodePublicWitness(witness);
    if (!decoded) {
        return Fail(BallotError::InvalidProofFormat,
                    "public witness is not " + std::to_string(NUM_PUBLIC_INPUTS) +
                    " elements in gnark layout (" + std::to_string(witness.size()) + " bytes)");
    }
    inputs = *decoded;
    return std::nullopt;
}

MaybeFailure EligibilityGateway::CheckPublicInputs(const PublicInputs& inputs,
                                                   const Proposal& proposal,
                                                   const CastRequest& request) {
    if (!PublicInputsMatch(inputs, proposal.minThreshold, proposal.id, request.commitment,
                           request.nullifier)) {
        return Fail(BallotError::PublicInputMismatch,
                    "witness does not match proposal " + std::to_string(proposal.id) +
                    " and the submitted commitment and nullifier");
    }
    return std::nullopt;
}

MaybeFailure EligibilityGateway::CheckBalance(const AccountId& voter, const Proposal& proposal) {
    std::optional<uint64_t> balance = balances_.BalanceOf(voter, proposal.credentialRef);
    if (!balance) {
        return Fail(BallotError::BalanceUnavailable, "balance source did not answer");
    }
    if (*balance < proposal.minThreshold) {
        return Fail(BallotError::InsufficientBalance,
                    "balance " + std::to_string(*balance) + " below threshold " +
                    std::to_string(proposal.minThreshold));
    }
    return std::nullopt;
}

MaybeFailure EligibilityGateway::CheckProof(const Proof& proof, const PublicWitness& witness) {
    bool accepted = false;
    try {
        accepted = verifier_.Verify(proof, witness);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::VERIFY)
            << verifier_.Name() << " verifier failed: " << e.what();
        return Fail(BallotError::VerificationFailed, std::string("verifier error: ") + e.what());
    }
    if (!accepted) {
        return Fail(BallotError::VerificationFailed, "proof rejected by " + verifier_.Name() +
                                                     " verifier");
    }
    return std::nullopt;
}

Result<VoteRecord> EligibilityGateway::CastVote(const CastRequest& request) {
    Proposal proposal;
    db::Status s = store_.GetProposal(request.proposalId, proposal);
    if (!s.ok()) {
        return StoreFailure(s, "proposal " + std::to_string(request.proposalId));
    }

    if (auto failure = CheckVotingOpen(proposal, clock_.Now())) {
        return *failure;
    }

    PublicInputs inputs;
    if (auto failure = CheckFormat(request.proof, request.witness, inputs)) {
        return *failure;
    }
    if (auto failure = CheckPublicInputs(inputs, proposal, request)) {
        return *failure;
    }
    if (auto failure = CheckBalance(request.voter, proposal)) {
        return *failure;
    }
    if (auto failure = CheckProof(request.proof, request.witness)) {
        return *failure;
    }

    // The external checks ran without the lock; bind them to the current record
    BallotStore::Transaction txn = store_.Begin();

    Proposal current;
    s = txn.GetProposal(request.proposalId, current);
    if (!s.ok()) {
        return StoreFailure(s, "proposal " + std::to_string(request.proposalId));
    }

    Timestamp now = clock_.Now();
    if (auto failure = CheckVotingOpen(current, now)) {
        return *failure;
    }
    if (auto failure = CheckPublicInputs(inputs, current, request)) {
        return *failure;
    }

    VoteRecord candidate;
    candidate.proposalId = request.proposalId;
    candidate.nullifier = request.nullifier;
    candidate.commitment = request.commitment;
    candidate.timestamp = now;

    Result<VoteRecord> admitted = ledger_.InsertIfAbsent(txn, current, candidate);
    if (!admitted) {
        return admitted;
    }

    s = txn.Commit();
    if (!s.ok()) {
        return Fail(BallotError::StorageFailure, "cast vote: " + s.ToString());
    }

    LogDebugF(util::LogCategory::LEDGER, "Proposal %llu now has %llu votes",
              static_cast<unsigned long long>(current.id),
              static_cast<unsigned long long>(current.voteCount));
    return admitted;
}

} // namespace ballot
} // namespace zkvote
