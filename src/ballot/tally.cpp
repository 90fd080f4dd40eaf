// ZKVOTE - Commit-Reveal Tally Engine Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/tally.h"
#include "zkvote/ballot/commitment.h"
#include "zkvote/util/logging.h"

namespace zkvote {
namespace ballot {

TallyEngine::TallyEngine(BallotStore& store, const Clock& clock)
    : store_(store), clock_(clock) {}

Result<Results> TallyEngine::RevealVote(const RevealRequest& request) {
    BallotStore::Transaction txn = store_.Begin();
    const std::string what = "proposal " + std::to_string(request.proposalId);

    Proposal proposal;
    db::Status s = txn.GetProposal(request.proposalId, proposal);
    if (!s.ok()) {
        return StoreFailure(s, what);
    }

    Timestamp now = clock_.Now();
    if (!proposal.HasEnded(now)) {
        return Fail(BallotError::VotingNotEnded,
                    "voting ends at " + std::to_string(proposal.endTime) +
                    ", now " + std::to_string(now));
    }
    if (proposal.isFinalized) {
        return Fail(BallotError::ProposalFinalized, what + " is finalized");
    }

    VoteRecord record;
    s = txn.GetVoteRecord(request.proposalId, request.nullifier, record);
    if (!s.ok()) {
        return StoreFailure(s, "vote record");
    }
    if (record.isRevealed) {
        return Fail(BallotError::AlreadyRevealed, "vote already revealed");
    }
    if (request.choice >= proposal.options.size()) {
        return Fail(BallotError::InvalidChoice,
                    "choice " + std::to_string(request.choice) + " of " +
                    std::to_string(proposal.options.size()) + " options");
    }

    if (!VerifyVoteCommitment(record.commitment, request.choice, request.secret,
                              request.proposalId)) {
        return Fail(BallotError::CommitmentMismatch,
                    "choice and secret do not open the stored commitment");
    }

    Results results;
    s = txn.GetResults(request.proposalId, results);
    if (!s.ok()) {
        return Fail(BallotError::StorageFailure, "results of " + what + ": " + s.ToString());
    }
    if (results.tallies.size() != proposal.options.size()) {
        return Fail(BallotError::StorageFailure,
                    "results of " + what + " have " + std::to_string(results.tallies.size()) +
                    " tallies for " + std::to_string(proposal.options.size()) + " options");
    }

    record.isRevealed = true;
    record.revealedChoice = request.choice;
    results.tallies[request.choice] += 1;

    txn.PutVoteRecord(record);
    txn.PutResults(results);

    s = txn.Commit();
    if (!s.ok()) {
        return Fail(BallotError::StorageFailure, "reveal vote: " + s.ToString());
    }

    LOG_DEBUG(util::LogCategory::TALLY)
        << "Revealer " << request.revealer.ToHex().substr(0, 16)
        << " opened " << record.ToString() << " -> " << results.ToString();
    return results;
}

} // namespace ballot
} // namespace zkvote
