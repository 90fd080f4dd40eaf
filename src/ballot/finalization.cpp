// ZKVOTE - Finalization Gate Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/finalization.h"
#include "zkvote/util/logging.h"

namespace zkvote {
namespace ballot {

FinalizationGate::FinalizationGate(BallotStore& store, const Clock& clock)
    : store_(store), clock_(clock) {}

Result<ProposalState> FinalizationGate::FinalizeProposal(const AccountId& authority,
                                                         ProposalId id) {
    BallotStore::Transaction txn = store_.Begin();
    const std::string what = "proposal " + std::to_string(id);

    ProposalState state;
    db::Status s = txn.GetProposal(id, state.proposal);
    if (!s.ok()) {
        return StoreFailure(s, what);
    }
    if (authority != state.proposal.creator) {
        return Fail(BallotError::Unauthorized, "only the creator may finalize " + what);
    }

    Timestamp now = clock_.Now();
    if (!state.proposal.HasEnded(now)) {
        return Fail(BallotError::VotingNotEnded,
                    "voting ends at " + std::to_string(state.proposal.endTime) +
                    ", now " + std::to_string(now));
    }
    if (state.proposal.isFinalized) {
        return Fail(BallotError::ProposalFinalized, what + " is already finalized");
    }

    s = txn.GetResults(id, state.results);
    if (!s.ok()) {
        return Fail(BallotError::StorageFailure, "results of " + what + ": " + s.ToString());
    }

    state.proposal.isFinalized = true;
    state.results.isFinalized = true;
    txn.PutProposal(state.proposal);
    txn.PutResults(state.results);

    s = txn.Commit();
    if (!s.ok()) {
        return Fail(BallotError::StorageFailure, "finalize: " + s.ToString());
    }

    LOG_DEBUG(util::LogCategory::TALLY) << "Frozen " << state.results.ToString();
    return state;
}

} // namespace ballot
} // namespace zkvote
