// ZKVOTE - Finalization Gate
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#ifndef ZKVOTE_BALLOT_FINALIZATION_H
#define ZKVOTE_BALLOT_FINALIZATION_H

#include "zkvote/ballot/clock.h"
#include "zkvote/ballot/errors.h"
#include "zkvote/ballot/registry.h"
#include "zkvote/ballot/store.h"

namespace zkvote {
namespace ballot {

/// Creator-only, one-time transition that freezes results
class FinalizationGate {
public:
    FinalizationGate(BallotStore& store, const Clock& clock);

    /**
     * Preconditions, in order: the proposal exists, `authority` is its
     * creator, voting has ended, it is not finalized yet.
     */
    Result<ProposalState> FinalizeProposal(const AccountId& authority, ProposalId id);

private:
    BallotStore& store_;
    const Clock& clock_;
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_FINALIZATION_H
