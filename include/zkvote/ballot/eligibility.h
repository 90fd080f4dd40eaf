// ZKVOTE - Eligibility Verifier Gateway
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Admits a hidden vote only if it carries a valid eligibility proof bound to
// the proposal, the commitment and the nullifier, and the voter's balance
// independently meets the proposal threshold.

#ifndef ZKVOTE_BALLOT_ELIGIBILITY_H
#define ZKVOTE_BALLOT_ELIGIBILITY_H

#include "zkvote/ballot/balance.h"
#include "zkvote/ballot/clock.h"
#include "zkvote/ballot/errors.h"
#include "zkvote/ballot/proof_format.h"
#include "zkvote/ballot/store.h"
#include "zkvote/ballot/verifier.h"
#include "zkvote/ballot/vote_ledger.h"

namespace zkvote {
namespace ballot {

struct CastRequest {
    AccountId voter;
    ProposalId proposalId{0};
    Nullifier nullifier;
    VoteCommitment commitment;
    Proof proof;
    PublicWitness witness;
};

class EligibilityGateway {
public:
    EligibilityGateway(BallotStore& store, const Clock& clock,
                       Verifier& verifier, BalanceSource& balances);

    /**
     * Gates, in order: proposal exists and voting is open, proof and
     * witness are well formed, witness inputs match the request, balance
     * meets the threshold, the verifier accepts. The vote is then admitted
     * through the ledger in one transaction that re-checks the window.
     */
    Result<VoteRecord> CastVote(const CastRequest& request);

    /// Structural check only
    static MaybeFailure CheckFormat(const Proof& proof, const PublicWitness& witness,
                                    PublicInputs& inputs);

    /// Witness elements against the proposal and the request
    static MaybeFailure CheckPublicInputs(const PublicInputs& inputs, const Proposal& proposal,
                                          const CastRequest& request);

private:
    MaybeFailure CheckBalance(const AccountId& voter, const Proposal& proposal);
    MaybeFailure CheckProof(const Proof& proof, const PublicWitness& witness);

    BallotStore& store_;
    const Clock& clock_;
    Verifier& verifier_;
    BalanceSource& balances_;
    VoteLedger ledger_;
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_ELIGIBILITY_H
