// ZKVOTE - Commit-Reveal Tally Engine
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#ifndef ZKVOTE_BALLOT_TALLY_H
#define ZKVOTE_BALLOT_TALLY_H

#include "zkvote/ballot/clock.h"
#include "zkvote/ballot/errors.h"
#include "zkvote/ballot/records.h"
#include "zkvote/ballot/store.h"

namespace zkvote {
namespace ballot {

struct RevealRequest {
    /// Anyone may reveal; recorded in the log only
    AccountId revealer;
    ProposalId proposalId{0};
    Nullifier nullifier;
    uint8_t choice{0};
    VoterSecret secret;
};

/**
 * Counts a vote once voting has ended, if the revealed choice and secret
 * recompute to the stored commitment. The record update and the tally
 * increment commit together.
 */
class TallyEngine {
public:
    TallyEngine(BallotStore& store, const Clock& clock);

    Result<Results> RevealVote(const RevealRequest& request);

private:
    BallotStore& store_;
    const Clock& clock_;
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_TALLY_H
