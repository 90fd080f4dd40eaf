// ZKVOTE - Vote Commitment Scheme
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// The public hash shared by the eligibility circuit, voters and the tally
// engine. Both values are Poseidon hashes over the BN254 scalar field,
// encoded as 32 big-endian bytes:
//
//   commitment = Poseidon(choice, secret mod p, proposal_id)
//   nullifier  = Poseidon(NullifierDomain(), secret mod p, proposal_id)

#ifndef ZKVOTE_BALLOT_COMMITMENT_H
#define ZKVOTE_BALLOT_COMMITMENT_H

#include "zkvote/core/types.h"
#include "zkvote/crypto/field.h"

#include <cstdint>

namespace zkvote {
namespace ballot {

/// Domain separation tag placed in the choice slot for nullifiers.
/// Derived from SHA-256, so it cannot collide with a small choice index.
const FieldElement& NullifierDomain();

VoteCommitment ComputeVoteCommitment(uint8_t choice, const VoterSecret& secret,
                                     ProposalId proposalId);

Nullifier DeriveNullifier(const VoterSecret& secret, ProposalId proposalId);

/// Recompute the commitment and compare byte for byte
bool VerifyVoteCommitment(const VoteCommitment& commitment, uint8_t choice,
                          const VoterSecret& secret, ProposalId proposalId);

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_COMMITMENT_H
