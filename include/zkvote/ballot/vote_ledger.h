// ZKVOTE - Vote Ledger
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#ifndef ZKVOTE_BALLOT_VOTE_LEDGER_H
#define ZKVOTE_BALLOT_VOTE_LEDGER_H

#include "zkvote/ballot/errors.h"
#include "zkvote/ballot/records.h"
#include "zkvote/ballot/store.h"

namespace zkvote {
namespace ballot {

/**
 * Admits a vote at most once per (proposal, nullifier).
 *
 * The existence check and the staged write happen in the caller's
 * transaction, which holds the store lock throughout.
 */
class VoteLedger {
public:
    /**
     * Stage `candidate` if its nullifier is unused for `proposal`, and bump
     * the proposal's vote count in the same transaction.
     *
     * Nothing is written until the caller commits.
     *
     * @param proposal Current proposal record; updated on success
     * @return The stored record, or DuplicateNullifier
     */
    Result<VoteRecord> InsertIfAbsent(BallotStore::Transaction& txn,
                                      Proposal& proposal,
                                      const VoteRecord& candidate) const;
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_VOTE_LEDGER_H
