// ZKVOTE - Vote Ledger Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/vote_ledger.h"
#include "zkvote/util/logging.h"

namespace zkvote {
namespace ballot {

Result<VoteRecord> VoteLedger::InsertIfAbsent(BallotStore::Transaction& txn,
                                              Proposal& proposal,
                                              const VoteRecord& candidate) const {
    VoteRecord record = candidate;
    record.proposalId = proposal.id;
    record.isRevealed = false;
    record.revealedChoice.reset();

    bool inserted = false;
    db::Status s = txn.InsertVoteRecordIfAbsent(record, &inserted);
    if (!s.ok()) {
        return StoreFailure(s, "vote record");
    }
    if (!inserted) {
        LogDebugF(util::LogCategory::LEDGER, "Nullifier %s already used on proposal %llu",
                  record.nullifier.ToHex().c_str(),
                  static_cast<unsigned long long>(proposal.id));
        return Fail(BallotError::DuplicateNullifier,
                    "nullifier already used on proposal " + std::to_string(proposal.id));
    }

    proposal.voteCount += 1;
    txn.PutProposal(proposal);
    return record;
}

} // namespace ballot
} // namespace zkvote
