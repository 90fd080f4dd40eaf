// ZKVOTE - Ballot Store
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Typed access to ballot records over the key-value database.
//
// Key layout:
//   'P' | id (8 bytes BE)               -> Proposal
//   'R' | id (8 bytes BE)               -> Results
//   'V' | id (8 bytes BE) | nullifier   -> VoteRecord
//
// Big-endian ids keep proposals, and the votes of one proposal, in id order.

#ifndef ZKVOTE_BALLOT_STORE_H
#define ZKVOTE_BALLOT_STORE_H

#include "zkvote/ballot/errors.h"
#include "zkvote/ballot/records.h"
#include "zkvote/db/database.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zkvote {
namespace ballot {

// ============================================================================
// Keys
// ============================================================================

namespace StoreKeys {
    constexpr char PROPOSAL = 'P';
    constexpr char RESULTS = 'R';
    constexpr char VOTE = 'V';
}

std::string MakeProposalKey(ProposalId id);
std::string MakeResultsKey(ProposalId id);
std::string MakeVoteKey(ProposalId id, const Nullifier& nullifier);

/// Prefix shared by every vote of one proposal
std::string MakeVotePrefix(ProposalId id);

/// NotFound for a missing record, StorageFailure for anything else
BallotFailure StoreFailure(const db::Status& status, const std::string& what);

// ============================================================================
// Ballot Store
// ============================================================================

class BallotStore {
public:
    /**
     * A serializable unit of work.
     *
     * Holds the store lock from construction to destruction, so every read
     * and every existence check it makes sees no concurrent writer. Writes
     * are staged and become visible to other readers only on Commit(), as a
     * single atomic batch. Destroying an uncommitted transaction discards
     * its staged writes.
     */
    class Transaction {
    public:
        ~Transaction() = default;

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        /// @return NotFound, Corruption for an undecodable record, or a backend error
        db::Status GetProposal(ProposalId id, Proposal& out);
        db::Status GetResults(ProposalId id, Results& out);
        db::Status GetVoteRecord(ProposalId id, const Nullifier& nullifier, VoteRecord& out);

        void PutProposal(const Proposal& proposal);
        void PutResults(const Results& results);
        void PutVoteRecord(const VoteRecord& record);

        /**
         * Stage a record only if its key is unused, in this transaction and
         * in the database.
         *
         * @param inserted Set to false if the key already exists
         */
        db::Status InsertVoteRecordIfAbsent(const VoteRecord& record, bool* inserted);
        db::Status InsertProposalIfAbsent(const Proposal& proposal, bool* inserted);

        /// Write staged records atomically. A transaction commits at most once.
        db::Status Commit();

        size_t StagedCount() const { return staged_.size(); }

    private:
        friend class BallotStore;
        explicit Transaction(BallotStore& store);

        db::Status Read(const std::string& key, std::string& value);
        db::Status Exists(const std::string& key, bool* exists);
        void Stage(const std::string& key, std::string value);

        template<typename T>
        db::Status ReadRecord(const std::string& key, T& out);

        BallotStore& store_;
        std::unique_lock<std::mutex> lock_;
        std::map<std::string, std::string> staged_;
        db::WriteBatch batch_;
        bool committed_{false};
    };

    explicit BallotStore(std::unique_ptr<db::Database> db);

    BallotStore(const BallotStore&) = delete;
    BallotStore& operator=(const BallotStore&) = delete;

    /// Blocks until no other transaction is open
    Transaction Begin();

    // Read-only queries, each under the store lock

    db::Status GetProposal(ProposalId id, Proposal& out);
    db::Status GetResults(ProposalId id, Results& out);
    db::Status GetVoteRecord(ProposalId id, const Nullifier& nullifier, VoteRecord& out);

    /// All proposals in id order
    db::Status ListProposals(std::vector<Proposal>& out);

    /// All votes of a proposal in nullifier order
    db::Status ListVotes(ProposalId id, std::vector<VoteRecord>& out);

private:
    template<typename T>
    db::Status ListRecords(const std::string& prefix, std::vector<T>& out);

    std::unique_ptr<db::Database> db_;
    std::mutex mutex_;
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_STORE_H
