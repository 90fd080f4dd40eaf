// ZKVOTE - Ballot Store Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/store.h"
#include "zkvote/util/logging.h"

#include <stdexcept>

namespace zkvote {
namespace ballot {

// ============================================================================
// Keys
// ============================================================================

namespace {

std::string MakeIdKey(char prefix, ProposalId id) {
    std::string key(9, '\0');
    key[0] = prefix;
    WriteBE64(reinterpret_cast<uint8_t*>(&key[1]), id);
    return key;
}

} // namespace

std::string MakeProposalKey(ProposalId id) {
    return MakeIdKey(StoreKeys::PROPOSAL, id);
}

std::string MakeResultsKey(ProposalId id) {
    return MakeIdKey(StoreKeys::RESULTS, id);
}

std::string MakeVotePrefix(ProposalId id) {
    return MakeIdKey(StoreKeys::VOTE, id);
}

std::string MakeVoteKey(ProposalId id, const Nullifier& nullifier) {
    std::string key = MakeVotePrefix(id);
    key.append(reinterpret_cast<const char*>(nullifier.data()), nullifier.size());
    return key;
}

BallotFailure StoreFailure(const db::Status& status, const std::string& what) {
    if (status.IsNotFound()) {
        return Fail(BallotError::NotFound, what + " not found");
    }
    return Fail(BallotError::StorageFailure, what + ": " + status.ToString());
}

// ============================================================================
// Transaction
// ============================================================================

BallotStore::Transaction::Transaction(BallotStore& store)
    : store_(store), lock_(store.mutex_) {}

db::Status BallotStore::Transaction::Read(const std::string& key, std::string& value) {
    auto it = staged_.find(key);
    if (it != staged_.end()) {
        value = it->second;
        return db::Status::Ok();
    }
    return store_.db_->Get(key, &value);
}

db::Status BallotStore::Transaction::Exists(const std::string& key, bool* exists) {
    std::string ignored;
    db::Status s = Read(key, ignored);
    if (s.ok()) {
        *exists = true;
        return s;
    }
    if (s.IsNotFound()) {
        *exists = false;
        return db::Status::Ok();
    }
    return s;
}

void BallotStore::Transaction::Stage(const std::string& key, std::string value) {
    batch_.Put(key, value);
    staged_[key] = std::move(value);
}

template<typename T>
db::Status BallotStore::Transaction::ReadRecord(const std::string& key, T& out) {
    std::string value;
    db::Status s = Read(key, value);
    if (!s.ok()) {
        return s;
    }
    if (!db::DeserializeFromString(value, out)) {
        return db::Status::Corruption("undecodable record under key prefix '" +
                                      std::string(1, key[0]) + "'");
    }
    return s;
}

db::Status BallotStore::Transaction::GetProposal(ProposalId id, Proposal& out) {
    return ReadRecord(MakeProposalKey(id), out);
}

db::Status BallotStore::Transaction::GetResults(ProposalId id, Results& out) {
    return ReadRecord(MakeResultsKey(id), out);
}

db::Status BallotStore::Transaction::GetVoteRecord(ProposalId id, const Nullifier& nullifier,
                                                   VoteRecord& out) {
    return ReadRecord(MakeVoteKey(id, nullifier), out);
}

void BallotStore::Transaction::PutProposal(const Proposal& proposal) {
    Stage(MakeProposalKey(proposal.id), db::SerializeToString(proposal));
}

void BallotStore::Transaction::PutResults(const Results& results) {
    Stage(MakeResultsKey(results.proposalId), db::SerializeToString(results));
}

void BallotStore::Transaction::PutVoteRecord(const VoteRecord& record) {
    Stage(MakeVoteKey(record.proposalId, record.nullifier), db::SerializeToString(record));
}

db::Status BallotStore::Transaction::InsertVoteRecordIfAbsent(const VoteRecord& record,
                                                              bool* inserted) {
    std::string key = MakeVoteKey(record.proposalId, record.nullifier);
    bool exists = false;
    db::Status s = Exists(key, &exists);
    if (!s.ok()) {
        return s;
    }
    *inserted = !exists;
    if (!exists) {
        Stage(key, db::SerializeToString(record));
    }
    return db::Status::Ok();
}

db::Status BallotStore::Transaction::InsertProposalIfAbsent(const Proposal& proposal,
                                                            bool* inserted) {
    std::string key = MakeProposalKey(proposal.id);
    bool exists = false;
    db::Status s = Exists(key, &exists);
    if (!s.ok()) {
        return s;
    }
    *inserted = !exists;
    if (!exists) {
        Stage(key, db::SerializeToString(proposal));
    }
    return db::Status::Ok();
}

db::Status BallotStore::Transaction::Commit() {
    if (committed_) {
        return db::Status::InvalidArgument("transaction already committed");
    }
    committed_ = true;

    if (batch_.Empty()) {
        return db::Status::Ok();
    }

    db::Status s = store_.db_->Write(db::WriteOptions(), &batch_);
    if (!s.ok()) {
        LogErrorF(util::LogCategory::DB, "Batch of %zu writes failed: %s",
                  batch_.Count(), s.ToString().c_str());
    }
    staged_.clear();
    batch_.Clear();
    return s;
}

// ============================================================================
// BallotStore
// ============================================================================

BallotStore::BallotStore(std::unique_ptr<db::Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("BallotStore requires a database");
    }
}

BallotStore::Transaction BallotStore::Begin() {
    return Transaction(*this);
}

db::Status BallotStore::GetProposal(ProposalId id, Proposal& out) {
    Transaction txn = Begin();
    return txn.GetProposal(id, out);
}

db::Status BallotStore::GetResults(ProposalId id, Results& out) {
    Transaction txn = Begin();
    return txn.GetResults(id, out);
}

db::Status BallotStore::GetVoteRecord(ProposalId id, const Nullifier& nullifier,
                                      VoteRecord& out) {
    Transaction txn = Begin();
    return txn.GetVoteRecord(id, nullifier, out);
}

template<typename T>
db::Status BallotStore::ListRecords(const std::string& prefix, std::vector<T>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();

    std::unique_ptr<db::Iterator> it = db_->NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        T record;
        if (!db::DeserializeFromString(it->value().ToString(), record)) {
            return db::Status::Corruption("undecodable record under key prefix '" +
                                          prefix.substr(0, 1) + "'");
        }
        out.push_back(std::move(record));
    }
    return it->status();
}

db::Status BallotStore::ListProposals(std::vector<Proposal>& out) {
    return ListRecords(std::string(1, StoreKeys::PROPOSAL), out);
}

db::Status BallotStore::ListVotes(ProposalId id, std::vector<VoteRecord>& out) {
    return ListRecords(MakeVotePrefix(id), out);
}

} // namespace ballot
} // namespace zkvote
