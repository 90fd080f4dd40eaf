// ZKVOTE - Ballot Engine Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/engine.h"
#include "zkvote/db/memory.h"
#include "zkvote/util/config.h"
#include "zkvote/util/logging.h"

#include <stdexcept>

namespace zkvote {
namespace ballot {

namespace {

std::string Subject(ProposalId id) {
    return "proposal " + std::to_string(id);
}

template<typename T>
std::shared_ptr<T> Require(std::shared_ptr<T> ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string("BallotEngine requires a ") + what);
    }
    return ptr;
}

/// Default LevelDB block cache, in MiB
constexpr int64_t DEFAULT_DBCACHE_MB = 8;

} // namespace

BallotEngine::BallotEngine(std::unique_ptr<db::Database> db,
                           std::shared_ptr<const Clock> clock,
                           std::shared_ptr<Verifier> verifier,
                           std::shared_ptr<BalanceSource> balances)
    : store_(std::move(db)),
      clock_(Require(std::move(clock), "clock")),
      verifier_(Require(std::move(verifier), "verifier")),
      balances_(Require(std::move(balances), "balance source")),
      registry_(store_, *clock_),
      gateway_(store_, *clock_, *verifier_, *balances_),
      tally_(store_, *clock_),
      finalization_(store_, *clock_) {}

BallotEngine::~BallotEngine() = default;

template<typename T>
Result<T> BallotEngine::Report(const char* operation, const std::string& subject,
                               Result<T> result) {
    if (result.ok()) {
        LogInfoF(util::LogCategory::BALLOT, "%s %s: ok", operation, subject.c_str());
        return result;
    }

    const BallotFailure& failure = result.failure();
    if (GetErrorKind(failure.error) == ErrorKind::Storage) {
        LOG_ERROR(util::LogCategory::BALLOT)
            << operation << " " << subject << " failed: " << failure.ToString();
    } else {
        LOG_DEBUG(util::LogCategory::BALLOT)
            << operation << " " << subject << " rejected ("
            << ErrorKindToString(GetErrorKind(failure.error)) << "): " << failure.ToString();
    }
    return result;
}

// ============================================================================
// Operations
// ============================================================================

Result<ProposalState> BallotEngine::CreateProposal(const ProposalRequest& request) {
    return Report("create", Subject(request.id), registry_.CreateProposal(request));
}

Result<VoteRecord> BallotEngine::CastVote(const CastRequest& request) {
    return Report("cast", Subject(request.proposalId), gateway_.CastVote(request));
}

Result<Results> BallotEngine::RevealVote(const RevealRequest& request) {
    return Report("reveal", Subject(request.proposalId), tally_.RevealVote(request));
}

Result<ProposalState> BallotEngine::FinalizeProposal(const AccountId& authority, ProposalId id) {
    return Report("finalize", Subject(id), finalization_.FinalizeProposal(authority, id));
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Proposal> BallotEngine::GetProposal(ProposalId id) {
    Proposal proposal;
    db::Status s = store_.GetProposal(id, proposal);
    if (s.ok()) {
        return proposal;
    }
    if (!s.IsNotFound()) {
        LogErrorF(util::LogCategory::DB, "Reading %s: %s", Subject(id).c_str(),
                  s.ToString().c_str());
    }
    return std::nullopt;
}

std::optional<Results> BallotEngine::GetResults(ProposalId id) {
    Results results;
    db::Status s = store_.GetResults(id, results);
    if (s.ok()) {
        return results;
    }
    if (!s.IsNotFound()) {
        LogErrorF(util::LogCategory::DB, "Reading results of %s: %s", Subject(id).c_str(),
                  s.ToString().c_str());
    }
    return std::nullopt;
}

std::optional<VoteRecord> BallotEngine::GetVoteRecord(ProposalId id, const Nullifier& nullifier) {
    VoteRecord record;
    db::Status s = store_.GetVoteRecord(id, nullifier, record);
    if (s.ok()) {
        return record;
    }
    if (!s.IsNotFound()) {
        LogErrorF(util::LogCategory::DB, "Reading vote %s of %s: %s",
                  nullifier.ToHex().c_str(), Subject(id).c_str(), s.ToString().c_str());
    }
    return std::nullopt;
}

std::optional<ProposalPhase> BallotEngine::GetPhase(ProposalId id) {
    auto proposal = GetProposal(id);
    if (!proposal) {
        return std::nullopt;
    }
    return proposal->GetPhase(clock_->Now());
}

Result<std::vector<Proposal>> BallotEngine::ListProposals() {
    std::vector<Proposal> proposals;
    db::Status s = store_.ListProposals(proposals);
    if (!s.ok()) {
        LogErrorF(util::LogCategory::DB, "Listing proposals: %s", s.ToString().c_str());
        return Fail(BallotError::StorageFailure, "list proposals: " + s.ToString());
    }
    return proposals;
}

Result<std::vector<VoteRecord>> BallotEngine::ListVotes(ProposalId id) {
    std::vector<VoteRecord> votes;
    db::Status s = store_.ListVotes(id, votes);
    if (!s.ok()) {
        LogErrorF(util::LogCategory::DB, "Listing votes of %s: %s", Subject(id).c_str(),
                  s.ToString().c_str());
        return Fail(BallotError::StorageFailure, "list votes: " + s.ToString());
    }
    return votes;
}

// ============================================================================
// Database Selection
// ============================================================================

std::unique_ptr<db::Database> OpenBallotDatabase(const util::ConfigManager& config,
                                                 std::string& error) {
    if (config.GetBool(util::ConfigKeys::INMEMORY, false)) {
        LOG_INFO(util::LogCategory::DB) << "Using in-memory ballot store";
        return std::make_unique<db::MemoryDatabase>();
    }

    int64_t cacheMb = config.GetInt(util::ConfigKeys::DBCACHE, DEFAULT_DBCACHE_MB);
    if (cacheMb <= 0) {
        error = "dbcache must be a positive number of MiB";
        return nullptr;
    }

    db::Options options;
    options.block_cache_size = static_cast<size_t>(cacheMb) * 1024 * 1024;

    std::filesystem::path path = std::filesystem::path(config.GetDataDir()) / "ballots";
    auto [status, database] = db::OpenDatabase(path, options);
    if (!status.ok()) {
        error = "cannot open ballot store at " + path.string() + ": " + status.ToString();
        return nullptr;
    }
    return std::move(database);
}

} // namespace ballot
} // namespace zkvote
