// ZKVOTE - Ballot Engine
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Facade over the ballot ledger. Owns the store and the injected clock,
// verifier and balance source, and exposes the four state-changing
// operations plus read-only queries.
//
// Lifecycle of a proposal:
//   Created -> Voting [start, end) -> Ended (now >= end) -> Finalized

#ifndef ZKVOTE_BALLOT_ENGINE_H
#define ZKVOTE_BALLOT_ENGINE_H

#include "zkvote/ballot/balance.h"
#include "zkvote/ballot/clock.h"
#include "zkvote/ballot/eligibility.h"
#include "zkvote/ballot/errors.h"
#include "zkvote/ballot/finalization.h"
#include "zkvote/ballot/records.h"
#include "zkvote/ballot/registry.h"
#include "zkvote/ballot/store.h"
#include "zkvote/ballot/tally.h"
#include "zkvote/ballot/verifier.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zkvote {

namespace util {
class ConfigManager;
}

namespace ballot {

class BallotEngine {
public:
    BallotEngine(std::unique_ptr<db::Database> db,
                 std::shared_ptr<const Clock> clock,
                 std::shared_ptr<Verifier> verifier,
                 std::shared_ptr<BalanceSource> balances);

    ~BallotEngine();

    BallotEngine(const BallotEngine&) = delete;
    BallotEngine& operator=(const BallotEngine&) = delete;

    // ========================================================================
    // Operations (each atomic)
    // ========================================================================

    Result<ProposalState> CreateProposal(const ProposalRequest& request);

    Result<VoteRecord> CastVote(const CastRequest& request);

    Result<Results> RevealVote(const RevealRequest& request);

    Result<ProposalState> FinalizeProposal(const AccountId& authority, ProposalId id);

    // ========================================================================
    // Queries
    // ========================================================================

    /// nullopt if absent; store errors are logged
    std::optional<Proposal> GetProposal(ProposalId id);

    std::optional<Results> GetResults(ProposalId id);

    std::optional<VoteRecord> GetVoteRecord(ProposalId id, const Nullifier& nullifier);

    /// Phase at the clock's current time
    std::optional<ProposalPhase> GetPhase(ProposalId id);

    /// All proposals in id order
    Result<std::vector<Proposal>> ListProposals();

    /// Votes of one proposal in nullifier order
    Result<std::vector<VoteRecord>> ListVotes(ProposalId id);

    // ========================================================================
    // Accessors
    // ========================================================================

    BallotStore& GetStore() { return store_; }
    const Clock& GetClock() const { return *clock_; }
    Verifier& GetVerifier() { return *verifier_; }

private:
    template<typename T>
    Result<T> Report(const char* operation, const std::string& subject, Result<T> result);

    BallotStore store_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<Verifier> verifier_;
    std::shared_ptr<BalanceSource> balances_;

    ProposalRegistry registry_;
    EligibilityGateway gateway_;
    TallyEngine tally_;
    FinalizationGate finalization_;
};

/**
 * Open the database selected by the inmemory, datadir and dbcache keys.
 * The persistent store lives in <datadir>/ballots.
 *
 * @param error Set to a description when nullptr is returned
 */
std::unique_ptr<db::Database> OpenBallotDatabase(const util::ConfigManager& config,
                                                 std::string& error);

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_ENGINE_H
