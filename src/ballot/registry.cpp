// ZKVOTE - Proposal Registry Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/registry.h"
#include "zkvote/util/logging.h"

#include <limits>

namespace zkvote {
namespace ballot {

ProposalRegistry::ProposalRegistry(BallotStore& store, const Clock& clock)
    : store_(store), clock_(clock) {}

MaybeFailure ProposalRegistry::Validate(const ProposalRequest& request, Timestamp now) {
    if (request.title.empty()) {
        return Fail(BallotError::EmptyTitle, "title is empty");
    }
    if (request.title.size() > MAX_TITLE_LENGTH) {
        return Fail(BallotError::TitleTooLong,
                    "title is " + std::to_string(request.title.size()) + " bytes, max " +
                    std::to_string(MAX_TITLE_LENGTH));
    }
    if (request.options.size() < MIN_OPTIONS) {
        return Fail(BallotError::TooFewOptions,
                    std::to_string(request.options.size()) + " options, min " +
                    std::to_string(MIN_OPTIONS));
    }
    if (request.options.size() > MAX_OPTIONS) {
        return Fail(BallotError::TooManyOptions,
                    std::to_string(request.options.size()) + " options, max " +
                    std::to_string(MAX_OPTIONS));
    }
    for (size_t i = 0; i < request.options.size(); ++i) {
        const std::string& option = request.options[i];
        if (option.empty() || option.size() > MAX_OPTION_LENGTH) {
            return Fail(BallotError::InvalidOption,
                        "option " + std::to_string(i) + " must be 1.." +
                        std::to_string(MAX_OPTION_LENGTH) + " bytes");
        }
    }
    if (request.votingPeriod <= 0) {
        return Fail(BallotError::InvalidVotingPeriod, "voting period must be positive");
    }
    if (now > std::numeric_limits<Timestamp>::max() - request.votingPeriod) {
        return Fail(BallotError::InvalidVotingPeriod, "voting period overflows end time");
    }
    return std::nullopt;
}

Result<ProposalState> ProposalRegistry::CreateProposal(const ProposalRequest& request) {
    Timestamp now = clock_.Now();

    if (auto failure = Validate(request, now)) {
        return *failure;
    }

    ProposalState state;
    Proposal& proposal = state.proposal;
    proposal.id = request.id;
    proposal.creator = request.creator;
    proposal.title = request.title;
    proposal.options = request.options;
    proposal.credentialRef = request.credentialRef;
    proposal.minThreshold = request.minThreshold;
    proposal.startTime = now;
    proposal.endTime = now + request.votingPeriod;
    proposal.voteCount = 0;
    proposal.isFinalized = false;

    Results& results = state.results;
    results.proposalId = request.id;
    results.tallies.assign(request.options.size(), 0);
    results.isFinalized = false;

    BallotStore::Transaction txn = store_.Begin();

    bool inserted = false;
    db::Status s = txn.InsertProposalIfAbsent(proposal, &inserted);
    if (!s.ok()) {
        return StoreFailure(s, "proposal " + std::to_string(request.id));
    }
    if (!inserted) {
        return Fail(BallotError::CreateCollision,
                    "proposal " + std::to_string(request.id) + " already exists");
    }
    txn.PutResults(results);

    s = txn.Commit();
    if (!s.ok()) {
        return Fail(BallotError::StorageFailure, "create proposal: " + s.ToString());
    }

    LOG_DEBUG(util::LogCategory::REGISTRY) << "Created " << proposal.ToString();
    return state;
}

} // namespace ballot
} // namespace zkvote
