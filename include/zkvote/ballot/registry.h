// ZKVOTE - Proposal Registry
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#ifndef ZKVOTE_BALLOT_REGISTRY_H
#define ZKVOTE_BALLOT_REGISTRY_H

#include "zkvote/ballot/clock.h"
#include "zkvote/ballot/errors.h"
#include "zkvote/ballot/records.h"
#include "zkvote/ballot/store.h"

#include <string>
#include <vector>

namespace zkvote {
namespace ballot {

/// Parameters of a new proposal
struct ProposalRequest {
    AccountId creator;
    ProposalId id{0};
    std::string title;
    std::vector<std::string> options;
    CredentialRef credentialRef;
    uint64_t minThreshold{0};
    /// Seconds from creation until voting closes
    int64_t votingPeriod{0};
};

/// A proposal together with its results record
struct ProposalState {
    Proposal proposal;
    Results results;
};

/**
 * Creates proposals. The Proposal and its zeroed Results are written in one
 * batch; an existing id is never overwritten.
 */
class ProposalRegistry {
public:
    ProposalRegistry(BallotStore& store, const Clock& clock);

    Result<ProposalState> CreateProposal(const ProposalRequest& request);

    /**
     * Check title, options and voting period against the limits.
     * Checks run in a fixed order and the first failure is returned.
     */
    static MaybeFailure Validate(const ProposalRequest& request, Timestamp now);

private:
    BallotStore& store_;
    const Clock& clock_;
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_REGISTRY_H
