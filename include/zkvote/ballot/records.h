// ZKVOTE - Ballot Records
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Persistent records of the ballot ledger: Proposal, Results and VoteRecord,
// plus limits and the derived proposal phase.

#ifndef ZKVOTE_BALLOT_RECORDS_H
#define ZKVOTE_BALLOT_RECORDS_H

#include "zkvote/core/serialize.h"
#include "zkvote/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zkvote {
namespace ballot {

// ============================================================================
// Limits
// ============================================================================

/// Maximum title length in bytes
constexpr size_t MAX_TITLE_LENGTH = 100;

/// Maximum option length in bytes
constexpr size_t MAX_OPTION_LENGTH = 50;

constexpr size_t MIN_OPTIONS = 2;
constexpr size_t MAX_OPTIONS = 10;

// ============================================================================
// Proposal Phase
// ============================================================================

enum class ProposalPhase {
    Pending,    // now < start_time
    Voting,     // start_time <= now < end_time
    Ended,      // now >= end_time, not finalized
    Finalized
};

const char* ProposalPhaseToString(ProposalPhase phase);

// ============================================================================
// Proposal
// ============================================================================

struct Proposal {
    ProposalId id{0};

    AccountId creator;

    std::string title;

    std::vector<std::string> options;

    /// Names the credential whose balance gates eligibility
    CredentialRef credentialRef;

    uint64_t minThreshold{0};

    Timestamp startTime{0};
    Timestamp endTime{0};

    /// Admitted votes; only the vote ledger changes this
    uint64_t voteCount{0};

    bool isFinalized{false};

    /// Voting is open at `now`: [startTime, endTime) and not finalized
    bool IsVotingActive(Timestamp now) const {
        return !isFinalized && now >= startTime && now < endTime;
    }

    bool HasEnded(Timestamp now) const { return now >= endTime; }

    ProposalPhase GetPhase(Timestamp now) const;

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::zkvote::Serialize(s, id);
        ::zkvote::Serialize(s, creator);
        ::zkvote::Serialize(s, title);
        ::zkvote::Serialize(s, options);
        ::zkvote::Serialize(s, credentialRef);
        ::zkvote::Serialize(s, minThreshold);
        ::zkvote::Serialize(s, startTime);
        ::zkvote::Serialize(s, endTime);
        ::zkvote::Serialize(s, voteCount);
        ::zkvote::Serialize(s, isFinalized);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::zkvote::Unserialize(s, id);
        ::zkvote::Unserialize(s, creator);
        ::zkvote::Unserialize(s, title);
        ::zkvote::Unserialize(s, options);
        ::zkvote::Unserialize(s, credentialRef);
        ::zkvote::Unserialize(s, minThreshold);
        ::zkvote::Unserialize(s, startTime);
        ::zkvote::Unserialize(s, endTime);
        ::zkvote::Unserialize(s, voteCount);
        ::zkvote::Unserialize(s, isFinalized);
    }

    bool operator==(const Proposal& o) const;
    bool operator!=(const Proposal& o) const { return !(*this == o); }
};

// ============================================================================
// Results
// ============================================================================

/// Per-option tallies of revealed votes
struct Results {
    ProposalId proposalId{0};

    /// One counter per option
    std::vector<uint64_t> tallies;

    /// Mirrors Proposal::isFinalized
    bool isFinalized{false};

    uint64_t TotalRevealed() const;

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::zkvote::Serialize(s, proposalId);
        ::zkvote::Serialize(s, tallies);
        ::zkvote::Serialize(s, isFinalized);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::zkvote::Unserialize(s, proposalId);
        ::zkvote::Unserialize(s, tallies);
        ::zkvote::Unserialize(s, isFinalized);
    }

    bool operator==(const Results& o) const {
        return proposalId == o.proposalId && tallies == o.tallies && isFinalized == o.isFinalized;
    }
    bool operator!=(const Results& o) const { return !(*this == o); }
};

// ============================================================================
// Vote Record
// ============================================================================

/// One admitted vote, keyed by (proposal, nullifier)
struct VoteRecord {
    ProposalId proposalId{0};

    Nullifier nullifier;

    VoteCommitment commitment;

    /// Admission time
    Timestamp timestamp{0};

    bool isRevealed{false};

    /// Set exactly once, on reveal
    std::optional<uint8_t> revealedChoice;

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::zkvote::Serialize(s, proposalId);
        ::zkvote::Serialize(s, nullifier);
        ::zkvote::Serialize(s, commitment);
        ::zkvote::Serialize(s, timestamp);
        ::zkvote::Serialize(s, isRevealed);
        ::zkvote::Serialize(s, revealedChoice);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::zkvote::Unserialize(s, proposalId);
        ::zkvote::Unserialize(s, nullifier);
        ::zkvote::Unserialize(s, commitment);
        ::zkvote::Unserialize(s, timestamp);
        ::zkvote::Unserialize(s, isRevealed);
        ::zkvote::Unserialize(s, revealedChoice);
    }

    bool operator==(const VoteRecord& o) const;
    bool operator!=(const VoteRecord& o) const { return !(*this == o); }
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_RECORDS_H
