// ZKVOTE - Ballot Records Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/records.h"

#include <numeric>
#include <sstream>

namespace zkvote {
namespace ballot {

const char* ProposalPhaseToString(ProposalPhase phase) {
    switch (phase) {
        case ProposalPhase::Pending: return "Pending";
        case ProposalPhase::Voting: return "Voting";
        case ProposalPhase::Ended: return "Ended";
        case ProposalPhase::Finalized: return "Finalized";
        default: return "Unknown";
    }
}

// ============================================================================
// Proposal
// ============================================================================

ProposalPhase Proposal::GetPhase(Timestamp now) const {
    if (isFinalized) {
        return ProposalPhase::Finalized;
    }
    if (now < startTime) {
        return ProposalPhase::Pending;
    }
    if (now < endTime) {
        return ProposalPhase::Voting;
    }
    return ProposalPhase::Ended;
}

std::string Proposal::ToString() const {
    std::ostringstream ss;
    ss << "Proposal(id=" << id
       << ", title=\"" << title << "\""
       << ", options=" << options.size()
       << ", creator=" << creator.ToHex().substr(0, 16)
       << ", threshold=" << minThreshold
       << ", window=[" << startTime << "," << endTime << ")"
       << ", votes=" << voteCount
       << ", finalized=" << (isFinalized ? "true" : "false")
       << ")";
    return ss.str();
}

bool Proposal::operator==(const Proposal& o) const {
    return id == o.id && creator == o.creator && title == o.title &&
           options == o.options && credentialRef == o.credentialRef &&
           minThreshold == o.minThreshold && startTime == o.startTime &&
           endTime == o.endTime && voteCount == o.voteCount &&
           isFinalized == o.isFinalized;
}

// ============================================================================
// Results
// ============================================================================

uint64_t Results::TotalRevealed() const {
    return std::accumulate(tallies.begin(), tallies.end(), uint64_t{0});
}

std::string Results::ToString() const {
    std::ostringstream ss;
    ss << "Results(id=" << proposalId << ", tallies=[";
    for (size_t i = 0; i < tallies.size(); ++i) {
        if (i > 0) ss << ",";
        ss << tallies[i];
    }
    ss << "], finalized=" << (isFinalized ? "true" : "false") << ")";
    return ss.str();
}

// ============================================================================
// Vote Record
// ============================================================================

std::string VoteRecord::ToString() const {
    std::ostringstream ss;
    ss << "VoteRecord(proposal=" << proposalId
       << ", nullifier=" << nullifier.ToHex().substr(0, 16)
       << ", revealed=" << (isRevealed ? "true" : "false");
    if (revealedChoice) {
        ss << ", choice=" << static_cast<int>(*revealedChoice);
    }
    ss << ")";
    return ss.str();
}

bool VoteRecord::operator==(const VoteRecord& o) const {
    return proposalId == o.proposalId && nullifier == o.nullifier &&
           commitment == o.commitment && timestamp == o.timestamp &&
           isRevealed == o.isRevealed &&
           revealedChoice == o.revealedChoice;
}

} // namespace ballot
} // namespace zkvote
