// ZKVOTE - Ballot Errors Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/errors.h"

namespace zkvote {
namespace ballot {

const char* BallotErrorToString(BallotError error) {
    switch (error) {
        case BallotError::TooFewOptions: return "TooFewOptions";
        case BallotError::TooManyOptions: return "TooManyOptions";
        case BallotError::EmptyTitle: return "EmptyTitle";
        case BallotError::TitleTooLong: return "TitleTooLong";
        case BallotError::InvalidOption: return "InvalidOption";
        case BallotError::InvalidVotingPeriod: return "InvalidVotingPeriod";
        case BallotError::InvalidChoice: return "InvalidChoice";
        case BallotError::InvalidProofFormat: return "InvalidProofFormat";
        case BallotError::Unauthorized: return "Unauthorized";
        case BallotError::VotingNotActive: return "VotingNotActive";
        case BallotError::VotingNotEnded: return "VotingNotEnded";
        case BallotError::AlreadyRevealed: return "AlreadyRevealed";
        case BallotError::ProposalFinalized: return "ProposalFinalized";
        case BallotError::CreateCollision: return "CreateCollision";
        case BallotError::PublicInputMismatch: return "PublicInputMismatch";
        case BallotError::CommitmentMismatch: return "CommitmentMismatch";
        case BallotError::DuplicateNullifier: return "DuplicateNullifier";
        case BallotError::VerificationFailed: return "VerificationFailed";
        case BallotError::InsufficientBalance: return "InsufficientBalance";
        case BallotError::BalanceUnavailable: return "BalanceUnavailable";
        case BallotError::NotFound: return "NotFound";
        case BallotError::StorageFailure: return "StorageFailure";
        default: return "Unknown";
    }
}

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::Authorization: return "Authorization";
        case ErrorKind::State: return "State";
        case ErrorKind::Integrity: return "Integrity";
        case ErrorKind::External: return "External";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Storage: return "Storage";
        default: return "Unknown";
    }
}

ErrorKind GetErrorKind(BallotError error) {
    switch (error) {
        case BallotError::TooFewOptions:
        case BallotError::TooManyOptions:
        case BallotError::EmptyTitle:
        case BallotError::TitleTooLong:
        case BallotError::InvalidOption:
        case BallotError::InvalidVotingPeriod:
        case BallotError::InvalidChoice:
        case BallotError::InvalidProofFormat:
            return ErrorKind::Validation;

        case BallotError::Unauthorized:
            return ErrorKind::Authorization;

        case BallotError::VotingNotActive:
        case BallotError::VotingNotEnded:
        case BallotError::AlreadyRevealed:
        case BallotError::ProposalFinalized:
        case BallotError::CreateCollision:
            return ErrorKind::State;

        case BallotError::PublicInputMismatch:
        case BallotError::CommitmentMismatch:
        case BallotError::DuplicateNullifier:
            return ErrorKind::Integrity;

        case BallotError::VerificationFailed:
        case BallotError::InsufficientBalance:
        case BallotError::BalanceUnavailable:
            return ErrorKind::External;

        case BallotError::NotFound:
            return ErrorKind::NotFound;

        case BallotError::StorageFailure:
        default:
            return ErrorKind::Storage;
    }
}

std::string BallotFailure::ToString() const {
    std::string result = BallotErrorToString(error);
    if (!message.empty()) {
        result += ": " + message;
    }
    return result;
}

} // namespace ballot
} // namespace zkvote
