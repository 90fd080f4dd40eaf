// ZKVOTE - Ballot Errors
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Typed failures returned by ballot operations, grouped by kind.

#ifndef ZKVOTE_BALLOT_ERRORS_H
#define ZKVOTE_BALLOT_ERRORS_H

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace zkvote {
namespace ballot {

// ============================================================================
// Error Codes
// ============================================================================

enum class BallotError {
    // Validation
    TooFewOptions,
    TooManyOptions,
    EmptyTitle,
    TitleTooLong,
    InvalidOption,
    InvalidVotingPeriod,
    InvalidChoice,
    InvalidProofFormat,

    // Authorization
    Unauthorized,

    // State
    VotingNotActive,
    VotingNotEnded,
    AlreadyRevealed,
    ProposalFinalized,
    CreateCollision,

    // Integrity
    PublicInputMismatch,
    CommitmentMismatch,
    DuplicateNullifier,

    // External
    VerificationFailed,
    InsufficientBalance,
    BalanceUnavailable,

    NotFound,

    /// The store reported an I/O error or holds a corrupt record
    StorageFailure
};

enum class ErrorKind {
    Validation,
    Authorization,
    State,
    Integrity,
    External,
    NotFound,
    Storage
};

const char* BallotErrorToString(BallotError error);

const char* ErrorKindToString(ErrorKind kind);

ErrorKind GetErrorKind(BallotError error);

// ============================================================================
// Failure and Result
// ============================================================================

/// An error code with a human-readable detail
struct BallotFailure {
    BallotError error;
    std::string message;

    std::string ToString() const;
};

/// Empty on success; used by checks that produce no value
using MaybeFailure = std::optional<BallotFailure>;

inline BallotFailure Fail(BallotError error, std::string message = "") {
    return BallotFailure{error, std::move(message)};
}

/**
 * Either a value or a BallotFailure.
 *
 * Implicitly constructible from both, so operations can
 * `return value;` or `return Fail(BallotError::X, "...");`.
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(BallotFailure failure) : failure_(std::move(failure)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    /// @throws std::logic_error if this holds a failure
    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result::value() on failure: " + failure_.ToString());
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Result::value() on failure: " + failure_.ToString());
        }
        return *value_;
    }

    const T& operator*() const { return value(); }
    const T* operator->() const { return &value(); }

    /// Only meaningful when !ok()
    BallotError error() const { return failure_.error; }
    const std::string& message() const { return failure_.message; }
    const BallotFailure& failure() const { return failure_; }

private:
    std::optional<T> value_;
    BallotFailure failure_{BallotError::StorageFailure, ""};
};

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_ERRORS_H
