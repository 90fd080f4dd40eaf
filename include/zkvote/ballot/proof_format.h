// ZKVOTE - Eligibility Proof Wire Format
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Fixed wire contract for a gnark Groth16 (BN254) eligibility proof and its
// public witness.
//
// Public witness layout (140 bytes, all integers big-endian):
//
//   offset  size  field
//   0       4     number of public elements   (4)
//   4       4     number of secret elements   (0)
//   8       4     vector length               (4)
//   12      32    min_threshold
//   44      32    proposal_id
//   76      32    vote_commitment
//   108     32    nullifier

#ifndef ZKVOTE_BALLOT_PROOF_FORMAT_H
#define ZKVOTE_BALLOT_PROOF_FORMAT_H

#include "zkvote/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace zkvote {
namespace ballot {

// ============================================================================
// Constants
// ============================================================================

/// Groth16 proof size produced by the eligibility circuit
constexpr size_t PROOF_SIZE = 388;

/// BN254 scalar field element
constexpr size_t FIELD_ELEMENT_SIZE = 32;

/// threshold, proposal id, commitment, nullifier
constexpr size_t NUM_PUBLIC_INPUTS = 4;

constexpr size_t PUBLIC_WITNESS_HEADER_SIZE = 12;

constexpr size_t PUBLIC_WITNESS_SIZE =
    PUBLIC_WITNESS_HEADER_SIZE + NUM_PUBLIC_INPUTS * FIELD_ELEMENT_SIZE;

// ============================================================================
// Types
// ============================================================================

using Proof = std::vector<Byte>;

/// Raw public witness bytes, as handed to the verifier
using PublicWitness = std::vector<Byte>;

using FieldBytes = std::array<Byte, FIELD_ELEMENT_SIZE>;

/// Decoded public inputs, in circuit order
struct PublicInputs {
    FieldBytes minThreshold{};
    FieldBytes proposalId{};
    VoteCommitment commitment;
    Nullifier nullifier;
};

// ============================================================================
// Functions
// ============================================================================

bool IsValidProofSize(const Proof& proof);

/// Decode a witness; nullopt unless it has exactly the layout above
std::optional<PublicInputs> DecodePublicWitness(const PublicWitness& witness);

PublicWitness EncodePublicWitness(const PublicInputs& inputs);

/// Canonical element for a u64: 24 zero bytes then the value big-endian
FieldBytes EncodeU64Element(uint64_t value);

/// Inverse of EncodeU64Element; nullopt if any of the upper 24 bytes is set
std::optional<uint64_t> DecodeU64Element(const FieldBytes& element);

PublicInputs MakePublicInputs(uint64_t minThreshold, ProposalId proposalId,
                              const VoteCommitment& commitment,
                              const Nullifier& nullifier);

/// True if every element equals the expected value
bool PublicInputsMatch(const PublicInputs& inputs, uint64_t minThreshold,
                       ProposalId proposalId, const VoteCommitment& commitment,
                       const Nullifier& nullifier);

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_PROOF_FORMAT_H
