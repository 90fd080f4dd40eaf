// ZKVOTE - Vote Commitment Scheme Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/commitment.h"
#include "zkvote/crypto/poseidon.h"
#include "zkvote/crypto/sha256.h"

#include <cstring>

namespace zkvote {
namespace ballot {

namespace {

constexpr const char* NULLIFIER_DOMAIN_SEED = "ZKVOTE_NULLIFIER_DOMAIN";

FieldElement SecretToField(const VoterSecret& secret) {
    return FieldElement::FromBytes(secret.data(), secret.size());
}

Hash256 HashToBytes(const FieldElement& element) {
    const auto& bytes = element.ToBytes();
    return Hash256(bytes.data(), bytes.size());
}

} // namespace

const FieldElement& NullifierDomain() {
    static const FieldElement domain = [] {
        Hash256 digest = SHA256Hash(reinterpret_cast<const Byte*>(NULLIFIER_DOMAIN_SEED),
                                    std::strlen(NULLIFIER_DOMAIN_SEED));
        return FieldElement::FromBytes(digest.data(), digest.size());
    }();
    return domain;
}

VoteCommitment ComputeVoteCommitment(uint8_t choice, const VoterSecret& secret,
                                     ProposalId proposalId) {
    FieldElement h = Poseidon::Hash({FieldElement(choice), SecretToField(secret),
                                     FieldElement(proposalId)});
    return VoteCommitment(HashToBytes(h));
}

Nullifier DeriveNullifier(const VoterSecret& secret, ProposalId proposalId) {
    FieldElement h = Poseidon::Hash({NullifierDomain(), SecretToField(secret),
                                     FieldElement(proposalId)});
    return Nullifier(HashToBytes(h));
}

bool VerifyVoteCommitment(const VoteCommitment& commitment, uint8_t choice,
                          const VoterSecret& secret, ProposalId proposalId) {
    return ComputeVoteCommitment(choice, secret, proposalId) == commitment;
}

} // namespace ballot
} // namespace zkvote
