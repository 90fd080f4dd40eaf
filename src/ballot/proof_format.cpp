// ZKVOTE - Eligibility Proof Wire Format Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/proof_format.h"
#include "zkvote/core/serialize.h"

#include <algorithm>
#include <cstring>

namespace zkvote {
namespace ballot {

namespace {

constexpr uint32_t HEADER_PUBLIC = NUM_PUBLIC_INPUTS;
constexpr uint32_t HEADER_SECRET = 0;
constexpr uint32_t HEADER_LENGTH = NUM_PUBLIC_INPUTS;

FieldBytes ReadElement(const Byte* data) {
    FieldBytes out;
    std::memcpy(out.data(), data, FIELD_ELEMENT_SIZE);
    return out;
}

} // namespace

bool IsValidProofSize(const Proof& proof) {
    return proof.size() == PROOF_SIZE;
}

std::optional<PublicInputs> DecodePublicWitness(const PublicWitness& witness) {
    if (witness.size() != PUBLIC_WITNESS_SIZE) {
        return std::nullopt;
    }

    const Byte* p = witness.data();
    if (ReadBE32(p) != HEADER_PUBLIC ||
        ReadBE32(p + 4) != HEADER_SECRET ||
        ReadBE32(p + 8) != HEADER_LENGTH) {
        return std::nullopt;
    }
    p += PUBLIC_WITNESS_HEADER_SIZE;

    PublicInputs inputs;
    inputs.minThreshold = ReadElement(p);
    inputs.proposalId = ReadElement(p + FIELD_ELEMENT_SIZE);
    inputs.commitment = VoteCommitment(p + 2 * FIELD_ELEMENT_SIZE, FIELD_ELEMENT_SIZE);
    inputs.nullifier = Nullifier(p + 3 * FIELD_ELEMENT_SIZE, FIELD_ELEMENT_SIZE);
    return inputs;
}

PublicWitness EncodePublicWitness(const PublicInputs& inputs) {
    PublicWitness out(PUBLIC_WITNESS_SIZE, 0);
    Byte* p = out.data();

    WriteBE32(p, HEADER_PUBLIC);
    WriteBE32(p + 4, HEADER_SECRET);
    WriteBE32(p + 8, HEADER_LENGTH);
    p += PUBLIC_WITNESS_HEADER_SIZE;

    std::copy(inputs.minThreshold.begin(), inputs.minThreshold.end(), p);
    std::copy(inputs.proposalId.begin(), inputs.proposalId.end(), p + FIELD_ELEMENT_SIZE);
    std::copy(inputs.commitment.begin(), inputs.commitment.end(), p + 2 * FIELD_ELEMENT_SIZE);
    std::copy(inputs.nullifier.begin(), inputs.nullifier.end(), p + 3 * FIELD_ELEMENT_SIZE);
    return out;
}

FieldBytes EncodeU64Element(uint64_t value) {
    FieldBytes out{};
    WriteBE64(out.data() + FIELD_ELEMENT_SIZE - 8, value);
    return out;
}

std::optional<uint64_t> DecodeU64Element(const FieldBytes& element) {
    for (size_t i = 0; i < FIELD_ELEMENT_SIZE - 8; ++i) {
        if (element[i] != 0) {
            return std::nullopt;
        }
    }
    return ReadBE64(element.data() + FIELD_ELEMENT_SIZE - 8);
}

PublicInputs MakePublicInputs(uint64_t minThreshold, ProposalId proposalId,
                              const VoteCommitment& commitment,
                              const Nullifier& nullifier) {
    PublicInputs inputs;
    inputs.minThreshold = EncodeU64Element(minThreshold);
    inputs.proposalId = EncodeU64Element(proposalId);
    inputs.commitment = commitment;
    inputs.nullifier = nullifier;
    return inputs;
}

bool PublicInputsMatch(const PublicInputs& inputs, uint64_t minThreshold,
                       ProposalId proposalId, const VoteCommitment& commitment,
                       const Nullifier& nullifier) {
    return inputs.minThreshold == EncodeU64Element(minThreshold) &&
           inputs.proposalId == EncodeU64Element(proposalId) &&
           inputs.commitment == commitment &&
           inputs.nullifier == nullifier;
}

} // namespace ballot
} // namespace zkvote
