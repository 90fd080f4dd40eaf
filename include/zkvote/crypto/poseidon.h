// ZKVOTE - Poseidon Hash Function
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// ZK-friendly algebraic hash function over the BN254 scalar field
// Based on: "Poseidon: A New Hash Function for Zero-Knowledge Proof Systems"
// https://eprint.iacr.org/2019/458

#ifndef ZKVOTE_CRYPTO_POSEIDON_H
#define ZKVOTE_CRYPTO_POSEIDON_H

#include <cstdint>
#include <memory>
#include <vector>
#include "zkvote/crypto/field.h"
#include "zkvote/core/types.h"

namespace zkvote {

// ============================================================================
// Poseidon Configuration
// ============================================================================

struct PoseidonConfig {
    /// State width (t)
    size_t width;

    /// Number of full rounds (R_F)
    size_t fullRounds;

    /// Number of partial rounds (R_P)
    size_t partialRounds;

    /// Capacity
    size_t capacity;

    size_t rate() const { return width - capacity; }
    size_t totalRounds() const { return fullRounds + partialRounds; }

    bool operator<(const PoseidonConfig& o) const {
        if (width != o.width) return width < o.width;
        if (fullRounds != o.fullRounds) return fullRounds < o.fullRounds;
        if (partialRounds != o.partialRounds) return partialRounds < o.partialRounds;
        return capacity < o.capacity;
    }
};

namespace PoseidonParams {
    /// 3-to-1 hash used for vote commitments and nullifiers
    /// (width=4, capacity=1, rate=3)
    extern const PoseidonConfig CONFIG_3_1;
}

/// Round constants and MDS matrix for one configuration
struct PoseidonConstants {
    std::vector<std::vector<FieldElement>> roundConstants;
    std::vector<std::vector<FieldElement>> mds;
};

// ============================================================================
// Poseidon Hash Class
// ============================================================================

/// Poseidon sponge over the BN254 scalar field (Hades design, x^5 S-box).
/// Constants are derived once per configuration and shared between hashers.
class Poseidon {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Create hasher with the 3-to-1 configuration
    Poseidon();

    explicit Poseidon(const PoseidonConfig& config);

    Poseidon& Reset();

    /// Absorb a field element into the sponge
    Poseidon& Absorb(const FieldElement& element);

    Poseidon& Absorb(const std::vector<FieldElement>& elements);

    /// Squeeze one field element from the sponge
    FieldElement Squeeze();

    /// Hash a vector of field elements to a single field element
    static FieldElement Hash(const std::vector<FieldElement>& inputs);

private:
    PoseidonConfig config_;
    std::shared_ptr<const PoseidonConstants> constants_;
    std::vector<FieldElement> state_;
    size_t absorbPos_;
    bool squeezing_;

    void Permute();
    void FullRound(size_t roundIdx);
    void PartialRound(size_t roundIdx);
    void AddRoundConstants(size_t roundIdx);
    void MixColumns();
};

/// Derive (or fetch the cached) constants for a configuration
std::shared_ptr<const PoseidonConstants> GetPoseidonConstants(const PoseidonConfig& config);

} // namespace zkvote

#endif // ZKVOTE_CRYPTO_POSEIDON_H
