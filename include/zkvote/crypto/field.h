// ZKVOTE - Finite Field Arithmetic
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Arithmetic in the BN254 scalar field, the field over which the eligibility
// circuit, the gnark public witness and the Poseidon commitment are defined.
//
// p = 21888242871839275222246405745257275088548364400416034343698204186575808495617
//
// Elements are held in canonical form and encoded as 32 big-endian bytes,
// the same encoding gnark uses for public witness elements. Arithmetic is
// delegated to OpenSSL BIGNUM.

#ifndef ZKVOTE_CRYPTO_FIELD_H
#define ZKVOTE_CRYPTO_FIELD_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include "zkvote/core/types.h"

namespace zkvote {

// ============================================================================
// Field Element (BN254 scalar field)
// ============================================================================

class FieldElement {
public:
    /// Encoded size in bytes
    static constexpr size_t SIZE = 32;

    /// Field modulus, big-endian hex
    static const char* const MODULUS_HEX;

    /// Default constructor - zero
    FieldElement();

    /// Construct from a small integer
    explicit FieldElement(uint64_t val);

    static FieldElement Zero();
    static FieldElement One();

    /// Interpret big-endian bytes of any length as an integer, reduced mod p
    static FieldElement FromBytes(const Byte* data, size_t len);

    /// Accept exactly 32 big-endian bytes only if they encode a value < p
    static std::optional<FieldElement> FromCanonicalBytes(const std::array<Byte, SIZE>& data);

    /// Parse big-endian hex (optional 0x prefix), reduced mod p
    /// @throws std::invalid_argument on malformed hex
    static FieldElement FromHex(const std::string& hex);

    /// Canonical 32-byte big-endian encoding
    const std::array<Byte, SIZE>& ToBytes() const { return bytes_; }

    std::string ToHex() const;

    bool IsZero() const;

    bool operator==(const FieldElement& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const FieldElement& other) const { return bytes_ != other.bytes_; }

    FieldElement operator+(const FieldElement& other) const;
    FieldElement operator-(const FieldElement& other) const;
    FieldElement operator*(const FieldElement& other) const;

    FieldElement& operator+=(const FieldElement& other);
    FieldElement& operator*=(const FieldElement& other);

    FieldElement Square() const;

    /// Multiplicative inverse (returns 0 if this is 0)
    FieldElement Inverse() const;

    /// S-box for Poseidon: x^5
    FieldElement PoseidonSbox() const;

private:
    std::array<Byte, SIZE> bytes_;
};

} // namespace zkvote

#endif // ZKVOTE_CRYPTO_FIELD_H
