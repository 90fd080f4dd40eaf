// ZKVOTE - Core Types Header
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// This file defines fundamental types used throughout ZKVOTE.

#ifndef ZKVOTE_CORE_TYPES_H
#define ZKVOTE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace zkvote {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Caller-chosen proposal identifier
using ProposalId = uint64_t;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque byte string. Hex form follows storage order.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    const std::array<Byte, SIZE>& bytes() const noexcept { return data_; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic, so ordering matches database key order
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex, first byte first
    std::string ToHex() const;

    /// Parse exactly SIZE bytes of hex
    /// @throws std::invalid_argument on malformed input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit value (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// Principal (account public key) that creates, votes, reveals or finalizes
class AccountId : public Hash256 {
public:
    using Hash256::Hash256;
    AccountId() = default;
    explicit AccountId(const Hash256& h) : Hash256(h) {}

    static AccountId FromHex(const std::string& hex) {
        return AccountId(Hash256::FromHex(hex));
    }
};

/// Opaque handle naming the credential whose balance gates eligibility
class CredentialRef : public Hash256 {
public:
    using Hash256::Hash256;
    CredentialRef() = default;
    explicit CredentialRef(const Hash256& h) : Hash256(h) {}

    static CredentialRef FromHex(const std::string& hex) {
        return CredentialRef(Hash256::FromHex(hex));
    }
};

/// One-time value derived from a voter secret and a proposal id
class Nullifier : public Hash256 {
public:
    using Hash256::Hash256;
    Nullifier() = default;
    explicit Nullifier(const Hash256& h) : Hash256(h) {}

    static Nullifier FromHex(const std::string& hex) {
        return Nullifier(Hash256::FromHex(hex));
    }
};

/// Hiding, binding stand-in for a vote choice
class VoteCommitment : public Hash256 {
public:
    using Hash256::Hash256;
    VoteCommitment() = default;
    explicit VoteCommitment(const Hash256& h) : Hash256(h) {}

    static VoteCommitment FromHex(const std::string& hex) {
        return VoteCommitment(Hash256::FromHex(hex));
    }
};

/// Private voter secret, disclosed only at reveal time
class VoterSecret : public Hash256 {
public:
    using Hash256::Hash256;
    VoterSecret() = default;
    explicit VoterSecret(const Hash256& h) : Hash256(h) {}

    static VoterSecret FromHex(const std::string& hex) {
        return VoterSecret(Hash256::FromHex(hex));
    }
};

} // namespace zkvote

#endif // ZKVOTE_CORE_TYPES_H
