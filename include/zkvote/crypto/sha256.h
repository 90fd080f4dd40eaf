// ZKVOTE - SHA256 Hash Function
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP interface.

#ifndef ZKVOTE_CRYPTO_SHA256_H
#define ZKVOTE_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include "zkvote/core/types.h"

namespace zkvote {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write OUTPUT_SIZE bytes to hash.
    /// The hasher must be Reset() before further use.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace zkvote

#endif // ZKVOTE_CRYPTO_SHA256_H
