// ZKVOTE - Finite Field Arithmetic Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/crypto/field.h"
#include "zkvote/core/hex.h"

#include <openssl/bn.h>

#include <memory>
#include <new>
#include <stdexcept>

namespace zkvote {

const char* const FieldElement::MODULUS_HEX =
    "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001";

// ============================================================================
// BIGNUM helpers
// ============================================================================

namespace {

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

BN_CTX* ThreadContext() {
    thread_local std::unique_ptr<BN_CTX, BnCtxDeleter> ctx(BN_CTX_new());
    if (!ctx) {
        throw std::bad_alloc();
    }
    return ctx.get();
}

const BIGNUM* Modulus() {
    static const BnPtr modulus = [] {
        BIGNUM* bn = nullptr;
        if (BN_hex2bn(&bn, FieldElement::MODULUS_HEX) == 0) {
            throw std::runtime_error("BN_hex2bn(modulus) failed");
        }
        return BnPtr(bn);
    }();
    return modulus.get();
}

BnPtr NewBn() {
    BnPtr bn(BN_new());
    if (!bn) {
        throw std::bad_alloc();
    }
    return bn;
}

BnPtr BytesToBn(const Byte* data, size_t len) {
    BnPtr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) {
        throw std::bad_alloc();
    }
    return bn;
}

void BnToBytes(const BIGNUM* bn, std::array<Byte, FieldElement::SIZE>& out) {
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != static_cast<int>(out.size())) {
        throw std::runtime_error("BN_bn2binpad: value does not fit in 32 bytes");
    }
}

using ModOp = int (*)(BIGNUM*, const BIGNUM*, const BIGNUM*, const BIGNUM*, BN_CTX*);

std::array<Byte, FieldElement::SIZE> Apply(ModOp op,
                                           const std::array<Byte, FieldElement::SIZE>& a,
                                           const std::array<Byte, FieldElement::SIZE>& b) {
    BnPtr x = BytesToBn(a.data(), a.size());
    BnPtr y = BytesToBn(b.data(), b.size());
    BnPtr r = NewBn();
    if (op(r.get(), x.get(), y.get(), Modulus(), ThreadContext()) != 1) {
        throw std::runtime_error("BIGNUM modular arithmetic failed");
    }
    std::array<Byte, FieldElement::SIZE> out;
    BnToBytes(r.get(), out);
    return out;
}

} // anonymous namespace

// ============================================================================
// FieldElement Implementation
// ============================================================================

FieldElement::FieldElement() {
    bytes_.fill(0);
}

FieldElement::FieldElement(uint64_t val) {
    bytes_.fill(0);
    for (size_t i = 0; i < 8; ++i) {
        bytes_[SIZE - 1 - i] = static_cast<Byte>(val >> (8 * i));
    }
}

FieldElement FieldElement::Zero() {
    return FieldElement();
}

FieldElement FieldElement::One() {
    return FieldElement(uint64_t{1});
}

FieldElement FieldElement::FromBytes(const Byte* data, size_t len) {
    BnPtr x = BytesToBn(data, len);
    BnPtr r = NewBn();
    if (BN_nnmod(r.get(), x.get(), Modulus(), ThreadContext()) != 1) {
        throw std::runtime_error("BN_nnmod failed");
    }
    FieldElement fe;
    BnToBytes(r.get(), fe.bytes_);
    return fe;
}

std::optional<FieldElement> FieldElement::FromCanonicalBytes(const std::array<Byte, SIZE>& data) {
    BnPtr x = BytesToBn(data.data(), data.size());
    if (BN_cmp(x.get(), Modulus()) >= 0) {
        return std::nullopt;
    }
    FieldElement fe;
    fe.bytes_ = data;
    return fe;
}

FieldElement FieldElement::FromHex(const std::string& hex) {
    std::vector<uint8_t> raw = HexToBytes(hex);
    return FromBytes(raw.data(), raw.size());
}

std::string FieldElement::ToHex() const {
    return BytesToHex(bytes_);
}

bool FieldElement::IsZero() const {
    for (Byte b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

FieldElement FieldElement::operator+(const FieldElement& other) const {
    FieldElement r;
    r.bytes_ = Apply(BN_mod_add, bytes_, other.bytes_);
    return r;
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
    FieldElement r;
    r.bytes_ = Apply(BN_mod_sub, bytes_, other.bytes_);
    return r;
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
    FieldElement r;
    r.bytes_ = Apply(BN_mod_mul, bytes_, other.bytes_);
    return r;
}

FieldElement& FieldElement::operator+=(const FieldElement& other) {
    bytes_ = Apply(BN_mod_add, bytes_, other.bytes_);
    return *this;
}

FieldElement& FieldElement::operator*=(const FieldElement& other) {
    bytes_ = Apply(BN_mod_mul, bytes_, other.bytes_);
    return *this;
}

FieldElement FieldElement::Square() const {
    return *this * *this;
}

FieldElement FieldElement::Inverse() const {
    if (IsZero()) {
        return Zero();
    }
    BnPtr x = BytesToBn(bytes_.data(), bytes_.size());
    BnPtr r = NewBn();
    if (BN_mod_inverse(r.get(), x.get(), Modulus(), ThreadContext()) == nullptr) {
        throw std::runtime_error("BN_mod_inverse failed");
    }
    FieldElement fe;
    BnToBytes(r.get(), fe.bytes_);
    return fe;
}

FieldElement FieldElement::PoseidonSbox() const {
    FieldElement x2 = Square();
    FieldElement x4 = x2.Square();
    return x4 * *this;
}

} // namespace zkvote
