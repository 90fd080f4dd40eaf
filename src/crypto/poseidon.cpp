// ZKVOTE - Poseidon Hash Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/crypto/poseidon.h"
#include "zkvote/crypto/sha256.h"
#include "zkvote/core/serialize.h"

#include <array>
#include <cstring>
#include <map>
#include <mutex>

namespace zkvote {

namespace PoseidonParams {
    // width=4, capacity=1, rate=3; 8 full rounds, 56 partial rounds
    const PoseidonConfig CONFIG_3_1{4, 8, 56, 1};
}

// ============================================================================
// Constant Generation
// ============================================================================

namespace {

/// Round constants from a SHA256 chain seeded by a domain tag and the shape
std::vector<FieldElement> GenerateRoundConstants(size_t width, size_t totalRounds) {
    std::vector<FieldElement> constants;
    constants.reserve(width * totalRounds);

    const char* domain = "ZKVOTE_POSEIDON_RC";
    std::array<Byte, 8> widthBytes;
    std::array<Byte, 8> roundBytes;
    WriteBE64(widthBytes.data(), width);
    WriteBE64(roundBytes.data(), totalRounds);

    std::array<Byte, 32> seed;
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(domain), std::strlen(domain));
    hasher.Write(widthBytes.data(), widthBytes.size());
    hasher.Write(roundBytes.data(), roundBytes.size());
    hasher.Finalize(seed.data());

    for (uint64_t count = 0; count < width * totalRounds; ++count) {
        std::array<Byte, 8> counter;
        WriteBE64(counter.data(), count);

        std::array<Byte, 32> hash;
        hasher.Reset();
        hasher.Write(seed.data(), seed.size());
        hasher.Write(counter.data(), counter.size());
        hasher.Finalize(hash.data());

        constants.push_back(FieldElement::FromBytes(hash.data(), hash.size()));
        seed = hash;
    }

    return constants;
}

/// Cauchy matrix M[i][j] = 1 / (x_i + y_j) with x_i = i, y_j = width + j
std::vector<std::vector<FieldElement>> GenerateMDSMatrix(size_t width) {
    std::vector<std::vector<FieldElement>> mds(width, std::vector<FieldElement>(width));
    for (size_t i = 0; i < width; ++i) {
        for (size_t j = 0; j < width; ++j) {
            mds[i][j] = FieldElement(static_cast<uint64_t>(i + width + j)).Inverse();
        }
    }
    return mds;
}

} // anonymous namespace

std::shared_ptr<const PoseidonConstants> GetPoseidonConstants(const PoseidonConfig& config) {
    static std::mutex mutex;
    static std::map<PoseidonConfig, std::shared_ptr<const PoseidonConstants>> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(config);
    if (it != cache.end()) {
        return it->second;
    }

    auto constants = std::make_shared<PoseidonConstants>();
    auto flat = GenerateRoundConstants(config.width, config.totalRounds());
    constants->roundConstants.resize(config.totalRounds());
    size_t idx = 0;
    for (size_t r = 0; r < config.totalRounds(); ++r) {
        constants->roundConstants[r].assign(flat.begin() + idx, flat.begin() + idx + config.width);
        idx += config.width;
    }
    constants->mds = GenerateMDSMatrix(config.width);

    cache.emplace(config, constants);
    return constants;
}

// ============================================================================
// Poseidon Implementation
// ============================================================================

Poseidon::Poseidon() : Poseidon(PoseidonParams::CONFIG_3_1) {}

Poseidon::Poseidon(const PoseidonConfig& config)
    : config_(config)
    , constants_(GetPoseidonConstants(config))
    , state_(config.width, FieldElement::Zero())
    , absorbPos_(0)
    , squeezing_(false) {}

Poseidon& Poseidon::Reset() {
    state_.assign(config_.width, FieldElement::Zero());
    absorbPos_ = 0;
    squeezing_ = false;
    return *this;
}

void Poseidon::AddRoundConstants(size_t roundIdx) {
    const auto& rc = constants_->roundConstants[roundIdx];
    for (size_t i = 0; i < config_.width; ++i) {
        state_[i] += rc[i];
    }
}

void Poseidon::MixColumns() {
    std::vector<FieldElement> next(config_.width, FieldElement::Zero());
    for (size_t i = 0; i < config_.width; ++i) {
        for (size_t j = 0; j < config_.width; ++j) {
            next[i] += constants_->mds[i][j] * state_[j];
        }
    }
    state_ = std::move(next);
}

void Poseidon::FullRound(size_t roundIdx) {
    AddRoundConstants(roundIdx);
    for (auto& element : state_) {
        element = element.PoseidonSbox();
    }
    MixColumns();
}

void Poseidon::PartialRound(size_t roundIdx) {
    AddRoundConstants(roundIdx);
    state_[0] = state_[0].PoseidonSbox();
    MixColumns();
}

void Poseidon::Permute() {
    size_t roundIdx = 0;
    size_t halfFull = config_.fullRounds / 2;

    for (size_t i = 0; i < halfFull; ++i) {
        FullRound(roundIdx++);
    }
    for (size_t i = 0; i < config_.partialRounds; ++i) {
        PartialRound(roundIdx++);
    }
    for (size_t i = 0; i < halfFull; ++i) {
        FullRound(roundIdx++);
    }
}

Poseidon& Poseidon::Absorb(const FieldElement& element) {
    if (squeezing_) {
        Reset();
    }

    state_[absorbPos_] += element;
    ++absorbPos_;

    if (absorbPos_ >= config_.rate()) {
        Permute();
        absorbPos_ = 0;
    }

    return *this;
}

Poseidon& Poseidon::Absorb(const std::vector<FieldElement>& elements) {
    for (const auto& element : elements) {
        Absorb(element);
    }
    return *this;
}

FieldElement Poseidon::Squeeze() {
    if (!squeezing_) {
        if (absorbPos_ > 0) {
            Permute();
        }
        squeezing_ = true;
        absorbPos_ = 0;
    }

    FieldElement result = state_[absorbPos_];
    ++absorbPos_;

    if (absorbPos_ >= config_.rate()) {
        Permute();
        absorbPos_ = 0;
    }

    return result;
}

FieldElement Poseidon::Hash(const std::vector<FieldElement>& inputs) {
    Poseidon hasher;
    hasher.Absorb(inputs);
    return hasher.Squeeze();
}

} // namespace zkvote
