// ZKVOTE - Balance Source Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/balance.h"
#include "zkvote/core/hex.h"

#include <cctype>
#include <limits>

namespace zkvote {
namespace ballot {

std::optional<uint64_t> MemoryBalanceSource::BalanceOf(const AccountId& voter,
                                                       const CredentialRef& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unavailable_) {
        return std::nullopt;
    }
    auto it = balances_.find({voter, credential});
    if (it == balances_.end()) {
        return uint64_t{0};
    }
    return it->second;
}

void MemoryBalanceSource::SetBalance(const AccountId& voter, const CredentialRef& credential,
                                     uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[{voter, credential}] = amount;
}

void MemoryBalanceSource::SetUnavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

size_t MemoryBalanceSource::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_.size();
}

namespace {

std::optional<Hash256> ParseHash(const std::string& hex) {
    auto bytes = TryHexToBytes(hex);
    if (!bytes || bytes->size() != Hash256::SIZE) {
        return std::nullopt;
    }
    return Hash256(bytes->data(), bytes->size());
}

std::optional<uint64_t> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace

std::optional<BalanceEntry> ParseBalanceEntry(const std::string& str) {
    size_t first = str.find(':');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    size_t second = str.find(':', first + 1);
    if (second == std::string::npos) {
        return std::nullopt;
    }

    auto account = ParseHash(str.substr(0, first));
    auto credential = ParseHash(str.substr(first + 1, second - first - 1));
    auto amount = ParseAmount(str.substr(second + 1));
    if (!account || !credential || !amount) {
        return std::nullopt;
    }

    BalanceEntry entry;
    entry.account = AccountId(*account);
    entry.credential = CredentialRef(*credential);
    entry.amount = *amount;
    return entry;
}

} // namespace ballot
} // namespace zkvote
