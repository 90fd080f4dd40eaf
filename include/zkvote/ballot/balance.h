// ZKVOTE - Balance Source
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Independent balance lookup used to double-check eligibility alongside
// the zero-knowledge proof.

#ifndef ZKVOTE_BALLOT_BALANCE_H
#define ZKVOTE_BALLOT_BALANCE_H

#include "zkvote/core/types.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace zkvote {
namespace ballot {

class BalanceSource {
public:
    virtual ~BalanceSource() = default;

    /**
     * Balance of `credential` held by `voter`.
     * @return nullopt if the source cannot answer
     */
    virtual std::optional<uint64_t> BalanceOf(const AccountId& voter,
                                              const CredentialRef& credential) = 0;
};

/// In-process balances. Unknown holders have a balance of zero.
class MemoryBalanceSource : public BalanceSource {
public:
    std::optional<uint64_t> BalanceOf(const AccountId& voter,
                                      const CredentialRef& credential) override;

    void SetBalance(const AccountId& voter, const CredentialRef& credential, uint64_t amount);

    /// While set, every lookup reports the source as unavailable
    void SetUnavailable(bool unavailable);

    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<AccountId, CredentialRef>, uint64_t> balances_;
    bool unavailable_{false};
};

/// A parsed "<account-hex>:<credential-hex>:<amount>" entry
struct BalanceEntry {
    AccountId account;
    CredentialRef credential;
    uint64_t amount{0};
};

std::optional<BalanceEntry> ParseBalanceEntry(const std::string& str);

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_BALANCE_H
