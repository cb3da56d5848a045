// CHAMA - Value Transfer
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Moves value between accounts on behalf of an engine. The native asset is
// identified by the null asset address.

#ifndef CHAMA_GROUP_TRANSFER_H
#define CHAMA_GROUP_TRANSFER_H

#include "chama/core/types.h"

#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace chama {
namespace group {

/// Custody interface used by engines for inbound pulls and outbound payments
class ValueTransfer {
public:
    virtual ~ValueTransfer() = default;

    /// Pull amount of asset from an account into custody
    virtual bool Deposit(const Address& from, const Address& custody,
                         const Address& asset, Amount amount) = 0;

    /// Pay amount of asset out of custody to an account
    virtual bool Withdraw(const Address& custody, const Address& to,
                          const Address& asset, Amount amount) = 0;
};

/**
 * In-memory balance book.
 *
 * Transfers fail when the source lacks funds. An optional hook runs after
 * every successful withdrawal, before Withdraw returns; it stands in for a
 * recipient that calls back into the engine.
 */
class LedgerTransfer : public ValueTransfer {
public:
    using WithdrawHook = std::function<void(const Address& to, Amount amount)>;

    bool Deposit(const Address& from, const Address& custody,
                 const Address& asset, Amount amount) override;

    bool Withdraw(const Address& custody, const Address& to,
                  const Address& asset, Amount amount) override;

    /// Mint funds into an account
    void Credit(const Address& account, const Address& asset, Amount amount);

    Amount Balance(const Address& account, const Address& asset = Address()) const;

    void SetWithdrawHook(WithdrawHook hook) { hook_ = std::move(hook); }

    /// Refuse every subsequent transfer
    void SetFailing(bool failing) { failing_ = failing; }

private:
    bool Move(const Address& from, const Address& to, const Address& asset, Amount amount);

    std::map<std::pair<Address, Address>, Amount> balances_;
    WithdrawHook hook_;
    bool failing_{false};
    mutable std::mutex mutex_;
};

} // namespace group
} // namespace chama

#endif // CHAMA_GROUP_TRANSFER_H
