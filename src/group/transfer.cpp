// CHAMA - Value Transfer Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/group/transfer.h"
#include "chama/util/logging.h"

namespace chama {
namespace group {

bool LedgerTransfer::Move(const Address& from, const Address& to,
                          const Address& asset, Amount amount) {
    if (amount < 0 || !MoneyRange(amount)) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_) return false;

    Amount& src = balances_[{from, asset}];
    if (src < amount) return false;
    src -= amount;
    balances_[{to, asset}] += amount;
    return true;
}

bool LedgerTransfer::Deposit(const Address& from, const Address& custody,
                             const Address& asset, Amount amount) {
    if (!Move(from, custody, asset, amount)) {
        LOG_DEBUG(util::LogCategory::CONTRIB) << "Deposit of " << FormatAmount(amount)
                                              << " from " << from.ToString() << " refused";
        return false;
    }
    return true;
}

bool LedgerTransfer::Withdraw(const Address& custody, const Address& to,
                              const Address& asset, Amount amount) {
    if (!Move(custody, to, asset, amount)) {
        LOG_WARN(util::LogCategory::PAYOUT) << "Withdrawal of " << FormatAmount(amount)
                                            << " to " << to.ToString() << " refused";
        return false;
    }
    // Invoked without the lock so the hook may transfer again
    if (hook_) hook_(to, amount);
    return true;
}

void LedgerTransfer::Credit(const Address& account, const Address& asset, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[{account, asset}] += amount;
}

Amount LedgerTransfer::Balance(const Address& account, const Address& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find({account, asset});
    return it == balances_.end() ? 0 : it->second;
}

} // namespace group
} // namespace chama
