// STAKEVOTE - Token Ledger Implementation
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include "stakevote/ledger/ledger.h"
#include "stakevote/util/logging.h"

namespace stakevote {
namespace ledger {

namespace {

bool ValidAmount(Amount amount) {
    return amount > 0 && MoneyRange(amount);
}

} // namespace

TokenLedger::TokenLedger(const Address& custody) : custody_(custody) {}

bool TokenLedger::Mint(const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ValidAmount(amount) || totalSupply_ > MAX_MONEY - amount) {
        LOG_WARN(util::LogCategory::LEDGER) << "Mint of " << amount
                                            << " rejected (supply " << totalSupply_ << ")";
        return false;
    }

    balances_[to] += amount;
    totalSupply_ += amount;
    LOG_DEBUG(util::LogCategory::LEDGER) << "Minted " << amount << " to "
                                         << to.ToShortString();
    return true;
}

Amount TokenLedger::BalanceOf(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(owner);
    return it == balances_.end() ? 0 : it->second;
}

bool TokenLedger::Approve(const Address& owner, const Address& spender, Amount amount) {
    if (amount < 0 || !MoneyRange(amount)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (amount == 0) {
        allowances_.erase({owner, spender});
    } else {
        allowances_[{owner, spender}] = amount;
    }
    LOG_DEBUG(util::LogCategory::LEDGER) << owner.ToShortString() << " approved "
                                         << spender.ToShortString() << " for " << amount;
    return true;
}

Amount TokenLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

bool TokenLedger::TransferLocked(const Address& from, const Address& to, Amount amount) {
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }

    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    balances_[to] += amount;
    return true;
}

bool TokenLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    if (!ValidAmount(amount)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!TransferLocked(from, to, amount)) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Transfer of " << amount << " from "
                                             << from.ToShortString()
                                             << ": insufficient balance";
        return false;
    }
    return true;
}

bool TokenLedger::TransferFrom(const Address& spender, const Address& from,
                               const Address& to, Amount amount) {
    if (!ValidAmount(amount)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto allowance = allowances_.find({from, spender});
    if (allowance == allowances_.end() || allowance->second < amount) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "TransferFrom of " << amount << " from "
                                             << from.ToShortString()
                                             << ": insufficient allowance";
        return false;
    }

    if (!TransferLocked(from, to, amount)) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "TransferFrom of " << amount << " from "
                                             << from.ToShortString()
                                             << ": insufficient balance";
        return false;
    }

    allowance->second -= amount;
    if (allowance->second == 0) {
        allowances_.erase(allowance);
    }
    return true;
}

Amount TokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

bool TokenLedger::Debit(const Address& from, Amount amount) {
    return TransferFrom(custody_, from, custody_, amount);
}

bool TokenLedger::Credit(const Address& to, Amount amount) {
    return Transfer(custody_, to, amount);
}

bool TokenLedger::Reclaim(const Address& from, Amount amount) {
    return Transfer(from, custody_, amount);
}

LedgerSnapshot TokenLedger::Export() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSnapshot snapshot;
    snapshot.balances = balances_;
    snapshot.allowances = allowances_;
    snapshot.totalSupply = totalSupply_;
    return snapshot;
}

void TokenLedger::Restore(const LedgerSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_ = snapshot.balances;
    allowances_ = snapshot.allowances;
    totalSupply_ = snapshot.totalSupply;
    LOG_INFO(util::LogCategory::LEDGER) << "Restored ledger: " << balances_.size()
                                        << " balances, supply " << totalSupply_;
}

} // namespace ledger
} // namespace stakevote
