// STAKEVOTE - Token Ledger
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// The fungible-token collaborator used by the voting engine, and an
// in-memory reference ledger with balances and allowances.

#ifndef STAKEVOTE_LEDGER_LEDGER_H
#define STAKEVOTE_LEDGER_LEDGER_H

#include "stakevote/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stakevote {
namespace ledger {

// ============================================================================
// Ledger Snapshot
// ============================================================================

/// Full ledger contents, used by the state store
struct LedgerSnapshot {
    std::map<Address, Amount> balances;
    std::map<std::pair<Address, Address>, Amount> allowances;  // (owner, spender)
    Amount totalSupply{0};
};

// ============================================================================
// Ledger Collaborator Interface
// ============================================================================

/**
 * Token movements the voting engine needs from a fungible-token ledger.
 *
 * Both calls are all-or-nothing: on false no balance or allowance changed.
 */
class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    /// Pull amount from 'from' into the custody account, spending the
    /// allowance 'from' granted to custody
    virtual bool Debit(const Address& from, Amount amount) = 0;

    /// Pay amount out of the custody account to 'to'
    virtual bool Credit(const Address& to, Amount amount) = 0;

    /// Take back a credit whose state commit failed, without an allowance
    virtual bool Reclaim(const Address& from, Amount amount) = 0;

    /// Contents to commit in the same batch as the engine's state change.
    /// Ledgers that persist themselves elsewhere return nullopt.
    virtual std::optional<LedgerSnapshot> Checkpoint() const { return std::nullopt; }
};

// ============================================================================
// Reference Token Ledger
// ============================================================================

/**
 * In-memory token ledger with approve / transferFrom semantics.
 *
 * Every method takes the ledger lock for its whole duration and never calls
 * out, so a debit or credit cannot re-enter the engine.
 */
class TokenLedger : public ITokenLedger {
public:
    explicit TokenLedger(const Address& custody);

    /// Create new tokens
    bool Mint(const Address& to, Amount amount);

    Amount BalanceOf(const Address& owner) const;

    /// Set (not add to) the allowance owner grants spender; 0 revokes
    bool Approve(const Address& owner, const Address& spender, Amount amount);

    Amount Allowance(const Address& owner, const Address& spender) const;

    bool Transfer(const Address& from, const Address& to, Amount amount);

    /// Move funds on behalf of 'from', consuming spender's allowance
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, Amount amount);

    Amount TotalSupply() const;

    const Address& GetCustody() const { return custody_; }

    // ITokenLedger
    bool Debit(const Address& from, Amount amount) override;
    bool Credit(const Address& to, Amount amount) override;
    bool Reclaim(const Address& from, Amount amount) override;
    std::optional<LedgerSnapshot> Checkpoint() const override { return Export(); }

    LedgerSnapshot Export() const;
    void Restore(const LedgerSnapshot& snapshot);

private:
    bool TransferLocked(const Address& from, const Address& to, Amount amount);

    const Address custody_;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount totalSupply_{0};
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace stakevote

#endif // STAKEVOTE_LEDGER_LEDGER_H
