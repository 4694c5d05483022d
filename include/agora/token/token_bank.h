// AGORA - Token Bank
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Boundary to the governance token. The governance contract holds a
// custody balance: stakes, poll deposits and income sit there until
// paid back out.

#ifndef AGORA_TOKEN_TOKEN_BANK_H
#define AGORA_TOKEN_TOKEN_BANK_H

#include "agora/core/status.h"
#include "agora/core/types.h"

#include <map>
#include <mutex>

namespace agora {
namespace token {

/**
 * Token movements between accounts and the contract's custody.
 * Each call either fully applies or reports an error and changes nothing.
 */
class ITokenBank {
public:
    virtual ~ITokenBank() = default;
    
    /// Move amount from account into custody; InsufficientBalance if refused
    virtual Status TransferFrom(const AccountId& account, Amount amount) = 0;
    
    /// Move amount from custody to account
    virtual Status TransferTo(const AccountId& account, Amount amount) = 0;
    
    /// Spendable balance of an account
    virtual Amount BalanceOf(const AccountId& account) const = 0;
};

/**
 * Map-backed bank used by tests and embedders without a ledger of their own.
 */
class InMemoryTokenBank : public ITokenBank {
public:
    InMemoryTokenBank() = default;
    
    Status TransferFrom(const AccountId& account, Amount amount) override;
    Status TransferTo(const AccountId& account, Amount amount) override;
    Amount BalanceOf(const AccountId& account) const override;
    
    /// Create tokens in an account
    void Mint(const AccountId& account, Amount amount);
    
    /// Credit custody directly, as a fee forwarder sending income would
    void FundCustody(Amount amount);
    
    /// Tokens currently held by the contract
    Amount CustodyBalance() const;
    
    /// Sum over all accounts plus custody
    Amount TotalSupply() const;

private:
    mutable std::mutex mutex_;
    std::map<AccountId, Amount> balances_;
    Amount custody_{0};
};

} // namespace token
} // namespace agora

#endif // AGORA_TOKEN_TOKEN_BANK_H
