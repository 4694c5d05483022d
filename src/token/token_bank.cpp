// AGORA - Token Bank Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/token/token_bank.h"

namespace agora {
namespace token {

Status InMemoryTokenBank::TransferFrom(const AccountId& account, Amount amount) {
    if (amount <= 0) {
        return Status::InvalidAmount("transfer amount must be positive");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    if (it == balances_.end() || it->second < amount) {
        return Status::InsufficientBalance("account " + account.ToHex().substr(0, 12) +
                                           " cannot cover " + std::to_string(amount));
    }
    it->second -= amount;
    custody_ += amount;
    return Status::Ok();
}

Status InMemoryTokenBank::TransferTo(const AccountId& account, Amount amount) {
    if (amount <= 0) {
        return Status::InvalidAmount("transfer amount must be positive");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (custody_ < amount) {
        return Status::InsufficientBalance("custody cannot cover " + std::to_string(amount));
    }
    custody_ -= amount;
    balances_[account] += amount;
    return Status::Ok();
}

Amount InMemoryTokenBank::BalanceOf(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

void InMemoryTokenBank::Mint(const AccountId& account, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[account] += amount;
}

void InMemoryTokenBank::FundCustody(Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    custody_ += amount;
}

Amount InMemoryTokenBank::CustodyBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custody_;
}

Amount InMemoryTokenBank::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = custody_;
    for (const auto& [account, balance] : balances_) {
        total += balance;
    }
    return total;
}

} // namespace token
} // namespace agora
