// AGORA - Stake Ledger
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Per-account staked balances and lifetime reward bookkeeping. Voting
// power and reward shares both derive from the balances kept here.

#ifndef AGORA_STAKING_STAKE_LEDGER_H
#define AGORA_STAKING_STAKE_LEDGER_H

#include "agora/core/status.h"
#include "agora/core/types.h"
#include "agora/staking/reward_distributor.h"
#include "agora/token/token_bank.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace staking {

// ============================================================================
// Stake
// ============================================================================

/**
 * One account's stake.
 *
 * Claimable reward is pendingReward plus the index delta since
 * rewardIndexSnapshot applied to amount.
 */
struct StakeInfo {
    AccountId account;
    
    /// Staked balance; changes only through Stake and Unstake
    Amount amount{0};
    
    /// Global index at the last settlement
    uint128_t rewardIndexSnapshot{0};
    
    /// Settled but unclaimed reward
    Amount pendingReward{0};
    
    /// Lifetime reward paid out
    Amount totalClaimed{0};
    
    std::vector<Byte> Serialize() const;
    static std::optional<StakeInfo> Deserialize(const Byte* data, size_t len);
    
    std::string ToString() const;
};

// ============================================================================
// Stake Ledger
// ============================================================================

class StakeLedger {
public:
    StakeLedger(RewardDistributor& distributor, token::ITokenBank& bank);
    
    /// Pull amount from the account's token balance into stake
    Status Stake(const AccountId& account, Amount amount);
    
    /**
     * Return amount of stake to the account's token balance.
     * @param locked Stake that must remain (power committed to open polls)
     */
    Status Unstake(const AccountId& account, Amount amount, Amount locked = 0);
    
    /// Unstake everything above the locked amount
    Status UnstakeAll(const AccountId& account, Amount locked = 0,
                      Amount* withdrawn = nullptr);
    
    /// Pending plus unsettled reward; does not mutate
    Amount ClaimableReward(const AccountId& account) const;
    
    /// Settle and pay out all reward; NothingToClaim when zero
    Status ClaimReward(const AccountId& account, Amount* claimed = nullptr);
    
    // === Queries ===
    
    Amount BalanceOf(const AccountId& account) const;
    std::optional<StakeInfo> GetStake(const AccountId& account) const;
    Amount TotalStaked() const { return distributor_.TotalStaked(); }
    size_t StakerCount() const;
    
    /// Sum of every stake amount, recomputed
    Amount SumOfStakes() const;
    
    // === Persistence ===
    
    std::vector<StakeInfo> GetAllStakes() const;
    
    /// Replace all stakes; Corruption if they disagree with the index total
    Status Restore(const std::vector<StakeInfo>& stakes);

private:
    /// Fold the index delta into pendingReward
    void Settle(StakeInfo& stake) const;
    
    RewardDistributor& distributor_;
    token::ITokenBank& bank_;
    std::map<AccountId, StakeInfo> stakes_;
};

} // namespace staking
} // namespace agora

#endif // AGORA_STAKING_STAKE_LEDGER_H
