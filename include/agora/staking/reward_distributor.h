// AGORA - Reward Distributor
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Accrues income into a global reward-per-share index. Depositing income
// is O(1) in the number of stakers; each staker settles lazily against
// the index the next time their stake is touched.

#ifndef AGORA_STAKING_REWARD_DISTRIBUTOR_H
#define AGORA_STAKING_REWARD_DISTRIBUTOR_H

#include "agora/core/status.h"
#include "agora/core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace staking {

// ============================================================================
// Constants
// ============================================================================

/// Fixed-point scale of the reward index (10^18)
constexpr uint128_t REWARD_INDEX_SCALE = static_cast<uint128_t>(1000000000000000000ULL);

// ============================================================================
// Reward Index
// ============================================================================

/**
 * Process-wide accumulator shared by every stake.
 *
 * globalIndex is reward per staked unit, scaled by REWARD_INDEX_SCALE.
 * It never decreases. remainder holds the scaled numerator left over
 * from the last division and is added to the next deposit.
 */
struct RewardIndex {
    uint128_t globalIndex{0};
    
    /// Denominator of the index: sum of all stake amounts
    Amount totalStaked{0};
    
    uint128_t remainder{0};
    
    /// Income received while nobody was staked
    Amount withheldIncome{0};
    
    /// Lifetime income accepted (including withheld)
    Amount totalIncome{0};
    
    std::vector<Byte> Serialize() const;
    static std::optional<RewardIndex> Deserialize(const Byte* data, size_t len);
    
    std::string ToString() const;
};

// ============================================================================
// Reward Distributor
// ============================================================================

class RewardDistributor {
public:
    /// The index is owned by the caller and outlives the distributor
    explicit RewardDistributor(RewardIndex& index);
    
    /**
     * Accrue income to all current stakers.
     *
     * Zero is a no-op. With nothing staked the income is withheld and the
     * call returns NoStakers; the withheld amount is released into the
     * index by the first stake. InvalidAmount if the amount, or the
     * lifetime income total, leaves the money range.
     */
    Status DepositIncome(Amount amount);
    
    /// Feed withheld income into the index once something is staked
    void ReleaseWithheld();
    
    /// Reward earned by stake between two index values
    static Amount AccruedBetween(Amount stake, uint128_t fromIndex, uint128_t toIndex);
    
    uint128_t GlobalIndex() const { return index_.globalIndex; }
    Amount TotalStaked() const { return index_.totalStaked; }
    Amount WithheldIncome() const { return index_.withheldIncome; }
    const RewardIndex& GetIndex() const { return index_; }
    
    /// Adjust the denominator; only the stake ledger calls these
    void AddStake(Amount amount);
    void RemoveStake(Amount amount);

private:
    /// Spread amount over totalStaked, carrying the remainder
    void Accrue(Amount amount);
    
    RewardIndex& index_;
};

} // namespace staking
} // namespace agora

#endif // AGORA_STAKING_REWARD_DISTRIBUTOR_H
