// AGORA - Reward Distributor Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/staking/reward_distributor.h"
#include "agora/core/serialize.h"
#include "agora/util/logging.h"

#include <sstream>

namespace agora {
namespace staking {

// ============================================================================
// RewardIndex Implementation
// ============================================================================

std::vector<Byte> RewardIndex::Serialize() const {
    DataStream ss;
    ss << globalIndex << totalStaked << remainder << withheldIncome << totalIncome;
    return ss.Data();
}

std::optional<RewardIndex> RewardIndex::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    
    try {
        DataStream ss(data, len);
        RewardIndex index;
        ss >> index.globalIndex >> index.totalStaked >> index.remainder
           >> index.withheldIncome >> index.totalIncome;
        if (!ss.empty() || !MoneyRange(index.totalStaked) ||
            !MoneyRange(index.totalIncome) || index.withheldIncome < 0 ||
            index.withheldIncome > index.totalIncome) {
            return std::nullopt;
        }
        return index;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string RewardIndex::ToString() const {
    std::ostringstream ss;
    ss << "RewardIndex { index: " << Uint128ToString(globalIndex)
       << ", staked: " << totalStaked
       << ", withheld: " << withheldIncome
       << ", income: " << totalIncome
       << " }";
    return ss.str();
}

// ============================================================================
// RewardDistributor Implementation
// ============================================================================

RewardDistributor::RewardDistributor(RewardIndex& index) : index_(index) {}

Status RewardDistributor::DepositIncome(Amount amount) {
    if (!MoneyRange(amount)) {
        return Status::InvalidAmount("income out of range");
    }
    if (amount == 0) {
        return Status::Ok();
    }
    if (index_.totalIncome > MAX_MONEY - amount) {
        LOG_DEBUG(util::LogCategory::REWARD) << "Rejected income of " << amount
                                             << " on top of " << index_.totalIncome;
        return Status::InvalidAmount("cumulative income would exceed the money range");
    }
    
    index_.totalIncome += amount;
    
    if (index_.totalStaked == 0) {
        index_.withheldIncome += amount;
        LOG_DEBUG(util::LogCategory::REWARD) << "No stakers, withholding " << amount
                                             << " (total withheld " << index_.withheldIncome << ")";
        return Status::NoStakers("income withheld until the first stake");
    }
    
    Accrue(amount);
    LOG_DEBUG(util::LogCategory::REWARD) << "Accrued " << amount << " over "
                                         << index_.totalStaked << " staked, index now "
                                         << Uint128ToString(index_.globalIndex);
    return Status::Ok();
}

void RewardDistributor::ReleaseWithheld() {
    if (index_.withheldIncome == 0 || index_.totalStaked == 0) {
        return;
    }
    Amount released = index_.withheldIncome;
    index_.withheldIncome = 0;
    Accrue(released);
    LOG_INFO(util::LogCategory::REWARD) << "Released " << released << " withheld income to "
                                        << index_.totalStaked << " staked";
}

void RewardDistributor::Accrue(Amount amount) {
    uint128_t numerator = static_cast<uint128_t>(amount) * REWARD_INDEX_SCALE + index_.remainder;
    uint128_t denominator = static_cast<uint128_t>(index_.totalStaked);
    index_.globalIndex += numerator / denominator;
    index_.remainder = numerator % denominator;
}

// Cumulative income stays within MAX_MONEY, so stake * delta / SCALE does too
Amount RewardDistributor::AccruedBetween(Amount stake, uint128_t fromIndex, uint128_t toIndex) {
    if (stake <= 0 || toIndex <= fromIndex) {
        return 0;
    }
    uint128_t delta = toIndex - fromIndex;
    return static_cast<Amount>(static_cast<uint128_t>(stake) * delta / REWARD_INDEX_SCALE);
}

void RewardDistributor::AddStake(Amount amount) {
    index_.totalStaked += amount;
}

void RewardDistributor::RemoveStake(Amount amount) {
    index_.totalStaked -= amount;
    if (index_.totalStaked == 0) {
        // Carry belongs to a denominator that no longer exists
        index_.remainder = 0;
    }
}

} // namespace staking
} // namespace agora
