// AGORA - Stake Ledger Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/staking/stake_ledger.h"
#include "agora/core/serialize.h"
#include "agora/util/logging.h"

#include <sstream>

namespace agora {
namespace staking {

namespace {

std::string ShortId(const AccountId& account) {
    return account.ToHex().substr(0, 12);
}

} // namespace

// ============================================================================
// StakeInfo Implementation
// ============================================================================

std::vector<Byte> StakeInfo::Serialize() const {
    DataStream ss;
    ss << account << amount << rewardIndexSnapshot << pendingReward << totalClaimed;
    return ss.Data();
}

std::optional<StakeInfo> StakeInfo::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }
    
    try {
        DataStream ss(data, len);
        StakeInfo stake;
        ss >> stake.account >> stake.amount >> stake.rewardIndexSnapshot
           >> stake.pendingReward >> stake.totalClaimed;
        if (!ss.empty() || stake.amount < 0 || stake.pendingReward < 0) {
            return std::nullopt;
        }
        return stake;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string StakeInfo::ToString() const {
    std::ostringstream ss;
    ss << "Stake { account: " << ShortId(account) << "..."
       << ", amount: " << amount
       << ", pending: " << pendingReward
       << ", claimed: " << totalClaimed
       << " }";
    return ss.str();
}

// ============================================================================
// StakeLedger Implementation
// ============================================================================

StakeLedger::StakeLedger(RewardDistributor& distributor, token::ITokenBank& bank)
    : distributor_(distributor), bank_(bank) {}

void StakeLedger::Settle(StakeInfo& stake) const {
    uint128_t current = distributor_.GlobalIndex();
    stake.pendingReward += RewardDistributor::AccruedBetween(
        stake.amount, stake.rewardIndexSnapshot, current);
    stake.rewardIndexSnapshot = current;
}

Status StakeLedger::Stake(const AccountId& account, Amount amount) {
    if (amount <= 0) {
        LOG_DEBUG(util::LogCategory::STAKE) << "Rejected stake of " << amount;
        return Status::InvalidAmount("stake amount must be positive");
    }
    if (!MoneyRange(amount) || TotalStaked() > MAX_MONEY - amount) {
        return Status::InvalidAmount("stake would exceed the money range");
    }
    
    Status s = bank_.TransferFrom(account, amount);
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::STAKE) << "Stake by " << ShortId(account)
                                            << " refused by bank: " << s.ToString();
        return s;
    }
    
    bool firstStake = TotalStaked() == 0;
    
    auto [it, inserted] = stakes_.try_emplace(account);
    StakeInfo& stake = it->second;
    if (inserted) {
        stake.account = account;
    }
    Settle(stake);
    stake.amount += amount;
    distributor_.AddStake(amount);
    
    if (firstStake) {
        distributor_.ReleaseWithheld();
    }
    
    LOG_INFO(util::LogCategory::STAKE) << ShortId(account) << " staked " << amount
                                       << " (balance " << stake.amount
                                       << ", total " << TotalStaked() << ")";
    return Status::Ok();
}

Status StakeLedger::Unstake(const AccountId& account, Amount amount, Amount locked) {
    if (amount <= 0) {
        return Status::InvalidAmount("unstake amount must be positive");
    }
    
    auto it = stakes_.find(account);
    Amount balance = it == stakes_.end() ? 0 : it->second.amount;
    if (amount > balance) {
        LOG_DEBUG(util::LogCategory::STAKE) << ShortId(account) << " cannot unstake " << amount
                                            << " of " << balance;
        return Status::InsufficientStake("requested " + std::to_string(amount) +
                                         ", staked " + std::to_string(balance));
    }
    if (balance - amount < locked) {
        LOG_DEBUG(util::LogCategory::STAKE) << ShortId(account) << " has " << locked
                                            << " locked by active polls";
        return Status::LockedByActivePoll("at most " + std::to_string(balance - locked) +
                                          " can be withdrawn while polls are open");
    }
    
    // Work on a copy so a refused payout leaves the ledger untouched
    StakeInfo updated = it->second;
    Settle(updated);
    updated.amount -= amount;
    
    Status s = bank_.TransferTo(account, amount);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STAKE) << "Payout of " << amount << " to "
                                            << ShortId(account) << " failed: " << s.ToString();
        return s;
    }
    
    it->second = updated;
    distributor_.RemoveStake(amount);
    
    LOG_INFO(util::LogCategory::STAKE) << ShortId(account) << " unstaked " << amount
                                       << " (balance " << updated.amount
                                       << ", total " << TotalStaked() << ")";
    return Status::Ok();
}

Status StakeLedger::UnstakeAll(const AccountId& account, Amount locked, Amount* withdrawn) {
    Amount balance = BalanceOf(account);
    if (balance == 0) {
        return Status::InsufficientStake("nothing staked");
    }
    Amount available = balance - locked;
    if (available <= 0) {
        return Status::LockedByActivePoll("entire stake is locked by active polls");
    }
    
    Status s = Unstake(account, available, locked);
    if (s.ok() && withdrawn) {
        *withdrawn = available;
    }
    return s;
}

Amount StakeLedger::ClaimableReward(const AccountId& account) const {
    auto it = stakes_.find(account);
    if (it == stakes_.end()) {
        return 0;
    }
    const StakeInfo& stake = it->second;
    return stake.pendingReward + RewardDistributor::AccruedBetween(
        stake.amount, stake.rewardIndexSnapshot, distributor_.GlobalIndex());
}

Status StakeLedger::ClaimReward(const AccountId& account, Amount* claimed) {
    auto it = stakes_.find(account);
    if (it == stakes_.end()) {
        return Status::NothingToClaim("no stake record");
    }
    
    StakeInfo updated = it->second;
    Settle(updated);
    Amount reward = updated.pendingReward;
    if (reward == 0) {
        return Status::NothingToClaim();
    }
    
    Status s = bank_.TransferTo(account, reward);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::REWARD) << "Reward payout of " << reward << " to "
                                             << ShortId(account) << " failed: " << s.ToString();
        return s;
    }
    
    updated.pendingReward = 0;
    updated.totalClaimed += reward;
    it->second = updated;
    
    if (claimed) {
        *claimed = reward;
    }
    LOG_INFO(util::LogCategory::REWARD) << ShortId(account) << " claimed " << reward;
    return Status::Ok();
}

Amount StakeLedger::BalanceOf(const AccountId& account) const {
    auto it = stakes_.find(account);
    return it == stakes_.end() ? 0 : it->second.amount;
}

std::optional<StakeInfo> StakeLedger::GetStake(const AccountId& account) const {
    auto it = stakes_.find(account);
    if (it == stakes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t StakeLedger::StakerCount() const {
    size_t count = 0;
    for (const auto& [account, stake] : stakes_) {
        if (stake.amount > 0) {
            ++count;
        }
    }
    return count;
}

Amount StakeLedger::SumOfStakes() const {
    Amount sum = 0;
    for (const auto& [account, stake] : stakes_) {
        sum += stake.amount;
    }
    return sum;
}

std::vector<StakeInfo> StakeLedger::GetAllStakes() const {
    std::vector<StakeInfo> result;
    result.reserve(stakes_.size());
    for (const auto& [account, stake] : stakes_) {
        result.push_back(stake);
    }
    return result;
}

Status StakeLedger::Restore(const std::vector<StakeInfo>& stakes) {
    std::map<AccountId, StakeInfo> restored;
    Amount sum = 0;
    for (const auto& stake : stakes) {
        if (stake.rewardIndexSnapshot > distributor_.GlobalIndex()) {
            return Status::Corruption("stake snapshot ahead of the global index");
        }
        if (!restored.emplace(stake.account, stake).second) {
            return Status::Corruption("duplicate stake for " + ShortId(stake.account));
        }
        sum += stake.amount;
    }
    if (sum != distributor_.TotalStaked()) {
        return Status::Corruption("stakes sum to " + std::to_string(sum) +
                                  " but the index records " +
                                  std::to_string(distributor_.TotalStaked()));
    }
    stakes_ = std::move(restored);
    return Status::Ok();
}

} // namespace staking
} // namespace agora
