// AGORA - Governance Contract
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Single entry point owning all governance state: staking, rewards,
// polls, votes, execution, parameters and the current height. Every call
// is serialised by one mutex and either completes or leaves state as it
// was.

#ifndef AGORA_GOVERNANCE_GOVERNANCE_H
#define AGORA_GOVERNANCE_GOVERNANCE_H

#include "agora/core/status.h"
#include "agora/core/types.h"
#include "agora/governance/execution_engine.h"
#include "agora/governance/params.h"
#include "agora/governance/poll.h"
#include "agora/governance/poll_registry.h"
#include "agora/staking/reward_distributor.h"
#include "agora/staking/stake_ledger.h"
#include "agora/token/token_bank.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace governance {

// ============================================================================
// Query Results
// ============================================================================

struct StakerInfo {
    AccountId account;
    Amount balance{0};
    
    /// Part of balance held by votes on open polls
    Amount locked{0};
    
    Amount claimable{0};
    Amount totalClaimed{0};
    
    std::string ToString() const;
};

struct RewardState {
    uint128_t globalIndex{0};
    Amount totalStaked{0};
    Amount withheldIncome{0};
    Amount totalIncome{0};
};

/// Everything needed to rebuild a contract
struct GovernanceState {
    GovernanceParams params;
    Height height{0};
    PollId nextPollId{1};
    staking::RewardIndex rewardIndex;
    std::vector<staking::StakeInfo> stakes;
    std::vector<Poll> polls;
    std::vector<Vote> votes;
};

// ============================================================================
// Governance Contract
// ============================================================================

class GovernanceContract {
public:
    /**
     * @param bank Token custody for stakes, deposits and rewards
     * @param host Receiver of messages for owned contracts (may be null)
     */
    GovernanceContract(const GovernanceParams& params,
                       token::ITokenBank& bank,
                       IExecutionHost* host = nullptr,
                       Height height = 0);
    
    GovernanceContract(const GovernanceContract&) = delete;
    GovernanceContract& operator=(const GovernanceContract&) = delete;
    
    // ========================================================================
    // Staking
    // ========================================================================
    
    Status Stake(const AccountId& account, Amount amount);
    
    /// Refused with LockedByActivePoll while the lock policy holds the amount
    Status Unstake(const AccountId& account, Amount amount);
    
    /// Withdraw all unlocked stake
    Status UnstakeAll(const AccountId& account, Amount* withdrawn = nullptr);
    
    Status ClaimReward(const AccountId& account, Amount* claimed = nullptr);
    
    /// Income from the fee collector; NoStakers means it was withheld
    Status DepositIncome(Amount amount);
    
    // ========================================================================
    // Polls
    // ========================================================================
    
    Status CreatePoll(const AccountId& creator,
                      Amount deposit,
                      const std::string& title,
                      const std::string& description,
                      const std::optional<std::string>& link,
                      const std::vector<PollMessage>& messages,
                      PollId* outId = nullptr);
    
    Status CastVote(PollId pollId, const AccountId& voter, VoteChoice choice);
    
    Status EndPoll(PollId pollId, PollStatus* outcome = nullptr);
    
    Status ExecutePoll(PollId pollId, ExecutionResult* result = nullptr);
    
    Status ExpirePoll(PollId pollId);
    
    // ========================================================================
    // Administration
    // ========================================================================
    
    /// Direct parameter change by the configured owner
    Status UpdateConfig(const AccountId& sender, const UpdateConfigMessage& update);
    
    /// Advance to a new block height
    Status ProcessBlock(Height height);
    
    void SetExecutionHost(IExecutionHost* host);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    std::optional<Poll> GetPoll(PollId pollId) const;
    std::vector<Poll> ListPolls(const PollQuery& query) const;
    
    std::optional<Vote> GetVote(PollId pollId, const AccountId& voter) const;
    
    /// Votes on a poll ordered by voter; limit as for ListPolls
    std::vector<Vote> GetVoters(PollId pollId,
                                const std::optional<AccountId>& startAfter = std::nullopt,
                                std::optional<size_t> limit = std::nullopt) const;
    
    StakerInfo GetStakerInfo(const AccountId& account) const;
    RewardState GetRewardState() const;
    GovernanceParams GetParams() const;
    Height GetHeight() const;
    
    /// Stake and tally cross-checks; Corruption on mismatch
    Status CheckInvariants() const;
    
    // ========================================================================
    // Persistence
    // ========================================================================
    
    GovernanceState ExportState() const;
    
    /// Replace all state; validated in full before anything changes
    Status ImportState(const GovernanceState& state);

private:
    Amount LockedFor(const AccountId& account) const;
    
    mutable std::mutex mutex_;
    
    GovernanceParams params_;
    Height height_;
    staking::RewardIndex index_;
    
    token::ITokenBank& bank_;
    
    staking::RewardDistributor distributor_;
    staking::StakeLedger ledger_;
    PollRegistry registry_;
    ExecutionEngine engine_;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_GOVERNANCE_H
