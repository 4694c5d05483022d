// AGORA - Poll Registry
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Poll creation, deposit escrow, vote tallying and the lifecycle state
// machine:
//
//   InProgress -> Passed | Rejected
//   Passed     -> Executed | Failed | Expired

#ifndef AGORA_GOVERNANCE_POLL_REGISTRY_H
#define AGORA_GOVERNANCE_POLL_REGISTRY_H

#include "agora/core/status.h"
#include "agora/core/types.h"
#include "agora/governance/params.h"
#include "agora/governance/poll.h"
#include "agora/governance/vote_snapshot.h"
#include "agora/staking/reward_distributor.h"
#include "agora/token/token_bank.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace governance {

/// Filter and cursor for ListPolls
struct PollQuery {
    std::optional<PollStatus> status;
    
    /// Exclusive cursor in iteration order
    std::optional<PollId> startAfter;
    
    /// Defaults to DEFAULT_PAGE_LIMIT, capped at MAX_PAGE_LIMIT
    std::optional<size_t> limit;
    
    bool descending{false};
};

class PollRegistry {
public:
    /// params is read on every call, so updates apply to later polls
    PollRegistry(const GovernanceParams& params,
                 token::ITokenBank& bank,
                 staking::RewardDistributor& distributor);
    
    // ========================================================================
    // Lifecycle
    // ========================================================================
    
    /**
     * Open a poll, escrowing the deposit from the creator's token balance.
     *
     * @param totalStaked Quorum denominator for the poll's life
     * @param outId Assigned poll id
     */
    Status CreatePoll(const AccountId& creator,
                      Amount deposit,
                      const std::string& title,
                      const std::string& description,
                      const std::optional<std::string>& link,
                      const std::vector<PollMessage>& messages,
                      Amount totalStaked,
                      Height height,
                      PollId* outId = nullptr);
    
    /// Record a vote with the voter's current stake as its power
    Status CastVote(PollId pollId, const AccountId& voter, VoteChoice choice,
                    Amount balance, Height height, Vote* out = nullptr);
    
    /// Settle the vote and the deposit once voting has closed
    Status EndPoll(PollId pollId, Height height, PollStatus* outcome = nullptr);
    
    /// Retire a passed poll whose execution window has closed
    Status ExpirePoll(PollId pollId, Height height);
    
    Status MarkExecuted(PollId pollId, Height height);
    Status MarkFailed(PollId pollId, Height height, uint32_t failedIndex);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    const Poll* FindPoll(PollId pollId) const;
    std::optional<Poll> GetPoll(PollId pollId) const;
    std::vector<Poll> ListPolls(const PollQuery& query) const;
    
    bool IsInProgress(PollId pollId) const;
    
    /// Stake the account may not withdraw while its polls are open
    Amount LockedBalance(const AccountId& account) const;
    
    /// Forget locks on polls that have closed
    void ReleaseLocks(const AccountId& account);
    
    const VoteSnapshot& Votes() const { return votes_; }
    
    PollId NextPollId() const { return nextId_; }
    size_t PollCount() const { return polls_.size(); }
    
    /// Corruption if any tally disagrees with its recorded votes
    Status CheckTallies() const;
    
    // ========================================================================
    // Persistence
    // ========================================================================
    
    std::vector<Poll> GetAllPolls() const;
    
    /// Replace polls and votes; nothing changes unless the set is consistent
    Status Restore(const std::vector<Poll>& polls, PollId nextId,
                   const std::vector<Vote>& votes);

private:
    Poll* FindMutable(PollId pollId);
    
    /// Move the deposit out of escrow according to the outcome
    Status SettleDeposit(const Poll& poll, bool passed, bool quorum,
                         DepositSettlement* settlement);
    
    static Status CheckTallies(const std::map<PollId, Poll>& polls,
                               const VoteSnapshot& votes);
    
    const GovernanceParams& params_;
    token::ITokenBank& bank_;
    staking::RewardDistributor& distributor_;
    
    std::map<PollId, Poll> polls_;
    VoteSnapshot votes_;
    PollId nextId_{1};
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_POLL_REGISTRY_H
