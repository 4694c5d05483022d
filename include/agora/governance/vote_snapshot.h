// AGORA - Vote Snapshot
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Records each vote with the power the voter held when casting it.
// Later stake changes never alter a recorded vote.

#ifndef AGORA_GOVERNANCE_VOTE_SNAPSHOT_H
#define AGORA_GOVERNANCE_VOTE_SNAPSHOT_H

#include "agora/core/status.h"
#include "agora/core/types.h"
#include "agora/governance/poll.h"

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace agora {
namespace governance {

/// True while the poll still accepts votes
using PollPredicate = std::function<bool(PollId)>;

class VoteSnapshot {
public:
    VoteSnapshot() = default;
    
    /**
     * Record a vote with power equal to the voter's current stake.
     *
     * @return NoStake if balance is zero, AlreadyVoted on a second vote
     */
    Status RecordVote(PollId pollId, const AccountId& voter, VoteChoice choice,
                      Amount balance, Height height, Vote* out = nullptr);
    
    std::optional<Vote> GetVote(PollId pollId, const AccountId& voter) const;
    
    bool HasVoted(PollId pollId, const AccountId& voter) const;
    
    /// Votes ordered by voter, starting after the cursor
    std::vector<Vote> GetVoters(PollId pollId,
                                const std::optional<AccountId>& startAfter,
                                size_t limit) const;
    
    /// Largest power the account committed to polls still in progress
    Amount LockedBalance(const AccountId& account, const PollPredicate& isInProgress) const;
    
    /// Drop lock entries for polls that left InProgress
    void PruneLocks(const AccountId& account, const PollPredicate& isInProgress);
    
    Amount SumOfPowers(PollId pollId) const;
    size_t VoteCount(PollId pollId) const;
    
    // === Persistence ===
    
    std::vector<Vote> GetAllVotes() const;
    
    /// Replace all votes; Corruption on duplicates or non-positive power
    Status Restore(const std::vector<Vote>& votes);

private:
    std::map<PollId, std::map<AccountId, Vote>> votes_;
    
    /// account -> poll -> committed power
    std::map<AccountId, std::map<PollId, Amount>> locks_;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_VOTE_SNAPSHOT_H
