// AGORA - Vote Snapshot Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/vote_snapshot.h"
#include "agora/util/logging.h"

#include <algorithm>

namespace agora {
namespace governance {

Status VoteSnapshot::RecordVote(PollId pollId, const AccountId& voter, VoteChoice choice,
                                Amount balance, Height height, Vote* out) {
    if (balance <= 0) {
        LOG_DEBUG(util::LogCategory::VOTE) << voter.ToHex().substr(0, 12)
                                           << " has no stake to vote on poll " << pollId;
        return Status::NoStake("voter has no staked balance");
    }
    
    auto& pollVotes = votes_[pollId];
    if (pollVotes.count(voter) > 0) {
        LOG_DEBUG(util::LogCategory::VOTE) << voter.ToHex().substr(0, 12)
                                           << " already voted on poll " << pollId;
        return Status::AlreadyVoted("poll " + std::to_string(pollId));
    }
    
    Vote vote;
    vote.pollId = pollId;
    vote.voter = voter;
    vote.choice = choice;
    vote.power = balance;
    vote.height = height;
    
    pollVotes.emplace(voter, vote);
    locks_[voter][pollId] = balance;
    
    if (out) {
        *out = vote;
    }
    return Status::Ok();
}

std::optional<Vote> VoteSnapshot::GetVote(PollId pollId, const AccountId& voter) const {
    auto pollIt = votes_.find(pollId);
    if (pollIt == votes_.end()) {
        return std::nullopt;
    }
    auto it = pollIt->second.find(voter);
    if (it == pollIt->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool VoteSnapshot::HasVoted(PollId pollId, const AccountId& voter) const {
    return GetVote(pollId, voter).has_value();
}

std::vector<Vote> VoteSnapshot::GetVoters(PollId pollId,
                                          const std::optional<AccountId>& startAfter,
                                          size_t limit) const {
    std::vector<Vote> result;
    auto pollIt = votes_.find(pollId);
    if (pollIt == votes_.end() || limit == 0) {
        return result;
    }
    
    const auto& pollVotes = pollIt->second;
    auto it = startAfter ? pollVotes.upper_bound(*startAfter) : pollVotes.begin();
    for (; it != pollVotes.end() && result.size() < limit; ++it) {
        result.push_back(it->second);
    }
    return result;
}

Amount VoteSnapshot::LockedBalance(const AccountId& account,
                                   const PollPredicate& isInProgress) const {
    auto it = locks_.find(account);
    if (it == locks_.end()) {
        return 0;
    }
    
    Amount locked = 0;
    for (const auto& [pollId, power] : it->second) {
        if (isInProgress(pollId)) {
            locked = std::max(locked, power);
        }
    }
    return locked;
}

void VoteSnapshot::PruneLocks(const AccountId& account, const PollPredicate& isInProgress) {
    auto it = locks_.find(account);
    if (it == locks_.end()) {
        return;
    }
    
    auto& polls = it->second;
    for (auto pollIt = polls.begin(); pollIt != polls.end();) {
        if (isInProgress(pollIt->first)) {
            ++pollIt;
        } else {
            pollIt = polls.erase(pollIt);
        }
    }
    if (polls.empty()) {
        locks_.erase(it);
    }
}

Amount VoteSnapshot::SumOfPowers(PollId pollId) const {
    Amount sum = 0;
    auto pollIt = votes_.find(pollId);
    if (pollIt != votes_.end()) {
        for (const auto& [voter, vote] : pollIt->second) {
            sum += vote.power;
        }
    }
    return sum;
}

size_t VoteSnapshot::VoteCount(PollId pollId) const {
    auto pollIt = votes_.find(pollId);
    return pollIt == votes_.end() ? 0 : pollIt->second.size();
}

std::vector<Vote> VoteSnapshot::GetAllVotes() const {
    std::vector<Vote> result;
    for (const auto& [pollId, pollVotes] : votes_) {
        for (const auto& [voter, vote] : pollVotes) {
            result.push_back(vote);
        }
    }
    return result;
}

Status VoteSnapshot::Restore(const std::vector<Vote>& votes) {
    std::map<PollId, std::map<AccountId, Vote>> restoredVotes;
    std::map<AccountId, std::map<PollId, Amount>> restoredLocks;
    
    for (const auto& vote : votes) {
        if (vote.power <= 0) {
            return Status::Corruption("vote without power on poll " +
                                      std::to_string(vote.pollId));
        }
        if (!restoredVotes[vote.pollId].emplace(vote.voter, vote).second) {
            return Status::Corruption("duplicate vote on poll " + std::to_string(vote.pollId));
        }
        restoredLocks[vote.voter][vote.pollId] = vote.power;
    }
    
    votes_ = std::move(restoredVotes);
    locks_ = std::move(restoredLocks);
    return Status::Ok();
}

} // namespace governance
} // namespace agora
