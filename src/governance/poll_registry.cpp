// AGORA - Poll Registry Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/poll_registry.h"
#include "agora/util/logging.h"

#include <algorithm>

namespace agora {
namespace governance {

namespace {

std::string ShortId(const AccountId& account) {
    return account.ToHex().substr(0, 12);
}

} // namespace

PollRegistry::PollRegistry(const GovernanceParams& params,
                           token::ITokenBank& bank,
                           staking::RewardDistributor& distributor)
    : params_(params), bank_(bank), distributor_(distributor) {}

// ============================================================================
// Lifecycle
// ============================================================================

Status PollRegistry::CreatePoll(const AccountId& creator,
                                Amount deposit,
                                const std::string& title,
                                const std::string& description,
                                const std::optional<std::string>& link,
                                const std::vector<PollMessage>& messages,
                                Amount totalStaked,
                                Height height,
                                PollId* outId) {
    Status s = ValidatePollContent(title, description, link, messages.size(),
                                   params_.maxMessages);
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::POLL) << "Rejected poll from " << ShortId(creator)
                                           << ": " << s.message();
        return s;
    }
    if (deposit < 0 || !MoneyRange(deposit)) {
        return Status::InvalidAmount("deposit out of range");
    }
    if (deposit < params_.proposalDeposit) {
        LOG_DEBUG(util::LogCategory::POLL) << "Deposit " << deposit << " below minimum "
                                           << params_.proposalDeposit;
        return Status::InsufficientDeposit("minimum deposit is " +
                                           std::to_string(params_.proposalDeposit));
    }
    
    if (deposit > 0) {
        s = bank_.TransferFrom(creator, deposit);
        if (!s.ok()) {
            LOG_DEBUG(util::LogCategory::POLL) << "Deposit escrow for " << ShortId(creator)
                                               << " refused: " << s.ToString();
            return s;
        }
    }
    
    Poll poll;
    poll.id = nextId_++;
    poll.creator = creator;
    poll.depositAmount = deposit;
    poll.title = title;
    poll.description = description;
    poll.link = link;
    poll.messages = messages;
    poll.status = PollStatus::InProgress;
    poll.totalVotingPowerAtCreation = totalStaked;
    poll.startHeight = height;
    poll.endHeight = height + params_.votingPeriod;
    
    PollId id = poll.id;
    polls_.emplace(id, std::move(poll));
    
    LOG_INFO(util::LogCategory::POLL) << "Poll " << id << " \"" << title << "\" opened by "
                                      << ShortId(creator) << ", voting until " << height + params_.votingPeriod
                                      << ", power " << totalStaked;
    if (outId) {
        *outId = id;
    }
    return Status::Ok();
}

Status PollRegistry::CastVote(PollId pollId, const AccountId& voter, VoteChoice choice,
                              Amount balance, Height height, Vote* out) {
    Poll* poll = FindMutable(pollId);
    if (!poll) {
        return Status::PollNotFound("poll " + std::to_string(pollId));
    }
    if (poll->status != PollStatus::InProgress || height >= poll->endHeight) {
        LOG_DEBUG(util::LogCategory::VOTE) << "Vote on closed poll " << pollId
                                           << " at height " << height;
        return Status::PollNotInProgress("poll " + std::to_string(pollId) + " is " +
                                         PollStatusToString(poll->status));
    }
    
    Vote vote;
    Status s = votes_.RecordVote(pollId, voter, choice, balance, height, &vote);
    if (!s.ok()) {
        return s;
    }
    
    switch (choice) {
        case VoteChoice::Yes: poll->yesVotes += vote.power; break;
        case VoteChoice::No: poll->noVotes += vote.power; break;
        case VoteChoice::Abstain: poll->abstainVotes += vote.power; break;
    }
    
    LOG_INFO(util::LogCategory::VOTE) << ShortId(voter) << " voted "
                                      << VoteChoiceToString(choice) << " on poll " << pollId
                                      << " with " << vote.power;
    if (out) {
        *out = vote;
    }
    return Status::Ok();
}

Status PollRegistry::EndPoll(PollId pollId, Height height, PollStatus* outcome) {
    Poll* poll = FindMutable(pollId);
    if (!poll) {
        return Status::PollNotFound("poll " + std::to_string(pollId));
    }
    if (poll->status != PollStatus::InProgress) {
        return Status::PollNotInProgress("poll " + std::to_string(pollId) + " already " +
                                         PollStatusToString(poll->status));
    }
    if (height < poll->endHeight) {
        return Status::VotingPeriodNotOver("voting ends at " + std::to_string(poll->endHeight));
    }
    
    bool quorum = poll->HasQuorum(params_.quorumBps);
    bool threshold = poll->HasThreshold(params_.thresholdBps);
    bool passed = quorum && threshold;
    
    DepositSettlement settlement = DepositSettlement::Escrowed;
    Status s = SettleDeposit(*poll, passed, quorum, &settlement);
    if (!s.ok()) {
        return s;
    }
    
    poll->status = passed ? PollStatus::Passed : PollStatus::Rejected;
    poll->depositSettlement = settlement;
    poll->settledHeight = height;
    
    LOG_INFO(util::LogCategory::POLL) << "Poll " << pollId << " "
                                      << PollStatusToString(poll->status)
                                      << " (yes " << poll->yesVotes << ", no " << poll->noVotes
                                      << ", abstain " << poll->abstainVotes << " of "
                                      << poll->totalVotingPowerAtCreation << "), deposit "
                                      << DepositSettlementToString(settlement);
    if (outcome) {
        *outcome = poll->status;
    }
    return Status::Ok();
}

Status PollRegistry::SettleDeposit(const Poll& poll, bool passed, bool quorum,
                                   DepositSettlement* settlement) {
    bool refund = passed;
    if (!passed) {
        switch (params_.depositPolicy) {
            case DepositPolicy::Forfeit: refund = false; break;
            case DepositPolicy::Refund: refund = true; break;
            case DepositPolicy::RefundIfQuorum: refund = quorum; break;
        }
    }
    
    if (poll.depositAmount == 0) {
        *settlement = refund ? DepositSettlement::Refunded : DepositSettlement::Forfeited;
        return Status::Ok();
    }
    
    if (refund) {
        Status s = bank_.TransferTo(poll.creator, poll.depositAmount);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::POLL) << "Deposit refund for poll " << poll.id
                                               << " failed: " << s.ToString();
            return s;
        }
        *settlement = DepositSettlement::Refunded;
        return Status::Ok();
    }
    
    // Escrowed tokens stay in custody and become staker income
    Status s = distributor_.DepositIncome(poll.depositAmount);
    if (s == Status::NO_STAKERS) {
        LOG_INFO(util::LogCategory::REWARD) << "Forfeited deposit of poll " << poll.id
                                            << " withheld until the first stake";
    } else if (!s.ok()) {
        return s;
    }
    *settlement = DepositSettlement::Forfeited;
    return Status::Ok();
}

Status PollRegistry::ExpirePoll(PollId pollId, Height height) {
    Poll* poll = FindMutable(pollId);
    if (!poll) {
        return Status::PollNotFound("poll " + std::to_string(pollId));
    }
    if (poll->status != PollStatus::Passed) {
        return Status::NotPassed("poll " + std::to_string(pollId) + " is " +
                                 PollStatusToString(poll->status));
    }
    Height until = poll->ExecutableUntil(params_.timelockPeriod, params_.expirationPeriod);
    if (height <= until) {
        return Status::ExecutionWindowOpen("executable until " + std::to_string(until));
    }
    
    poll->status = PollStatus::Expired;
    poll->settledHeight = height;
    LOG_INFO(util::LogCategory::POLL) << "Poll " << pollId << " expired unexecuted";
    return Status::Ok();
}

Status PollRegistry::MarkExecuted(PollId pollId, Height height) {
    Poll* poll = FindMutable(pollId);
    if (!poll) {
        return Status::PollNotFound("poll " + std::to_string(pollId));
    }
    if (poll->status != PollStatus::Passed) {
        return Status::NotPassed("poll " + std::to_string(pollId));
    }
    poll->status = PollStatus::Executed;
    poll->settledHeight = height;
    return Status::Ok();
}

Status PollRegistry::MarkFailed(PollId pollId, Height height, uint32_t failedIndex) {
    Poll* poll = FindMutable(pollId);
    if (!poll) {
        return Status::PollNotFound("poll " + std::to_string(pollId));
    }
    if (poll->status != PollStatus::Passed) {
        return Status::NotPassed("poll " + std::to_string(pollId));
    }
    poll->status = PollStatus::Failed;
    poll->settledHeight = height;
    poll->failedMessageIndex = failedIndex;
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

Poll* PollRegistry::FindMutable(PollId pollId) {
    auto it = polls_.find(pollId);
    return it == polls_.end() ? nullptr : &it->second;
}

const Poll* PollRegistry::FindPoll(PollId pollId) const {
    auto it = polls_.find(pollId);
    return it == polls_.end() ? nullptr : &it->second;
}

std::optional<Poll> PollRegistry::GetPoll(PollId pollId) const {
    const Poll* poll = FindPoll(pollId);
    if (!poll) {
        return std::nullopt;
    }
    return *poll;
}

std::vector<Poll> PollRegistry::ListPolls(const PollQuery& query) const {
    size_t limit = std::min(query.limit.value_or(DEFAULT_PAGE_LIMIT), MAX_PAGE_LIMIT);
    std::vector<Poll> result;
    
    auto matches = [&query](const Poll& poll) {
        return !query.status || poll.status == *query.status;
    };
    
    if (query.descending) {
        auto it = query.startAfter ? polls_.lower_bound(*query.startAfter) : polls_.end();
        while (it != polls_.begin() && result.size() < limit) {
            --it;
            if (matches(it->second)) {
                result.push_back(it->second);
            }
        }
    } else {
        auto it = query.startAfter ? polls_.upper_bound(*query.startAfter) : polls_.begin();
        for (; it != polls_.end() && result.size() < limit; ++it) {
            if (matches(it->second)) {
                result.push_back(it->second);
            }
        }
    }
    return result;
}

bool PollRegistry::IsInProgress(PollId pollId) const {
    const Poll* poll = FindPoll(pollId);
    return poll && poll->status == PollStatus::InProgress;
}

Amount PollRegistry::LockedBalance(const AccountId& account) const {
    return votes_.LockedBalance(account, [this](PollId id) { return IsInProgress(id); });
}

void PollRegistry::ReleaseLocks(const AccountId& account) {
    votes_.PruneLocks(account, [this](PollId id) { return IsInProgress(id); });
}

Status PollRegistry::CheckTallies() const {
    return CheckTallies(polls_, votes_);
}

Status PollRegistry::CheckTallies(const std::map<PollId, Poll>& polls,
                                  const VoteSnapshot& votes) {
    for (const auto& [id, poll] : polls) {
        Amount recorded = votes.SumOfPowers(id);
        if (poll.TotalVotes() != recorded) {
            return Status::Corruption("poll " + std::to_string(id) + " tallies " +
                                      std::to_string(poll.TotalVotes()) +
                                      " but votes sum to " + std::to_string(recorded));
        }
    }
    for (const auto& vote : votes.GetAllVotes()) {
        if (polls.count(vote.pollId) == 0) {
            return Status::Corruption("vote on unknown poll " + std::to_string(vote.pollId));
        }
    }
    return Status::Ok();
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Poll> PollRegistry::GetAllPolls() const {
    std::vector<Poll> result;
    result.reserve(polls_.size());
    for (const auto& [id, poll] : polls_) {
        result.push_back(poll);
    }
    return result;
}

Status PollRegistry::Restore(const std::vector<Poll>& polls, PollId nextId,
                             const std::vector<Vote>& votes) {
    std::map<PollId, Poll> restored;
    for (const auto& poll : polls) {
        if (poll.id == 0 || poll.id >= nextId) {
            return Status::Corruption("poll id " + std::to_string(poll.id) +
                                      " outside the issued range");
        }
        if (!restored.emplace(poll.id, poll).second) {
            return Status::Corruption("duplicate poll " + std::to_string(poll.id));
        }
    }
    
    VoteSnapshot restoredVotes;
    Status s = restoredVotes.Restore(votes);
    if (!s.ok()) {
        return s;
    }
    s = CheckTallies(restored, restoredVotes);
    if (!s.ok()) {
        return s;
    }
    
    polls_ = std::move(restored);
    votes_ = std::move(restoredVotes);
    nextId_ = nextId;
    return Status::Ok();
}

} // namespace governance
} // namespace agora
