// AGORA - Governance Contract Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/governance.h"
#include "agora/util/logging.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace agora {
namespace governance {

namespace {

std::string ShortId(const AccountId& account) {
    return account.ToHex().substr(0, 12);
}

} // namespace

std::string StakerInfo::ToString() const {
    std::ostringstream ss;
    ss << "StakerInfo { account: " << ShortId(account) << "..."
       << ", balance: " << balance
       << ", locked: " << locked
       << ", claimable: " << claimable
       << ", claimed: " << totalClaimed
       << " }";
    return ss.str();
}

// ============================================================================
// Construction
// ============================================================================

GovernanceContract::GovernanceContract(const GovernanceParams& params,
                                       token::ITokenBank& bank,
                                       IExecutionHost* host,
                                       Height height)
    : params_(params),
      height_(height),
      bank_(bank),
      distributor_(index_),
      ledger_(distributor_, bank_),
      registry_(params_, bank_, distributor_),
      engine_(registry_, host) {
    Status s = params_.Validate();
    if (!s.ok()) {
        throw std::invalid_argument("invalid governance parameters: " + s.message());
    }
    if (height_ < 0 || height_ > MAX_HEIGHT) {
        throw std::invalid_argument("starting height out of range");
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Governance started at height " << height_
                                         << " with " << params_.ToString();
}

Amount GovernanceContract::LockedFor(const AccountId& account) const {
    return params_.lockVotedStake ? registry_.LockedBalance(account) : 0;
}

// ============================================================================
// Staking
// ============================================================================

Status GovernanceContract::Stake(const AccountId& account, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.Stake(account, amount);
}

Status GovernanceContract::Unstake(const AccountId& account, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = ledger_.Unstake(account, amount, LockedFor(account));
    if (s.ok()) {
        registry_.ReleaseLocks(account);
    }
    return s;
}

Status GovernanceContract::UnstakeAll(const AccountId& account, Amount* withdrawn) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = ledger_.UnstakeAll(account, LockedFor(account), withdrawn);
    if (s.ok()) {
        registry_.ReleaseLocks(account);
    }
    return s;
}

Status GovernanceContract::ClaimReward(const AccountId& account, Amount* claimed) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.ClaimReward(account, claimed);
}

Status GovernanceContract::DepositIncome(Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return distributor_.DepositIncome(amount);
}

// ============================================================================
// Polls
// ============================================================================

Status GovernanceContract::CreatePoll(const AccountId& creator,
                                      Amount deposit,
                                      const std::string& title,
                                      const std::string& description,
                                      const std::optional<std::string>& link,
                                      const std::vector<PollMessage>& messages,
                                      PollId* outId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.CreatePoll(creator, deposit, title, description, link, messages,
                                ledger_.TotalStaked(), height_, outId);
}

Status GovernanceContract::CastVote(PollId pollId, const AccountId& voter, VoteChoice choice) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.CastVote(pollId, voter, choice, ledger_.BalanceOf(voter), height_);
}

Status GovernanceContract::EndPoll(PollId pollId, PollStatus* outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.EndPoll(pollId, height_, outcome);
}

Status GovernanceContract::ExecutePoll(PollId pollId, ExecutionResult* result) {
    std::lock_guard<std::mutex> lock(mutex_);
    GovernanceParams before = params_;
    Status s = engine_.Execute(pollId, height_, params_, result);
    if (s.ok() && params_ != before) {
        LOG_INFO(util::LogCategory::CONFIG) << "Poll " << pollId << " updated parameters to "
                                            << params_.ToString();
    }
    return s;
}

Status GovernanceContract::ExpirePoll(PollId pollId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.ExpirePoll(pollId, height_);
}

// ============================================================================
// Administration
// ============================================================================

Status GovernanceContract::UpdateConfig(const AccountId& sender,
                                        const UpdateConfigMessage& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (params_.owner.IsNull() || sender != params_.owner) {
        LOG_DEBUG(util::LogCategory::CONFIG) << "Config update from " << ShortId(sender)
                                             << " refused";
        return Status::Unauthorized("only the owner or a passed poll may update parameters");
    }
    
    GovernanceParams updated = params_;
    updated.ApplyUpdate(update);
    Status s = updated.Validate();
    if (!s.ok()) {
        LOG_DEBUG(util::LogCategory::CONFIG) << "Config update rejected: " << s.message();
        return s;
    }
    
    params_ = updated;
    LOG_INFO(util::LogCategory::CONFIG) << "Owner updated parameters to " << params_.ToString();
    return Status::Ok();
}

Status GovernanceContract::ProcessBlock(Height height) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (height < height_) {
        return Status::InvalidHeight("height " + std::to_string(height) +
                                     " is behind " + std::to_string(height_));
    }
    if (height > MAX_HEIGHT) {
        return Status::InvalidHeight("height " + std::to_string(height) + " out of range");
    }
    height_ = height;
    return Status::Ok();
}

void GovernanceContract::SetExecutionHost(IExecutionHost* host) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_.SetHost(host);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Poll> GovernanceContract::GetPoll(PollId pollId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.GetPoll(pollId);
}

std::vector<Poll> GovernanceContract::ListPolls(const PollQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.ListPolls(query);
}

std::optional<Vote> GovernanceContract::GetVote(PollId pollId, const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.Votes().GetVote(pollId, voter);
}

std::vector<Vote> GovernanceContract::GetVoters(PollId pollId,
                                                const std::optional<AccountId>& startAfter,
                                                std::optional<size_t> limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t pageSize = std::min(limit.value_or(DEFAULT_PAGE_LIMIT), MAX_PAGE_LIMIT);
    return registry_.Votes().GetVoters(pollId, startAfter, pageSize);
}

StakerInfo GovernanceContract::GetStakerInfo(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    StakerInfo info;
    info.account = account;
    info.balance = ledger_.BalanceOf(account);
    info.locked = std::min(LockedFor(account), info.balance);
    info.claimable = ledger_.ClaimableReward(account);
    if (auto stake = ledger_.GetStake(account)) {
        info.totalClaimed = stake->totalClaimed;
    }
    return info;
}

RewardState GovernanceContract::GetRewardState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    RewardState state;
    state.globalIndex = index_.globalIndex;
    state.totalStaked = index_.totalStaked;
    state.withheldIncome = index_.withheldIncome;
    state.totalIncome = index_.totalIncome;
    return state;
}

GovernanceParams GovernanceContract::GetParams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

Height GovernanceContract::GetHeight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return height_;
}

Status GovernanceContract::CheckInvariants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (ledger_.SumOfStakes() != ledger_.TotalStaked()) {
        return Status::Corruption("stakes sum to " + std::to_string(ledger_.SumOfStakes()) +
                                  " but total is " + std::to_string(ledger_.TotalStaked()));
    }
    return registry_.CheckTallies();
}

// ============================================================================
// Persistence
// ============================================================================

GovernanceState GovernanceContract::ExportState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    GovernanceState state;
    state.params = params_;
    state.height = height_;
    state.nextPollId = registry_.NextPollId();
    state.rewardIndex = index_;
    state.stakes = ledger_.GetAllStakes();
    state.polls = registry_.GetAllPolls();
    state.votes = registry_.Votes().GetAllVotes();
    return state;
}

Status GovernanceContract::ImportState(const GovernanceState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Status s = state.params.Validate();
    if (!s.ok()) {
        return Status::Corruption("stored parameters invalid: " + s.message());
    }
    if (state.height < 0 || state.height > MAX_HEIGHT) {
        return Status::Corruption("stored height out of range");
    }
    
    // Dry run against scratch components so a bad state changes nothing
    {
        staking::RewardIndex scratchIndex = state.rewardIndex;
        staking::RewardDistributor scratchDistributor(scratchIndex);
        staking::StakeLedger scratchLedger(scratchDistributor, bank_);
        s = scratchLedger.Restore(state.stakes);
        if (!s.ok()) {
            return s;
        }
        PollRegistry scratchRegistry(state.params, bank_, scratchDistributor);
        s = scratchRegistry.Restore(state.polls, state.nextPollId, state.votes);
        if (!s.ok()) {
            return s;
        }
    }
    
    params_ = state.params;
    height_ = state.height;
    index_ = state.rewardIndex;
    s = ledger_.Restore(state.stakes);
    if (!s.ok()) {
        return s;
    }
    s = registry_.Restore(state.polls, state.nextPollId, state.votes);
    if (!s.ok()) {
        return s;
    }
    
    LOG_INFO(util::LogCategory::STORE) << "Imported state at height " << height_ << ": "
                                       << state.stakes.size() << " stakes, "
                                       << state.polls.size() << " polls, "
                                       << state.votes.size() << " votes";
    return Status::Ok();
}

} // namespace governance
} // namespace agora
