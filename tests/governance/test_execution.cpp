// AGORA - Poll Execution Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include <agora/governance/governance.h>
#include <agora/token/token_bank.h>

#include <array>
#include <memory>
#include <stdexcept>

using namespace agora;
using namespace agora::governance;

namespace {

/// Records every call and refuses the message at failAt
class RecordingHost : public IExecutionHost {
public:
    void BeginBatch() override { ++begun; }
    
    bool Dispatch(const PollMessage& message) override {
        if (throwOnDispatch) {
            throw std::runtime_error("contract trapped");
        }
        size_t index = dispatched.size();
        dispatched.push_back(message);
        return !failAt || *failAt != index;
    }
    
    void CommitBatch() override { ++committed; }
    void RollbackBatch() override { ++rolledBack; }
    
    std::optional<size_t> failAt;
    bool throwOnDispatch{false};
    
    std::vector<PollMessage> dispatched;
    int begun{0};
    int committed{0};
    int rolledBack{0};
};

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class ExecutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        voter_ = CreateTestAddress(1);
        creator_ = CreateTestAddress(2);
        target_ = CreateTestAddress(3);
        
        params_.quorumBps = 3000;
        params_.thresholdBps = 5000;
        params_.votingPeriod = 10;
        params_.timelockPeriod = 5;
        params_.expirationPeriod = 5;
        params_.proposalDeposit = 100;
        
        bank_.Mint(voter_, 1000);
        bank_.Mint(creator_, 1000);
        
        gov_ = std::make_unique<GovernanceContract>(params_, bank_, &host_);
        ASSERT_TRUE(gov_->Stake(voter_, 1000).ok());
    }
    
    AccountId CreateTestAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return AccountId(data);
    }
    
    /// Create, vote and end a poll; it ends at height 10
    PollId PassPoll(const std::vector<PollMessage>& messages) {
        PollId id = 0;
        EXPECT_TRUE(gov_->CreatePoll(creator_, 100, "Upgrade target", "Run the upgrade",
                                     std::string("https://agora.example/up"), messages,
                                     &id).ok());
        EXPECT_TRUE(gov_->CastVote(id, voter_, VoteChoice::Yes).ok());
        EXPECT_TRUE(gov_->ProcessBlock(10).ok());
        PollStatus outcome = PollStatus::InProgress;
        EXPECT_TRUE(gov_->EndPoll(id, &outcome).ok());
        EXPECT_EQ(outcome, PollStatus::Passed);
        return id;
    }
    
    ForwardMessage Forward(Byte tag) {
        return ForwardMessage{target_, {tag}};
    }
    
    GovernanceParams params_;
    token::InMemoryTokenBank bank_;
    RecordingHost host_;
    std::unique_ptr<GovernanceContract> gov_;
    
    AccountId voter_;
    AccountId creator_;
    AccountId target_;
};

// ============================================================================
// Execution Window
// ============================================================================

TEST_F(ExecutionTest, TimelockHoldsExecution) {
    PollId id = PassPoll({Forward(1)});
    
    ASSERT_TRUE(gov_->ProcessBlock(14).ok());
    EXPECT_EQ(gov_->ExecutePoll(id).code(), Status::TIMELOCK_NOT_EXPIRED);
    EXPECT_EQ(host_.begun, 0);
    EXPECT_EQ(gov_->GetPoll(id)->status, PollStatus::Passed);
    
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    EXPECT_TRUE(gov_->ExecutePoll(id).ok());
}

TEST_F(ExecutionTest, WindowClosesThenPollExpires) {
    PollId id = PassPoll({Forward(1)});
    
    ASSERT_TRUE(gov_->ProcessBlock(20).ok());
    EXPECT_EQ(gov_->ExpirePoll(id).code(), Status::EXECUTION_WINDOW_OPEN);
    
    ASSERT_TRUE(gov_->ProcessBlock(21).ok());
    EXPECT_EQ(gov_->ExecutePoll(id).code(), Status::EXECUTION_WINDOW_CLOSED);
    EXPECT_TRUE(host_.dispatched.empty());
    
    ASSERT_TRUE(gov_->ExpirePoll(id).ok());
    EXPECT_EQ(gov_->GetPoll(id)->status, PollStatus::Expired);
    EXPECT_EQ(gov_->ExpirePoll(id).code(), Status::NOT_PASSED);
}

TEST_F(ExecutionTest, RejectedPollCannotExecute) {
    PollId id = 0;
    ASSERT_TRUE(gov_->CreatePoll(creator_, 100, "Upgrade target", "Run the upgrade",
                                 std::nullopt, {Forward(1)}, &id).ok());
    ASSERT_TRUE(gov_->CastVote(id, voter_, VoteChoice::No).ok());
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    EXPECT_EQ(gov_->ExecutePoll(id).code(), Status::NOT_PASSED);
    ASSERT_TRUE(gov_->EndPoll(id).ok());
    EXPECT_EQ(gov_->ExecutePoll(id).code(), Status::NOT_PASSED);
    EXPECT_EQ(gov_->ExecutePoll(77).code(), Status::POLL_NOT_FOUND);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(ExecutionTest, ExecutesMessagesInOrder) {
    PollId id = PassPoll({Forward(1), TransferOwnershipMessage{target_, creator_}, Forward(2)});
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    ExecutionResult result;
    ASSERT_TRUE(gov_->ExecutePoll(id, &result).ok());
    EXPECT_EQ(result.status, PollStatus::Executed);
    EXPECT_FALSE(result.failedIndex.has_value());
    EXPECT_EQ(result.dispatched, 3u);
    
    ASSERT_EQ(host_.dispatched.size(), 3u);
    EXPECT_TRUE(host_.dispatched[0] == PollMessage(Forward(1)));
    EXPECT_TRUE(std::holds_alternative<TransferOwnershipMessage>(host_.dispatched[1]));
    EXPECT_TRUE(host_.dispatched[2] == PollMessage(Forward(2)));
    EXPECT_EQ(host_.begun, 1);
    EXPECT_EQ(host_.committed, 1);
    EXPECT_EQ(host_.rolledBack, 0);
    
    auto poll = gov_->GetPoll(id);
    EXPECT_EQ(poll->status, PollStatus::Executed);
    EXPECT_EQ(poll->settledHeight, 15);
}

TEST_F(ExecutionTest, ExecutesOnlyOnce) {
    PollId id = PassPoll({Forward(1)});
    ASSERT_TRUE(gov_->ProcessBlock(16).ok());
    ASSERT_TRUE(gov_->ExecutePoll(id).ok());
    
    EXPECT_EQ(gov_->ExecutePoll(id).code(), Status::ALREADY_EXECUTED);
    EXPECT_EQ(host_.dispatched.size(), 1u);
    EXPECT_EQ(gov_->ExpirePoll(id).code(), Status::NOT_PASSED);
}

TEST_F(ExecutionTest, EmptyPollExecutes) {
    PollId id = PassPoll({});
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    ExecutionResult result;
    ASSERT_TRUE(gov_->ExecutePoll(id, &result).ok());
    EXPECT_EQ(result.status, PollStatus::Executed);
    EXPECT_EQ(result.dispatched, 0u);
}

TEST_F(ExecutionTest, FailedMessageRollsBackBatch) {
    UpdateConfigMessage update;
    update.votingPeriod = 50;
    PollId id = PassPoll({update, Forward(1), Forward(2), Forward(3)});
    
    // Host sees the forwards only; index 1 is the second forward
    host_.failAt = 1;
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    ExecutionResult result;
    ASSERT_TRUE(gov_->ExecutePoll(id, &result).ok());
    EXPECT_EQ(result.status, PollStatus::Failed);
    ASSERT_TRUE(result.failedIndex.has_value());
    EXPECT_EQ(*result.failedIndex, 2u);
    EXPECT_EQ(result.dispatched, 2u);
    
    EXPECT_EQ(host_.rolledBack, 1);
    EXPECT_EQ(host_.committed, 0);
    EXPECT_EQ(host_.dispatched.size(), 2u);
    
    auto poll = gov_->GetPoll(id);
    EXPECT_EQ(poll->status, PollStatus::Failed);
    EXPECT_EQ(poll->failedMessageIndex, 2u);
    EXPECT_EQ(gov_->GetParams().votingPeriod, 10);
    
    EXPECT_EQ(gov_->ExecutePoll(id).code(), Status::ALREADY_EXECUTED);
}

TEST_F(ExecutionTest, ThrowingHostFailsPoll) {
    PollId id = PassPoll({Forward(1)});
    host_.throwOnDispatch = true;
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    ExecutionResult result;
    ASSERT_TRUE(gov_->ExecutePoll(id, &result).ok());
    EXPECT_EQ(result.status, PollStatus::Failed);
    EXPECT_EQ(result.failedIndex, 0u);
    EXPECT_EQ(host_.rolledBack, 1);
}

TEST_F(ExecutionTest, ExternalMessageNeedsHost) {
    PollId id = PassPoll({Forward(1)});
    gov_->SetExecutionHost(nullptr);
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    ExecutionResult result;
    ASSERT_TRUE(gov_->ExecutePoll(id, &result).ok());
    EXPECT_EQ(result.status, PollStatus::Failed);
    EXPECT_EQ(result.failedIndex, 0u);
    EXPECT_EQ(host_.begun, 0);
}

// ============================================================================
// Parameter Updates
// ============================================================================

TEST_F(ExecutionTest, UpdateConfigAppliesOnSuccess) {
    UpdateConfigMessage update;
    update.quorumBps = 500;
    update.depositPolicy = DepositPolicy::Refund;
    PollId id = PassPoll({update});
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    ASSERT_TRUE(gov_->ExecutePoll(id).ok());
    GovernanceParams params = gov_->GetParams();
    EXPECT_EQ(params.quorumBps, 500u);
    EXPECT_EQ(params.depositPolicy, DepositPolicy::Refund);
    EXPECT_EQ(params.thresholdBps, 5000u);
    
    // Config messages never reach the host
    EXPECT_TRUE(host_.dispatched.empty());
}

TEST_F(ExecutionTest, LaterUpdateSeesEarlierOne) {
    UpdateConfigMessage first;
    first.votingPeriod = 40;
    UpdateConfigMessage second;
    second.timelockPeriod = 8;
    PollId id = PassPoll({first, second});
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    ASSERT_TRUE(gov_->ExecutePoll(id).ok());
    EXPECT_EQ(gov_->GetParams().votingPeriod, 40);
    EXPECT_EQ(gov_->GetParams().timelockPeriod, 8);
}

TEST_F(ExecutionTest, InvalidUpdateFailsPoll) {
    UpdateConfigMessage update;
    update.thresholdBps = 12000;
    PollId id = PassPoll({Forward(1), update});
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    
    ExecutionResult result;
    ASSERT_TRUE(gov_->ExecutePoll(id, &result).ok());
    EXPECT_EQ(result.status, PollStatus::Failed);
    EXPECT_EQ(result.failedIndex, 1u);
    EXPECT_EQ(host_.rolledBack, 1);
    EXPECT_TRUE(gov_->GetParams() == params_);
}

TEST_F(ExecutionTest, PollCanGrantOwnership) {
    UpdateConfigMessage update;
    update.owner = creator_;
    PollId id = PassPoll({update});
    ASSERT_TRUE(gov_->ProcessBlock(15).ok());
    ASSERT_TRUE(gov_->ExecutePoll(id).ok());
    
    UpdateConfigMessage direct;
    direct.votingPeriod = 12;
    ASSERT_TRUE(gov_->UpdateConfig(creator_, direct).ok());
    EXPECT_EQ(gov_->GetParams().votingPeriod, 12);
}
