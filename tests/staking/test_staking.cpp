// AGORA - Staking Module Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include <agora/staking/reward_distributor.h>
#include <agora/staking/stake_ledger.h>
#include <agora/token/token_bank.h>

#include <cstdint>
#include <memory>
#include <vector>

using namespace agora;
using namespace agora::staking;

// ============================================================================
// Test Fixture
// ============================================================================

class StakingTest : public ::testing::Test {
protected:
    void SetUp() override {
        distributor_ = std::make_unique<RewardDistributor>(index_);
        ledger_ = std::make_unique<StakeLedger>(*distributor_, bank_);
        
        for (uint8_t i = 1; i <= 4; ++i) {
            accounts_.push_back(CreateTestAddress(i));
            bank_.Mint(accounts_.back(), 10000);
        }
    }
    
    AccountId CreateTestAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return AccountId(data);
    }
    
    /// Income arrives in custody before it is reported
    Status Income(Amount amount) {
        bank_.FundCustody(amount);
        return distributor_->DepositIncome(amount);
    }
    
    RewardIndex index_;
    token::InMemoryTokenBank bank_;
    std::unique_ptr<RewardDistributor> distributor_;
    std::unique_ptr<StakeLedger> ledger_;
    std::vector<AccountId> accounts_;
};

// ============================================================================
// Stake / Unstake
// ============================================================================

TEST_F(StakingTest, StakeMovesTokensIntoCustody) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 400).ok());
    
    EXPECT_EQ(ledger_->BalanceOf(accounts_[0]), 400);
    EXPECT_EQ(ledger_->TotalStaked(), 400);
    EXPECT_EQ(bank_.BalanceOf(accounts_[0]), 9600);
    EXPECT_EQ(bank_.CustodyBalance(), 400);
    EXPECT_EQ(ledger_->StakerCount(), 1u);
}

TEST_F(StakingTest, StakeRejectsNonPositive) {
    EXPECT_EQ(ledger_->Stake(accounts_[0], 0).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(ledger_->Stake(accounts_[0], -1).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(ledger_->TotalStaked(), 0);
}

TEST_F(StakingTest, StakeBeyondMoneyRange) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 10).ok());
    
    EXPECT_EQ(ledger_->Stake(accounts_[1], INT64_MAX).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(ledger_->Stake(accounts_[1], MAX_MONEY).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(ledger_->TotalStaked(), 10);
    EXPECT_EQ(bank_.BalanceOf(accounts_[1]), 10000);
    
    bank_.Mint(accounts_[1], MAX_MONEY - 10000);
    EXPECT_TRUE(ledger_->Stake(accounts_[1], MAX_MONEY - 10).ok());
    EXPECT_EQ(ledger_->TotalStaked(), MAX_MONEY);
    EXPECT_EQ(ledger_->Stake(accounts_[0], 1).code(), Status::INVALID_AMOUNT);
}

TEST_F(StakingTest, StakeRefusedByBankLeavesLedgerUntouched) {
    Status s = ledger_->Stake(accounts_[0], 10001);
    EXPECT_EQ(s.code(), Status::INSUFFICIENT_BALANCE);
    EXPECT_EQ(ledger_->BalanceOf(accounts_[0]), 0);
    EXPECT_EQ(ledger_->TotalStaked(), 0);
    EXPECT_FALSE(ledger_->GetStake(accounts_[0]).has_value());
}

TEST_F(StakingTest, UnstakeReturnsTokens) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 500).ok());
    ASSERT_TRUE(ledger_->Unstake(accounts_[0], 200).ok());
    
    EXPECT_EQ(ledger_->BalanceOf(accounts_[0]), 300);
    EXPECT_EQ(ledger_->TotalStaked(), 300);
    EXPECT_EQ(bank_.BalanceOf(accounts_[0]), 9700);
}

TEST_F(StakingTest, UnstakeErrors) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 100).ok());
    
    EXPECT_EQ(ledger_->Unstake(accounts_[0], 0).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(ledger_->Unstake(accounts_[0], 101).code(), Status::INSUFFICIENT_STAKE);
    EXPECT_EQ(ledger_->Unstake(accounts_[1], 1).code(), Status::INSUFFICIENT_STAKE);
    EXPECT_EQ(ledger_->BalanceOf(accounts_[0]), 100);
}

TEST_F(StakingTest, LockedStakeCannotBeWithdrawn) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 100).ok());
    
    EXPECT_EQ(ledger_->Unstake(accounts_[0], 50, 60).code(), Status::LOCKED_BY_ACTIVE_POLL);
    EXPECT_TRUE(ledger_->Unstake(accounts_[0], 40, 60).ok());
    EXPECT_EQ(ledger_->BalanceOf(accounts_[0]), 60);
}

TEST_F(StakingTest, UnstakeAllKeepsLockedPart) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 100).ok());
    
    Amount withdrawn = 0;
    ASSERT_TRUE(ledger_->UnstakeAll(accounts_[0], 30, &withdrawn).ok());
    EXPECT_EQ(withdrawn, 70);
    EXPECT_EQ(ledger_->BalanceOf(accounts_[0]), 30);
    
    EXPECT_EQ(ledger_->UnstakeAll(accounts_[0], 30).code(), Status::LOCKED_BY_ACTIVE_POLL);
    EXPECT_EQ(ledger_->UnstakeAll(accounts_[1]).code(), Status::INSUFFICIENT_STAKE);
}

TEST_F(StakingTest, ConservationOfStake) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 1000).ok());
    ASSERT_TRUE(ledger_->Stake(accounts_[1], 250).ok());
    ASSERT_TRUE(ledger_->Unstake(accounts_[0], 400).ok());
    ASSERT_TRUE(ledger_->Stake(accounts_[2], 75).ok());
    EXPECT_FALSE(ledger_->Unstake(accounts_[1], 300).ok());
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 5).ok());
    
    EXPECT_EQ(ledger_->SumOfStakes(), ledger_->TotalStaked());
    EXPECT_EQ(ledger_->TotalStaked(), 1000 - 400 + 250 + 75 + 5);
    EXPECT_EQ(bank_.TotalSupply(), 40000);
}

// ============================================================================
// Rewards
// ============================================================================

TEST_F(StakingTest, IncomeSplitProportionally) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 300).ok());
    ASSERT_TRUE(ledger_->Stake(accounts_[1], 700).ok());
    ASSERT_TRUE(Income(100).ok());
    
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[0]), 30);
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[1]), 70);
    
    Amount claimed = 0;
    ASSERT_TRUE(ledger_->ClaimReward(accounts_[0], &claimed).ok());
    EXPECT_EQ(claimed, 30);
    EXPECT_EQ(bank_.BalanceOf(accounts_[0]), 10000 - 300 + 30);
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[0]), 0);
    EXPECT_EQ(ledger_->GetStake(accounts_[0])->totalClaimed, 30);
}

TEST_F(StakingTest, LateStakerEarnsOnlyLaterIncome) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 100).ok());
    ASSERT_TRUE(Income(50).ok());
    
    ASSERT_TRUE(ledger_->Stake(accounts_[1], 100).ok());
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[1]), 0);
    
    ASSERT_TRUE(Income(50).ok());
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[0]), 75);
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[1]), 25);
}

TEST_F(StakingTest, RewardSurvivesUnstake) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 100).ok());
    ASSERT_TRUE(Income(40).ok());
    ASSERT_TRUE(ledger_->Unstake(accounts_[0], 100).ok());
    
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[0]), 40);
    ASSERT_TRUE(ledger_->ClaimReward(accounts_[0]).ok());
    EXPECT_EQ(bank_.CustodyBalance(), 0);
}

TEST_F(StakingTest, RemainderCarriedToNextDeposit) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(ledger_->Stake(accounts_[i], 1).ok());
    }
    
    ASSERT_TRUE(Income(1).ok());
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[0]), 0);
    
    ASSERT_TRUE(Income(2).ok());
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(ledger_->ClaimableReward(accounts_[i]), 1);
    }
}

TEST_F(StakingTest, PayoutsNeverExceedIncome) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 333).ok());
    ASSERT_TRUE(ledger_->Stake(accounts_[1], 333).ok());
    ASSERT_TRUE(ledger_->Stake(accounts_[2], 334).ok());
    ASSERT_TRUE(Income(7).ok());
    ASSERT_TRUE(Income(13).ok());
    
    Amount total = 0;
    for (int i = 0; i < 3; ++i) {
        total += ledger_->ClaimableReward(accounts_[i]);
    }
    EXPECT_LE(total, 20);
    EXPECT_GE(total, 18);
}

TEST_F(StakingTest, IncomeWithheldUntilFirstStake) {
    Status s = Income(90);
    EXPECT_EQ(s.code(), Status::NO_STAKERS);
    EXPECT_EQ(distributor_->WithheldIncome(), 90);
    EXPECT_EQ(index_.totalIncome, 90);
    
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 10).ok());
    EXPECT_EQ(distributor_->WithheldIncome(), 0);
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[0]), 90);
}

TEST_F(StakingTest, ZeroIncomeIsNoOp) {
    EXPECT_TRUE(distributor_->DepositIncome(0).ok());
    EXPECT_EQ(distributor_->WithheldIncome(), 0);
    EXPECT_EQ(distributor_->DepositIncome(-1).code(), Status::INVALID_AMOUNT);
}

TEST_F(StakingTest, IncomeBeyondMoneyRange) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 10).ok());
    
    EXPECT_EQ(distributor_->DepositIncome(INT64_MAX).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(index_.totalIncome, 0);
    
    ASSERT_TRUE(Income(MAX_MONEY - 5).ok());
    EXPECT_EQ(distributor_->DepositIncome(6).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(index_.totalIncome, MAX_MONEY - 5);
    ASSERT_TRUE(Income(5).ok());
    
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[0]), MAX_MONEY);
}

TEST_F(StakingTest, WithheldIncomeBeyondMoneyRange) {
    ASSERT_EQ(Income(MAX_MONEY).code(), Status::NO_STAKERS);
    EXPECT_EQ(distributor_->DepositIncome(1).code(), Status::INVALID_AMOUNT);
    EXPECT_EQ(distributor_->WithheldIncome(), MAX_MONEY);
    
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 1).ok());
    EXPECT_EQ(ledger_->ClaimableReward(accounts_[0]), MAX_MONEY);
}

TEST_F(StakingTest, NothingToClaim) {
    EXPECT_EQ(ledger_->ClaimReward(accounts_[0]).code(), Status::NOTHING_TO_CLAIM);
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 10).ok());
    EXPECT_EQ(ledger_->ClaimReward(accounts_[0]).code(), Status::NOTHING_TO_CLAIM);
}

TEST_F(StakingTest, IndexIsMonotonic) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 1000).ok());
    uint128_t last = distributor_->GlobalIndex();
    for (Amount income : {5, 0, 17, 1}) {
        ASSERT_TRUE(Income(income).ok());
        EXPECT_TRUE(distributor_->GlobalIndex() >= last);
        last = distributor_->GlobalIndex();
    }
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(StakingTest, StakeInfoSerialization) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 100).ok());
    ASSERT_TRUE(Income(10).ok());
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 1).ok());
    
    StakeInfo stake = *ledger_->GetStake(accounts_[0]);
    auto bytes = stake.Serialize();
    auto decoded = StakeInfo::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->account, stake.account);
    EXPECT_EQ(decoded->amount, 101);
    EXPECT_EQ(decoded->pendingReward, 10);
    EXPECT_TRUE(decoded->rewardIndexSnapshot == stake.rewardIndexSnapshot);
    
    bytes.pop_back();
    EXPECT_FALSE(StakeInfo::Deserialize(bytes.data(), bytes.size()).has_value());
}

TEST_F(StakingTest, RestoreRejectsMismatchedTotal) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 100).ok());
    auto stakes = ledger_->GetAllStakes();
    stakes[0].amount = 99;
    
    EXPECT_EQ(ledger_->Restore(stakes).code(), Status::CORRUPTION);
    EXPECT_EQ(ledger_->BalanceOf(accounts_[0]), 100);
    
    stakes[0].amount = 100;
    EXPECT_TRUE(ledger_->Restore(stakes).ok());
}

TEST_F(StakingTest, RestoreRejectsDuplicates) {
    ASSERT_TRUE(ledger_->Stake(accounts_[0], 100).ok());
    auto stakes = ledger_->GetAllStakes();
    stakes.push_back(stakes[0]);
    stakes[0].amount = 50;
    stakes[1].amount = 50;
    EXPECT_EQ(ledger_->Restore(stakes).code(), Status::CORRUPTION);
}
