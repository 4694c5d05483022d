// AGORA - State Store Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include <agora/crypto/sha256.h>
#include <agora/db/leveldb.h>
#include <agora/governance/governance.h>
#include <agora/store/state_store.h>
#include <agora/token/token_bank.h>

#include <array>
#include <filesystem>
#include <memory>
#include <random>

using namespace agora;
using namespace agora::governance;
using namespace agora::store;

// ============================================================================
// Test Fixture
// ============================================================================

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = CreateTestAddress(1);
        bob_ = CreateTestAddress(2);
        creator_ = CreateTestAddress(3);
        
        params_.quorumBps = 3000;
        params_.votingPeriod = 10;
        params_.timelockPeriod = 2;
        params_.expirationPeriod = 2;
        params_.proposalDeposit = 100;
        params_.depositPolicy = DepositPolicy::RefundIfQuorum;
        
        bank_.Mint(alice_, 1000);
        bank_.Mint(bob_, 1000);
        bank_.Mint(creator_, 1000);
        
        gov_ = std::make_unique<GovernanceContract>(params_, bank_);
    }
    
    AccountId CreateTestAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return AccountId(data);
    }
    
    /// Two stakers, income, one open poll with a vote and one rejected poll
    void Populate() {
        ASSERT_TRUE(gov_->Stake(alice_, 600).ok());
        ASSERT_TRUE(gov_->Stake(bob_, 400).ok());
        bank_.FundCustody(50);
        ASSERT_TRUE(gov_->DepositIncome(50).ok());
        
        PollId rejected = 0;
        ASSERT_TRUE(gov_->CreatePoll(creator_, 100, "First poll", "Nobody votes",
                                     std::nullopt, {}, &rejected).ok());
        ASSERT_TRUE(gov_->ProcessBlock(10).ok());
        ASSERT_TRUE(gov_->EndPoll(rejected).ok());
        
        UpdateConfigMessage update;
        update.quorumBps = 2000;
        PollId open = 0;
        ASSERT_TRUE(gov_->CreatePoll(creator_, 100, "Second poll", "Lower the quorum",
                                     std::string("https://agora.example/2"), {update},
                                     &open).ok());
        ASSERT_TRUE(gov_->CastVote(open, alice_, VoteChoice::Yes).ok());
        ASSERT_TRUE(gov_->CastVote(open, bob_, VoteChoice::No).ok());
    }
    
    GovernanceParams params_;
    token::InMemoryTokenBank bank_;
    std::unique_ptr<GovernanceContract> gov_;
    db::MemoryDatabase db_;
    
    AccountId alice_;
    AccountId bob_;
    AccountId creator_;
};

// ============================================================================
// Keys
// ============================================================================

TEST_F(StateStoreTest, KeysSortByPollId) {
    EXPECT_EQ(StateStore::MetaKey(), "M");
    EXPECT_EQ(StateStore::PollKey(1).size(), 9u);
    EXPECT_LT(StateStore::PollKey(255), StateStore::PollKey(256));
    EXPECT_LT(StateStore::VoteKey(1, bob_), StateStore::VoteKey(2, alice_));
    EXPECT_EQ(StateStore::StakeKey(alice_)[0], prefix::STAKE);
}

// ============================================================================
// Save and Load
// ============================================================================

TEST_F(StateStoreTest, EmptyDatabaseHasNoState) {
    StateStore store(db_);
    EXPECT_FALSE(store.HasState());
    
    GovernanceState state;
    EXPECT_EQ(store.Load(&state).code(), Status::NOT_FOUND);
    EXPECT_EQ(store.LoadContract(*gov_).code(), Status::NOT_FOUND);
}

TEST_F(StateStoreTest, RestoresContract) {
    Populate();
    StateStore store(db_);
    ASSERT_TRUE(store.SaveContract(*gov_).ok());
    EXPECT_TRUE(store.HasState());
    
    GovernanceContract restored(GovernanceParams(), bank_);
    ASSERT_TRUE(store.LoadContract(restored).ok());
    
    EXPECT_EQ(restored.GetHeight(), 10);
    EXPECT_TRUE(restored.GetParams() == params_);
    EXPECT_TRUE(restored.CheckInvariants().ok());
    
    auto poll = restored.GetPoll(2);
    ASSERT_TRUE(poll.has_value());
    EXPECT_EQ(poll->yesVotes, 600);
    EXPECT_EQ(poll->noVotes, 400);
    ASSERT_EQ(poll->messages.size(), 1u);
    EXPECT_EQ(poll->GetContentHash(), gov_->GetPoll(2)->GetContentHash());
    EXPECT_EQ(restored.GetPoll(1)->status, PollStatus::Rejected);
    
    EXPECT_EQ(restored.GetVoters(2).size(), 2u);
    EXPECT_EQ(restored.GetStakerInfo(alice_).claimable, gov_->GetStakerInfo(alice_).claimable);
    EXPECT_EQ(restored.GetStakerInfo(bob_).locked, 400);
    
    RewardState before = gov_->GetRewardState();
    RewardState after = restored.GetRewardState();
    EXPECT_TRUE(before.globalIndex == after.globalIndex);
    EXPECT_EQ(before.totalStaked, after.totalStaked);
    EXPECT_EQ(before.totalIncome, after.totalIncome);
    
    PollId next = 0;
    ASSERT_TRUE(restored.CreatePoll(creator_, 100, "Third poll", "After restart",
                                    std::nullopt, {}, &next).ok());
    EXPECT_EQ(next, 3u);
}

TEST_F(StateStoreTest, SaveReplacesStaleRecords) {
    Populate();
    StateStore store(db_);
    ASSERT_TRUE(store.SaveContract(*gov_).ok());
    
    GovernanceContract fresh(params_, bank_);
    ASSERT_TRUE(fresh.Stake(creator_, 10).ok());
    ASSERT_TRUE(store.SaveContract(fresh).ok());
    
    std::string value;
    EXPECT_TRUE(db_.Get(StateStore::StakeKey(alice_), &value).IsNotFound());
    EXPECT_TRUE(db_.Get(StateStore::PollKey(1), &value).IsNotFound());
    EXPECT_TRUE(db_.Get(StateStore::VoteKey(2, bob_), &value).IsNotFound());
    
    GovernanceState state;
    ASSERT_TRUE(store.Load(&state).ok());
    ASSERT_EQ(state.stakes.size(), 1u);
    EXPECT_EQ(state.stakes[0].account, creator_);
    EXPECT_TRUE(state.polls.empty());
    EXPECT_TRUE(state.votes.empty());
}

// ============================================================================
// Corruption
// ============================================================================

TEST_F(StateStoreTest, FlippedByteDetected) {
    Populate();
    StateStore store(db_);
    ASSERT_TRUE(store.SaveContract(*gov_).ok());
    
    std::string key = StateStore::PollKey(2);
    std::string value;
    ASSERT_TRUE(db_.Get(key, &value).ok());
    value[value.size() / 2] ^= 0x01;
    ASSERT_TRUE(db_.Put(key, value).ok());
    
    GovernanceState state;
    EXPECT_EQ(store.Load(&state).code(), Status::CORRUPTION);
    
    GovernanceContract target(params_, bank_);
    EXPECT_EQ(store.LoadContract(target).code(), Status::CORRUPTION);
    EXPECT_FALSE(target.GetPoll(1).has_value());
}

TEST_F(StateStoreTest, MissingVoteDetected) {
    Populate();
    StateStore store(db_);
    ASSERT_TRUE(store.SaveContract(*gov_).ok());
    
    ASSERT_TRUE(db_.Delete(StateStore::VoteKey(2, alice_)).ok());
    
    GovernanceState state;
    EXPECT_EQ(store.Load(&state).code(), Status::CORRUPTION);
}

TEST_F(StateStoreTest, MissingParamsDetected) {
    Populate();
    StateStore store(db_);
    ASSERT_TRUE(store.SaveContract(*gov_).ok());
    
    ASSERT_TRUE(db_.Delete(db::MakeKey(prefix::PARAMS)).ok());
    
    GovernanceState state;
    EXPECT_EQ(store.Load(&state).code(), Status::CORRUPTION);
}

TEST_F(StateStoreTest, UnknownVersionRefused) {
    StateStore store(db_);
    ASSERT_TRUE(store.SaveContract(*gov_).ok());
    
    StateMeta meta;
    meta.version = STATE_FORMAT_VERSION + 1;
    auto payload = meta.Serialize();
    
    std::string key = StateStore::MetaKey();
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(key.data()), key.size());
    hasher.Write(payload.data(), payload.size());
    Byte checksum[SHA256::OUTPUT_SIZE];
    hasher.Finalize(checksum);
    
    std::string value(payload.begin(), payload.end());
    value.append(reinterpret_cast<const char*>(checksum), sizeof(checksum));
    ASSERT_TRUE(db_.Put(key, value).ok());
    
    GovernanceState state;
    EXPECT_EQ(store.Load(&state).code(), Status::NOT_SUPPORTED);
}

// ============================================================================
// On-Disk Store
// ============================================================================

TEST_F(StateStoreTest, OpenOnDisk) {
    std::random_device rd;
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                ("agora_state_test_" + std::to_string(rd()));
    {
        auto [status, store] = StateStore::Open(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(store != nullptr);
        
        Populate();
        ASSERT_TRUE(store->SaveContract(*gov_).ok());
        
        GovernanceState state;
        ASSERT_TRUE(store->Load(&state).ok());
        EXPECT_EQ(state.polls.size(), 2u);
        EXPECT_EQ(state.votes.size(), 2u);
        EXPECT_EQ(state.nextPollId, 3u);
    }
    EXPECT_TRUE(db::DestroyDatabase(dir).ok());
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
