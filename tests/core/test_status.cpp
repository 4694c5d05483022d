// AGORA - Status Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include <agora/core/status.h>

using namespace agora;

TEST(StatusTest, DefaultIsOk) {
    Status s;
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.ToString(), "OK");
    EXPECT_EQ(s.category(), ErrorCategory::None);
}

TEST(StatusTest, ToStringIncludesMessage) {
    Status s = Status::AlreadyVoted("poll 3");
    EXPECT_FALSE(s.ok());
    EXPECT_TRUE(s == Status::ALREADY_VOTED);
    EXPECT_EQ(s.ToString(), "AlreadyVoted: poll 3");
    EXPECT_EQ(Status::NothingToClaim().ToString(), "NothingToClaim");
}

TEST(StatusTest, Categories) {
    EXPECT_EQ(Status::InvalidAmount().category(), ErrorCategory::Validation);
    EXPECT_EQ(Status::InsufficientDeposit().category(), ErrorCategory::Validation);
    EXPECT_EQ(Status::InvalidHeight().category(), ErrorCategory::Validation);
    
    EXPECT_EQ(Status::AlreadyVoted().category(), ErrorCategory::StateConflict);
    EXPECT_EQ(Status::TimelockNotExpired().category(), ErrorCategory::StateConflict);
    EXPECT_EQ(Status::LockedByActivePoll().category(), ErrorCategory::StateConflict);
    
    EXPECT_EQ(Status::NoStakers().category(), ErrorCategory::Resource);
    EXPECT_EQ(Status::PollNotFound().category(), ErrorCategory::Resource);
    
    EXPECT_EQ(Status::Unauthorized().category(), ErrorCategory::Authorization);
    
    EXPECT_EQ(Status::Corruption().category(), ErrorCategory::Storage);
    EXPECT_EQ(Status::IOError().category(), ErrorCategory::Storage);
}

TEST(StatusTest, CategoryNames) {
    EXPECT_STREQ(ErrorCategoryToString(ErrorCategory::StateConflict), "StateConflict");
    EXPECT_STREQ(Status::CodeToString(Status::EXECUTION_WINDOW_CLOSED), "ExecutionWindowClosed");
}
