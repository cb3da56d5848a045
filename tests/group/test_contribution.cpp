// CHAMA - Contribution Tests
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "group_fixture.h"

namespace chama {
namespace group {
namespace test {

class ContributionTest : public GroupEngineTest {};

// ============================================================================
// Periods
// ============================================================================

TEST_F(ContributionTest, PeriodArithmetic) {
    Build();
    const Timestamp start = params_.rules.startDate;

    now_ = GENESIS;
    EXPECT_EQ(engine_->GetCurrentPeriod(), 0u);
    EXPECT_FALSE(engine_->IsContributionWindowOpen());

    At(0);
    EXPECT_EQ(engine_->GetCurrentPeriod(), 0u);
    At(1, -1);
    EXPECT_EQ(engine_->GetCurrentPeriod(), 0u);
    At(1);
    EXPECT_EQ(engine_->GetCurrentPeriod(), 1u);
    At(5, 3 * DAY);
    EXPECT_EQ(engine_->GetCurrentPeriod(), 5u);

    EXPECT_EQ(engine_->GetPeriodStart(0), start);
    EXPECT_EQ(engine_->GetPeriodStart(2), start + 2 * WEEK);
    EXPECT_EQ(engine_->GetContributionDeadline(2), start + 2 * WEEK + 6 * DAY);
}

TEST_F(ContributionTest, WindowOpensAndCloses) {
    Build();

    At(0, 6 * DAY);
    EXPECT_TRUE(engine_->IsContributionWindowOpen());
    At(0, 6 * DAY + 12 * 3600);
    EXPECT_FALSE(engine_->IsContributionWindowOpen());
    At(1);
    EXPECT_TRUE(engine_->IsContributionWindowOpen());

    now_ = params_.rules.endDate + 1;
    EXPECT_FALSE(engine_->IsContributionWindowOpen());
}

// ============================================================================
// Contribute
// ============================================================================

TEST_F(ContributionTest, ContributeRecordsAndMovesFunds) {
    BuildWithMembers();
    At(0, 2 * DAY);
    events_.clear();
    const Amount before = ledger_.Balance(user1_);

    ASSERT_TRUE(engine_->Contribute(user1_, CONTRIBUTION).ok());

    EXPECT_EQ(engine_->GetContributionTimestamp(user1_, 0), now_);
    EXPECT_EQ(engine_->GetContributionTimestamp(user1_, 1), 0);
    EXPECT_EQ(engine_->GetTotalFunds(), CONTRIBUTION);
    EXPECT_EQ(engine_->GetMemberDetails(user1_)->totalContributed, CONTRIBUTION);
    EXPECT_EQ(ledger_.Balance(user1_), before - CONTRIBUTION);
    EXPECT_EQ(ledger_.Balance(groupAddress_), CONTRIBUTION);

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, EventType::ContributionMade);
    EXPECT_EQ(events_[0].account, user1_);
    EXPECT_EQ(events_[0].amount, CONTRIBUTION);
    EXPECT_EQ(events_[0].index, 0u);
}

TEST_F(ContributionTest, OneContributionPerPeriod) {
    BuildWithMembers();
    ASSERT_TRUE(engine_->Contribute(user1_, CONTRIBUTION).ok());

    Status s = engine_->Contribute(user1_, CONTRIBUTION);
    EXPECT_EQ(s.code(), Status::PRECONDITION);
    EXPECT_EQ(s.message(), "Already contributed this period");
    EXPECT_EQ(engine_->GetTotalFunds(), CONTRIBUTION);

    At(1);
    EXPECT_TRUE(engine_->Contribute(user1_, CONTRIBUTION).ok());
    EXPECT_EQ(engine_->GetTotalFunds(), 2 * CONTRIBUTION);
}

TEST_F(ContributionTest, IncorrectAmountRejected) {
    BuildWithMembers();

    Status s = engine_->Contribute(user1_, CONTRIBUTION - 1);
    EXPECT_EQ(s.code(), Status::VALUE_MISMATCH);
    EXPECT_EQ(s.message(), "Incorrect contribution amount");
    EXPECT_EQ(engine_->Contribute(user1_, 0).code(), Status::VALUE_MISMATCH);
    EXPECT_EQ(engine_->GetTotalFunds(), 0);
}

TEST_F(ContributionTest, ClosedWindowRejected) {
    BuildWithMembers();
    At(0, 6 * DAY + 12 * 3600);

    EXPECT_EQ(engine_->Contribute(user1_, CONTRIBUTION).message(), "Contribution window closed");
    EXPECT_EQ(engine_->GetContributionTimestamp(user1_, 0), 0);
}

TEST_F(ContributionTest, NonMemberRejected) {
    BuildWithMembers();

    Status s = engine_->Contribute(outsider_, CONTRIBUTION);
    EXPECT_EQ(s.code(), Status::UNAUTHORIZED);
    EXPECT_EQ(s.message(), "Not an active member");
}

TEST_F(ContributionTest, EndedGroupRejected) {
    BuildWithMembers();
    now_ = params_.rules.endDate + 1;
    EXPECT_EQ(engine_->Contribute(user1_, CONTRIBUTION).message(), "Group has ended");
}

TEST_F(ContributionTest, TokenGroupPullsToken) {
    const Address token = AddressFromLabel("token");
    params_.contributionToken = token;
    ledger_.Credit(user1_, token, COIN);
    BuildWithMembers();
    const Amount native = ledger_.Balance(user1_);

    EXPECT_EQ(engine_->Contribute(user1_, CONTRIBUTION).message(), "Native value not accepted");
    ASSERT_TRUE(engine_->Contribute(user1_, 0).ok());

    EXPECT_EQ(ledger_.Balance(user1_, token), COIN - CONTRIBUTION);
    EXPECT_EQ(ledger_.Balance(groupAddress_, token), CONTRIBUTION);
    EXPECT_EQ(ledger_.Balance(user1_), native);
}

TEST_F(ContributionTest, UnfundedMemberFails) {
    const Address broke = AddressFromLabel("broke");
    BuildWithMembers();
    ASSERT_TRUE(engine_->Join(broke).ok());
    events_.clear();

    Status s = engine_->Contribute(broke, CONTRIBUTION);
    EXPECT_EQ(s.code(), Status::TRANSFER_FAILED);
    EXPECT_EQ(engine_->GetContributionTimestamp(broke, 0), 0);
    EXPECT_EQ(engine_->GetTotalFunds(), 0);
    EXPECT_TRUE(events_.empty());
}

// ============================================================================
// Missed Contributions
// ============================================================================

TEST_F(ContributionTest, MissedPeriodsDetectedOnContribute) {
    BuildWithMembers();
    At(2, DAY);
    events_.clear();

    ASSERT_TRUE(engine_->Contribute(user1_, CONTRIBUTION).ok());

    auto m = engine_->GetMemberDetails(user1_);
    EXPECT_EQ(m->missedContributions, 2u);
    EXPECT_EQ(m->nextCheckPeriod, 2u);

    ASSERT_EQ(events_.size(), 3u);
    EXPECT_EQ(events_[0].type, EventType::MissedContributionDetected);
    EXPECT_EQ(events_[0].index, 0u);
    EXPECT_EQ(events_[1].type, EventType::MissedContributionDetected);
    EXPECT_EQ(events_[1].index, 1u);
    EXPECT_EQ(events_[2].type, EventType::ContributionMade);
    EXPECT_EQ(events_[2].index, 2u);
}

TEST_F(ContributionTest, ContributedPeriodsNotCountedAsMissed) {
    BuildWithMembers();
    ASSERT_TRUE(engine_->Contribute(user1_, CONTRIBUTION).ok());
    At(2);
    ASSERT_TRUE(engine_->Contribute(user1_, CONTRIBUTION).ok());

    EXPECT_EQ(engine_->GetMemberDetails(user1_)->missedContributions, 1u);
    EXPECT_EQ(CountEvents(EventType::MissedContributionDetected), 1u);
}

TEST_F(ContributionTest, PeriodInGraceNotYetMissed) {
    BuildWithMembers();
    At(0, 5 * DAY + 3600);

    ASSERT_TRUE(engine_->CheckMissedContributions(creator_, user1_).ok());
    EXPECT_EQ(engine_->GetMemberDetails(user1_)->missedContributions, 0u);
    EXPECT_EQ(engine_->GetMemberDetails(user1_)->nextCheckPeriod, 0u);
}

TEST_F(ContributionTest, DetectionStopsAtEndDate) {
    params_.rules.endDate = params_.rules.startDate + 20 * DAY;
    settings_.maxMissedContributions = 10;
    BuildWithMembers();
    now_ = params_.rules.startDate + 100 * DAY;

    ASSERT_TRUE(engine_->CheckMissedContributions(creator_, user1_).ok());

    auto m = engine_->GetMemberDetails(user1_);
    EXPECT_EQ(m->missedContributions, 3u);
    EXPECT_EQ(m->nextCheckPeriod, 3u);
}

TEST_F(ContributionTest, CheckRequiresAdminAndActiveTarget) {
    BuildWithMembers();
    At(3);

    EXPECT_EQ(engine_->CheckMissedContributions(user1_, user2_).message(), "Not admin");
    EXPECT_EQ(engine_->CheckMissedContributions(creator_, outsider_).code(),
              Status::UNAUTHORIZED);
    EXPECT_EQ(engine_->GetMemberDetails(user2_)->missedContributions, 0u);
}

TEST_F(ContributionTest, FailedTransferRollsBackDetection) {
    BuildWithMembers();
    At(2);
    ledger_.SetFailing(true);
    events_.clear();

    EXPECT_EQ(engine_->Contribute(user1_, CONTRIBUTION).code(), Status::TRANSFER_FAILED);

    auto m = engine_->GetMemberDetails(user1_);
    EXPECT_EQ(m->missedContributions, 0u);
    EXPECT_EQ(m->nextCheckPeriod, 0u);
    EXPECT_TRUE(events_.empty());

    ledger_.SetFailing(false);
    ASSERT_TRUE(engine_->Contribute(user1_, CONTRIBUTION).ok());
    EXPECT_EQ(engine_->GetMemberDetails(user1_)->missedContributions, 2u);
}

} // namespace test
} // namespace group
} // namespace chama
