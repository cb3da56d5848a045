// CHAMA - Governance Tests
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "group_fixture.h"

namespace chama {
namespace group {
namespace test {

class GovernanceTest : public GroupEngineTest {
protected:
    uint64_t Propose(ProposalType type, const Address& target) {
        uint64_t id = 0;
        EXPECT_TRUE(engine_->CreateProposal(user1_, type, target, 0, "test", &id).ok());
        return id;
    }

    void Vote(uint64_t id, std::initializer_list<std::pair<Address, bool>> ballots) {
        for (const auto& b : ballots) {
            EXPECT_TRUE(engine_->VoteOnProposal(b.first, id, b.second).ok());
        }
    }

    void EndVoting() { Advance(settings_.proposalDuration + 1); }
};

// ============================================================================
// Proposals
// ============================================================================

TEST_F(GovernanceTest, CreateProposal) {
    BuildWithMembers();
    events_.clear();

    uint64_t id = 0;
    ASSERT_TRUE(engine_->CreateProposal(user1_, ProposalType::AddAdmin, user2_, 7,
                                        "promote", &id).ok());
    EXPECT_EQ(id, 1u);
    EXPECT_EQ(engine_->GetProposalCount(), 1u);

    auto p = engine_->GetProposal(id);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->type, ProposalType::AddAdmin);
    EXPECT_EQ(p->proposer, user1_);
    EXPECT_EQ(p->target, user2_);
    EXPECT_EQ(p->value, 7);
    EXPECT_EQ(p->description, "promote");
    EXPECT_EQ(p->createdAt, now_);
    EXPECT_FALSE(p->executed);

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, EventType::ProposalCreated);
    EXPECT_EQ(events_[0].index, 1u);
    EXPECT_EQ(events_[0].other, user2_);

    EXPECT_EQ(Propose(ProposalType::KickMember, user3_), 2u);
    EXPECT_FALSE(engine_->GetProposal(0).has_value());
    EXPECT_FALSE(engine_->GetProposal(3).has_value());
}

TEST_F(GovernanceTest, CreateValidation) {
    BuildWithMembers();
    EXPECT_EQ(engine_->CreateProposal(outsider_, ProposalType::AddAdmin, user2_, 0, "").code(),
              Status::UNAUTHORIZED);
    EXPECT_EQ(engine_->CreateProposal(user1_, ProposalType::AddAdmin, Address(), 0, "").message(),
              "Invalid address");
    EXPECT_EQ(engine_->GetProposalCount(), 0u);
}

// ============================================================================
// Voting
// ============================================================================

TEST_F(GovernanceTest, VoteTallies) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::AddAdmin, user2_);
    events_.clear();

    Vote(id, {{user1_, true}, {user2_, true}, {user3_, false}});

    auto p = engine_->GetProposal(id);
    EXPECT_EQ(p->votesFor, 2u);
    EXPECT_EQ(p->votesAgainst, 1u);
    EXPECT_TRUE(engine_->HasVoted(id, user3_));
    EXPECT_FALSE(engine_->HasVoted(id, creator_));

    ASSERT_EQ(events_.size(), 3u);
    EXPECT_EQ(events_[2].type, EventType::VoteCast);
    EXPECT_FALSE(events_[2].flag);
}

TEST_F(GovernanceTest, VoteValidation) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::AddAdmin, user2_);

    EXPECT_EQ(engine_->VoteOnProposal(user1_, 9, true).message(), "Proposal does not exist");
    EXPECT_EQ(engine_->VoteOnProposal(outsider_, id, true).code(), Status::UNAUTHORIZED);

    ASSERT_TRUE(engine_->VoteOnProposal(user1_, id, true).ok());
    EXPECT_EQ(engine_->VoteOnProposal(user1_, id, false).message(), "Already voted");

    Advance(settings_.proposalDuration);
    EXPECT_TRUE(engine_->VoteOnProposal(user2_, id, true).ok());
    Advance(1);
    EXPECT_EQ(engine_->VoteOnProposal(user3_, id, true).message(), "Voting period over");
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(GovernanceTest, RequiredVotesRoundsUp) {
    BuildWithMembers();
    EXPECT_EQ(engine_->GetRequiredVotes(), 2u);

    ASSERT_TRUE(engine_->Leave(user3_).ok());
    EXPECT_EQ(engine_->GetRequiredVotes(), 2u);
    ASSERT_TRUE(engine_->Leave(user2_).ok());
    EXPECT_EQ(engine_->GetRequiredVotes(), 1u);
}

TEST_F(GovernanceTest, QuorumCeilingBlocksTwoOfFive) {
    BuildWithMembers();
    ASSERT_TRUE(engine_->Join(outsider_).ok());
    ASSERT_EQ(engine_->GetActiveMemberCount(), 5u);
    EXPECT_EQ(engine_->GetRequiredVotes(), 3u);

    uint64_t id = Propose(ProposalType::AddAdmin, user2_);
    Vote(id, {{user1_, true}, {user3_, true}});
    EndVoting();

    Status s = engine_->ExecuteProposal(creator_, id);
    EXPECT_EQ(s.message(), "Insufficient participation");
    EXPECT_FALSE(engine_->IsAdmin(user2_));
    EXPECT_FALSE(engine_->GetProposal(id)->executed);
}

TEST_F(GovernanceTest, ExecuteAddAdmin) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::AddAdmin, user2_);
    Vote(id, {{user1_, true}, {user3_, true}});

    EXPECT_EQ(engine_->ExecuteProposal(creator_, id).message(), "Voting still active");

    EndVoting();
    events_.clear();
    ASSERT_TRUE(engine_->ExecuteProposal(creator_, id).ok());

    EXPECT_TRUE(engine_->IsAdmin(user2_));
    EXPECT_TRUE(engine_->GetProposal(id)->executed);
    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0].type, EventType::AdminAdded);
    EXPECT_EQ(events_[1].type, EventType::ProposalExecuted);

    EXPECT_EQ(engine_->ExecuteProposal(creator_, id).message(), "Proposal already executed");
    EXPECT_EQ(engine_->VoteOnProposal(creator_, id, true).message(), "Proposal already executed");
}

TEST_F(GovernanceTest, ExecuteRequiresAdmin) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::AddAdmin, user2_);
    Vote(id, {{user1_, true}, {user3_, true}});
    EndVoting();

    EXPECT_EQ(engine_->ExecuteProposal(user1_, id).message(), "Not admin");
    EXPECT_EQ(engine_->ExecuteProposal(creator_, 5).message(), "Proposal does not exist");
}

TEST_F(GovernanceTest, InsufficientParticipation) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::AddAdmin, user2_);
    Vote(id, {{user1_, true}});
    EndVoting();

    EXPECT_EQ(engine_->ExecuteProposal(creator_, id).message(), "Insufficient participation");
    EXPECT_FALSE(engine_->IsAdmin(user2_));
}

TEST_F(GovernanceTest, TieRejected) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::AddAdmin, user2_);
    Vote(id, {{user1_, true}, {user3_, false}});
    EndVoting();

    EXPECT_EQ(engine_->ExecuteProposal(creator_, id).message(), "Proposal rejected");
    EXPECT_FALSE(engine_->GetProposal(id)->executed);
}

TEST_F(GovernanceTest, ExecuteRemoveAdmin) {
    BuildWithMembers();
    ASSERT_TRUE(engine_->AddAdmin(creator_, user3_).ok());
    uint64_t id = Propose(ProposalType::RemoveAdmin, user3_);
    Vote(id, {{user1_, true}, {user2_, true}});
    EndVoting();

    ASSERT_TRUE(engine_->ExecuteProposal(creator_, id).ok());
    EXPECT_FALSE(engine_->IsAdmin(user3_));
}

TEST_F(GovernanceTest, CreatorCannotBeVotedOut) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::RemoveAdmin, creator_);
    Vote(id, {{user1_, true}, {user2_, true}});
    EndVoting();
    events_.clear();

    EXPECT_EQ(engine_->ExecuteProposal(creator_, id).message(), "Cannot remove creator");
    EXPECT_TRUE(engine_->IsAdmin(creator_));
    EXPECT_FALSE(engine_->GetProposal(id)->executed);
    EXPECT_TRUE(events_.empty());
}

TEST_F(GovernanceTest, ExecuteKickMember) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::KickMember, user3_);
    Vote(id, {{user1_, true}, {user2_, true}});
    EndVoting();
    events_.clear();

    ASSERT_TRUE(engine_->ExecuteProposal(creator_, id).ok());
    EXPECT_FALSE(engine_->IsActiveMember(user3_));
    EXPECT_EQ(engine_->GetActiveMemberCount(), 3u);
    EXPECT_EQ(events_[0].type, EventType::MemberKicked);
    EXPECT_EQ(events_[0].account, user3_);
}

TEST_F(GovernanceTest, ExecuteCancelPunishment) {
    BuildWithMembers();
    ASSERT_TRUE(engine_->PunishMember(creator_, user3_, PunishmentAction::Ban, "x").ok());
    uint64_t id = Propose(ProposalType::CancelPunishment, user3_);
    Vote(id, {{user1_, true}, {user2_, true}});
    EndVoting();

    ASSERT_TRUE(engine_->ExecuteProposal(creator_, id).ok());
    EXPECT_FALSE(engine_->HasActivePunishment(user3_));
    EXPECT_TRUE(engine_->IsActiveMember(user3_));
    EXPECT_EQ(CountEvents(EventType::PunishmentCancelled), 1u);
}

TEST_F(GovernanceTest, CancelPunishmentWithoutPunishmentFails) {
    BuildWithMembers();
    uint64_t id = Propose(ProposalType::CancelPunishment, user3_);
    Vote(id, {{user1_, true}, {user2_, true}});
    EndVoting();

    EXPECT_EQ(engine_->ExecuteProposal(creator_, id).message(), "No active punishment");
}

} // namespace test
} // namespace group
} // namespace chama
