// CHAMA - Group Registry Tests
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "group_fixture.h"

#include "chama/group/registry.h"

namespace chama {
namespace group {
namespace test {

class GroupRegistryTest : public GroupEngineTest {
protected:
    void SetUp() override {
        GroupEngineTest::SetUp();
        owner_ = AddressFromLabel("owner");
        registry_ = std::make_unique<GroupRegistry>(owner_, ledger_, [this] { return now_; });
        registry_->SetEventCallback([this](const GroupEvent& ev) { events_.push_back(ev); });
    }

    Status Create(const GroupParams& params, std::shared_ptr<GroupEngine>* out = nullptr) {
        auto result = registry_->CreateGroup(creator_, params);
        if (out) *out = result.second;
        return result.first;
    }

    Address owner_;
    std::unique_ptr<GroupRegistry> registry_;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(GroupRegistryTest, CreateGroup) {
    params_.creator = outsider_;
    std::shared_ptr<GroupEngine> group;
    ASSERT_TRUE(Create(params_, &group).ok());
    ASSERT_NE(group, nullptr);

    EXPECT_EQ(group->GetCreator(), creator_);
    EXPECT_TRUE(group->IsAdmin(creator_));
    EXPECT_FALSE(group->IsAdmin(outsider_));
    EXPECT_EQ(group->GetRules().name, "Test Chama");
    EXPECT_EQ(group->GetAddress(), GroupRegistry::DeriveGroupAddress(creator_, 0));

    EXPECT_EQ(registry_->GetGroupCount(), 1u);
    EXPECT_EQ(registry_->GetGroup(group->GetAddress()), group);
    EXPECT_EQ(registry_->GetCreatorGroups(creator_),
              std::vector<Address>{group->GetAddress()});
    EXPECT_TRUE(registry_->GetCreatorGroups(user1_).empty());
    EXPECT_EQ(registry_->GetGroup(outsider_), nullptr);

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, EventType::GroupCreated);
    EXPECT_EQ(events_[0].group, group->GetAddress());
    EXPECT_EQ(events_[0].account, creator_);
    EXPECT_EQ(events_[0].detail, "Test Chama");
    EXPECT_EQ(events_[0].timestamp, now_);
}

TEST_F(GroupRegistryTest, GroupAddressesAreDistinct) {
    std::shared_ptr<GroupEngine> a, b;
    ASSERT_TRUE(Create(params_, &a).ok());
    ASSERT_TRUE(Create(params_, &b).ok());

    EXPECT_NE(a->GetAddress(), b->GetAddress());
    EXPECT_EQ(registry_->GetAllGroups().size(), 2u);
    EXPECT_NE(GroupRegistry::DeriveGroupAddress(creator_, 0),
              GroupRegistry::DeriveGroupAddress(user1_, 0));
}

TEST_F(GroupRegistryTest, CreatedGroupForwardsEvents) {
    std::shared_ptr<GroupEngine> group;
    ASSERT_TRUE(Create(params_, &group).ok());
    events_.clear();

    At(0);
    ASSERT_TRUE(group->Join(user1_).ok());
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, EventType::MemberJoined);
    EXPECT_EQ(events_[0].group, group->GetAddress());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(GroupRegistryTest, RejectsBadName) {
    params_.rules.name = "";
    EXPECT_EQ(Create(params_).message(), "Invalid name length");
    params_.rules.name = std::string(MAX_NAME_LENGTH + 1, 'x');
    EXPECT_EQ(Create(params_).message(), "Invalid name length");
    params_.rules.name = std::string(MAX_NAME_LENGTH, 'x');
    EXPECT_TRUE(Create(params_).ok());
}

TEST_F(GroupRegistryTest, RejectsBadContribution) {
    params_.rules.contributionAmount = MIN_CONTRIBUTION - 1;
    Status s = Create(params_);
    EXPECT_EQ(s.code(), Status::VALUE_MISMATCH);
    EXPECT_EQ(s.message(), "Invalid contribution amount");

    params_.rules.contributionAmount = MAX_CONTRIBUTION + 1;
    EXPECT_EQ(Create(params_).code(), Status::VALUE_MISMATCH);
}

TEST_F(GroupRegistryTest, RejectsBadMemberLimit) {
    params_.rules.maxMembers = 1;
    EXPECT_EQ(Create(params_).code(), Status::CAPACITY);
    params_.rules.maxMembers = MAX_MEMBERS + 1;
    EXPECT_EQ(Create(params_).message(), "Invalid max members");
}

TEST_F(GroupRegistryTest, RejectsBadDates) {
    params_.rules.startDate = now_;
    EXPECT_EQ(Create(params_).message(), "Start date must be in future");

    params_.rules.startDate = now_ + DAY;
    params_.rules.endDate = params_.rules.startDate;
    EXPECT_EQ(Create(params_).message(), "Invalid end date");

    params_.rules.endDate = now_ + MAX_GROUP_DURATION + 1;
    EXPECT_EQ(Create(params_).message(), "Invalid end date");

    params_.rules.endDate = now_ + MAX_GROUP_DURATION;
    EXPECT_TRUE(Create(params_).ok());
}

TEST_F(GroupRegistryTest, RejectsNegativeDurations) {
    params_.gracePeriod = -1;
    EXPECT_EQ(Create(params_).message(), "Invalid contribution window");
    EXPECT_EQ(registry_->GetGroupCount(), 0u);
    EXPECT_TRUE(events_.empty());
}

TEST_F(GroupRegistryTest, CreatorGroupLimit) {
    for (size_t i = 0; i < MAX_GROUPS_PER_CREATOR; ++i) {
        ASSERT_TRUE(Create(params_).ok());
    }
    Status s = Create(params_);
    EXPECT_EQ(s.code(), Status::CAPACITY);
    EXPECT_EQ(s.message(), "Too many groups");

    EXPECT_TRUE(registry_->CreateGroup(user1_, params_).first.ok());
}

// ============================================================================
// Pause
// ============================================================================

TEST_F(GroupRegistryTest, PauseBlocksCreation) {
    EXPECT_EQ(registry_->Pause(creator_).message(), "Not owner");
    ASSERT_TRUE(registry_->Pause(owner_).ok());
    EXPECT_TRUE(registry_->IsPaused());
    EXPECT_EQ(events_.back().type, EventType::RegistryPaused);

    EXPECT_EQ(Create(params_).message(), "Registry is paused");

    EXPECT_EQ(registry_->Unpause(creator_).code(), Status::UNAUTHORIZED);
    ASSERT_TRUE(registry_->Unpause(owner_).ok());
    EXPECT_EQ(events_.back().type, EventType::RegistryUnpaused);
    EXPECT_EQ(registry_->Unpause(owner_).message(), "Registry is not paused");

    EXPECT_TRUE(Create(params_).ok());
}

} // namespace test
} // namespace group
} // namespace chama
