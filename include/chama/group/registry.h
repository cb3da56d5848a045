// CHAMA - Group Registry
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Validates group parameters, creates engines at deterministic addresses
// and indexes them by creator.

#ifndef CHAMA_GROUP_REGISTRY_H
#define CHAMA_GROUP_REGISTRY_H

#include "chama/group/engine.h"

#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace chama {
namespace group {

// ============================================================================
// Registry Limits
// ============================================================================

constexpr size_t MIN_NAME_LENGTH = 1;
constexpr size_t MAX_NAME_LENGTH = 50;
constexpr Amount MIN_CONTRIBUTION = COIN / 1000;
constexpr Amount MAX_CONTRIBUTION = 100 * COIN;
constexpr uint32_t MIN_MEMBERS = 2;
constexpr uint32_t MAX_MEMBERS = 100;
constexpr size_t MAX_GROUPS_PER_CREATOR = 10;
constexpr int64_t MAX_GROUP_DURATION = 365 * util::SECONDS_PER_DAY;

class GroupRegistry {
public:
    GroupRegistry(const Address& owner, ValueTransfer& transfer,
                  GroupEngine::Clock clock = &util::GetTime,
                  const EngineSettings& settings = EngineSettings());

    /// Callback installed on every engine created afterwards, and used for
    /// registry events
    void SetEventCallback(EventCallback callback) { callback_ = std::move(callback); }

    /// Validate params and create a group owned by caller (params.creator is
    /// overwritten)
    std::pair<Status, std::shared_ptr<GroupEngine>> CreateGroup(const Address& caller,
                                                                GroupParams params);

    Status Pause(const Address& caller);
    Status Unpause(const Address& caller);

    /// Null if no group lives at that address
    std::shared_ptr<GroupEngine> GetGroup(const Address& group) const;
    std::vector<Address> GetCreatorGroups(const Address& creator) const;
    const std::vector<Address>& GetAllGroups() const { return order_; }
    size_t GetGroupCount() const { return order_.size(); }

    const Address& GetOwner() const { return owner_; }
    bool IsPaused() const { return paused_; }

    /// Address a group created by creator as its registry-wide n-th group gets
    static Address DeriveGroupAddress(const Address& creator, uint64_t sequence);

private:
    Status Validate(const GroupParams& params, Timestamp now) const;
    void Publish(GroupEvent event, Timestamp now);

    Address owner_;
    ValueTransfer& transfer_;
    GroupEngine::Clock clock_;
    EngineSettings settings_;
    EventCallback callback_;

    std::map<Address, std::shared_ptr<GroupEngine>> groups_;
    std::map<Address, std::vector<Address>> byCreator_;
    std::vector<Address> order_;
    bool paused_{false};
};

} // namespace group
} // namespace chama

#endif // CHAMA_GROUP_REGISTRY_H
