// CHAMA - Group Registry Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/group/registry.h"
#include "chama/core/serialize.h"
#include "chama/crypto/sha256.h"
#include "chama/util/logging.h"

namespace chama {
namespace group {

using util::LogCategory::REGISTRY;

GroupRegistry::GroupRegistry(const Address& owner, ValueTransfer& transfer,
                             GroupEngine::Clock clock, const EngineSettings& settings)
    : owner_(owner)
    , transfer_(transfer)
    , clock_(std::move(clock))
    , settings_(settings)
{}

Address GroupRegistry::DeriveGroupAddress(const Address& creator, uint64_t sequence) {
    DataStream ss;
    ss << std::string("chama-group") << creator << sequence;
    Hash256 digest = SHA256Hash(ss.Data());
    return Address(digest.data(), Address::SIZE);
}

Status GroupRegistry::Validate(const GroupParams& params, Timestamp now) const {
    const GroupRules& rules = params.rules;
    if (rules.name.size() < MIN_NAME_LENGTH || rules.name.size() > MAX_NAME_LENGTH) {
        return Status::Precondition("Invalid name length");
    }
    if (rules.contributionAmount < MIN_CONTRIBUTION ||
        rules.contributionAmount > MAX_CONTRIBUTION) {
        return Status::ValueMismatch("Invalid contribution amount");
    }
    if (rules.maxMembers < MIN_MEMBERS || rules.maxMembers > MAX_MEMBERS) {
        return Status::Capacity("Invalid max members");
    }
    if (rules.startDate <= now) {
        return Status::Precondition("Start date must be in future");
    }
    if (rules.endDate <= rules.startDate || rules.endDate > now + MAX_GROUP_DURATION) {
        return Status::Precondition("Invalid end date");
    }
    if (params.contributionWindow < 0 || params.gracePeriod < 0 || params.fineAmount < 0) {
        return Status::Precondition("Invalid contribution window");
    }
    return Status::Ok();
}

std::pair<Status, std::shared_ptr<GroupEngine>> GroupRegistry::CreateGroup(
    const Address& caller, GroupParams params)
{
    const Timestamp now = clock_();
    if (paused_) {
        return {Status::Precondition("Registry is paused"), nullptr};
    }
    Status s = Validate(params, now);
    if (!s.ok()) {
        LOG_DEBUG(REGISTRY) << "CreateGroup rejected: " << s.message();
        return {s, nullptr};
    }

    auto& owned = byCreator_[caller];
    if (owned.size() >= MAX_GROUPS_PER_CREATOR) {
        LOG_DEBUG(REGISTRY) << "CreateGroup rejected: creator limit reached";
        return {Status::Capacity("Too many groups"), nullptr};
    }

    params.creator = caller;
    const Address address = DeriveGroupAddress(caller, order_.size());
    auto engine = std::make_shared<GroupEngine>(address, params, transfer_, clock_, settings_);
    if (callback_) engine->SetEventCallback(callback_);

    groups_[address] = engine;
    owned.push_back(address);
    order_.push_back(address);

    GroupEvent ev;
    ev.type = EventType::GroupCreated;
    ev.group = address;
    ev.account = caller;
    ev.other = params.contributionToken;
    ev.amount = params.rules.contributionAmount;
    ev.detail = params.rules.name;
    Publish(std::move(ev), now);

    LOG_INFO(REGISTRY) << "Created group \"" << params.rules.name << "\" at "
                       << address.ToString() << " for " << caller.ToString();
    return {Status::Ok(), engine};
}

Status GroupRegistry::Pause(const Address& caller) {
    if (caller != owner_) return Status::Unauthorized("Not owner");
    paused_ = true;

    GroupEvent ev;
    ev.type = EventType::RegistryPaused;
    ev.account = caller;
    Publish(std::move(ev), clock_());
    LOG_WARN(REGISTRY) << "Registry paused";
    return Status::Ok();
}

Status GroupRegistry::Unpause(const Address& caller) {
    if (caller != owner_) return Status::Unauthorized("Not owner");
    if (!paused_) return Status::Precondition("Registry is not paused");
    paused_ = false;

    GroupEvent ev;
    ev.type = EventType::RegistryUnpaused;
    ev.account = caller;
    Publish(std::move(ev), clock_());
    LOG_INFO(REGISTRY) << "Registry unpaused";
    return Status::Ok();
}

std::shared_ptr<GroupEngine> GroupRegistry::GetGroup(const Address& group) const {
    auto it = groups_.find(group);
    return it == groups_.end() ? nullptr : it->second;
}

std::vector<Address> GroupRegistry::GetCreatorGroups(const Address& creator) const {
    auto it = byCreator_.find(creator);
    if (it == byCreator_.end()) return {};
    return it->second;
}

void GroupRegistry::Publish(GroupEvent event, Timestamp now) {
    event.timestamp = now;
    if (callback_) callback_(event);
}

} // namespace group
} // namespace chama
