// CHAMA - Group Engine Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Core of the engine: the guarded operation runner, period arithmetic,
// membership, roles, lifecycle and contributions. Punishments, governance
// and payouts live in their own translation units.

#include "chama/group/engine.h"
#include "chama/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace chama {
namespace group {

using util::LogCategory::CONTRIB;
using util::LogCategory::GROUP;

// ============================================================================
// Construction
// ============================================================================

GroupEngine::GroupEngine(const Address& self, const GroupParams& params, ValueTransfer& transfer,
                         Clock clock, const EngineSettings& settings)
    : self_(self)
    , params_(params)
    , settings_(settings)
    , transfer_(transfer)
    , clock_(std::move(clock))
{
    if (settings_.periodDuration <= 0) {
        throw std::invalid_argument("Period duration must be positive");
    }
    if (!clock_) {
        throw std::invalid_argument("Engine requires a clock");
    }
    state_.creator = params_.creator;
    state_.admins.insert(params_.creator);
}

// ============================================================================
// Guarded Runner
// ============================================================================

Status GroupEngine::Guarded(const char* operation, const char* category,
                            bool blockedWhilePaused, const Body& body) {
    if (entered_) {
        LOG_WARN(category) << operation << " rejected: reentrant call into "
                           << self_.ToString();
        return Status::Reentrancy("Reentrant call");
    }
    if (blockedWhilePaused && state_.paused) {
        LOG_DEBUG(category) << operation << " rejected: group is paused";
        return Status::Precondition("Group is paused");
    }

    // Restores the pre-operation state unless committed, and always
    // releases the reentrancy flag
    struct Scope {
        GroupEngine& engine;
        State snapshot;
        bool committed{false};

        ~Scope() {
            if (!committed) {
                engine.state_ = std::move(snapshot);
                engine.pending_.clear();
            }
            engine.entered_ = false;
        }
    };

    const Timestamp now = clock_();
    std::vector<GroupEvent> events;
    {
        Scope scope{*this, state_};
        entered_ = true;
        pending_.clear();

        Status s = body(now);
        if (!s.ok()) {
            LOG_DEBUG(category) << operation << " rejected: " << s.message();
            return s;
        }
        scope.committed = true;
        events.swap(pending_);
    }

    for (auto& ev : events) {
        ev.group = self_;
        ev.timestamp = now;
    }
    if (callback_) {
        for (const auto& ev : events) {
            callback_(ev);
        }
    }
    return Status::Ok();
}

void GroupEngine::Emit(GroupEvent event) {
    pending_.push_back(std::move(event));
}

Status GroupEngine::TransferOut(const Address& to, Amount amount) {
    if (!entered_) {
        return Status::Integrity("Transfer outside of an operation");
    }
    if (amount <= 0) return Status::Ok();
    if (!transfer_.Withdraw(self_, to, params_.contributionToken, amount)) {
        return Status::TransferFailed("Transfer failed");
    }
    return Status::Ok();
}

Status GroupEngine::TransferIn(const Address& from, Amount amount) {
    if (amount <= 0) return Status::Ok();
    if (!transfer_.Deposit(from, self_, params_.contributionToken, amount)) {
        return Status::TransferFailed("Transfer failed");
    }
    return Status::Ok();
}

// ============================================================================
// Checks
// ============================================================================

Status GroupEngine::RequireAdmin(const Address& caller) const {
    if (!IsAdmin(caller)) return Status::Unauthorized("Not admin");
    return Status::Ok();
}

Status GroupEngine::RequireCreator(const Address& caller) const {
    if (caller != state_.creator) return Status::Unauthorized("Only creator");
    return Status::Ok();
}

Status GroupEngine::RequireActiveMember(const Address& caller) const {
    if (!IsActiveMember(caller)) return Status::Unauthorized("Not an active member");
    return Status::Ok();
}

Status GroupEngine::RequireRunning(Timestamp now) const {
    if (!state_.isActive) return Status::Precondition("Group not active");
    if (now < params_.rules.startDate) return Status::Precondition("Group has not started");
    if (now > params_.rules.endDate) return Status::Precondition("Group has ended");
    return Status::Ok();
}

// ============================================================================
// Periods
// ============================================================================

uint64_t GroupEngine::PeriodAt(Timestamp now) const {
    if (now < params_.rules.startDate) return 0;
    return static_cast<uint64_t>((now - params_.rules.startDate) / settings_.periodDuration);
}

uint64_t GroupEngine::FirstOpenPeriod(Timestamp now) const {
    uint64_t period = PeriodAt(now);
    return now > GetContributionDeadline(period) ? period + 1 : period;
}

uint64_t GroupEngine::GetCurrentPeriod() const {
    return PeriodAt(clock_());
}

Timestamp GroupEngine::GetPeriodStart(uint64_t period) const {
    return params_.rules.startDate + static_cast<int64_t>(period) * settings_.periodDuration;
}

Timestamp GroupEngine::GetContributionDeadline(uint64_t period) const {
    return GetPeriodStart(period) + params_.contributionWindow + params_.gracePeriod;
}

bool GroupEngine::IsContributionWindowOpen() const {
    const Timestamp now = clock_();
    if (!RequireRunning(now).ok()) return false;
    return now <= GetContributionDeadline(PeriodAt(now));
}

// ============================================================================
// Queries
// ============================================================================

bool GroupEngine::HasContributed(const Address& user, uint64_t period) const {
    return state_.contributions.count({user, period}) > 0;
}

Timestamp GroupEngine::GetContributionTimestamp(const Address& user, uint64_t period) const {
    auto it = state_.contributions.find({user, period});
    return it == state_.contributions.end() ? 0 : it->second;
}

bool GroupEngine::IsActiveMember(const Address& user) const {
    auto it = state_.members.find(user);
    return it != state_.members.end() && it->second.exists && it->second.isActive;
}

bool GroupEngine::HasActivePunishment(const Address& user) const {
    auto it = state_.punishments.find(user);
    return it != state_.punishments.end() && it->second.isActive;
}

std::optional<Member> GroupEngine::GetMemberDetails(const Address& user) const {
    auto it = state_.members.find(user);
    if (it == state_.members.end()) return std::nullopt;
    return it->second;
}

std::optional<Punishment> GroupEngine::GetPunishmentDetails(const Address& user) const {
    auto it = state_.punishments.find(user);
    if (it == state_.punishments.end()) return std::nullopt;
    return it->second;
}

std::optional<Proposal> GroupEngine::GetProposal(uint64_t proposalId) const {
    if (proposalId == 0 || proposalId > state_.proposals.size()) return std::nullopt;
    return state_.proposals[proposalId - 1];
}

std::optional<PayoutRecord> GroupEngine::GetPayoutInfo(uint64_t period) const {
    auto it = state_.payouts.find(period);
    if (it == state_.payouts.end()) return std::nullopt;
    return it->second;
}

std::vector<uint64_t> GroupEngine::GetMemberPayoutHistory(const Address& user) const {
    auto it = state_.payoutHistory.find(user);
    if (it == state_.payoutHistory.end()) return {};
    return it->second;
}

std::vector<Address> GroupEngine::GetMembers() const {
    return state_.memberOrder;
}

uint32_t GroupEngine::GetRequiredVotes() const {
    uint64_t scaled = static_cast<uint64_t>(state_.activeMemberCount) * settings_.quorumPercent;
    return static_cast<uint32_t>((scaled + 99) / 100);
}

// ============================================================================
// Membership
// ============================================================================

void GroupEngine::Admit(const Address& user, Timestamp now) {
    Member m;
    m.exists = true;
    m.isActive = true;
    m.joinedAt = now;
    m.nextCheckPeriod = FirstOpenPeriod(now);
    state_.members[user] = m;
    state_.memberOrder.push_back(user);
    ++state_.memberCount;
    ++state_.activeMemberCount;

    GroupEvent ev;
    ev.type = EventType::MemberJoined;
    ev.account = user;
    Emit(std::move(ev));

    LOG_INFO(GROUP) << user.ToString() << " joined " << params_.rules.name
                    << " (" << state_.memberCount << "/" << params_.rules.maxMembers << ")";
}

void GroupEngine::Deactivate(Member& member) {
    if (member.isActive) {
        member.isActive = false;
        --state_.activeMemberCount;
    }
}

Status GroupEngine::Join(const Address& caller) {
    return Guarded("Join", GROUP, true, [&](Timestamp now) -> Status {
        auto it = state_.members.find(caller);
        if (it != state_.members.end() && it->second.exists) {
            return Status::Precondition("Already a member");
        }
        if (HasActivePunishment(caller)) {
            return Status::Precondition("Cannot join with active punishment");
        }
        Status s = RequireRunning(now);
        if (!s.ok()) return s;
        if (state_.memberCount >= params_.rules.maxMembers) {
            return Status::Capacity("Group is full");
        }

        if (params_.rules.approvalRequired) {
            if (!state_.pendingJoins.insert(caller).second) {
                return Status::Precondition("Join request already pending");
            }
            GroupEvent ev;
            ev.type = EventType::JoinRequested;
            ev.account = caller;
            Emit(std::move(ev));
            LOG_INFO(GROUP) << caller.ToString() << " requested to join " << params_.rules.name;
            return Status::Ok();
        }

        Admit(caller, now);
        return Status::Ok();
    });
}

Status GroupEngine::ApproveJoin(const Address& caller, const Address& user) {
    return Guarded("ApproveJoin", GROUP, true, [&](Timestamp now) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        if (state_.pendingJoins.count(user) == 0) {
            return Status::Precondition("No pending join request");
        }
        if (state_.memberCount >= params_.rules.maxMembers) {
            return Status::Capacity("Group is full");
        }
        state_.pendingJoins.erase(user);

        GroupEvent ev;
        ev.type = EventType::JoinApproved;
        ev.account = user;
        ev.other = caller;
        Emit(std::move(ev));

        Admit(user, now);
        return Status::Ok();
    });
}

Status GroupEngine::Leave(const Address& caller) {
    return Guarded("Leave", GROUP, true, [&](Timestamp) -> Status {
        Status s = RequireActiveMember(caller);
        if (!s.ok()) return s;
        if (HasActivePunishment(caller)) {
            return Status::Precondition("Cannot leave with active punishment");
        }

        Member& m = state_.members[caller];
        Amount refund = 0;
        auto hist = state_.payoutHistory.find(caller);
        if (hist == state_.payoutHistory.end() || hist->second.empty()) {
            Amount penalty = static_cast<Amount>(m.missedContributions) * params_.fineAmount;
            refund = std::max<Amount>(0, m.totalContributed - penalty);
        }
        if (refund > state_.totalFunds) {
            return Status::Precondition("Insufficient pool funds");
        }

        Deactivate(m);
        m.hasLeft = true;
        state_.totalFunds -= refund;

        GroupEvent ev;
        ev.type = EventType::MemberLeft;
        ev.account = caller;
        ev.amount = refund;
        Emit(std::move(ev));

        LOG_INFO(GROUP) << caller.ToString() << " left " << params_.rules.name
                        << " with refund " << FormatAmount(refund);
        return TransferOut(caller, refund);
    });
}

// ============================================================================
// Roles
// ============================================================================

Status GroupEngine::AddAdmin(const Address& caller, const Address& user) {
    return Guarded("AddAdmin", GROUP, true, [&](Timestamp) -> Status {
        Status s = RequireCreator(caller);
        if (!s.ok()) return s;
        if (user.IsNull()) return Status::Precondition("Invalid address");

        state_.admins.insert(user);
        GroupEvent ev;
        ev.type = EventType::AdminAdded;
        ev.account = user;
        Emit(std::move(ev));
        return Status::Ok();
    });
}

Status GroupEngine::RemoveAdmin(const Address& caller, const Address& user) {
    return Guarded("RemoveAdmin", GROUP, true, [&](Timestamp) -> Status {
        Status s = RequireCreator(caller);
        if (!s.ok()) return s;
        if (user == state_.creator) return Status::Precondition("Cannot remove creator");

        state_.admins.erase(user);
        GroupEvent ev;
        ev.type = EventType::AdminRemoved;
        ev.account = user;
        Emit(std::move(ev));
        return Status::Ok();
    });
}

Status GroupEngine::TransferCreator(const Address& caller, const Address& newCreator) {
    return Guarded("TransferCreator", GROUP, true, [&](Timestamp) -> Status {
        Status s = RequireCreator(caller);
        if (!s.ok()) return s;
        if (newCreator.IsNull()) return Status::Precondition("Invalid address");
        if (newCreator == state_.creator) return Status::Precondition("Already creator");

        Address previous = state_.creator;
        state_.creator = newCreator;
        state_.admins.insert(newCreator);

        GroupEvent ev;
        ev.type = EventType::CreatorTransferred;
        ev.account = newCreator;
        ev.other = previous;
        Emit(std::move(ev));

        LOG_INFO(GROUP) << "Creator of " << params_.rules.name << " is now "
                        << newCreator.ToString();
        return Status::Ok();
    });
}

// ============================================================================
// Lifecycle
// ============================================================================

Status GroupEngine::Pause(const Address& caller) {
    return Guarded("Pause", GROUP, true, [&](Timestamp) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        state_.paused = true;

        GroupEvent ev;
        ev.type = EventType::GroupPaused;
        ev.account = caller;
        Emit(std::move(ev));
        LOG_WARN(GROUP) << params_.rules.name << " paused by " << caller.ToString();
        return Status::Ok();
    });
}

Status GroupEngine::Unpause(const Address& caller) {
    return Guarded("Unpause", GROUP, false, [&](Timestamp) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        if (!state_.paused) return Status::Precondition("Group is not paused");
        state_.paused = false;

        GroupEvent ev;
        ev.type = EventType::GroupUnpaused;
        ev.account = caller;
        Emit(std::move(ev));
        LOG_INFO(GROUP) << params_.rules.name << " unpaused by " << caller.ToString();
        return Status::Ok();
    });
}

// ============================================================================
// Contributions
// ============================================================================

Status GroupEngine::Contribute(const Address& caller, Amount value) {
    return Guarded("Contribute", CONTRIB, true, [&](Timestamp now) -> Status {
        Status s = RequireActiveMember(caller);
        if (!s.ok()) return s;
        s = RequireRunning(now);
        if (!s.ok()) return s;

        const uint64_t period = PeriodAt(now);
        if (HasContributed(caller, period)) {
            return Status::Precondition("Already contributed this period");
        }

        const Amount amount = params_.rules.contributionAmount;
        if (params_.IsTokenBased()) {
            if (value != 0) return Status::ValueMismatch("Native value not accepted");
        } else if (value != amount) {
            return Status::ValueMismatch("Incorrect contribution amount");
        }
        if (now > GetContributionDeadline(period)) {
            return Status::Precondition("Contribution window closed");
        }

        // May punish or ban the caller; the contribution is recorded regardless
        DetectMissed(caller, now);

        s = TransferIn(caller, amount);
        if (!s.ok()) return s;

        Member& m = state_.members[caller];
        state_.contributions[{caller, period}] = now;
        m.totalContributed += amount;
        state_.totalFunds += amount;

        GroupEvent ev;
        ev.type = EventType::ContributionMade;
        ev.account = caller;
        ev.amount = amount;
        ev.index = period;
        Emit(std::move(ev));

        LOG_INFO(CONTRIB) << caller.ToString() << " contributed " << FormatAmount(amount)
                          << " for period " << period;
        return Status::Ok();
    });
}

} // namespace group
} // namespace chama
