// CHAMA - Group Engine
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// State machine of one savings group: membership, periodic contributions,
// missed-contribution detection, punishments, governance and rotating
// payouts. Every mutating operation names its caller and is atomic.

#ifndef CHAMA_GROUP_ENGINE_H
#define CHAMA_GROUP_ENGINE_H

#include "chama/core/types.h"
#include "chama/group/events.h"
#include "chama/group/status.h"
#include "chama/group/transfer.h"
#include "chama/group/types.h"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace chama {
namespace group {

/**
 * One savings group.
 *
 * Operations return a Status; on rejection the engine state and the event
 * stream are unchanged. Events are handed to the callback only after the
 * operation commits. Outbound value moves through the ValueTransfer after
 * all state changes are made, and a call that re-enters the engine while
 * an operation is in flight is rejected.
 *
 * Not thread-safe; the owner serializes calls.
 */
class GroupEngine {
public:
    using Clock = std::function<Timestamp()>;

    GroupEngine(const Address& self, const GroupParams& params, ValueTransfer& transfer,
                Clock clock = &util::GetTime, const EngineSettings& settings = EngineSettings());

    GroupEngine(const GroupEngine&) = delete;
    GroupEngine& operator=(const GroupEngine&) = delete;

    void SetEventCallback(EventCallback callback) { callback_ = std::move(callback); }

    // ========================================================================
    // Membership
    // ========================================================================

    Status Join(const Address& caller);
    Status ApproveJoin(const Address& caller, const Address& user);
    Status Leave(const Address& caller);

    // ========================================================================
    // Roles
    // ========================================================================

    Status AddAdmin(const Address& caller, const Address& user);
    Status RemoveAdmin(const Address& caller, const Address& user);
    Status TransferCreator(const Address& caller, const Address& newCreator);

    // ========================================================================
    // Contributions
    // ========================================================================

    /// value is the native amount attached to the call; zero for token groups
    Status Contribute(const Address& caller, Amount value);

    /// Run missed-contribution detection for one member on demand
    Status CheckMissedContributions(const Address& caller, const Address& user);

    // ========================================================================
    // Punishments
    // ========================================================================

    Status PunishMember(const Address& caller, const Address& user,
                        PunishmentAction action, const std::string& reason);
    Status CancelPunishment(const Address& caller, const Address& user);
    Status PayFine(const Address& caller, Amount value);

    // ========================================================================
    // Governance
    // ========================================================================

    Status CreateProposal(const Address& caller, ProposalType type, const Address& target,
                          int64_t value, const std::string& description,
                          uint64_t* proposalId = nullptr);
    Status VoteOnProposal(const Address& caller, uint64_t proposalId, bool support);
    Status ExecuteProposal(const Address& caller, uint64_t proposalId);

    // ========================================================================
    // Payouts
    // ========================================================================

    Status SetPayoutQueue(const Address& caller, const std::vector<Address>& queue);
    Status ProcessRotationPayout(const Address& caller);
    Status EmergencyWithdraw(const Address& caller);
    /// Collect an emergency share whose transfer was refused
    Status ClaimEmergencyShare(const Address& caller);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    Status Pause(const Address& caller);
    Status Unpause(const Address& caller);

    // ========================================================================
    // Queries
    // ========================================================================

    const Address& GetAddress() const { return self_; }
    const GroupParams& GetParams() const { return params_; }
    const GroupRules& GetRules() const { return params_.rules; }
    const EngineSettings& GetSettings() const { return settings_; }

    /// Zero before the start date
    uint64_t GetCurrentPeriod() const;
    Timestamp GetPeriodStart(uint64_t period) const;
    /// Last instant at which a contribution for the period is accepted
    Timestamp GetContributionDeadline(uint64_t period) const;
    bool IsContributionWindowOpen() const;

    /// Zero if the member has not contributed for that period
    Timestamp GetContributionTimestamp(const Address& user, uint64_t period) const;

    std::optional<Member> GetMemberDetails(const Address& user) const;
    std::optional<Punishment> GetPunishmentDetails(const Address& user) const;
    std::optional<Proposal> GetProposal(uint64_t proposalId) const;
    std::optional<PayoutRecord> GetPayoutInfo(uint64_t period) const;
    std::vector<uint64_t> GetMemberPayoutHistory(const Address& user) const;
    std::vector<Address> GetMembers() const;

    bool IsAdmin(const Address& user) const { return state_.admins.count(user) > 0; }
    bool IsActiveMember(const Address& user) const;
    bool HasActivePunishment(const Address& user) const;
    bool HasPendingJoinRequest(const Address& user) const {
        return state_.pendingJoins.count(user) > 0;
    }
    bool HasVoted(uint64_t proposalId, const Address& user) const {
        return state_.votes.count({proposalId, user}) > 0;
    }

    const Address& GetCreator() const { return state_.creator; }
    uint32_t GetMemberCount() const { return state_.memberCount; }
    uint32_t GetActiveMemberCount() const { return state_.activeMemberCount; }
    Amount GetTotalFunds() const { return state_.totalFunds; }
    Amount GetOwedShare(const Address& user) const;
    bool IsActive() const { return state_.isActive; }
    bool IsPaused() const { return state_.paused; }
    bool IsPayoutQueueSet() const { return state_.queueSet; }
    const std::vector<Address>& GetPayoutQueue() const { return state_.payoutQueue; }
    uint64_t GetSkippedPayouts() const { return state_.skippedPayouts; }
    uint64_t GetProposalCount() const { return state_.proposals.size(); }

    /// Votes an execution currently needs
    uint32_t GetRequiredVotes() const;

private:
    /// Everything an operation may change; copied for rollback
    struct State {
        Address creator;
        std::set<Address> admins;
        std::map<Address, Member> members;
        std::vector<Address> memberOrder;
        std::set<Address> pendingJoins;
        std::map<Address, Punishment> punishments;
        std::map<std::pair<Address, uint64_t>, Timestamp> contributions;
        std::vector<Proposal> proposals;
        std::set<std::pair<uint64_t, Address>> votes;
        std::map<uint64_t, PayoutRecord> payouts;
        std::map<Address, std::vector<uint64_t>> payoutHistory;
        std::vector<Address> payoutQueue;
        bool queueSet{false};
        uint64_t skippedPayouts{0};
        uint32_t memberCount{0};
        uint32_t activeMemberCount{0};
        Amount totalFunds{0};
        /// Emergency shares still held in custody for their recipients
        std::map<Address, Amount> owedShares;
        bool isActive{true};
        bool paused{false};
    };

    using Body = std::function<Status(Timestamp now)>;

    /// Run body with reentrancy protection, rollback and deferred events
    Status Guarded(const char* operation, const char* category, bool blockedWhilePaused,
                   const Body& body);

    void Emit(GroupEvent event);

    /// Pay out of custody. Only valid inside Guarded, after state changes.
    Status TransferOut(const Address& to, Amount amount);
    Status TransferIn(const Address& from, Amount amount);

    Status RequireAdmin(const Address& caller) const;
    Status RequireCreator(const Address& caller) const;
    Status RequireActiveMember(const Address& caller) const;
    Status RequireRunning(Timestamp now) const;

    uint64_t PeriodAt(Timestamp now) const;
    /// First period whose deadline has not passed at now
    uint64_t FirstOpenPeriod(Timestamp now) const;
    bool HasContributed(const Address& user, uint64_t period) const;
    bool IsEligibleForPayout(const Address& user) const;

    void Admit(const Address& user, Timestamp now);
    void Deactivate(Member& member);

    /// Walk unchecked periods whose deadline has passed
    void DetectMissed(const Address& user, Timestamp now);
    void ApplyAutomaticPunishment(const Address& user, uint64_t period, Timestamp now);
    void ApplyPunishment(const Address& user, PunishmentAction action,
                         const std::string& reason, Timestamp now);
    void ClearPunishment(const Address& user, Timestamp now);

    Status DispatchProposal(const Proposal& proposal, Timestamp now);

    Address self_;
    GroupParams params_;
    EngineSettings settings_;
    ValueTransfer& transfer_;
    Clock clock_;
    EventCallback callback_;

    State state_;
    std::vector<GroupEvent> pending_;
    bool entered_{false};
};

} // namespace group
} // namespace chama

#endif // CHAMA_GROUP_ENGINE_H
