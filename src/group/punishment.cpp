// CHAMA - Group Engine Punishments
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Missed-contribution detection, automatic and manual punishments, fine
// escalation, cancellation and fine collection.

#include "chama/group/engine.h"
#include "chama/util/logging.h"

namespace chama {
namespace group {

using util::LogCategory::PUNISH;

// ============================================================================
// Detection
// ============================================================================

void GroupEngine::DetectMissed(const Address& user, Timestamp now) {
    auto it = state_.members.find(user);
    if (it == state_.members.end()) return;
    Member& m = it->second;

    const uint64_t current = PeriodAt(now);
    while (m.isActive && m.nextCheckPeriod < current) {
        const uint64_t period = m.nextCheckPeriod;
        if (GetPeriodStart(period) > params_.rules.endDate) break;
        if (now <= GetContributionDeadline(period)) break;

        ++m.nextCheckPeriod;
        if (HasContributed(user, period)) continue;

        ++m.missedContributions;
        GroupEvent ev;
        ev.type = EventType::MissedContributionDetected;
        ev.account = user;
        ev.index = period;
        Emit(std::move(ev));

        LOG_INFO(PUNISH) << user.ToString() << " missed period " << period
                         << " (" << m.missedContributions << " total)";

        if (m.missedContributions > settings_.maxMissedContributions) {
            ApplyAutomaticPunishment(user, period, now);
        }
    }
}

void GroupEngine::ApplyAutomaticPunishment(const Address& user, uint64_t period, Timestamp now) {
    const PunishmentAction mode = params_.rules.punishmentMode;
    if (mode == PunishmentAction::None) return;

    Member& m = state_.members[user];
    PunishmentAction action = mode;
    std::string reason = "Missed contribution for period " + std::to_string(period);

    if (mode == PunishmentAction::Fine) {
        if (++m.consecutiveFines >= settings_.escalationThreshold) {
            action = PunishmentAction::Ban;
            reason = "Fine escalation after " + std::to_string(m.consecutiveFines) + " fines";
        }
    } else {
        m.consecutiveFines = 0;
    }

    ApplyPunishment(user, action, reason, now);
}

// ============================================================================
// Recording
// ============================================================================

void GroupEngine::ApplyPunishment(const Address& user, PunishmentAction action,
                                  const std::string& reason, Timestamp now) {
    Punishment p;
    p.action = action;
    p.reason = reason;
    p.isActive = true;
    p.issuedAt = now;
    p.fineAmount = action == PunishmentAction::Fine ? params_.fineAmount : 0;
    state_.punishments[user] = p;

    if (action == PunishmentAction::Ban) {
        Deactivate(state_.members[user]);
    }

    GroupEvent ev;
    ev.type = EventType::MemberPunished;
    ev.account = user;
    ev.code = static_cast<uint8_t>(action);
    ev.amount = p.fineAmount;
    ev.detail = reason;
    Emit(std::move(ev));

    LOG_WARN(PUNISH) << user.ToString() << " punished with "
                     << PunishmentActionToString(action) << ": " << reason;
}

void GroupEngine::ClearPunishment(const Address& user, Timestamp now) {
    Punishment& p = state_.punishments[user];
    p.isActive = false;

    Member& m = state_.members[user];
    if (p.action == PunishmentAction::Ban && !m.isActive && !m.hasLeft) {
        m.isActive = true;
        ++state_.activeMemberCount;
        m.missedContributions = 0;
        m.consecutiveFines = 0;
        m.nextCheckPeriod = FirstOpenPeriod(now);
    }

    GroupEvent ev;
    ev.type = EventType::PunishmentCancelled;
    ev.account = user;
    ev.code = static_cast<uint8_t>(p.action);
    Emit(std::move(ev));

    LOG_INFO(PUNISH) << PunishmentActionToString(p.action) << " on " << user.ToString()
                     << " cancelled";
}

// ============================================================================
// Operations
// ============================================================================

Status GroupEngine::CheckMissedContributions(const Address& caller, const Address& user) {
    return Guarded("CheckMissedContributions", PUNISH, true, [&](Timestamp now) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        s = RequireActiveMember(user);
        if (!s.ok()) return s;
        DetectMissed(user, now);
        return Status::Ok();
    });
}

Status GroupEngine::PunishMember(const Address& caller, const Address& user,
                                 PunishmentAction action, const std::string& reason) {
    return Guarded("PunishMember", PUNISH, true, [&](Timestamp now) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        if (action == PunishmentAction::None) {
            return Status::Precondition("Invalid punishment action");
        }
        auto it = state_.members.find(user);
        if (it == state_.members.end() || !it->second.exists) {
            return Status::Integrity("Not a member");
        }
        if (!it->second.isActive) {
            return Status::Precondition("Not an active member");
        }

        if (action != PunishmentAction::Fine) {
            it->second.consecutiveFines = 0;
        }
        ApplyPunishment(user, action, reason, now);
        return Status::Ok();
    });
}

Status GroupEngine::CancelPunishment(const Address& caller, const Address& user) {
    return Guarded("CancelPunishment", PUNISH, true, [&](Timestamp now) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        if (!HasActivePunishment(user)) {
            return Status::Precondition("No active punishment");
        }
        ClearPunishment(user, now);
        return Status::Ok();
    });
}

Status GroupEngine::PayFine(const Address& caller, Amount value) {
    return Guarded("PayFine", PUNISH, true, [&](Timestamp) -> Status {
        auto it = state_.punishments.find(caller);
        if (it == state_.punishments.end() || !it->second.isActive ||
            it->second.action != PunishmentAction::Fine) {
            return Status::Precondition("No active fine");
        }

        const Amount fine = it->second.fineAmount;
        if (params_.IsTokenBased()) {
            if (value != 0) return Status::ValueMismatch("Native value not accepted");
        } else if (value != fine) {
            return Status::ValueMismatch("Incorrect fine amount");
        }

        Status s = TransferIn(caller, fine);
        if (!s.ok()) return s;

        state_.totalFunds += fine;
        it->second.isActive = false;
        state_.members[caller].consecutiveFines = 0;

        GroupEvent ev;
        ev.type = EventType::FineCollected;
        ev.account = caller;
        ev.amount = fine;
        Emit(std::move(ev));

        LOG_INFO(PUNISH) << caller.ToString() << " paid fine of " << FormatAmount(fine);
        return Status::Ok();
    });
}

} // namespace group
} // namespace chama
