// CHAMA - Group Engine Payouts
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Rotation queue, per-period payouts with skip-forward past ineligible
// members, and emergency distribution of the pool.

#include "chama/group/engine.h"
#include "chama/util/logging.h"

namespace chama {
namespace group {

using util::LogCategory::PAYOUT;

bool GroupEngine::IsEligibleForPayout(const Address& user) const {
    return IsActiveMember(user) && !HasActivePunishment(user);
}

Status GroupEngine::SetPayoutQueue(const Address& caller, const std::vector<Address>& queue) {
    return Guarded("SetPayoutQueue", PAYOUT, true, [&](Timestamp) -> Status {
        Status s = RequireCreator(caller);
        if (!s.ok()) return s;
        if (state_.queueSet) return Status::Integrity("Payout queue already set");
        if (queue.empty() || queue.size() != state_.memberCount) {
            return Status::Capacity("Invalid queue length");
        }
        for (const auto& entry : queue) {
            auto it = state_.members.find(entry);
            if (it == state_.members.end() || !it->second.exists) {
                return Status::Integrity("Queue member does not exist");
            }
        }

        state_.payoutQueue = queue;
        state_.queueSet = true;

        GroupEvent ev;
        ev.type = EventType::PayoutQueueSet;
        ev.account = caller;
        ev.index = queue.size();
        Emit(std::move(ev));

        LOG_INFO(PAYOUT) << "Payout queue of " << queue.size() << " set for "
                         << params_.rules.name;
        return Status::Ok();
    });
}

Status GroupEngine::ProcessRotationPayout(const Address& caller) {
    return Guarded("ProcessRotationPayout", PAYOUT, true, [&](Timestamp now) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        if (!state_.isActive) return Status::Precondition("Group not active");
        if (!state_.queueSet) return Status::Precondition("Payout queue not set");

        const uint64_t period = PeriodAt(now);
        if (state_.payouts.count(period) > 0) {
            return Status::Integrity("Payout already processed for this period");
        }

        const auto& queue = state_.payoutQueue;
        for (const auto& entry : queue) {
            if (IsEligibleForPayout(entry) && !HasContributed(entry, period)) {
                return Status::Precondition("Member has not contributed yet");
            }
        }

        // Skips shift the rotation so the next period resumes after the
        // member that was actually paid
        const int64_t len = static_cast<int64_t>(queue.size());
        int64_t offset = static_cast<int64_t>(period) - static_cast<int64_t>(state_.skippedPayouts);
        const size_t nominal = static_cast<size_t>(((offset % len) + len) % len);

        size_t index = nominal;
        bool skipped = false;
        if (!IsEligibleForPayout(queue[nominal])) {
            skipped = true;
            ++state_.skippedPayouts;
            bool found = false;
            for (size_t step = 1; step < queue.size(); ++step) {
                size_t candidate = (nominal + step) % queue.size();
                if (IsEligibleForPayout(queue[candidate])) {
                    index = candidate;
                    found = true;
                    break;
                }
            }
            if (!found) return Status::Precondition("No eligible recipients");
        }

        const Address recipient = queue[index];
        const Amount amount = params_.rules.contributionAmount *
                              static_cast<Amount>(state_.activeMemberCount);
        if (state_.totalFunds < amount) {
            return Status::Precondition("Insufficient pool funds");
        }

        state_.totalFunds -= amount;
        PayoutRecord record;
        record.recipient = recipient;
        record.amount = amount;
        record.timestamp = now;
        record.wasSkipped = skipped;
        state_.payouts[period] = record;
        state_.payoutHistory[recipient].push_back(period);

        GroupEvent ev;
        ev.type = EventType::PayoutProcessed;
        ev.account = recipient;
        ev.amount = amount;
        ev.index = period;
        ev.flag = skipped;
        Emit(std::move(ev));

        LOG_INFO(PAYOUT) << "Period " << period << " payout of " << FormatAmount(amount)
                         << " to " << recipient.ToString() << (skipped ? " (skipped ahead)" : "");
        return TransferOut(recipient, amount);
    });
}

Status GroupEngine::EmergencyWithdraw(const Address& caller) {
    return Guarded("EmergencyWithdraw", PAYOUT, true, [&](Timestamp) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        if (!params_.rules.emergencyWithdrawAllowed) {
            return Status::Precondition("Emergency withdrawal not allowed");
        }
        if (!state_.isActive) return Status::Precondition("Group not active");

        state_.isActive = false;

        std::vector<Address> recipients;
        for (const auto& addr : state_.memberOrder) {
            if (IsActiveMember(addr)) recipients.push_back(addr);
        }

        Amount share = 0;
        if (!recipients.empty()) {
            share = state_.totalFunds / static_cast<Amount>(recipients.size());
        }
        const Amount distributed = share * static_cast<Amount>(recipients.size());
        state_.totalFunds -= distributed;

        GroupEvent ev;
        ev.type = EventType::EmergencyWithdrawal;
        ev.account = caller;
        ev.amount = distributed;
        ev.index = recipients.size();
        Emit(std::move(ev));

        LOG_WARN(PAYOUT) << "Emergency withdrawal from " << params_.rules.name << ": "
                         << FormatAmount(distributed) << " split across "
                         << recipients.size() << " members";

        // Shares already sent cannot be recalled, so a refused share stays
        // in custody as a claim instead of failing the operation
        for (const auto& addr : recipients) {
            if (TransferOut(addr, share).ok()) continue;

            state_.owedShares[addr] += share;
            GroupEvent owed;
            owed.type = EventType::EmergencyShareOwed;
            owed.account = addr;
            owed.amount = share;
            Emit(std::move(owed));

            LOG_WARN(PAYOUT) << "Emergency share of " << FormatAmount(share) << " to "
                             << addr.ToString() << " held for claim";
        }
        return Status::Ok();
    });
}

Status GroupEngine::ClaimEmergencyShare(const Address& caller) {
    return Guarded("ClaimEmergencyShare", PAYOUT, true, [&](Timestamp) -> Status {
        auto it = state_.owedShares.find(caller);
        if (it == state_.owedShares.end()) {
            return Status::Precondition("No emergency share owed");
        }
        const Amount amount = it->second;
        state_.owedShares.erase(it);

        GroupEvent ev;
        ev.type = EventType::EmergencyShareClaimed;
        ev.account = caller;
        ev.amount = amount;
        Emit(std::move(ev));

        LOG_INFO(PAYOUT) << caller.ToString() << " claimed emergency share of "
                         << FormatAmount(amount);
        return TransferOut(caller, amount);
    });
}

Amount GroupEngine::GetOwedShare(const Address& user) const {
    auto it = state_.owedShares.find(user);
    return it == state_.owedShares.end() ? 0 : it->second;
}

} // namespace group
} // namespace chama
