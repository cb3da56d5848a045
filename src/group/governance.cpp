// CHAMA - Group Engine Governance
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/group/engine.h"
#include "chama/util/logging.h"

namespace chama {
namespace group {

using util::LogCategory::GOV;

Status GroupEngine::CreateProposal(const Address& caller, ProposalType type, const Address& target,
                                   int64_t value, const std::string& description,
                                   uint64_t* proposalId) {
    return Guarded("CreateProposal", GOV, true, [&](Timestamp now) -> Status {
        Status s = RequireActiveMember(caller);
        if (!s.ok()) return s;
        if (target.IsNull()) return Status::Precondition("Invalid address");

        Proposal p;
        p.id = state_.proposals.size() + 1;
        p.type = type;
        p.proposer = caller;
        p.target = target;
        p.value = value;
        p.description = description;
        p.createdAt = now;
        state_.proposals.push_back(p);

        GroupEvent ev;
        ev.type = EventType::ProposalCreated;
        ev.account = caller;
        ev.other = target;
        ev.index = p.id;
        ev.code = static_cast<uint8_t>(type);
        ev.detail = description;
        Emit(std::move(ev));

        LOG_INFO(GOV) << "Proposal " << p.id << " (" << ProposalTypeToString(type)
                      << " " << target.ToString() << ") created by " << caller.ToString();
        if (proposalId) *proposalId = p.id;
        return Status::Ok();
    });
}

Status GroupEngine::VoteOnProposal(const Address& caller, uint64_t proposalId, bool support) {
    return Guarded("VoteOnProposal", GOV, true, [&](Timestamp now) -> Status {
        if (proposalId == 0 || proposalId > state_.proposals.size()) {
            return Status::Integrity("Proposal does not exist");
        }
        Status s = RequireActiveMember(caller);
        if (!s.ok()) return s;

        Proposal& p = state_.proposals[proposalId - 1];
        if (p.executed) return Status::Integrity("Proposal already executed");
        if (now > p.createdAt + settings_.proposalDuration) {
            return Status::Precondition("Voting period over");
        }
        if (!state_.votes.insert({proposalId, caller}).second) {
            return Status::Precondition("Already voted");
        }

        if (support) {
            ++p.votesFor;
        } else {
            ++p.votesAgainst;
        }

        GroupEvent ev;
        ev.type = EventType::VoteCast;
        ev.account = caller;
        ev.index = proposalId;
        ev.flag = support;
        Emit(std::move(ev));

        LOG_DEBUG(GOV) << caller.ToString() << " voted " << (support ? "for" : "against")
                       << " proposal " << proposalId;
        return Status::Ok();
    });
}

Status GroupEngine::ExecuteProposal(const Address& caller, uint64_t proposalId) {
    return Guarded("ExecuteProposal", GOV, true, [&](Timestamp now) -> Status {
        Status s = RequireAdmin(caller);
        if (!s.ok()) return s;
        if (proposalId == 0 || proposalId > state_.proposals.size()) {
            return Status::Integrity("Proposal does not exist");
        }

        const Proposal p = state_.proposals[proposalId - 1];
        if (p.executed) return Status::Integrity("Proposal already executed");
        if (now <= p.createdAt + settings_.proposalDuration) {
            return Status::Precondition("Voting still active");
        }

        const uint32_t total = p.votesFor + p.votesAgainst;
        if (total < GetRequiredVotes()) {
            return Status::Precondition("Insufficient participation");
        }
        if (p.votesFor <= p.votesAgainst) {
            return Status::Precondition("Proposal rejected");
        }

        s = DispatchProposal(p, now);
        if (!s.ok()) return s;
        state_.proposals[proposalId - 1].executed = true;

        GroupEvent ev;
        ev.type = EventType::ProposalExecuted;
        ev.account = caller;
        ev.other = p.target;
        ev.index = proposalId;
        ev.code = static_cast<uint8_t>(p.type);
        Emit(std::move(ev));

        LOG_INFO(GOV) << "Proposal " << proposalId << " executed (" << p.votesFor
                      << " for, " << p.votesAgainst << " against)";
        return Status::Ok();
    });
}

Status GroupEngine::DispatchProposal(const Proposal& proposal, Timestamp now) {
    const Address& target = proposal.target;
    GroupEvent ev;
    ev.account = target;

    switch (proposal.type) {
        case ProposalType::CancelPunishment:
            if (!HasActivePunishment(target)) {
                return Status::Precondition("No active punishment");
            }
            ClearPunishment(target, now);
            return Status::Ok();

        case ProposalType::AddAdmin:
            state_.admins.insert(target);
            ev.type = EventType::AdminAdded;
            Emit(std::move(ev));
            return Status::Ok();

        case ProposalType::RemoveAdmin:
            if (target == state_.creator) {
                return Status::Precondition("Cannot remove creator");
            }
            state_.admins.erase(target);
            ev.type = EventType::AdminRemoved;
            Emit(std::move(ev));
            return Status::Ok();

        case ProposalType::KickMember:
            if (!IsActiveMember(target)) {
                return Status::Precondition("Not an active member");
            }
            Deactivate(state_.members[target]);
            state_.members[target].hasLeft = true;
            ev.type = EventType::MemberKicked;
            Emit(std::move(ev));
            LOG_WARN(GOV) << target.ToString() << " removed by proposal " << proposal.id;
            return Status::Ok();
    }
    return Status::Integrity("Unknown proposal type");
}

} // namespace group
} // namespace chama
