// CHAMA - Group Events
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Observable records emitted by engines and the registry, and the
// hash-chained journal that persists them.

#ifndef CHAMA_GROUP_EVENTS_H
#define CHAMA_GROUP_EVENTS_H

#include "chama/core/serialize.h"
#include "chama/core/types.h"
#include "chama/db/database.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace chama {
namespace group {

// ============================================================================
// Event Types
// ============================================================================

enum class EventType : uint8_t {
    GroupCreated = 0,
    MemberJoined = 1,
    JoinRequested = 2,
    JoinApproved = 3,
    MemberLeft = 4,
    MemberKicked = 5,
    ContributionMade = 6,
    MissedContributionDetected = 7,
    MemberPunished = 8,
    PunishmentCancelled = 9,
    FineCollected = 10,
    PayoutQueueSet = 11,
    PayoutProcessed = 12,
    EmergencyWithdrawal = 13,
    AdminAdded = 14,
    AdminRemoved = 15,
    CreatorTransferred = 16,
    ProposalCreated = 17,
    VoteCast = 18,
    ProposalExecuted = 19,
    GroupPaused = 20,
    GroupUnpaused = 21,
    RegistryPaused = 22,
    RegistryUnpaused = 23,
    EmergencyShareOwed = 24,
    EmergencyShareClaimed = 25,
};

const char* EventTypeToString(EventType type);

/// One emitted event. Field use depends on the type:
///   account   member, recipient, admin or new creator
///   other     previous creator, proposal target or token
///   amount    contribution, refund, fine or payout value
///   index     period or proposal id
///   code      punishment action or proposal type
///   flag      vote support or payout skip marker
struct GroupEvent {
    EventType type{EventType::GroupCreated};
    Address group;
    Address account;
    Address other;
    Amount amount{0};
    uint64_t index{0};
    uint8_t code{0};
    bool flag{false};
    std::string detail;
    Timestamp timestamp{0};

    /// Single-line human readable form
    std::string ToString() const;

    bool operator==(const GroupEvent& other) const;
    bool operator!=(const GroupEvent& o) const { return !(*this == o); }
};

using EventCallback = std::function<void(const GroupEvent&)>;

template<typename Stream>
void Serialize(Stream& s, const GroupEvent& ev) {
    ::chama::Serialize(s, static_cast<uint8_t>(ev.type));
    ::chama::Serialize(s, ev.group);
    ::chama::Serialize(s, ev.account);
    ::chama::Serialize(s, ev.other);
    ::chama::Serialize(s, ev.amount);
    ::chama::Serialize(s, ev.index);
    ::chama::Serialize(s, ev.code);
    ::chama::Serialize(s, ev.flag);
    ::chama::Serialize(s, ev.detail);
    ::chama::Serialize(s, ev.timestamp);
}

template<typename Stream>
void Unserialize(Stream& s, GroupEvent& ev) {
    uint8_t type = 0;
    ::chama::Unserialize(s, type);
    if (type > static_cast<uint8_t>(EventType::EmergencyShareClaimed)) {
        throw std::ios_base::failure("Unknown event type");
    }
    ev.type = static_cast<EventType>(type);
    ::chama::Unserialize(s, ev.group);
    ::chama::Unserialize(s, ev.account);
    ::chama::Unserialize(s, ev.other);
    ::chama::Unserialize(s, ev.amount);
    ::chama::Unserialize(s, ev.index);
    ::chama::Unserialize(s, ev.code);
    ::chama::Unserialize(s, ev.flag);
    ::chama::Unserialize(s, ev.detail);
    ::chama::Unserialize(s, ev.timestamp);
}

// ============================================================================
// Event Journal
// ============================================================================

/**
 * Append-only event log on a key-value store.
 *
 * Record n is stored under MakeSeqKey('e', n) as (prevHash, event). Each
 * link hash is SHA256(prevHash || serialized event); the head key holds
 * the record count and the last link hash.
 */
class EventJournal {
public:
    explicit EventJournal(db::Database& db);

    /// Read the head record. Missing head means an empty journal.
    db::Status Open();

    /// Append one event atomically with the head update
    db::Status Append(const GroupEvent& event);

    /// Read every record in order
    db::Status Load(std::vector<GroupEvent>& events) const;

    /// Recompute the chain and compare it with the head
    db::Status Verify() const;

    uint64_t Size() const { return count_; }
    const Hash256& LastHash() const { return lastHash_; }

    /// Adapter for GroupEngine::SetEventCallback. Append failures are logged.
    EventCallback Sink();

private:
    db::Database& db_;
    uint64_t count_{0};
    Hash256 lastHash_;
};

} // namespace group
} // namespace chama

#endif // CHAMA_GROUP_EVENTS_H
