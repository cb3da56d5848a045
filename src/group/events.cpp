// CHAMA - Group Events Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/group/events.h"
#include "chama/crypto/sha256.h"
#include "chama/group/types.h"
#include "chama/util/logging.h"
#include "chama/util/time.h"

#include <sstream>

namespace chama {
namespace group {

// ============================================================================
// Event Types
// ============================================================================

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::GroupCreated:               return "GroupCreated";
        case EventType::MemberJoined:               return "MemberJoined";
        case EventType::JoinRequested:              return "JoinRequested";
        case EventType::JoinApproved:               return "JoinApproved";
        case EventType::MemberLeft:                 return "MemberLeft";
        case EventType::MemberKicked:               return "MemberKicked";
        case EventType::ContributionMade:           return "ContributionMade";
        case EventType::MissedContributionDetected: return "MissedContributionDetected";
        case EventType::MemberPunished:             return "MemberPunished";
        case EventType::PunishmentCancelled:        return "PunishmentCancelled";
        case EventType::FineCollected:              return "FineCollected";
        case EventType::PayoutQueueSet:             return "PayoutQueueSet";
        case EventType::PayoutProcessed:            return "PayoutProcessed";
        case EventType::EmergencyWithdrawal:        return "EmergencyWithdrawal";
        case EventType::AdminAdded:                 return "AdminAdded";
        case EventType::AdminRemoved:               return "AdminRemoved";
        case EventType::CreatorTransferred:         return "CreatorTransferred";
        case EventType::ProposalCreated:            return "ProposalCreated";
        case EventType::VoteCast:                   return "VoteCast";
        case EventType::ProposalExecuted:           return "ProposalExecuted";
        case EventType::GroupPaused:                return "GroupPaused";
        case EventType::GroupUnpaused:              return "GroupUnpaused";
        case EventType::RegistryPaused:             return "RegistryPaused";
        case EventType::RegistryUnpaused:           return "RegistryUnpaused";
        case EventType::EmergencyShareOwed:         return "EmergencyShareOwed";
        case EventType::EmergencyShareClaimed:      return "EmergencyShareClaimed";
        default:                                    return "Unknown";
    }
}

std::string GroupEvent::ToString() const {
    std::ostringstream ss;
    ss << util::FormatISO8601(timestamp) << " " << EventTypeToString(type);

    switch (type) {
        case EventType::ContributionMade:
        case EventType::MissedContributionDetected:
            ss << " member=" << account.ToString() << " period=" << index;
            if (amount != 0) ss << " amount=" << FormatAmount(amount);
            break;
        case EventType::MemberPunished:
            ss << " member=" << account.ToString()
               << " action=" << PunishmentActionToString(static_cast<PunishmentAction>(code));
            if (!detail.empty()) ss << " reason=\"" << detail << "\"";
            break;
        case EventType::PayoutProcessed:
            ss << " recipient=" << account.ToString() << " period=" << index
               << " amount=" << FormatAmount(amount);
            if (flag) ss << " skipped";
            break;
        case EventType::ProposalCreated:
            ss << " id=" << index
               << " type=" << ProposalTypeToString(static_cast<ProposalType>(code))
               << " target=" << other.ToString();
            break;
        case EventType::VoteCast:
            ss << " id=" << index << " voter=" << account.ToString()
               << (flag ? " for" : " against");
            break;
        case EventType::ProposalExecuted:
            ss << " id=" << index;
            break;
        case EventType::CreatorTransferred:
            ss << " from=" << other.ToString() << " to=" << account.ToString();
            break;
        case EventType::GroupCreated:
            ss << " group=" << group.ToString() << " creator=" << account.ToString();
            if (!detail.empty()) ss << " name=\"" << detail << "\"";
            break;
        default:
            if (!account.IsNull()) ss << " account=" << account.ToString();
            if (amount != 0) ss << " amount=" << FormatAmount(amount);
            break;
    }
    return ss.str();
}

bool GroupEvent::operator==(const GroupEvent& o) const {
    return type == o.type && group == o.group && account == o.account &&
           other == o.other && amount == o.amount && index == o.index &&
           code == o.code && flag == o.flag && detail == o.detail &&
           timestamp == o.timestamp;
}

// ============================================================================
// Journal Records
// ============================================================================

namespace {

struct JournalRecord {
    Hash256 prevHash;
    GroupEvent event;
};

template<typename Stream>
void Serialize(Stream& s, const JournalRecord& rec) {
    ::chama::Serialize(s, rec.prevHash);
    ::chama::group::Serialize(s, rec.event);
}

template<typename Stream>
void Unserialize(Stream& s, JournalRecord& rec) {
    ::chama::Unserialize(s, rec.prevHash);
    ::chama::group::Unserialize(s, rec.event);
}

struct JournalHead {
    uint64_t count{0};
    Hash256 lastHash;
};

template<typename Stream>
void Serialize(Stream& s, const JournalHead& head) {
    ::chama::Serialize(s, head.count);
    ::chama::Serialize(s, head.lastHash);
}

template<typename Stream>
void Unserialize(Stream& s, JournalHead& head) {
    ::chama::Unserialize(s, head.count);
    ::chama::Unserialize(s, head.lastHash);
}

const std::string& HeadKey() {
    static const std::string key(1, db::prefix::JOURNAL_HEAD);
    return key;
}

Hash256 LinkHash(const Hash256& prev, const GroupEvent& event) {
    DataStream ss;
    ss << event;
    SHA256 hasher;
    hasher.Write(prev.data(), Hash256::SIZE);
    hasher.Write(ss.data(), ss.size());
    Hash256 out;
    hasher.Finalize(out.data());
    return out;
}

} // namespace

// ============================================================================
// EventJournal
// ============================================================================

EventJournal::EventJournal(db::Database& db) : db_(db) {}

db::Status EventJournal::Open() {
    std::string value;
    db::Status s = db_.Get(HeadKey(), &value);
    if (s.IsNotFound()) {
        count_ = 0;
        lastHash_.SetNull();
        return db::Status::Ok();
    }
    if (!s.ok()) return s;

    JournalHead head;
    if (!db::DeserializeFromString(value, head)) {
        return db::Status::Corruption("Malformed journal head");
    }
    count_ = head.count;
    lastHash_ = head.lastHash;
    LOG_DEBUG(util::LogCategory::JOURNAL) << "Opened journal with " << count_ << " records";
    return db::Status::Ok();
}

db::Status EventJournal::Append(const GroupEvent& event) {
    JournalRecord rec{lastHash_, event};
    Hash256 next = LinkHash(lastHash_, event);
    JournalHead head{count_ + 1, next};

    db::WriteBatch batch;
    batch.Put(db::MakeSeqKey(db::prefix::EVENT, count_), db::SerializeToString(rec));
    batch.Put(HeadKey(), db::SerializeToString(head));

    db::Status s = db_.Write(&batch);
    if (!s.ok()) return s;

    count_ = head.count;
    lastHash_ = next;
    return db::Status::Ok();
}

db::Status EventJournal::Load(std::vector<GroupEvent>& events) const {
    events.clear();
    const std::string start = db::MakeSeqKey(db::prefix::EVENT, 0);
    const std::string pfx(1, db::prefix::EVENT);

    auto it = db_.NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(pfx); it->Next()) {
        auto seq = db::ParseSeqKey(db::prefix::EVENT, it->key());
        if (!seq || *seq != events.size()) {
            return db::Status::Corruption("Journal sequence gap");
        }
        JournalRecord rec;
        if (!db::DeserializeFromString(it->value().ToString(), rec)) {
            return db::Status::Corruption("Malformed journal record " + std::to_string(*seq));
        }
        events.push_back(std::move(rec.event));
    }
    return it->status();
}

db::Status EventJournal::Verify() const {
    const std::string pfx(1, db::prefix::EVENT);
    Hash256 running;
    uint64_t seen = 0;

    auto it = db_.NewIterator();
    for (it->Seek(db::MakeSeqKey(db::prefix::EVENT, 0));
         it->Valid() && it->key().starts_with(pfx); it->Next()) {
        auto seq = db::ParseSeqKey(db::prefix::EVENT, it->key());
        if (!seq || *seq != seen) {
            return db::Status::Corruption("Journal sequence gap at " + std::to_string(seen));
        }
        JournalRecord rec;
        if (!db::DeserializeFromString(it->value().ToString(), rec)) {
            return db::Status::Corruption("Malformed journal record " + std::to_string(seen));
        }
        if (rec.prevHash != running) {
            return db::Status::Corruption("Broken hash link at record " + std::to_string(seen));
        }
        running = LinkHash(running, rec.event);
        ++seen;
    }
    db::Status s = it->status();
    if (!s.ok()) return s;

    if (seen != count_ || running != lastHash_) {
        return db::Status::Corruption("Journal head does not match records");
    }
    return db::Status::Ok();
}

EventCallback EventJournal::Sink() {
    return [this](const GroupEvent& event) {
        db::Status s = Append(event);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::JOURNAL) << "Failed to append "
                << EventTypeToString(event.type) << ": " << s.ToString();
        }
    };
}

} // namespace group
} // namespace chama
