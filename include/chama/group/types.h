// CHAMA - Group Types
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Value types owned by a group engine: rules, members, punishments,
// proposals and payout records, plus the engine-wide tunables.

#ifndef CHAMA_GROUP_TYPES_H
#define CHAMA_GROUP_TYPES_H

#include "chama/core/types.h"
#include "chama/util/time.h"

#include <cstdint>
#include <optional>
#include <string>

namespace chama {
namespace group {

// ============================================================================
// Constants
// ============================================================================

/// Length of one accounting period
constexpr int64_t PERIOD_DURATION = util::SECONDS_PER_WEEK;

/// How long a proposal accepts votes
constexpr int64_t DEFAULT_PROPOSAL_DURATION = 3 * util::SECONDS_PER_DAY;

/// Share of active members that must vote for a proposal to be executable
constexpr uint32_t DEFAULT_QUORUM_PERCENT = 50;

/// Automatic punishment fires once missed contributions exceed this count
constexpr uint32_t MAX_MISSED_CONTRIBUTIONS = 2;

/// Consecutive automatic fines that escalate to a ban
constexpr uint32_t FINE_ESCALATION_THRESHOLD = 3;

/// Fine charged per punishment and deducted per missed period on exit
constexpr Amount DEFAULT_FINE_AMOUNT = COIN / 100;

// ============================================================================
// Enumerations
// ============================================================================

enum class PunishmentAction : uint8_t {
    None = 0,
    Warning = 1,
    Fine = 2,
    Ban = 3,
};

const char* PunishmentActionToString(PunishmentAction action);

/// Accepts the name (case-insensitive) or the numeric code
std::optional<PunishmentAction> ParsePunishmentAction(const std::string& str);

enum class ProposalType : uint8_t {
    CancelPunishment = 0,
    AddAdmin = 1,
    RemoveAdmin = 2,
    KickMember = 3,
};

const char* ProposalTypeToString(ProposalType type);

/// Accepts the name (case-insensitive) or the numeric code
std::optional<ProposalType> ParseProposalType(const std::string& str);

// ============================================================================
// Group Configuration
// ============================================================================

/// Rules fixed at construction
struct GroupRules {
    std::string name;
    Amount contributionAmount{0};
    std::string contributionFrequency{"weekly"};
    uint32_t maxMembers{0};
    Timestamp startDate{0};
    Timestamp endDate{0};
    PunishmentAction punishmentMode{PunishmentAction::None};
    bool approvalRequired{false};
    bool emergencyWithdrawAllowed{false};
};

/// Everything the registry hands to a new engine
struct GroupParams {
    GroupRules rules;
    Address creator;
    /// Null means the group collects the native asset
    Address contributionToken;
    /// Seconds after the window closes during which contributions still count
    int64_t gracePeriod{0};
    /// Seconds after period start during which contributions are expected
    int64_t contributionWindow{0};
    Amount fineAmount{DEFAULT_FINE_AMOUNT};

    bool IsTokenBased() const { return !contributionToken.IsNull(); }
};

/// Engine-wide tunables
struct EngineSettings {
    int64_t periodDuration{PERIOD_DURATION};
    int64_t proposalDuration{DEFAULT_PROPOSAL_DURATION};
    uint32_t quorumPercent{DEFAULT_QUORUM_PERCENT};
    uint32_t maxMissedContributions{MAX_MISSED_CONTRIBUTIONS};
    uint32_t escalationThreshold{FINE_ESCALATION_THRESHOLD};
};

// ============================================================================
// Ledger Records
// ============================================================================

struct Member {
    bool exists{false};
    bool isActive{false};
    Timestamp joinedAt{0};
    Amount totalContributed{0};
    uint32_t missedContributions{0};
    uint32_t consecutiveFines{0};
    /// First period not yet inspected for a missed contribution
    uint64_t nextCheckPeriod{0};
    /// Left or was kicked; never reactivated
    bool hasLeft{false};
};

/// At most one per member; a new punishment overwrites the old record
struct Punishment {
    PunishmentAction action{PunishmentAction::None};
    std::string reason;
    bool isActive{false};
    Timestamp issuedAt{0};
    Amount fineAmount{0};
};

struct Proposal {
    uint64_t id{0};
    ProposalType type{ProposalType::CancelPunishment};
    Address proposer;
    Address target;
    int64_t value{0};
    std::string description;
    uint32_t votesFor{0};
    uint32_t votesAgainst{0};
    Timestamp createdAt{0};
    bool executed{false};
};

struct PayoutRecord {
    Address recipient;
    Amount amount{0};
    Timestamp timestamp{0};
    bool wasSkipped{false};
};

} // namespace group
} // namespace chama

#endif // CHAMA_GROUP_TYPES_H
