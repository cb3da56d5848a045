// CHAMA - Group Types Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/group/types.h"

#include <algorithm>
#include <cctype>

namespace chama {
namespace group {

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

const char* PunishmentActionToString(PunishmentAction action) {
    switch (action) {
        case PunishmentAction::None:    return "None";
        case PunishmentAction::Warning: return "Warning";
        case PunishmentAction::Fine:    return "Fine";
        case PunishmentAction::Ban:     return "Ban";
        default:                        return "Unknown";
    }
}

std::optional<PunishmentAction> ParsePunishmentAction(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "none" || lower == "0") return PunishmentAction::None;
    if (lower == "warning" || lower == "1") return PunishmentAction::Warning;
    if (lower == "fine" || lower == "2") return PunishmentAction::Fine;
    if (lower == "ban" || lower == "3") return PunishmentAction::Ban;
    return std::nullopt;
}

const char* ProposalTypeToString(ProposalType type) {
    switch (type) {
        case ProposalType::CancelPunishment: return "CancelPunishment";
        case ProposalType::AddAdmin:         return "AddAdmin";
        case ProposalType::RemoveAdmin:      return "RemoveAdmin";
        case ProposalType::KickMember:       return "KickMember";
        default:                             return "Unknown";
    }
}

std::optional<ProposalType> ParseProposalType(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "cancelpunishment" || lower == "cancel" || lower == "0") {
        return ProposalType::CancelPunishment;
    }
    if (lower == "addadmin" || lower == "1") return ProposalType::AddAdmin;
    if (lower == "removeadmin" || lower == "2") return ProposalType::RemoveAdmin;
    if (lower == "kickmember" || lower == "kick" || lower == "3") return ProposalType::KickMember;
    return std::nullopt;
}

} // namespace group
} // namespace chama
