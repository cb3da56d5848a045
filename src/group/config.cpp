// CHAMA - Group Configuration Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/group/config.h"
#include "chama/crypto/sha256.h"
#include "chama/util/time.h"

namespace chama {
namespace group {

namespace Keys = util::ConfigKeys;

namespace {

util::ConfigParseResult KeyError(const util::ConfigManager& config, const char* section,
                                 const char* key, const std::string& what) {
    auto entry = config.GetEntry(key, section);
    std::string file = entry ? entry->source : "";
    int line = entry ? entry->lineNumber : 0;
    return util::ConfigParseResult::Error(std::string(section) + "." + key + ": " + what,
                                          file, line);
}

std::optional<Timestamp> ParseDate(const std::string& str, Timestamp now) {
    if (!str.empty() && str[0] == '+') {
        auto offset = util::ParseDuration(str.substr(1));
        if (!offset) return std::nullopt;
        return now + *offset;
    }
    return util::ParseISO8601(str);
}

} // namespace

Address ParseAccount(const std::string& str) {
    if (str.size() == 2 + 2 * Address::SIZE && str.compare(0, 2, "0x") == 0) {
        if (auto addr = Address::FromString(str)) return *addr;
    }
    return AddressFromLabel(str);
}

util::ConfigParseResult LoadEngineSettings(const util::ConfigManager& config,
                                           EngineSettings& settings) {
    const char* section = Keys::ENGINE;

    if (config.HasKey(Keys::PERIODDURATION, section)) {
        auto v = config.TryGetDuration(Keys::PERIODDURATION, section);
        if (!v || *v <= 0) return KeyError(config, section, Keys::PERIODDURATION, "expected a positive duration");
        settings.periodDuration = *v;
    }
    if (config.HasKey(Keys::PROPOSALDURATION, section)) {
        auto v = config.TryGetDuration(Keys::PROPOSALDURATION, section);
        if (!v || *v <= 0) return KeyError(config, section, Keys::PROPOSALDURATION, "expected a positive duration");
        settings.proposalDuration = *v;
    }
    if (config.HasKey(Keys::QUORUMPERCENT, section)) {
        auto v = config.TryGetInt(Keys::QUORUMPERCENT, section);
        if (!v || *v < 0 || *v > 100) return KeyError(config, section, Keys::QUORUMPERCENT, "expected 0..100");
        settings.quorumPercent = static_cast<uint32_t>(*v);
    }
    if (config.HasKey(Keys::MAXMISSED, section)) {
        auto v = config.TryGetInt(Keys::MAXMISSED, section);
        if (!v || *v < 0) return KeyError(config, section, Keys::MAXMISSED, "expected a non-negative integer");
        settings.maxMissedContributions = static_cast<uint32_t>(*v);
    }
    if (config.HasKey(Keys::ESCALATIONTHRESHOLD, section)) {
        auto v = config.TryGetInt(Keys::ESCALATIONTHRESHOLD, section);
        if (!v || *v < 1) return KeyError(config, section, Keys::ESCALATIONTHRESHOLD, "expected a positive integer");
        settings.escalationThreshold = static_cast<uint32_t>(*v);
    }
    return util::ConfigParseResult::Success();
}

util::ConfigParseResult LoadGroupParams(const util::ConfigManager& config,
                                        Timestamp now, GroupParams& params) {
    const char* section = Keys::GROUP;
    GroupRules& rules = params.rules;

    if (auto name = config.TryGetString(Keys::NAME, section)) {
        rules.name = *name;
    }
    if (auto freq = config.TryGetString(Keys::FREQUENCY, section)) {
        rules.contributionFrequency = *freq;
    }

    if (auto str = config.TryGetString(Keys::CONTRIBUTION, section)) {
        auto amount = ParseAmount(*str);
        if (!amount) return KeyError(config, section, Keys::CONTRIBUTION, "invalid amount " + *str);
        rules.contributionAmount = *amount;
    }
    if (auto str = config.TryGetString(Keys::FINEAMOUNT, section)) {
        auto amount = ParseAmount(*str);
        if (!amount) return KeyError(config, section, Keys::FINEAMOUNT, "invalid amount " + *str);
        params.fineAmount = *amount;
    }

    if (config.HasKey(Keys::MAXMEMBERS, section)) {
        auto v = config.TryGetInt(Keys::MAXMEMBERS, section);
        if (!v || *v < 0 || *v > UINT32_MAX) {
            return KeyError(config, section, Keys::MAXMEMBERS, "expected a member count");
        }
        rules.maxMembers = static_cast<uint32_t>(*v);
    }

    if (auto str = config.TryGetString(Keys::STARTDATE, section)) {
        auto ts = ParseDate(*str, now);
        if (!ts) return KeyError(config, section, Keys::STARTDATE, "invalid date " + *str);
        rules.startDate = *ts;
    }
    if (auto str = config.TryGetString(Keys::ENDDATE, section)) {
        auto ts = ParseDate(*str, now);
        if (!ts) return KeyError(config, section, Keys::ENDDATE, "invalid date " + *str);
        rules.endDate = *ts;
    }

    if (auto str = config.TryGetString(Keys::PUNISHMENTMODE, section)) {
        auto mode = ParsePunishmentAction(*str);
        if (!mode) return KeyError(config, section, Keys::PUNISHMENTMODE, "unknown action " + *str);
        rules.punishmentMode = *mode;
    }

    if (config.HasKey(Keys::APPROVALREQUIRED, section)) {
        auto v = config.TryGetBool(Keys::APPROVALREQUIRED, section);
        if (!v) return KeyError(config, section, Keys::APPROVALREQUIRED, "expected a boolean");
        rules.approvalRequired = *v;
    }
    if (config.HasKey(Keys::EMERGENCYWITHDRAW, section)) {
        auto v = config.TryGetBool(Keys::EMERGENCYWITHDRAW, section);
        if (!v) return KeyError(config, section, Keys::EMERGENCYWITHDRAW, "expected a boolean");
        rules.emergencyWithdrawAllowed = *v;
    }

    if (auto str = config.TryGetString(Keys::TOKEN, section)) {
        params.contributionToken = str->empty() ? Address() : ParseAccount(*str);
    }

    if (config.HasKey(Keys::GRACEPERIOD, section)) {
        auto v = config.TryGetDuration(Keys::GRACEPERIOD, section);
        if (!v || *v < 0) return KeyError(config, section, Keys::GRACEPERIOD, "expected a duration");
        params.gracePeriod = *v;
    }
    if (config.HasKey(Keys::CONTRIBUTIONWINDOW, section)) {
        auto v = config.TryGetDuration(Keys::CONTRIBUTIONWINDOW, section);
        if (!v || *v < 0) return KeyError(config, section, Keys::CONTRIBUTIONWINDOW, "expected a duration");
        params.contributionWindow = *v;
    }

    return util::ConfigParseResult::Success();
}

} // namespace group
} // namespace chama
