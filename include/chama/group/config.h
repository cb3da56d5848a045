// CHAMA - Group Configuration
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Maps the [engine] and [group] configuration sections onto
// EngineSettings and GroupParams.

#ifndef CHAMA_GROUP_CONFIG_H
#define CHAMA_GROUP_CONFIG_H

#include "chama/group/types.h"
#include "chama/util/config.h"

#include <string>

namespace chama {
namespace group {

/// Overlay [engine] keys onto settings. Missing keys keep their value.
util::ConfigParseResult LoadEngineSettings(const util::ConfigManager& config,
                                           EngineSettings& settings);

/**
 * Overlay [group] keys onto params.
 *
 * Dates are ISO-8601 or "+<duration>" relative to now. Amounts are decimal
 * coin values. The creator is left untouched; the registry assigns it.
 */
util::ConfigParseResult LoadGroupParams(const util::ConfigManager& config,
                                        Timestamp now, GroupParams& params);

/// "0x"-prefixed hex address, or a label hashed with AddressFromLabel
Address ParseAccount(const std::string& str);

} // namespace group
} // namespace chama

#endif // CHAMA_GROUP_CONFIG_H
