// CHAMA - Configuration File Parser
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Parses INI-style configuration describing engine tunables and group rules.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME

#ifndef CHAMA_UTIL_CONFIG_H
#define CHAMA_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chama {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File, string name or "<override>"
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }

    /// "file:line: message", omitting empty parts
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration entries keyed by section and key.
 *
 * Later definitions of a key overwrite earlier ones. Overrides of the form
 * "section.key=value" take the same path and are applied after files.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Apply one "section.key=value" or "key=value" override
    ConfigParseResult ParseOverride(const std::string& assignment);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Decimal integer; nullopt if missing or malformed
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Seconds, with optional s/m/h/d/w suffix
    std::optional<int64_t> TryGetDuration(const std::string& key,
                                          const std::string& section = "") const;

    /// Comma-separated list, each item trimmed
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Where the key was defined, for diagnostics
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear() { entries_.clear(); }
    size_t Size() const { return entries_.size(); }

    /// Expand ${VAR} and $VAR references; unknown variables expand to ""
    static std::string ExpandEnvVars(const std::string& value);

    /// Dump all configuration as INI text
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static bool IsValidKey(const std::string& key);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Sections
    constexpr const char* ENGINE = "engine";
    constexpr const char* GROUP = "group";
    constexpr const char* LOG = "log";

    // [engine]
    constexpr const char* PERIODDURATION = "periodduration";
    constexpr const char* PROPOSALDURATION = "proposalduration";
    constexpr const char* QUORUMPERCENT = "quorumpercent";
    constexpr const char* MAXMISSED = "maxmissed";
    constexpr const char* ESCALATIONTHRESHOLD = "escalationthreshold";

    // [group]
    constexpr const char* NAME = "name";
    constexpr const char* CONTRIBUTION = "contribution";
    constexpr const char* MAXMEMBERS = "maxmembers";
    constexpr const char* STARTDATE = "startdate";
    constexpr const char* ENDDATE = "enddate";
    constexpr const char* FREQUENCY = "frequency";
    constexpr const char* PUNISHMENTMODE = "punishmentmode";
    constexpr const char* APPROVALREQUIRED = "approvalrequired";
    constexpr const char* EMERGENCYWITHDRAW = "emergencywithdraw";
    constexpr const char* TOKEN = "token";
    constexpr const char* GRACEPERIOD = "graceperiod";
    constexpr const char* CONTRIBUTIONWINDOW = "contributionwindow";
    constexpr const char* FINEAMOUNT = "fineamount";

    // [log]
    constexpr const char* LEVEL = "level";
    constexpr const char* FILE = "file";
    constexpr const char* CATEGORIES = "categories";
}

} // namespace util
} // namespace chama

#endif // CHAMA_UTIL_CONFIG_H
