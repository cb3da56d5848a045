// CHAMA - Configuration File Parser Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/util/config.h"
#include "chama/util/time.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace chama {
namespace util {

std::string ConfigParseResult::ToString() const {
    if (success) return "OK";
    std::string out;
    if (!errorFile.empty()) {
        out += errorFile;
        if (errorLine > 0) out += ":" + std::to_string(errorLine);
        out += ": ";
    }
    return out + errorMessage;
}

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    const char first = str.front();
    const char last = str.back();
    if (first != last || (first != '"' && first != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Escapes are honoured in double-quoted strings only
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': unescaped += '\n'; ++i; continue;
                case 't': unescaped += '\t'; ++i; continue;
                case '\\': unescaped += '\\'; ++i; continue;
                case '"': unescaped += '"'; ++i; continue;
                default: break;
            }
        }
        unescaped += inner[i];
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart;
            size_t nameEnd;
            size_t resume;
            if (value[i + 1] == '{') {
                nameStart = i + 2;
                nameEnd = value.find('}', nameStart);
                if (nameEnd == std::string::npos) {
                    result += value.substr(i);
                    break;
                }
                resume = nameEnd + 1;
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                resume = nameEnd;
            }

            if (nameEnd > nameStart) {
                const char* envValue = std::getenv(value.substr(nameStart, nameEnd - nameStart).c_str());
                if (envValue) result += envValue;
                i = resume;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        if (!IsValidKey(currentSection)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + currentSection, source, lineNum);
            return false;
        }
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag; "nokey" negates
        key = trimmed;
        value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    std::transform(key.begin(), key.end(), key.begin(), ::tolower);
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: " + key, source, lineNum);
        return false;
    }

    const std::string fullKey = MakeKey(key, currentSection);
    if (entries_.count(fullKey) > 0) {
        result.warnings.push_back(source + ":" + std::to_string(lineNum) +
                                  ": duplicate key " + fullKey);
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[fullKey] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuation;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, source, lineNum, currentSection, result)) {
        return result;
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    const std::string path = ExpandEnvVars(filePath);

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }

    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseOverride(const std::string& assignment) {
    size_t eqPos = assignment.find('=');
    if (eqPos == std::string::npos) {
        return ConfigParseResult::Error("Override must be key=value: " + assignment,
                                        "<override>");
    }

    std::string name = Trim(assignment.substr(0, eqPos));
    std::string section;
    size_t dot = name.find('.');
    if (dot != std::string::npos) {
        section = name.substr(0, dot);
        name = name.substr(dot + 1);
    }

    ConfigParseResult result = ConfigParseResult::Success();
    std::string line = name + "=" + assignment.substr(eqPos + 1);
    if (!ParseLine(line, "<override>", 0, section, result)) {
        return result;
    }
    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty()) {
        return std::nullopt;
    }

    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);
        if (pos != str->length()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetDuration(const std::string& key,
                                                     const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseDuration(*str);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;
    auto str = TryGetString(key, section);
    if (!str) {
        return result;
    }

    std::istringstream stream(*str);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<set>";
    entries_[MakeKey(key, section)] = entry;
}

// ============================================================================
// Sections
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [key, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

std::string ConfigManager::Dump() const {
    std::map<std::string, std::vector<const ConfigEntry*>> bySection;
    for (const auto& [key, entry] : entries_) {
        bySection[entry.section].push_back(&entry);
    }

    std::ostringstream oss;
    for (const auto& [section, entries] : bySection) {
        if (!section.empty()) {
            oss << "[" << section << "]\n";
        }
        for (const ConfigEntry* entry : entries) {
            oss << entry->key << "=" << entry->value << "  # " << entry->source;
            if (entry->lineNumber > 0) {
                oss << ":" << entry->lineNumber;
            }
            oss << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace util
} // namespace chama
