// SPECTRE - Configuration File Parser Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/util/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace spectre {
namespace util {

std::string ConfigParseResult::Describe() const {
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

    char first = str.front();
    char last = str.back();
    if (first == '\'' && last == '\'') {
        return str.substr(1, str.length() - 2);
    }
    if (first != '"' || last != '"') {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n':  unescaped += '\n'; ++i; continue;
                case 't':  unescaped += '\t'; ++i; continue;
                case '\\': unescaped += '\\'; ++i; continue;
                case '"':  unescaped += '"';  ++i; continue;
                default: break;
            }
        }
        unescaped += inner[i];
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

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
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string varName = value.substr(i + 2, end - i - 2);
                if (const char* envValue = std::getenv(varName.c_str())) {
                    result += envValue;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;
    }

    std::string home;
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& source, int lineNum) {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.isDefault) {
        ConfigEntry entry;
        entry.key = key;
        entry.values.push_back(value);
        entry.source = source;
        entry.lineNumber = lineNum;
        entries_[key] = std::move(entry);
        return;
    }
    it->second.values.push_back(value);
    it->second.source = source;
    it->second.lineNumber = lineNum;
}

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
        return true;
    }

    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error("Maximum include depth exceeded", source, lineNum);
            return false;
        }
        std::string includePath = ExpandEnvVars(ExpandTilde(Unquote(Trim(trimmed.substr(8)))));

        ++includeDepth_;
        ConfigParseResult included = ParseFile(includePath);
        --includeDepth_;

        if (!included.success) {
            result = included;
            return false;
        }
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag; "nofoo" means foo=false
        key = trimmed;
        value = "true";
        if (key.size() > 2 && key.compare(0, 2, "no") == 0 && std::islower(key[2])) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }

    Store(currentSection.empty() ? key : currentSection + "." + key, value, source, lineNum);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& sourceName) {
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
                sourceName, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, sourceName, lineNum, currentSection, result)) {
        return result;
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseStream(file, expandedPath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    ConfigParseResult result = ConfigParseResult::Success();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-' || arg == "-") {
            result.positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            for (++i; i < argc; ++i) result.positional.push_back(argv[i]);
            break;
        }

        size_t start = arg.find_first_not_of('-');
        arg = arg.substr(start);

        std::string key;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else if (arg.size() > 2 && arg.compare(0, 2, "no") == 0 && std::islower(arg[2])) {
            key = arg.substr(2);
            value = "false";
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            key = arg;
            value = argv[++i];
        } else {
            key = arg;
            value = "true";
        }

        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>");
        }

        ConfigEntry entry;
        entry.key = key;
        entry.values.push_back(value);
        entry.source = "<command-line>";
        entries_[key] = std::move(entry);
    }

    return result;
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return entries_.count(key) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.values.empty()) {
        return std::nullopt;
    }
    return it->second.values.back();
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto text = TryGetString(key);
    if (!text) {
        return std::nullopt;
    }
    std::string strValue = Trim(*text);

    int64_t value = 0;
    const char* first = strValue.data();
    const char* last = first + strValue.size();
    auto parsed = std::from_chars(first, last, value);
    if (parsed.ec != std::errc() || parsed.ptr == first) {
        return std::nullopt;
    }

    std::string suffix = Trim(std::string(parsed.ptr, last));
    if (suffix.empty()) {
        return value;
    }
    if (suffix.size() != 1) {
        return std::nullopt;
    }
    switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
        case 'k': return value * 1024;
        case 'm': return value * 1024 * 1024;
        case 'g': return value * 1024LL * 1024 * 1024;
        default:  return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue) const {
    return TryGetInt(key).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key) const {
    auto intValue = TryGetInt(key);
    if (!intValue || *intValue < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*intValue);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue) const {
    return TryGetUInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto text = TryGetString(key);
    if (!text) {
        return std::nullopt;
    }
    return ParseBool(*text);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key) const {
    std::vector<std::string> result;
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return result;
    }

    for (const auto& value : it->second.values) {
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value) {
    ConfigEntry entry;
    entry.key = key;
    entry.values.push_back(value);
    entry.source = "<programmatic>";
    entries_[key] = std::move(entry);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    auto it = entries_.find(key);
    if (it != entries_.end() && !it->second.isDefault) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.values.push_back(value);
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[key] = std::move(entry);
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key) {
    allowedKeys_.insert(key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    if (allowedKeys_.empty()) {
        return errors;
    }
    for (const auto& [key, entry] : entries_) {
        if (allowedKeys_.count(key) == 0) {
            errors.push_back("Unknown key: " + key + " (defined in " + entry.source + ")");
        }
    }
    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    allowedKeys_.clear();
    includeDepth_ = 0;
}

std::vector<std::string> ConfigManager::GetKeys() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        keys.push_back(key);
    }
    return keys;
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    for (const auto& [key, entry] : entries_) {
        for (const auto& value : entry.values) {
            oss << key << "=" << value << "\n";
        }
    }
    return oss.str();
}

void AllowStandardKeys(ConfigManager& config) {
    for (const char* key : {
             ConfigKeys::CONF, ConfigKeys::LOGLEVEL, ConfigKeys::LOGFILE,
             ConfigKeys::PRINTTOCONSOLE, ConfigKeys::CIRCUITS_PATH, ConfigKeys::CIRCUITS_REMOTE,
             ConfigKeys::CIRCUITS_NAME, ConfigKeys::CIRCUITS_CACHEDIR, ConfigKeys::CIRCUITS_TIMEOUT,
             ConfigKeys::HASHER_BACKEND, ConfigKeys::PROVER_SNARKJS, ConfigKeys::PROVER_WORKDIR,
             ConfigKeys::PROVER_THREADS, ConfigKeys::SHIELD_TREEDEPTH, ConfigKeys::SHIELD_FEEBPS,
             ConfigKeys::SHIELD_PROGRAMID, ConfigKeys::WITHDRAW_PROGRAMID,
             ConfigKeys::WITHDRAW_AUTHORITY, ConfigKeys::WITHDRAW_EXPIRY,
             ConfigKeys::HTTP_BIND, ConfigKeys::HTTP_PORT, ConfigKeys::HTTP_THREADS}) {
        config.AllowKey(key);
    }
}

} // namespace util
} // namespace spectre
