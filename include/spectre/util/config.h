// SPECTRE - Configuration File Parser
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// INI-style configuration for the prover daemon and command-line tool.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs; keys are dotted ("circuits.path")
// - Section headers: [section] prefixes the following keys ("section.key")
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Repeating a key builds a list; comma-separated values also form a list
// - Environment variable expansion: ${VAR_NAME}
// - "include <path>" pulls in another file

#ifndef SPECTRE_UTIL_CONFIG_H
#define SPECTRE_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace spectre {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "spectre.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth (to prevent infinite recursion)
constexpr int MAX_INCLUDE_DEPTH = 10;

/// Raised when a configured value cannot be used
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    /// Every value given for the key, in order; the last one wins for scalars
    std::vector<std::string> values;
    std::string source;
    int lineNumber{0};
    bool isDefault{false};
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
    /// Non-option command-line arguments, in order
    std::vector<std::string> positional;

    static ConfigParseResult Success() {
        ConfigParseResult r;
        r.success = true;
        return r;
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        ConfigParseResult r;
        r.errorMessage = msg;
        r.errorFile = file;
        r.errorLine = line;
        return r;
    }

    /// "file:line: message"
    std::string Describe() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Configuration from files and command-line arguments.
 *
 * Priority (highest first): command line, config file, built-in defaults.
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

    /**
     * Parse --key=value, --key value, --flag and --noflag arguments.
     * Command-line values replace anything read from files. Arguments not
     * starting with '-' are returned in ConfigParseResult::positional.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key) const;

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// Integer with optional k/m/g suffix (binary multiples)
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;

    std::optional<uint64_t> TryGetUInt(const std::string& key) const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue) const;

    /// true/false, yes/no, on/off, 1/0
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// All values for a repeated or comma-separated key
    std::vector<std::string> GetList(const std::string& key) const;

    /// String value with ~ and ${VAR} expansion
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Replace any value for key
    void Set(const std::string& key, const std::string& value);

    /// Set unless the key already has a non-default value
    void SetDefault(const std::string& key, const std::string& value);

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register a known key; once any are registered, others are reported
    void AllowKey(const std::string& key);

    /// Messages for unknown keys
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// All keys in sorted order
    std::vector<std::string> GetKeys() const;

    /// "key=value" lines for every entry
    std::string Dump() const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    ConfigParseResult ParseStream(std::istream& in, const std::string& sourceName);

    void Store(const std::string& key, const std::string& value,
               const std::string& source, int lineNum);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    constexpr const char* CIRCUITS_PATH = "circuits.path";
    constexpr const char* CIRCUITS_REMOTE = "circuits.remote";
    constexpr const char* CIRCUITS_NAME = "circuits.name";
    constexpr const char* CIRCUITS_CACHEDIR = "circuits.cachedir";
    constexpr const char* CIRCUITS_TIMEOUT = "circuits.timeout";

    constexpr const char* HASHER_BACKEND = "hasher.backend";

    constexpr const char* PROVER_SNARKJS = "prover.snarkjs";
    constexpr const char* PROVER_WORKDIR = "prover.workdir";
    constexpr const char* PROVER_THREADS = "prover.threads";

    constexpr const char* SHIELD_TREEDEPTH = "shield.treedepth";
    constexpr const char* SHIELD_FEEBPS = "shield.feebps";
    constexpr const char* SHIELD_PROGRAMID = "shield.programid";

    constexpr const char* WITHDRAW_PROGRAMID = "withdraw.programid";
    constexpr const char* WITHDRAW_AUTHORITY = "withdraw.authority";
    constexpr const char* WITHDRAW_EXPIRY = "withdraw.expiry";

    constexpr const char* HTTP_BIND = "http.bind";
    constexpr const char* HTTP_PORT = "http.port";
    constexpr const char* HTTP_THREADS = "http.threads";
}

/// Register every key above as allowed
void AllowStandardKeys(ConfigManager& config);

} // namespace util
} // namespace spectre

#endif // SPECTRE_UTIL_CONFIG_H
