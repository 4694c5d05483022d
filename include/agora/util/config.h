// AGORA - Configuration File Parser
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Parses INI-style configuration for governance parameters and logging.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef AGORA_UTIL_CONFIG_H
#define AGORA_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agora {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "agora.conf";

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
    std::string source;    // File path or "<string>"
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
    
    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }
    
    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Key/value store loaded from INI text. Later definitions of a key
 * replace earlier ones; defaults never replace a parsed value.
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);
    
    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;
    
    /// Whole-value integer parse; nullopt if missing or malformed
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
    
    std::optional<double> TryGetDouble(const std::string& key,
                                       const std::string& section = "") const;
    double GetDouble(const std::string& key,
                     double defaultValue,
                     const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    
    /// Set a value only if the key is absent
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");
    
    // ========================================================================
    // Sections
    // ========================================================================
    
    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    void RequireKey(const std::string& key, const std::string& section = "");
    
    /// Once any key is allowed for a section, unknown keys in it are reported
    void AllowKey(const std::string& key, const std::string& section = "");
    
    /// Missing required keys and unknown keys, one message each
    std::vector<std::string> Validate() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    /// Expand ${VAR} references from the environment
    static std::string ExpandEnvVars(const std::string& value);
    
    /// Dump all configuration as INI text
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Logging Setup
// ============================================================================

/// Configure the global logger from the [log] section (level, file, console, categories)
void ApplyLogConfig(const ConfigManager& config);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // [governance]
    constexpr const char* GOVERNANCE_SECTION = "governance";
    constexpr const char* QUORUM = "quorum";
    constexpr const char* THRESHOLD = "threshold";
    constexpr const char* VOTING_PERIOD = "voting_period";
    constexpr const char* TIMELOCK_PERIOD = "timelock_period";
    constexpr const char* EXPIRATION_PERIOD = "expiration_period";
    constexpr const char* PROPOSAL_DEPOSIT = "proposal_deposit";
    constexpr const char* DEPOSIT_POLICY = "deposit_policy";
    constexpr const char* LOCK_VOTED_STAKE = "lock_voted_stake";
    constexpr const char* MAX_MESSAGES = "max_messages";
    constexpr const char* OWNER = "owner";
    
    // [log]
    constexpr const char* LOG_SECTION = "log";
    constexpr const char* LOG_LEVEL = "level";
    constexpr const char* LOG_FILE = "file";
    constexpr const char* LOG_CONSOLE = "console";
    constexpr const char* LOG_CATEGORIES = "categories";
}

} // namespace util
} // namespace agora

#endif // AGORA_UTIL_CONFIG_H
