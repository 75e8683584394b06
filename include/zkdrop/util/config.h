// ZKDROP - Configuration File Parser
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Parses INI-style configuration for the airdrop service.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare "key" means key=true, a bare "nokey" means key=false
// - Environment variable expansion: ${VAR_NAME}

#ifndef ZKDROP_UTIL_CONFIG_H
#define ZKDROP_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zkdrop {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".zkdrop";

constexpr const char* DEFAULT_CONFIG_FILENAME = "zkdrop.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/// Where a value came from; a higher source overrides a lower one
enum class ConfigSource {
    Default = 0,
    File = 1,
    CommandLine = 2,
    Programmatic = 3,
};

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string origin;    // File path, "<command-line>", ...
    int lineNumber{0};
    ConfigSource source{ConfigSource::Default};
    
    /// Additional values when the key is repeated at the same level
    std::vector<std::string> extra;
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
    
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 * 
 * Priority order (highest to lowest):
 * 1. Values set programmatically
 * 2. Command-line arguments
 * 3. Config file (<datadir>/zkdrop.conf or -conf=<path>)
 * 4. Built-in defaults
 */
class ConfigManager {
public:
    ConfigManager();
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    ConfigParseResult ParseFile(const std::string& filePath);
    
    ConfigParseResult ParseString(const std::string& content, 
                                  const std::string& sourceName = "<string>");
    
    /// Accepts -key=value, --key=value, -key value, -key and -nokey
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key, 
                                             const std::string& section = "") const;
    
    std::string GetString(const std::string& key, 
                          const std::string& defaultValue,
                          const std::string& section = "") const;
    
    /// Integers may carry a k/m/g suffix (powers of 1024)
    std::optional<int64_t> TryGetInt(const std::string& key, 
                                      const std::string& section = "") const;
    
    int64_t GetInt(const std::string& key, 
                   int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<uint64_t> TryGetUInt(const std::string& key, 
                                        const std::string& section = "") const;
    
    uint64_t GetUInt(const std::string& key, 
                     uint64_t defaultValue,
                     const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key, 
                                    const std::string& section = "") const;
    
    bool GetBool(const std::string& key, 
                 bool defaultValue,
                 const std::string& section = "") const;
    
    /// All values of a repeated or comma-separated key
    std::vector<std::string> GetList(const std::string& key, 
                                     const std::string& section = "") const;
    
    /// String value with ~ and environment variables expanded
    std::string GetPath(const std::string& key, 
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value, 
             const std::string& section = "");
    
    /// Only takes effect if nothing else has set the key
    void SetDefault(const std::string& key, const std::string& value, 
                    const std::string& section = "");
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    void AllowKey(const std::string& key, const std::string& section = "");
    
    /// Unknown keys (when any key has been allowed) and malformed values
    std::vector<std::string> Validate() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    
    size_t Size() const;
    
    static std::string GetDefaultDataDir();
    
    static std::string ExpandEnvVars(const std::string& value);
    
    static std::string ExpandTilde(const std::string& path);
    
    /// key=value lines, one section after another
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    ConfigParseResult ParseStream(std::istream& in, const std::string& sourceName);
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    void Store(const std::string& key, const std::string& value,
               const std::string& section, ConfigSource source,
               const std::string& origin, int lineNumber);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Global Configuration
// ============================================================================

ConfigManager& GetConfig();

/**
 * Initialize the global configuration: command line first (for -datadir and
 * -conf), then the config file if it exists.
 */
ConfigParseResult InitConfig(int argc, const char* const argv[]);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    
    // Deployment
    constexpr const char* CONTRACT = "contract";
    
    // Storage
    constexpr const char* MEMORY = "memory";
    constexpr const char* DBCACHE = "dbcache";
    
    // Logging
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DEBUG = "debug";
}

} // namespace util
} // namespace zkdrop

#endif // ZKDROP_UTIL_CONFIG_H
