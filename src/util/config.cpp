// ZKDROP - Configuration File Parser Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include "zkdrop/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace zkdrop {
namespace util {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// "nofoo" -> "foo" when it reads as a negated flag
bool StripNegation(std::string& key) {
    if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(key[2]))) {
        key = key.substr(2);
        return true;
    }
    return false;
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) return "OK";
    std::string out = errorMessage;
    if (!errorFile.empty()) {
        out += " (" + errorFile;
        if (errorLine > 0) {
            out += ":" + std::to_string(errorLine);
        }
        out += ")";
    }
    return out;
}

// ============================================================================
// ConfigManager - Static Helpers
// ============================================================================

ConfigManager::ConfigManager() = default;

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
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }
    
    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }
    
    // Escapes are only honoured inside double quotes
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': out += '\n'; ++i; continue;
                case 't': out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"': out += '"'; ++i; continue;
                default: break;
            }
        }
        out += inner[i];
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(Trim(str));
    
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
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());
    
    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string name = value.substr(i + 2, end - i - 2);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i++];
    }
    
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.length() > 1 && path[1] != '/')) {
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

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return DEFAULT_DATADIR_NAME;
    }
    return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

// ============================================================================
// Storage
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, ConfigSource source,
                          const std::string& origin, int lineNumber) {
    std::string fullKey = MakeKey(key, section);
    auto it = entries_.find(fullKey);
    
    if (it != entries_.end()) {
        ConfigEntry& existing = it->second;
        if (existing.source > source) {
            return;
        }
        if (existing.source == source && source != ConfigSource::Default) {
            // Repeated key: last value wins, earlier ones stay listed
            existing.extra.push_back(existing.value);
            existing.value = value;
            existing.origin = origin;
            existing.lineNumber = lineNumber;
            return;
        }
    }
    
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.origin = origin;
    entry.lineNumber = lineNumber;
    entry.source = source;
    entries_[fullKey] = std::move(entry);
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
        return true;
    }
    
    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        key = trimmed;
        value = StripNegation(key) ? "false" : "true";
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }
    
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key '" + key + "'", source, lineNum);
        return false;
    }
    
    Store(key, value, currentSection, ConfigSource::File, source, lineNum);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& sourceName) {
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();
    
    while (std::getline(in, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));
    
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }
    
    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }
    
    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        // Positional arguments are not configuration
        if (arg.size() < 2 || arg[0] != '-') {
            continue;
        }
        
        arg = arg.substr(arg[1] == '-' ? 2 : 1);
        
        std::string key;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            key = arg;
            if (StripNegation(key)) {
                value = "false";
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                value = argv[++i];
            } else {
                value = "true";
            }
        }
        
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option '-" + key + "'",
                                            "<command-line>");
        }
        
        Store(key, value, "", ConfigSource::CommandLine, "<command-line>", 0);
    }
    
    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    
    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);
        std::string suffix = ToLower(Trim(str->substr(pos)));
        if (suffix.empty()) {
            return value;
        }
        if (suffix == "k") return value * 1024;
        if (suffix == "m") return value * 1024 * 1024;
        if (suffix == "g") return value * 1024LL * 1024 * 1024;
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto value = TryGetInt(key, section);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key,
                                uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
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

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return result;
    }
    
    std::vector<std::string> raw = it->second.extra;
    raw.push_back(it->second.value);
    
    for (const auto& value : raw) {
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
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    // Programmatic values replace rather than accumulate
    entries_.erase(MakeKey(key, section));
    Store(key, value, section, ConfigSource::Programmatic, "<programmatic>", 0);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    Store(key, value, section, ConfigSource::Default, "<default>", 0);
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    
    if (!allowedKeys_.empty()) {
        for (const auto& [fullKey, entry] : entries_) {
            if (allowedKeys_.count(fullKey) == 0) {
                errors.push_back("Unknown key: " + fullKey +
                                 " (defined in " + entry.origin + ")");
            }
        }
    }
    
    auto dbcache = TryGetString(ConfigKeys::DBCACHE);
    if (dbcache && !TryGetUInt(ConfigKeys::DBCACHE)) {
        errors.push_back("Invalid dbcache value: " + *dbcache);
    }
    
    for (const char* flag : {ConfigKeys::MEMORY, ConfigKeys::PRINTTOCONSOLE}) {
        auto str = TryGetString(flag);
        if (str && !ParseBool(*str)) {
            errors.push_back(std::string("Invalid boolean for ") + flag + ": " + *str);
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
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::Dump() const {
    std::map<std::string, std::vector<const ConfigEntry*>> bySection;
    for (const auto& [fullKey, entry] : entries_) {
        bySection[entry.section].push_back(&entry);
    }
    
    std::ostringstream oss;
    for (const auto& [section, entries] : bySection) {
        if (!section.empty()) {
            oss << "[" << section << "]\n";
        }
        for (const ConfigEntry* entry : entries) {
            oss << entry->key << "=" << entry->value << "  # " << entry->origin;
            if (entry->lineNumber > 0) {
                oss << ":" << entry->lineNumber;
            }
            oss << "\n";
        }
    }
    return oss.str();
}

// ============================================================================
// Global Configuration
// ============================================================================

ConfigManager& GetConfig() {
    static ConfigManager config;
    return config;
}

ConfigParseResult InitConfig(int argc, const char* const argv[]) {
    ConfigManager& config = GetConfig();
    
    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        return cmdResult;
    }
    
    std::string dataDir = config.GetPath(ConfigKeys::DATADIR,
                                         ConfigManager::GetDefaultDataDir());
    std::string confPath = config.GetPath(ConfigKeys::CONF,
                                          dataDir + "/" + DEFAULT_CONFIG_FILENAME);
    
    // A missing file is only an error if it was asked for explicitly
    std::ifstream probe(confPath);
    if (!probe.is_open()) {
        if (config.HasKey(ConfigKeys::CONF)) {
            return ConfigParseResult::Error("Cannot open file: " + confPath);
        }
        return ConfigParseResult::Success();
    }
    probe.close();
    
    return config.ParseFile(confPath);
}

} // namespace util
} // namespace zkdrop
