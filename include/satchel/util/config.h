// Satchel - Configuration File Parser
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Parses INI-style signing policy files.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section], dotted names allowed ([size.legacy])
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef SATCHEL_UTIL_CONFIG_H
#define SATCHEL_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace satchel {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Maximum config file size (64 KB)
constexpr size_t MAX_CONFIG_SIZE = 64 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or source name
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

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Key/value store filled from INI text.
 *
 * Later definitions of the same key replace earlier ones. A manager is a
 * plain value; there is no process-wide instance.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a file. The store keeps every entry read before an error.
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue = "",
                          const std::string& section = "") const;

    /// nullopt if absent or not an integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// nullopt if absent, negative or not an integer
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    std::optional<double> TryGetDouble(const std::string& key,
                                       const std::string& section = "") const;
    double GetDouble(const std::string& key, double defaultValue,
                     const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Section names in sorted order (global section excluded)
    std::vector<std::string> GetSections() const;

    /// Keys defined in one section
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();
    size_t Size() const;

    /// Replace ${VAR} with the environment value (empty if unset)
    static std::string ExpandEnvVars(const std::string& value);

    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::map<std::string, ConfigEntry> entries_;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* SECTION_POLICY = "policy";
    constexpr const char* SECTION_DUST = "dust";
    constexpr const char* SECTION_SIZE_LEGACY = "size.legacy";
    constexpr const char* SECTION_SIZE_SEGWIT = "size.segwit";
    constexpr const char* SECTION_LOG = "log";

    constexpr const char* DERIVATION = "derivation";
    constexpr const char* SWEEP_MAX_FEE_RATIO = "sweep_max_fee_ratio";
    constexpr const char* DUST_P2PKH = "p2pkh";
    constexpr const char* DUST_P2SH_P2WPKH = "p2sh_p2wpkh";
    constexpr const char* DUST_P2WPKH = "p2wpkh";
    constexpr const char* SIZE_OVERHEAD = "overhead";
    constexpr const char* SIZE_INPUT = "input";
    constexpr const char* SIZE_OUTPUT = "output";
    constexpr const char* LOG_LEVEL = "level";
}

} // namespace util
} // namespace satchel

#endif // SATCHEL_UTIL_CONFIG_H
