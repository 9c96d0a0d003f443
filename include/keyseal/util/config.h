// KEYSEAL - Configuration File Parser
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// INI-style configuration for keyseal-tool.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a flag set to true; "nokey" sets it to false
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME

#ifndef KEYSEAL_UTIL_CONFIG_H
#define KEYSEAL_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace keyseal {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name, looked up in the user's home directory
constexpr const char* DEFAULT_CONFIG_FILENAME = ".keyseal.conf";

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
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing a configuration source. Parsing never throws; callers
 * inspect success and report errorMessage themselves.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() { return {true, "", "", 0}; }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message", or "ok"
    std::string Describe() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration gathered from a file and the command line.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Config file (--conf, or ~/.keyseal.conf)
 * 3. Built-in defaults
 */
class ConfigManager {
public:
    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and $VAR are expanded)
     * @param overwrite If false, keys that already have a non-default value
     *                  (for example from the command line) are kept
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments.
     *
     * Options take the form --key=value or --flag (also -key, --nokey).
     * Anything not starting with '-' is collected as a positional argument,
     * in order; a lone "--" ends option parsing.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Positional arguments seen by ParseCommandLine
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                             const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; accepts k/m/g binary suffixes ("256k" = 262144).
    /// Returns nullopt if missing or not a number.
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

    /// All values of a repeated or comma-separated key, in order
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Path value with ~ and environment expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Where a key's current value came from, or nullopt
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (replaced by any file or command-line value)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register an allowed key
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Warnings for keys that were set but never registered with AllowKey
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    /// Expand ${VAR} and $VAR
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand a leading ~ to the home directory
    static std::string ExpandTilde(const std::string& path);

    /// Parse true/false, yes/no, on/off, 1/0 (case-insensitive)
    static std::optional<bool> ParseBool(const std::string& str);

    /// ~/.keyseal.conf, or empty if no home directory is known
    static std::string GetDefaultConfigPath();

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source,
                                  bool overwrite);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, bool overwrite,
                   ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool overwrite);

    void Put(const std::string& key, const std::string& value,
             const std::string& section, const std::string& source, bool isDefault);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;  // Repeated keys
    std::set<std::string> allowedKeys_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* CONF = "conf";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* THREADS = "threads";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";

    // Key derivation
    constexpr const char* KDF = "kdf";
    constexpr const char* ITERATIONS = "iterations";
    constexpr const char* SCRYPT_N = "scrypt-n";

    // Records
    constexpr const char* KEY = "key";
    constexpr const char* ID = "id";
    constexpr const char* IN = "in";
    constexpr const char* OUT = "out";
    constexpr const char* PASSWORD_FILE = "password-file";
    constexpr const char* PRETTY = "pretty";
}

} // namespace util
} // namespace keyseal

#endif // KEYSEAL_UTIL_CONFIG_H
