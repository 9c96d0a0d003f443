// KEYSEAL - Configuration File Parser Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/util/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace keyseal {
namespace util {

namespace {

const char* const COMMAND_LINE_SOURCE = "<command-line>";
const char* const DEFAULT_SOURCE = "<default>";
const char* const PROGRAMMATIC_SOURCE = "<programmatic>";

std::string Trim(const std::string& str) {
    const char* const ws = " \t\r\n";
    size_t first = str.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(ws) - first + 1);
}

std::string ToLower(std::string str) {
    for (auto& c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

std::string SectionKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + ":" + key;
}

/// Keys are [A-Za-z0-9_.-]+; the first offending character goes to bad
bool IsValidKey(const std::string& key, char& bad) {
    auto it = std::find_if(key.begin(), key.end(), [](char c) {
        return !std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.';
    });
    if (it != key.end()) {
        bad = *it;
        return false;
    }
    return true;
}

/// "nofoo" becomes "foo" and reports the negation
bool StripNegation(std::string& key) {
    if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(key[2]))) {
        key.erase(0, 2);
        return true;
    }
    return false;
}

/// Remove matching single or double quotes; only double quotes honour escapes
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }
    const bool escapes = str.front() == '"';
    const std::string inner = str.substr(1, str.size() - 2);
    if (!escapes) {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '\\' && i + 1 < inner.size()) {
            char next = inner[i + 1];
            char mapped = next == 'n' ? '\n' : next == 't' ? '\t' : next == 'r' ? '\r'
                        : (next == '\\' || next == '"') ? next : '\0';
            if (mapped != '\0') {
                out += mapped;
                ++i;
                continue;
            }
        }
        out += c;
    }
    return out;
}

bool IsEnvNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // anonymous namespace

std::string ConfigParseResult::Describe() const {
    if (success) {
        return "ok";
    }
    if (errorFile.empty()) {
        return errorMessage;
    }
    std::string where = errorFile;
    if (errorLine > 0) {
        where += ":" + std::to_string(errorLine);
    }
    return where + ": " + errorMessage;
}

// ============================================================================
// Static Helpers
// ============================================================================

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    static const char* const TRUE_WORDS[] = {"true", "yes", "on", "1"};
    static const char* const FALSE_WORDS[] = {"false", "no", "off", "0"};

    const std::string word = ToLower(Trim(str));
    for (const char* w : TRUE_WORDS) {
        if (word == w) return true;
    }
    for (const char* w : FALSE_WORDS) {
        if (word == w) return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$' || i + 1 == value.size()) {
            out += value[i++];
            continue;
        }

        std::string name;
        size_t resume;
        if (value[i + 1] == '{') {
            size_t close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out.append(value, i, std::string::npos);
                break;
            }
            name = value.substr(i + 2, close - i - 2);
            resume = close + 1;
        } else {
            size_t end = i + 1;
            while (end < value.size() && IsEnvNameChar(value[end])) {
                ++end;
            }
            name = value.substr(i + 1, end - i - 1);
            resume = end;
        }

        if (name.empty()) {
            out += value[i++];
            continue;
        }
        if (const char* env = std::getenv(name.c_str())) {
            out += env;
        }
        i = resume;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    // "~user/..." is left alone
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    }
#ifndef _WIN32
    else if (const struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
#else
    else if (const char* profile = std::getenv("USERPROFILE")) {
        home = profile;
    }
#endif

    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultConfigPath() {
    std::string path = ExpandTilde(std::string("~/") + DEFAULT_CONFIG_FILENAME);
    return (!path.empty() && path[0] == '~') ? "" : path;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum, bool overwrite) {
    const std::string fullKey = SectionKey(key, section);

    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        // Repeating a key inside one file builds a list
        if (it->second.source == source && source != COMMAND_LINE_SOURCE) {
            lists_[fullKey].push_back(value);
            return;
        }
        if (!overwrite) {
            return;
        }
    }

    Put(key, value, section, source, false);
    entries_[fullKey].lineNumber = lineNum;
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection, bool overwrite,
                              ConfigParseResult& result) {
    const std::string text = Trim(line);
    if (text.empty() || text[0] == '#' || text[0] == ';') {
        return true;
    }

    if (text[0] == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(text.substr(1, close - 1));
        return true;
    }

    std::string key;
    std::string value;
    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        key = text;
        value = StripNegation(key) ? "false" : "true";
    } else {
        key = Trim(text.substr(0, eq));
        value = ExpandEnvVars(Unquote(Trim(text.substr(eq + 1))));
    }

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    char bad = 0;
    if (!IsValidKey(key, bad)) {
        result = ConfigParseResult::Error(
            std::string("Invalid character in key: ") + bad, source, lineNum);
        return false;
    }

    Store(key, value, currentSection, source, lineNum, overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source,
                                             bool overwrite) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string section;
    std::string pending;   // accumulated backslash-continued text
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            pending.append(line, 0, line.size() - 1);
            continue;
        }
        if (!pending.empty()) {
            line = pending + line;
            pending.clear();
        }
        if (!ParseLine(line, source, lineNum, section, overwrite, result)) {
            return result;
        }
    }

    if (!pending.empty() && !ParseLine(pending, source, lineNum, section, overwrite, result)) {
        return result;
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    const std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path, std::ios::in | std::ios::ate);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }
    if (file.tellg() > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }
    file.seekg(0);
    return ParseStream(file, path, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream in(content);
    return ParseStream(in, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    bool optionsDone = false;

    for (int i = 1; i < argc; ++i) {
        const std::string raw = argv[i] ? argv[i] : "";

        if (optionsDone || raw.empty() || raw[0] != '-' || raw == "-") {
            positional_.push_back(raw);
            continue;
        }
        if (raw == "--") {
            optionsDone = true;
            continue;
        }

        const std::string option = raw.substr(raw.find_first_not_of('-'));
        std::string key;
        std::string value;
        size_t eq = option.find('=');
        if (eq == std::string::npos) {
            key = option;
            value = StripNegation(key) ? "false" : "true";
        } else {
            key = option.substr(0, eq);
            value = option.substr(eq + 1);
        }

        char bad = 0;
        if (key.empty() || !IsValidKey(key, bad)) {
            return ConfigParseResult::Error("Invalid option: " + raw, COMMAND_LINE_SOURCE, i);
        }
        Store(key, value, "", COMMAND_LINE_SOURCE, i, true);
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(SectionKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(SectionKey(key, section));
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
    auto text = TryGetString(key, section);
    if (!text) {
        return std::nullopt;
    }

    const std::string digits = Trim(*text);
    int64_t value = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [end, ec] = std::from_chars(first, last, value);
    if (ec != std::errc()) {
        return std::nullopt;
    }

    const std::string suffix = ToLower(Trim(std::string(end, last)));
    int shift;
    if (suffix.empty())      shift = 0;
    else if (suffix == "k")  shift = 10;
    else if (suffix == "m")  shift = 20;
    else if (suffix == "g")  shift = 30;
    else return std::nullopt;

    const int64_t bound = std::numeric_limits<int64_t>::max() >> shift;
    if (value > bound || value < -bound) {
        return std::nullopt;
    }
    return value * (int64_t{1} << shift);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
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

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto text = TryGetString(key, section);
    return text ? ParseBool(*text) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    const std::string fullKey = SectionKey(key, section);
    std::vector<std::string> items;

    auto split = [&items](const std::string& value) {
        size_t start = 0;
        while (start <= value.size()) {
            size_t comma = value.find(',', start);
            if (comma == std::string::npos) {
                comma = value.size();
            }
            std::string item = Trim(value.substr(start, comma - start));
            if (!item.empty()) {
                items.push_back(std::move(item));
            }
            start = comma + 1;
        }
    };

    auto entry = entries_.find(fullKey);
    if (entry != entries_.end()) {
        split(entry->second.value);
    }
    auto repeats = lists_.find(fullKey);
    if (repeats != lists_.end()) {
        std::for_each(repeats->second.begin(), repeats->second.end(), split);
    }
    return items;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    auto it = entries_.find(SectionKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Value Setting and Validation
// ============================================================================

void ConfigManager::Put(const std::string& key, const std::string& value,
                        const std::string& section, const std::string& source,
                        bool isDefault) {
    const std::string fullKey = SectionKey(key, section);
    ConfigEntry& entry = entries_[fullKey];
    entry = ConfigEntry{key, value, section, source, 0, isDefault};
    lists_.erase(fullKey);
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    Put(key, value, section, PROGRAMMATIC_SOURCE, false);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    if (!HasKey(key, section)) {
        Put(key, value, section, DEFAULT_SOURCE, true);
    }
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(SectionKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> warnings;
    if (allowedKeys_.empty()) {
        return warnings;
    }
    for (const auto& [fullKey, entry] : entries_) {
        if (allowedKeys_.count(fullKey) == 0) {
            warnings.push_back("Unknown key: " + fullKey + " (defined in " + entry.source + ")");
        }
    }
    return warnings;
}

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    allowedKeys_.clear();
    positional_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

} // namespace util
} // namespace keyseal
