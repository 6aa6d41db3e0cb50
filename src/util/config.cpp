// LIQUIDSTAKE - Configuration Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/util/config.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace liquidstake {
namespace util {

namespace {

const char* const COMMAND_LINE = "<command-line>";

std::string Strip(const std::string& text) {
    size_t first = 0;
    size_t last = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
    return text.substr(first, last - first);
}

std::string Lowercase(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// First character not allowed in a key, or '\0' if the key is fine
char BadKeyChar(const std::string& key) {
    for (char c : key) {
        if (!IsNameChar(c) && c != '-' && c != '.') {
            return c;
        }
    }
    return '\0';
}

/// Double quotes understand \n \t \\ and \"; single quotes are literal
std::string Dequote(const std::string& text) {
    if (text.size() < 2 || text.front() != text.back() ||
        (text.front() != '"' && text.front() != '\'')) {
        return text;
    }
    std::string inner = text.substr(1, text.size() - 2);
    if (text.front() == '\'') {
        return inner;
    }

    std::string out;
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '\\' && i + 1 < inner.size()) {
            switch (inner[i + 1]) {
                case 'n': c = '\n'; ++i; break;
                case 't': c = '\t'; ++i; break;
                case '\\': ++i; break;
                case '"': c = '"'; ++i; break;
                default: break;
            }
        }
        out += c;
    }
    return out;
}

/// "nofoo" is foo=false, "foo" is foo=true
void ApplyFlag(const std::string& word, ConfigEntry& entry) {
    bool negated = word.size() > 2 && word.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(word[2]));
    entry.key = negated ? word.substr(2) : word;
    entry.value = negated ? "false" : "true";
}

std::optional<bool> ToBool(const std::string& text) {
    static const char* const YES[] = {"true", "yes", "on", "1"};
    static const char* const NO[] = {"false", "no", "off", "0"};
    std::string lowered = Lowercase(text);
    for (const char* word : YES) {
        if (lowered == word) return true;
    }
    for (const char* word : NO) {
        if (lowered == word) return false;
    }
    return std::nullopt;
}

std::string QualifiedKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + ":" + key;
}

} // namespace

std::string ConfigParseResult::Describe() const {
    if (success) {
        return "OK";
    }
    std::ostringstream out;
    if (!errorFile.empty()) {
        out << errorFile;
        if (errorLine > 0) {
            out << ':' << errorLine;
        }
        out << ": ";
    }
    out << errorMessage;
    return out.str();
}

// ============================================================================
// Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t dollar = value.find('$', pos);
        if (dollar == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, dollar - pos);

        std::string name;
        size_t next = dollar + 1;
        if (next < value.size() && value[next] == '{') {
            size_t close = value.find('}', next);
            if (close != std::string::npos) {
                name = value.substr(next + 1, close - next - 1);
                next = close + 1;
            }
        } else {
            size_t end = next;
            while (end < value.size() && IsNameChar(value[end])) ++end;
            name = value.substr(next, end - next);
            next = end;
        }

        if (next == dollar + 1) {
            out += '$';
        } else if (const char* env = std::getenv(name.c_str())) {
            out += env;
        }
        pos = next;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* account = getpwuid(getuid());
        home = account != nullptr ? account->pw_dir : nullptr;
    }
    if (home == nullptr || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

// ============================================================================
// Sources
// ============================================================================

void ConfigManager::Store(ConfigEntry entry) {
    std::string key = QualifiedKey(entry.key, entry.section);
    auto existing = entries_.find(key);
    if (existing != entries_.end() && existing->second.source > entry.source) {
        return;
    }
    entries_[key] = std::move(entry);
}

ConfigParseResult ConfigManager::ApplyLine(const std::string& line, const std::string& origin,
                                           int number, std::string& section) {
    std::string text = Strip(line);
    if (text.empty() || text[0] == '#' || text[0] == ';') {
        return ConfigParseResult::Ok();
    }

    if (text[0] == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos) {
            return ConfigParseResult::Fail("Missing closing bracket in section header",
                                           origin, number);
        }
        section = Strip(text.substr(1, close - 1));
        return ConfigParseResult::Ok();
    }

    ConfigEntry entry;
    entry.section = section;
    entry.origin = origin;
    entry.lineNumber = number;
    entry.source = ConfigSource::File;

    size_t equals = text.find('=');
    if (equals == std::string::npos) {
        ApplyFlag(text, entry);
    } else {
        entry.key = Strip(text.substr(0, equals));
        entry.value = ExpandEnvVars(Dequote(Strip(text.substr(equals + 1))));
    }

    if (entry.key.empty()) {
        return ConfigParseResult::Fail("Empty key", origin, number);
    }
    if (char bad = BadKeyChar(entry.key)) {
        return ConfigParseResult::Fail(std::string("Invalid character in key: ") + bad,
                                       origin, number);
    }
    Store(std::move(entry));
    return ConfigParseResult::Ok();
}

ConfigParseResult ConfigManager::ParseLines(std::istream& in, const std::string& origin) {
    std::string section;
    std::string pending;
    std::string line;
    int number = 0;

    while (std::getline(in, line)) {
        ++number;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Fail("Line too long (max " +
                                           std::to_string(MAX_LINE_LENGTH) + " characters)",
                                           origin, number);
        }
        if (!line.empty() && line.back() == '\\') {
            line.pop_back();
            pending += line;
            continue;
        }

        ConfigParseResult result = ApplyLine(pending + line, origin, number, section);
        pending.clear();
        if (!result.success) {
            return result;
        }
    }

    // Continuation on the last line
    if (!pending.empty()) {
        return ApplyLine(pending, origin, number, section);
    }
    return ConfigParseResult::Ok();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return ConfigParseResult::Fail("Cannot open file: " + path);
    }
    if (static_cast<size_t>(file.tellg()) > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Fail("Config file too large (max " +
                                       std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }
    file.seekg(0);
    return ParseLines(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    return ParseLines(in, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            return ConfigParseResult::Fail("Unexpected argument: " + arg, COMMAND_LINE);
        }
        std::string option = arg.substr(arg.find_first_not_of('-') == std::string::npos
                                            ? arg.size()
                                            : arg.find_first_not_of('-'));
        if (option.empty()) {
            continue;
        }

        ConfigEntry entry;
        entry.origin = COMMAND_LINE;
        entry.source = ConfigSource::CommandLine;

        size_t equals = option.find('=');
        bool takesNext = i + 1 < argc && argv[i + 1][0] != '-';
        if (equals != std::string::npos) {
            entry.key = option.substr(0, equals);
            entry.value = option.substr(equals + 1);
        } else {
            ApplyFlag(option, entry);
            if (entry.value == "true" && takesNext) {
                entry.value = argv[++i];
            }
        }

        if (entry.key.empty() || BadKeyChar(entry.key) != '\0') {
            return ConfigParseResult::Fail("Invalid option: -" + entry.key, COMMAND_LINE);
        }
        Store(std::move(entry));
    }
    return ConfigParseResult::Ok();
}

void ConfigManager::LoadEnvironment(const std::map<std::string, std::string>& variableToKey) {
    for (const auto& mapping : variableToKey) {
        if (const char* value = std::getenv(mapping.first.c_str())) {
            ConfigEntry entry;
            entry.key = mapping.second;
            entry.value = value;
            entry.origin = mapping.first;
            entry.source = ConfigSource::Environment;
            Store(std::move(entry));
        }
    }
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    Store(ConfigEntry{key, value, section, "<programmatic>", 0, ConfigSource::CommandLine});
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    Store(ConfigEntry{key, value, section, "<default>", 0, ConfigSource::Default});
}

// ============================================================================
// Lookups
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(QualifiedKey(key, section)) != 0;
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    auto found = entries_.find(QualifiedKey(key, section));
    if (found == entries_.end()) {
        return std::nullopt;
    }
    return found->second;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto entry = GetEntry(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& fallback,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(fallback);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto text = TryGetString(key, section);
    if (!text) {
        return std::nullopt;
    }

    int64_t number = 0;
    size_t used = 0;
    try {
        number = std::stoll(*text, &used);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }

    std::string unit = Lowercase(Strip(text->substr(used)));
    if (unit.empty()) {
        return number;
    }
    static const std::pair<const char*, int> UNITS[] = {{"k", 10}, {"m", 20}, {"g", 30}};
    for (const auto& scale : UNITS) {
        if (unit == scale.first) {
            return number * (int64_t(1) << scale.second);
        }
    }
    return std::nullopt;
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t fallback,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(fallback);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto number = TryGetInt(key, section);
    if (!number || *number < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*number);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t fallback,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(fallback);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto text = TryGetString(key, section);
    return text ? ToBool(*text) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool fallback,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(fallback);
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& fallback,
                                   const std::string& section) const {
    return ExpandTilde(GetString(key, fallback, section));
}

} // namespace util
} // namespace liquidstake
