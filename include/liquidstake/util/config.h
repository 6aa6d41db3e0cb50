// LIQUIDSTAKE - Configuration
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Settings of liquidstaked and reward-claimer, merged from four sources.
// A key set by a higher source is never overwritten by a lower one:
//
//   command line  >  environment  >  config file  >  built-in default
//
// Config files hold one "key=value" per line. Values may be quoted
// ('literal' or "with \n escapes"), may reference ${VAR} or $VAR and may
// continue on the next line after a trailing backslash. A bare "key" means
// key=true and "nokey" means key=false. "[name]" starts a section; keys
// below it are looked up with section "name".

#ifndef LIQUIDSTAKE_UTIL_CONFIG_H
#define LIQUIDSTAKE_UTIL_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace liquidstake {
namespace util {

constexpr size_t MAX_CONFIG_SIZE = 1 << 20;
constexpr size_t MAX_LINE_LENGTH = 4096;

enum class ConfigSource {
    Default = 0,
    File = 1,
    Environment = 2,
    CommandLine = 3,
};

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;
    /// File path, environment variable, "<command-line>" or "<default>"
    std::string origin;
    /// 1-based; 0 outside files
    int lineNumber{0};
    ConfigSource source{ConfigSource::Default};
};

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Ok() { return ConfigParseResult(); }
    static ConfigParseResult Fail(std::string message, std::string file = "", int line = 0) {
        ConfigParseResult result;
        result.success = false;
        result.errorMessage = std::move(message);
        result.errorFile = std::move(file);
        result.errorLine = line;
        return result;
    }

    /// "pool.conf:3: message", or "OK"
    std::string Describe() const;
};

class ConfigManager {
public:
    /// ~ and environment references in the path are expanded first
    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// -key=value, --key=value, -key value, -flag and -noflag; argv[0] is skipped
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Map of variable name to key; unset variables are skipped
    void LoadEnvironment(const std::map<std::string, std::string>& variableToKey);

    bool HasKey(const std::string& key, const std::string& section = "") const;
    std::optional<ConfigEntry> GetEntry(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key, const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& fallback,
                          const std::string& section = "") const;

    /// A trailing k, m or g multiplies by 2^10, 2^20 or 2^30
    std::optional<int64_t> TryGetInt(const std::string& key, const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t fallback, const std::string& section = "") const;

    /// Negative values count as unset
    std::optional<uint64_t> TryGetUInt(const std::string& key, const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t fallback, const std::string& section = "") const;

    /// true/false, yes/no, on/off and 1/0, any case
    std::optional<bool> TryGetBool(const std::string& key, const std::string& section = "") const;
    bool GetBool(const std::string& key, bool fallback, const std::string& section = "") const;

    /// GetString with a leading ~ replaced by the home directory
    std::string GetPath(const std::string& key, const std::string& fallback = "",
                        const std::string& section = "") const;

    /// Programmatic override, ranked like the command line
    void Set(const std::string& key, const std::string& value, const std::string& section = "");
    /// Used only while no other source defines key
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    void Clear() { entries_.clear(); }
    size_t Size() const { return entries_.size(); }

    /// Unset variables expand to nothing; a lone '$' is kept
    static std::string ExpandEnvVars(const std::string& value);
    /// "~" and "~/..." only; "~user" is left alone
    static std::string ExpandTilde(const std::string& path);

private:
    void Store(ConfigEntry entry);
    ConfigParseResult ParseLines(std::istream& in, const std::string& origin);
    ConfigParseResult ApplyLine(const std::string& line, const std::string& origin, int number,
                                std::string& section);

    /// "section:key", or key outside sections
    std::map<std::string, ConfigEntry> entries_;
};

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    constexpr const char* RPCBIND = "rpcbind";
    constexpr const char* RPCPORT = "rpcport";
    constexpr const char* RPCUSER = "rpcuser";
    constexpr const char* RPCPASSWORD = "rpcpassword";

    constexpr const char* DBBACKEND = "dbbackend";
    constexpr const char* DBCACHE = "dbcache";

    /// Pool bootstrap
    constexpr const char* ADMIN = "admin";
    constexpr const char* VALIDATOR = "validator";
    constexpr const char* VALIDATOROPERATOR = "validatoroperator";
    constexpr const char* REWARDINTERVAL = "rewardinterval";
    constexpr const char* MEVRECIPIENT = "mevrecipient";
    constexpr const char* TREASURY = "treasury";

    /// reward-claimer only
    constexpr const char* RPCENDPOINT = "rpcendpoint";
    constexpr const char* CONTRACTADDRESS = "contractaddress";
    constexpr const char* ADMINMNEMONIC = "adminmnemonic";
    constexpr const char* CLAIMSCHEDULE = "claimschedule";
}

} // namespace util
} // namespace liquidstake

#endif // LIQUIDSTAKE_UTIL_CONFIG_H
