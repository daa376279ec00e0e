// FORESIGHT - Configuration
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Flat key=value configuration for the market engine and its tools, read
// from config files and the command line.
//
// File format:
// - Lines starting with # or ; are comments
// - key=value pairs; values may be "double quoted" (with \n \t \\ \" escapes)
//   or 'single quoted' (literal)
// - A bare key means true, a bare "nokey" means false
// - A trailing backslash continues the line
// - "include <path>" reads another file in place
// - ${VAR} and $VAR expand from the environment
// - Repeating a key in one file accumulates a list (see GetList)

#ifndef FORESIGHT_UTIL_CONFIG_H
#define FORESIGHT_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace foresight {
namespace util {

constexpr const char* DEFAULT_DATADIR_NAME = ".foresight";
constexpr const char* DEFAULT_CONFIG_FILENAME = "foresight.conf";
constexpr const char* SYSTEM_CONFIG_PATH = "/etc/foresight/foresight.conf";

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() { return {true, "", "", 0, {}}; }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }

    /// "file:line: message" for diagnostics
    std::string Describe() const;
};

// ============================================================================
// ConfigManager
// ============================================================================

/**
 * Key-value store fed from config files and the command line.
 *
 * Precedence, highest first: command line, explicit -conf file (or the
 * data directory's foresight.conf), ~/.foresight/foresight.conf,
 * /etc/foresight/foresight.conf.
 */
class ConfigManager {
public:
    /// Where a key's current value came from
    struct Origin {
        std::string source;   // file path, "<command-line>" or "<programmatic>"
        int line{0};
    };

    // Parsing

    /// A key already set by a different source is replaced only when overwrite is set
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /// -key=value, --key=value, -flag and -noflag; other arguments are positional.
    /// Options always replace earlier values.
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Read the system, user and data directory files in increasing priority
    ConfigParseResult LoadAllConfigs(const std::string& dataDir = "");

    // Retrieval

    bool HasKey(const std::string& key) const;
    std::optional<Origin> GetOrigin(const std::string& key) const;

    /// First value of the key
    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// Integer with an optional k/m/g (binary) suffix; nullopt on malformed or overflowing input
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;

    std::optional<uint64_t> TryGetUInt(const std::string& key) const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue) const;

    /// true/false, yes/no, on/off, 1/0
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// Every value of a repeated key, each split on commas
    std::vector<std::string> GetList(const std::string& key) const;

    /// String value with ~ and environment expansion
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    const std::vector<std::string>& GetPositional() const { return positional_; }

    void Set(const std::string& key, const std::string& value);

    /// Keys that are not in ConfigKeys::ALL, as "key (source:line)"
    std::vector<std::string> FindUnknownKeys() const;

    void Clear();
    size_t Size() const { return values_.size(); }

    std::string GetDataDir() const;
    void SetDataDir(const std::string& dir);
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// Commented sample listing every option; parses to an empty config
    static std::string GenerateSampleConfig();

private:
    struct Value {
        std::vector<std::string> items;
        Origin origin;
    };

    ConfigParseResult ParseStream(std::istream& in, const std::string& source, bool overwrite);
    ConfigParseResult ParseLine(const std::string& line, const std::string& source,
                                int lineNum, bool overwrite);
    void Store(const std::string& key, const std::string& value,
               const std::string& source, int lineNum, bool overwrite);

    std::map<std::string, Value> values_;
    std::vector<std::string> positional_;
    std::string dataDir_;
    int includeDepth_{0};
};

/// Process-wide configuration
ConfigManager& GetConfig();

/// Parse the command line, then the config files, then re-apply the command line
ConfigParseResult InitConfig(int argc, const char* const argv[]);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* HELP = "help";

    // Logging
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";

    // Storage
    constexpr const char* MEMDB = "memdb";
    constexpr const char* DBCACHE = "dbcache";
    constexpr const char* DBSYNC = "dbsync";

    // Market parameters
    constexpr const char* OWNER = "owner";
    constexpr const char* MINSTAKE = "minstake";
    constexpr const char* FEEPERCENT = "feepercent";

    // Replay
    constexpr const char* SCRIPT = "script";
    constexpr const char* EXPECTDIGEST = "expectdigest";

    constexpr const char* ALL[] = {
        DATADIR, CONF, HELP, LOGLEVEL, DEBUG, PRINTTOCONSOLE, LOGFILE,
        MEMDB, DBCACHE, DBSYNC, OWNER, MINSTAKE, FEEPERCENT, SCRIPT, EXPECTDIGEST,
    };
}

} // namespace util
} // namespace foresight

#endif // FORESIGHT_UTIL_CONFIG_H
