// FORESIGHT - Configuration Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <utility>

#include <pwd.h>
#include <unistd.h>

namespace foresight {
namespace util {

namespace {

const char* const COMMAND_LINE_SOURCE = "<command-line>";

std::string Trim(const std::string& str) {
    const char* ws = " \t\r\n";
    const size_t first = str.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(ws) - first + 1);
}

bool StartsWith(const std::string& str, const char* prefix) {
    return str.compare(0, std::strlen(prefix), prefix) == 0;
}

/// Keys are [A-Za-z0-9_.-]+
bool IsValidKey(const std::string& key) {
    return !key.empty() &&
           std::all_of(key.begin(), key.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '_' || c == '-' || c == '.';
           });
}

/// "nofoo" -> ("foo", "false"), "foo" -> ("foo", "true")
std::pair<std::string, std::string> SplitFlag(const std::string& flag) {
    if (flag.size() > 2 && StartsWith(flag, "no") &&
        std::islower(static_cast<unsigned char>(flag[2]))) {
        return {flag.substr(2), "false"};
    }
    return {flag, "true"};
}

std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back()) {
        return str;
    }
    const char quote = str.front();
    if (quote != '"' && quote != '\'') {
        return str;
    }

    const std::string inner = str.substr(1, str.size() - 2);
    if (quote == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        const char c = inner[i];
        if (c != '\\' || i + 1 == inner.size()) {
            out += c;
            continue;
        }
        switch (inner[i + 1]) {
            case 'n':  out += '\n'; ++i; break;
            case 't':  out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"':  out += '"';  ++i; break;
            default:   out += c;         break;
        }
    }
    return out;
}

std::optional<bool> ParseBool(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* yes : {"1", "true", "yes", "on"}) {
        if (str == yes) return true;
    }
    for (const char* no : {"0", "false", "no", "off"}) {
        if (str == no) return false;
    }
    return std::nullopt;
}

bool FileExists(const std::string& path) {
    return std::ifstream(path).is_open();
}

} // namespace

// ============================================================================
// ConfigParseResult
// ============================================================================

std::string ConfigParseResult::Describe() const {
    if (success) {
        return "OK";
    }
    std::string where;
    if (!errorFile.empty()) {
        where = errorFile + (errorLine > 0 ? ":" + std::to_string(errorLine) : "") + ": ";
    }
    return where + errorMessage;
}

// ============================================================================
// Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$' || i + 1 == value.size()) {
            out += value[i++];
            continue;
        }

        size_t nameBegin = i + 1;
        size_t nameEnd;
        size_t next;
        if (value[nameBegin] == '{') {
            ++nameBegin;
            nameEnd = value.find('}', nameBegin);
            if (nameEnd == std::string::npos) {
                out += value.substr(i);
                break;
            }
            next = nameEnd + 1;
        } else {
            nameEnd = nameBegin;
            while (nameEnd < value.size() &&
                   (std::isalnum(static_cast<unsigned char>(value[nameEnd])) || value[nameEnd] == '_')) {
                ++nameEnd;
            }
            next = nameEnd;
        }

        if (nameEnd == nameBegin) {
            out += value[i++];
            continue;
        }
        if (const char* env = std::getenv(value.substr(nameBegin, nameEnd - nameBegin).c_str())) {
            out += env;
        }
        i = next;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (const passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/" + DEFAULT_DATADIR_NAME : DEFAULT_DATADIR_NAME;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& source, int lineNum, bool overwrite) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        if (it->second.origin.source == source) {
            it->second.items.push_back(value);
            return;
        }
        if (!overwrite) {
            return;
        }
    }
    values_[key] = Value{{value}, Origin{source, lineNum}};
}

ConfigParseResult ConfigManager::ParseLine(const std::string& line, const std::string& source,
                                           int lineNum, bool overwrite) {
    const std::string text = Trim(line);
    if (text.empty() || text[0] == '#' || text[0] == ';') {
        return ConfigParseResult::Success();
    }
    if (text[0] == '[') {
        return ConfigParseResult::Error("Sections are not supported: " + text, source, lineNum);
    }

    if (StartsWith(text, "include ")) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            return ConfigParseResult::Error("Maximum include depth exceeded", source, lineNum);
        }
        ++includeDepth_;
        ConfigParseResult included = ParseFile(Unquote(Trim(text.substr(8))), overwrite);
        --includeDepth_;
        return included;
    }

    const size_t eq = text.find('=');
    if (eq == std::string::npos) {
        const auto [key, value] = SplitFlag(text);
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid key: " + text, source, lineNum);
        }
        Store(key, value, source, lineNum, overwrite);
        return ConfigParseResult::Success();
    }

    const std::string key = Trim(text.substr(0, eq));
    if (!IsValidKey(key)) {
        return ConfigParseResult::Error(key.empty() ? "Empty key" : "Invalid key: " + key,
                                        source, lineNum);
    }
    Store(key, ExpandEnvVars(Unquote(Trim(text.substr(eq + 1)))), source, lineNum, overwrite);
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source,
                                             bool overwrite) {
    std::string pending;
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
            line.pop_back();
            pending += line;
            continue;
        }

        ConfigParseResult result = ParseLine(pending + line, source, lineNum, overwrite);
        pending.clear();
        if (!result.success) {
            return result;
        }
    }

    if (!pending.empty()) {
        return ParseLine(pending, source, lineNum, overwrite);
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    const std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path, std::ios::ate);
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
    std::istringstream stream(content);
    return ParseStream(stream, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        const size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            continue;
        }
        const std::string option = arg.substr(start);

        std::string key;
        std::string value;
        const size_t eq = option.find('=');
        if (eq != std::string::npos) {
            key = option.substr(0, eq);
            value = option.substr(eq + 1);
        } else {
            std::tie(key, value) = SplitFlag(option);
        }

        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid command-line option: " + arg,
                                            COMMAND_LINE_SOURCE);
        }
        values_[key] = Value{{value}, Origin{COMMAND_LINE_SOURCE, 0}};
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadAllConfigs(const std::string& dataDir) {
    if (!dataDir.empty()) {
        SetDataDir(dataDir);
    }

    ConfigParseResult outcome = ConfigParseResult::Success();

    // Optional files: a parse error is a warning, not fatal
    const std::pair<std::string, const char*> optional[] = {
        {SYSTEM_CONFIG_PATH, "system"},
        {ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME + "/" + DEFAULT_CONFIG_FILENAME), "user"},
    };
    for (const auto& [path, label] : optional) {
        if (!FileExists(path)) {
            continue;
        }
        ConfigParseResult result = ParseFile(path, true);
        if (!result.success) {
            outcome.warnings.push_back(std::string("Failed to parse ") + label + " config: " +
                                       result.Describe());
        }
    }

    // An explicit -conf must exist; the data directory file is optional
    std::string primary;
    if (auto conf = TryGetString(ConfigKeys::CONF)) {
        primary = *conf;
    } else if (FileExists(GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME)) {
        primary = GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME;
    }
    if (!primary.empty()) {
        ConfigParseResult result = ParseFile(primary, true);
        if (!result.success) {
            return result;
        }
    }
    return outcome;
}

// ============================================================================
// Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return values_.count(key) > 0;
}

std::optional<ConfigManager::Origin> ConfigManager::GetOrigin(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second.origin;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.items.empty()) {
        return std::nullopt;
    }
    return it->second.items.front();
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    const auto text = TryGetString(key);
    if (!text) {
        return std::nullopt;
    }

    int64_t value = 0;
    size_t used = 0;
    try {
        value = std::stoll(*text, &used);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    const std::string suffix = Trim(text->substr(used));
    if (suffix.empty()) {
        return value;
    }
    if (suffix.size() != 1) {
        return std::nullopt;
    }

    int shift;
    switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
        case 'k': shift = 10; break;
        case 'm': shift = 20; break;
        case 'g': shift = 30; break;
        default: return std::nullopt;
    }
    const int64_t limit = std::numeric_limits<int64_t>::max() >> shift;
    if (value > limit || value < -limit) {
        return std::nullopt;
    }
    return value * (int64_t(1) << shift);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue) const {
    return TryGetInt(key).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key) const {
    const auto value = TryGetInt(key);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue) const {
    return TryGetUInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    const auto text = TryGetString(key);
    return text ? ParseBool(*text) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key) const {
    std::vector<std::string> result;
    auto it = values_.find(key);
    if (it == values_.end()) {
        return result;
    }
    for (const auto& item : it->second.items) {
        std::istringstream parts(item);
        std::string part;
        while (std::getline(parts, part, ',')) {
            part = Trim(part);
            if (!part.empty()) {
                result.push_back(part);
            }
        }
    }
    return result;
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& defaultValue) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue)));
}

// ============================================================================
// Mutation and Checks
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value) {
    values_[key] = Value{{value}, Origin{"<programmatic>", 0}};
}

std::vector<std::string> ConfigManager::FindUnknownKeys() const {
    std::vector<std::string> unknown;
    for (const auto& [key, value] : values_) {
        const bool known = std::any_of(std::begin(ConfigKeys::ALL), std::end(ConfigKeys::ALL),
                                       [&key](const char* name) { return key == name; });
        if (known) {
            continue;
        }
        std::string entry = key + " (" + value.origin.source;
        if (value.origin.line > 0) {
            entry += ":" + std::to_string(value.origin.line);
        }
        unknown.push_back(entry + ")");
    }
    return unknown;
}

void ConfigManager::Clear() {
    values_.clear();
    positional_.clear();
    dataDir_.clear();
    includeDepth_ = 0;
}

std::string ConfigManager::GetDataDir() const {
    return dataDir_.empty() ? GetDefaultDataDir() : dataDir_;
}

void ConfigManager::SetDataDir(const std::string& dir) {
    dataDir_ = ExpandEnvVars(ExpandTilde(dir));
}

std::string ConfigManager::GenerateSampleConfig() {
    return
        "# FORESIGHT Configuration File\n"
        "\n"
        "# Data directory (default: ~/.foresight)\n"
        "#datadir=~/.foresight\n"
        "\n"
        "# --- Logging ---\n"
        "\n"
        "# Minimum level: trace, debug, info, warn, error, off\n"
        "#loglevel=warn\n"
        "# Restrict output to categories (market, scoring, ledger, db, config, journal, replay)\n"
        "#debug=market,ledger\n"
        "#printtoconsole=1\n"
        "#logfile=~/.foresight/foresight.log\n"
        "\n"
        "# --- Storage ---\n"
        "\n"
        "# Keep state in memory instead of LevelDB\n"
        "#memdb=0\n"
        "# LevelDB block cache in MB\n"
        "#dbcache=8\n"
        "# fsync every committed transition\n"
        "#dbsync=0\n"
        "\n"
        "# --- Market parameters (applied on first start only) ---\n"
        "\n"
        "# Owner principal, 40 hex characters\n"
        "#owner=\n"
        "# Minimum stake in base units\n"
        "#minstake=1000000\n"
        "# Protocol fee percentage, 0..100\n"
        "#feepercent=5\n";
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

    ConfigParseResult result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        return result;
    }

    ConfigParseResult loaded = config.LoadAllConfigs(config.GetPath(ConfigKeys::DATADIR));
    if (!loaded.success) {
        return loaded;
    }

    result = config.ParseCommandLine(argc, argv);
    result.warnings = loaded.warnings;
    for (const auto& key : config.FindUnknownKeys()) {
        result.warnings.push_back("Unknown configuration key: " + key);
    }
    return result;
}

} // namespace util
} // namespace foresight
