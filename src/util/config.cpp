// VFACE - Configuration Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/util/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace vface {
namespace util {

namespace {

constexpr const char* COMMAND_LINE = "<command-line>";

std::string Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(" \t\r\n") - first + 1);
}

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool IsValidKey(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

/// 'value' is literal; "value" understands \n \t \r \\ and \"
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }

    std::string out;
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.size()) {
            out += inner[i];
            continue;
        }
        switch (inner[i + 1]) {
            case 'n':  out += '\n'; break;
            case 't':  out += '\t'; break;
            case 'r':  out += '\r'; break;
            case '\\': out += '\\'; break;
            case '"':  out += '"'; break;
            default:   out += '\\'; continue;
        }
        ++i;
    }
    return out;
}

/// "flag" is true and "noflag" is false
std::pair<std::string, std::string> FlagSetting(const std::string& word) {
    if (word.size() > 2 && word.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(word[2]))) {
        return {word.substr(2), "false"};
    }
    return {word, "true"};
}

bool FileExists(const std::string& path) {
    return std::ifstream(path).good();
}

} // namespace

// ============================================================================
// Standard Options
// ============================================================================

const std::vector<ConfigOption>& StandardOptions() {
    static const std::vector<ConfigOption> options = {
        {ConfigKeys::DATADIR, "General", "~/.vface", "Data directory"},
        {ConfigKeys::CONF, "General", "", "Read options from this file instead of <datadir>/vface.conf"},
        {ConfigKeys::LOGLEVEL, "General", "info", "Log level: trace, debug, info, warn, error, fatal, off"},
        {ConfigKeys::DEBUG, "General", "",
         "Categories logged below warn, comma separated (registry, chain, crypto,\n"
         "keystore, consent, matcher, db, rpc or all)"},
        {ConfigKeys::PRINTTOCONSOLE, "General", "0", "Also log to the console"},
        {ConfigKeys::LOGFILE, "General", "", "Log file (default: <datadir>/debug.log)"},

        {ConfigKeys::KEYSTORE, "Storage and Keys", "", "Key store file (default: <datadir>/keystore.json)"},
        {ConfigKeys::DBCACHE, "Storage and Keys", "8", "Database cache in MiB"},

        {ConfigKeys::DIMENSION, "Fingerprints and Matching", "128", "Feature vector dimension"},
        {ConfigKeys::PRECISION, "Fingerprints and Matching", "4",
         "Decimal places kept when deriving fingerprints"},
        {ConfigKeys::ENFORCEFINGERPRINT, "Fingerprints and Matching", "0",
         "Reject registrations whose fingerprint is not derived from their vector"},
        {ConfigKeys::VERIFYTHRESHOLD, "Fingerprints and Matching", "0.85",
         "Cosine similarity for a verification match"},
        {ConfigKeys::SYBILTHRESHOLD, "Fingerprints and Matching", "0.92",
         "Cosine similarity at which a registration duplicates an identity"},
        {ConfigKeys::MAXTOPK, "Fingerprints and Matching", "100", "Largest accepted search topK"},

        {ConfigKeys::REVOKEWINDOW, "Owner Proofs", "300", "Accepted clock skew for signed commands, in seconds"},
        {ConfigKeys::NONCETTL, "Owner Proofs", "300", "How long a used nonce is remembered, in seconds"},

        {ConfigKeys::GENESISSEED, "Hash Chain", "vface-genesis-v3", "Seed hashed into the genesis link"},

        {ConfigKeys::TOKENISSUER, "Consent Tokens", "https://registry.v-face.org", "Token issuer (iss claim)"},
        {ConfigKeys::MODELVERSION, "Consent Tokens", "mobilefacenet_128d", "Model version claim (vf_model_v)"},
        {ConfigKeys::REQUIREAPPROVALPROOF, "Consent Tokens", "0",
         "Require a signed approve_consent command to approve a request"},

        {ConfigKeys::SERVER, "RPC", "1", "Run the JSON-RPC server"},
        {ConfigKeys::RPCBIND, "RPC", "127.0.0.1", "Listen address"},
        {ConfigKeys::RPCPORT, "RPC", "8645", "Listen port"},
        {ConfigKeys::RPCUSER, "RPC", "", "Basic auth user; authentication is off when unset"},
        {ConfigKeys::RPCPASSWORD, "RPC", "", "Basic auth password"},
        {ConfigKeys::RPCTHREADS, "RPC", "4", "Worker threads"},
    };
    return options;
}

std::string ConfigParseResult::ToString() const {
    std::string where = errorFile;
    if (!where.empty() && errorLine > 0) {
        where += ":" + std::to_string(errorLine);
    }
    return where.empty() ? errorMessage : where + ": " + errorMessage;
}

// ============================================================================
// Parser
// ============================================================================

/// Reads one source line by line, tracking the current [section]
class ConfigManager::Parser {
public:
    Parser(ConfigManager& config, std::string source, bool overwrite)
        : config_(config), source_(std::move(source)), overwrite_(overwrite) {}

    ConfigParseResult Run(std::istream& in) {
        std::string raw;
        std::string pending;
        while (std::getline(in, raw)) {
            ++line_;
            if (raw.size() > MAX_LINE_LENGTH) {
                return Fail("line longer than " + std::to_string(MAX_LINE_LENGTH) + " characters");
            }
            if (!raw.empty() && raw.back() == '\\') {
                raw.pop_back();
                pending += raw;
                continue;
            }
            if (!Handle(Trim(pending + raw))) {
                return result_;
            }
            pending.clear();
        }
        if (!pending.empty()) {
            Handle(Trim(pending));
        }
        return result_;
    }

private:
    ConfigManager& config_;
    const std::string source_;
    const bool overwrite_;
    std::string section_;
    int line_{0};
    ConfigParseResult result_;

    ConfigParseResult Fail(const std::string& message) {
        result_ = ConfigParseResult::Error(message, source_, line_);
        return result_;
    }

    bool Handle(const std::string& text) {
        if (text.empty() || text[0] == '#' || text[0] == ';') {
            return true;
        }
        if (text[0] == '[') {
            if (text.back() != ']') {
                Fail("unterminated section header");
                return false;
            }
            section_ = Trim(text.substr(1, text.size() - 2));
            return true;
        }
        if (text.compare(0, 8, "include ") == 0) {
            return Include(Unquote(Trim(text.substr(8))));
        }

        size_t eq = text.find('=');
        std::pair<std::string, std::string> setting =
            eq == std::string::npos
                ? FlagSetting(text)
                : std::make_pair(Trim(text.substr(0, eq)),
                                 ExpandEnvVars(Unquote(Trim(text.substr(eq + 1)))));
        if (!IsValidKey(setting.first)) {
            Fail("invalid key '" + setting.first + "'");
            return false;
        }
        config_.Store(section_, setting.first, setting.second, source_, line_, overwrite_);
        return true;
    }

    bool Include(const std::string& path) {
        if (config_.includeDepth_ >= MAX_INCLUDE_DEPTH) {
            Fail("includes nested deeper than " + std::to_string(MAX_INCLUDE_DEPTH));
            return false;
        }
        ++config_.includeDepth_;
        ConfigParseResult nested = config_.ParseFile(path, overwrite_);
        --config_.includeDepth_;
        if (!nested.success) {
            result_ = nested;
            return false;
        }
        return true;
    }
};

// ============================================================================
// Sources
// ============================================================================

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("cannot open file", path);
    }
    file.seekg(0, std::ios::end);
    if (file.tellg() > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error("file larger than " + std::to_string(MAX_CONFIG_SIZE) +
                                        " bytes", path);
    }
    file.seekg(0, std::ios::beg);
    return Parser(*this, path, overwrite).Run(file);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream in(content);
    return Parser(*this, sourceName, overwrite).Run(in);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    bool positionalOnly = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!positionalOnly && arg == "--") {
            positionalOnly = true;
            continue;
        }
        if (positionalOnly || arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        arg.erase(0, arg.find_first_not_of('-'));
        size_t eq = arg.find('=');
        auto setting = eq == std::string::npos
                           ? FlagSetting(arg)
                           : std::make_pair(arg.substr(0, eq), arg.substr(eq + 1));
        if (!IsValidKey(setting.first)) {
            return ConfigParseResult::Error(std::string("invalid option ") + argv[i], COMMAND_LINE);
        }
        commandLine_.push_back(std::move(setting));
    }
    ApplyCommandLine();
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadAllConfigs(const std::string& dataDir) {
    if (!dataDir.empty()) {
        SetDataDir(dataDir);
    } else if (auto dir = TryGetString(ConfigKeys::DATADIR)) {
        SetDataDir(*dir);
    }

    ConfigParseResult result;
    if (FileExists(SYSTEM_CONFIG_PATH)) {
        ConfigParseResult system = ParseFile(SYSTEM_CONFIG_PATH);
        if (!system.success) {
            result.warnings.push_back("ignoring system config: " + system.ToString());
        }
    }

    auto conf = TryGetString(ConfigKeys::CONF);
    std::string path = conf ? ExpandEnvVars(ExpandTilde(*conf))
                            : GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME;
    if (conf || FileExists(path)) {
        ConfigParseResult data = ParseFile(path);
        if (!data.success) {
            return data;
        }
    }

    ApplyCommandLine();
    return result;
}

// ============================================================================
// Storage
// ============================================================================

std::string ConfigManager::FullKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + ":" + key;
}

const ConfigManager::Entry* ConfigManager::Find(const std::string& key,
                                                const std::string& section) const {
    auto it = entries_.find(FullKey(key, section));
    return it == entries_.end() ? nullptr : &it->second;
}

void ConfigManager::Store(const std::string& section, const std::string& key,
                          const std::string& value, const std::string& source, int line,
                          bool overwrite) {
    Entry& entry = entries_[FullKey(key, section)];
    if (!entry.values.empty()) {
        if (entry.source == source) {
            entry.values.push_back(value);
            return;
        }
        if (!overwrite || entry.source == COMMAND_LINE) {
            return;
        }
    }
    entry = Entry{section, key, {value}, source, line};
}

void ConfigManager::ApplyCommandLine() {
    for (const auto& setting : commandLine_) {
        entries_.erase(setting.first);
    }
    for (const auto& setting : commandLine_) {
        Store("", setting.first, setting.second, COMMAND_LINE, 0, true);
    }
}

// ============================================================================
// Lookup
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    const Entry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return entry->values.back();
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto text = TryGetString(key, section);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text->c_str(), &end, 10);
    if (end == text->c_str() || errno == ERANGE) {
        return std::nullopt;
    }

    std::string suffix = ToLower(Trim(end));
    int shift = 0;
    if (suffix == "k") {
        shift = 10;
    } else if (suffix == "m") {
        shift = 20;
    } else if (suffix == "g") {
        shift = 30;
    } else if (!suffix.empty()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value) * (int64_t{1} << shift);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto text = TryGetString(key, section);
    return text ? ParseBool(*text) : std::nullopt;
}

std::optional<double> ConfigManager::TryGetDouble(const std::string& key,
                                                  const std::string& section) const {
    auto text = TryGetString(key, section);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text->c_str(), &end);
    if (end == text->c_str() || errno == ERANGE || !Trim(end).empty()) {
        return std::nullopt;
    }
    return value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

double ConfigManager::GetDouble(const std::string& key, double defaultValue,
                                const std::string& section) const {
    return TryGetDouble(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> items;
    const Entry* entry = Find(key, section);
    if (!entry) {
        return items;
    }
    for (const auto& value : entry->values) {
        std::istringstream parts(value);
        std::string item;
        while (std::getline(parts, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
    }
    return items;
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandTilde(GetString(key, defaultValue, section));
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return {sections.begin(), sections.end()};
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(FullKey(key, section));
}

void ConfigManager::AllowStandardKeys() {
    for (const ConfigOption& option : StandardOptions()) {
        AllowKey(option.key);
    }
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> unknown;
    if (allowedKeys_.empty()) {
        return unknown;
    }
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.source != COMMAND_LINE && allowedKeys_.count(fullKey) == 0) {
            unknown.push_back("unknown option '" + fullKey + "' in " + entry.source + ":" +
                              std::to_string(entry.line));
        }
    }
    return unknown;
}

// ============================================================================
// Paths and Helpers
// ============================================================================

void ConfigManager::Clear() {
    *this = ConfigManager();
}

std::string ConfigManager::GetDataDir() const {
    return dataDir_.empty() ? GetDefaultDataDir() : dataDir_;
}

void ConfigManager::SetDataDir(const std::string& dir) {
    dataDir_ = ExpandEnvVars(ExpandTilde(dir));
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        size_t close = open == std::string::npos ? open : value.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, open - pos);
        // Unset variables expand to nothing
        if (const char* env = std::getenv(value.substr(open + 2, close - open - 2).c_str())) {
            out += env;
        }
        pos = close + 1;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        const struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }
    return home && *home ? std::string(home) + path.substr(1) : path;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    static const char* const truthy[] = {"1", "true", "yes", "on"};
    static const char* const falsy[] = {"0", "false", "no", "off"};
    std::string word = ToLower(Trim(str));
    for (const char* t : truthy) {
        if (word == t) return true;
    }
    for (const char* f : falsy) {
        if (word == f) return false;
    }
    return std::nullopt;
}

std::string ConfigManager::GenerateSampleConfig() const {
    std::ostringstream out;
    out << "# vface.conf\n"
        << "# Every option is shown commented out with its default.\n"
        << "# Command-line options (-key=value) override this file.\n";

    std::string group;
    for (const ConfigOption& option : StandardOptions()) {
        if (option.key == std::string(ConfigKeys::CONF)) {
            continue;
        }
        if (group != option.group) {
            group = option.group;
            out << "\n# " << std::string(60, '=') << "\n# " << group << "\n# "
                << std::string(60, '=') << "\n";
        }
        out << "\n";
        std::istringstream help(option.help);
        for (std::string line; std::getline(help, line);) {
            out << "# " << line << "\n";
        }
        out << "#" << option.key << "=" << option.sample << "\n";
    }
    return out.str();
}

} // namespace util
} // namespace vface
