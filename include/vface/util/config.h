// VFACE - Configuration
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Options for vfaced and vface-admin come from three places, later ones
// winning: /etc/vface/vface.conf, <datadir>/vface.conf (or -conf=FILE),
// and the command line.
//
// File syntax:
//
//     # comment            ; comment
//     key=value            key = "quoted value"
//     flag                 noflag            (true / false)
//     [section]            include other.conf
//     long=first \
//          second          (backslash continues a line)
//     keystore=${HOME}/keys.json
//
// Booleans accept true/false, yes/no, on/off and 1/0. Integers accept a
// k, m or g suffix (powers of 1024).

#ifndef VFACE_UTIL_CONFIG_H
#define VFACE_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace vface {
namespace util {

/// Under $HOME
constexpr const char* DEFAULT_DATADIR_NAME = ".vface";
constexpr const char* DEFAULT_CONFIG_FILENAME = "vface.conf";
constexpr const char* SYSTEM_CONFIG_PATH = "/etc/vface/vface.conf";

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Option Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";

    constexpr const char* KEYSTORE = "keystore";
    constexpr const char* DBCACHE = "dbcache";

    constexpr const char* DIMENSION = "dimension";
    constexpr const char* PRECISION = "precision";
    constexpr const char* ENFORCEFINGERPRINT = "enforcefingerprint";
    constexpr const char* VERIFYTHRESHOLD = "verifythreshold";
    constexpr const char* SYBILTHRESHOLD = "sybilthreshold";
    constexpr const char* MAXTOPK = "maxtopk";
    constexpr const char* REVOKEWINDOW = "revokewindow";
    constexpr const char* NONCETTL = "noncettl";

    constexpr const char* GENESISSEED = "genesisseed";

    constexpr const char* TOKENISSUER = "tokenissuer";
    constexpr const char* MODELVERSION = "modelversion";
    constexpr const char* REQUIREAPPROVALPROOF = "requireapprovalproof";

    constexpr const char* SERVER = "server";
    constexpr const char* RPCBIND = "rpcbind";
    constexpr const char* RPCPORT = "rpcport";
    constexpr const char* RPCUSER = "rpcuser";
    constexpr const char* RPCPASSWORD = "rpcpassword";
    constexpr const char* RPCTHREADS = "rpcthreads";
}

/// One documented configuration file option
struct ConfigOption {
    const char* key;
    /// Heading the option is listed under in the sample file
    const char* group;
    /// Shown commented out in the sample file; empty means unset
    const char* sample;
    const char* help;
};

/// Every option a configuration file may set, in sample-file order
const std::vector<ConfigOption>& StandardOptions();

// ============================================================================
// Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    /// Non-fatal problems, such as an unreadable system config
    std::vector<std::string> warnings;

    static ConfigParseResult Success() { return {}; }

    static ConfigParseResult Error(const std::string& msg, const std::string& file = "",
                                   int line = 0) {
        ConfigParseResult result;
        result.success = false;
        result.errorMessage = msg;
        result.errorFile = file;
        result.errorLine = line;
        return result;
    }

    /// "file:line: message"
    std::string ToString() const;
};

// ============================================================================
// ConfigManager
// ============================================================================

class ConfigManager {
public:
    /**
     * Read a file. A key repeated inside one source accumulates values
     * (see GetList); a key from a later source replaces the earlier one
     * unless overwrite is false.
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = true);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = true);

    /**
     * Accepts -key=value, --key=value, -flag and -noflag. Anything not
     * starting with '-', and everything after "--", is positional.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /**
     * Resolve the data directory (argument, then -datadir, then
     * ~/.vface), read the system and data directory files, and re-apply
     * the command line on top. A missing -conf file is an error; a
     * missing default file is not.
     */
    ConfigParseResult LoadAllConfigs(const std::string& dataDir = "");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Last value given for the key
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    std::optional<double> TryGetDouble(const std::string& key,
                                       const std::string& section = "") const;

    // Unset or unparsable values fall back to the default
    std::string GetString(const std::string& key, const std::string& defaultValue = "",
                          const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue = 0,
                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue = false,
                 const std::string& section = "") const;
    double GetDouble(const std::string& key, double defaultValue = 0.0,
                     const std::string& section = "") const;

    /// Every value given for the key, with comma-separated values split
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// String value with a leading ~ expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "",
                        const std::string& section = "") const;

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    std::vector<std::string> GetSections() const;

    /// Allowing any key turns on Validate()
    void AllowKey(const std::string& key, const std::string& section = "");
    void AllowStandardKeys();

    /// File-defined keys that were never allowed; command-line keys are exempt
    std::vector<std::string> Validate() const;

    void Clear();

    std::string GetDataDir() const;
    void SetDataDir(const std::string& dir);

    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    /// "~" and "~/..." only; "~user" is left alone
    static std::string ExpandTilde(const std::string& path);
    static std::optional<bool> ParseBool(const std::string& str);

    /// Commented-out vface.conf listing StandardOptions()
    std::string GenerateSampleConfig() const;

private:
    struct Entry {
        std::string section;
        std::string key;
        std::vector<std::string> values;
        std::string source;
        int line{0};
    };

    class Parser;

    static std::string FullKey(const std::string& key, const std::string& section);
    const Entry* Find(const std::string& key, const std::string& section) const;

    void Store(const std::string& section, const std::string& key, const std::string& value,
               const std::string& source, int line, bool overwrite);
    void ApplyCommandLine();

    std::map<std::string, Entry> entries_;
    std::vector<std::pair<std::string, std::string>> commandLine_;
    std::vector<std::string> positional_;
    std::set<std::string> allowedKeys_;
    std::string dataDir_;
    int includeDepth_{0};
};

} // namespace util
} // namespace vface

#endif // VFACE_UTIL_CONFIG_H
