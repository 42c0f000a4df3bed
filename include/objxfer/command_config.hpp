#pragma once

#include "objxfer/location.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

/// One invocation of the objxfer command line.
struct CommandConfig {
    std::string command;               // "rm", "cp" or "stat"
    std::vector<std::string> targets;  // positional addresses

    // Global
    std::filesystem::path config_file;  // alias configuration (JSON)
    std::string encrypt;                // --encrypt: default-SSE prefixes
    std::string encrypt_key;            // --encrypt-key: prefix=key list
    bool json = false;
    bool verbose = false;
    std::filesystem::path log_file;
    std::filesystem::path metrics_file;

    // rm
    bool recursive = false;
    bool force = false;
    bool dangerous = false;
    bool incomplete = false;
    bool fake = false;
    bool stdin_targets = false;
    bool bypass = false;
    std::string older_than;
    std::string newer_than;

    // cp
    std::string attr;
    std::string retention_mode;
    std::string retention_duration;
    std::string legal_hold;  // normalized to ON/OFF
    bool disable_multipart = false;
    bool md5 = false;
    bool preserve = false;

    // Loaded from the configuration file
    std::map<std::string, AliasConfig> aliases;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<CommandConfig> from_args(int argc, char* argv[]);

    /// $OBJXFER_CONFIG, else ~/.objxfer/config.json.
    static std::filesystem::path default_config_path();

    /// Load aliases from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill alias credentials from AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace objxfer
