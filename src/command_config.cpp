#include "objxfer/command_config.hpp"
#include "objxfer/constants.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace objxfer {

namespace {

void print_usage() {
    std::cerr <<
        "Usage: objxfer <rm|cp|stat> [options] <targets...>\n"
        "\n"
        "Commands:\n"
        "  rm <target>...                   Remove objects or folders\n"
        "  cp <source>... <target>          Copy objects\n"
        "  stat <target>...                 Show object metadata\n"
        "\n"
        "Global options:\n"
        "  --config <path>                  Alias configuration (default: $OBJXFER_CONFIG\n"
        "                                   or ~/.objxfer/config.json)\n"
        "  --encrypt <prefixes>             Default SSE prefixes (or OBJXFER_ENCRYPT env)\n"
        "  --encrypt-key <prefix=key,...>   SSE-C keys (or OBJXFER_ENCRYPT_KEY env)\n"
        "  --json                           JSON output\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Append output to a log file\n"
        "  --metrics-file <path>            Prometheus .prom file written on exit\n"
        "\n"
        "rm options:\n"
        "  --recursive, -r                  Remove recursively\n"
        "  --force                          Allow recursive and stdin removal\n"
        "  --dangerous                      Allow removal of a whole alias\n"
        "  --incomplete, -I                 Remove incomplete uploads\n"
        "  --fake                           Report what would be removed\n"
        "  --stdin                          Read more targets from standard input\n"
        "  --bypass                         Bypass governance retention\n"
        "  --older-than <age>               Remove objects older than age (e.g. 7d10h)\n"
        "  --newer-than <age>               Remove objects newer than age\n"
        "\n"
        "cp options:\n"
        "  --recursive, -r                  Copy recursively\n"
        "  --attr <k1=v1;k2=v2>             User metadata for targets\n"
        "  --retention-mode <mode>          GOVERNANCE or COMPLIANCE\n"
        "  --retention-duration <Nd|Ny>     Retention validity\n"
        "  --legal-hold <on|off>            Legal hold for targets\n"
        "  --disable-multipart              Always upload in one request\n"
        "  --md5                            Send Content-MD5 with uploads\n"
        "  --preserve, -a                   Preserve filesystem attributes\n"
        "  --help                           Show this help\n";
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool valid_alias_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

}  // namespace

std::optional<CommandConfig> CommandConfig::from_args(int argc, char* argv[]) {
    CommandConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    bool explicit_config = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            config.config_file = v;
            explicit_config = true;
        } else if (arg == "--encrypt") {
            auto* v = next_arg(i, "--encrypt");
            if (!v) return std::nullopt;
            config.encrypt = v;
        } else if (arg == "--encrypt-key") {
            auto* v = next_arg(i, "--encrypt-key");
            if (!v) return std::nullopt;
            config.encrypt_key = v;
        } else if (arg == "--json") {
            config.json = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--recursive" || arg == "-r") {
            config.recursive = true;
        } else if (arg == "--force") {
            config.force = true;
        } else if (arg == "--dangerous") {
            config.dangerous = true;
        } else if (arg == "--incomplete" || arg == "-I") {
            config.incomplete = true;
        } else if (arg == "--fake") {
            config.fake = true;
        } else if (arg == "--stdin") {
            config.stdin_targets = true;
        } else if (arg == "--bypass") {
            config.bypass = true;
        } else if (arg == "--older-than") {
            auto* v = next_arg(i, "--older-than");
            if (!v) return std::nullopt;
            config.older_than = v;
        } else if (arg == "--newer-than") {
            auto* v = next_arg(i, "--newer-than");
            if (!v) return std::nullopt;
            config.newer_than = v;
        } else if (arg == "--attr") {
            auto* v = next_arg(i, "--attr");
            if (!v) return std::nullopt;
            config.attr = v;
        } else if (arg == "--retention-mode") {
            auto* v = next_arg(i, "--retention-mode");
            if (!v) return std::nullopt;
            config.retention_mode = v;
        } else if (arg == "--retention-duration") {
            auto* v = next_arg(i, "--retention-duration");
            if (!v) return std::nullopt;
            config.retention_duration = v;
        } else if (arg == "--legal-hold") {
            auto* v = next_arg(i, "--legal-hold");
            if (!v) return std::nullopt;
            config.legal_hold = to_upper(v);
        } else if (arg == "--disable-multipart") {
            config.disable_multipart = true;
        } else if (arg == "--md5") {
            config.md5 = true;
        } else if (arg == "--preserve" || arg == "-a") {
            config.preserve = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (config.command.empty()) {
            config.command = arg;
        } else {
            config.targets.push_back(arg);
        }
    }

    if (config.config_file.empty()) {
        config.config_file = default_config_path();
    }
    std::error_code ec;
    if (explicit_config || std::filesystem::exists(config.config_file, ec)) {
        if (!config.load_json(config.config_file)) return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

std::filesystem::path CommandConfig::default_config_path() {
    if (const char* v = std::getenv("OBJXFER_CONFIG"); v && *v) {
        return v;
    }
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? home : ".";
    return base / constants::DEFAULT_CONFIG_DIR / constants::DEFAULT_CONFIG_FILE;
}

bool CommandConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("aliases") && j["aliases"].is_object()) {
            for (auto& [name, ja] : j["aliases"].items()) {
                AliasConfig alias;
                if (ja.contains("url")) alias.url = ja["url"].get<std::string>();
                if (ja.contains("access_key")) alias.access_key = ja["access_key"].get<std::string>();
                if (ja.contains("secret_key")) alias.secret_key = ja["secret_key"].get<std::string>();
                if (ja.contains("session_token"))
                    alias.session_token = ja["session_token"].get<std::string>();
                if (ja.contains("region")) alias.region = ja["region"].get<std::string>();
                if (ja.contains("path_style")) alias.path_style = ja["path_style"].get<bool>();
                if (ja.contains("verify_ssl")) alias.verify_ssl = ja["verify_ssl"].get<bool>();
                // Endpoints are joined with paths later
                while (!alias.url.empty() && alias.url.back() == '/') alias.url.pop_back();
                aliases[name] = std::move(alias);
            }
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void CommandConfig::apply_defaults() {
    const char* access = std::getenv("AWS_ACCESS_KEY_ID");
    const char* secret = std::getenv("AWS_SECRET_ACCESS_KEY");
    if (!access || !secret) return;

    for (auto& [name, alias] : aliases) {
        if (alias.access_key.empty() && alias.secret_key.empty()) {
            alias.access_key = access;
            alias.secret_key = secret;
        }
    }
}

std::string CommandConfig::validate() const {
    if (command.empty()) return "a command is required (rm, cp or stat)";
    if (command != "rm" && command != "cp" && command != "stat") {
        return "unknown command: " + command;
    }

    for (const auto& [name, alias] : aliases) {
        if (!valid_alias_name(name)) return "invalid alias name: " + name;
        auto err = alias.validate();
        if (!err.empty()) return "alias " + name + ": " + err;
    }

    if (command == "cp" && targets.size() < 2) {
        return "cp requires a source and a target";
    }
    if (command == "stat" && targets.empty()) {
        return "stat requires at least one target";
    }
    if (command == "rm" && targets.empty() && !stdin_targets) {
        return "rm requires at least one target (or --stdin)";
    }
    if (command != "rm" && (fake || stdin_targets || dangerous || !older_than.empty() ||
                            !newer_than.empty())) {
        return "--fake, --stdin, --dangerous, --older-than and --newer-than apply to rm only";
    }
    return "";
}

}  // namespace objxfer
