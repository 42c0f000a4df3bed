#include "objxfer/client.hpp"
#include "objxfer/command_config.hpp"
#include "objxfer/durations.hpp"
#include "objxfer/log.hpp"
#include "objxfer/metrics.hpp"
#include "objxfer/remove.hpp"
#include "objxfer/transfer.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

/// Forwards SIGINT/SIGTERM to the invocation's cancellation token.
class SignalWatcher {
public:
    explicit SignalWatcher(const objxfer::CancellationToken& cancel) {
        thread_ = std::thread([this, cancel]() {
            while (!done_.load()) {
                if (g_shutdown_requested) {
                    objxfer::log_warn("Interrupted, cancelling");
                    cancel.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~SignalWatcher() {
        done_ = true;
        if (thread_.joinable()) thread_.join();
    }

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

void print_remove(const objxfer::PipelineResult& result, bool json) {
    if (json) {
        nlohmann::json j;
        j["status"] = "success";
        j["key"] = result.key;
        j["size"] = result.size;
        if (result.dry_run) j["dryRun"] = true;
        std::cout << j.dump() << std::endl;
    } else {
        std::cout << "Removing '" << result.key << "'." << std::endl;
    }
}

void print_copy(const objxfer::PipelineResult& result, bool json) {
    if (!result.ok()) return;
    if (json) {
        nlohmann::json j;
        j["status"] = "success";
        j["source"] = result.key;
        j["target"] = result.target;
        j["size"] = result.size;
        std::cout << j.dump() << std::endl;
    } else {
        std::cout << "'" << result.key << "' -> '" << result.target << "'" << std::endl;
    }
}

std::optional<objxfer::Error> run_stat(const objxfer::Environment& env,
                                       const objxfer::CommandConfig& config) {
    std::optional<objxfer::Error> first_error;
    for (const auto& url : config.targets) {
        auto st = objxfer::stat_url(env, url, config.incomplete, config.preserve);
        if (!st.success) {
            objxfer::log_error("Unable to stat '%s': %s", url.c_str(),
                               st.error.to_string().c_str());
            if (!first_error) first_error = st.error;
            continue;
        }
        const auto& c = st.content;
        std::string date = c.has_time() ? objxfer::format_rfc3339(c.time) : "";

        if (config.json) {
            nlohmann::json j;
            j["status"] = "success";
            j["name"] = url;
            j["size"] = c.size;
            j["lastModified"] = date;
            j["type"] = c.is_dir ? "folder" : "file";
            if (!c.etag.empty()) j["etag"] = c.etag;
            if (!c.storage_class.empty()) j["storageClass"] = c.storage_class;
            nlohmann::json meta = nlohmann::json::object();
            for (const auto& [k, v] : c.metadata) meta[k] = v;
            for (const auto& [k, v] : c.user_metadata) meta[k] = v;
            j["metadata"] = meta;
            std::cout << j.dump() << std::endl;
            continue;
        }

        std::cout << "Name      : " << url << "\n";
        if (!date.empty()) std::cout << "Date      : " << date << "\n";
        std::cout << "Size      : " << c.size << "\n";
        if (!c.etag.empty()) std::cout << "ETag      : " << c.etag << "\n";
        std::cout << "Type      : " << (c.is_dir ? "folder" : "file") << "\n";
        if (!c.storage_class.empty()) std::cout << "Class     : " << c.storage_class << "\n";
        if (!c.metadata.empty() || !c.user_metadata.empty()) {
            std::cout << "Metadata  :\n";
            for (const auto& [k, v] : c.metadata) std::cout << "  " << k << ": " << v << "\n";
            for (const auto& [k, v] : c.user_metadata) std::cout << "  " << k << ": " << v << "\n";
        }
        std::cout << std::flush;
    }
    return first_error;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = objxfer::CommandConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file: " << config.log_file << std::endl;
            return 1;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    objxfer::set_verbose(config.verbose);

    objxfer::Environment env;
    env.resolver = objxfer::LocationResolver(config.aliases);
    if (auto key_err = objxfer::load_encryption_keys(config.encrypt, config.encrypt_key, env.keys)) {
        objxfer::log_error("Unable to parse encryption keys: %s", key_err->to_string().c_str());
        return 1;
    }

    std::unique_ptr<objxfer::TransferMetrics> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<objxfer::TransferMetrics>(
            config.metrics_file, std::map<std::string, std::string>{{"command", config.command}});
        env.metrics = metrics.get();
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::optional<objxfer::Error> result;
    {
        SignalWatcher watcher(env.cancel);

        if (config.command == "rm") {
            objxfer::RemoveOptions options;
            options.recursive = config.recursive;
            options.force = config.force;
            options.dangerous = config.dangerous;
            options.incomplete = config.incomplete;
            options.fake = config.fake;
            options.stdin_targets = config.stdin_targets;
            options.bypass = config.bypass;
            options.older_than = config.older_than;
            options.newer_than = config.newer_than;
            bool json = config.json;
            options.on_result = [json](const objxfer::PipelineResult& r) { print_remove(r, json); };
            result = objxfer::remove_targets(env, config.targets, options, &std::cin);
        } else if (config.command == "cp") {
            objxfer::CopyOptions options;
            options.recursive = config.recursive;
            options.retention_mode = config.retention_mode;
            options.retention_duration = config.retention_duration;
            options.legal_hold = config.legal_hold;
            options.disable_multipart = config.disable_multipart;
            options.md5 = config.md5;
            options.preserve = config.preserve;
            bool json = config.json;
            options.on_result = [json](const objxfer::PipelineResult& r) { print_copy(r, json); };

            result = objxfer::parse_attributes(config.attr, options.attributes);
            if (!result) {
                std::vector<std::string> sources(config.targets.begin(), config.targets.end() - 1);
                result = objxfer::copy_targets(env, sources, config.targets.back(), options);
            }
        } else {
            result = run_stat(env, config);
        }
    }

    if (metrics) {
        metrics->write_file();
    }

    if (result) {
        // Per-object failures were already reported where they happened
        if (result->is(objxfer::ErrorKind::InvalidArgument) ||
            result->is(objxfer::ErrorKind::PreconditionNotMet)) {
            objxfer::log_error("%s", result->to_string().c_str());
        }
        return 1;
    }
    return 0;
}
